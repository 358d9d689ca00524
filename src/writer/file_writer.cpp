#include "writer/file_writer.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

FileWriter::FileWriter(std::string name, const std::string& path, std::size_t buf_capacity)
    : base_writer(std::move(name), buf_capacity), path_(path)
{
    ofs_.open(path_, std::ios::app);
    if (!ofs_) {
        shutdown();
        throw std::runtime_error("FileWriter: cannot open " + path_);
    }
    spdlog::info("FileWriter: '{}' appending to {}", name_, path_);
}

FileWriter::~FileWriter()
{
    shutdown();
}

void FileWriter::flush_impl(const std::vector<ScrapeBatch>& batch)
{
    for (const auto& b : batch) {
        auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                      b.Timestamp.time_since_epoch()).count();
        for (const auto& line : b.Lines) {
            nlohmann::json j = {
                {"job", b.Job},
                {"labels", b.Labels},
                {"timestamp_ms", ts},
                {"sample", line},
            };
            ofs_ << j.dump() << '\n';
        }
    }
    ofs_.flush();          // 强制落盘
    if (!ofs_)
        throw std::runtime_error("write to " + path_ + " failed");
}
