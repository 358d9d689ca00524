#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <fstream>
#include <string>
#include <vector>
#include "writer/base_writer.hpp"

// 每个样本行写成一行 JSON，追加到文件
class FileWriter : public base_writer {
public:
    FileWriter(std::string name, const std::string& path, std::size_t buf_capacity);
    ~FileWriter() override;

protected:
    void flush_impl(const std::vector<ScrapeBatch>& batch) override;

private:
    std::string   path_;
    std::ofstream ofs_;
};
