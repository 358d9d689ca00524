#include "writer/writer_manager.hpp"

#include <stdexcept>
#include <fmt/core.h>

#include "writer/file_writer.hpp"

writer_manager::writer_manager(const Config& config) {
    struct Writer {
        std::string name;
        std::string type;
        std::string config;
    };
    spdlog::info("writer_manager: initializing...");
    if (!config.has("receivers_config", "receivers")) {
        spdlog::warn("writer_manager: no receivers configured, scraped samples will be dropped");
        return;
    }

    auto writers = config.getArray<Writer>("receivers_config", "receivers",
        [](const YAML::Node& node) {
            Writer w;
            w.name = node["name"].as<std::string>();
            w.type = node["type"].as<std::string>();
            w.config = node["config"].as<std::string>();
            return w;
        });
    spdlog::info("writer_manager: found {} receivers", writers.size());

    for (const auto& writer : writers) {
        if (writers_.count(writer.name)) {
            throw std::runtime_error(fmt::format("Duplicate receiver name: {}", writer.name));
        }
        if (writer.type == RECEIVER_TYPE_FILE) {
            auto path = config.getString(writer.config, "path");
            auto buffer = config.getInt(writer.config, "buffer_size", 256);
            if (buffer <= 0) {
                throw std::runtime_error(fmt::format("Receiver {}: buffer_size must be positive", writer.name));
            }
            addWriter(std::make_shared<FileWriter>(writer.name, path, static_cast<std::size_t>(buffer)));
        } else {
            throw std::runtime_error(fmt::format("Unknown receiver type: {}", writer.type));
        }
    }
    spdlog::info("writer_manager: initialized with {} receivers", writers_.size());
}

writer_manager::~writer_manager() {
    shutdown();
}

std::shared_ptr<IReceiver> writer_manager::find(const std::string& name) const {
    std::lock_guard lg(m_);
    auto it = writers_.find(name);
    return it == writers_.end() ? nullptr : it->second;
}

std::vector<std::string> writer_manager::list() const {
    std::lock_guard lg(m_);
    std::vector<std::string> out;
    for (const auto& [name, _] : writers_) out.push_back(name);
    return out;
}

void writer_manager::shutdown() {
    std::lock_guard lg(m_);
    if (writers_.empty()) return;
    spdlog::info("writer_manager: shutting down...");
    for (auto& [name, writer] : writers_) {
        if (auto buffered = std::dynamic_pointer_cast<base_writer>(writer)) {
            buffered->shutdown();
        }
    }
    writers_.clear();
}

void writer_manager::addWriter(std::shared_ptr<IReceiver> writer) {
    std::lock_guard lg(m_);
    auto name = writer->name();
    writers_.emplace(std::move(name), std::move(writer));
}
