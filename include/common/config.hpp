#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class Config {
public:
    // 从文件加载
    explicit Config(const std::string& filePath);
    // 从已解析的节点构造（测试与热加载使用）
    explicit Config(YAML::Node root);

    static Config fromString(const std::string& yaml);

    // 基本类型读取
    int         getInt   (const std::string& parentKey,
                          const std::string& key) const;
    double      getDouble(const std::string& parentKey,
                          const std::string& key) const;
    bool        getBool  (const std::string& parentKey,
                          const std::string& key) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key) const;

    // 带默认值读取，键不存在时返回 fallback，类型错误仍然抛异常
    int         getInt   (const std::string& parentKey,
                          const std::string& key, int fallback) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key,
                          const std::string& fallback) const;

    bool        has(const std::string& parentKey) const;
    bool        has(const std::string& parentKey,
                    const std::string& key) const;

    YAML::Node  getRawNode(const std::string& parentKey) const;

    const std::string& source() const { return source_; }

    // 数组读取
    template<typename T>
    std::vector<T> getArray(const std::string& parentKey,
                            const std::string& key) const
    {
        try {
            return root_[parentKey][key].as<std::vector<T>>();
        } catch (const YAML::Exception& e) {
            spdlog::error("Config: error decoding array [{}][{}]: {}", parentKey, key, e.what());
            throw std::runtime_error("Config: missing or bad type for [" +
                                     parentKey + "][" + key + "]");
        }
    }

    template <typename T>
    std::vector<T> getArray(const std::string& parentKey,
                            const std::string& key,
                            std::function<T(const YAML::Node&)> decoder) const
    {
        try {
            std::vector<T> out;
            const auto& list = root_[parentKey][key];
            if (!list.IsSequence())
                throw YAML::Exception(YAML::Mark::null_mark(),
                                      "not a sequence");

            out.reserve(list.size());
            for (const auto& node : list)
                out.push_back(decoder(node));
            return out;
        } catch (const YAML::Exception& e) {
            spdlog::error("Config: error decoding array [{}][{}]: {}", parentKey, key, e.what());
            throw std::runtime_error("Config: missing or bad array [" +
                                     parentKey + "][" + key + "]");
        }
    }

private:
    YAML::Node  root_;
    std::string source_;
};
