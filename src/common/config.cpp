#include "common/config.hpp"
#include <stdexcept>
#include <utility>

Config::Config(const std::string& filePath)
    : source_(filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
        spdlog::info("Config: loaded configuration from {}", filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to load configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath + ": " + e.what());
    }
}

Config::Config(YAML::Node root)
    : root_(std::move(root)), source_("<memory>")
{
}

Config Config::fromString(const std::string& yaml)
{
    try {
        return Config(YAML::Load(yaml));
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(std::string("Config: cannot parse document: ") + e.what());
    }
}

int Config::getInt(const std::string& parentKey,
                   const std::string& key) const
{
    try {
        return root_[parentKey][key].as<int>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding int [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

double Config::getDouble(const std::string& parentKey,
                         const std::string& key) const
{
    try {
        return root_[parentKey][key].as<double>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding double [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

bool Config::getBool(const std::string& parentKey,
                     const std::string& key) const
{
    try {
        return root_[parentKey][key].as<bool>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding bool [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

std::string Config::getString(const std::string& parentKey,
                              const std::string& key) const
{
    try {
        return root_[parentKey][key].as<std::string>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding string [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

int Config::getInt(const std::string& parentKey,
                   const std::string& key, int fallback) const
{
    if (!has(parentKey, key)) return fallback;
    return getInt(parentKey, key);
}

std::string Config::getString(const std::string& parentKey,
                              const std::string& key,
                              const std::string& fallback) const
{
    if (!has(parentKey, key)) return fallback;
    return getString(parentKey, key);
}

bool Config::has(const std::string& parentKey) const
{
    return root_.IsMap() && root_[parentKey].IsDefined() && !root_[parentKey].IsNull();
}

bool Config::has(const std::string& parentKey,
                 const std::string& key) const
{
    if (!has(parentKey)) return false;
    const auto& parent = root_[parentKey];
    return parent.IsMap() && parent[key].IsDefined() && !parent[key].IsNull();
}

YAML::Node Config::getRawNode(const std::string& parentKey) const
{
    if (!has(parentKey)) {
        spdlog::error("Config: missing section [{}]", parentKey);
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "]");
    }
    return root_[parentKey];
}
