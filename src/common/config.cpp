#include "common/config.hpp"
#include <stdexcept>

Config::Config(const std::string& filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
        spdlog::info("Config: loaded configuration from {}", filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to load configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: syntax error in {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
}

Config::Config(YAML::Node root)
    : root_(std::move(root))
{
}

Config Config::fromString(const std::string& yamlText)
{
    try {
        return Config(YAML::Load(yamlText));
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: syntax error in inline configuration: {}", e.what());
        throw std::runtime_error("Config: cannot parse inline configuration");
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

int Config::getIntOr(const std::string& parentKey,
                     const std::string& key, int fallback) const
{
    if (!has(parentKey, key)) {
        spdlog::debug("Config: [{}][{}] not set, using default {}", parentKey, key, fallback);
        return fallback;
    }
    return getInt(parentKey, key);
}

std::string Config::getStringOr(const std::string& parentKey,
                                const std::string& key,
                                const std::string& fallback) const
{
    if (!has(parentKey, key)) {
        spdlog::debug("Config: [{}][{}] not set, using default '{}'", parentKey, key, fallback);
        return fallback;
    }
    return getString(parentKey, key);
}

bool Config::has(const std::string& parentKey) const
{
    if (!root_.IsMap()) return false;
    return root_[parentKey].IsDefined();
}

bool Config::has(const std::string& parentKey, const std::string& key) const
{
    if (!has(parentKey)) return false;
    const auto parent = root_[parentKey];
    if (!parent.IsMap()) return false;
    return parent[key].IsDefined() && !parent[key].IsNull();
}

YAML::Node Config::getNode(const std::string& parentKey) const
{
    if (!has(parentKey)) {
        spdlog::error("Config: missing section [{}]", parentKey);
        throw std::runtime_error("Config: missing section [" + parentKey + "]");
    }
    return root_[parentKey];
}

// 常见模板实例化
template std::vector<std::string> Config::getArray<std::string>(const std::string&, const std::string&) const;
