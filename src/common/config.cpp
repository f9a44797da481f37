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
        spdlog::error("Config: failed to parse configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
}

Config Config::fromString(const std::string& yaml)
{
    Config c;
    try {
        c.root_ = YAML::Load(yaml);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration: {}", e.what());
        throw std::runtime_error(std::string("Config: cannot parse document: ") + e.what());
    }
    return c;
}

bool Config::has(const std::string& parentKey,
                 const std::string& key) const
{
    // operator[] on a const node never inserts
    const YAML::Node parent = root_[parentKey];
    if (!parent || !parent.IsMap()) return false;
    const YAML::Node node = parent[key];
    return node && !node.IsNull();
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
