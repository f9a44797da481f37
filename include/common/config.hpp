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
    // load from file
    explicit Config(const std::string& filePath);

    // load from an in-memory YAML document
    static Config fromString(const std::string& yaml);

    bool        has      (const std::string& parentKey,
                          const std::string& key) const;

    int         getInt   (const std::string& parentKey,
                          const std::string& key) const;
    bool        getBool  (const std::string& parentKey,
                          const std::string& key) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key) const;

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

    static Config& instance(std::string path = "") {
        static Config c = Config(initOnce(path));
        return c;
    }

private:
    Config() = default;

    static const std::string& initOnce(const std::string& path) {
        static std::string stored;
        if (!stored.empty()) return stored;
        if (path.empty())
            throw std::runtime_error("Config path not provided on first call");
        stored = path;
        return stored;
    }
    YAML::Node root_;
};
