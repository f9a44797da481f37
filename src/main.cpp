#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <spdlog/spdlog.h>

#include <cxxopts.hpp>
#include <date/date.h>
#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "ingest/ingest_client.hpp"
#include "ingest/ingest_options.hpp"

void init(const Config* config) {
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    std::string log_level = "info";
    if (config && config->has("app_config", "log_level")) {
        log_level = config->getString("app_config", "log_level");
    }
    auto it = log_level_map.find(log_level);
    if (it == log_level_map.end()) {
        log_level = "info"; // unknown level falls back to info
    }
    spdlog::set_level(log_level_map.at(log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

std::string now_rfc3339() {
    return date::format("%FT%TZ", date::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

// Returns the number of lines that could not be parsed.
size_t pump(std::istream& in, IngestClient& client, const std::string& stamp_field) {
    size_t line_no = 0;
    size_t bad = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); }))
            continue;
        nlohmann::json record;
        try {
            record = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Main: skipping line {}: {}", line_no, e.what());
            ++bad;
            continue;
        }
        if (!stamp_field.empty() && record.is_object()) {
            record[stamp_field] = now_rfc3339();
        }
        client.ingest(std::move(record));
    }
    return bad;
}

int run(int argc, char* argv[]) {
    cxxopts::Options options("quickingest", "Batching JSONL ingest client");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("e,endpoint", "Ingest endpoint, overrides ingest_config.endpoint", cxxopts::value<std::string>())
        ("i,input", "JSONL input file (default: stdin)", cxxopts::value<std::string>())
        ("t,timestamp", "Add an RFC3339 timestamp under this field to every object record", cxxopts::value<std::string>());

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // the config file may be omitted when the endpoint is given on the command line
    auto config_path = result["config"].as<std::string>();
    const Config* config = nullptr;
    if (std::filesystem::exists(config_path) || !result.count("endpoint")) {
        config = &Config::instance(config_path);
    }
    init(config);

    IngestSettings settings;
    if (config) settings = load_ingest_settings(*config);
    if (result.count("endpoint")) {
        settings.ingest.endpoint = result["endpoint"].as<std::string>();
    }
    if (settings.ingest.endpoint.empty()) {
        spdlog::critical("Main: no endpoint configured (ingest_config.endpoint or --endpoint)");
        return 1;
    }

    auto client = IngestClient::from_settings(settings);
    std::string stamp_field = result.count("timestamp") ? result["timestamp"].as<std::string>() : "";

    size_t bad = 0;
    if (result.count("input")) {
        auto path = result["input"].as<std::string>();
        std::ifstream ifs(path);
        if (!ifs) {
            spdlog::critical("Main: cannot open input file {}", path);
            return 1;
        }
        bad = pump(ifs, *client, stamp_field);
    } else {
        bad = pump(std::cin, *client, stamp_field);
    }

    client->close();

    auto stats = client->stats();
    spdlog::info("Main: done, queued={} delivered={} dropped={} unparsable_lines={}",
                 stats.queued, stats.delivered, stats.dropped, bad);
    if (auto fault = client->fault()) {
        spdlog::critical("Main: ingest stopped on fault: {}", *fault);
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }
}
