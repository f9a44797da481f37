#include "ingest/ingest_options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

#include "common/config.hpp"
#include <spdlog/spdlog.h>

Backpressure parse_backpressure(const std::string& name)
{
    std::string mode = name;
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (mode == "block") return Backpressure::Block;
    if (mode == "drop") return Backpressure::Drop;
    throw std::runtime_error(fmt::format("Unknown backpressure mode: {}", name));
}

const char* to_string(Backpressure mode)
{
    switch (mode) {
    case Backpressure::Block: return "block";
    case Backpressure::Drop:  return "drop";
    }
    return "unknown";
}

IngestOptions IngestOptions::normalized() const
{
    IngestOptions out = *this;
    if (out.queue_capacity == 0) out.queue_capacity = kDefaultQueueCapacity;
    if (out.batch_size == 0) out.batch_size = kDefaultBatchSize;
    if (out.max_delay.count() <= 0) out.max_delay = kDefaultMaxDelay;
    // a cap below the batch size would keep the size trigger from ever firing
    if (out.max_pending > 0 && out.max_pending < out.batch_size) out.max_pending = out.batch_size;
    return out;
}

namespace {

std::size_t non_negative(int v, const char* key)
{
    if (v < 0) {
        spdlog::warn("ingest_options: negative {} ({}) ignored, using default", key, v);
        return 0;
    }
    return static_cast<std::size_t>(v);
}

} // namespace

IngestSettings load_ingest_settings(const Config& config, const std::string& section)
{
    IngestSettings s;
    auto& opt = s.ingest;

    if (config.has(section, "endpoint"))
        opt.endpoint = config.getString(section, "endpoint");

    if (config.has(section, "batch_size"))
        opt.batch_size = non_negative(config.getInt(section, "batch_size"), "batch_size");
    if (config.has(section, "queue_capacity"))
        opt.queue_capacity = non_negative(config.getInt(section, "queue_capacity"), "queue_capacity");
    if (config.has(section, "max_delay_ms"))
        opt.max_delay = std::chrono::milliseconds(config.getInt(section, "max_delay_ms"));
    if (config.has(section, "max_pending"))
        opt.max_pending = non_negative(config.getInt(section, "max_pending"), "max_pending");
    if (config.has(section, "backpressure"))
        opt.backpressure = parse_backpressure(config.getString(section, "backpressure"));
    opt = opt.normalized();

    if (config.has(section, "timeout_ms"))
        s.http.timeout_ms = config.getInt(section, "timeout_ms");
    if (config.has(section, "connect_timeout_ms"))
        s.http.connect_timeout_ms = config.getInt(section, "connect_timeout_ms");
    if (config.has(section, "verify_tls"))
        s.http.verify_tls = config.getBool(section, "verify_tls");
    if (config.has(section, "proxy"))
        s.http.proxy = config.getString(section, "proxy");

    if (config.has(section, "bearer_token"))
        s.bearer_token = config.getString(section, "bearer_token");
    if (config.has(section, "bearer_token_env"))
        s.bearer_token_env = config.getString(section, "bearer_token_env");

    if (config.has(section, "headers")) {
        s.headers = config.getArray<HeaderEntry>(section, "headers",
            [](const YAML::Node& node) {
                HeaderEntry h;
                h.name = node["name"].as<std::string>();
                h.value = node["value"].as<std::string>();
                return h;
            });
    }

    spdlog::info("ingest_options: endpoint={} batch_size={} max_delay={}ms queue_capacity={} backpressure={}",
                 opt.endpoint, opt.batch_size, opt.max_delay.count(), opt.queue_capacity,
                 to_string(opt.backpressure));
    return s;
}
