#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

class Config;

enum class Backpressure {
    Block,   // producer waits for space
    Drop     // record is discarded when the queue is full
};

Backpressure parse_backpressure(const std::string& name);
const char*  to_string(Backpressure mode);

struct IngestOptions {
    static constexpr std::size_t               kDefaultQueueCapacity = 10000;
    static constexpr std::size_t               kDefaultBatchSize     = 1000;
    static constexpr std::chrono::milliseconds kDefaultMaxDelay{1000};

    std::string               endpoint;                  // http://{host}/api/v1/{index}
    std::size_t               queue_capacity = kDefaultQueueCapacity;
    std::size_t               batch_size     = kDefaultBatchSize;
    std::chrono::milliseconds max_delay      = kDefaultMaxDelay;
    Backpressure              backpressure   = Backpressure::Block;
    std::size_t               max_pending    = 0;        // 0: accumulator unbounded

    // zero / non-positive values fall back to the defaults
    IngestOptions normalized() const;
};

struct HttpOptions {
    long        timeout_ms         = 0;
    long        connect_timeout_ms = 0;
    bool        verify_tls         = true;
    std::string proxy;
};

struct HeaderEntry {
    std::string name;
    std::string value;
};

// Everything the `ingest_config` section of a YAML file can carry.
struct IngestSettings {
    IngestOptions            ingest;
    HttpOptions              http;
    std::string              bearer_token;
    std::string              bearer_token_env;
    std::vector<HeaderEntry> headers;
};

IngestSettings load_ingest_settings(const Config& config,
                                    const std::string& section = "ingest_config");
