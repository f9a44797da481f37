#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <memory>
#include <string>

#include "ingest/batch.hpp"
#include "transport/auth.hpp"
#include "transport/http_transport.hpp"

enum class FlushResult {
    Empty,       // nothing to send
    Delivered,   // 200 OK, batch cleared
    Retry,       // transport error or non-200, batch kept for the next trigger
    Fatal        // request could not be built, retrying cannot help
};

const char* to_string(FlushResult r);

class Flusher
{
public:
    Flusher(std::string endpoint,
            std::shared_ptr<HttpTransport> transport,
            AuthDecorator auth);

    // Serializes the batch, POSTs it to <endpoint>/ingest and clears the
    // batch only when the server answers 200.
    FlushResult flush(Batch& batch);

    // Throws std::invalid_argument for an unusable URL.
    HttpRequest make_request(std::string body) const;

    const std::string& url() const { return url_; }
    const std::string& last_error() const { return last_error_; }

    // One trailing '/' of the endpoint is dropped before "/ingest" is appended.
    static std::string ingest_url(const std::string& endpoint);

private:
    std::string                    url_;
    std::shared_ptr<HttpTransport> transport_;
    AuthDecorator                  auth_;
    std::string                    last_error_;
};
