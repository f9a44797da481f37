#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <mutex>
#include <string>

#include <curl/curl.h>

#include "transport/http_transport.hpp"

class CurlTransport : public HttpTransport
{
public:
    struct options
    {
        long        timeout_ms         = 0;     // 0: no limit
        long        connect_timeout_ms = 0;     // 0: libcurl default
        bool        verify_tls         = true;
        std::string proxy;                      // empty: environment / none
        std::string user_agent         = "quickingest/1.0";
        std::string content_type       = "application/json"; // when the request sets none
    };

    CurlTransport();
    explicit CurlTransport(options opt);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const options& get_options() const { return opt_; }

private:
    options    opt_;
    CURL*      curl_ = nullptr;
    std::mutex curl_mtx_;   // one easy handle, shared by every caller
};
