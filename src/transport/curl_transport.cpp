#include "transport/curl_transport.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

static size_t collect_cb(char* ptr, size_t size, size_t n, void* userdata)
{
    static_cast<std::string*>(userdata)->append(ptr, size * n);
    return size * n;
}

static void ensure_curl_global_init()
{
    static std::once_flag once;
    std::call_once(once, [] {
        // curl_global_cleanup is left to process exit; other transports may still be alive
        curl_global_init(CURL_GLOBAL_ALL);
        spdlog::debug("curl_transport: curl_global_init done");
    });
}

/* ---------- construct / destroy ---------- */
CurlTransport::CurlTransport() : CurlTransport(options{}) {}

CurlTransport::CurlTransport(options opt)
    : opt_(std::move(opt))
{
    ensure_curl_global_init();
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("curl_easy_init failed");
    spdlog::debug("curl_transport: initialized timeout_ms={} connect_timeout_ms={} verify_tls={}",
                  opt_.timeout_ms, opt_.connect_timeout_ms, opt_.verify_tls);
}

CurlTransport::~CurlTransport()
{
    if (curl_) curl_easy_cleanup(curl_);
}

/* ---------- libcurl request ---------- */
HttpResponse CurlTransport::execute(const HttpRequest& request)
{
    std::lock_guard lg(curl_mtx_);

    HttpResponse resp;

    // reset drops per-request options but keeps live connections for reuse
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method == "POST" || !request.body.empty()) {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, collect_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    if (opt_.timeout_ms > 0)
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, opt_.timeout_ms);
    if (opt_.connect_timeout_ms > 0)
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, opt_.connect_timeout_ms);
    if (!opt_.verify_tls) {
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!opt_.proxy.empty())
        curl_easy_setopt(curl_, CURLOPT_PROXY, opt_.proxy.c_str());

    struct curl_slist* hdrs = nullptr;
    for (const auto& [name, value] : request.headers)
        hdrs = curl_slist_append(hdrs, fmt::format("{}: {}", name, value).c_str());
    if (!request.header("Content-Type") && !opt_.content_type.empty())
        hdrs = curl_slist_append(hdrs, fmt::format("Content-Type: {}", opt_.content_type).c_str());
    // suppress "Expect: 100-continue" round trip on large bodies
    hdrs = curl_slist_append(hdrs, "Expect:");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, hdrs);

    CURLcode rc = curl_easy_perform(curl_);
    curl_slist_free_all(hdrs);

    if (rc != CURLE_OK)
    {
        throw TransportError(fmt::format("curl: {} {}: {}",
                                         request.method, request.url, curl_easy_strerror(rc)));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
