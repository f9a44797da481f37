#include "ingest/flusher.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

constexpr long        kStatusOK          = 200;
constexpr std::size_t kLoggedBodyLimit   = 256;

void validate_url(const std::string& url)
{
    auto bad = std::find_if(url.begin(), url.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u <= 0x20 || u == 0x7f;
    });
    if (bad != url.end())
        throw std::invalid_argument(fmt::format("invalid endpoint '{}': contains whitespace or control characters", url));

    auto sep = url.find("://");
    if (sep == std::string::npos)
        throw std::invalid_argument(fmt::format("invalid endpoint '{}': missing scheme", url));

    std::string scheme = url.substr(0, sep);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https")
        throw std::invalid_argument(fmt::format("invalid endpoint '{}': unsupported scheme '{}'", url, scheme));

    auto host_begin = sep + 3;
    auto host_end = url.find_first_of("/?#", host_begin);
    if (host_end == std::string::npos) host_end = url.size();
    if (host_end == host_begin)
        throw std::invalid_argument(fmt::format("invalid endpoint '{}': missing host", url));
}

} // namespace

const char* to_string(FlushResult r)
{
    switch (r) {
    case FlushResult::Empty:     return "empty";
    case FlushResult::Delivered: return "delivered";
    case FlushResult::Retry:     return "retry";
    case FlushResult::Fatal:     return "fatal";
    }
    return "unknown";
}

std::string Flusher::ingest_url(const std::string& endpoint)
{
    std::string url = endpoint;
    if (!url.empty() && url.back() == '/') url.pop_back();
    return url + "/ingest";
}

Flusher::Flusher(std::string endpoint,
                 std::shared_ptr<HttpTransport> transport,
                 AuthDecorator auth)
    : url_(ingest_url(endpoint)),
      transport_(std::move(transport)),
      auth_(std::move(auth))
{
    if (!transport_) throw std::invalid_argument("Flusher: transport is required");
}

HttpRequest Flusher::make_request(std::string body) const
{
    validate_url(url_);
    HttpRequest req;
    req.method = "POST";
    req.url = url_;
    req.body = std::move(body);
    return req;
}

/* ---------- one flush attempt ---------- */
FlushResult Flusher::flush(Batch& batch)
{
    if (batch.empty()) return FlushResult::Empty;

    HttpRequest req;
    try {
        req = make_request(batch.encode());
    } catch (const std::invalid_argument& e) {
        last_error_ = e.what();
        return FlushResult::Fatal;
    }

    HttpResponse resp;
    try {
        // decorated per attempt, so rotated credentials reach the next retry
        if (auth_) auth_(req);
        resp = transport_->execute(req);
    } catch (const TransportError& e) {
        last_error_ = e.what();
        spdlog::warn("flusher: ingest request failed, keeping {} records: {}", batch.size(), e.what());
        return FlushResult::Retry;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        spdlog::error("flusher: unexpected error while sending {} records: {}", batch.size(), e.what());
        return FlushResult::Retry;
    }

    if (resp.status != kStatusOK) {
        last_error_ = fmt::format("ingest status {}", resp.status);
        spdlog::error("flusher: ingest status not ok, status={} records={} body='{}'",
                      resp.status, batch.size(), resp.body.substr(0, kLoggedBodyLimit));
        return FlushResult::Retry;
    }

    spdlog::debug("flusher: delivered {} records to {}", batch.size(), url_);
    last_error_.clear();
    batch.clear();
    return FlushResult::Delivered;
}
