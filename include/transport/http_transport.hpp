#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest
{
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /* replaces an existing header with the same name (case-insensitive) */
    void set_header(const std::string& name, std::string value);

    /* nullptr when absent */
    const std::string* header(const std::string& name) const;
};

struct HttpResponse
{
    long        status = 0;
    std::string body;
};

// Connection-level failure: nothing usable came back from the server.
class TransportError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // Returns the response for any HTTP status; throws TransportError when
    // the exchange itself fails. Implementations must read the whole body.
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};
