#pragma once

#include <chrono>
#include <expected>
#include <string>

namespace ligaproxy {

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Connection refused, DNS failure, timeout: no HTTP status was received.
struct TransportError {
    std::string message;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual std::expected<HttpResponse, TransportError> get(const std::string& path) = 0;
};

// HTTPS GET through cpp-httplib. Each attempt is bounded by `timeout` for
// both connect and read.
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(std::string host,
                              std::chrono::seconds timeout = std::chrono::seconds(10));

    std::expected<HttpResponse, TransportError> get(const std::string& path) override;

private:
    std::string host_;
    std::chrono::seconds timeout_;
};

} // namespace ligaproxy
