#include "ligaproxy/http_transport.hpp"
#include <httplib.h>

namespace ligaproxy {

HttplibTransport::HttplibTransport(std::string host, std::chrono::seconds timeout)
    : host_(std::move(host)), timeout_(timeout) {}

std::expected<HttpResponse, TransportError> HttplibTransport::get(const std::string& path) {
    httplib::SSLClient client(host_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);

    httplib::Headers headers{{"Accept", "application/json"}};

    auto res = client.Get(path, headers);
    if (!res) {
        return std::unexpected(TransportError{"Connection failed: " + httplib::to_string(res.error())});
    }
    return HttpResponse{res->status, res->body};
}

} // namespace ligaproxy
