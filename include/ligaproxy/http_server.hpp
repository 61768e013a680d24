#pragma once

#include "ligaproxy/dispatcher.hpp"
#include <stop_token>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace ligaproxy {

struct HttpReply {
    int status = 200;
    std::string request_id;
    nlohmann::ordered_json body;
};

// 400 for unknown operation and validation, 502 upstream, 500 internal.
int http_status_for(ErrorCode code);

std::string new_request_id();

// Body for replies the router produces itself: 404 NOT_FOUND,
// 405 METHOD_NOT_ALLOWED, anything else HTTP_ERROR.
nlohmann::ordered_json http_error_body(int status);

// Network front-end for the dispatcher:
//   POST /proxy/execute  {operationType, payload, requestId?}
//   GET  /health
//   GET  /operations
class ProxyServer {
public:
    explicit ProxyServer(OperationDispatcher& dispatcher);

    bool listen(const std::string& host, int port);

    // Stops accepting connections and cancels retries still in flight.
    void stop();

    HttpReply execute(const httplib::Request& req);
    HttpReply health(const httplib::Request& req) const;
    HttpReply operations(const httplib::Request& req) const;

private:
    void register_routes();

    OperationDispatcher& dispatcher_;
    httplib::Server server_;
    std::stop_source stop_source_;
};

} // namespace ligaproxy
