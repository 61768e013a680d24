#include "ligaproxy/http_server.hpp"
#include "ligaproxy/audit.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <spdlog/spdlog.h>

namespace ligaproxy {

namespace {

constexpr const char* request_id_header = "X-Request-ID";

bool is_sensitive(std::string name) {
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });
    return name == "authorization" || name == "cookie";
}

std::string resolve_request_id(const httplib::Request& req) {
    auto id = req.get_header_value(request_id_header);
    return id.empty() ? new_request_id() : id;
}

void log_inbound(const RequestContext& ctx, const httplib::Request& req) {
    auto headers = nlohmann::json::object();
    for (const auto& [name, value] : req.headers) {
        headers[name] = is_sensitive(name) ? "[REDACTED]" : value;
    }
    audit::info(ctx, "inbound", {
        audit::string_field("method", req.method),
        audit::string_field("path", req.path),
        audit::string_field("headers", headers.dump()),
    });
}

void write_reply(httplib::Response& res, const HttpReply& reply) {
    res.status = reply.status;
    res.set_header(request_id_header, reply.request_id);
    res.set_content(reply.body.dump(), "application/json");
}

HttpReply bad_request(const std::string& request_id, std::vector<FieldError> errors) {
    auto details = nlohmann::ordered_json::array();
    for (const auto& e : errors) {
        details.push_back({{"field", e.field}, {"message", e.message}, {"type", e.kind}});
    }
    return {400, request_id, nlohmann::ordered_json{
        {"error", "Request validation failed"},
        {"code", "VALIDATION_ERROR"},
        {"details", {{"validation_errors", details}}},
        {"requestId", request_id},
    }};
}

} // namespace

int http_status_for(ErrorCode code) {
    switch (code) {
    case ErrorCode::Upstream: return 502;
    case ErrorCode::Internal: return 500;
    case ErrorCode::UnknownOperation:
    case ErrorCode::Validation:
        return 400;
    }
    return 400;
}

std::string new_request_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;

    std::uint32_t a = dist(rng), b = dist(rng), c = dist(rng), d = dist(rng);
    b = (b & 0xffff0fffu) | 0x00004000u; // version 4
    c = (c & 0x3fffffffu) | 0x80000000u; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%04x%08x",
                  a, b >> 16, b & 0xffffu, c >> 16, c & 0xffffu, d);
    return buf;
}

nlohmann::ordered_json http_error_body(int status) {
    std::string error = "Request failed";
    std::string code = "HTTP_ERROR";
    if (status == 404) {
        error = "Endpoint not found";
        code = "NOT_FOUND";
    } else if (status == 405) {
        error = "Method not allowed";
        code = "METHOD_NOT_ALLOWED";
    }
    return {
        {"error", error},
        {"code", code},
        {"details", {{"message", "Use POST /proxy/execute for operations"}}},
    };
}

ProxyServer::ProxyServer(OperationDispatcher& dispatcher) : dispatcher_(dispatcher) {
    register_routes();
}

bool ProxyServer::listen(const std::string& host, int port) {
    spdlog::info("listening on {}:{} provider={}", host, port, dispatcher_.provider_name());
    return server_.listen(host, port);
}

void ProxyServer::stop() {
    stop_source_.request_stop();
    server_.stop();
}

HttpReply ProxyServer::execute(const httplib::Request& req) {
    auto request = nlohmann::json::parse(req.body, nullptr, false);

    std::string request_id = req.get_header_value(request_id_header);
    if (request_id.empty() && request.is_object()) {
        auto it = request.find("requestId");
        if (it != request.end() && it->is_string()) request_id = it->get<std::string>();
    }
    if (request_id.empty()) request_id = new_request_id();

    RequestContext ctx{request_id, stop_source_.get_token()};
    log_inbound(ctx, req);

    if (request.is_discarded() || !request.is_object()) {
        return bad_request(request_id, {{"body", "Request body must be a JSON object", "json_invalid"}});
    }

    std::vector<FieldError> errors;
    auto op = request.find("operationType");
    if (op == request.end()) {
        errors.push_back({"operationType", "Field required", "missing"});
    } else if (!op->is_string()) {
        errors.push_back({"operationType", "Input should be a valid string", "string_type"});
    }
    auto payload = request.find("payload");
    if (payload == request.end()) {
        errors.push_back({"payload", "Field required", "missing"});
    } else if (!payload->is_object()) {
        errors.push_back({"payload", "Input should be a valid dictionary", "dict_type"});
    }
    if (!errors.empty()) return bad_request(request_id, std::move(errors));

    const auto operation = op->get<std::string>();
    audit::info(ctx, "proxy_start", {audit::string_field("operation_type", operation)});

    auto result = dispatcher_.execute(ctx, operation, *payload);
    if (!result) {
        audit::info(ctx, "proxy_complete", {
            audit::string_field("outcome", "error"),
            audit::string_field("operation_type", operation),
            audit::string_field("error_code", to_string(result.error().code)),
        });
        auto body = error_to_json(result.error());
        body["requestId"] = request_id;
        return {http_status_for(result.error().code), request_id, std::move(body)};
    }

    audit::info(ctx, "proxy_complete", {
        audit::string_field("outcome", "success"),
        audit::string_field("operation_type", operation),
    });
    return {200, request_id, {
        {"requestId", request_id},
        {"operationType", operation},
        {"data", result_to_json(*result)},
    }};
}

HttpReply ProxyServer::health(const httplib::Request& req) const {
    RequestContext ctx{resolve_request_id(req), {}};
    log_inbound(ctx, req);
    return {200, ctx.request_id, {
        {"status", "healthy"},
        {"provider", std::string(dispatcher_.provider_name())},
    }};
}

HttpReply ProxyServer::operations(const httplib::Request& req) const {
    RequestContext ctx{resolve_request_id(req), {}};
    log_inbound(ctx, req);
    return {200, ctx.request_id, {
        {"supported_operations", dispatcher_.operations()},
        {"schemas", dispatcher_.operation_info()},
    }};
}

void ProxyServer::register_routes() {
    server_.Post("/proxy/execute", [this](const httplib::Request& req, httplib::Response& res) {
        write_reply(res, execute(req));
    });

    server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        write_reply(res, health(req));
    });

    server_.Get("/operations", [this](const httplib::Request& req, httplib::Response& res) {
        write_reply(res, operations(req));
    });

    // Known paths with the wrong method; the error handler fills the body.
    auto not_allowed = [](const char* allow) {
        return [allow](const httplib::Request&, httplib::Response& res) {
            res.status = 405;
            res.set_header("Allow", allow);
        };
    };
    server_.Get("/proxy/execute", not_allowed("POST"));
    server_.Post("/health", not_allowed("GET"));
    server_.Post("/operations", not_allowed("GET"));

    // Also invoked for our own 4xx/5xx replies, which already carry a body.
    server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        res.set_content(http_error_body(res.status).dump(), "application/json");
    });

    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        auto id = res.get_header_value(request_id_header);
        RequestContext ctx{id.empty() ? req.get_header_value(request_id_header) : id, {}};
        audit::info(ctx, "outbound", {
            audit::string_field("path", req.path),
            audit::int_field("status_code", res.status),
            audit::int_field("body_size", static_cast<std::int64_t>(res.body.size())),
        });
    });
}

} // namespace ligaproxy
