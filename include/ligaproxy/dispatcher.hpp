#pragma once

#include "ligaproxy/payloads.hpp"
#include "ligaproxy/provider.hpp"
#include "ligaproxy/schemas.hpp"
#include "ligaproxy/types.hpp"
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace ligaproxy {

enum class ErrorCode { UnknownOperation, Validation, Upstream, Internal };

std::string_view to_string(ErrorCode code);

struct OperationError {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    nlohmann::json details; // null when there are none
};

// {error, code, details?}
nlohmann::ordered_json error_to_json(const OperationError& error);

// Static descriptor of one operation. `invoke` is the argument-extraction
// rule: it unpacks the validated payload into the provider call.
struct Operation {
    std::string name;
    nlohmann::ordered_json payload_shape;
    nlohmann::ordered_json output_shape;
    std::function<ValidationResult(const nlohmann::json&)> validate;
    std::function<std::expected<RawRecord, UpstreamError>(
        Provider&, const RequestContext&, const Payload&)> invoke;
    std::function<std::expected<OperationResult, SchemaError>(const RawRecord&)> normalize;
};

// ListLeagues, GetLeagueMatches, GetTeam, GetMatch, in that order.
std::vector<Operation> build_registry();

class OperationDispatcher {
public:
    explicit OperationDispatcher(Provider& provider);

    // Lookup, validate, invoke, normalize. Stops at the first failing stage;
    // never retries on its own.
    std::expected<OperationResult, OperationError> execute(
        const RequestContext& ctx, std::string_view operation,
        const nlohmann::json& payload) const;

    std::vector<std::string> operations() const;

    // {name: {payload_schema, response_schema}} for every operation, in
    // registry order.
    nlohmann::ordered_json operation_info() const;

    std::string_view provider_name() const { return provider_.name(); }

private:
    const Operation* find(std::string_view name) const;

    Provider& provider_;
    std::vector<Operation> registry_;
};

} // namespace ligaproxy
