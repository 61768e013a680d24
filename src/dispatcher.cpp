#include "ligaproxy/dispatcher.hpp"
#include "ligaproxy/audit.hpp"
#include <algorithm>

namespace ligaproxy {

namespace {

template <typename NormalizeFn>
auto as_result(NormalizeFn fn) {
    return [fn](const RawRecord& raw) -> std::expected<OperationResult, SchemaError> {
        auto normalized = fn(raw);
        if (!normalized) return std::unexpected(std::move(normalized.error()));
        return OperationResult{std::move(*normalized)};
    };
}

nlohmann::json field_errors_to_json(const std::vector<FieldError>& errors) {
    auto out = nlohmann::json::array();
    for (const auto& e : errors) {
        out.push_back({{"field", e.field}, {"message", e.message}, {"type", e.kind}});
    }
    return out;
}

std::string join_fields(const std::vector<FieldError>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += ',';
        out += e.field + ":" + e.kind;
    }
    return out;
}

} // namespace

std::string_view to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::UnknownOperation: return "UNKNOWN_OPERATION";
    case ErrorCode::Validation: return "VALIDATION_ERROR";
    case ErrorCode::Upstream: return "UPSTREAM_ERROR";
    case ErrorCode::Internal: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

nlohmann::ordered_json error_to_json(const OperationError& error) {
    nlohmann::ordered_json j = {
        {"error", error.message},
        {"code", std::string(to_string(error.code))},
    };
    if (!error.details.is_null()) j["details"] = error.details;
    return j;
}

std::vector<Operation> build_registry() {
    std::vector<Operation> registry;

    registry.push_back({
        .name = "ListLeagues",
        .payload_shape = list_leagues_payload_shape(),
        .output_shape = list_leagues_response_shape(),
        .validate = validate_list_leagues,
        .invoke = [](Provider& provider, const RequestContext& ctx, const Payload&) {
            return provider.list_leagues(ctx);
        },
        .normalize = as_result(normalize_list_leagues),
    });

    registry.push_back({
        .name = "GetLeagueMatches",
        .payload_shape = league_matches_payload_shape(),
        .output_shape = league_matches_response_shape(),
        .validate = validate_league_matches,
        .invoke = [](Provider& provider, const RequestContext& ctx, const Payload& payload) {
            const auto& args = std::get<GetLeagueMatchesPayload>(payload);
            return provider.get_league_matches(ctx, args.league_shortcut, args.league_season);
        },
        .normalize = as_result(normalize_league_matches),
    });

    registry.push_back({
        .name = "GetTeam",
        .payload_shape = team_payload_shape(),
        .output_shape = team_response_shape(),
        .validate = validate_team,
        .invoke = [](Provider& provider, const RequestContext& ctx, const Payload& payload) {
            return provider.get_team(ctx, std::get<GetTeamPayload>(payload).team_id);
        },
        .normalize = as_result(normalize_team),
    });

    registry.push_back({
        .name = "GetMatch",
        .payload_shape = match_payload_shape(),
        .output_shape = match_response_shape(),
        .validate = validate_match,
        .invoke = [](Provider& provider, const RequestContext& ctx, const Payload& payload) {
            return provider.get_match(ctx, std::get<GetMatchPayload>(payload).match_id);
        },
        .normalize = as_result(normalize_match),
    });

    return registry;
}

OperationDispatcher::OperationDispatcher(Provider& provider)
    : provider_(provider), registry_(build_registry()) {}

std::expected<OperationResult, OperationError> OperationDispatcher::execute(
    const RequestContext& ctx, std::string_view operation,
    const nlohmann::json& payload) const {

    const Operation* op = find(operation);
    if (!op) {
        std::string message = "Unknown operationType: " + std::string(operation);
        audit::warn(ctx, "validation", {
            audit::string_field("outcome", "fail"),
            audit::string_field("reason", message),
        });
        return std::unexpected(OperationError{
            ErrorCode::UnknownOperation, message,
            {{"valid_operations", operations()}}});
    }

    auto validated = op->validate(payload);
    if (!validated) {
        audit::warn(ctx, "validation", {
            audit::string_field("outcome", "fail"),
            audit::string_field("operation_type", op->name),
            audit::string_field("errors", join_fields(validated.error())),
        });
        return std::unexpected(OperationError{
            ErrorCode::Validation, "Payload validation failed",
            {{"validation_errors", field_errors_to_json(validated.error())}}});
    }
    audit::info(ctx, "validation", {
        audit::string_field("outcome", "pass"),
        audit::string_field("operation_type", op->name),
    });

    audit::info(ctx, "provider_call", {
        audit::string_field("operation_type", op->name),
        audit::string_field("provider", provider_.name()),
    });
    auto raw = op->invoke(provider_, ctx, *validated);
    if (!raw) {
        audit::warn(ctx, "provider_response", {
            audit::string_field("outcome", "error"),
            audit::string_field("operation_type", op->name),
            audit::string_field("reason", raw.error().message),
        });
        return std::unexpected(OperationError{
            ErrorCode::Upstream, "Upstream API failed",
            {{"message", raw.error().message}}});
    }
    audit::info(ctx, "provider_response", {
        audit::string_field("outcome", "success"),
        audit::string_field("operation_type", op->name),
    });

    auto normalized = op->normalize(*raw);
    if (!normalized) {
        audit::error(ctx, "response_normalization", {
            audit::string_field("outcome", "error"),
            audit::string_field("operation_type", op->name),
            audit::string_field("errors", join_fields(normalized.error().errors)),
        });
        return std::unexpected(OperationError{
            ErrorCode::Internal, "Internal response normalization error",
            {{"message", "Provider response format unexpected"}}});
    }
    audit::info(ctx, "response_normalization", {
        audit::string_field("outcome", "success"),
        audit::string_field("operation_type", op->name),
    });

    return std::move(*normalized);
}

std::vector<std::string> OperationDispatcher::operations() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& op : registry_) names.push_back(op.name);
    return names;
}

nlohmann::ordered_json OperationDispatcher::operation_info() const {
    auto info = nlohmann::ordered_json::object();
    for (const auto& op : registry_) {
        info[op.name] = {
            {"payload_schema", op.payload_shape},
            {"response_schema", op.output_shape},
        };
    }
    return info;
}

const Operation* OperationDispatcher::find(std::string_view name) const {
    auto it = std::ranges::find(registry_, name, &Operation::name);
    return it == registry_.end() ? nullptr : &*it;
}

} // namespace ligaproxy
