#include "ligaproxy/payloads.hpp"
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <string_view>

namespace ligaproxy {

namespace {

std::string_view trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = sv.find_last_not_of(" \t\r\n");
    return sv.substr(start, end - start + 1);
}

bool require_object(const nlohmann::json& payload, std::vector<FieldError>& errors) {
    if (payload.is_object()) return true;
    errors.push_back({"payload", "Input should be a valid dictionary", "dict_type"});
    return false;
}

std::optional<std::string> required_string(const nlohmann::json& payload, const std::string& key,
                                           std::vector<FieldError>& errors) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        errors.push_back({key, "Field required", "missing"});
        return std::nullopt;
    }
    if (!it->is_string()) {
        errors.push_back({key, "Input should be a valid string", "string_type"});
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::int64_t> required_int(const nlohmann::json& payload, const std::string& key,
                                         std::vector<FieldError>& errors) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        errors.push_back({key, "Field required", "missing"});
        return std::nullopt;
    }

    const auto& v = *it;
    if (v.is_number_integer()) {
        if (v.is_number_unsigned() &&
            v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            errors.push_back({key, "Input should be a valid integer", "int_type"});
            return std::nullopt;
        }
        return v.get<std::int64_t>();
    }

    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= -9.2e18 && d <= 9.2e18) {
            return static_cast<std::int64_t>(d);
        }
        errors.push_back({key, "Input should be a valid integer, got a number with a fractional part",
                          "int_from_float"});
        return std::nullopt;
    }

    if (v.is_string()) {
        auto s = trim(v.get_ref<const std::string&>());
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (!s.empty() && ec == std::errc{} && ptr == s.data() + s.size()) return value;
        errors.push_back({key, "Input should be a valid integer, unable to parse string as an integer",
                          "int_parsing"});
        return std::nullopt;
    }

    errors.push_back({key, "Input should be a valid integer", "int_type"});
    return std::nullopt;
}

nlohmann::ordered_json payload_shape(const std::string& title, nlohmann::ordered_json properties,
                                     std::vector<std::string> required) {
    return {
        {"title", title},
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
    };
}

} // namespace

ValidationResult validate_list_leagues(const nlohmann::json& payload) {
    std::vector<FieldError> errors;
    if (!require_object(payload, errors)) return std::unexpected(std::move(errors));
    return ListLeaguesPayload{};
}

ValidationResult validate_league_matches(const nlohmann::json& payload) {
    std::vector<FieldError> errors;
    if (!require_object(payload, errors)) return std::unexpected(std::move(errors));

    auto shortcut = required_string(payload, "league_shortcut", errors);
    auto season = required_string(payload, "league_season", errors);
    if (!errors.empty()) return std::unexpected(std::move(errors));

    return GetLeagueMatchesPayload{std::move(*shortcut), std::move(*season)};
}

ValidationResult validate_team(const nlohmann::json& payload) {
    std::vector<FieldError> errors;
    if (!require_object(payload, errors)) return std::unexpected(std::move(errors));

    auto team_id = required_int(payload, "team_id", errors);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return GetTeamPayload{*team_id};
}

ValidationResult validate_match(const nlohmann::json& payload) {
    std::vector<FieldError> errors;
    if (!require_object(payload, errors)) return std::unexpected(std::move(errors));

    auto match_id = required_int(payload, "match_id", errors);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return GetMatchPayload{*match_id};
}

nlohmann::ordered_json list_leagues_payload_shape() {
    return payload_shape("ListLeaguesPayload", nlohmann::ordered_json::object(), {});
}

nlohmann::ordered_json league_matches_payload_shape() {
    return payload_shape("GetLeagueMatchesPayload", {
        {"league_shortcut", {{"type", "string"}}},
        {"league_season", {{"type", "string"}}},
    }, {"league_shortcut", "league_season"});
}

nlohmann::ordered_json team_payload_shape() {
    return payload_shape("GetTeamPayload", {{"team_id", {{"type", "integer"}}}}, {"team_id"});
}

nlohmann::ordered_json match_payload_shape() {
    return payload_shape("GetMatchPayload", {{"match_id", {{"type", "integer"}}}}, {"match_id"});
}

} // namespace ligaproxy
