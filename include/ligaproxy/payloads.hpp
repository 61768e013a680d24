#pragma once

#include "ligaproxy/types.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace ligaproxy {

struct ListLeaguesPayload {};

struct GetLeagueMatchesPayload {
    std::string league_shortcut;
    std::string league_season;
};

struct GetTeamPayload {
    std::int64_t team_id = 0;
};

struct GetMatchPayload {
    std::int64_t match_id = 0;
};

using Payload = std::variant<ListLeaguesPayload, GetLeagueMatchesPayload,
                             GetTeamPayload, GetMatchPayload>;

using ValidationResult = std::expected<Payload, std::vector<FieldError>>;

// Unknown fields are ignored. Integer fields accept JSON integers, floats
// with no fractional part and decimal strings; string fields accept strings only.
ValidationResult validate_list_leagues(const nlohmann::json& payload);
ValidationResult validate_league_matches(const nlohmann::json& payload);
ValidationResult validate_team(const nlohmann::json& payload);
ValidationResult validate_match(const nlohmann::json& payload);

nlohmann::ordered_json list_leagues_payload_shape();
nlohmann::ordered_json league_matches_payload_shape();
nlohmann::ordered_json team_payload_shape();
nlohmann::ordered_json match_payload_shape();

} // namespace ligaproxy
