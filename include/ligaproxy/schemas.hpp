#pragma once

#include "ligaproxy/provider.hpp"
#include "ligaproxy/types.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace ligaproxy {

enum class MatchStatus { Scheduled, InProgress, Finished };

std::string_view to_string(MatchStatus status);
std::optional<MatchStatus> parse_match_status(std::string_view s);

// Wall-clock time exactly as written upstream. A naive value (no offset)
// stays naive; OpenLigaDB sends local German time that way.
struct Timestamp {
    TimePoint local;
    std::optional<std::chrono::minutes> utc_offset;

    TimePoint utc() const { return utc_offset ? local - *utc_offset : local; }
};

// Parsed timestamp, or the upstream string when it is not ISO 8601.
using DateTime = std::variant<Timestamp, std::string>;

struct LeagueSummary {
    std::int64_t id = 0;
    std::string name;
    std::string shortcut;
    std::string country;
    std::string season;
};

struct TeamDetail {
    std::int64_t id = 0;
    std::string name;
    std::string short_name;
    std::optional<std::string> icon_url;
};

struct MatchScore {
    std::int64_t home = 0;
    std::int64_t away = 0;
    MatchStatus status = MatchStatus::Scheduled;
};

struct MatchDetail {
    std::int64_t id = 0;
    std::string league_name;
    DateTime date_time;
    TeamDetail team_home;
    TeamDetail team_away;
    MatchScore score;
    bool is_finished = false;
};

struct ListLeaguesResponse {
    std::vector<LeagueSummary> leagues;
};

struct GetLeagueMatchesResponse {
    std::vector<MatchDetail> matches;
};

struct GetTeamResponse {
    TeamDetail team;
};

struct GetMatchResponse {
    MatchDetail match;
};

using OperationResult = std::variant<ListLeaguesResponse, GetLeagueMatchesResponse,
                                     GetTeamResponse, GetMatchResponse>;

// Adapter output did not match the declared shape. Never retryable.
struct SchemaError {
    std::vector<FieldError> errors;
};

// Each normalize_* validates every field of its response and renames the
// adapter's field names to the canonical ones:
//   current_season -> season, team_id -> id, match_id -> id,
//   match_date_time -> date_time, final_score -> score, match_status -> status.
std::expected<ListLeaguesResponse, SchemaError> normalize_list_leagues(const RawRecord& raw);
std::expected<GetLeagueMatchesResponse, SchemaError> normalize_league_matches(const RawRecord& raw);
std::expected<GetTeamResponse, SchemaError> normalize_team(const RawRecord& raw);
std::expected<GetMatchResponse, SchemaError> normalize_match(const RawRecord& raw);

std::optional<Timestamp> parse_iso8601(const std::string& s);

// YYYY-MM-DDTHH:MM:SS[.ffffff] followed by nothing (naive), Z, or +HH:MM.
std::string format_iso8601(const Timestamp& ts);

// Records serialize with keys in declaration order.
void to_json(nlohmann::ordered_json& j, const LeagueSummary& league);
void to_json(nlohmann::ordered_json& j, const TeamDetail& team);
void to_json(nlohmann::ordered_json& j, const MatchScore& score);
void to_json(nlohmann::ordered_json& j, const MatchDetail& match);
void to_json(nlohmann::ordered_json& j, const ListLeaguesResponse& response);
void to_json(nlohmann::ordered_json& j, const GetLeagueMatchesResponse& response);
void to_json(nlohmann::ordered_json& j, const GetTeamResponse& response);
void to_json(nlohmann::ordered_json& j, const GetMatchResponse& response);

nlohmann::ordered_json result_to_json(const OperationResult& result);

// JSON descriptions of each response shape, for introspection.
nlohmann::ordered_json list_leagues_response_shape();
nlohmann::ordered_json league_matches_response_shape();
nlohmann::ordered_json team_response_shape();
nlohmann::ordered_json match_response_shape();

} // namespace ligaproxy
