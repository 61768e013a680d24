#include "ligaproxy/openliga_provider.hpp"
#include "ligaproxy/audit.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>

namespace ligaproxy {

namespace {

// Integers and integral floats that fit in int64; anything else is the fallback.
std::int64_t safe_int(const nlohmann::json& j, const std::string& key, std::int64_t fallback = 0) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;

    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return fallback;
        return static_cast<std::int64_t>(value);
    }
    if (it->is_number_integer()) return it->get<std::int64_t>();

    if (it->is_number_float()) {
        double d = it->get<double>();
        // 2^63 is exactly representable; anything at or above it overflows.
        constexpr double limit = 9223372036854775808.0;
        if (std::isfinite(d) && std::trunc(d) == d && d >= -limit && d < limit) {
            return static_cast<std::int64_t>(d);
        }
    }
    return fallback;
}

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) return it->get<std::string>();
    return fallback;
}

bool safe_bool(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

nlohmann::json optional_str(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) return *it;
    return nullptr;
}

const nlohmann::json& safe_obj(const nlohmann::json& j, const std::string& key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(key);
    if (it != j.end() && it->is_object()) return *it;
    return empty;
}

std::string encode_segment(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

RawRecord map_team_detail(const nlohmann::json& team) {
    return {
        {"team_id", safe_int(team, "teamId")},
        {"name", safe_str(team, "teamName")},
        {"short_name", safe_str(team, "shortName")},
        {"icon_url", optional_str(team, "teamIconUrl")},
    };
}

// The last matchResults entry is taken as the final score. Upstream does
// not document its ordering.
RawRecord map_final_score(const nlohmann::json& match) {
    RawRecord score = {{"home", 0}, {"away", 0}, {"match_status", "scheduled"}};

    auto results = match.find("matchResults");
    if (results == match.end() || !results->is_array() || results->empty()) return score;

    const auto& final_result = results->back();
    if (!final_result.is_object()) return score;

    score["home"] = safe_int(final_result, "pointsTeam1");
    score["away"] = safe_int(final_result, "pointsTeam2");
    score["match_status"] = safe_bool(match, "matchIsFinished") ? "finished" : "in_progress";
    return score;
}

RawRecord map_match_detail(const nlohmann::json& match, const std::string& league_name) {
    return {
        {"match_id", safe_int(match, "matchID")},
        {"league_name", league_name},
        {"match_date_time", safe_str(match, "matchDateTime")},
        {"team_home", map_team_detail(safe_obj(match, "team1"))},
        {"team_away", map_team_detail(safe_obj(match, "team2"))},
        {"final_score", map_final_score(match)},
        {"is_finished", safe_bool(match, "matchIsFinished")},
    };
}

} // namespace

RawRecord map_leagues(const nlohmann::json& data) {
    RawRecord leagues = RawRecord::array();
    if (!data.is_array()) return {{"leagues", leagues}};

    for (const auto& league : data) {
        if (!league.is_object()) continue;
        leagues.push_back({
            {"id", safe_int(league, "leagueId")},
            {"name", safe_str(league, "leagueName")},
            {"shortcut", safe_str(league, "leagueShortcut")},
            {"country", safe_str(league, "country")},
            {"current_season", safe_str(league, "leagueSeason")},
        });
    }
    return {{"leagues", leagues}};
}

RawRecord map_league_matches(const nlohmann::json& data, const std::string& league_shortcut) {
    RawRecord matches = RawRecord::array();
    if (data.is_array()) {
        for (const auto& match : data) {
            if (match.is_object()) matches.push_back(map_match_detail(match, league_shortcut));
        }
    }
    return {{"matches", matches}};
}

RawRecord map_team(const nlohmann::json& data) {
    static const nlohmann::json empty = nlohmann::json::object();
    return {{"team", map_team_detail(data.is_object() ? data : empty)}};
}

std::expected<RawRecord, UpstreamError> map_match(const nlohmann::json& data) {
    const nlohmann::json* match = nullptr;
    if (data.is_array() && !data.empty()) {
        match = &data.front();
    } else if (data.is_object()) {
        match = &data;
    }

    if (!match || !match->is_object() || match->empty()) {
        return std::unexpected(UpstreamError{0, "Match not found"});
    }

    return RawRecord{{"match", map_match_detail(*match, safe_str(*match, "leagueName"))}};
}

OpenLigaProvider::OpenLigaProvider(const ProviderSettings& settings,
                                   std::unique_ptr<HttpTransport> transport,
                                   std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)),
      transport_(std::move(transport)),
      limiter_(settings.rate_limit_requests, settings.rate_limit_window, *clock_),
      caller_(*transport_, *clock_, settings.retry) {}

std::expected<nlohmann::json, UpstreamError> OpenLigaProvider::fetch(
    const RequestContext& ctx, const std::string& path) {

    if (!limiter_.acquire(ctx)) {
        return std::unexpected(UpstreamError{0, "Request cancelled"});
    }
    return caller_.call(ctx, path);
}

std::expected<RawRecord, UpstreamError> OpenLigaProvider::list_leagues(
    const RequestContext& ctx) {

    auto result = fetch(ctx, "/getavailableleagues");
    if (!result) return std::unexpected(result.error());
    return map_leagues(*result);
}

std::expected<RawRecord, UpstreamError> OpenLigaProvider::get_league_matches(
    const RequestContext& ctx, const std::string& league_shortcut,
    const std::string& league_season) {

    auto result = fetch(ctx, "/getmatchdata/" + encode_segment(league_shortcut) + "/" +
                                 encode_segment(league_season));
    if (!result) return std::unexpected(result.error());
    return map_league_matches(*result, league_shortcut);
}

// Upstream answers /getteam with 404 in practice, so callers usually see
// UPSTREAM_ERROR here; a non-object 200 body yields an all-default team.
std::expected<RawRecord, UpstreamError> OpenLigaProvider::get_team(
    const RequestContext& ctx, std::int64_t team_id) {

    auto result = fetch(ctx, "/getteam/" + std::to_string(team_id));
    if (!result) return std::unexpected(result.error());
    return map_team(*result);
}

std::expected<RawRecord, UpstreamError> OpenLigaProvider::get_match(
    const RequestContext& ctx, std::int64_t match_id) {

    auto result = fetch(ctx, "/getmatchdata/" + std::to_string(match_id));
    if (!result) return std::unexpected(result.error());

    auto mapped = map_match(*result);
    if (!mapped) {
        audit::warn(ctx, "upstream_error", {
            audit::int_field("match_id", match_id),
            audit::string_field("reason", mapped.error().message),
        });
    }
    return mapped;
}

} // namespace ligaproxy
