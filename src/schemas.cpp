#include "ligaproxy/schemas.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <limits>
#include <type_traits>

namespace ligaproxy {

namespace {

// Reads declared fields out of one JSON object, recording a FieldError for
// every missing or mistyped field instead of stopping at the first.
class FieldReader {
public:
    FieldReader(const nlohmann::json& obj, std::string path, std::vector<FieldError>& errors)
        : obj_(obj), path_(std::move(path)), errors_(errors) {}

    std::string path(const std::string& key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

    std::int64_t integer(const std::string& key) {
        auto* v = find(key);
        if (!v) return 0;
        if (!v->is_number_integer() ||
            (v->is_number_unsigned() &&
             v->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))) {
            fail(key, "Input should be a valid integer", "int_type");
            return 0;
        }
        return v->get<std::int64_t>();
    }

    std::string string(const std::string& key) {
        auto* v = find(key);
        if (!v) return {};
        if (!v->is_string()) {
            fail(key, "Input should be a valid string", "string_type");
            return {};
        }
        return v->get<std::string>();
    }

    std::optional<std::string> optional_string(const std::string& key) {
        auto it = obj_.find(key);
        if (it == obj_.end() || it->is_null()) return std::nullopt;
        if (!it->is_string()) {
            fail(key, "Input should be a valid string", "string_type");
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    bool boolean(const std::string& key) {
        auto* v = find(key);
        if (!v) return false;
        if (!v->is_boolean()) {
            fail(key, "Input should be a valid boolean", "bool_type");
            return false;
        }
        return v->get<bool>();
    }

    const nlohmann::json* array(const std::string& key) {
        auto* v = find(key);
        if (v && !v->is_array()) {
            fail(key, "Input should be a valid list", "list_type");
            return nullptr;
        }
        return v;
    }

    const nlohmann::json* object(const std::string& key) {
        auto* v = find(key);
        if (v && !v->is_object()) {
            fail(key, "Input should be a valid dictionary", "model_type");
            return nullptr;
        }
        return v;
    }

    void fail(const std::string& key, std::string message, std::string kind) {
        errors_.push_back({path(key), std::move(message), std::move(kind)});
    }

private:
    const nlohmann::json* find(const std::string& key) {
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            fail(key, "Field required", "missing");
            return nullptr;
        }
        return &*it;
    }

    const nlohmann::json& obj_;
    std::string path_;
    std::vector<FieldError>& errors_;
};

bool require_object(const nlohmann::json& j, const std::string& path,
                    std::vector<FieldError>& errors) {
    if (j.is_object()) return true;
    errors.push_back({path, "Input should be a valid dictionary", "model_type"});
    return false;
}

LeagueSummary read_league(const nlohmann::json& j, const std::string& path,
                          std::vector<FieldError>& errors) {
    LeagueSummary league;
    if (!require_object(j, path, errors)) return league;

    FieldReader r(j, path, errors);
    league.id = r.integer("id");
    league.name = r.string("name");
    league.shortcut = r.string("shortcut");
    league.country = r.string("country");
    league.season = r.string("current_season");
    return league;
}

TeamDetail read_team(const nlohmann::json& j, const std::string& path,
                     std::vector<FieldError>& errors) {
    TeamDetail team;
    if (!require_object(j, path, errors)) return team;

    FieldReader r(j, path, errors);
    team.id = r.integer("team_id");
    team.name = r.string("name");
    team.short_name = r.string("short_name");
    team.icon_url = r.optional_string("icon_url");
    return team;
}

MatchScore read_score(const nlohmann::json& j, const std::string& path,
                      std::vector<FieldError>& errors) {
    MatchScore score;
    if (!require_object(j, path, errors)) return score;

    FieldReader r(j, path, errors);
    score.home = r.integer("home");
    score.away = r.integer("away");

    auto before = errors.size();
    auto status = r.string("match_status");
    if (errors.size() == before) {
        if (auto parsed = parse_match_status(status)) {
            score.status = *parsed;
        } else {
            r.fail("match_status",
                   "Input should be 'scheduled', 'in_progress' or 'finished'", "enum");
        }
    }
    return score;
}

MatchDetail read_match(const nlohmann::json& j, const std::string& path,
                       std::vector<FieldError>& errors) {
    MatchDetail match;
    if (!require_object(j, path, errors)) return match;

    FieldReader r(j, path, errors);
    match.id = r.integer("match_id");
    match.league_name = r.string("league_name");

    auto raw_date = r.string("match_date_time");
    if (auto parsed = parse_iso8601(raw_date)) {
        match.date_time = *parsed;
    } else {
        match.date_time = raw_date;
    }

    if (auto* home = r.object("team_home")) match.team_home = read_team(*home, r.path("team_home"), errors);
    if (auto* away = r.object("team_away")) match.team_away = read_team(*away, r.path("team_away"), errors);
    if (auto* score = r.object("final_score")) match.score = read_score(*score, r.path("final_score"), errors);
    match.is_finished = r.boolean("is_finished");
    return match;
}

template <typename T, typename ReadFn>
std::vector<T> read_list(const nlohmann::json& raw, const std::string& key,
                         std::vector<FieldError>& errors, ReadFn read) {
    std::vector<T> items;
    if (!require_object(raw, "", errors)) return items;

    FieldReader r(raw, "", errors);
    auto* list = r.array(key);
    if (!list) return items;

    for (std::size_t i = 0; i < list->size(); ++i) {
        items.push_back(read((*list)[i], key + "." + std::to_string(i), errors));
    }
    return items;
}

template <typename T, typename ReadFn>
std::optional<T> read_single(const nlohmann::json& raw, const std::string& key,
                             std::vector<FieldError>& errors, ReadFn read) {
    if (!require_object(raw, "", errors)) return std::nullopt;

    FieldReader r(raw, "", errors);
    auto* item = r.object(key);
    if (!item) return std::nullopt;
    return read(*item, key, errors);
}

nlohmann::ordered_json type_of(const std::string& type) {
    return {{"type", type}};
}

nlohmann::ordered_json object_shape(const std::string& title, nlohmann::ordered_json properties,
                                    std::vector<std::string> required) {
    return {
        {"title", title},
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
    };
}

nlohmann::ordered_json league_shape() {
    return object_shape("LeagueSummary", {
        {"id", type_of("integer")},
        {"name", type_of("string")},
        {"shortcut", type_of("string")},
        {"country", type_of("string")},
        {"season", type_of("string")},
    }, {"id", "name", "shortcut", "country", "season"});
}

nlohmann::ordered_json team_shape() {
    return object_shape("TeamDetail", {
        {"id", type_of("integer")},
        {"name", type_of("string")},
        {"short_name", type_of("string")},
        {"icon_url", {{"type", {"string", "null"}}, {"default", nullptr}}},
    }, {"id", "name", "short_name"});
}

nlohmann::ordered_json score_shape() {
    return object_shape("MatchScore", {
        {"home", type_of("integer")},
        {"away", type_of("integer")},
        {"status", {{"type", "string"}, {"enum", {"scheduled", "in_progress", "finished"}}}},
    }, {"home", "away", "status"});
}

nlohmann::ordered_json match_shape() {
    return object_shape("MatchDetail", {
        {"id", type_of("integer")},
        {"league_name", type_of("string")},
        {"date_time", {{"type", "string"}, {"format", "date-time"},
                       {"description", "ISO 8601 with the upstream offset kept (none when upstream sends none), "
                                       "or the upstream value when it is not ISO 8601"}}},
        {"team_home", team_shape()},
        {"team_away", team_shape()},
        {"score", score_shape()},
        {"is_finished", type_of("boolean")},
    }, {"id", "league_name", "date_time", "team_home", "team_away", "score", "is_finished"});
}

bool is_digits(std::string_view s) {
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return !s.empty();
}

} // namespace

std::string_view to_string(MatchStatus status) {
    switch (status) {
    case MatchStatus::Scheduled: return "scheduled";
    case MatchStatus::InProgress: return "in_progress";
    case MatchStatus::Finished: return "finished";
    }
    return "scheduled";
}

std::optional<MatchStatus> parse_match_status(std::string_view s) {
    if (s == "scheduled") return MatchStatus::Scheduled;
    if (s == "in_progress") return MatchStatus::InProgress;
    if (s == "finished") return MatchStatus::Finished;
    return std::nullopt;
}

// Accepts YYYY-MM-DDTHH:MM:SS with optional fractional seconds and an
// optional Z or +HH:MM / -HH:MM suffix. Fractions finer than a microsecond
// are dropped.
std::optional<Timestamp> parse_iso8601(const std::string& s) {
    std::string_view sv(s);
    if (sv.size() < 19) return std::nullopt;
    if (sv[4] != '-' || sv[7] != '-' || sv[10] != 'T' || sv[13] != ':' || sv[16] != ':') {
        return std::nullopt;
    }
    if (!is_digits(sv.substr(0, 4)) || !is_digits(sv.substr(5, 2)) || !is_digits(sv.substr(8, 2)) ||
        !is_digits(sv.substr(11, 2)) || !is_digits(sv.substr(14, 2)) || !is_digits(sv.substr(17, 2))) {
        return std::nullopt;
    }

    std::tm tm{};
    std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d",
                &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                &tm.tm_hour, &tm.tm_min, &tm.tm_sec);
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
        return std::nullopt;
    }
    int day = tm.tm_mday;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::chrono::microseconds fraction{0};
    auto rest = sv.substr(19);
    if (!rest.empty() && rest.front() == '.') {
        std::size_t i = 1;
        std::int64_t micros = 0;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) {
            if (i <= 6) micros = micros * 10 + (rest[i] - '0');
            ++i;
        }
        if (i == 1) return std::nullopt;
        for (std::size_t digits = i - 1; digits < 6; ++digits) micros *= 10;
        fraction = std::chrono::microseconds(micros);
        rest.remove_prefix(i);
    }

    std::optional<std::chrono::minutes> offset;
    if (rest == "Z" || rest == "z") {
        offset = std::chrono::minutes(0);
    } else if (!rest.empty()) {
        if (rest.size() != 6 || (rest[0] != '+' && rest[0] != '-') || rest[3] != ':' ||
            !is_digits(rest.substr(1, 2)) || !is_digits(rest.substr(4, 2))) {
            return std::nullopt;
        }
        int hours = (rest[1] - '0') * 10 + (rest[2] - '0');
        int minutes = (rest[4] - '0') * 10 + (rest[5] - '0');
        if (hours > 23 || minutes > 59) return std::nullopt;
        offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
        if (rest[0] == '-') offset = -*offset;
    }

    auto t = timegm(&tm);
    if (tm.tm_mday != day) return std::nullopt; // e.g. Feb 30 was normalized
    return Timestamp{std::chrono::system_clock::from_time_t(t) + fraction, offset};
}

std::string format_iso8601(const Timestamp& ts) {
    auto whole = std::chrono::floor<std::chrono::seconds>(ts.local);
    auto t = std::chrono::system_clock::to_time_t(whole);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[48];
    std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf, len);

    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.local - whole).count();
    if (micros > 0) {
        std::snprintf(buf, sizeof(buf), ".%06lld", static_cast<long long>(micros));
        out += buf;
    }

    if (!ts.utc_offset) return out;
    auto minutes = ts.utc_offset->count();
    if (minutes == 0) return out + "Z";

    char sign = minutes < 0 ? '-' : '+';
    if (minutes < 0) minutes = -minutes;
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign,
                  static_cast<int>(minutes / 60), static_cast<int>(minutes % 60));
    return out + buf;
}

std::expected<ListLeaguesResponse, SchemaError> normalize_list_leagues(const RawRecord& raw) {
    std::vector<FieldError> errors;
    ListLeaguesResponse response{read_list<LeagueSummary>(raw, "leagues", errors, read_league)};
    if (!errors.empty()) return std::unexpected(SchemaError{std::move(errors)});
    return response;
}

std::expected<GetLeagueMatchesResponse, SchemaError> normalize_league_matches(const RawRecord& raw) {
    std::vector<FieldError> errors;
    GetLeagueMatchesResponse response{read_list<MatchDetail>(raw, "matches", errors, read_match)};
    if (!errors.empty()) return std::unexpected(SchemaError{std::move(errors)});
    return response;
}

std::expected<GetTeamResponse, SchemaError> normalize_team(const RawRecord& raw) {
    std::vector<FieldError> errors;
    auto team = read_single<TeamDetail>(raw, "team", errors, read_team);
    if (!errors.empty() || !team) return std::unexpected(SchemaError{std::move(errors)});
    return GetTeamResponse{std::move(*team)};
}

std::expected<GetMatchResponse, SchemaError> normalize_match(const RawRecord& raw) {
    std::vector<FieldError> errors;
    auto match = read_single<MatchDetail>(raw, "match", errors, read_match);
    if (!errors.empty() || !match) return std::unexpected(SchemaError{std::move(errors)});
    return GetMatchResponse{std::move(*match)};
}

void to_json(nlohmann::ordered_json& j, const LeagueSummary& league) {
    j = {
        {"id", league.id},
        {"name", league.name},
        {"shortcut", league.shortcut},
        {"country", league.country},
        {"season", league.season},
    };
}

void to_json(nlohmann::ordered_json& j, const TeamDetail& team) {
    j = {
        {"id", team.id},
        {"name", team.name},
        {"short_name", team.short_name},
        {"icon_url", team.icon_url ? nlohmann::ordered_json(*team.icon_url) : nlohmann::ordered_json(nullptr)},
    };
}

void to_json(nlohmann::ordered_json& j, const MatchScore& score) {
    j = {
        {"home", score.home},
        {"away", score.away},
        {"status", std::string(to_string(score.status))},
    };
}

void to_json(nlohmann::ordered_json& j, const MatchDetail& match) {
    auto date_time = std::visit([](const auto& v) -> nlohmann::ordered_json {
        if constexpr (std::is_same_v<std::decay_t<decltype(v)>, Timestamp>) {
            return format_iso8601(v);
        } else {
            return v;
        }
    }, match.date_time);

    j = {
        {"id", match.id},
        {"league_name", match.league_name},
        {"date_time", std::move(date_time)},
        {"team_home", match.team_home},
        {"team_away", match.team_away},
        {"score", match.score},
        {"is_finished", match.is_finished},
    };
}

void to_json(nlohmann::ordered_json& j, const ListLeaguesResponse& response) {
    j = {{"leagues", response.leagues}};
}

void to_json(nlohmann::ordered_json& j, const GetLeagueMatchesResponse& response) {
    j = {{"matches", response.matches}};
}

void to_json(nlohmann::ordered_json& j, const GetTeamResponse& response) {
    j = {{"team", response.team}};
}

void to_json(nlohmann::ordered_json& j, const GetMatchResponse& response) {
    j = {{"match", response.match}};
}

nlohmann::ordered_json result_to_json(const OperationResult& result) {
    return std::visit([](const auto& r) { return nlohmann::ordered_json(r); }, result);
}

nlohmann::ordered_json list_leagues_response_shape() {
    return object_shape("ListLeaguesResponse",
                        {{"leagues", {{"type", "array"}, {"items", league_shape()}}}},
                        {"leagues"});
}

nlohmann::ordered_json league_matches_response_shape() {
    return object_shape("GetLeagueMatchesResponse",
                        {{"matches", {{"type", "array"}, {"items", match_shape()}}}},
                        {"matches"});
}

nlohmann::ordered_json team_response_shape() {
    return object_shape("GetTeamResponse", {{"team", team_shape()}}, {"team"});
}

nlohmann::ordered_json match_response_shape() {
    return object_shape("GetMatchResponse", {{"match", match_shape()}}, {"match"});
}

} // namespace ligaproxy
