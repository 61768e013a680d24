#pragma once

#include "ligaproxy/types.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace ligaproxy {

// Loosely-typed intermediate record, keyed by the adapter's field names.
// Never handed to callers; normalization turns it into typed records.
using RawRecord = nlohmann::json;

// The capability set every upstream adapter offers.
class Provider {
public:
    virtual ~Provider() = default;

    virtual std::string_view name() const = 0;

    virtual std::expected<RawRecord, UpstreamError> list_leagues(
        const RequestContext& ctx) = 0;

    virtual std::expected<RawRecord, UpstreamError> get_league_matches(
        const RequestContext& ctx, const std::string& league_shortcut,
        const std::string& league_season) = 0;

    virtual std::expected<RawRecord, UpstreamError> get_team(
        const RequestContext& ctx, std::int64_t team_id) = 0;

    virtual std::expected<RawRecord, UpstreamError> get_match(
        const RequestContext& ctx, std::int64_t match_id) = 0;
};

} // namespace ligaproxy
