#pragma once

#include "ligaproxy/clock.hpp"
#include "ligaproxy/http_transport.hpp"
#include "ligaproxy/provider.hpp"
#include "ligaproxy/rate_limiter.hpp"
#include "ligaproxy/retrying_caller.hpp"
#include <memory>

namespace ligaproxy {

// Adapter for api.openligadb.de. Owns its rate limiter and retry state, so
// separate instances never share limits.
class OpenLigaProvider : public Provider {
public:
    OpenLigaProvider(const ProviderSettings& settings,
                     std::unique_ptr<HttpTransport> transport,
                     std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    std::string_view name() const override { return "OpenLigaProvider"; }

    std::expected<RawRecord, UpstreamError> list_leagues(
        const RequestContext& ctx) override;

    std::expected<RawRecord, UpstreamError> get_league_matches(
        const RequestContext& ctx, const std::string& league_shortcut,
        const std::string& league_season) override;

    std::expected<RawRecord, UpstreamError> get_team(
        const RequestContext& ctx, std::int64_t team_id) override;

    std::expected<RawRecord, UpstreamError> get_match(
        const RequestContext& ctx, std::int64_t match_id) override;

    RateLimiter& rate_limiter() { return limiter_; }

private:
    std::expected<nlohmann::json, UpstreamError> fetch(const RequestContext& ctx,
                                                       const std::string& path);

    std::shared_ptr<Clock> clock_;
    std::unique_ptr<HttpTransport> transport_;
    RateLimiter limiter_;
    RetryingCaller caller_;
};

// Upstream JSON -> RawRecord. Missing or wrongly-typed upstream fields
// become defaults instead of failures.
RawRecord map_leagues(const nlohmann::json& data);
RawRecord map_league_matches(const nlohmann::json& data, const std::string& league_shortcut);
RawRecord map_team(const nlohmann::json& data);

// Fails with "Match not found" when no match object can be resolved.
std::expected<RawRecord, UpstreamError> map_match(const nlohmann::json& data);

} // namespace ligaproxy
