#include "ligaproxy/retrying_caller.hpp"
#include "ligaproxy/audit.hpp"
#include <algorithm>
#include <cmath>

namespace ligaproxy {

namespace {

UpstreamError cancelled() {
    return UpstreamError{0, "Request cancelled"};
}

} // namespace

bool is_retryable_status(int status) {
    switch (status) {
    case 429:
    case 500:
    case 502:
    case 503:
    case 504:
        return true;
    default:
        return false;
    }
}

Seconds base_backoff(const RetryPolicy& policy, int attempt) {
    double delay = policy.base_delay.count() * std::pow(policy.backoff_multiplier, attempt);
    return Seconds(std::min(delay, policy.max_delay.count()));
}

Seconds jittered_backoff(const RetryPolicy& policy, int attempt, double jitter) {
    auto delay = base_backoff(policy, attempt);
    return Seconds(std::max(0.0, delay.count() + jitter * delay.count()));
}

RetryingCaller::RetryingCaller(HttpTransport& transport, Clock& clock,
                               RetryPolicy policy, std::uint64_t seed)
    : transport_(transport), clock_(clock), policy_(policy), rng_(seed) {}

std::expected<nlohmann::json, UpstreamError> RetryingCaller::call(
    const RequestContext& ctx, const std::string& path) {

    for (int attempt = 0; attempt <= policy_.max_retries; ++attempt) {
        if (ctx.stop.stop_requested()) return std::unexpected(cancelled());

        bool final_attempt = attempt == policy_.max_retries;

        audit::info(ctx, "upstream_request", {
            audit::int_field("attempt", attempt + 1),
            audit::string_field("method", "GET"),
            audit::string_field("path", path),
        });

        auto start = clock_.now();
        auto res = transport_.get(path);
        auto latency_ms = std::chrono::duration<double, std::milli>(clock_.now() - start).count();

        if (!res) {
            audit::warn(ctx, "request_exception", {
                audit::int_field("attempt", attempt + 1),
                audit::string_field("error", res.error().message),
            });
            if (final_attempt) {
                return std::unexpected(UpstreamError{
                    0, "Upstream API request failed: " + res.error().message});
            }
            if (!backoff(ctx, attempt, 0)) return std::unexpected(cancelled());
            continue;
        }

        audit::info(ctx, "upstream_response", {
            audit::int_field("status_code", res->status),
            audit::double_field("latency_ms", latency_ms),
            audit::string_field("path", path),
        });

        if (res->status == 200) {
            try {
                return nlohmann::json::parse(res->body);
            } catch (const nlohmann::json::exception&) {
                audit::warn(ctx, "upstream_error", {
                    audit::int_field("status_code", res->status),
                    audit::string_field("reason", "invalid JSON body"),
                });
                return std::unexpected(UpstreamError{res->status, "Upstream returned invalid JSON"});
            }
        }

        if (is_retryable_status(res->status) && !final_attempt) {
            if (!backoff(ctx, attempt, res->status)) return std::unexpected(cancelled());
            continue;
        }

        audit::warn(ctx, "upstream_error", {
            audit::int_field("status_code", res->status),
            audit::bool_field("final_attempt", true),
        });
        return std::unexpected(UpstreamError{
            res->status, "Upstream API failed with status " + std::to_string(res->status)});
    }

    return std::unexpected(UpstreamError{0, "Max retries exceeded"});
}

bool RetryingCaller::backoff(const RequestContext& ctx, int attempt, int status) {
    auto sleep_time = jittered_backoff(policy_, attempt, draw_jitter());

    audit::info(ctx, "retry_backoff", {
        audit::int_field("attempt", attempt + 1),
        audit::int_field("status_code", status),
        audit::double_field("sleep_time", sleep_time.count()),
    });

    return clock_.sleep_for(std::chrono::duration_cast<Clock::duration>(sleep_time), ctx.stop);
}

double RetryingCaller::draw_jitter() {
    if (policy_.jitter_range <= 0.0) return 0.0;
    std::uniform_real_distribution<double> dist(-policy_.jitter_range, policy_.jitter_range);
    std::lock_guard lock(rng_mutex_);
    return dist(rng_);
}

} // namespace ligaproxy
