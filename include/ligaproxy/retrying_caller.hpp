#pragma once

#include "ligaproxy/clock.hpp"
#include "ligaproxy/http_transport.hpp"
#include "ligaproxy/types.hpp"
#include <cstdint>
#include <expected>
#include <mutex>
#include <random>
#include <string>
#include <nlohmann/json.hpp>

namespace ligaproxy {

bool is_retryable_status(int status);

// min(base_delay * multiplier^attempt, max_delay), before jitter.
Seconds base_backoff(const RetryPolicy& policy, int attempt);

// `jitter` is a fraction in [-jitter_range, jitter_range]; result is floored at 0.
Seconds jittered_backoff(const RetryPolicy& policy, int attempt, double jitter);

class RetryingCaller {
public:
    RetryingCaller(HttpTransport& transport, Clock& clock, RetryPolicy policy,
                   std::uint64_t seed = std::random_device{}());

    // At most max_retries + 1 attempts. Returns the parsed body of the
    // first 200 response.
    std::expected<nlohmann::json, UpstreamError> call(const RequestContext& ctx,
                                                      const std::string& path);

    const RetryPolicy& policy() const { return policy_; }

private:
    bool backoff(const RequestContext& ctx, int attempt, int status);
    double draw_jitter();

    HttpTransport& transport_;
    Clock& clock_;
    RetryPolicy policy_;
    std::mt19937_64 rng_;
    std::mutex rng_mutex_;
};

} // namespace ligaproxy
