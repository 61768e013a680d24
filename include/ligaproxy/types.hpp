#pragma once

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>

namespace ligaproxy {

using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::duration<double>;

// Per-execution context, passed explicitly down the pipeline.
struct RequestContext {
    std::string request_id;
    std::stop_token stop;
};

struct UpstreamError {
    int status_code = 0;
    std::string message;
};

// One failing field, as reported by payload validation and normalization.
struct FieldError {
    std::string field;
    std::string message;
    std::string kind;
};

struct RetryPolicy {
    int max_retries = 3;
    Seconds base_delay{1.0};
    Seconds max_delay{30.0};
    double backoff_multiplier = 2.0;
    double jitter_range = 0.1; // fraction of the computed delay
};

struct ProviderSettings {
    int rate_limit_requests = 10;
    std::chrono::seconds rate_limit_window{60};
    RetryPolicy retry;
};

} // namespace ligaproxy
