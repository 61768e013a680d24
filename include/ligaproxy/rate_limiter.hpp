#pragma once

#include "ligaproxy/clock.hpp"
#include "ligaproxy/types.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace ligaproxy {

// Sliding-window limiter: at most `max_requests` acquisitions in any
// trailing `window`. Shared by every execution that goes through one provider.
class RateLimiter {
public:
    // `max_requests` below 1 is treated as 1.
    RateLimiter(int max_requests, std::chrono::seconds window, Clock& clock);

    // Returns false only if the context was cancelled while waiting.
    bool acquire(const RequestContext& ctx);

    std::size_t recent_count();

    static constexpr auto margin = std::chrono::milliseconds(100);

private:
    void prune(Clock::time_point now);

    int max_requests_;
    std::chrono::seconds window_;
    Clock& clock_;
    std::deque<Clock::time_point> timestamps_;
    std::mutex mutex_;
};

} // namespace ligaproxy
