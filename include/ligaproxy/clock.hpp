#pragma once

#include <chrono>
#include <stop_token>

namespace ligaproxy {

// Time source for everything that waits: the rate limiter and retry backoff.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    // Blocks the calling thread only. Returns false when `stop` was
    // requested before the full duration elapsed.
    virtual bool sleep_for(duration d, const std::stop_token& stop) = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override;
    bool sleep_for(duration d, const std::stop_token& stop) override;
};

} // namespace ligaproxy
