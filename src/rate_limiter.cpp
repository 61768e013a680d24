#include "ligaproxy/rate_limiter.hpp"
#include "ligaproxy/audit.hpp"
#include <algorithm>

namespace ligaproxy {

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window, Clock& clock)
    : max_requests_(std::max(1, max_requests)), window_(window), clock_(clock) {}

bool RateLimiter::acquire(const RequestContext& ctx) {
    std::unique_lock lock(mutex_);

    // Other callers may take freed slots while we sleep, so every wakeup
    // re-runs the whole check.
    while (true) {
        auto now = clock_.now();
        prune(now);

        if (static_cast<int>(timestamps_.size()) < max_requests_) {
            timestamps_.push_back(now);
            return true;
        }

        auto sleep_duration = window_ - (now - timestamps_.front()) + margin;
        audit::info(ctx, "rate_limit", {
            audit::string_field("action", "waiting"),
            audit::double_field("sleep_time",
                std::chrono::duration<double>(sleep_duration).count()),
        });

        lock.unlock();
        bool completed = clock_.sleep_for(
            std::chrono::duration_cast<Clock::duration>(sleep_duration), ctx.stop);
        lock.lock();

        if (!completed) return false;
    }
}

std::size_t RateLimiter::recent_count() {
    std::lock_guard lock(mutex_);
    prune(clock_.now());
    return timestamps_.size();
}

void RateLimiter::prune(Clock::time_point now) {
    while (!timestamps_.empty() && (now - timestamps_.front()) >= window_) {
        timestamps_.pop_front();
    }
}

} // namespace ligaproxy
