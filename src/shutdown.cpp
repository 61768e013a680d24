#include "ligaproxy/shutdown.hpp"
#include "ligaproxy/clock.hpp"

namespace ligaproxy {

static_assert(std::atomic<bool>::is_always_lock_free);

ShutdownWatcher::ShutdownWatcher(const std::atomic<bool>& flag,
                                 std::function<void()> on_shutdown,
                                 std::chrono::milliseconds poll_interval)
    : flag_(flag),
      on_shutdown_(std::move(on_shutdown)),
      poll_interval_(poll_interval),
      thread_([this](std::stop_token stop) { run(stop); }) {}

void ShutdownWatcher::run(std::stop_token stop) {
    SystemClock clock;
    while (!stop.stop_requested()) {
        if (flag_.load()) {
            on_shutdown_();
            return;
        }
        clock.sleep_for(poll_interval_, stop);
    }
}

} // namespace ligaproxy
