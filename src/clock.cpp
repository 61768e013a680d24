#include "ligaproxy/clock.hpp"
#include <condition_variable>
#include <mutex>

namespace ligaproxy {

SystemClock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

bool SystemClock::sleep_for(duration d, const std::stop_token& stop) {
    if (d <= duration::zero()) return !stop.stop_requested();

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, d, [] { return false; });
    return !stop.stop_requested();
}

} // namespace ligaproxy
