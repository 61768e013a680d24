#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

namespace ligaproxy {

// Signal handlers may only set a flag. This thread polls the flag and runs
// `on_shutdown` once, from ordinary thread context, when it becomes true.
// The flag must be lock-free to be written from a signal handler.
class ShutdownWatcher {
public:
    ShutdownWatcher(const std::atomic<bool>& flag, std::function<void()> on_shutdown,
                    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

private:
    void run(std::stop_token stop);

    const std::atomic<bool>& flag_;
    std::function<void()> on_shutdown_;
    std::chrono::milliseconds poll_interval_;
    std::jthread thread_;
};

} // namespace ligaproxy
