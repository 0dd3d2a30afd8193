#pragma once

#include <chrono>
#include <csignal>
#include <functional>
#include <thread>

namespace polystore {

/**
 * @brief Runs a stop callback outside signal context
 *
 * A signal handler may only store to a sig_atomic_t. This thread polls
 * that flag and, once it is non-zero, calls `on_signal` with the signal
 * number exactly once. Destruction stops the thread without calling it.
 */
class SignalWatcher {
public:
    SignalWatcher(const volatile std::sig_atomic_t& flag, std::function<void(int)> on_signal,
                  std::chrono::milliseconds interval = std::chrono::milliseconds{100});

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    std::jthread thread_;
};

} // namespace polystore
