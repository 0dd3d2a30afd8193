#include "engine/signal_watcher.hpp"

namespace polystore {

SignalWatcher::SignalWatcher(const volatile std::sig_atomic_t& flag,
                             std::function<void(int)> on_signal,
                             std::chrono::milliseconds interval)
    : thread_([&flag, on_signal = std::move(on_signal), interval](std::stop_token token) {
          while (!token.stop_requested()) {
              if (const int signal = flag) {
                  on_signal(signal);
                  return;
              }
              std::this_thread::sleep_for(interval);
          }
      }) {}

} // namespace polystore
