#pragma once

#include "core/json.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace polystore {

/**
 * @brief Per-consumer FIFO of JSON payloads
 *
 * Producers never block: when max_size is reached the oldest payload is
 * dropped and counted. Consumers wait on a condition variable.
 * max_size 0 means unbounded.
 */
class MessageQueue {
public:
    explicit MessageQueue(size_t max_size = 0) : max_size_(max_size) {}

    /// False once the queue is closed
    bool push(JsonValue payload);

    /// Blocks until a payload arrives; nullopt once closed and drained
    [[nodiscard]] std::optional<JsonValue> pop();

    [[nodiscard]] std::optional<JsonValue> pop_for(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<JsonValue> try_pop();

    /// Wakes every waiter; queued payloads stay readable
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t dropped() const;

private:
    std::optional<JsonValue> take_front();   // caller holds mutex_

    const size_t max_size_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<JsonValue> items_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace polystore
