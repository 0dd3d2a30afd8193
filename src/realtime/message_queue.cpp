#include "realtime/message_queue.hpp"

namespace polystore {

bool MessageQueue::push(JsonValue payload) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        if (max_size_ > 0 && items_.size() >= max_size_) {
            items_.pop_front();
            ++dropped_;
        }
        items_.push_back(std::move(payload));
    }
    cv_.notify_one();
    return true;
}

std::optional<JsonValue> MessageQueue::take_front() {
    if (items_.empty()) return std::nullopt;
    JsonValue front = std::move(items_.front());
    items_.pop_front();
    return front;
}

std::optional<JsonValue> MessageQueue::pop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    return take_front();
}

std::optional<JsonValue> MessageQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    return take_front();
}

std::optional<JsonValue> MessageQueue::try_pop() {
    std::lock_guard lock(mutex_);
    return take_front();
}

void MessageQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool MessageQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t MessageQueue::size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
}

uint64_t MessageQueue::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

} // namespace polystore
