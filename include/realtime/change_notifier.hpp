#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "realtime/message_queue.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace polystore {

enum class LifecycleEvent {
    CREATED,
    UPDATED,
    DELETED,
};

[[nodiscard]] inline std::string_view lifecycle_event_to_string(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::CREATED: return "created";
        case LifecycleEvent::UPDATED: return "updated";
        case LifecycleEvent::DELETED: return "deleted";
        default: return "created";
    }
}

/// "<entity>:<created|updated|deleted>"
[[nodiscard]] std::string lifecycle_channel(std::string_view entity, LifecycleEvent event);

/// True for a well-formed "<entity>:<created|updated|deleted>" name
[[nodiscard]] bool is_lifecycle_channel(std::string_view channel);

class ChannelHub;

/**
 * @brief One consumer's view of a channel, from subscription onward
 *
 * Destroying the handle unsubscribes.
 */
class Subscription {
public:
    Subscription(std::string channel, uint64_t id,
                 std::shared_ptr<MessageQueue> queue, std::weak_ptr<ChannelHub> hub);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    [[nodiscard]] const std::string& channel() const { return channel_; }
    [[nodiscard]] uint64_t id() const { return id_; }

    /// Blocks until the next payload; nullopt after unsubscribe or shutdown
    [[nodiscard]] std::optional<JsonValue> next() { return queue_->pop(); }

    [[nodiscard]] std::optional<JsonValue> next_for(std::chrono::milliseconds timeout) {
        return queue_->pop_for(timeout);
    }

    [[nodiscard]] std::optional<JsonValue> try_next() { return queue_->try_pop(); }

    void unsubscribe();

    [[nodiscard]] bool active() const { return !queue_->closed(); }
    [[nodiscard]] size_t pending() const { return queue_->size(); }
    [[nodiscard]] uint64_t dropped() const { return queue_->dropped(); }

private:
    std::string channel_;
    uint64_t id_;
    std::shared_ptr<MessageQueue> queue_;
    std::weak_ptr<ChannelHub> hub_;
};

/**
 * @brief Receives every publish; the realtime gateway is one
 *
 * deliver() runs on the publishing thread and must not block.
 */
class IChannelSink {
public:
    virtual ~IChannelSink() = default;
    virtual void deliver(const std::string& channel, const JsonValue& payload) = 0;
};

/**
 * @brief Publish/subscribe fanout keyed by exact channel name
 *
 * Channels exist implicitly once subscribed to. Delivery is not
 * retroactive and publish never waits on a consumer.
 */
class ChangeNotifier {
public:
    explicit ChangeNotifier(size_t max_queue = 0);
    ~ChangeNotifier();

    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    /// VALIDATION_ERROR on an empty channel name
    [[nodiscard]] Status publish(const std::string& channel, const JsonValue& payload);

    [[nodiscard]] Status publish(std::string_view entity, LifecycleEvent event,
                                 const JsonValue& payload) {
        return publish(lifecycle_channel(entity, event), payload);
    }

    [[nodiscard]] Result<std::shared_ptr<Subscription>> subscribe(const std::string& channel);

    void add_sink(std::shared_ptr<IChannelSink> sink);

    [[nodiscard]] size_t subscriber_count(const std::string& channel) const;

    [[nodiscard]] uint64_t published() const {
        return published_.load(std::memory_order_relaxed);
    }

    /// Ends every live subscription; later publishes reach only sinks
    void shutdown();

private:
    std::shared_ptr<ChannelHub> hub_;

    mutable std::shared_mutex sinks_mutex_;
    std::vector<std::shared_ptr<IChannelSink>> sinks_;

    std::atomic<uint64_t> published_{0};
};

} // namespace polystore
