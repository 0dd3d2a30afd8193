#include "realtime/change_notifier.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>
#include <unordered_map>

namespace polystore {

std::string lifecycle_channel(std::string_view entity, LifecycleEvent event) {
    return std::format("{}:{}", entity, lifecycle_event_to_string(event));
}

bool is_lifecycle_channel(std::string_view channel) {
    const auto colon = channel.rfind(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    const auto suffix = channel.substr(colon + 1);
    return suffix == "created" || suffix == "updated" || suffix == "deleted";
}

// ============================================================================
// ChannelHub
// ============================================================================

/// Subscriber table shared by the notifier and its subscription handles
class ChannelHub {
public:
    explicit ChannelHub(size_t max_queue) : max_queue_(max_queue) {}

    std::shared_ptr<Subscription> add(const std::string& channel,
                                      const std::shared_ptr<ChannelHub>& self) {
        auto queue = std::make_shared<MessageQueue>(max_queue_);
        std::unique_lock lock(mutex_);
        const uint64_t id = ++next_id_;
        if (shut_down_) queue->close();
        else channels_[channel][id] = queue;
        return std::make_shared<Subscription>(channel, id, std::move(queue), self);
    }

    void remove(const std::string& channel, uint64_t id) {
        std::shared_ptr<MessageQueue> queue;
        {
            std::unique_lock lock(mutex_);
            const auto it = channels_.find(channel);
            if (it == channels_.end()) return;
            const auto sub = it->second.find(id);
            if (sub == it->second.end()) return;
            queue = std::move(sub->second);
            it->second.erase(sub);
            if (it->second.empty()) channels_.erase(it);
        }
        queue->close();
    }

    size_t fanout(const std::string& channel, const JsonValue& payload) {
        std::shared_lock lock(mutex_);
        const auto it = channels_.find(channel);
        if (it == channels_.end()) return 0;
        for (const auto& [id, queue] : it->second) {
            queue->push(payload);
        }
        return it->second.size();
    }

    size_t count(const std::string& channel) const {
        std::shared_lock lock(mutex_);
        const auto it = channels_.find(channel);
        return it == channels_.end() ? 0 : it->second.size();
    }

    void close_all() {
        std::unique_lock lock(mutex_);
        shut_down_ = true;
        for (auto& [name, subs] : channels_) {
            for (auto& [id, queue] : subs) queue->close();
        }
        channels_.clear();
    }

private:
    const size_t max_queue_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unordered_map<uint64_t, std::shared_ptr<MessageQueue>>> channels_;
    uint64_t next_id_ = 0;
    bool shut_down_ = false;
};

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(std::string channel, uint64_t id,
                           std::shared_ptr<MessageQueue> queue, std::weak_ptr<ChannelHub> hub)
    : channel_(std::move(channel)), id_(id), queue_(std::move(queue)), hub_(std::move(hub)) {}

Subscription::~Subscription() {
    unsubscribe();
}

void Subscription::unsubscribe() {
    if (auto hub = hub_.lock()) {
        hub->remove(channel_, id_);
    }
    hub_.reset();
    queue_->close();
}

// ============================================================================
// ChangeNotifier
// ============================================================================

ChangeNotifier::ChangeNotifier(size_t max_queue)
    : hub_(std::make_shared<ChannelHub>(max_queue)) {}

ChangeNotifier::~ChangeNotifier() {
    shutdown();
}

Status ChangeNotifier::publish(const std::string& channel, const JsonValue& payload) {
    if (channel.empty()) {
        return Status::error(ErrorCategory::VALIDATION_ERROR, "channel name must not be empty");
    }

    const size_t local = hub_->fanout(channel, payload);

    std::vector<std::shared_ptr<IChannelSink>> sinks;
    {
        std::shared_lock lock(sinks_mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->deliver(channel, payload);
    }

    published_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug(std::format("Published to '{}' ({} subscribers)", channel, local));
    return Status::ok();
}

Result<std::shared_ptr<Subscription>> ChangeNotifier::subscribe(const std::string& channel) {
    using R = Result<std::shared_ptr<Subscription>>;
    if (channel.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "channel name must not be empty");
    }
    return R::ok(hub_->add(channel, hub_));
}

void ChangeNotifier::add_sink(std::shared_ptr<IChannelSink> sink) {
    std::unique_lock lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

size_t ChangeNotifier::subscriber_count(const std::string& channel) const {
    return hub_->count(channel);
}

void ChangeNotifier::shutdown() {
    hub_->close_all();
}

} // namespace polystore
