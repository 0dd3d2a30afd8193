#include "realtime/realtime_gateway.hpp"
#include "core/utils.hpp"

#include <format>

namespace polystore {

RealtimeGateway::SessionId RealtimeGateway::open_session() {
    const SessionId id = ++next_id_;
    std::unique_lock lock(mutex_);
    sessions_[id] = Session{{}, std::make_shared<MessageQueue>(max_queue_)};
    utils::log::debug(std::format("Realtime session {} opened", id));
    return id;
}

void RealtimeGateway::close_session(SessionId id) {
    std::shared_ptr<MessageQueue> queue;
    {
        std::unique_lock lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        queue = std::move(it->second.outbox);
        sessions_.erase(it);
    }
    queue->close();
    utils::log::debug(std::format("Realtime session {} closed", id));
}

JsonValue RealtimeGateway::error_reply(ErrorCategory category, const std::string& message) {
    JsonValue reply = JsonValue::object();
    reply.set("event", "error");
    reply.set("category", error_category_to_string(category));
    reply.set("message", message);
    return reply;
}

JsonValue RealtimeGateway::handle_message(SessionId id, const std::string& text) {
    JsonValue message;
    try {
        message = JsonValue::parse(text);
    } catch (const JsonValue::parse_error& e) {
        return error_reply(ErrorCategory::VALIDATION_ERROR,
            std::format("malformed control message: {}", e.what()));
    }

    const auto type = message.value<std::string>("type", "");
    const auto channel = message.value<std::string>("channel", "");
    if (type != "subscribe" && type != "unsubscribe") {
        return error_reply(ErrorCategory::UNSUPPORTED_OPERATION,
            std::format("unknown message type '{}'", type));
    }
    if (channel.empty()) {
        return error_reply(ErrorCategory::VALIDATION_ERROR, "channel must be a non-empty string");
    }

    {
        std::unique_lock lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return error_reply(ErrorCategory::NOT_FOUND, std::format("unknown session {}", id));
        }
        if (type == "subscribe") it->second.channels.insert(channel);
        else it->second.channels.erase(channel);
    }

    JsonValue ack = JsonValue::object();
    ack.set("event", type == "subscribe" ? "subscribed" : "unsubscribed");
    ack.set("channel", channel);
    return ack;
}

std::shared_ptr<MessageQueue> RealtimeGateway::outbox(SessionId id) const {
    std::shared_lock lock(mutex_);
    const auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.outbox;
}

std::optional<JsonValue> RealtimeGateway::poll(SessionId id) {
    const auto queue = outbox(id);
    if (!queue) return std::nullopt;
    return queue->try_pop();
}

std::optional<JsonValue> RealtimeGateway::poll_for(SessionId id, std::chrono::milliseconds timeout) {
    const auto queue = outbox(id);
    if (!queue) return std::nullopt;
    return queue->pop_for(timeout);
}

std::set<std::string> RealtimeGateway::channels(SessionId id) const {
    std::shared_lock lock(mutex_);
    const auto it = sessions_.find(id);
    return it == sessions_.end() ? std::set<std::string>{} : it->second.channels;
}

size_t RealtimeGateway::session_count() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

JsonValue RealtimeGateway::data_event(const std::string& channel, const JsonValue& payload) {
    JsonValue event = JsonValue::object();
    event.set("event", "data");
    event.set("channel", channel);
    event.set("payload", payload);
    return event;
}

void RealtimeGateway::deliver(const std::string& channel, const JsonValue& payload) {
    std::shared_lock lock(mutex_);
    if (sessions_.empty()) return;

    const JsonValue event = data_event(channel, payload);
    for (const auto& [id, session] : sessions_) {
        if (session.channels.contains(channel)) {
            session.outbox->push(event);
        }
    }
}

} // namespace polystore
