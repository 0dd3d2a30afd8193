#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "realtime/change_notifier.hpp"
#include "realtime/message_queue.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace polystore {

/**
 * @brief Channel membership for realtime client sessions
 *
 * Transport-agnostic: a session is an id plus an outbox. Control
 * messages arrive as text:
 *   {"type":"subscribe","channel":"users:created"}
 *   {"type":"unsubscribe","channel":"users:created"}
 * and every publish to a joined channel lands in the outbox as
 *   {"event":"data","channel":"users:created","payload":{...}}
 */
class RealtimeGateway : public IChannelSink {
public:
    using SessionId = uint64_t;

    explicit RealtimeGateway(size_t max_queue = 0) : max_queue_(max_queue) {}

    [[nodiscard]] SessionId open_session();

    void close_session(SessionId id);

    /**
     * @brief Apply one control message from a client
     * @return Acknowledgement or error message to send back
     */
    [[nodiscard]] JsonValue handle_message(SessionId id, const std::string& text);

    /// Outgoing message for the session, or nullopt when none is queued
    [[nodiscard]] std::optional<JsonValue> poll(SessionId id);

    [[nodiscard]] std::optional<JsonValue> poll_for(SessionId id, std::chrono::milliseconds timeout);

    [[nodiscard]] std::set<std::string> channels(SessionId id) const;

    [[nodiscard]] size_t session_count() const;

    void deliver(const std::string& channel, const JsonValue& payload) override;

    [[nodiscard]] static JsonValue data_event(const std::string& channel, const JsonValue& payload);

private:
    struct Session {
        std::set<std::string> channels;
        std::shared_ptr<MessageQueue> outbox;
    };

    std::shared_ptr<MessageQueue> outbox(SessionId id) const;

    static JsonValue error_reply(ErrorCategory category, const std::string& message);

    const size_t max_queue_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<SessionId, Session> sessions_;
    std::atomic<SessionId> next_id_{0};
};

} // namespace polystore
