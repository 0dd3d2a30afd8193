#pragma once

#include "config/config_types.hpp"
#include "realtime/realtime_gateway.hpp"
#include "realtime/websocket_codec.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace polystore {

/**
 * @brief TCP listener speaking RFC 6455 in front of a RealtimeGateway
 *
 * One worker thread per client connection. Each worker multiplexes
 * inbound frames and the session outbox with poll().
 */
class WebSocketServer {
public:
    struct Stats {
        uint64_t connections_total = 0;
        uint64_t active_connections = 0;
        uint64_t messages_sent = 0;
        uint64_t messages_received = 0;
        uint64_t worker_threads = 0;         // finished workers are reaped on the next accept
    };

    WebSocketServer(std::shared_ptr<RealtimeGateway> gateway, const RealtimeConfig& config);

    ~WebSocketServer();

    // Non-blocking: spawns the accept thread. Throws on socket setup failure.
    void start();

    void stop();

    [[nodiscard]] bool running() const { return running_.load(); }

    /// Bound port, useful when configured with port 0
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] Stats get_stats() const;

private:
    void accept_loop();
    void handle_connection(int client_fd, std::string remote_addr);

    /// Reads the HTTP upgrade request and answers it; false = drop the client
    bool handshake(int client_fd, std::string& leftover);

    bool send_all(int fd, const std::vector<uint8_t>& bytes);
    bool send_text(int fd, const JsonValue& message);

    std::shared_ptr<RealtimeGateway> gateway_;
    RealtimeConfig config_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> connections_total_{0};
    std::atomic<uint64_t> active_connections_{0};
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_received_{0};

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// Joins and drops workers whose connection has ended; caller holds workers_mutex_
    void reap_finished_workers();

    std::jthread accept_thread_;
    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace polystore
