#include "realtime/websocket_server.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace polystore {

namespace {

constexpr size_t kMaxHandshakeBytes = 8192;
constexpr size_t kMaxFrameBytes = 1 << 20;
constexpr int kPollIntervalMs = 50;

} // namespace

WebSocketServer::WebSocketServer(std::shared_ptr<RealtimeGateway> gateway,
                                 const RealtimeConfig& config)
    : gateway_(std::move(gateway)), config_(config) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    if (running_.load()) return;

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error(std::format("Realtime: socket() failed: {}", strerror(errno)));
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_aton(config_.host.c_str(), &addr.sin_addr) == 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error(std::format("Realtime: invalid listen address '{}'", config_.host));
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error(std::format("Realtime: bind({}:{}) failed: {}",
            config_.host, config_.port, reason));
    }

    if (listen(server_fd_, 128) < 0) {
        const std::string reason = strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error(std::format("Realtime: listen() failed: {}", reason));
    }

    socklen_t len = sizeof(addr);
    getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
    bound_port_ = ntohs(addr.sin_port);

    running_.store(true);
    accept_thread_ = std::jthread([this](std::stop_token) { accept_loop(); });

    utils::log::info(std::format("Realtime WebSocket server listening on {}:{}",
        config_.host, bound_port_));
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) return;

    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }

    std::vector<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }

    utils::log::info("Realtime WebSocket server stopped");
}

void WebSocketServer::accept_loop() {
    while (running_.load()) {
        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        const int client_fd = accept(server_fd_,
            reinterpret_cast<struct sockaddr*>(&client_addr), &addr_len);

        if (client_fd < 0) {
            if (!running_.load()) break;
            continue;
        }

        if (active_connections_.load() >= config_.max_connections) {
            const auto reply = WebSocketCodec::build_rejection(503, "Service Unavailable");
            send_all(client_fd, {reply.begin(), reply.end()});
            close(client_fd);
            continue;
        }

        std::string remote_addr = std::format("{}:{}",
            inet_ntoa(client_addr.sin_addr), ntohs(client_addr.sin_port));

        active_connections_.fetch_add(1);
        connections_total_.fetch_add(1);
        std::lock_guard lock(workers_mutex_);
        reap_finished_workers();
        auto done = std::make_shared<std::atomic<bool>>(false);
        workers_.push_back({std::jthread([this, client_fd, done, addr = std::move(remote_addr)]() {
            handle_connection(client_fd, addr);
            close(client_fd);
            active_connections_.fetch_sub(1);
            done->store(true);
        }), done});
    }
}

void WebSocketServer::reap_finished_workers() {
    std::erase_if(workers_, [](Worker& w) {
        if (!w.done->load()) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    });
}

bool WebSocketServer::send_all(int fd, const std::vector<uint8_t>& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
        const auto n = send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketServer::send_text(int fd, const JsonValue& message) {
    if (!send_all(fd, WebSocketCodec::encode_frame(WsOpcode::TEXT, message.dump()))) return false;
    messages_sent_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool WebSocketServer::handshake(int client_fd, std::string& leftover) {
    std::string buffer;
    char chunk[1024];
    size_t head_end = std::string::npos;

    while (head_end == std::string::npos) {
        if (buffer.size() > kMaxHandshakeBytes) return false;
        pollfd pfd{client_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (!running_.load()) return false;
        if (ready <= 0) continue;

        const auto n = recv(client_fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        buffer.append(chunk, static_cast<size_t>(n));
        head_end = buffer.find("\r\n\r\n");
    }

    const auto request = WebSocketCodec::parse_request_head(buffer);
    if (!request || request->method != "GET" ||
        !WebSocketCodec::is_upgrade_request(request->header("upgrade"), request->header("connection")) ||
        request->header("sec-websocket-key").empty()) {
        const auto reply = WebSocketCodec::build_rejection(400, "Bad Request");
        send_all(client_fd, {reply.begin(), reply.end()});
        return false;
    }

    const auto response = WebSocketCodec::build_upgrade_response(
        WebSocketCodec::compute_accept_key(request->header("sec-websocket-key")));
    if (!send_all(client_fd, {response.begin(), response.end()})) return false;

    leftover = buffer.substr(head_end + 4);
    return true;
}

void WebSocketServer::handle_connection(int client_fd, std::string remote_addr) {
    std::string leftover;
    if (!handshake(client_fd, leftover)) {
        utils::log::debug(std::format("Realtime handshake rejected for {}", remote_addr));
        return;
    }

    const auto session = gateway_->open_session();
    utils::log::info(std::format("Realtime client {} connected (session {})", remote_addr, session));

    std::vector<uint8_t> inbound(leftover.begin(), leftover.end());
    uint8_t chunk[4096];
    bool open = true;

    while (open && running_.load()) {
        // Drain published events first so slow readers do not starve them
        while (auto message = gateway_->poll(session)) {
            if (!send_text(client_fd, *message)) { open = false; break; }
        }
        if (!open) break;

        pollfd pfd{client_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0 && errno != EINTR) break;
        if (ready <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP)) break;

        const auto n = recv(client_fd, chunk, sizeof(chunk), 0);
        if (n <= 0) break;
        inbound.insert(inbound.end(), chunk, chunk + n);

        size_t consumed = 0;
        while (auto frame = WebSocketCodec::decode_frame(inbound.data(), inbound.size(), consumed)) {
            inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(consumed));

            switch (frame->opcode) {
                case WsOpcode::TEXT: {
                    messages_received_.fetch_add(1, std::memory_order_relaxed);
                    const auto reply = gateway_->handle_message(session, frame->text());
                    if (!send_text(client_fd, reply)) open = false;
                    break;
                }
                case WsOpcode::PING:
                    if (!send_all(client_fd, WebSocketCodec::encode_frame(WsOpcode::PONG, frame->text()))) {
                        open = false;
                    }
                    break;
                case WsOpcode::PONG:
                    break;
                case WsOpcode::CLOSE:
                    send_all(client_fd, WebSocketCodec::encode_close(WebSocketCodec::kCloseNormal));
                    open = false;
                    break;
                default:
                    send_all(client_fd, WebSocketCodec::encode_close(
                        WebSocketCodec::kCloseProtocolError, "text frames only"));
                    open = false;
                    break;
            }
            if (!open) break;
        }

        if (open && inbound.size() > kMaxFrameBytes) {
            send_all(client_fd, WebSocketCodec::encode_close(WebSocketCodec::kCloseTooLarge));
            open = false;
        }
    }

    gateway_->close_session(session);
    utils::log::info(std::format("Realtime client {} disconnected", remote_addr));
}

WebSocketServer::Stats WebSocketServer::get_stats() const {
    Stats stats{
        connections_total_.load(std::memory_order_relaxed),
        active_connections_.load(std::memory_order_relaxed),
        messages_sent_.load(std::memory_order_relaxed),
        messages_received_.load(std::memory_order_relaxed)
    };
    std::lock_guard lock(workers_mutex_);
    stats.worker_threads = workers_.size();
    return stats;
}

} // namespace polystore
