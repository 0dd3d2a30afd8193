#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polystore {

// WebSocket frame opcodes per RFC 6455
enum class WsOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT         = 0x1,
    BINARY       = 0x2,
    CLOSE        = 0x8,
    PING         = 0x9,
    PONG         = 0xA
};

// Decoded WebSocket frame
struct WsFrame {
    bool fin = true;
    bool masked = false;
    WsOpcode opcode = WsOpcode::TEXT;
    std::vector<uint8_t> payload;

    [[nodiscard]] std::string text() const { return {payload.begin(), payload.end()}; }
};

// Parsed HTTP request head of an upgrade attempt
struct WsUpgradeRequest {
    std::string method;
    std::string path;
    std::unordered_map<std::string, std::string> headers;   // lower-cased names

    [[nodiscard]] std::string header(const std::string& name) const {
        const auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

/**
 * @brief RFC 6455 wire codec.
 *
 * Provides:
 * - HTTP upgrade handshake (SHA1 + base64)
 * - Frame encoding/decoding
 * - Close frame status codes
 */
class WebSocketCodec {
public:
    static constexpr uint16_t kCloseNormal = 1000;
    static constexpr uint16_t kCloseProtocolError = 1002;
    static constexpr uint16_t kCloseTooLarge = 1009;

    // RFC 6455 handshake: SHA1(client_key + magic_guid) -> base64
    [[nodiscard]] static std::string compute_accept_key(const std::string& client_key);

    // Frame encoding per RFC 6455 (server->client: unmasked)
    [[nodiscard]] static std::vector<uint8_t> encode_frame(
        WsOpcode opcode, std::string_view payload);

    [[nodiscard]] static std::vector<uint8_t> encode_close(
        uint16_t code, std::string_view reason = {});

    // Frame decoding per RFC 6455 (client->server: masked).
    // nullopt = need more bytes; bytes_consumed stays 0.
    [[nodiscard]] static std::optional<WsFrame> decode_frame(
        const uint8_t* data, size_t len, size_t& bytes_consumed);

    // Validate WebSocket upgrade request headers
    [[nodiscard]] static bool is_upgrade_request(
        const std::string& upgrade_header,
        const std::string& connection_header);

    // Parse "GET /path HTTP/1.1\r\nName: value\r\n...\r\n\r\n"
    [[nodiscard]] static std::optional<WsUpgradeRequest> parse_request_head(std::string_view raw);

    // Build HTTP 101 response headers
    [[nodiscard]] static std::string build_upgrade_response(
        const std::string& accept_key);

    [[nodiscard]] static std::string build_rejection(int status, std::string_view reason);
};

} // namespace polystore
