#include "realtime/websocket_codec.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"
#include <openssl/evp.h>
#include <cstring>
#include <format>

namespace polystore {

// RFC 6455 magic GUID
static constexpr const char* WS_MAGIC_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// ============================================================================
// RFC 6455 Handshake
// ============================================================================

std::string WebSocketCodec::compute_accept_key(const std::string& client_key) {
    const std::string combined = client_key + WS_MAGIC_GUID;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_Digest(
        combined.data(), combined.size(),
        hash, &hash_len,
        EVP_sha1(), nullptr);

    return base64::encode(hash, hash_len);
}

bool WebSocketCodec::is_upgrade_request(
    const std::string& upgrade_header,
    const std::string& connection_header) {
    return utils::to_lower(utils::trim(upgrade_header)) == "websocket" &&
           utils::to_lower(connection_header).find("upgrade") != std::string::npos;
}

std::optional<WsUpgradeRequest> WebSocketCodec::parse_request_head(std::string_view raw) {
    const auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string_view::npos) return std::nullopt;

    auto lines = utils::split(std::string(raw.substr(0, head_end)), '\n');
    if (lines.empty()) return std::nullopt;
    for (auto& line : lines) line = utils::trim(line);

    // Request line: METHOD SP PATH SP VERSION
    const auto parts = utils::split(lines[0], ' ');
    if (parts.size() != 3 || !parts[2].starts_with("HTTP/1.")) return std::nullopt;

    WsUpgradeRequest request;
    request.method = parts[0];
    request.path = parts[1];
    for (size_t i = 1; i < lines.size(); ++i) {
        const auto colon = lines[i].find(':');
        if (colon == std::string::npos) continue;
        request.headers[utils::to_lower(utils::trim(lines[i].substr(0, colon)))] =
            utils::trim(lines[i].substr(colon + 1));
    }
    return request;
}

std::string WebSocketCodec::build_upgrade_response(
    const std::string& accept_key) {
    return std::format(
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: {}\r\n"
        "\r\n", accept_key);
}

std::string WebSocketCodec::build_rejection(int status, std::string_view reason) {
    return std::format(
        "HTTP/1.1 {} {}\r\n"
        "Connection: close\r\n"
        "Content-Length: 0\r\n"
        "\r\n", status, reason);
}

// ============================================================================
// Frame Encoding (server -> client: unmasked)
// ============================================================================

std::vector<uint8_t> WebSocketCodec::encode_frame(
    WsOpcode opcode, std::string_view payload) {
    std::vector<uint8_t> frame;
    const size_t payload_len = payload.size();
    frame.reserve(payload_len + 10);

    // FIN bit + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    // Payload length (server frames are NOT masked)
    if (payload_len <= 125) {
        frame.push_back(static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(126);
        frame.push_back(static_cast<uint8_t>((payload_len >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(payload_len & 0xFF));
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>(
                (static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF));
        }
    }

    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<uint8_t> WebSocketCodec::encode_close(uint16_t code, std::string_view reason) {
    std::string body;
    body.push_back(static_cast<char>((code >> 8) & 0xFF));
    body.push_back(static_cast<char>(code & 0xFF));
    // Control frame payloads are capped at 125 bytes
    body.append(reason.substr(0, 123));
    return encode_frame(WsOpcode::CLOSE, body);
}

// ============================================================================
// Frame Decoding (client -> server: masked per RFC 6455)
// ============================================================================

std::optional<WsFrame> WebSocketCodec::decode_frame(
    const uint8_t* data, size_t len, size_t& bytes_consumed) {
    bytes_consumed = 0;

    if (len < 2) return std::nullopt;

    size_t pos = 0;

    // Byte 0: FIN + RSV + Opcode
    const bool fin = (data[0] & 0x80) != 0;
    const auto opcode = static_cast<WsOpcode>(data[0] & 0x0F);
    ++pos;

    // Byte 1: MASK + Payload length
    const bool masked = (data[1] & 0x80) != 0;
    uint64_t payload_len = data[1] & 0x7F;
    ++pos;

    if (payload_len == 126) {
        if (len < pos + 2) return std::nullopt;
        payload_len = (static_cast<uint64_t>(data[pos]) << 8) |
                       static_cast<uint64_t>(data[pos + 1]);
        pos += 2;
    } else if (payload_len == 127) {
        if (len < pos + 8) return std::nullopt;
        payload_len = 0;
        for (int i = 0; i < 8; ++i) {
            payload_len = (payload_len << 8) | static_cast<uint64_t>(data[pos + i]);
        }
        pos += 8;
    }

    uint8_t mask_key[4] = {0};
    if (masked) {
        if (len < pos + 4) return std::nullopt;
        std::memcpy(mask_key, data + pos, 4);
        pos += 4;
    }

    if (payload_len > len - pos) return std::nullopt;

    WsFrame frame;
    frame.fin = fin;
    frame.masked = masked;
    frame.opcode = opcode;
    frame.payload.resize(static_cast<size_t>(payload_len));

    if (masked) {
        for (size_t i = 0; i < payload_len; ++i) {
            frame.payload[i] = data[pos + i] ^ mask_key[i % 4];
        }
    } else if (payload_len > 0) {
        std::memcpy(frame.payload.data(), data + pos, static_cast<size_t>(payload_len));
    }

    bytes_consumed = pos + static_cast<size_t>(payload_len);
    return frame;
}

} // namespace polystore
