#pragma once
// WebSocket (RFC 6455) helpers for a server-push channel
//
// Opening handshake, frame encoding and incremental frame parsing. The
// server never masks; inbound client frames are unmasked on parse.

#include <sakshi/types.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sakshi {
namespace ws {

constexpr const char* GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Inbound frames larger than this close the connection
constexpr size_t MAX_INBOUND_PAYLOAD = 1 << 20;

enum class Opcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

inline bool is_control(Opcode op) {
    return (static_cast<uint8_t>(op) & 0x8) != 0;
}

// Handshake request heads larger than this are refused
constexpr size_t MAX_HANDSHAKE = 16 * 1024;

// Head of the client's opening handshake
struct UpgradeRequest {
    std::string method;
    std::string path;   // target without query
    std::vector<std::pair<std::string, std::string>> headers;

    // Case-insensitive lookup; nullptr when absent
    const std::string* header(const std::string& name) const;

    // Case-insensitive comma-separated token ("Connection: keep-alive, Upgrade")
    bool has_token(const std::string& name, const std::string& token) const;
};

// Parses a request head. consumed = bytes through the blank line.
ParseStatus parse_upgrade_request(const std::string& buf, UpgradeRequest& out, size_t& consumed);

// GET with Upgrade: websocket and a non-empty Sec-WebSocket-Key
bool is_upgrade(const UpgradeRequest& request);

// base64(SHA-1(client_key + GUID))
std::string compute_accept_key(const std::string& client_key);

// 101 Switching Protocols carrying the accept key
std::string handshake_response(const std::string& client_key);

// Plain HTTP/1.1 refusal with a JSON body; the connection closes after it
std::string refusal(int status, const char* reason, const std::string& body,
                    const std::string& extra_headers = "");

// One final, unmasked frame
std::string encode_frame(Opcode opcode, const std::string& payload);

inline std::string text_frame(const std::string& payload) {
    return encode_frame(Opcode::Text, payload);
}

struct Frame {
    bool fin = true;
    Opcode opcode = Opcode::Text;
    std::string payload;   // unmasked
};

// Parses one frame at pos; pos advances only on Complete.
// Malformed: reserved bits, unknown opcode, oversize or fragmented control.
ParseStatus parse_frame(const std::string& buf, size_t& pos, Frame& out);

} // namespace ws
} // namespace sakshi
