#include <sakshi/websocket.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <cctype>

namespace sakshi {
namespace ws {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

}  // anonymous namespace

const std::string* UpgradeRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

bool UpgradeRequest::has_token(const std::string& name, const std::string& token) const {
    for (const auto& [key, value] : headers) {
        if (!iequals(key, name)) continue;
        size_t start = 0;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos) comma = value.size();
            if (iequals(trim(value.substr(start, comma - start)), token)) return true;
            start = comma + 1;
        }
    }
    return false;
}

ParseStatus parse_upgrade_request(const std::string& buf, UpgradeRequest& out, size_t& consumed) {
    size_t head_end = buf.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        return buf.size() > MAX_HANDSHAKE ? ParseStatus::Malformed : ParseStatus::Incomplete;
    }
    if (head_end > MAX_HANDSHAKE) return ParseStatus::Malformed;

    // GET /ws HTTP/1.1
    size_t line_end = buf.find("\r\n");
    std::string line = buf.substr(0, line_end);
    size_t sp1 = line.find(' ');
    size_t sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) return ParseStatus::Malformed;

    UpgradeRequest req;
    req.method = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (req.method.empty() || target.empty() || target[0] != '/' ||
        line.compare(sp2 + 1, 5, "HTTP/") != 0) {
        return ParseStatus::Malformed;
    }
    req.path = target.substr(0, target.find('?'));

    size_t pos = line_end + 2;
    while (pos < head_end) {
        size_t eol = buf.find("\r\n", pos);
        if (eol == std::string::npos || eol > head_end) eol = head_end;
        std::string field = buf.substr(pos, eol - pos);
        pos = eol + 2;
        if (field.empty()) continue;
        size_t colon = field.find(':');
        if (colon == std::string::npos || colon == 0) return ParseStatus::Malformed;
        req.headers.emplace_back(field.substr(0, colon), trim(field.substr(colon + 1)));
    }

    out = std::move(req);
    consumed = head_end + 4;
    return ParseStatus::Complete;
}

bool is_upgrade(const UpgradeRequest& request) {
    const std::string* key = request.header("Sec-WebSocket-Key");
    return request.method == "GET" && request.has_token("Upgrade", "websocket") &&
           key != nullptr && !key->empty();
}

std::string compute_accept_key(const std::string& client_key) {
    std::string concat = client_key + GUID;
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash);

    // 20 bytes -> 28 base64 chars + NUL
    unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
    int n = EVP_EncodeBlock(encoded, hash, SHA_DIGEST_LENGTH);
    return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(n));
}

std::string handshake_response(const std::string& client_key) {
    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " + compute_accept_key(client_key) + "\r\n\r\n";
}

std::string refusal(int status, const char* reason, const std::string& body,
                    const std::string& extra_headers) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Access-Control-Allow-Origin: *\r\n" +
           extra_headers +
           "Connection: close\r\n\r\n" + body;
}

std::string encode_frame(Opcode opcode, const std::string& payload) {
    std::string frame;
    frame.reserve(payload.size() + 10);
    frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

    size_t len = payload.size();
    if (len < 126) {
        frame.push_back(static_cast<char>(len));
    } else if (len < 65536) {
        frame.push_back(static_cast<char>(126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(127));
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<char>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
        }
    }
    frame += payload;
    return frame;
}

ParseStatus parse_frame(const std::string& buf, size_t& pos, Frame& out) {
    const size_t avail = buf.size() - pos;
    if (avail < 2) return ParseStatus::Incomplete;

    auto byte = [&](size_t i) { return static_cast<uint8_t>(buf[pos + i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) return ParseStatus::Malformed;   // RSV bits without extensions

    uint8_t op = b0 & 0x0F;
    switch (op) {
        case 0x0: case 0x1: case 0x2: case 0x8: case 0x9: case 0xA:
            break;
        default:
            return ParseStatus::Malformed;
    }
    Opcode opcode = static_cast<Opcode>(op);
    bool fin = (b0 & 0x80) != 0;
    bool masked = (b1 & 0x80) != 0;

    uint64_t payload_len = b1 & 0x7F;
    size_t header_len = 2;
    if (payload_len == 126) {
        if (avail < 4) return ParseStatus::Incomplete;
        payload_len = (uint64_t(byte(2)) << 8) | byte(3);
        header_len = 4;
    } else if (payload_len == 127) {
        if (avail < 10) return ParseStatus::Incomplete;
        payload_len = 0;
        for (size_t i = 0; i < 8; ++i) payload_len = (payload_len << 8) | byte(2 + i);
        header_len = 10;
    }

    if (is_control(opcode) && (!fin || payload_len > 125)) return ParseStatus::Malformed;
    if (payload_len > MAX_INBOUND_PAYLOAD) return ParseStatus::Malformed;

    size_t mask_offset = header_len;
    if (masked) header_len += 4;
    if (avail < header_len + payload_len) return ParseStatus::Incomplete;

    Frame frame;
    frame.fin = fin;
    frame.opcode = opcode;
    frame.payload = buf.substr(pos + header_len, static_cast<size_t>(payload_len));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(
                static_cast<uint8_t>(frame.payload[i]) ^ byte(mask_offset + (i % 4)));
        }
    }

    out = std::move(frame);
    pos += header_len + static_cast<size_t>(payload_len);
    return ParseStatus::Complete;
}

} // namespace ws
} // namespace sakshi
