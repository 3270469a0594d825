#include <sakshi/sakshi.hpp>
#include <sakshi/net.hpp>
#include <sakshi/websocket.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <thread>

using namespace sakshi;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════
// Fakes
// ═══════════════════════════════════════════════════════════════════

class FakeStream : public StreamSource {
public:
    std::optional<StreamReading> read(const std::string&, const std::string&,
                                      size_t count) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms.load()));
        std::lock_guard<std::mutex> lock(mutex);
        calls++;
        if (fail) return std::nullopt;

        StreamReading r;
        r.length = entries.size();
        for (auto it = entries.rbegin(); it != entries.rend() && r.entries.size() < count; ++it) {
            r.entries.push_back(*it);
        }
        r.actors = actors;
        return r;
    }

    std::string last_error() const override { return "fake stream down"; }

    void append(const std::string& id, const std::string& salience,
                const std::string& content = "") {
        std::lock_guard<std::mutex> lock(mutex);
        StreamEntry e;
        e.id = id;
        if (!salience.empty()) e.fields["salience"] = salience;
        if (!content.empty()) e.fields["content"] = content;
        entries.push_back(std::move(e));
    }

    void set_fail(bool f) {
        std::lock_guard<std::mutex> lock(mutex);
        fail = f;
    }

    std::mutex mutex;
    std::vector<StreamEntry> entries;   // oldest first
    std::unordered_map<std::string, std::string> actors;
    bool fail = false;
    int calls = 0;
    std::atomic<int> delay_ms{0};   // per read, outside the lock
};

class FakeVectors : public VectorSource {
public:
    std::optional<uint64_t> count(const std::string& collection) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms.load()));
        std::lock_guard<std::mutex> lock(mutex);
        if (fail) return std::nullopt;
        auto it = counts.find(collection);
        return it == counts.end() ? 0 : it->second;
    }

    std::optional<IdentityRecord> identity(const std::string&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms.load()));
        std::lock_guard<std::mutex> lock(mutex);
        if (fail) return std::nullopt;
        return record;
    }

    std::optional<std::vector<VectorSample>> scroll(const std::string& collection,
                                                    size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (fail || failing.count(collection)) return std::nullopt;
        std::vector<VectorSample> out;
        auto it = samples.find(collection);
        if (it == samples.end()) return out;
        for (const auto& s : it->second) {
            if (out.size() >= limit) break;
            out.push_back(s);
        }
        return out;
    }

    std::string last_error() const override { return "fake vectors down"; }

    void set_fail(bool f) {
        std::lock_guard<std::mutex> lock(mutex);
        fail = f;
    }

    mutable std::mutex mutex;
    std::map<std::string, uint64_t> counts;
    IdentityRecord record;
    std::map<std::string, std::vector<VectorSample>> samples;
    std::set<std::string> failing;
    bool fail = false;
    std::atomic<int> delay_ms{0};   // per count or identity request
};

// Shared view of what a FakeWriter saw; the writer itself is owned by the hub
struct WriterLog {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> payloads;
    bool gate_closed = false;   // writes block while set
    bool fail = false;
    bool closed = false;
    bool in_write = false;

    bool wait_for_count(size_t n, int ms) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(ms),
                           [&] { return payloads.size() >= n; });
    }

    bool wait_in_write(int ms) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(ms), [&] { return in_write; });
    }

    bool wait_closed(int ms) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(ms), [&] { return closed; });
    }

    void set_gate(bool blocked) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            gate_closed = blocked;
        }
        cv.notify_all();
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return payloads.size();
    }

    std::string last() {
        std::lock_guard<std::mutex> lock(mutex);
        return payloads.empty() ? "" : payloads.back();
    }
};

class FakeWriter : public SessionWriter {
public:
    FakeWriter(std::shared_ptr<WriterLog> log, std::string name)
        : log_(std::move(log)), name_(std::move(name)) {}

    // Blocks while the gate is closed, whatever the timeout says
    bool write(const std::string& payload, int64_t) override {
        std::unique_lock<std::mutex> lock(log_->mutex);
        log_->in_write = true;
        log_->cv.notify_all();
        log_->cv.wait(lock, [&] { return !log_->gate_closed || log_->closed; });
        log_->in_write = false;
        if (log_->closed || log_->fail) {
            log_->cv.notify_all();
            return false;
        }
        log_->payloads.push_back(payload);
        log_->cv.notify_all();
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            log_->closed = true;
        }
        log_->cv.notify_all();
    }

    std::string describe() const override { return name_; }

private:
    std::shared_ptr<WriterLog> log_;
    std::string name_;
};

std::unique_ptr<SessionWriter> fake_writer(const std::shared_ptr<WriterLog>& log,
                                           const std::string& name) {
    return std::make_unique<FakeWriter>(log, name);
}

struct ManualClock {
    std::atomic<Timestamp> t{1700000000000};
    Clock fn() { return [this] { return t.load(); }; }
    void advance(int64_t ms) { t += ms; }
};

// Collector over fakes with a hand-driven clock
struct CollectorRig {
    FakeStream stream;
    FakeVectors vectors;
    SnapshotStore store;
    ManualClock clock;
    Collector collector;

    explicit CollectorRig(CollectorConfig config = CollectorConfig{})
        : collector(std::move(config), stream, vectors, store) {
        collector.set_clock(clock.fn());
    }
};

Embedding test_embedding(float seed, size_t dim = EMBED_DIM) {
    Embedding v(dim);
    for (size_t i = 0; i < dim; ++i) {
        v[i] = std::sin((static_cast<float>(i) + seed) * 0.1f);
    }
    return v;
}

VectorSample sample(const std::string& id, Embedding v, json payload = json::object()) {
    VectorSample s;
    s.id = id;
    s.vector = std::move(v);
    s.payload = std::move(payload);
    return s;
}

bool near(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) <= eps;
}

bool same_point(const Point3& a, const Point3& b, float eps = 1e-5f) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps);
}

// One-connection-at-a-time TCP server answering scripted replies. The
// responder sees the bytes received since its last reply and returns
// nullopt until they hold a complete request.
class ScriptedServer {
public:
    using Responder = std::function<std::optional<std::string>(const std::string&)>;

    explicit ScriptedServer(Responder respond) : respond_(std::move(respond)) {
        bool ok = listener_.listen("127.0.0.1", 0);
        assert(ok);
        (void)ok;
        thread_ = std::thread([this] { run(); });
    }

    ~ScriptedServer() {
        running_ = false;
        thread_.join();
    }

    uint16_t port() const { return listener_.port(); }
    int served() const { return served_; }

private:
    void run() {
        while (running_) {
            pollfd pfd = {listener_.fd(), POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0) continue;
            int fd = listener_.accept();
            if (fd < 0) continue;

            // Sequential requests on one connection until the peer leaves
            Socket socket(fd);
            std::string buf;
            std::string error;
            while (running_) {
                std::optional<std::string> reply = respond_(buf);
                if (reply) {
                    if (!send_all(fd, reply->data(), reply->size(), deadline_after(2000), error)) {
                        break;
                    }
                    served_++;
                    buf.clear();
                    continue;
                }
                IoResult io = recv_some(fd, buf, deadline_after(100), error);
                if (io == IoResult::Timeout) continue;
                if (io != IoResult::Ok) break;
            }
        }
    }

    Responder respond_;
    TcpListener listener_;
    std::atomic<bool> running_{true};
    std::atomic<int> served_{0};
    std::thread thread_;
};

std::string bulk(const std::string& s) {
    return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
}

// Arguments of one complete RESP command, or nullopt while bytes are missing
std::optional<std::vector<std::string>> resp_command(const std::string& buf) {
    if (buf.empty() || buf[0] != '*') return std::nullopt;
    size_t eol = buf.find("\r\n");
    if (eol == std::string::npos) return std::nullopt;
    int n = std::stoi(buf.substr(1, eol - 1));
    size_t pos = eol + 2;

    std::vector<std::string> args;
    for (int i = 0; i < n; ++i) {
        if (pos >= buf.size() || buf[pos] != '$') return std::nullopt;
        eol = buf.find("\r\n", pos);
        if (eol == std::string::npos) return std::nullopt;
        size_t len = std::stoul(buf.substr(pos + 1, eol - pos - 1));
        pos = eol + 2;
        if (buf.size() < pos + len + 2) return std::nullopt;
        args.push_back(buf.substr(pos, len));
        pos += len + 2;
    }
    return args;
}

// Plain blocking-connect client for the push port
class TestClient {
public:
    TestClient() = default;
    ~TestClient() { close(); }

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    bool connect(uint16_t port) {
        close();
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) return false;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            close();
            return false;
        }
        return set_nonblocking(fd_);
    }

    bool write(const std::string& data) {
        return send_all(fd_, data.data(), data.size(), deadline_after(1000), error_);
    }

    IoResult read_some(std::string& out, Deadline deadline) {
        return recv_some(fd_, out, deadline, error_);
    }

    // Everything the server sends before it closes
    std::string read_to_close(int ms = 2000) {
        std::string out;
        Deadline deadline = deadline_after(ms);
        while (read_some(out, deadline) == IoResult::Ok) {}
        return out;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
    std::string error_;
};

// Status code of a raw HTTP/1.1 reply, 0 if there is none
int reply_status(const std::string& raw) {
    if (raw.compare(0, 9, "HTTP/1.1 ") != 0 || raw.size() < 12) return 0;
    return std::stoi(raw.substr(9, 3));
}

// Client frames are masked
std::string masked_frame(ws::Opcode opcode, const std::string& payload) {
    const unsigned char mask[4] = {0x37, 0xfa, 0x21, 0x3d};
    std::string frame;
    frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));
    frame.push_back(static_cast<char>(0x80 | payload.size()));
    frame.append(reinterpret_cast<const char*>(mask), 4);
    for (size_t i = 0; i < payload.size(); ++i) {
        frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
    }
    return frame;
}

// Reads from conn until one full frame is parsed
bool read_frame(TestClient& conn, std::string& buf, ws::Frame& frame, int ms = 2000) {
    Deadline deadline = deadline_after(ms);
    while (true) {
        size_t pos = 0;
        ParseStatus st = ws::parse_frame(buf, pos, frame);
        if (st == ParseStatus::Complete) {
            buf.erase(0, pos);
            return true;
        }
        if (st == ParseStatus::Malformed) return false;
        if (conn.read_some(buf, deadline) != IoResult::Ok) return false;
    }
}

// Both listeners on ephemeral ports
GatewayConfig ephemeral_gateway() {
    GatewayConfig cfg;
    cfg.port = 0;
    cfg.ws_port = 0;
    return cfg;
}

template <typename Pred>
bool eventually(Pred pred, int ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// ═══════════════════════════════════════════════════════════════════
// Wire codecs
// ═══════════════════════════════════════════════════════════════════

void test_rfc3339() {
    std::cout << "Testing RFC 3339 timestamps..." << std::endl;

    assert(format_rfc3339(0) == "1970-01-01T00:00:00.000Z");
    assert(format_rfc3339(1700000000123) == "2023-11-14T22:13:20.123Z");

    assert(parse_rfc3339("2023-11-14T22:13:20Z") == Timestamp(1700000000000));
    assert(parse_rfc3339("2023-11-14T22:13:20.123Z") == Timestamp(1700000000123));
    assert(parse_rfc3339("2023-11-14T22:13:20.123456789Z") == Timestamp(1700000000123));
    assert(parse_rfc3339("2023-11-15T00:13:20+02:00") == Timestamp(1700000000000));
    assert(parse_rfc3339("2023-11-14T17:43:20-0430") == Timestamp(1700000000000));

    assert(!parse_rfc3339(""));
    assert(!parse_rfc3339("yesterday"));
    assert(!parse_rfc3339("2023-11-14T22:13:20"));       // no zone
    assert(!parse_rfc3339("2023-13-14T22:13:20Z"));
    assert(!parse_rfc3339("2023-11-14T22:13:20Zjunk"));

    auto round = parse_rfc3339(format_rfc3339(1234567890987));
    assert(round && *round == 1234567890987);

    std::cout << "  PASS" << std::endl;
}

void test_url_parsing() {
    std::cout << "Testing store URL parsing..." << std::endl;

    Endpoint r = parse_redis_url("redis://cache.local:6380/2");
    assert(r.host == "cache.local" && r.port == 6380);
    r = parse_redis_url("redis://:secret@10.0.0.5");
    assert(r.host == "10.0.0.5" && r.port == 6379);

    Endpoint q = parse_http_url("http://qdrant:6334/");
    assert(q.host == "qdrant" && q.port == 6334);
    q = parse_http_url("http://localhost");
    assert(q.host == "localhost" && q.port == 80);

    bool threw = false;
    try { parse_redis_url("http://localhost:6379"); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_http_url("http://host:99999"); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_http_url("http://:6333"); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_upgrade_request_parsing() {
    std::cout << "Testing WebSocket upgrade request parsing..." << std::endl;

    ws::UpgradeRequest req;
    size_t consumed = 0;
    std::string raw = "GET /ws?client=ui HTTP/1.1\r\nHost: x\r\nuPgRaDe: WebSocket\r\n"
                      "Connection: keep-alive, Upgrade\r\n"
                      "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n\r\nextra";
    assert(ws::parse_upgrade_request(raw, req, consumed) == ParseStatus::Complete);
    assert(consumed == raw.size() - 5);
    assert(req.method == "GET");
    assert(req.path == "/ws");
    assert(req.header("upgrade") && *req.header("upgrade") == "WebSocket");
    assert(req.has_token("Connection", "upgrade"));
    assert(!req.has_token("Connection", "close"));
    assert(ws::is_upgrade(req));

    ws::UpgradeRequest plain;
    assert(ws::parse_upgrade_request("GET /ws HTTP/1.1\r\nHost: x\r\n\r\n", plain, consumed) ==
           ParseStatus::Complete);
    assert(!plain.header("Sec-WebSocket-Key"));
    assert(!ws::is_upgrade(plain));

    assert(ws::parse_upgrade_request("GET / HTTP/1.1\r\nHost:", req, consumed) ==
           ParseStatus::Incomplete);
    assert(ws::parse_upgrade_request("GARBAGE\r\n\r\n", req, consumed) == ParseStatus::Malformed);
    assert(ws::parse_upgrade_request("GET nopath HTTP/1.1\r\n\r\n", req, consumed) ==
           ParseStatus::Malformed);
    assert(ws::parse_upgrade_request("GET / HTTP/1.1\r\nNoColon\r\n\r\n", req, consumed) ==
           ParseStatus::Malformed);

    std::string huge = "GET /ws HTTP/1.1\r\nX: " + std::string(ws::MAX_HANDSHAKE, 'a');
    assert(ws::parse_upgrade_request(huge, req, consumed) == ParseStatus::Malformed);

    std::string accept = ws::handshake_response("dGhlIHNhbXBsZSBub25jZQ==");
    assert(accept.compare(0, 12, "HTTP/1.1 101") == 0);
    assert(accept.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") !=
           std::string::npos);
    assert(accept.substr(accept.size() - 4) == "\r\n\r\n");

    std::string refused = ws::refusal(426, "Upgrade Required", "{\"a\":1}",
                                      "Upgrade: websocket\r\n");
    assert(reply_status(refused) == 426);
    assert(refused.find("Content-Length: 7\r\n") != std::string::npos);
    assert(refused.find("Upgrade: websocket\r\n") != std::string::npos);
    assert(refused.find("Connection: close\r\n") != std::string::npos);
    assert(refused.substr(refused.size() - 7) == "{\"a\":1}");

    std::cout << "  PASS" << std::endl;
}

void test_websocket_codec() {
    std::cout << "Testing WebSocket codec..." << std::endl;

    // Handshake example from RFC 6455 section 1.3
    assert(ws::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");

    std::string small = ws::text_frame("hi");
    assert(small.size() == 4);
    assert(static_cast<uint8_t>(small[0]) == 0x81 && small[1] == 2);

    std::string medium = ws::text_frame(std::string(300, 'x'));
    assert(medium.size() == 304);
    assert(static_cast<uint8_t>(medium[1]) == 126);
    assert(static_cast<uint8_t>(medium[2]) == 0x01 && static_cast<uint8_t>(medium[3]) == 0x2C);

    std::string large = ws::text_frame(std::string(70000, 'x'));
    assert(large.size() == 70010);
    assert(static_cast<uint8_t>(large[1]) == 127);

    // Masked "Hello" from RFC 6455 section 5.7
    const unsigned char hello[] = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58};
    std::string buf(reinterpret_cast<const char*>(hello), sizeof(hello));
    ws::Frame frame;
    size_t pos = 0;
    assert(ws::parse_frame(buf.substr(0, 6), pos, frame) == ParseStatus::Incomplete);
    assert(pos == 0);
    assert(ws::parse_frame(buf, pos, frame) == ParseStatus::Complete);
    assert(pos == buf.size());
    assert(frame.fin && frame.opcode == ws::Opcode::Text && frame.payload == "Hello");

    // Unmasked server frames parse too
    pos = 0;
    assert(ws::parse_frame(medium, pos, frame) == ParseStatus::Complete);
    assert(frame.payload.size() == 300);

    std::string ping = masked_frame(ws::Opcode::Ping, "abc");
    pos = 0;
    assert(ws::parse_frame(ping, pos, frame) == ParseStatus::Complete);
    assert(frame.opcode == ws::Opcode::Ping && frame.payload == "abc");

    // Reserved bits, unknown opcode, oversize control frame
    std::string rsv("\xC1\x00", 2);
    pos = 0;
    assert(ws::parse_frame(rsv, pos, frame) == ParseStatus::Malformed);
    std::string unknown("\x83\x00", 2);
    pos = 0;
    assert(ws::parse_frame(unknown, pos, frame) == ParseStatus::Malformed);
    std::string big_ping = ws::encode_frame(ws::Opcode::Ping, std::string(200, 'p'));
    pos = 0;
    assert(ws::parse_frame(big_ping, pos, frame) == ParseStatus::Malformed);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════

Config config_from(const std::map<std::string, std::string>& env) {
    return Config::from_lookup([&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });
}

bool config_rejects(const std::map<std::string, std::string>& env) {
    try {
        config_from(env);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void test_config() {
    std::cout << "Testing Config..." << std::endl;

    Config defaults = config_from({});
    assert(defaults.port == 3000);
    assert(defaults.ws_port == 3001);
    assert(defaults.bind_address == "127.0.0.1");
    assert(defaults.tick_interval_ms == 200);
    assert(defaults.refresh_interval_ms == 2000);
    assert(defaults.sample_count == 500);
    assert(defaults.queue_depth == 1);
    assert(defaults.embed_dim == EMBED_DIM);
    assert(defaults.projection == ProjectionKind::Random);
    assert(defaults.stream_key == "daneel:stream:awake");
    assert(defaults.log_level == LogLevel::Info);

    Config c = config_from({
        {"REDIS_URL", "redis://stream:7000"},
        {"QDRANT_URL", "http://vectors:7001"},
        {"PORT", "8080"},
        {"SAKSHI_WS_PORT", "8081"},
        {"SAKSHI_TICK_MS", "100"},
        {"SAKSHI_SOURCE_TIMEOUT_MS", "50"},
        {"SAKSHI_WRITE_TIMEOUT_MS", "60"},
        {"SAKSHI_SAMPLE_COUNT", "64"},
        {"SAKSHI_QUEUE_DEPTH", "2"},
        {"SAKSHI_PROJECTION", "pca"},
        {"SAKSHI_LOG", "debug"},
        {"SAKSHI_NAME", "Daneel"},
    });
    assert(c.redis.host == "stream" && c.redis.port == 7000);
    assert(c.qdrant.host == "vectors" && c.qdrant.port == 7001);
    assert(c.port == 8080);
    assert(c.ws_port == 8081);
    assert(c.tick_interval_ms == 100);
    assert(c.sample_count == 64);
    assert(c.queue_depth == 2);
    assert(c.projection == ProjectionKind::Pca);
    assert(c.log_level == LogLevel::Debug);
    assert(c.name == "Daneel");
    assert(c.summary().find("projection=pca") != std::string::npos);
    assert(c.summary().find("ws=8081") != std::string::npos);

    assert(config_rejects({{"PORT", "http"}}));
    assert(config_rejects({{"PORT", "0"}}));
    assert(config_rejects({{"SAKSHI_WS_PORT", "3000"}}));
    assert(config_rejects({{"PORT", "4000"}, {"SAKSHI_WS_PORT", "4000"}}));
    assert(config_rejects({{"SAKSHI_BIND", "localhost"}}));
    assert(config_rejects({{"SAKSHI_TICK_MS", "5"}}));
    assert(config_rejects({{"SAKSHI_REFRESH_MS", "100"}}));
    assert(config_rejects({{"SAKSHI_SOURCE_TIMEOUT_MS", "200"}}));
    assert(config_rejects({{"SAKSHI_WRITE_TIMEOUT_MS", "0"}}));
    assert(config_rejects({{"SAKSHI_SAMPLE_COUNT", "0"}}));
    assert(config_rejects({{"SAKSHI_SAMPLE_COUNT", "10001"}}));
    assert(config_rejects({{"SAKSHI_QUEUE_DEPTH", "5"}}));
    assert(config_rejects({{"SAKSHI_EMBED_DIM", "2"}}));
    assert(config_rejects({{"SAKSHI_PROJECTION", "tsne"}}));
    assert(config_rejects({{"SAKSHI_LOG", "loud"}}));
    assert(config_rejects({{"SAKSHI_SEED", "-1"}}));
    assert(config_rejects({{"REDIS_URL", "localhost:6379"}}));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Snapshot model
// ═══════════════════════════════════════════════════════════════════

void test_emotional_derivation() {
    std::cout << "Testing emotional derivation..." << std::endl;

    assert(near(emotional_intensity(-0.5f, 0.8f), 0.4f));
    assert(near(emotional_intensity(0.0f, 1.0f), 0.0f));
    assert(near(connection_drive(0.0f, 0.5f), 0.5f));
    assert(near(connection_drive(1.0f, 1.0f), 1.0f));
    assert(near(connection_drive(-1.0f, 0.0f), 0.0f));

    EmotionalState e = EmotionalState::derive(3.0f, -2.0f, 7.0f);
    assert(e.valence == 1.0f && e.arousal == 0.0f && e.dominance == 1.0f);
    assert(near(e.emotional_intensity, 0.0f));
    assert(near(e.connection_drive, 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_thought_parsing() {
    std::cout << "Testing thought record parsing..." << std::endl;

    StreamEntry e;
    e.id = "1700000000042-3";
    e.fields["content"] = R"({"Symbol":{"id":"thought_77","data":[1,2,3]}})";
    e.fields["salience"] = R"({"importance":0.65,"novelty":0.7,"valence":-0.4,"arousal":0.9})";
    auto t = parse_thought(e, 5);
    assert(t);
    assert(t->summary.id == "1700000000042-3");
    assert(t->summary.content_preview == "thought_77");
    assert(near(t->summary.salience, 0.65f));
    assert(near(t->valence, -0.4f) && near(t->arousal, 0.9f));
    assert(t->summary.timestamp == 1700000000042);

    // Bare number salience, clamped; timestamp from field
    StreamEntry n;
    n.id = "thought-a";
    n.fields["salience"] = "1.7";
    n.fields["timestamp"] = "1700000000999";
    t = parse_thought(n, 5);
    assert(t && t->summary.salience == 1.0f);
    assert(t->summary.timestamp == 1700000000999);
    assert(t->summary.content_preview.empty());

    // Neither id time nor field: tick time
    n.fields.erase("timestamp");
    t = parse_thought(n, 5);
    assert(t && t->summary.timestamp == 5);

    StreamEntry missing;
    missing.id = "1-0";
    assert(!parse_thought(missing, 0));
    missing.fields["salience"] = "\"high\"";
    assert(!parse_thought(missing, 0));
    StreamEntry no_id;
    no_id.fields["salience"] = "0.5";
    assert(!parse_thought(no_id, 0));

    // Raw text is cut by characters, not bytes
    std::string accented;
    for (int i = 0; i < 100; ++i) accented += "\xC3\xA9";   // é
    std::string preview = content_preview(accented);
    assert(preview.size() == 2 * PREVIEW_CHARS);
    assert(content_preview("short") == "short");
    assert(content_preview(std::string(200, 'a')).size() == PREVIEW_CHARS);

    ActorStatus a = parse_actor_status(R"({"alive":true,"restart_count":4})");
    assert(a.alive && a.restart_count == 4);
    a = parse_actor_status("not json");
    assert(!a.alive && a.restart_count == 0);

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_json() {
    std::cout << "Testing Snapshot JSON..." << std::endl;

    SnapshotStore store;
    assert(!store.initialized());
    assert(store.current() == nullptr);

    Snapshot s;
    s.timestamp = 1700000000123;
    s.identity.name = "Timmy";
    s.identity.session_thoughts = 3;
    s.emotional = EmotionalState::derive(0.5f, 0.5f, 0.5f);
    s.actors["MemoryActor"] = ActorStatus{true, 1};
    s.recent_thoughts.push_back(ThoughtSummary{"1-0", "hi", 0.9f, 1700000000000});

    auto published = store.publish(s);
    assert(store.initialized());
    assert(store.current() == published);

    json j = json::parse(published->json);
    assert(j["timestamp"] == "2023-11-14T22:13:20.123Z");
    assert(j["identity"]["name"] == "Timmy");
    assert(j["identity"]["session_thoughts"] == 3);
    assert(j["cognitive"].contains("current_cycle"));
    assert(j["emotional"].contains("connection_drive"));
    assert(j["actors"]["MemoryActor"]["alive"] == true);
    assert(j["recent_thoughts"][0]["content_preview"] == "hi");
    assert(j["recent_thoughts"][0]["timestamp"] == "2023-11-14T22:13:20.000Z");

    // Readers keep their copy after a newer publish
    s.timestamp += 200;
    store.publish(s);
    assert(published->snapshot.timestamp == 1700000000123);
    assert(store.current()->snapshot.timestamp == 1700000000323);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Collector
// ═══════════════════════════════════════════════════════════════════

void test_collector_tick() {
    std::cout << "Testing Collector tick..." << std::endl;

    CollectorRig rig;
    rig.vectors.counts["memories"] = 120;
    rig.vectors.counts["unconscious"] = 45;
    rig.vectors.record = IdentityRecord{9001, 7, 12};
    rig.stream.append("1700000000000-0", "0.3", "first");
    rig.stream.append("1700000000100-0",
                      R"({"importance":0.8,"valence":0.6,"arousal":0.5})", "second");
    rig.stream.actors["MemoryActor"] = R"({"alive":true,"restart_count":1})";
    rig.stream.actors["DreamActor"] = R"({"alive":true,"restart_count":0})";

    int published = 0;
    rig.collector.on_publish([&](const SnapshotStore::Ptr& p) {
        assert(p == rig.store.current());
        published++;
    });

    auto p = rig.collector.tick();
    assert(p && published == 1);
    const Snapshot& s = p->snapshot;
    assert(s.timestamp == rig.clock.t.load());
    assert(s.identity.name == "Timmy");
    assert(s.identity.lifetime_thoughts == 9001);
    assert(s.identity.restart_count == 7);
    assert(s.identity.session_thoughts == 2);
    assert(s.cognitive.conscious_memories == 120);
    assert(s.cognitive.unconscious_memories == 45);
    assert(s.cognitive.lifetime_dreams == 12);
    assert(s.cognitive.current_cycle == 2);

    // Primitives from the newest record, derived fields from them
    assert(near(s.emotional.valence, 0.6f) && near(s.emotional.arousal, 0.5f));
    assert(near(s.emotional.emotional_intensity, 0.3f));
    assert(near(s.emotional.connection_drive, 0.65f));
    assert(s.emotional.dominance == 0.5f);

    assert(s.recent_thoughts.size() == 2);
    assert(s.recent_thoughts[0].content_preview == "second");

    // Every known actor present; unknown names kept
    for (const auto& name : known_actors()) assert(s.actors.count(name));
    assert(s.actors.at("MemoryActor").alive);
    assert(s.actors.at("MemoryActor").restart_count == 1);
    assert(!s.actors.at("VolitionActor").alive);
    assert(s.actors.at("DreamActor").alive);

    auto st = rig.collector.stats();
    assert(st.ticks == 1 && !st.stream_stale && !st.vector_stale);

    std::cout << "  PASS" << std::endl;
}

void test_metrics_bounds_and_order() {
    std::cout << "Testing /metrics bounds and timestamp order..." << std::endl;

    CollectorRig rig;
    FakeVectors cloud_vectors;
    ProjectionEngine projection(ProjectionConfig{}, cloud_vectors);
    BroadcastHub hub(HubConfig{}, rig.store);
    Gateway gateway(ephemeral_gateway(), rig.store, projection, hub);
    assert(gateway.start());
    httplib::Client client("127.0.0.1", gateway.port());

    Timestamp previous = 0;
    int seq = 0;
    for (int tick = 0; tick < 30; ++tick) {
        rig.stream.append("t" + std::to_string(seq++), "0.5");
        rig.stream.append("t" + std::to_string(seq++), "0.5");
        // Wall clock occasionally steps backwards
        rig.clock.advance(tick % 5 == 4 ? -5000 : 200);
        rig.collector.tick();

        auto r = client.Get("/metrics");
        assert(r && r->status == 200);
        json j = json::parse(r->body);
        assert(j["recent_thoughts"].size() <= RECENT_THOUGHTS);
        auto ts = parse_rfc3339(j["timestamp"].get<std::string>());
        assert(ts && *ts >= previous);
        previous = *ts;
    }
    assert(rig.store.current()->snapshot.recent_thoughts.size() == RECENT_THOUGHTS);
    assert(rig.store.current()->snapshot.identity.session_thoughts == 60);
    gateway.stop();

    std::cout << "  PASS" << std::endl;
}

void test_metrics_idempotent() {
    std::cout << "Testing /metrics idempotence..." << std::endl;

    CollectorRig rig;
    FakeVectors cloud_vectors;
    ProjectionEngine projection(ProjectionConfig{}, cloud_vectors);
    BroadcastHub hub(HubConfig{}, rig.store);
    Gateway gateway(ephemeral_gateway(), rig.store, projection, hub);

    assert(gateway.start());
    httplib::Client client("127.0.0.1", gateway.port());

    auto before = client.Get("/metrics");
    assert(before && before->status == 503);
    assert(json::parse(before->body)["status"] == "initializing");

    rig.stream.append("1-0", "0.4", "x");
    rig.collector.tick();

    auto a = client.Get("/metrics");
    rig.clock.advance(1000);   // time passes, no tick
    auto b = client.Get("/metrics");
    assert(a && b && a->status == 200 && b->status == 200);
    assert(a->body == b->body);
    assert(a->get_header_value("Content-Type") == b->get_header_value("Content-Type"));
    assert(a->get_header_value("Content-Type") == "application/json");

    rig.collector.tick();
    auto c = client.Get("/metrics");
    assert(c && c->body != a->body);
    gateway.stop();

    std::cout << "  PASS" << std::endl;
}

void test_scenario_three_new_thoughts() {
    std::cout << "Testing three new thoughts scenario..." << std::endl;

    CollectorRig rig;
    for (int i = 0; i < 5; ++i) rig.stream.append("0-" + std::to_string(i), "0.1");
    size_t before = rig.collector.tick()->snapshot.recent_thoughts.size();
    assert(before == 5);

    rig.stream.append("1", "0.9");
    rig.stream.append("2", "0.2");
    rig.stream.append("3", "0.5");
    rig.clock.advance(200);
    auto after = rig.collector.tick();
    const auto& recent = after->snapshot.recent_thoughts;
    assert(recent.size() == before + 3);
    assert(recent[0].id == "3" && near(recent[0].salience, 0.5f));
    assert(recent[1].id == "2" && near(recent[1].salience, 0.2f));
    assert(recent[2].id == "1" && near(recent[2].salience, 0.9f));

    // Capped at 20
    for (int i = 0; i < 14; ++i) rig.stream.append("9-" + std::to_string(i), "0.3");
    rig.stream.append("4", "0.1");
    rig.stream.append("5", "0.1");
    rig.stream.append("6", "0.1");
    auto capped = rig.collector.tick();
    assert(capped->snapshot.recent_thoughts.size() == RECENT_THOUGHTS);
    assert(capped->snapshot.recent_thoughts[0].id == "6");

    std::cout << "  PASS" << std::endl;
}

void test_degradation_stream_outage() {
    std::cout << "Testing degradation under stream outage..." << std::endl;

    CollectorRig rig;
    rig.vectors.counts["memories"] = 10;
    rig.vectors.counts["unconscious"] = 3;
    rig.vectors.record = IdentityRecord{100, 2, 5};
    rig.stream.append("1700000000000-0", R"({"importance":0.7,"valence":0.6,"arousal":0.8})");
    rig.stream.actors["SalienceActor"] = R"({"alive":true,"restart_count":0})";

    rig.clock.advance(1000);
    Snapshot good = rig.collector.tick()->snapshot;
    assert(good.identity.session_thoughts == 1);

    rig.stream.set_fail(true);
    uint64_t uptime = good.identity.uptime_seconds;
    for (int i = 0; i < 5; ++i) {
        rig.clock.advance(1000);
        Snapshot s = rig.collector.tick()->snapshot;

        assert(s.cognitive.conscious_memories == good.cognitive.conscious_memories);
        assert(s.cognitive.unconscious_memories == good.cognitive.unconscious_memories);
        assert(s.cognitive.lifetime_dreams == good.cognitive.lifetime_dreams);
        assert(s.cognitive.current_cycle == good.cognitive.current_cycle);
        assert(s.emotional.valence == good.emotional.valence);
        assert(s.emotional.arousal == good.emotional.arousal);
        assert(s.emotional.dominance == good.emotional.dominance);
        assert(s.emotional.connection_drive == good.emotional.connection_drive);
        assert(s.emotional.emotional_intensity == good.emotional.emotional_intensity);
        assert(s.recent_thoughts.size() == good.recent_thoughts.size());
        assert(s.actors.at("SalienceActor").alive);

        assert(s.identity.uptime_seconds > uptime);
        uptime = s.identity.uptime_seconds;
        assert(s.timestamp > good.timestamp);
    }

    auto st = rig.collector.stats();
    assert(st.stream_stale && !st.vector_stale);
    assert(st.stream_failures == 5);
    assert(st.ticks == 6);

    // Recovery picks up what happened meanwhile
    rig.stream.set_fail(false);
    rig.stream.append("1700000005000-0", R"({"importance":0.2,"valence":-0.5,"arousal":0.4})");
    Snapshot back = rig.collector.tick()->snapshot;
    assert(!rig.collector.stats().stream_stale);
    assert(back.identity.session_thoughts == 2);
    assert(near(back.emotional.valence, -0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_degradation_vector_outage() {
    std::cout << "Testing degradation under vector store outage..." << std::endl;

    CollectorRig rig;
    rig.vectors.counts["memories"] = 77;
    rig.vectors.record = IdentityRecord{500, 1, 2};
    rig.stream.append("1-0", "0.5");
    Snapshot good = rig.collector.tick()->snapshot;

    rig.vectors.set_fail(true);
    rig.stream.append("2-0", "0.5");
    rig.clock.advance(200);
    Snapshot s = rig.collector.tick()->snapshot;
    assert(s.cognitive.conscious_memories == 77);
    assert(s.identity.lifetime_thoughts == 500);
    assert(s.identity.restart_count == 1);
    // The stream side stays fresh
    assert(s.identity.session_thoughts == 2);
    assert(s.recent_thoughts[0].id == "2-0");

    auto st = rig.collector.stats();
    assert(st.vector_stale && !st.stream_stale && st.vector_failures == 1);
    (void)good;

    std::cout << "  PASS" << std::endl;
}

void test_malformed_thoughts() {
    std::cout << "Testing malformed thought handling..." << std::endl;

    CollectorRig rig;
    rig.stream.append("1-0", "0.4");
    rig.stream.append("2-0", "");            // no salience
    rig.stream.append("3-0", "not json");
    rig.stream.append("4-0", "0.6");

    Snapshot s = rig.collector.tick()->snapshot;
    assert(s.recent_thoughts.size() == 2);
    assert(s.recent_thoughts[0].id == "4-0");
    assert(s.recent_thoughts[1].id == "1-0");
    assert(rig.collector.stats().malformed_thoughts == 2);

    // The same records seen again are not counted twice
    rig.collector.tick();
    assert(rig.collector.stats().malformed_thoughts == 2);
    assert(!rig.collector.stats().stream_stale);

    std::cout << "  PASS" << std::endl;
}

void test_malformed_without_id() {
    std::cout << "Testing malformed thoughts without an id..." << std::endl;

    CollectorRig rig;
    rig.stream.append("", "0.4");
    rig.stream.append("", "0.5");
    rig.stream.append("3-0", "0.6");

    Snapshot s = rig.collector.tick()->snapshot;
    assert(s.recent_thoughts.size() == 1);
    assert(rig.collector.stats().malformed_thoughts == 2);

    rig.collector.tick();
    assert(rig.collector.stats().malformed_thoughts == 2);

    std::cout << "  PASS" << std::endl;
}

void test_collector_tick_budget() {
    std::cout << "Testing Collector tick budget with slow stores..." << std::endl;

    CollectorConfig cfg;
    cfg.tick_interval_ms = 200;
    cfg.source_timeout_ms = 170;
    CollectorRig rig(cfg);
    rig.vectors.counts["memories"] = 5;
    rig.vectors.record = IdentityRecord{10, 1, 0};
    rig.stream.append("1-0", "0.5");
    rig.stream.delay_ms = 140;
    rig.vectors.delay_ms = 140;

    // Both sources slow but inside their timeout: one tick, both fresh
    auto started = std::chrono::steady_clock::now();
    Snapshot s = rig.collector.tick()->snapshot;
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    assert(took < 200);
    auto st = rig.collector.stats();
    assert(!st.stream_stale && !st.vector_stale);
    assert(s.identity.session_thoughts == 1);
    assert(s.cognitive.conscious_memories == 5);

    // A hung source is cut off at the shared deadline and marked stale
    rig.stream.delay_ms = 400;
    rig.vectors.delay_ms = 0;
    rig.stream.append("2-0", "0.5");
    started = std::chrono::steady_clock::now();
    s = rig.collector.tick()->snapshot;
    took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    assert(took < 200);
    st = rig.collector.stats();
    assert(st.stream_stale && !st.vector_stale);
    assert(s.identity.session_thoughts == 1);

    // The next tick waits on the read already in flight instead of issuing another
    rig.stream.delay_ms = 0;
    assert(eventually([&] {
        rig.collector.tick();
        return !rig.collector.stats().stream_stale;
    }, 2000));
    assert(rig.store.current()->snapshot.identity.session_thoughts == 2);

    std::cout << "  PASS" << std::endl;
}

void test_non_utf8_content() {
    std::cout << "Testing non UTF-8 stream content..." << std::endl;

    assert(sanitize_utf8("plain") == "plain");
    assert(sanitize_utf8("caf\xC3\xA9") == "caf\xC3\xA9");
    assert(sanitize_utf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");    // overlong '/'
    assert(sanitize_utf8("a\x80z") == "a\xEF\xBF\xBDz");                 // lone continuation
    assert(sanitize_utf8("\xED\xA0\x80") ==                             // surrogate
           "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    assert(sanitize_utf8("\xF0\x9F\x98") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");  // truncated

    CollectorRig rig;
    rig.stream.append("1-0", "0.5", "caf\xE9 ok");
    rig.stream.actors["Dream\xFF" "Actor"] = R"({"alive":true,"restart_count":0})";

    auto p = rig.collector.tick();
    assert(p);
    assert(!rig.collector.stats().stream_stale);
    json j = json::parse(p->json);
    assert(j["recent_thoughts"][0]["content_preview"] == "caf\xEF\xBF\xBD ok");
    assert(j["actors"].contains("Dream\xEF\xBF\xBD" "Actor"));

    // Bytes that bypass the adapters are still replaced at publish
    SnapshotStore store;
    Snapshot raw;
    raw.identity.name = "bad\xFFname";
    auto published = store.publish(std::move(raw));
    assert(json::parse(published->json)["identity"]["name"] == "bad\xEF\xBF\xBD" "name");

    std::cout << "  PASS" << std::endl;
}

void test_collector_loop() {
    std::cout << "Testing Collector loop..." << std::endl;

    FakeStream stream;
    FakeVectors vectors;
    SnapshotStore store;
    CollectorConfig cfg;
    cfg.tick_interval_ms = 20;
    Collector collector(cfg, stream, vectors, store);

    std::atomic<int> published{0};
    collector.on_publish([&](const SnapshotStore::Ptr&) { published++; });

    collector.start();
    assert(collector.is_running());
    assert(eventually([&] { return published >= 3; }));
    collector.stop();
    assert(!collector.is_running());

    int after = published;
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    assert(published == after);
    assert(store.initialized());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Broadcast Hub
// ═══════════════════════════════════════════════════════════════════

SnapshotStore::Ptr publish_at(SnapshotStore& store, Timestamp t) {
    Snapshot s;
    s.timestamp = t;
    s.identity.name = "Timmy";
    return store.publish(std::move(s));
}

void test_hub_register_sends_current() {
    std::cout << "Testing hub out-of-band first push..." << std::endl;

    SnapshotStore store;
    BroadcastHub hub(HubConfig{}, store);

    // Nothing to send before the first publish
    auto empty_log = std::make_shared<WriterLog>();
    SessionId early = hub.register_session(fake_writer(empty_log, "early"));
    assert(early != 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    assert(empty_log->count() == 0);

    auto current = publish_at(store, 1000);
    auto log = std::make_shared<WriterLog>();
    SessionId id = hub.register_session(fake_writer(log, "late"));
    assert(id != 0 && id != early);
    assert(log->wait_for_count(1, 1000));
    assert(log->last() == current->json);

    // A tick with the same snapshot is not sent twice
    hub.on_tick(current);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    assert(log->count() == 1);

    assert(hub.session_count() == 2);
    hub.stop();
    assert(hub.session_count() == 0);
    assert(log->closed && empty_log->closed);

    // Stopped hubs refuse new sessions
    auto refused = std::make_shared<WriterLog>();
    assert(hub.register_session(fake_writer(refused, "refused")) == 0);
    assert(refused->closed);

    std::cout << "  PASS" << std::endl;
}

void test_hub_fault_isolation() {
    std::cout << "Testing hub fault isolation..." << std::endl;

    const int tick_ms = 200;
    SnapshotStore store;
    BroadcastHub hub(HubConfig{1, 150}, store);

    auto stuck = std::make_shared<WriterLog>();
    stuck->gate_closed = true;   // never drains
    auto a = std::make_shared<WriterLog>();
    auto b = std::make_shared<WriterLog>();
    hub.register_session(fake_writer(stuck, "stuck"));
    hub.register_session(fake_writer(a, "a"));
    hub.register_session(fake_writer(b, "b"));

    for (int k = 1; k <= 5; ++k) {
        auto snap = publish_at(store, 1000 * k);
        auto started = std::chrono::steady_clock::now();
        hub.on_tick(snap);
        // Fan-out itself never waits on the stuck session
        assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(tick_ms));

        assert(a->wait_for_count(static_cast<size_t>(k), tick_ms));
        assert(b->wait_for_count(static_cast<size_t>(k), tick_ms));
        assert(a->last() == snap->json);
        assert(b->last() == snap->json);
    }
    assert(stuck->count() == 0);
    assert(hub.session_count() == 3);

    // Shutdown unblocks and joins the stuck writer too
    hub.stop();
    assert(stuck->closed);

    std::cout << "  PASS" << std::endl;
}

void test_hub_backpressure() {
    std::cout << "Testing hub replace-pending backpressure..." << std::endl;

    for (size_t depth = 1; depth <= 2; ++depth) {
        SnapshotStore store;
        BroadcastHub hub(HubConfig{depth, 150}, store);

        auto slow = std::make_shared<WriterLog>();
        slow->gate_closed = true;
        hub.register_session(fake_writer(slow, "slow"));

        auto first = publish_at(store, 1000);
        hub.on_tick(first);
        assert(slow->wait_in_write(1000));   // first snapshot is in flight

        SnapshotStore::Ptr newest;
        for (int k = 2; k <= 10; ++k) {
            newest = publish_at(store, 1000 * k);
            hub.on_tick(newest);
            auto info = hub.sessions();
            assert(info.size() == 1);
            assert(info[0].pending <= depth);
        }
        auto info = hub.sessions();
        assert(info[0].pending == depth);
        assert(info[0].replaced == 9 - depth);

        slow->set_gate(false);
        assert(slow->wait_for_count(1 + depth, 1000));
        assert(eventually([&] { return hub.sessions()[0].sent == 1 + depth; }));
        assert(slow->count() == 1 + depth);
        assert(slow->payloads.front() == first->json);
        assert(slow->last() == newest->json);

        info = hub.sessions();
        assert(info[0].last_sent_timestamp == 10000);
        hub.stop();
    }

    std::cout << "  PASS" << std::endl;
}

void test_hub_write_failure() {
    std::cout << "Testing hub removal on write failure..." << std::endl;

    SnapshotStore store;
    BroadcastHub hub(HubConfig{}, store);

    auto broken = std::make_shared<WriterLog>();
    broken->fail = true;
    auto healthy = std::make_shared<WriterLog>();
    SessionId broken_id = hub.register_session(fake_writer(broken, "broken"));
    hub.register_session(fake_writer(healthy, "healthy"));

    hub.on_tick(publish_at(store, 1000));
    assert(eventually([&] { return hub.session_count() == 1; }));
    assert(healthy->wait_for_count(1, 500));
    assert(hub.stats().write_failures == 1);
    assert(broken->wait_closed(500));

    hub.on_tick(publish_at(store, 2000));
    assert(healthy->wait_for_count(2, 500));

    // Idempotent
    hub.unregister(broken_id);
    hub.unregister(broken_id);
    hub.unregister(12345);
    assert(hub.session_count() == 1);
    assert(hub.stats().unregistered == 0);

    std::cout << "  PASS" << std::endl;
}

void test_session_order() {
    std::cout << "Testing per-session snapshot order..." << std::endl;

    SnapshotStore store;
    auto log = std::make_shared<WriterLog>();
    log->gate_closed = true;
    Session session(1, fake_writer(log, "ordered"), HubConfig{2, 150});

    auto s5 = publish_at(store, 5000);
    auto s3 = publish_at(store, 3000);
    auto s7 = publish_at(store, 7000);
    assert(session.enqueue(s5));
    assert(!session.enqueue(s3));   // older than pending
    assert(!session.enqueue(s5));   // already pending
    assert(session.enqueue(s7));
    assert(!session.enqueue(nullptr));
    assert(session.pending() == 2);

    session.start([](SessionId) {});
    log->set_gate(false);
    assert(log->wait_for_count(2, 1000));
    assert(eventually([&] { return session.last_sent_timestamp() == 7000; }));
    assert(!session.enqueue(s5));   // older than sent

    session.close();
    session.join();
    assert(session.finished());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Projection
// ═══════════════════════════════════════════════════════════════════

void test_random_projector() {
    std::cout << "Testing RandomProjector..." << std::endl;

    const size_t dim = 64;
    RandomProjector p(dim, 42);
    assert(p.ready() && p.dimension() == dim);
    assert(std::string(p.name()) == "random");

    // Unit-length columns
    double sx = 0, sy = 0, sz = 0;
    for (size_t i = 0; i < dim; ++i) {
        Embedding e(dim, 0.0f);
        e[i] = 1.0f;
        Point3 q = p.project(e);
        sx += q.x * q.x;
        sy += q.y * q.y;
        sz += q.z * q.z;
    }
    assert(std::fabs(sx - 1.0) < 1e-4 && std::fabs(sy - 1.0) < 1e-4 && std::fabs(sz - 1.0) < 1e-4);

    // Same seed, same basis; another seed, another basis
    Embedding v = test_embedding(3.0f, dim);
    RandomProjector again(dim, 42);
    RandomProjector other(dim, 7);
    assert(same_point(p.project(v), again.project(v), 0.0f));
    assert(!same_point(p.project(v), other.project(v)));

    bool threw = false;
    try { RandomProjector bad(2, 1); } catch (const ConfigError&) { threw = true; }
    assert(threw);
    threw = false;
    try { make_projector(ProjectionKind::Pca, 0, 1); } catch (const ConfigError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_pca_projector() {
    std::cout << "Testing PcaProjector..." << std::endl;

    const size_t dim = 8;
    PcaProjector p(dim);
    assert(!p.ready());

    // Variance 100 : 25 : 1 along axes 0, 1, 2 around an offset mean
    std::vector<Embedding> samples;
    for (int i = 0; i < 60; ++i) {
        Embedding v(dim, 1.0f);
        v[0] += 10.0f * std::sin(0.7f * i);
        v[1] += 5.0f * std::cos(1.3f * i);
        v[2] += 1.0f * std::sin(2.9f * i + 1.0f);
        samples.push_back(v);
    }

    p.prepare({samples[0], samples[1]});
    assert(!p.ready());   // too few

    p.prepare(samples);
    assert(p.ready());
    assert(std::fabs(p.axes()[0][0]) > 0.95f);
    assert(std::fabs(p.axes()[1][1]) > 0.95f);
    assert(std::fabs(p.axes()[2][2]) > 0.95f);
    for (size_t i = 3; i < dim; ++i) assert(near(p.mean()[i], 1.0f));

    // Frozen after the first fit
    Point3 before = p.project(samples[5]);
    std::vector<Embedding> shifted(10, Embedding(dim, 50.0f));
    p.prepare(shifted);
    assert(same_point(before, p.project(samples[5]), 0.0f));

    // Rank-deficient input still yields an orthonormal basis
    PcaProjector flat(dim);
    std::vector<Embedding> line;
    for (int i = 0; i < 5; ++i) {
        Embedding v(dim, 0.0f);
        v[4] = static_cast<float>(i);
        line.push_back(v);
    }
    flat.prepare(line);
    assert(flat.ready());
    for (size_t a = 0; a < 3; ++a) {
        for (size_t b = 0; b < 3; ++b) {
            float d = 0;
            for (size_t i = 0; i < dim; ++i) d += flat.axes()[a][i] * flat.axes()[b][i];
            assert(near(d, a == b ? 1.0f : 0.0f, 1e-3f));
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_projection_dropped_samples() {
    std::cout << "Testing projection drops mismatched samples..." << std::endl;

    FakeVectors vectors;
    vectors.samples["memories"] = {
        sample("a", test_embedding(1.0f)),
        sample("b", test_embedding(2.0f)),
        sample("short", test_embedding(3.0f, EMBED_DIM - 1)),
    };
    ProjectionEngine engine(ProjectionConfig{}, vectors);
    assert(engine.current() == nullptr);

    assert(engine.refresh());
    auto cloud = engine.current();
    assert(cloud);
    assert(cloud->points.size() == 2);
    assert(cloud->dropped == 1);
    assert(engine.stats().dropped_samples == 1);
    assert(cloud->points[0].id == "a" && cloud->points[1].id == "b");

    std::cout << "  PASS" << std::endl;
}

void test_projection_stability() {
    std::cout << "Testing projection stability..." << std::endl;

    FakeVectors vectors;
    ManualClock clock;
    for (int i = 0; i < 6; ++i) {
        vectors.samples["memories"].push_back(
            sample("m" + std::to_string(i), test_embedding(static_cast<float>(i))));
    }
    SnapshotStore store;
    ProjectionEngine engine(ProjectionConfig{}, vectors);
    engine.set_clock(clock.fn());
    BroadcastHub hub(HubConfig{}, store);
    Gateway gateway(ephemeral_gateway(), store, engine, hub);
    assert(gateway.start());
    httplib::Client client("127.0.0.1", gateway.port());

    auto empty = client.Get("/vectors");
    assert(empty && empty->status == 503);

    assert(engine.refresh());
    auto r1 = client.Get("/vectors");
    auto r2 = client.Get("/vectors");
    assert(r1 && r2 && r1->status == 200);
    json j1 = json::parse(r1->body);
    json j2 = json::parse(r2->body);
    assert(j1["anchors"] == j2["anchors"]);
    assert(j1["anchors"].size() == 4);
    assert(j1["projection_type"] == "random");
    assert(j1["points"].size() == 6);
    assert(j1["points"][0].contains("age_seconds"));

    // No anchor embeddings stored: canonical positions
    auto first = engine.current();
    for (size_t i = 0; i < 4; ++i) {
        assert(first->anchors[i].label == law_anchors()[i].label);
        assert(first->anchors[i].law == static_cast<int>(i));
        assert(same_point(first->anchors[i].position, law_anchors()[i].canonical, 0.0f));
    }

    // Many refreshes over an unchanged population
    for (int k = 0; k < 10; ++k) {
        clock.advance(2000);
        assert(engine.refresh());
    }
    auto later = engine.current();
    assert(later->generated_at > first->generated_at);
    for (size_t i = 0; i < 4; ++i) {
        assert(same_point(later->anchors[i].position, first->anchors[i].position, 0.0f));
    }
    for (size_t i = 0; i < first->points.size(); ++i) {
        assert(same_point(later->points[i].position, first->points[i].position, 1e-6f));
    }
    gateway.stop();

    std::cout << "  PASS" << std::endl;
}

void test_projection_anchors() {
    std::cout << "Testing projection anchors..." << std::endl;

    FakeVectors vectors;
    vectors.samples["memories"] = {sample("m", test_embedding(1.0f))};
    Embedding humanity = test_embedding(11.0f);
    Embedding obey = test_embedding(22.0f);
    vectors.samples["anchors"] = {
        sample("x", humanity, json{{"label", "Law 0: Humanity"}}),
        sample("y", obey, json{{"law", 2}}),
        sample("z", test_embedding(33.0f, 10), json{{"law", 3}}),   // wrong dimension
    };
    vectors.failing.insert("anchors");

    ProjectionEngine engine(ProjectionConfig{}, vectors);

    // Unreachable anchors: nothing published, retried next refresh
    assert(!engine.refresh());
    assert(engine.current() == nullptr);
    assert(engine.stats().stale && engine.stats().failures == 1);

    {
        std::lock_guard<std::mutex> lock(vectors.mutex);
        vectors.failing.clear();
    }
    assert(engine.refresh());
    assert(!engine.stats().stale);

    RandomProjector reference(EMBED_DIM, 42);
    auto cloud = engine.current();
    assert(same_point(cloud->anchors[0].position, reference.project(humanity)));
    assert(same_point(cloud->anchors[1].position, law_anchors()[1].canonical, 0.0f));
    assert(same_point(cloud->anchors[2].position, reference.project(obey)));
    assert(same_point(cloud->anchors[3].position, law_anchors()[3].canonical, 0.0f));

    // Cached for the life of the basis
    {
        std::lock_guard<std::mutex> lock(vectors.mutex);
        vectors.samples["anchors"][0].vector = test_embedding(99.0f);
    }
    assert(engine.refresh());
    assert(same_point(engine.current()->anchors[0].position, cloud->anchors[0].position, 0.0f));

    // Until reset
    engine.reset();
    assert(engine.current() == nullptr);
    assert(engine.refresh());
    assert(same_point(engine.current()->anchors[0].position,
                      reference.project(test_embedding(99.0f))));

    std::cout << "  PASS" << std::endl;
}

void test_projection_payload_fields() {
    std::cout << "Testing projection salience and age..." << std::endl;

    FakeVectors vectors;
    ManualClock clock;
    vectors.samples["memories"] = {
        sample("old", test_embedding(1.0f),
               json{{"semantic_salience", 0.8}, {"encoded_at", format_rfc3339(clock.t - 30000)}}),
        sample("bare", test_embedding(2.0f)),
        sample("odd", test_embedding(3.0f),
               json{{"semantic_salience", "high"}, {"encoded_at", "last week"}}),
    };
    ProjectionEngine engine(ProjectionConfig{}, vectors);
    engine.set_clock(clock.fn());
    assert(engine.refresh());

    auto cloud = engine.current();
    assert(cloud->generated_at == clock.t.load());
    assert(near(cloud->points[0].salience, 0.8f));
    assert(std::fabs(cloud->points[0].age_seconds - 30.0) < 1e-6);
    assert(near(cloud->points[1].salience, 0.5f) && cloud->points[1].age_seconds == 0.0);
    assert(near(cloud->points[2].salience, 0.5f) && cloud->points[2].age_seconds == 0.0);

    json j = *cloud;
    assert(j["points"][0]["id"] == "old");
    assert(j["generated_at"] == format_rfc3339(clock.t.load()));
    assert(j["dropped"] == 0);

    // Unreachable store keeps the previous cloud
    vectors.set_fail(true);
    assert(!engine.refresh());
    assert(engine.current() == cloud);

    std::cout << "  PASS" << std::endl;
}

void test_projection_pca_engine() {
    std::cout << "Testing PCA projection engine..." << std::endl;

    FakeVectors vectors;
    ProjectionConfig cfg;
    cfg.kind = ProjectionKind::Pca;
    ProjectionEngine engine(cfg, vectors);

    vectors.samples["memories"] = {sample("a", test_embedding(1.0f)),
                                   sample("b", test_embedding(2.0f))};
    assert(!engine.refresh());   // basis waits for enough samples
    assert(engine.current() == nullptr);

    vectors.samples["memories"].push_back(sample("c", test_embedding(5.0f)));
    vectors.samples["memories"].push_back(sample("d", test_embedding(9.0f)));
    assert(engine.refresh());
    auto cloud = engine.current();
    assert(cloud->projection_type == "pca");
    assert(cloud->points.size() == 4);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Store adapters against scripted servers
// ═══════════════════════════════════════════════════════════════════

void test_redis_stream_store() {
    std::cout << "Testing RedisStreamStore..." << std::endl;

    std::string thought = R"({"importance":0.7,"valence":0.1,"arousal":0.6})";
    std::string actor = R"({"alive":true,"restart_count":2})";
    ScriptedServer server([&](const std::string& buf) -> std::optional<std::string> {
        auto args = resp_command(buf);
        if (!args) return std::nullopt;
        const std::string& cmd = (*args)[0];
        if (cmd == "XLEN" && args->size() == 2 && (*args)[1] == "daneel:stream:awake") {
            return std::string(":42\r\n");
        }
        if (cmd == "XREVRANGE") {
            assert(args->size() == 6);
            assert((*args)[2] == "+" && (*args)[3] == "-" && (*args)[5] == "20");
            return "*3\r\n"
                   "*2\r\n" + bulk("1700000000002-0") +
                   "*4\r\n" + bulk("content") + bulk("hello") + bulk("salience") + bulk(thought) +
                   "*2\r\n" + bulk("1700000000001-0") +
                   "*2\r\n" + bulk("content") + bulk("no salience") +
                   "*2\r\n" + bulk("1700000000000-0") + "*-1\r\n";
        }
        if (cmd == "HGETALL" && (*args)[1] == "daneel:actors") {
            return "*2\r\n" + bulk("MemoryActor") + bulk(actor);
        }
        return std::string("-ERR unknown command\r\n");
    });

    RedisStreamStore store(Endpoint{"127.0.0.1", server.port()}, 1000);
    auto reading = store.read("daneel:stream:awake", "daneel:actors", 20);
    assert(reading);
    assert(reading->length == 42);
    assert(reading->entries.size() == 3);
    assert(reading->entries[0].id == "1700000000002-0");
    assert(reading->entries[0].fields.at("content") == "hello");
    assert(reading->entries[2].fields.empty());   // trimmed entry keeps its slot
    assert(reading->actors.at("MemoryActor") == actor);

    auto t = parse_thought(reading->entries[0], 0);
    assert(t && near(t->summary.salience, 0.7f));
    assert(!parse_thought(reading->entries[1], 0));
    assert(!parse_thought(reading->entries[2], 0));

    // The pooled connection serves the next read too
    assert(store.read("daneel:stream:awake", "daneel:actors", 20));
    assert(eventually([&] { return server.served() == 6; }));

    // Nobody listening: unavailable, never a throw
    uint16_t closed_port;
    {
        TcpListener gone;
        assert(gone.listen("127.0.0.1", 0));
        closed_port = gone.port();
    }
    RedisStreamStore down(Endpoint{"127.0.0.1", closed_port}, 100);
    assert(!down.read("s", "a", 20));
    assert(!down.last_error().empty());

    std::cout << "  PASS" << std::endl;
}

void test_redis_error_reply() {
    std::cout << "Testing RedisStreamStore error replies..." << std::endl;

    ScriptedServer server([](const std::string& buf) -> std::optional<std::string> {
        if (!resp_command(buf)) return std::nullopt;
        return std::string("-WRONGTYPE Operation against a key holding the wrong kind of value\r\n");
    });

    RedisStreamStore store(Endpoint{"127.0.0.1", server.port()}, 1000);
    assert(!store.read("s", "a", 20));
    assert(store.last_error().find("WRONGTYPE") != std::string::npos);
    assert(eventually([&] { return server.served() == 1; }));

    std::cout << "  PASS" << std::endl;
}

// Qdrant REST stand-in on an ephemeral port
class FakeQdrant {
public:
    FakeQdrant() {
        server_.Get("/collections/memories", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"result":{"status":"green","points_count":7},"status":"ok"})",
                            "application/json");
        });
        server_.Get("/collections/unconscious", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content(R"({"status":{"error":"Not found"}})", "application/json");
        });
        server_.Post("/collections/identity/points",
                     [](const httplib::Request& req, httplib::Response& res) {
            json body = json::parse(req.body);
            assert(body["ids"][0] == IDENTITY_POINT_ID);
            res.set_content(R"({"result":[{"id":"00000000-0000-0000-0000-000000000001",)"
                            R"("payload":{"lifetime_thought_count":1234,"restart_count":3,)"
                            R"("lifetime_dream_count":9}}],"status":"ok"})",
                            "application/json");
        });
        server_.Post("/collections/memories/points/scroll",
                     [](const httplib::Request& req, httplib::Response& res) {
            json body = json::parse(req.body);
            assert(body["limit"] == 2 && body["with_vector"] == true);
            std::string payload =
                R"({"result":{"points":[)"
                R"({"id":1,"vector":[0.1,0.2,0.3],"payload":{"semantic_salience":0.9}},)"
                R"({"id":"abc","vector":{"text":[1,2,3]},"payload":{}}],"next_page_offset":null}})";
            // Chunked, split mid-body
            res.set_chunked_content_provider("application/json",
                [payload](size_t, httplib::DataSink& sink) {
                    sink.write(payload.data(), 20);
                    sink.write(payload.data() + 20, payload.size() - 20);
                    sink.done();
                    return true;
                });
        });
        server_.Get("/collections/broken", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
            res.set_content(R"({"status":{"error":"unexpected"}})", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        assert(port_ > 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeQdrant() {
        server_.stop();
        thread_.join();
    }

    uint16_t port() const { return static_cast<uint16_t>(port_); }

private:
    httplib::Server server_;
    int port_ = -1;
    std::thread thread_;
};

void test_qdrant_vector_store() {
    std::cout << "Testing QdrantVectorStore..." << std::endl;

    FakeQdrant server;
    QdrantVectorStore store(Endpoint{"127.0.0.1", server.port()}, 1000);

    assert(store.count("memories") == uint64_t(7));
    assert(store.count("unconscious") == uint64_t(0));   // 404 reads as empty

    auto id = store.identity("identity");
    assert(id);
    assert(id->lifetime_thoughts == 1234 && id->restart_count == 3 && id->lifetime_dreams == 9);

    auto samples = store.scroll("memories", 2);
    assert(samples && samples->size() == 2);
    assert((*samples)[0].id == "1");
    assert((*samples)[0].vector.size() == 3 && near((*samples)[0].vector[2], 0.3f));
    assert((*samples)[0].payload["semantic_salience"] == 0.9);
    assert((*samples)[1].id == "abc" && (*samples)[1].vector.size() == 3);

    // Server error is an unavailable source
    assert(!store.count("broken"));
    assert(store.last_error().find("500") != std::string::npos);

    // Nobody listening
    uint16_t closed_port;
    {
        TcpListener gone;
        assert(gone.listen("127.0.0.1", 0));
        closed_port = gone.port();
    }
    QdrantVectorStore down(Endpoint{"127.0.0.1", closed_port}, 100);
    assert(!down.count("memories"));
    assert(!down.last_error().empty());

    assert(extract_vector(json::array({1, "x"})).empty());
    assert(extract_vector(json("nope")).empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Gateway
// ═══════════════════════════════════════════════════════════════════

void test_gateway_routing() {
    std::cout << "Testing Gateway routing..." << std::endl;

    SnapshotStore store;
    FakeVectors vectors;
    ProjectionEngine projection(ProjectionConfig{}, vectors);
    BroadcastHub hub(HubConfig{}, store);
    Gateway gateway(ephemeral_gateway(), store, projection, hub);
    assert(gateway.start());
    assert(gateway.port() != 0 && gateway.ws_port() != 0);
    assert(gateway.port() != gateway.ws_port());

    httplib::Client client("127.0.0.1", gateway.port());

    // Health never depends on the stores
    auto health = client.Get("/health");
    assert(health && health->status == 200);
    json h = json::parse(health->body);
    assert(h["status"] == "ok");
    assert(h["service"] == "sakshi");
    assert(h["version"] == version::software());
    assert(h["sessions"] == 0);
    assert(h["ws_port"] == gateway.ws_port());
    assert(health->get_header_value("Access-Control-Allow-Origin") == "*");
    assert(health->get_header_value("Cache-Control") == "no-store");

    auto head = client.Head("/health?x=1");
    assert(head && head->status == 200);

    auto missing = client.Get("/nowhere");
    assert(missing && missing->status == 404);
    assert(json::parse(missing->body)["error"] == "not found");

    auto post = client.Post("/metrics", "{}", "application/json");
    assert(post && post->status == 405);
    assert(post->get_header_value("Allow") == "GET");
    auto del = client.Delete("/health");
    assert(del && del->status == 405);

    // Upgrades belong on the push port
    auto plain_ws = client.Get("/ws");
    assert(plain_ws && plain_ws->status == 426);
    assert(plain_ws->get_header_value("Upgrade") == "websocket");
    assert(json::parse(plain_ws->body)["ws_port"] == gateway.ws_port());

    // Push port refusals
    auto refused = [&](const std::string& request) {
        TestClient raw;
        assert(raw.connect(gateway.ws_port()));
        assert(raw.write(request));
        return reply_status(raw.read_to_close());
    };
    assert(refused("NONSENSE\r\n\r\n") == 400);
    assert(refused("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n") == 404);
    assert(refused("POST /ws HTTP/1.1\r\nHost: x\r\n\r\n") == 405);
    assert(refused("GET /ws HTTP/1.1\r\nHost: x\r\n\r\n") == 426);
    assert(refused("GET /ws HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n") == 400);
    assert(hub.session_count() == 0);

    gateway.stop();
    assert(!gateway.running());

    std::cout << "  PASS" << std::endl;
}

void test_gateway_end_to_end() {
    std::cout << "Testing Gateway over TCP..." << std::endl;

    SnapshotStore store;
    FakeVectors vectors;
    ProjectionEngine projection(ProjectionConfig{}, vectors);
    BroadcastHub hub(HubConfig{1, 500}, store);
    GatewayConfig cfg = ephemeral_gateway();
    cfg.write_timeout_ms = 500;
    Gateway gateway(cfg, store, projection, hub);
    assert(gateway.start());

    auto first = publish_at(store, 1000);

    // Plain HTTP
    httplib::Client client("127.0.0.1", gateway.port());
    auto metrics = client.Get("/metrics");
    assert(metrics && metrics->status == 200 && metrics->body == first->json);

    // WebSocket
    TestClient conn;
    assert(conn.connect(gateway.ws_port()));
    std::string key = "dGhlIHNhbXBsZSBub25jZQ==";
    std::string handshake = "GET /ws HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\n"
                            "Connection: Upgrade\r\nSec-WebSocket-Key: " + key + "\r\n"
                            "Sec-WebSocket-Version: 13\r\n\r\n";
    assert(conn.write(handshake));

    std::string buf;
    Deadline deadline = deadline_after(2000);
    while (buf.find("\r\n\r\n") == std::string::npos) {
        assert(conn.read_some(buf, deadline) == IoResult::Ok);
    }
    size_t head_end = buf.find("\r\n\r\n") + 4;
    std::string head = buf.substr(0, head_end);
    buf.erase(0, head_end);
    assert(head.compare(0, 12, "HTTP/1.1 101") == 0);
    assert(head.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") != std::string::npos);

    // Current snapshot arrives without waiting for a tick
    ws::Frame frame;
    assert(read_frame(conn, buf, frame));
    assert(frame.opcode == ws::Opcode::Text && frame.payload == first->json);
    assert(eventually([&] { return hub.session_count() == 1; }));

    auto health = client.Get("/health");
    assert(health && json::parse(health->body)["sessions"] == 1);

    // Ping gets a pong; inbound text is ignored
    assert(conn.write(masked_frame(ws::Opcode::Text, "ignored")));
    assert(conn.write(masked_frame(ws::Opcode::Ping, "beat")));
    assert(read_frame(conn, buf, frame));
    assert(frame.opcode == ws::Opcode::Pong && frame.payload == "beat");

    auto second = publish_at(store, 2000);
    hub.on_tick(second);
    assert(read_frame(conn, buf, frame));
    assert(frame.opcode == ws::Opcode::Text && frame.payload == second->json);
    assert(json::parse(frame.payload)["timestamp"] == format_rfc3339(2000));

    // Close handshake ends the session
    assert(conn.write(masked_frame(ws::Opcode::Close, std::string("\x03\xE8", 2))));
    assert(read_frame(conn, buf, frame));
    assert(frame.opcode == ws::Opcode::Close);
    assert(eventually([&] { return hub.session_count() == 0; }));

    // A client that just disconnects is dropped too
    TestClient quiet;
    assert(quiet.connect(gateway.ws_port()));
    assert(quiet.write(handshake));
    assert(eventually([&] { return hub.session_count() == 1; }));
    quiet.close();
    assert(eventually([&] { return hub.session_count() == 0; }));

    gateway.stop();
    assert(!gateway.running());
    hub.stop();

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Sakshi Tests ===" << std::endl;
    std::cout << "EMBED_DIM = " << EMBED_DIM << std::endl;
    std::cout << std::endl;

    set_log_level(LogLevel::Error);

    test_rfc3339();
    test_url_parsing();
    test_upgrade_request_parsing();
    test_websocket_codec();
    test_config();

    std::cout << std::endl;
    std::cout << "=== Snapshot & Collector ===" << std::endl;
    test_emotional_derivation();
    test_thought_parsing();
    test_snapshot_json();
    test_collector_tick();
    test_metrics_bounds_and_order();
    test_metrics_idempotent();
    test_scenario_three_new_thoughts();
    test_degradation_stream_outage();
    test_degradation_vector_outage();
    test_malformed_thoughts();
    test_malformed_without_id();
    test_collector_tick_budget();
    test_non_utf8_content();
    test_collector_loop();

    std::cout << std::endl;
    std::cout << "=== Broadcast Hub ===" << std::endl;
    test_hub_register_sends_current();
    test_hub_fault_isolation();
    test_hub_backpressure();
    test_hub_write_failure();
    test_session_order();

    std::cout << std::endl;
    std::cout << "=== Projection ===" << std::endl;
    test_random_projector();
    test_pca_projector();
    test_projection_dropped_samples();
    test_projection_stability();
    test_projection_anchors();
    test_projection_payload_fields();
    test_projection_pca_engine();

    std::cout << std::endl;
    std::cout << "=== Stores & Gateway ===" << std::endl;
    test_redis_stream_store();
    test_redis_error_reply();
    test_qdrant_vector_store();
    test_gateway_routing();
    test_gateway_end_to_end();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
