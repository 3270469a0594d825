#pragma once
// Gateway: HTTP and WebSocket front doors of the daemon
//
// /health, /metrics and /vectors are served by an httplib::Server from
// the current cells. The /ws push channel listens on its own port: a
// poll() loop completes the RFC 6455 handshake and turns each connection
// into a Broadcast Hub session. Neither side holds state of its own
// beyond connection buffers.

#include <sakshi/broadcast_hub.hpp>
#include <sakshi/net.hpp>
#include <sakshi/projection.hpp>
#include <sakshi/snapshot_store.hpp>
#include <sakshi/websocket.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace httplib {
class Server;
} // namespace httplib

namespace sakshi {

struct GatewayConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 3000;      // HTTP endpoints; 0 = ephemeral
    uint16_t ws_port = 3001;   // /ws push channel; 0 = ephemeral
    int64_t write_timeout_ms = 150;
};

// Write side of one upgraded connection, shared by the poll thread
// (control frames) and the session's send thread (snapshots)
class WsChannel {
public:
    explicit WsChannel(std::shared_ptr<Socket> socket) : socket_(std::move(socket)) {}

    // One text frame under the write lock; shuts the socket down on failure
    bool send_text(const std::string& payload, int64_t timeout_ms);

    // Control frame; skipped when a data frame is mid-write
    bool send_control(const std::string& frame, int64_t timeout_ms);

    void close();
    bool closed() const { return closed_; }
    int fd() const { return socket_->fd(); }

private:
    std::shared_ptr<Socket> socket_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

// SessionWriter over a WsChannel
class WsSessionWriter : public SessionWriter {
public:
    explicit WsSessionWriter(std::shared_ptr<WsChannel> channel) : channel_(std::move(channel)) {}

    bool write(const std::string& payload, int64_t timeout_ms) override {
        return channel_->send_text(payload, timeout_ms);
    }
    void close() override { channel_->close(); }
    std::string describe() const override {
        return "ws fd=" + std::to_string(channel_->fd());
    }

private:
    std::shared_ptr<WsChannel> channel_;
};

class Gateway {
public:
    static constexpr size_t MAX_CONNECTIONS = 256;
    static constexpr int POLL_TIMEOUT_MS = 100;

    Gateway(GatewayConfig config,
            SnapshotStore& store,
            ProjectionEngine& projection,
            BroadcastHub& hub);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Binds both listeners and starts their threads; false if either fails
    bool start();
    // Stops accepting, closes every connection, joins both threads
    void stop();
    bool running() const { return running_; }

    // Bound ports (port 0 resolved)
    uint16_t port() const { return http_port_; }
    uint16_t ws_port() const { return listener_.port(); }

    // Open /ws connections, upgraded or not
    size_t connection_count() const { return connection_count_; }

    const std::string& last_error() const { return last_error_; }

private:
    struct Connection {
        std::shared_ptr<Socket> socket;
        std::string read_buffer;
        std::string write_buffer;
        bool close_after_write = false;
        bool wants_close = false;
        SessionId session = 0;
        std::shared_ptr<WsChannel> channel;
    };

    void configure_routes(httplib::Server& server);
    nlohmann::json health() const;

    void run_loop();
    void poll_once(int timeout_ms);
    void accept_new_connections();
    void process_request(Connection& conn);
    void upgrade(Connection& conn, const ws::UpgradeRequest& request);
    void process_frames(Connection& conn);
    void close_connection(Connection& conn);
    void cleanup_closed_connections();

    GatewayConfig config_;
    SnapshotStore& store_;
    ProjectionEngine& projection_;
    BroadcastHub& hub_;

    std::unique_ptr<httplib::Server> http_;
    std::thread http_thread_;
    uint16_t http_port_ = 0;

    TcpListener listener_;
    std::vector<Connection> connections_;   // poll thread only
    std::atomic<size_t> connection_count_{0};
    std::chrono::steady_clock::time_point started_at_;
    std::string last_error_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace sakshi
