#include <sakshi/gateway.hpp>
#include <sakshi/log.hpp>
#include <sakshi/version.hpp>
#include <httplib.h>
#include <sys/socket.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace sakshi {

using json = nlohmann::json;

namespace {

const char* JSON_TYPE = "application/json";

void set_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), JSON_TYPE);
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════════
// WebSocket channel
// ═══════════════════════════════════════════════════════════════════

bool WsChannel::send_text(const std::string& payload, int64_t timeout_ms) {
    if (closed_) return false;
    std::string frame = ws::text_frame(payload);
    std::string error;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        ok = send_all(socket_->fd(), frame.data(), frame.size(),
                      deadline_after(timeout_ms), error);
    }
    if (!ok) {
        log_debug("gateway", "ws fd=%d write failed: %s", socket_->fd(), error.c_str());
        // Lets the poll loop see the hangup
        close();
    }
    return ok;
}

bool WsChannel::send_control(const std::string& frame, int64_t timeout_ms) {
    if (closed_) return false;
    std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    std::string error;
    return send_all(socket_->fd(), frame.data(), frame.size(),
                    deadline_after(timeout_ms), error);
}

void WsChannel::close() {
    if (closed_.exchange(true)) return;
    socket_->shutdown();
}

// ═══════════════════════════════════════════════════════════════════
// Gateway
// ═══════════════════════════════════════════════════════════════════

Gateway::Gateway(GatewayConfig config,
                 SnapshotStore& store,
                 ProjectionEngine& projection,
                 BroadcastHub& hub)
    : config_(std::move(config))
    , store_(store)
    , projection_(projection)
    , hub_(hub)
    , started_at_(std::chrono::steady_clock::now())
{}

Gateway::~Gateway() {
    stop();
}

bool Gateway::start() {
    if (running_) return true;  // Already running

    http_ = std::make_unique<httplib::Server>();
    configure_routes(*http_);

    int bound = -1;
    if (config_.port == 0) {
        bound = http_->bind_to_any_port(config_.bind_address);
    } else if (http_->bind_to_port(config_.bind_address, config_.port)) {
        bound = config_.port;
    }
    if (bound < 0) {
        last_error_ = "cannot bind HTTP port " + std::to_string(config_.port);
        log_error("gateway", "%s on %s", last_error_.c_str(), config_.bind_address.c_str());
        http_.reset();
        return false;
    }
    http_port_ = static_cast<uint16_t>(bound);

    if (!listener_.listen(config_.bind_address, config_.ws_port)) {
        last_error_ = listener_.last_error();
        log_error("gateway", "ws listen on %s:%u failed: %s",
                  config_.bind_address.c_str(), config_.ws_port, last_error_.c_str());
        http_.reset();
        http_port_ = 0;
        return false;
    }

    running_ = true;
    http_thread_ = std::thread([this]() {
        http_->listen_after_bind();
    });
    thread_ = std::thread([this]() {
        run_loop();
    });
    http_->wait_until_ready();

    log_info("gateway", "listening on http://%s:%u, push channel ws://%s:%u/ws",
             config_.bind_address.c_str(), http_port_,
             config_.bind_address.c_str(), listener_.port());
    return true;
}

void Gateway::stop() {
    if (!running_.exchange(false)) return;  // Not running

    http_->stop();
    if (http_thread_.joinable()) {
        http_thread_.join();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    for (auto& conn : connections_) {
        close_connection(conn);
    }
    connections_.clear();
    connection_count_ = 0;
    listener_.close();
    http_.reset();
    log_info("gateway", "stopped");
}

void Gateway::run_loop() {
    while (running_) {
        poll_once(POLL_TIMEOUT_MS);
    }
}

json Gateway::health() const {
    auto up = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();
    return json{
        {"status", "ok"},
        {"service", SAKSHI_SERVICE_NAME},
        {"version", version::software()},
        {"uptime_seconds", up},
        {"sessions", hub_.session_count()},
        {"ws_port", ws_port()}
    };
}

void Gateway::configure_routes(httplib::Server& server) {
    server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Cache-Control", "no-store"}
    });

    // Health never depends on the stores
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        set_json(res, 200, health());
    });

    server.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        auto current = store_.current();
        if (!current) {
            set_json(res, 503, json{{"status", "initializing"}});
            return;
        }
        res.set_content(current->json, JSON_TYPE);
    });

    server.Get("/vectors", [this](const httplib::Request&, httplib::Response& res) {
        auto cloud = projection_.current();
        if (!cloud) {
            set_json(res, 503, json{{"status", "initializing"}});
            return;
        }
        set_json(res, 200, json(*cloud));
    });

    // The push channel lives on its own port
    server.Get("/ws", [this](const httplib::Request&, httplib::Response& res) {
        res.set_header("Upgrade", "websocket");
        set_json(res, 426, json{
            {"error", "websocket upgrade required"},
            {"ws_port", ws_port()}
        });
    });

    // Read-only surface
    auto refuse = [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Allow", "GET");
        set_json(res, 405, json{{"error", "method not allowed"}});
    };
    server.Post(".*", refuse);
    server.Put(".*", refuse);
    server.Patch(".*", refuse);
    server.Delete(".*", refuse);
    server.Options(".*", refuse);

    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) {
            set_json(res, 404, json{{"error", "not found"}});
        }
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log_debug("gateway", "%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });
}

void Gateway::poll_once(int timeout_ms) {
    // Build poll fd array
    std::vector<pollfd> fds;
    fds.reserve(1 + connections_.size());
    fds.push_back({listener_.fd(), POLLIN, 0});
    for (const auto& conn : connections_) {
        short events = POLLIN;
        if (!conn.write_buffer.empty()) events |= POLLOUT;
        fds.push_back({conn.socket->fd(), events, 0});
    }

    int ret = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            log_error("gateway", "poll() error: %s", strerror(errno));
        }
        return;
    }
    if (ret == 0) return;  // Timeout

    // Connections accepted now are polled next round
    size_t polled = connections_.size();

    if (fds[0].revents & POLLIN) {
        accept_new_connections();
    }

    for (size_t i = 1; i < fds.size() && i - 1 < polled; ++i) {
        auto& conn = connections_[i - 1];
        if (conn.wants_close) continue;

        if (fds[i].revents & POLLIN) {
            char buf[4096];
            ssize_t n = ::recv(conn.socket->fd(), buf, sizeof(buf), 0);
            if (n > 0) {
                conn.read_buffer.append(buf, static_cast<size_t>(n));
                if (conn.session) {
                    process_frames(conn);
                } else if (!conn.close_after_write) {
                    process_request(conn);
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
                conn.wants_close = true;
            }
        }

        if ((fds[i].revents & POLLOUT) && !conn.write_buffer.empty()) {
            ssize_t n = ::send(conn.socket->fd(), conn.write_buffer.data(),
                               conn.write_buffer.size(), MSG_NOSIGNAL);
            if (n > 0) {
                conn.write_buffer.erase(0, static_cast<size_t>(n));
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                conn.wants_close = true;
            }
        }
        if (conn.close_after_write && conn.write_buffer.empty()) {
            conn.wants_close = true;
        }

        if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            conn.wants_close = true;
        }
    }

    cleanup_closed_connections();
}

void Gateway::accept_new_connections() {
    while (true) {
        int client_fd = listener_.accept();
        if (client_fd < 0) {
            if (!listener_.last_error().empty()) {
                log_error("gateway", "accept() error: %s", listener_.last_error().c_str());
            }
            break;
        }

        auto socket = std::make_shared<Socket>(client_fd);
        if (connections_.size() >= MAX_CONNECTIONS) {
            log_warn("gateway", "max connections reached, rejecting fd=%d", client_fd);
            continue;
        }

        Connection conn;
        conn.socket = std::move(socket);
        connections_.push_back(std::move(conn));
        connection_count_ = connections_.size();
        log_debug("gateway", "client connected (fd=%d, total=%zu)",
                  client_fd, connections_.size());
    }
}

void Gateway::process_request(Connection& conn) {
    ws::UpgradeRequest request;
    size_t consumed = 0;
    ParseStatus st = ws::parse_upgrade_request(conn.read_buffer, request, consumed);
    if (st == ParseStatus::Incomplete) return;

    conn.close_after_write = true;
    if (st == ParseStatus::Malformed) {
        conn.write_buffer = ws::refusal(400, "Bad Request", R"({"error":"bad request"})");
        conn.read_buffer.clear();
        return;
    }

    conn.read_buffer.erase(0, consumed);
    if (request.path != "/ws") {
        conn.write_buffer = ws::refusal(404, "Not Found", R"({"error":"not found"})");
    } else if (request.method != "GET") {
        conn.write_buffer = ws::refusal(405, "Method Not Allowed",
                                        R"({"error":"method not allowed"})", "Allow: GET\r\n");
    } else if (!request.has_token("Upgrade", "websocket")) {
        conn.write_buffer = ws::refusal(426, "Upgrade Required",
                                        R"({"error":"websocket upgrade required"})",
                                        "Upgrade: websocket\r\n");
    } else if (!ws::is_upgrade(request)) {
        conn.write_buffer = ws::refusal(400, "Bad Request",
                                        R"({"error":"missing Sec-WebSocket-Key"})");
    } else {
        conn.close_after_write = false;
        upgrade(conn, request);
        return;
    }
    log_debug("gateway", "refused %s %s on the push port",
              request.method.c_str(), request.path.c_str());
}

void Gateway::upgrade(Connection& conn, const ws::UpgradeRequest& request) {
    std::string response = ws::handshake_response(*request.header("Sec-WebSocket-Key"));

    // The handshake must precede the first pushed frame
    std::string error;
    if (!send_all(conn.socket->fd(), response.data(), response.size(),
                  deadline_after(config_.write_timeout_ms), error)) {
        log_debug("gateway", "handshake write failed: %s", error.c_str());
        conn.wants_close = true;
        return;
    }

    conn.channel = std::make_shared<WsChannel>(conn.socket);
    conn.session = hub_.register_session(std::make_unique<WsSessionWriter>(conn.channel));
    if (conn.session == 0) {
        conn.wants_close = true;
        return;
    }

    // Anything after the handshake is already frame data
    if (!conn.read_buffer.empty()) process_frames(conn);
}

void Gateway::process_frames(Connection& conn) {
    size_t pos = 0;
    while (!conn.wants_close) {
        ws::Frame frame;
        ParseStatus st = ws::parse_frame(conn.read_buffer, pos, frame);
        if (st == ParseStatus::Incomplete) break;
        if (st == ParseStatus::Malformed) {
            log_debug("gateway", "session %llu sent a malformed frame",
                      static_cast<unsigned long long>(conn.session));
            conn.wants_close = true;
            break;
        }

        switch (frame.opcode) {
            case ws::Opcode::Ping:
                conn.channel->send_control(ws::encode_frame(ws::Opcode::Pong, frame.payload),
                                           config_.write_timeout_ms);
                break;
            case ws::Opcode::Close:
                // Echo the status code, then drop the session
                conn.channel->send_control(
                    ws::encode_frame(ws::Opcode::Close, frame.payload.substr(0, 2)),
                    config_.write_timeout_ms);
                conn.wants_close = true;
                break;
            default:
                // Inbound data carries no meaning
                break;
        }
    }
    conn.read_buffer.erase(0, pos);
}

void Gateway::close_connection(Connection& conn) {
    if (conn.session) {
        hub_.unregister(conn.session);
        conn.session = 0;
    }
    if (conn.channel) {
        conn.channel->close();
    } else {
        conn.socket->shutdown();
    }
}

void Gateway::cleanup_closed_connections() {
    for (auto& conn : connections_) {
        if (conn.wants_close) {
            log_debug("gateway", "client disconnected (fd=%d)", conn.socket->fd());
            close_connection(conn);
        }
    }
    auto it = std::remove_if(connections_.begin(), connections_.end(),
        [](const Connection& conn) { return conn.wants_close; });
    connections_.erase(it, connections_.end());
    connection_count_ = connections_.size();
}

} // namespace sakshi
