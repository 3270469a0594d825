#pragma once
// Net: deadline-bounded socket primitives for the /ws listener
//
// Every blocking point waits in poll() against an absolute deadline, so
// no session can be stalled by a peer for longer than it budgeted.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sakshi {

using Deadline = std::chrono::steady_clock::time_point;

inline Deadline deadline_after(int64_t ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}

// Milliseconds left until deadline, never negative
int remaining_ms(Deadline deadline);

enum class IoResult {
    Ok,
    Closed,   // orderly EOF from peer
    Timeout,
    Error
};

bool set_nonblocking(int fd);

// Writes all of data or fails; never raises SIGPIPE
bool send_all(int fd, const char* data, size_t len, Deadline deadline, std::string& error);

// Appends whatever is readable once data arrives (waits up to deadline)
IoResult recv_some(int fd, std::string& out, Deadline deadline, std::string& error);

// Owns a connected socket; closes it on destruction
class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return fd_; }

    // Wakes any poller on this socket without releasing the descriptor
    void shutdown();

private:
    int fd_ = -1;
};

// Non-blocking IPv4 listener
class TcpListener {
public:
    static constexpr int BACKLOG = 64;

    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // port 0 binds an ephemeral port; see port()
    bool listen(const std::string& address, uint16_t port);
    void close();

    // Returns a non-blocking client fd, or -1 when nothing is pending
    int accept();

    int fd() const { return fd_; }
    uint16_t port() const { return port_; }
    const std::string& last_error() const { return last_error_; }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::string last_error_;
};

} // namespace sakshi
