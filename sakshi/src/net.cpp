#include <sakshi/net.hpp>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace sakshi {

int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool send_all(int fd, const char* data, size_t len, Deadline deadline, std::string& error) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int wait = remaining_ms(deadline);
            if (wait == 0) {
                error = "write timeout";
                return false;
            }
            pollfd pfd = {fd, POLLOUT, 0};
            int ret = ::poll(&pfd, 1, wait);
            if (ret < 0 && errno != EINTR) {
                error = std::string("poll() failed: ") + strerror(errno);
                return false;
            }
            if (ret > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                error = "peer hung up";
                return false;
            }
            continue;
        }
        error = std::string("send() failed: ") + strerror(errno);
        return false;
    }
    return true;
}

IoResult recv_some(int fd, std::string& out, Deadline deadline, std::string& error) {
    while (true) {
        char buf[8192];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            return IoResult::Ok;
        }
        if (n == 0) {
            error = "connection closed";
            return IoResult::Closed;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            error = std::string("recv() failed: ") + strerror(errno);
            return IoResult::Error;
        }

        int wait = remaining_ms(deadline);
        if (wait == 0) {
            error = "read timeout";
            return IoResult::Timeout;
        }
        pollfd pfd = {fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, wait);
        if (ret < 0 && errno != EINTR) {
            error = std::string("poll() failed: ") + strerror(errno);
            return IoResult::Error;
        }
        if (ret == 0) {
            error = "read timeout";
            return IoResult::Timeout;
        }
    }
}

Socket::~Socket() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Socket::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

TcpListener::~TcpListener() {
    close();
}

bool TcpListener::listen(const std::string& address, uint16_t port) {
    close();

    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }
    int one = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    set_nonblocking(fd_);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        last_error_ = "invalid listen address: " + address;
        close();
        return false;
    }

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("bind() failed: ") + strerror(errno);
        close();
        return false;
    }
    if (::listen(fd_, BACKLOG) < 0) {
        last_error_ = std::string("listen() failed: ") + strerror(errno);
        close();
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = port;
    }
    return true;
}

void TcpListener::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

int TcpListener::accept() {
    if (fd_ < 0) return -1;
    last_error_.clear();
    while (true) {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client >= 0) {
            set_nonblocking(client);
            int one = 1;
            setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            return client;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            last_error_ = std::string("accept() failed: ") + strerror(errno);
        }
        return -1;
    }
}

} // namespace sakshi
