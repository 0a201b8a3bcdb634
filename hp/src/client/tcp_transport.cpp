// SPDX-License-Identifier: Apache-2.0
// Part of the HTTPipe (HP) project.
// hp/src/client/tcp_transport.cpp

#include "hp/internal/tcp_transport.hpp"
#include "hp/internal/socket_pool.hpp"
#include "hp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <limits>
#include <algorithm>

namespace hp::internal {

namespace {

constexpr std::size_t kRecvChunk = 16384;
constexpr std::size_t kMaxLine   = 1u << 20;

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

bool set_nonblocking(int s) {
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(s, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool peer_gone(int e) {
    return e == EPIPE || e == ECONNRESET || e == ENOTCONN;
}

// Wait for a non-blocking connect() to finish.
bool finish_connect(int s, int timeout_ms, Error& err) {
    struct pollfd pfd;
    pfd.fd      = s;
    pfd.events  = POLLOUT;
    pfd.revents = 0;

    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, timeout_ms > 0 ? timeout_ms : -1);
    } while (pr < 0 && errno == EINTR);

    if (pr == 0) { err.set(Errc::Timeout, "timeout"); return false; }
    if (pr < 0)  { err.set(Errc::Transport, std::strerror(errno)); return false; }

    int soerr = 0;
    socklen_t slen = sizeof(soerr);
    if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0) {
        err.set(Errc::Transport, std::strerror(errno));
        return false;
    }
    if (soerr != 0) {
        err.set(Errc::Transport, std::strerror(soerr));
        return false;
    }
    return true;
}

} // namespace

TcpTransport::~TcpTransport() {
    if (_fd >= 0) { ::close(_fd); _fd = -1; }
}

bool TcpTransport::connect(const Endpoint& ep, Error& err) {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
    _buf.clear();
    _key = ep.pool_key();

    int fd = -1, reused = 0;
    if (SocketPool::instance().acquire(_key, fd, reused)) {
        _fd = fd;
        _reused = reused;
        return true;
    }

    _reused = 0;
    return ep.is_unix() ? open_unix(ep, err) : open_tcp(ep, err);
}

bool TcpTransport::open_tcp(const Endpoint& ep, Error& err) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(ep.host.c_str(), std::to_string(ep.port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err.set(Errc::Transport, std::string("getaddrinfo failed: ") + gai_strerror(rc));
        hp::log_line("[TCP] " + err.message);
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(_timeout_ms > 0 ? _timeout_ms : 0);

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) {
            err.set(Errc::Transport, std::strerror(errno));
            continue;
        }
        if (!set_nonblocking(s)) {
            err.set(Errc::Transport, std::strerror(errno));
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            err.set(Errc::Transport, std::strerror(errno));
            ::close(s);
            continue;
        }
        if (ret < 0) {
            const int budget = _timeout_ms > 0 ? std::max(1, remaining_ms(deadline)) : 0;
            if (!finish_connect(s, budget, err)) {
                ::close(s);
                continue;
            }
        }

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        hp::log_line("[TCP] connect to " + _key + " failed: " + describe(err));
        return false;
    }

    err.clear();
    _fd = s_ok;
    return true;
}

bool TcpTransport::open_unix(const Endpoint& ep, Error& err) {
    struct sockaddr_un addr{};
    if (ep.unix_path.size() >= sizeof(addr.sun_path)) {
        err.set(Errc::InvalidTarget, "socket path too long");
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, ep.unix_path.c_str(), ep.unix_path.size() + 1);

    int s = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (s < 0) {
        err.set(Errc::Transport, std::strerror(errno));
        return false;
    }
    if (!set_nonblocking(s)) {
        err.set(Errc::Transport, std::strerror(errno));
        ::close(s);
        return false;
    }

    int ret = ::connect(s, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        err.set(Errc::Transport, std::strerror(errno));
        hp::log_line("[TCP] connect to " + _key + " failed: " + err.message);
        ::close(s);
        return false;
    }
    if (ret < 0 && !finish_connect(s, _timeout_ms, err)) {
        hp::log_line("[TCP] connect to " + _key + " failed: " + describe(err));
        ::close(s);
        return false;
    }

    _fd = s;
    return true;
}

bool TcpTransport::wait_fd(short events, Error& err) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(_timeout_ms > 0 ? _timeout_ms : 0);
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = events;

    int pr = 0;
    do {
        const int ms = _timeout_ms > 0 ? remaining_ms(deadline) : -1;
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);

    if (pr == 0) { err.set(Errc::Timeout, "timeout"); return false; }
    if (pr < 0)  { err.set(Errc::Transport, std::strerror(errno)); return false; }
    return true;
}

bool TcpTransport::send(const char* data, std::size_t len, Error& err) {
    if (_fd < 0) { err.set(Errc::Closed, "closed"); return false; }

    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, data + off, len - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_fd(POLLOUT, err)) return false;
            continue;
        }
        if (n < 0 && peer_gone(errno)) err.set(Errc::Closed, "closed");
        else err.set(Errc::Transport, n < 0 ? std::strerror(errno) : "send returned 0");
        return false;
    }
    return true;
}

bool TcpTransport::fill(Error& err) {
    if (_fd < 0) { err.set(Errc::Closed, "closed"); return false; }

    char buf[kRecvChunk];
    for (;;) {
        ssize_t n = ::recv(_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            _buf.append(buf, buf + n);
            return true;
        }
        if (n == 0) { err.set(Errc::Closed, "closed"); return false; }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_fd(POLLIN, err)) return false;
            continue;
        }
        if (peer_gone(errno)) err.set(Errc::Closed, "closed");
        else err.set(Errc::Transport, std::strerror(errno));
        return false;
    }
}

bool TcpTransport::receive(std::size_t len, std::string& out, Error& err) {
    out.clear();
    while (_buf.size() < len) {
        if (!fill(err)) {
            if (err.code == Errc::Closed) {
                out.swap(_buf);
                _buf.clear();
            }
            return false;
        }
    }
    out.assign(_buf, 0, len);
    _buf.erase(0, len);
    return true;
}

LineReader TcpTransport::receive_until(const std::string& delim) {
    return [this, delim](std::string& line, Error& err) {
        for (;;) {
            std::size_t p = _buf.find(delim);
            if (p != std::string::npos) {
                line.assign(_buf, 0, p);
                _buf.erase(0, p + delim.size());
                return true;
            }
            if (_buf.size() > kMaxLine) {
                err.set(Errc::Transport, "line too long");
                return false;
            }
            if (!fill(err)) return false;
        }
    };
}

bool TcpTransport::close(Error& err) {
    _buf.clear();
    if (_fd < 0) return true;

    const int fd = _fd;
    _fd = -1;
    if (::close(fd) < 0) {
        err.set(Errc::Transport, std::strerror(errno));
        return false;
    }
    return true;
}

bool TcpTransport::set_keepalive(const KeepaliveOptions& ka, Error& err) {
    if (_fd < 0) { err.set(Errc::Closed, "closed"); return false; }

    if (!_buf.empty()) {
        hp::log_line("[TCP] unread data on " + _key + ", closing instead of pooling");
        return close(err);
    }

    SocketPool::instance().release(_key, _fd, _reused, ka);
    _fd = -1;
    return true;
}

bool TcpTransport::get_reused_times(int& times, Error& err) const {
    (void)err;
    times = _reused;
    return true;
}

} // namespace hp::internal
