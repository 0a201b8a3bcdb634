/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/pipe.hpp"
#include "hp/log.hpp"
#include "hp/internal/socket_pool.hpp"
#include "hp/internal/tcp_transport.hpp"

#include <gtest/gtest.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace hp;
using hp::internal::SocketPool;

namespace {

// Single-threaded scripted HTTP server on 127.0.0.1 or a UNIX socket.
// Connections are served one after the other; each request head gets the
// next scripted response. An empty response means "never answer".
class LoopbackServer {
public:
    explicit LoopbackServer(std::vector<std::string> responses,
                            bool close_after_each = false,
                            std::string unix_path = "")
        : _responses(std::move(responses)),
          _close_after_each(close_after_each),
          _unix_path(std::move(unix_path)) {}

    ~LoopbackServer() {
        _stop = true;
        if (_thread.joinable()) _thread.join();
        if (_lfd >= 0) ::close(_lfd);
        if (!_unix_path.empty()) ::unlink(_unix_path.c_str());
    }

    bool start() {
        if (_unix_path.empty()) {
            _lfd = ::socket(AF_INET, SOCK_STREAM, 0);
            if (_lfd < 0) return false;
            int one = 1;
            setsockopt(_lfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            if (::bind(_lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) return false;

            socklen_t len = sizeof(addr);
            if (getsockname(_lfd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return false;
            _port = ntohs(addr.sin_port);
        } else {
            ::unlink(_unix_path.c_str());
            _lfd = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (_lfd < 0) return false;

            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, _unix_path.c_str(), sizeof(addr.sun_path) - 1);
            if (::bind(_lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) return false;
        }
        if (::listen(_lfd, 8) < 0) return false;

        _thread = std::thread([this] { run(); });
        return true;
    }

    std::uint16_t port() const { return _port; }
    int accepts() const { return _accepts.load(); }

    std::vector<std::string> target() const {
        if (!_unix_path.empty()) return {"unix:" + _unix_path};
        return {"127.0.0.1", std::to_string(_port)};
    }

private:
    bool wait_readable(int fd) {
        while (!_stop) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            int pr = ::poll(&pfd, 1, 20);
            if (pr > 0) return true;
            if (pr < 0) return false;
        }
        return false;
    }

    void run() {
        while (!_stop && _next < _responses.size()) {
            if (!wait_readable(_lfd)) return;
            int c = ::accept(_lfd, nullptr, nullptr);
            if (c < 0) continue;
            _accepts++;
            serve(c);
            ::close(c);
        }
    }

    void serve(int c) {
        std::string in;
        while (_next < _responses.size()) {
            std::size_t end;
            while ((end = in.find("\r\n\r\n")) == std::string::npos) {
                if (!wait_readable(c)) return;
                char buf[4096];
                ssize_t n = ::recv(c, buf, sizeof(buf), 0);
                if (n <= 0) return;
                in.append(buf, buf + n);
            }
            in.erase(0, end + 4);

            const std::string& resp = _responses[_next++];
            if (resp.empty()) {
                while (!_stop) std::this_thread::sleep_for(std::chrono::milliseconds(10));
                return;
            }
            if (::send(c, resp.data(), resp.size(), MSG_NOSIGNAL) < 0) return;
            if (_close_after_each) return;
        }
    }

    std::vector<std::string> _responses;
    std::size_t _next = 0;
    bool _close_after_each;
    std::string _unix_path;
    int _lfd = -1;
    std::uint16_t _port = 0;
    std::atomic<bool> _stop{false};
    std::atomic<int> _accepts{0};
    std::thread _thread;
};

const char* const kOk = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok";

class TcpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_quiet(true);
        SocketPool::instance().clear();
    }
    void TearDown() override {
        SocketPool::instance().clear();
    }
};

} // namespace

TEST_F(TcpTransportTest, KeepaliveReusesConnection) {
    LoopbackServer server({kOk, kOk});
    ASSERT_TRUE(server.start());
    const std::string key = "127.0.0.1:" + std::to_string(server.port());

    Pipe pipe;
    HttpResponse resp;
    Error err;
    int times = -1;

    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "ok");
    ASSERT_TRUE(pipe.get_reused_times(times, err));
    EXPECT_EQ(times, 0);
    EXPECT_EQ(SocketPool::instance().count(key), 1u);

    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.body, "ok");
    ASSERT_TRUE(pipe.get_reused_times(times, err));
    EXPECT_EQ(times, 1);
    EXPECT_EQ(server.accepts(), 1);
}

TEST_F(TcpTransportTest, ConnectionCloseIsNotPooled) {
    const std::string resp_text = "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 2\r\n\r\nok";
    LoopbackServer server({resp_text, resp_text}, true);
    ASSERT_TRUE(server.start());
    const std::string key = "127.0.0.1:" + std::to_string(server.port());

    Pipe pipe;
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.body, "ok");
    EXPECT_EQ(SocketPool::instance().count(key), 0u);

    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    int times = -1;
    ASSERT_TRUE(pipe.get_reused_times(times, err));
    EXPECT_EQ(times, 0);
    EXPECT_EQ(server.accepts(), 2);
}

TEST_F(TcpTransportTest, ChunkedResponse) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n"});
    ASSERT_TRUE(server.start());

    Pipe pipe;
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.body, "hello world");
    EXPECT_TRUE(resp.eof);
    EXPECT_EQ(SocketPool::instance().count("127.0.0.1:" + std::to_string(server.port())), 1u);
}

TEST_F(TcpTransportTest, ReadTimeout) {
    LoopbackServer server({""});
    ASSERT_TRUE(server.start());

    Pipe pipe;
    RequestOptions opts;
    opts.read_timeout_ms = 100;
    HttpResponse resp;
    Error err;
    EXPECT_FALSE(pipe.request(server.target(), opts, resp, err));
    EXPECT_EQ(err.code, Errc::Timeout);
    EXPECT_EQ(err.message, "read status line failed: timeout");
    ASSERT_TRUE(pipe.close(err));
}

TEST_F(TcpTransportTest, ConnectionRefused) {
    int s = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(s, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(s, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    const std::uint16_t port = ntohs(addr.sin_port);
    ::close(s);

    Pipe pipe;
    HttpResponse resp;
    Error err;
    EXPECT_FALSE(pipe.request("127.0.0.1", port, RequestOptions{}, resp, err));
    EXPECT_EQ(err.code, Errc::Transport);
}

TEST_F(TcpTransportTest, UnixDomainSocket) {
    const std::string path = "/tmp/hp_test_" + std::to_string(::getpid()) + ".sock";
    LoopbackServer server({kOk}, false, path);
    ASSERT_TRUE(server.start());

    Pipe pipe;
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.body, "ok");
    EXPECT_EQ(SocketPool::instance().count("unix:" + path), 1u);
}

TEST_F(TcpTransportTest, UnreadDataIsNotPooled) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nokEXTRA"});
    ASSERT_TRUE(server.start());
    const std::string key = "127.0.0.1:" + std::to_string(server.port());

    Pipe pipe;
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "ok");
    EXPECT_TRUE(resp.eof);
    EXPECT_EQ(SocketPool::instance().count(key), 0u);
}

TEST_F(TcpTransportTest, StrayCrlfAfterBodyKeepsResponse) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\ntest\r\n"});
    ASSERT_TRUE(server.start());
    const std::string key = "127.0.0.1:" + std::to_string(server.port());

    Pipe pipe;
    HttpResponse resp;
    Error err;
    ASSERT_TRUE(pipe.request(server.target(), RequestOptions{}, resp, err)) << describe(err);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "test");
    EXPECT_EQ(SocketPool::instance().count(key), 0u);
}

TEST(SocketPoolTest, LifoAndEviction) {
    SocketPool pool;
    KeepaliveOptions ka;
    ka.pool_size = 2;

    int peers[3];
    int fds[3];
    for (int i = 0; i < 3; ++i) {
        int sv[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
        fds[i] = sv[0];
        peers[i] = sv[1];
    }
    pool.release("k", fds[0], 0, ka);
    pool.release("k", fds[1], 4, ka);
    pool.release("k", fds[2], 1, ka);
    EXPECT_EQ(pool.count("k"), 2u);

    int fd = -1, reused = -1;
    ASSERT_TRUE(pool.acquire("k", fd, reused));
    EXPECT_EQ(fd, fds[2]);
    EXPECT_EQ(reused, 2);
    ::close(fd);

    ASSERT_TRUE(pool.acquire("k", fd, reused));
    EXPECT_EQ(fd, fds[1]);
    EXPECT_EQ(reused, 5);
    ::close(fd);

    EXPECT_FALSE(pool.acquire("k", fd, reused));
    for (int p : peers) ::close(p);
}

TEST(SocketPoolTest, DropsDeadAndExpiredSockets) {
    SocketPool pool;
    KeepaliveOptions ka;

    int dead[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, dead), 0);
    pool.release("dead", dead[0], 0, ka);
    ::close(dead[1]);

    int fd = -1, reused = -1;
    EXPECT_FALSE(pool.acquire("dead", fd, reused));
    EXPECT_EQ(pool.count("dead"), 0u);

    int old[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, old), 0);
    ka.max_idle_ms = 1;
    pool.release("old", old[0], 0, ka);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(pool.acquire("old", fd, reused));
    ::close(old[1]);
}

TEST(SocketPoolTest, ZeroPoolSizeClosesImmediately) {
    SocketPool pool;
    KeepaliveOptions ka;
    ka.pool_size = 0;

    int sv[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    pool.release("k", sv[0], 0, ka);
    EXPECT_EQ(pool.count("k"), 0u);

    char c;
    EXPECT_EQ(::recv(sv[1], &c, 1, 0), 0);
    ::close(sv[1]);
}
