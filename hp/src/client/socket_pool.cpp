// SPDX-License-Identifier: Apache-2.0
// Part of the HTTPipe (HP) project.
// hp/src/client/socket_pool.cpp

#include "hp/internal/socket_pool.hpp"
#include "hp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

namespace hp::internal {

namespace {

// An idle keepalive socket must have nothing to read: EOF or stray bytes
// mean the peer closed it or broke the protocol while it sat in the pool.
bool idle_socket_alive(int fd) {
    char c;
    ssize_t n = ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
}

} // namespace

SocketPool& SocketPool::instance() {
    static SocketPool pool;
    return pool;
}

SocketPool::~SocketPool() {
    clear();
}

bool SocketPool::acquire(const std::string& key, int& fd, int& reused_times) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _pools.find(key);
    if (it == _pools.end()) return false;

    auto& pool = it->second;
    const auto now = std::chrono::steady_clock::now();
    while (!pool.empty()) {
        Idle conn = pool.back();
        pool.pop_back();

        if (now >= conn.expires_at || !idle_socket_alive(conn.fd)) {
            ::close(conn.fd);
            continue;
        }
        fd = conn.fd;
        reused_times = conn.reused_times + 1;
        return true;
    }
    _pools.erase(it);
    return false;
}

void SocketPool::release(const std::string& key, int fd, int reused_times, const KeepaliveOptions& ka) {
    if (ka.pool_size <= 0) {
        ::close(fd);
        return;
    }

    std::lock_guard<std::mutex> lk(_mtx);
    auto& pool = _pools[key];
    while (pool.size() >= static_cast<std::size_t>(ka.pool_size)) {
        ::close(pool.front().fd);
        pool.pop_front();
        hp::log_line("[POOL] " + key + " full, evicted oldest idle socket");
    }

    const auto idle = std::chrono::milliseconds(ka.max_idle_ms > 0 ? ka.max_idle_ms : 60000);
    pool.push_back(Idle{fd, reused_times, std::chrono::steady_clock::now() + idle});
}

void SocketPool::clear() {
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto& kv : _pools) {
        for (auto& conn : kv.second) {
            ::close(conn.fd);
        }
    }
    _pools.clear();
}

std::size_t SocketPool::count(const std::string& key) const {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _pools.find(key);
    if (it == _pools.end()) return 0;
    return it->second.size();
}

} // namespace hp::internal
