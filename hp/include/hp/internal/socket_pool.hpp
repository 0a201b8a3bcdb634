/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstddef>
#include <unordered_map>
#include "hp/request_options.hpp"

namespace hp::internal {

// Process-wide store of idle keepalive sockets, keyed by Endpoint::pool_key().
class SocketPool {
public:
    static SocketPool& instance();

    SocketPool() = default;
    ~SocketPool();

    SocketPool(const SocketPool&) = delete;
    SocketPool& operator=(const SocketPool&) = delete;

    // Take the most recently released live socket for `key`.
    // `reused_times` is the socket's reuse count including this take.
    bool acquire(const std::string& key, int& fd, int& reused_times);

    // Park `fd` for later reuse. The oldest socket is closed when the pool
    // for `key` is full; pool_size <= 0 closes `fd` right away.
    void release(const std::string& key, int fd, int reused_times, const KeepaliveOptions& ka);

    // Close every idle socket.
    void clear();

    std::size_t count(const std::string& key) const;

private:
    struct Idle {
        int fd;
        int reused_times;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::unordered_map<std::string, std::deque<Idle>> _pools;
    mutable std::mutex _mtx;
};

} // namespace hp::internal
