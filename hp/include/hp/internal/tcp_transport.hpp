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
#include <cstddef>
#include "hp/transport.hpp"

namespace hp::internal {

// RAII non-blocking TCP / UNIX-domain connection. Each call waits in poll()
// for at most the current timeout. Line and byte reads share one buffer.
class TcpTransport : public Transport {
public:
    TcpTransport() = default;
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    bool connect(const Endpoint& ep, Error& err) override;
    bool send(const char* data, std::size_t len, Error& err) override;
    bool receive(std::size_t len, std::string& out, Error& err) override;
    LineReader receive_until(const std::string& delim) override;
    void set_timeout(int ms) override { _timeout_ms = ms; }
    bool close(Error& err) override;
    bool set_keepalive(const KeepaliveOptions& ka, Error& err) override;

    // Reuse count of the connection most recently bound to this transport.
    bool get_reused_times(int& times, Error& err) const override;

    int fd() const { return _fd; }

private:
    bool open_tcp(const Endpoint& ep, Error& err);
    bool open_unix(const Endpoint& ep, Error& err);
    bool wait_fd(short events, Error& err);
    bool fill(Error& err);

    int _fd = -1;
    int _timeout_ms = 60000;
    int _reused = 0;
    std::string _key;
    std::string _buf;   // received, not yet consumed
};

} // namespace hp::internal
