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
#include <functional>
#include <cstddef>
#include "hp/error.hpp"
#include "hp/request_options.hpp"

namespace hp {

// Reads the next line without its delimiter. Bound to one transport and
// reusable until that transport is closed.
using LineReader = std::function<bool(std::string& line, Error& err)>;

// Byte-stream connection driven by a Pipe. Every call may block up to the
// current timeout.
class Transport {
public:
    virtual ~Transport() = default;

    // Connect (or take an idle connection for `ep` from the keepalive pool).
    virtual bool connect(const Endpoint& ep, Error& err) = 0;

    virtual bool send(const char* data, std::size_t len, Error& err) = 0;

    // Read exactly `len` bytes into `out`. When the peer closes first the call
    // fails with Errc::Closed and `out` holds the bytes received before that.
    virtual bool receive(std::size_t len, std::string& out, Error& err) = 0;

    virtual LineReader receive_until(const std::string& delim) = 0;

    virtual void set_timeout(int ms) = 0;

    virtual bool close(Error& err) = 0;

    // Hand the connection to the keepalive pool; the transport is unbound after.
    virtual bool set_keepalive(const KeepaliveOptions& ka, Error& err) = 0;

    // How many times the current connection was taken from the pool.
    virtual bool get_reused_times(int& times, Error& err) const = 0;
};

} // namespace hp
