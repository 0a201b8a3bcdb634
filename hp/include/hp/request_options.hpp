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
#include <vector>
#include <utility>
#include <optional>
#include <functional>
#include <cstdint>
#include "hp/types.hpp"
#include "hp/error.hpp"
#include "hp/header_map.hpp"

namespace hp {

// Pulls the next slice of a streamed request body into `chunk`.
// Returns false once the producer has nothing more to give.
using BodyProducer = std::function<bool(std::string& chunk)>;

// Where a pipe connects: host + port, or a UNIX-domain socket path.
struct Endpoint {
    std::string   host;
    std::uint16_t port = 80;
    std::string   unix_path;   // non-empty selects AF_UNIX

    bool is_unix() const { return !unix_path.empty(); }
    // Identity of the connection inside the keepalive pool.
    std::string pool_key() const;
};

// Build an Endpoint from positional request() arguments:
//   {"host"} | {"host", "port"} | {"unix:/path/to/socket"}
// The options argument counts as the third one, so more than two address
// arguments fails with Errc::InvalidArgumentCount.
bool parse_endpoint(const std::vector<std::string>& args, Endpoint& out, Error& err);

// Pool parameters used when a finished connection is kept alive.
struct KeepaliveOptions {
    int max_idle_ms = 60000;   // drop the idle socket after this long
    int pool_size   = 30;      // max idle sockets per endpoint
};

// Per-request options. Per-instance; not shared between pipes.
struct RequestOptions {
    // Request line
    std::string method = "GET";
    std::string path   = "/";
    std::vector<std::pair<std::string,std::string>> query_args; // encoded in order
    std::optional<std::string> query;  // pre-encoded, wins over query_args
    int version = 1;                   // 1 -> HTTP/1.1, 0 -> HTTP/1.0

    HeaderMap headers;

    // Body: a literal string or a producer. Content-Length must be set by
    // the caller when using a producer.
    std::optional<std::string> body;
    BodyProducer body_producer;

    StreamMode stream = StreamMode::None;

    // Timeouts in milliseconds; 0 keeps the current transport timeout.
    int connect_timeout_ms = kDefaultConnectTimeoutMs;
    int send_timeout_ms    = 0;
    int read_timeout_ms    = 0;

    // Pool parameters applied when the response reaches eof.
    KeepaliveOptions keepalive;
};

} // namespace hp
