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
#include <utility>

namespace hp {

enum class Errc {
    None,
    NotInitialized,       // no transport bound to the pipe
    NotReady,             // read before any request was dispatched
    InvalidVersion,       // HTTP version selector outside {0,1}
    InvalidArgumentCount, // request() target arguments out of range
    InvalidTarget,        // unparsable host/port/socket path
    Transport,            // connect/send/receive failure
    Closed,               // peer closed the connection
    Timeout,              // per-operation timeout expired
    MalformedStatusLine,  // message holds the raw line
    BadChunkSize,         // chunk-size line is not hex
    PrematureClose,       // body shorter than declared when the peer closed
    ShortRequestBody      // body producer ended before Content-Length was sent
};

// Failure detail filled by operations that return false.
struct Error {
    Errc        code = Errc::None;
    std::string message;

    bool failed() const { return code != Errc::None; }
    void set(Errc c, std::string msg) { code = c; message = std::move(msg); }
    void clear() { code = Errc::None; message.clear(); }
};

const char* errc_name(Errc c);

// "<errc_name>: <message>", for logs and the CLI.
std::string describe(const Error& e);

} // namespace hp
