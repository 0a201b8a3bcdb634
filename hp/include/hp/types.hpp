/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>

namespace hp {

// Response streaming selected by the caller of Pipe::request().
enum class StreamMode {
    None,  // read and assemble the whole response
    Full,  // return right after sending; caller drives read()/read_body()
    Body   // parse status and headers, caller reads the body
};

// Parser state of a Pipe. Values are stable and index the handler table.
enum class State : int {
    NotReady      = 0,
    Begin         = 1,
    ReadingHeader = 2,
    ReadingBody   = 3,
    Eof           = 4
};

enum class EventType {
    StatusLine,
    Header,
    HeaderEnd,
    Body,
    BodyEnd,
    Eof
};

constexpr std::size_t kDefaultChunkSize = 8192;
constexpr int kDefaultConnectTimeoutMs  = 5000;

} // namespace hp
