/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/error.hpp"

namespace hp {

const char* errc_name(Errc c) {
    switch (c) {
    case Errc::None:                 return "ok";
    case Errc::NotInitialized:       return "not initialized";
    case Errc::NotReady:             return "not ready";
    case Errc::InvalidVersion:       return "unknown HTTP version";
    case Errc::InvalidArgumentCount: return "invalid argument count";
    case Errc::InvalidTarget:        return "invalid target";
    case Errc::Transport:            return "transport error";
    case Errc::Closed:               return "closed";
    case Errc::Timeout:              return "timeout";
    case Errc::MalformedStatusLine:  return "malformed status line";
    case Errc::BadChunkSize:         return "bad chunk size";
    case Errc::PrematureClose:       return "premature close";
    case Errc::ShortRequestBody:     return "short request body";
    }
    return "unknown";
}

std::string describe(const Error& e) {
    std::string s = errc_name(e.code);
    if (!e.message.empty()) {
        s += ": ";
        s += e.message;
    }
    return s;
}

} // namespace hp
