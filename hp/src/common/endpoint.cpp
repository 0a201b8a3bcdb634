/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/request_options.hpp"
#include "hp/internal/utils.hpp"

namespace hp {

std::string Endpoint::pool_key() const {
    if (is_unix()) return "unix:" + unix_path;
    return host + ":" + std::to_string(port);
}

bool parse_endpoint(const std::vector<std::string>& args, Endpoint& out, Error& err) {
    const std::size_t n = args.size();
    if (n != 1 && n != 2) {
        err.set(Errc::InvalidArgumentCount,
                "expecting 1 or 2 target arguments plus options, but seen " + std::to_string(n));
        return false;
    }

    Endpoint ep;
    const std::string& target = args[0];
    if (n == 1 && target.compare(0, 5, "unix:") == 0) {
        ep.unix_path = target.substr(5);
        if (ep.unix_path.empty()) {
            err.set(Errc::InvalidTarget, "empty socket path");
            return false;
        }
        out = ep;
        return true;
    }

    if (target.empty()) {
        err.set(Errc::InvalidTarget, "empty host");
        return false;
    }
    ep.host = target;

    if (n == 2) {
        std::uint64_t port = 0;
        if (!internal::parse_decimal(args[1], port) || port == 0 || port > 65535) {
            err.set(Errc::InvalidTarget, "bad port: " + args[1]);
            return false;
        }
        ep.port = (std::uint16_t)port;
    }

    out = ep;
    return true;
}

} // namespace hp
