/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/internal/http_encoder.hpp"
#include "hp/internal/http_parser.hpp"
#include "hp/internal/utils.hpp"

#include <sstream>
#include <cstdint>
#include <utility>

namespace hp::internal {

const char* const kUserAgent = "HTTPipe/0.4";

bool encode_request(const RequestOptions& opts, const std::string& host,
                    EncodedRequest& out, Error& err)
{
    if (opts.version != 0 && opts.version != 1) {
        err.set(Errc::InvalidVersion, "version " + std::to_string(opts.version));
        return false;
    }

    const std::string method = upper_copy(opts.method.empty() ? "GET" : opts.method);

    std::string path = opts.path.empty() ? "/" : opts.path;
    if (path[0] != '/') path = "/" + path;

    std::string query;
    if (opts.query) {
        query = *opts.query;
    } else if (!opts.query_args.empty()) {
        query = encode_args(opts.query_args);
    }

    HeaderMap headers;
    for (const auto& e : opts.headers) {
        headers.set(normalize_header(e.name), e.values);
    }

    if (opts.body) {
        headers.set("Content-Length", std::to_string(opts.body->size()));
    }

    if (method == "PUT" || method == "POST") {
        std::uint64_t len = 0;
        const auto cl = headers.get("Content-Length");
        if (!cl || !parse_decimal(*cl, len)) len = 0;
        headers.set("Content-Length", std::to_string(len));
    }

    if (!headers.has("Host"))       headers.set("Host", host);
    if (!headers.has("User-Agent")) headers.set("User-Agent", kUserAgent);
    if (!headers.has("Accept"))     headers.set("Accept", "*/*");

    if (opts.version == 0 && !headers.has("Connection")) {
        headers.set("Connection", "Keep-Alive");
    }

    std::ostringstream req;
    req << method << " " << escape_path(path);
    if (opts.query || !query.empty()) req << "?" << query;
    req << (opts.version == 1 ? " HTTP/1.1\r\n" : " HTTP/1.0\r\n");

    for (const auto& e : headers) {
        for (const auto& v : e.values) {
            req << e.name << ": " << v << "\r\n";
        }
    }
    req << "\r\n";

    out.method  = method;
    out.head    = req.str();
    out.headers = std::move(headers);
    return true;
}

} // namespace hp::internal
