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
#include "hp/error.hpp"
#include "hp/header_map.hpp"
#include "hp/request_options.hpp"

namespace hp::internal {

extern const char* const kUserAgent;

struct EncodedRequest {
    std::string method;   // uppercased verb
    std::string head;     // request line, header lines, blank line
    HeaderMap   headers;  // normalized headers as sent
};

// Build the request head for `opts`. `host` fills a missing Host header.
// Fails only with Errc::InvalidVersion.
bool encode_request(const RequestOptions& opts, const std::string& host,
                    EncodedRequest& out, Error& err);

} // namespace hp::internal
