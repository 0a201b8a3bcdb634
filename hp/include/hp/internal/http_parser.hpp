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

namespace hp::internal {

// Canonical display form of a header name: "content-type" -> "Content-Type",
// "etag" -> "ETag". Idempotent.
std::string normalize_header(const std::string& name);

// Percent-encode each path segment, keeping '/' separators and a trailing '/'.
std::string escape_path(const std::string& path);

struct StatusLine {
    int major = 0;
    int minor = 0;
    int code  = 0;
};

// Match "HTTP/<d>.<d> <ddd>" (reason phrase ignored).
bool parse_status_line(const std::string& line, StatusLine& out);

// Split "Name: value" at the first colon; leading blanks are dropped from value.
bool split_header_line(const std::string& line, std::string& name, std::string& value);

} // namespace hp::internal
