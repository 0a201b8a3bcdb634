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
#include <cstddef>
#include <cstdint>

namespace hp::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string upper_copy(std::string s);
bool iequals(const std::string& a, const std::string& b);

// Percent-encode everything except unreserved characters (A-Z a-z 0-9 - . _ ~).
std::string escape_uri(const std::string& s);

// "k1=v1&k2=v2" with escape_uri() applied to keys and values; order is kept.
std::string encode_args(const std::vector<std::pair<std::string,std::string>>& args);

// Whole-string decimal parse (surrounding whitespace allowed).
bool parse_decimal(const std::string& s, std::uint64_t& out);

// Leading hex digits of a chunk-size line; extensions after ';' are ignored.
bool parse_hex_size(const std::string& s, std::uint64_t& out);

} // namespace hp::internal
