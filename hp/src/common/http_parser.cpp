/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/internal/http_parser.hpp"
#include "hp/internal/utils.hpp"
#include <vector>
#include <cctype>

namespace hp::internal {

namespace {

const char* const kCommonHeaders[] = {
    "Cache-Control",
    "Content-Length",
    "Content-Type",
    "Date",
    "ETag",
    "Expires",
    "Host",
    "Location",
    "User-Agent",
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // namespace

std::string normalize_header(const std::string& name) {
    for (const char* h : kCommonHeaders) {
        if (iequals(name, h)) return h;
    }

    std::string out = name;
    bool up = true;
    for (char& c : out) {
        if (up) c = (char)std::toupper((unsigned char)c);
        up = (c == '-');
    }
    return out;
}

std::string escape_path(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t p = 0;
    while (p < path.size()) {
        std::size_t slash = path.find('/', p);
        if (slash == std::string::npos) slash = path.size();
        if (slash > p) segments.push_back(path.substr(p, slash - p));
        p = slash + 1;
    }

    std::string out = "/";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i) out.push_back('/');
        out += escape_uri(segments[i]);
    }
    if (!segments.empty() && path.back() == '/') out.push_back('/');
    return out;
}

bool parse_status_line(const std::string& line, StatusLine& out) {
    std::size_t p = line.find("HTTP/");
    if (p == std::string::npos) return false;
    p += 5;

    auto read_number = [&](int& v) {
        std::size_t start = p;
        v = 0;
        while (p < line.size() && is_digit(line[p]) && p - start < 3) {
            v = v*10 + (line[p] - '0');
            ++p;
        }
        return p > start;
    };

    StatusLine s;
    if (!read_number(s.major)) return false;
    if (p >= line.size() || line[p] != '.') return false;
    ++p;
    if (!read_number(s.minor)) return false;
    if (p >= line.size() || line[p] != ' ') return false;
    ++p;

    if (p + 3 > line.size()) return false;
    for (std::size_t i = p; i < p + 3; ++i) {
        if (!is_digit(line[i])) return false;
    }
    if (p + 3 < line.size() && is_digit(line[p + 3])) return false;
    s.code = (line[p]-'0')*100 + (line[p+1]-'0')*10 + (line[p+2]-'0');

    out = s;
    return true;
}

bool split_header_line(const std::string& line, std::string& name, std::string& value) {
    std::size_t c = line.find(':');
    if (c == std::string::npos || c == 0) return false;
    name = line.substr(0, c);
    std::size_t v = c + 1;
    while (v < line.size() && std::isspace((unsigned char)line[v])) ++v;
    value = line.substr(v);
    return true;
}

} // namespace hp::internal
