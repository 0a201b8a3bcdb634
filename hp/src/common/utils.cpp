/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/internal/utils.hpp"
#include <cctype>
#include <limits>
#include <strings.h> // strcasecmp

namespace hp::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}

bool iequals(const std::string& a, const std::string& b){
    return a.size() == b.size() && strcasecmp(a.c_str(), b.c_str()) == 0;
}

std::string escape_uri(const std::string& s){
    static const char* H="0123456789ABCDEF";
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        if(std::isalnum(c) || c=='-' || c=='.' || c=='_' || c=='~') {
            out.push_back((char)c);
        } else {
            out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string encode_args(const std::vector<std::pair<std::string,std::string>>& args){
    std::string out;
    bool first=true;
    for(const auto& kv: args){
        if(!first) out.push_back('&');
        first=false;
        out += escape_uri(kv.first);
        out.push_back('=');
        out += escape_uri(kv.second);
    }
    return out;
}

bool parse_decimal(const std::string& s, std::uint64_t& out){
    std::string t = s;
    trim_inplace(t);
    if (t.empty() || t.size() > 19) return false;
    std::uint64_t v = 0;
    for (char c : t) {
        if (c < '0' || c > '9') return false;
        v = v*10 + (std::uint64_t)(c - '0');
    }
    out = v;
    return true;
}

bool parse_hex_size(const std::string& s, std::uint64_t& out){
    std::size_t i = 0;
    while (i < s.size() && (s[i]==' ' || s[i]=='\t')) ++i;
    std::uint64_t v = 0;
    std::size_t digits = 0;
    for (; i < s.size(); ++i) {
        int h = hexval(s[i]);
        if (h < 0) break;
        if (v > (std::numeric_limits<std::uint64_t>::max() >> 4)) return false;
        v = (v<<4) | (std::uint64_t)h;
        ++digits;
    }
    if (digits == 0) return false;
    while (i < s.size() && (s[i]==' ' || s[i]=='\t')) ++i;
    if (i < s.size() && s[i] != ';') return false;
    out = v;
    return true;
}

} // namespace hp::internal
