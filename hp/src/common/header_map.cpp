/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/header_map.hpp"
#include "hp/internal/utils.hpp"
#include <utility>

namespace hp {

HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string, std::string>> init) {
    for (const auto& kv : init) append(kv.first, kv.second);
}

HeaderMap::Entry* HeaderMap::find(const std::string& name) {
    for (auto& e : _entries) {
        if (internal::iequals(e.name, name)) return &e;
    }
    return nullptr;
}

const HeaderMap::Entry* HeaderMap::find(const std::string& name) const {
    for (const auto& e : _entries) {
        if (internal::iequals(e.name, name)) return &e;
    }
    return nullptr;
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    set(name, std::vector<std::string>{value});
}

void HeaderMap::set(const std::string& name, std::vector<std::string> values) {
    if (Entry* e = find(name)) {
        e->values = std::move(values);
        return;
    }
    _entries.push_back(Entry{name, std::move(values)});
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    if (Entry* e = find(name)) {
        e->values.push_back(value);
        return;
    }
    _entries.push_back(Entry{name, {value}});
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    const Entry* e = find(name);
    if (!e || e->values.empty()) return std::nullopt;
    return e->values.front();
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    const Entry* e = find(name);
    if (!e) return {};
    return e->values;
}

bool HeaderMap::has(const std::string& name) const {
    return find(name) != nullptr;
}

} // namespace hp
