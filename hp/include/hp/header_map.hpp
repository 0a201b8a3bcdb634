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
#include <optional>
#include <utility>
#include <initializer_list>
#include <cstddef>

namespace hp {

// Header name -> one or more values. Lookups are case-insensitive, the name
// spelling of the first insertion is kept, and iteration follows insertion order.
class HeaderMap {
public:
    struct Entry {
        std::string name;
        std::vector<std::string> values;
    };

    HeaderMap() = default;
    HeaderMap(std::initializer_list<std::pair<std::string, std::string>> init);

    // Replace all values of `name`.
    void set(const std::string& name, const std::string& value);
    void set(const std::string& name, std::vector<std::string> values);
    // Add one more value to `name`.
    void append(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    using const_iterator = std::vector<Entry>::const_iterator;
    const_iterator begin() const { return _entries.begin(); }
    const_iterator end() const { return _entries.end(); }

private:
    Entry* find(const std::string& name);
    const Entry* find(const std::string& name) const;

    std::vector<Entry> _entries;
};

} // namespace hp
