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

namespace hp {

// Thread-safe logging (to file + stdout).
// Nothing is written to disk until set_log_file() names a path.
void set_log_file(const std::string& path);
void set_log_quiet(bool quiet);   // true: no stdout echo
void log_line(const std::string& line);

} // namespace hp
