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
#include "hp/header_map.hpp"

namespace hp {

struct HttpResponse {
    int status = 0;          // 0 until a status line was read
    HeaderMap headers;       // canonical names, repeated headers keep every value
    std::string body;        // empty when streamed through a body filter
    bool eof = false;        // response fully consumed and connection finalized
};

} // namespace hp
