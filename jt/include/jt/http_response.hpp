/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>

namespace jt {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    HttpHeaders headers;
    std::string body;

    // Case-insensitive header lookup; empty when absent.
    std::string header(const char* name) const;
};

} // namespace jt
