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

namespace jt {

// Thread-safe logging (to optional file + stderr).
// An empty path closes the file sink.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Loggable stand-in for a secret: "<redacted N chars>".
std::string redact(const std::string& secret);

} // namespace jt
