/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;

void open_if_needed_unlocked() {
    if (!g_log_path.empty() && !g_log_ofs.is_open()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}
} // namespace

namespace jt {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    // stdout may carry fetched payloads (CLI), keep log lines on stderr
    std::cerr << line << '\n';
}

std::string redact(const std::string& secret) {
    return "<redacted " + std::to_string(secret.size()) + " chars>";
}

} // namespace jt
