/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/status.hpp"
#include "jt/http_response.hpp"
#include "jt/internal/utils.hpp"

namespace jt {

std::string HttpResponse::header(const char* name) const {
    return internal::hdr_ci(headers, name);
}

const char* error_kind_name(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:          return "ok";
    case ErrorKind::Transport:     return "transport";
    case ErrorKind::Protocol:      return "protocol";
    case ErrorKind::Integrity:     return "integrity";
    case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

std::string Status::to_string() const {
    if (ok()) return "ok";
    return std::string(error_kind_name(_kind)) + ": " + _message;
}

} // namespace jt
