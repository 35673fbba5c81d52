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
#include <utility>

namespace jt {

enum class ErrorKind {
    None,
    Transport,      // DNS / connect / TLS handshake / timeout / read
    Protocol,       // non-200 status, malformed HTTP
    Integrity,      // X-Cattle-Hash mismatch; always fatal
    Configuration   // bad URL, nonce failure, unusable CA bundle, missing collaborator
};

const char* error_kind_name(ErrorKind k);

// Result of every public operation. Out-parameters are only written when ok().
class Status {
public:
    Status() = default;

    static Status error(ErrorKind kind, std::string message) {
        Status s;
        s._kind = kind;
        s._message = std::move(message);
        return s;
    }

    bool ok() const { return _kind == ErrorKind::None; }
    ErrorKind kind() const { return _kind; }
    const std::string& message() const { return _message; }

    // "<kind>: <message>", or "ok"
    std::string to_string() const;

private:
    ErrorKind _kind = ErrorKind::None;
    std::string _message;
};

} // namespace jt
