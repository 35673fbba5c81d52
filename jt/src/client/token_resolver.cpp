/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/token_resolver.hpp"
#include "jt/log.hpp"
#include <utility>

namespace jt {

Status PassthroughTokenResolver::resolve(const std::string& token, ResolvedToken& out) const {
    out.hardware_backed = false;
    out.token = token;
    return {};
}

SealedTokenResolver::SealedTokenResolver(Unseal unseal, std::string prefix)
    : _unseal(std::move(unseal)), _prefix(std::move(prefix)) {}

Status SealedTokenResolver::resolve(const std::string& token, ResolvedToken& out) const {
    if (_prefix.empty() || token.compare(0, _prefix.size(), _prefix) != 0) {
        out.hardware_backed = false;
        out.token = token;
        return {};
    }
    if (!_unseal) {
        return Status::error(ErrorKind::Configuration,
                             "token references a sealed credential but no unseal function is configured");
    }

    std::string secret;
    Status st = _unseal(token.substr(_prefix.size()), secret);
    if (!st.ok()) {
        return Status::error(st.kind(), "unseal token: " + st.message());
    }
    jt::log_line("[TOKEN] unsealed hardware-backed token " + redact(secret));
    out.hardware_backed = true;
    out.token = std::move(secret);
    return {};
}

} // namespace jt
