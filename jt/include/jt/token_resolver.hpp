/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>
#include "jt/bootstrap.hpp"
#include "jt/status.hpp"

namespace jt {

struct ResolvedToken {
    bool hardware_backed = false;
    std::string token;   // usable secret (unsealed when hardware_backed)
};

// Turns a configured machine token into the secret used on the wire.
class TokenResolver {
public:
    virtual ~TokenResolver() = default;
    virtual Status resolve(const std::string& token, ResolvedToken& out) const = 0;
};

// Token is the secret itself.
class PassthroughTokenResolver : public TokenResolver {
public:
    Status resolve(const std::string& token, ResolvedToken& out) const override;
};

// Tokens starting with `prefix` reference a hardware-sealed credential and
// are handed to `unseal`; anything else passes through.
class SealedTokenResolver : public TokenResolver {
public:
    using Unseal = std::function<Status(const std::string& reference, std::string& secret)>;

    static constexpr const char* kDefaultPrefix = "tpm://";

    explicit SealedTokenResolver(Unseal unseal, std::string prefix = kDefaultPrefix);

    Status resolve(const std::string& token, ResolvedToken& out) const override;

private:
    Unseal _unseal;
    std::string _prefix;
};

// Fetches a resource with a hardware-backed identity instead of a bearer
// token. `ca` is the bundle from TrustBootstrapper (may be empty).
class HardwareRetriever {
public:
    virtual ~HardwareRetriever() = default;
    virtual Status get(const CaBundle& ca, const std::string& url, std::string& body) = 0;
};

} // namespace jt
