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

// Which certificates the TLS client accepts for one request.
enum class TrustMode {
    SystemDefault,  // host trust store (or ClientConfig::tls_ca_file override)
    SkipVerify,     // bootstrap only: no certificate verification at all
    PinnedBundle    // only the certificates of TlsTrust::ca_bundle
};

struct TlsTrust {
    TrustMode   mode = TrustMode::SystemDefault;
    std::string ca_bundle;  // PEM, used with PinnedBundle

    static TlsTrust system_default() { return TlsTrust{}; }
    static TlsTrust skip_verify() { TlsTrust t; t.mode = TrustMode::SkipVerify; return t; }
    static TlsTrust pinned(const std::string& pem) {
        TlsTrust t;
        t.mode = TrustMode::PinnedBundle;
        t.ca_bundle = pem;
        return t;
    }
};

// Which endpoint family a token belongs to.
enum class TokenScope {
    Cluster,  // /cacerts, no bearer on resource fetches
    Machine   // /v1-rancheros/cacerts, hardware-eligible, bearer on fetches
};

} // namespace jt
