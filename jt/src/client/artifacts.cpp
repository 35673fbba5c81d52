/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/artifacts.hpp"
#include "jt/internal/utils.hpp"

namespace jt {

Instruction to_update_ca_certificates_instruction() {
    Instruction i;
    i.name = "update-ca-certificates";
    i.save_output = true;
    i.command = "update-ca-certificates";
    return i;
}

Status to_file(const TrustBootstrapper& bootstrap,
               const std::string& server,
               const std::string& token,
               File& out)
{
    CaBundle ca;
    Status st = bootstrap.ca_certs(server, token, TokenScope::Cluster, ca);
    if (!st.ok()) return st;

    File f;
    f.content = internal::base64_encode(ca.pem);
    f.path = kAdditionalCaPath;
    f.permissions = "0644";
    out = f;
    return {};
}

} // namespace jt
