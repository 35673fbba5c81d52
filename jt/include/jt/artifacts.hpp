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
#include "jt/bootstrap.hpp"
#include "jt/status.hpp"

namespace jt {

// Declarative descriptors consumed by an external provisioning agent.
// Nothing here executes or writes anything.

struct Instruction {
    std::string name;
    bool save_output = false;
    std::string command;
};

struct File {
    std::string content;      // base64
    std::string path;         // absolute
    std::string permissions;  // octal string, e.g. "0644"
};

constexpr const char* kAdditionalCaPath = "/etc/pki/trust/anchors/additional-ca.pem";

// Refresh the host trust store after a bundle was dropped into it.
Instruction to_update_ca_certificates_instruction();

// Write the cluster-scoped CA bundle of `server` to kAdditionalCaPath.
// An empty bundle yields an empty file.
Status to_file(const TrustBootstrapper& bootstrap,
               const std::string& server,
               const std::string& token,
               File& out);

} // namespace jt
