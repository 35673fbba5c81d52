// SPDX-License-Identifier: Apache-2.0
// Part of the JoinTrust (JT) project.
// apps/jt_fetch.cpp

#include "jt/artifacts.hpp"
#include "jt/bootstrap.hpp"
#include "jt/client_config.hpp"
#include "jt/fetcher.hpp"
#include "jt/log.hpp"
#include "jt/token_resolver.hpp"
#include "jt/transport.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --server https://host[:port] --token TOKEN [--path /resource] [--machine]\n"
      "  " << argv0 << " --server https://host[:port] --token TOKEN --cacerts [--machine]\n"
      "  " << argv0 << " --server https://host[:port] --token TOKEN --emit-artifacts\n"
      "\n"
      "Options:\n"
      "  --path <p>              resource to fetch after trust is established\n"
      "  --machine               machine/node token (default: cluster token)\n"
      "  --cacerts               only bootstrap; print checksum and CA bundle\n"
      "  --emit-artifacts        print the trust-store provisioning descriptors\n"
      "  --ca-file <f>           default trust store override (PEM file)\n"
      "  --ca-dir <d>            default trust store override (hashed dir)\n"
      "  --timeout <sec>         limit for each whole request in seconds (default 5)\n"
      "  --log-file <f>          also append log lines to this file\n"
      "\n"
      "HTTPS_PROXY, HTTP_PROXY and NO_PROXY are honoured.\n";
}

int main(int argc, char** argv){
    jt::ClientConfig cfg;
    jt::load_proxy_env(cfg);

    std::string server, token, path;
    bool machine = false;
    bool cacerts_only = false;
    bool emit_artifacts = false;

    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        try {
            if(a=="--server" && i+1<argc) server = argv[++i];
            else if(a=="--token" && i+1<argc) token = argv[++i];
            else if(a=="--path" && i+1<argc) path = argv[++i];
            else if(a=="--machine") machine = true;
            else if(a=="--cacerts") cacerts_only = true;
            else if(a=="--emit-artifacts") emit_artifacts = true;
            else if(a=="--ca-file" && i+1<argc) cfg.tls_ca_file = argv[++i];
            else if(a=="--ca-dir" && i+1<argc) cfg.tls_ca_dir = argv[++i];
            else if(a=="--timeout" && i+1<argc) {
                const int t = std::max(1, std::stoi(argv[++i]));
                if (t > 86400) throw std::out_of_range("timeout");
                cfg.timeout_ms = t * 1000;
            }
            else if(a=="--log-file" && i+1<argc) cfg.log_file = argv[++i];
            else { usage(argv[0]); return 2; }
        } catch (const std::exception&) {
            std::cerr << "Bad value for " << a << "\n";
            return 2;
        }
    }

    if(server.empty() || token.empty()){
        usage(argv[0]);
        return 2;
    }
    if(!cacerts_only && !emit_artifacts && path.empty()){
        std::cerr << "--path is required unless --cacerts or --emit-artifacts is given\n";
        return 2;
    }

    jt::set_log_file(cfg.log_file);

    jt::SocketTransport transport(cfg);
    jt::TrustBootstrapper bootstrap(transport);
    const jt::TokenScope scope = machine ? jt::TokenScope::Machine : jt::TokenScope::Cluster;

    if (emit_artifacts) {
        jt::File file;
        jt::Status st = jt::to_file(bootstrap, server, token, file);
        if (!st.ok()) {
            std::cerr << st.to_string() << "\n";
            return 1;
        }
        const jt::Instruction ins = jt::to_update_ca_certificates_instruction();
        std::cout << "file.path: " << file.path << "\n"
                  << "file.permissions: " << file.permissions << "\n"
                  << "file.content: " << file.content << "\n"
                  << "instruction.name: " << ins.name << "\n"
                  << "instruction.saveOutput: " << (ins.save_output ? "true" : "false") << "\n"
                  << "instruction.command: " << ins.command << "\n";
        return 0;
    }

    if (cacerts_only) {
        jt::CaBundle ca;
        jt::Status st = bootstrap.ca_certs(server, token, scope, ca);
        if (!st.ok()) {
            std::cerr << st.to_string() << "\n";
            return 1;
        }
        if (ca.empty()) {
            std::cout << "checksum: \n(default trust store suffices)\n";
        } else {
            std::cout << "checksum: " << ca.checksum << "\n" << ca.pem;
        }
        return 0;
    }

    // No unseal backend is linked into this tool: tpm:// machine tokens are
    // rejected with a configuration error, others pass through.
    jt::SealedTokenResolver resolver(nullptr);
    jt::TrustedFetcher fetcher(transport, resolver);

    jt::FetchResult res;
    jt::Status st = fetcher.fetch(server, token, path, scope, res);
    if (!st.ok()) {
        std::cerr << st.to_string() << "\n";
        return 1;
    }
    std::cerr << "ca checksum: " << (res.ca_checksum.empty() ? "(default trust store)" : res.ca_checksum) << "\n";
    std::cout << res.body;
    return 0;
}
