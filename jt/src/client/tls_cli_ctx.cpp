/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/internal/tls_cli_ctx.hpp"
#include "jt/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <memory>

namespace jt::internal {

std::string drain_openssl_errors(const char* tag, const char* where) {
    std::string all;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        jt::log_line(std::string(tag) + " error at " + where + ": " + buf);
        if (!all.empty()) all += "; ";
        all += buf;
    }
    return all;
}

TlsClientContext::TlsClientContext(const jt::ClientConfig& cfg, const jt::TlsTrust& trust) {
    ERR_clear_error();

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        fail("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        fail("set_min_proto");
        return;
    }

    switch (trust.mode) {
    case jt::TrustMode::SkipVerify:
        _verify = false;
        break;

    case jt::TrustMode::PinnedBundle:
        if (!load_pinned_bundle(trust.ca_bundle)) return;
        break;

    case jt::TrustMode::SystemDefault:
        if (!cfg.tls_ca_file.empty() || !cfg.tls_ca_dir.empty()) {
            const char* file = cfg.tls_ca_file.empty() ? nullptr : cfg.tls_ca_file.c_str();
            const char* dir  = cfg.tls_ca_dir.empty()  ? nullptr : cfg.tls_ca_dir.c_str();
            if (SSL_CTX_load_verify_locations(_ctx, file, dir) != 1) {
                fail("load_verify_locations(CA)");
                return;
            }
        } else if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            fail("set_default_verify_paths");
            return;
        }
        break;
    }

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // servers commonly drop the connection without close_notify after the body
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    SSL_CTX_set_verify(_ctx, _verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

// The pinned bundle replaces the default store: only its certificates
// are trust anchors for this context.
bool TlsClientContext::load_pinned_bundle(const std::string& pem) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), (int)pem.size()), &BIO_free);
    if (!bio) {
        fail("BIO_new_mem_buf");
        return false;
    }

    X509_STORE* store = X509_STORE_new();
    if (!store) {
        fail("X509_STORE_new");
        return false;
    }

    int added = 0;
    for (;;) {
        X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
        if (!cert) break;
        if (X509_STORE_add_cert(store, cert) == 1) ++added;
        X509_free(cert);
    }
    // PEM_read_bio_X509 reports end of input through the error queue
    ERR_clear_error();

    if (added == 0) {
        X509_STORE_free(store);
        _error = "CA bundle contains no usable PEM certificates";
        jt::log_line("[TLS-CLI] " + _error);
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
        return false;
    }

    // ctx takes ownership of store
    SSL_CTX_set_cert_store(_ctx, store);
    jt::log_line("[TLS-CLI] pinned " + std::to_string(added) + " CA certificate(s)");
    return true;
}

void TlsClientContext::fail(const char* where) {
    const std::string detail = drain_openssl_errors("[TLS-CLI]", where);
    _error = std::string(where) + (detail.empty() ? " failed" : ": " + detail);
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

} // namespace jt::internal
