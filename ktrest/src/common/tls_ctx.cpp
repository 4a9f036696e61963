/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/tls_ctx.hpp"
#include "ktrest/log.hpp"
#include <openssl/err.h>

namespace ktrest::internal {

static void log_openssl_errors(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        ktrest::log_line(LogLevel::Warn, std::string("TLS ") + where + ": " + buf);
    }
}

TlsContext::TlsContext(const ktrest::ServerConfig& cfg) {
    _ctx = SSL_CTX_new(TLS_server_method());
    if (!_ctx) fail("SSL_CTX_new", "cannot create server context");

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        fail("set_min_proto_version", "cannot require TLS 1.2");
    }

    if (SSL_CTX_use_certificate_chain_file(_ctx, cfg.tls_cert_file.c_str()) != 1) {
        fail("use_certificate_chain_file", "cannot load certificate " + cfg.tls_cert_file);
    }
    if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail("use_PrivateKey_file", "cannot load private key " + cfg.tls_key_file);
    }
    if (SSL_CTX_check_private_key(_ctx) != 1) {
        fail("check_private_key", "private key does not match certificate");
    }

    if (!cfg.tls_client_ca.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_client_ca.c_str(), nullptr) != 1) {
            fail("load_verify_locations", "cannot load client CA " + cfg.tls_client_ca);
        }
        int vmode = SSL_VERIFY_PEER;
        if (cfg.require_client_cert) vmode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
        SSL_CTX_set_verify(_ctx, vmode, nullptr);
        _verify_peer = true;
    }

    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_SERVER);
    const unsigned char sid_ctx[] = "ktrest_sid_ctx_v1";
    SSL_CTX_set_session_id_context(_ctx, sid_ctx, (unsigned int)sizeof(sid_ctx));
}

TlsContext::~TlsContext() {
    if (_ctx) SSL_CTX_free(_ctx);
}

void TlsContext::fail(const char* where, const std::string& what) {
    log_openssl_errors(where);
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
    throw TlsError("TLS: " + what);
}

} // namespace ktrest::internal
