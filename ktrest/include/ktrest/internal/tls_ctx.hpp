/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <openssl/ssl.h>
#include "ktrest/server_config.hpp"

namespace ktrest::internal {

// Raised when the server context, certificate chain, private key or client CA
// cannot be loaded. what() names the file or step that failed; the OpenSSL
// error queue is logged before the throw.
class TlsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns the server SSL_CTX for one listener: TLS 1.2 minimum, server-side
// session cache, optional client certificate verification.
//
// Relies on OpenSSL >= 1.1 self-initialisation: no library-wide init or
// cleanup happens here, so several contexts may coexist in one process.
class TlsContext {
public:
    // Throws TlsError; a half-built SSL_CTX is freed before the throw.
    explicit TlsContext(const ktrest::ServerConfig& cfg);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    // True when a client CA was configured and peers are asked for certificates.
    bool verifies_peer() const { return _verify_peer; }

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool     _verify_peer = false;

    [[noreturn]] void fail(const char* where, const std::string& what);
};

} // namespace ktrest::internal
