/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <memory>
#include "ktrest/server_config.hpp"
#include "ktrest/rest.hpp"
#include "ktrest/internal/tls_ctx.hpp"

namespace ktrest {

// HTTP(S) listener feeding a RestServer.
//
// Every accepted connection runs on a detached thread that reads the
// Server's config, TLS context and RestServer until the peer goes away.
// There is no shutdown path: run() serves until the process exits, and the
// Server and the RestServer it was given must outlive it.
class Server {
public:
    // Throws internal::TlsError when TLS is configured and the key material
    // cannot be loaded. No socket is opened before run().
    Server(const ServerConfig& cfg, const RestServer& rest);

    // Blocking: create socket, listen, accept forever. Throws std::runtime_error
    // when the listening socket cannot be set up.
    [[noreturn]] void run();

    bool tls_enabled() const { return _tls != nullptr; }

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

private:
    ServerConfig _cfg;
    const RestServer& _rest;
    std::unique_ptr<internal::TlsContext> _tls; // only when TLS is configured

    [[noreturn]] void serve_plain();
    [[noreturn]] void serve_tls();

    int create_listen_socket();
};

} // namespace ktrest
