/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/server_config.hpp"
#include "ktrest/http_request.hpp"
#include "ktrest/rest.hpp"
#include "ktrest/log.hpp"
#include "ktrest/internal/http_io.hpp"
#include "ktrest/internal/http_parser.hpp"
#include "ktrest/internal/tls_ctx.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ktrest::internal {

// --- TLS I/O helpers ---

static bool ssl_send_all(SSL* ssl, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        int n = SSL_write(ssl, d + off, static_cast<int>(len - off));
        if (n <= 0) {
            (void)SSL_get_error(ssl, n);
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// --- Exported entry point for server.cpp ---

void handle_connection_tls(int fd,
                           const ktrest::ServerConfig& cfg,
                           const std::string& peer_ip,
                           ktrest::internal::TlsContext& tls,
                           const ktrest::RestServer& rest)
{
    // Apply kernel timeouts before the handshake so a stalled peer cannot
    // hold the thread.
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    SSL* ssl = SSL_new(tls.ctx());
    if (!ssl) { ::close(fd); return; }
    SSL_set_fd(ssl, fd);
    if (SSL_accept(ssl) <= 0) {
        unsigned long e = ERR_get_error();
        if (e != 0) {
            char buf[256];
            ERR_error_string_n(e, buf, sizeof(buf));
            ktrest::log_line(ktrest::LogLevel::Warn, "TLS handshake failed ip=" + peer_ip + ": " + buf);
        }
        ERR_clear_error();
        SSL_free(ssl);
        ::close(fd);
        return;
    }

    auto rd = [ssl](char* buf, std::size_t len) -> long {
        return static_cast<long>(SSL_read(ssl, buf, static_cast<int>(len)));
    };

    std::string carry;
    int served = 0;
    while (served < cfg.ka_max) {
        ktrest::HttpRequest R;
        if (!recv_http_request(rd, cfg, carry, R)) break;

        ktrest::HttpResponse resp = dispatch_request(rest, R, peer_ip);
        ++served;
        const bool ka = should_keep_alive(R) && served < cfg.ka_max;
        const std::string wire = serialize_response(resp, cfg, ka);
        if (!ssl_send_all(ssl, wire.data(), wire.size())) break;
        if (!ka) break;
    }

    SSL_shutdown(ssl);
    SSL_free(ssl);
    ::close(fd);
}

} // namespace ktrest::internal
