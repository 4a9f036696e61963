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
#include "ktrest/internal/http_io.hpp"
#include "ktrest/internal/http_parser.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ktrest::internal {

// --- I/O helpers ---

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const ktrest::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const ktrest::RestServer& rest)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    auto rd = [fd](char* buf, std::size_t len) -> long {
        return static_cast<long>(::recv(fd, buf, len, 0));
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
        if (!send_all(fd, wire.data(), wire.size())) break;
        if (!ka) break;
    }
    ::close(fd);
}

} // namespace ktrest::internal
