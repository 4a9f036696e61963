/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/server.hpp"
#include "ktrest/log.hpp"

#include <stdexcept>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <thread>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Forward declarations of per-connection handlers provided by http_* modules.
namespace ktrest::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
void handle_connection_plain(int fd,
                             const ktrest::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const ktrest::RestServer& rest);

// Handles a single HTTPS connection (keep-alive is managed inside).
void handle_connection_tls(int fd,
                           const ktrest::ServerConfig& cfg,
                           const std::string& peer_ip,
                           ktrest::internal::TlsContext& tls,
                           const ktrest::RestServer& rest);

} // namespace ktrest::internal

namespace ktrest {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg, const RestServer& rest)
    : _cfg(cfg), _rest(rest)
{
    if (_cfg.tls_enabled()) {
        _tls = std::make_unique<internal::TlsContext>(_cfg);
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        ktrest::log_line(LogLevel::Fatal, std::string("socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    if (set_reuseaddr(srv) < 0) {
        ktrest::log_line(LogLevel::Warn, std::string("SO_REUSEADDR: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg.port);

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ktrest::log_line(LogLevel::Fatal, std::string("bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        ktrest::log_line(LogLevel::Fatal, std::string("listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }
    return srv;
}

void Server::run() {
    ktrest::log_line(LogLevel::Info, "ktrest server starting...");
    ktrest::log_line(LogLevel::Info, "Port: " + std::to_string(_cfg.port));
    ktrest::log_line(LogLevel::Info, "Routes: " + std::to_string(_rest.size()));
    if (_cfg.redact_errors) {
        ktrest::log_line(LogLevel::Info, "Error redaction: ENABLED");
    }
    ktrest::log_line(LogLevel::Info, "Max body=" + std::to_string(_cfg.max_body) +
                     " KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                     "s, KA max=" + std::to_string(_cfg.ka_max));

    if (_tls) {
        serve_tls();
    } else {
        serve_plain();
    }
}

void Server::serve_plain() {
    int srv = create_listen_socket();
    ktrest::log_line(LogLevel::Info, "Listening HTTP on :" + std::to_string(_cfg.port));

    for (;;) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            // EINTR and transient errors (EMFILE, ECONNABORTED, ...)
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        // Detach a per-connection handler; it will manage the fd lifetime.
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, this->_cfg, peer, this->_rest);
        }).detach();
    }
}

void Server::serve_tls() {
    int srv = create_listen_socket();
    ktrest::log_line(LogLevel::Info, "Listening HTTPS on :" + std::to_string(_cfg.port) +
                     (_tls->verifies_peer() ? " (client certificates verified)" : ""));

    for (;;) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) continue;
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        std::thread([this, fd, peer]() {
            // handler is responsible for closing the fd and SSL shutdown
            internal::handle_connection_tls(fd, this->_cfg, peer, *this->_tls, this->_rest);
        }).detach();
    }
}

} // namespace ktrest
