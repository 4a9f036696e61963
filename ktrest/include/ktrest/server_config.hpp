/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace ktrest {

struct ServerConfig {
    // Core
    uint16_t port = 8080;

    // TLS (enabled when both cert and key are set)
    std::string tls_cert_file;
    std::string tls_key_file;
    std::string tls_client_ca;
    bool        require_client_cert = false;

    // Request limits
    std::size_t max_body = 2*1024*1024;

    // Error redaction
    bool redact_errors = false;

    // Keep-alive
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;

    bool tls_enabled() const {
        return !tls_cert_file.empty() && !tls_key_file.empty();
    }
};

} // namespace ktrest
