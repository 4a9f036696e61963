/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>
#include "ktrest/http_request.hpp"
#include "ktrest/http_response.hpp"
#include "ktrest/rest.hpp"
#include "ktrest/server_config.hpp"
#include "ktrest/internal/http_parser.hpp"

namespace ktrest::internal {

constexpr std::size_t kMaxHeaderBytes = 1u << 20;

/**
 * Reads one request using rd(buf, len) -> bytes read (<= 0 on EOF/error).
 * carry holds bytes received past the previous request on the same
 * connection and is updated with what is left past this one.
 */
template <class ReadFn>
bool recv_http_request(ReadFn&& rd,
                       const ktrest::ServerConfig& cfg,
                       std::string& carry,
                       ktrest::HttpRequest& R)
{
    std::string req;
    req.swap(carry);
    char buf[4096];
    std::size_t hdr_end;
    while ((hdr_end = req.find("\r\n\r\n")) == std::string::npos) {
        if (req.size() > kMaxHeaderBytes) return false; // header abuse guard
        long n = rd(buf, sizeof(buf));
        if (n <= 0) return false;
        req.append(buf, buf + n);
    }
    if (!parse_request_head(req.substr(0, hdr_end), R)) return false;

    std::size_t len = 0;
    if (!content_length(R, cfg.max_body, len)) return false;

    const std::size_t body_off = hdr_end + 4;
    while (req.size() - body_off < len) {
        long n = rd(buf, sizeof(buf));
        if (n <= 0) return false;
        req.append(buf, buf + n);
    }
    R.body.assign(req, body_off, len);
    carry.assign(req, body_off + len, std::string::npos);
    return true;
}

// /health plus the REST route table; logs one line per request.
ktrest::HttpResponse dispatch_request(const ktrest::RestServer& rest,
                                      ktrest::HttpRequest& R,
                                      const std::string& peer_ip);

} // namespace ktrest::internal
