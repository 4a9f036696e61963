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
#include <unordered_map>

namespace ktrest {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "PUT", ...
    std::string path;     // "/v2/users/alice@example.com"
    std::string query;    // "epoch=3&app_id=pgp"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    // Routing context, filled by the router on a successful match.
    bool routed = false;
    std::unordered_map<std::string, std::string> path_vars;
};

} // namespace ktrest
