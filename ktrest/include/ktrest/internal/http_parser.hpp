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
#include <unordered_map>
#include "ktrest/http_request.hpp"
#include "ktrest/http_response.hpp"
#include "ktrest/server_config.hpp"

namespace ktrest::internal {

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, ktrest::HttpRequest& r);

// Parse request line + header lines (the block before the blank line).
bool parse_request_head(const std::string& head, ktrest::HttpRequest& r);

// Parse query string into map ('+' and %XX decoded)
std::unordered_map<std::string, std::string> parse_query(const std::string& q);

// %XX decoding without '+' handling (path segments)
std::string percent_decode(const std::string& s);

// Case-insensitive header lookup
std::string hdr_ci(const ktrest::HttpRequest& R, const char* name);

// Content-Length of R, 0 when absent. False when malformed or above max_body.
bool content_length(const ktrest::HttpRequest& R, std::size_t max_body, std::size_t& out);

// HTTP/1.1 keep-alive decision from version + Connection header
bool should_keep_alive(const ktrest::HttpRequest& R);

// Status line, headers and body ready for the socket.
std::string serialize_response(const ktrest::HttpResponse& resp,
                               const ktrest::ServerConfig& cfg,
                               bool keep_alive);

} // namespace ktrest::internal
