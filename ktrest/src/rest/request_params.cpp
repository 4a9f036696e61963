/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/request_params.hpp"
#include "ktrest/internal/http_parser.hpp"
#include <charconv>

namespace ktrest::internal {

bool parse_url_variable(const HttpRequest& R, const std::string& name, std::string& out) {
    out.clear();
    if (!R.routed) return false;
    auto it = R.path_vars.find(name);
    if (it == R.path_vars.end()) return false;
    out = it->second;
    return true;
}

bool query_value(const HttpRequest& R, const std::string& name, std::string& out) {
    out.clear();
    const auto q = parse_query(R.query);
    auto it = q.find(name);
    if (it == q.end()) return false;
    out = it->second;
    return true;
}

template <class T>
static bool parse_digits(const std::string& s, T& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    T v{};
    const char* b = s.data();
    const char* e = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(b, e, v);
    if (ec != std::errc() || ptr != e) return false;
    out = v;
    return true;
}

bool parse_uint64(const std::string& s, std::uint64_t& out) {
    return parse_digits(s, out);
}

bool parse_nonneg_int32(const std::string& s, std::int32_t& out) {
    return parse_digits(s, out);
}

Status uint64_query_param(const HttpRequest& R, const std::string& name, std::uint64_t& out) {
    std::string v;
    if (!query_value(R, name, v) || v.empty()) return Status::OK();
    if (!parse_uint64(v, out)) {
        return Status::Error(StatusCode::InvalidArgument, "BAD_PARAM: " + name + "=" + v);
    }
    return Status::OK();
}

Status int32_query_param(const HttpRequest& R, const std::string& name, std::int32_t& out) {
    std::string v;
    if (!query_value(R, name, v) || v.empty()) return Status::OK();
    if (!parse_nonneg_int32(v, out)) {
        return Status::Error(StatusCode::InvalidArgument, "BAD_PARAM: " + name + "=" + v);
    }
    return Status::OK();
}

} // namespace ktrest::internal
