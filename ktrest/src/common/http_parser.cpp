/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/http_parser.hpp"
#include "ktrest/internal/utils.hpp"
#include <charconv>
#include <sstream>
#include <strings.h> // strcasecmp

namespace ktrest::internal {

bool parse_request_line(const std::string& line, ktrest::HttpRequest& r) {
    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;
    if (line.find(' ', sp2 + 1) != std::string::npos) return false;

    r.method  = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    r.httpver = line.substr(sp2 + 1);
    if (r.httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (target.empty() || target[0] != '/') return false;

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_request_head(const std::string& head, ktrest::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) line_end = head.size();
    if (!parse_request_line(head.substr(0, line_end), r)) return false;

    r.headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        r.headers[k] = v;
    }
    return true;
}

static std::string url_decode(const std::string& s, bool plus_is_space) {
    std::string o; o.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexval(s[i+1]), lo = hexval(s[i+2]);
            if (hi >= 0 && lo >= 0) { o.push_back((char)((hi << 4) | lo)); i += 2; continue; }
        }
        if (plus_is_space && s[i] == '+') { o.push_back(' '); continue; }
        o.push_back(s[i]);
    }
    return o;
}

std::string percent_decode(const std::string& s) {
    return url_decode(s, false);
}

std::unordered_map<std::string,std::string> parse_query(const std::string& q){
    std::unordered_map<std::string,std::string> m;
    std::size_t p = 0;
    while (p <= q.size()) {
        std::size_t amp = q.find('&', p);
        if (amp == std::string::npos) amp = q.size();
        const std::string part = q.substr(p, amp - p);
        if (!part.empty()) {
            const std::size_t eq = part.find('=');
            std::string k = url_decode(part.substr(0, eq), true);
            std::string v = (eq == std::string::npos) ? std::string()
                                                      : url_decode(part.substr(eq + 1), true);
            // first occurrence wins
            m.emplace(std::move(k), std::move(v));
        }
        p = amp + 1;
    }
    return m;
}

std::string hdr_ci(const ktrest::HttpRequest& R, const char* name){
    auto it = R.headers.find(name);
    if (it != R.headers.end()) return it->second;
    for (const auto& kv : R.headers){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

bool content_length(const ktrest::HttpRequest& R, std::size_t max_body, std::size_t& out) {
    out = 0;
    const std::string v = hdr_ci(R, "Content-Length");
    if (v.empty()) return true;
    const char* b = v.data();
    const char* e = v.data() + v.size();
    auto [ptr, ec] = std::from_chars(b, e, out);
    if (ec != std::errc() || ptr != e) return false;
    return out <= max_body;
}

bool should_keep_alive(const ktrest::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (R.httpver == "HTTP/1.1") {
        return (conn != "close");
    }
    return (conn == "keep-alive");
}

std::string serialize_response(const ktrest::HttpResponse& resp,
                               const ktrest::ServerConfig& cfg,
                               bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status_code << " " << resp.status_text << "\r\n";
    oss << "Content-Type: " << resp.content_type << "\r\n";
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    oss << resp.body;
    return oss.str();
}

} // namespace ktrest::internal
