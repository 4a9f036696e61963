/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/router.hpp"
#include "ktrest/internal/http_parser.hpp"
#include <stdexcept>

namespace ktrest::internal {

std::vector<std::string> Router::split_path(const std::string& path) {
    std::vector<std::string> out;
    std::size_t p = (!path.empty() && path[0] == '/') ? 1 : 0;
    if (p == path.size()) return out; // "/" or ""
    while (true) {
        std::size_t slash = path.find('/', p);
        if (slash == std::string::npos) {
            out.push_back(path.substr(p));
            break;
        }
        out.push_back(path.substr(p, slash - p));
        p = slash + 1;
    }
    return out;
}

void Router::add(const std::string& path_template, const std::string& method,
                 std::size_t binding_id)
{
    for (auto& r : _routes) {
        if (r.path_template != path_template) continue;
        if (!r.by_method.emplace(method, binding_id).second) {
            throw std::runtime_error("Router: duplicate route " + method + " " + path_template);
        }
        return;
    }

    Route r;
    r.path_template = path_template;
    for (const auto& s : split_path(path_template)) {
        Segment seg;
        if (s.size() >= 2 && s.front() == '{' && s.back() == '}') {
            seg.text = s.substr(1, s.size() - 2);
            seg.is_var = true;
            if (seg.text.empty()) {
                throw std::runtime_error("Router: empty variable in " + path_template);
            }
        } else {
            if (s.find('{') != std::string::npos || s.find('}') != std::string::npos) {
                throw std::runtime_error("Router: malformed segment in " + path_template);
            }
            seg.text = s;
        }
        r.segs.push_back(std::move(seg));
    }
    r.by_method.emplace(method, binding_id);
    _routes.push_back(std::move(r));
}

Router::Match Router::match(const std::string& method, const std::string& path) const {
    Match m;
    const std::vector<std::string> parts = split_path(path);

    bool path_matched = false;
    for (const auto& r : _routes) {
        if (r.segs.size() != parts.size()) continue;

        std::unordered_map<std::string, std::string> vars;
        bool ok = true;
        for (std::size_t i = 0; i < parts.size() && ok; ++i) {
            const Segment& seg = r.segs[i];
            if (seg.is_var) {
                if (parts[i].empty()) { ok = false; break; }
                vars[seg.text] = percent_decode(parts[i]);
            } else if (seg.text != parts[i]) {
                ok = false;
            }
        }
        if (!ok) continue;

        path_matched = true;
        auto it = r.by_method.find(method);
        if (it == r.by_method.end()) continue;

        m.kind = MatchKind::Matched;
        m.binding_id = it->second;
        m.vars = std::move(vars);
        return m;
    }
    m.kind = path_matched ? MatchKind::MethodNotAllowed : MatchKind::NotFound;
    return m;
}

} // namespace ktrest::internal
