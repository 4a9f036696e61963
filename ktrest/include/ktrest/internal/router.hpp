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
#include <vector>

namespace ktrest::internal {

/**
 * Path-template router. Templates are "/"-separated segments where a
 * segment of the form {name} binds one non-empty, percent-decoded path
 * segment. Literal segments must match exactly.
 */
class Router {
public:
    enum class MatchKind { Matched, NotFound, MethodNotAllowed };

    struct Match {
        MatchKind   kind = MatchKind::NotFound;
        std::size_t binding_id = 0;
        std::unordered_map<std::string, std::string> vars;
    };

    // Throws std::runtime_error on a malformed template or when
    // (template, method) is already registered.
    void add(const std::string& path_template, const std::string& method,
             std::size_t binding_id);

    // First template (in registration order) whose segments match wins.
    Match match(const std::string& method, const std::string& path) const;

private:
    struct Segment {
        std::string text;   // literal text, or variable name
        bool        is_var = false;
    };
    struct Route {
        std::string          path_template;
        std::vector<Segment> segs;
        std::unordered_map<std::string, std::size_t> by_method;
    };

    std::vector<Route> _routes;

    static std::vector<std::string> split_path(const std::string& path);
};

} // namespace ktrest::internal
