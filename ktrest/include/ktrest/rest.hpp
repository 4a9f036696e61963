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
#include <vector>
#include "ktrest/handlers.hpp"
#include "ktrest/http_request.hpp"
#include "ktrest/http_response.hpp"
#include "ktrest/internal/router.hpp"
#include "ktrest/key_server.hpp"

namespace ktrest {

/**
 * REST front end: owns the route table and turns routed HTTP requests into
 * backend calls. Bindings are added before serving starts; handle() only
 * reads the table and may run on many threads at once.
 */
class RestServer {
public:
    explicit RestServer(KeyServer& backend, bool redact_errors = false);

    // Runs rinfo.initializer once and registers the resulting binding.
    // Throws std::runtime_error when (path, method) is already bound.
    void add_handler(const RouteInfo& rinfo);

    // Route -> parse params -> rewrite timestamps -> decode -> call backend.
    HttpResponse handle(HttpRequest& R, const std::string& peer_ip) const;

    std::size_t size() const { return _bindings.size(); }

private:
    struct Binding {
        RouteInfo   route;
        HandlerInfo info;
    };

    KeyServer&           _backend;
    bool                 _redact;
    internal::Router     _router;
    std::vector<Binding> _bindings;

    HttpResponse error_response(int sc, const std::string& reason) const;
};

} // namespace ktrest
