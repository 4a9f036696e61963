/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/http_io.hpp"
#include "ktrest/log.hpp"

namespace ktrest::internal {

ktrest::HttpResponse dispatch_request(const ktrest::RestServer& rest,
                                      ktrest::HttpRequest& R,
                                      const std::string& peer_ip)
{
    if (R.path == "/health" && R.method == "GET") {
        ktrest::HttpResponse resp;
        resp.body = R"({"status":"OK"})";
        return resp;
    }

    ktrest::HttpResponse resp = rest.handle(R, peer_ip);
    ktrest::log_request(resp.status_code, R.method, R.path, peer_ip,
                        resp.status_code == 200 ? "" : "body=" + resp.body);
    return resp;
}

} // namespace ktrest::internal
