/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/handlers.hpp"
#include "ktrest/internal/request_params.hpp"

namespace ktrest {

// GET /v1/hkp/lookup?op=&search=&options=
// All three are optional; the backend decides what an empty op means.
static Status parse_hkp_lookup(const HttpRequest& R, v1::HkpLookupRequest& m) {
    std::string v;
    if (internal::query_value(R, "op", v))      m.set_op(v);
    if (internal::query_value(R, "search", v))  m.set_search(v);
    if (internal::query_value(R, "options", v)) m.set_options(v);
    return Status::OK();
}

HandlerInfo init_get_entry_v1(const RouteInfo& rinfo) {
    // v1 lookups decode into the v2 request.
    return init_get_entry_v2(rinfo);
}

HandlerInfo init_hkp_lookup_v1(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v1::HkpLookupRequest();
    info.parser = typed_parser(&parse_hkp_lookup);
    info.h      = rinfo.requester;
    return info;
}

} // namespace ktrest
