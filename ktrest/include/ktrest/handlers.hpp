/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <google/protobuf/message.h>
#include "ktrest/http_request.hpp"
#include "ktrest/key_server.hpp"
#include "ktrest/status.hpp"

namespace ktrest {

// Path template variable holding the user identifier.
inline constexpr const char* kUserIdKeyword = "user_id";
// JSON field carrying an RFC3339 timestamp in key uploads.
inline constexpr const char* kCreationTimeKeyword = "creation_time";

// Closed set of messages a route can decode into.
using RequestMessage = std::variant<
    v1::HkpLookupRequest,
    v2::GetEntryRequest,
    v2::ListEntryHistoryRequest,
    v2::UpdateEntryRequest,
    v2::ListSEHRequest,
    v2::ListUpdateRequest,
    v2::ListStepsRequest>;

struct HandlerResult {
    Status status;
    std::unique_ptr<google::protobuf::Message> response; // set when status.ok()
};

// Fills path/query derived fields of a fresh message.
using Parser = std::function<Status(const HttpRequest&, RequestMessage&)>;

// Calls the backend with the fully populated message.
using RequestHandler = std::function<HandlerResult(KeyServer&,
                                                   const RequestContext&,
                                                   const RequestMessage&)>;

struct HandlerInfo {
    RequestMessage           arg;              // prototype, copied per request
    Parser                   parser;
    RequestHandler           h;
    std::vector<std::string> timestamp_fields; // rewritten before decoding
};

struct RouteInfo;
using Initializer = std::function<HandlerInfo(const RouteInfo&)>;

// One row of the route table: (path template, method) plus how to build its
// HandlerInfo. requester becomes HandlerInfo::h.
struct RouteInfo {
    std::string    path;
    std::string    method;
    Initializer    initializer;
    RequestHandler requester;
};

// Adapts a parser written against the concrete message type.
template <class Req>
Parser typed_parser(Status (*fn)(const HttpRequest&, Req&)) {
    return [fn](const HttpRequest& R, RequestMessage& arg) -> Status {
        Req* m = std::get_if<Req>(&arg);
        if (!m) return Status::Error(StatusCode::Internal, "REQUEST_TYPE_MISMATCH");
        return fn(R, *m);
    };
}

// Adapts a KeyServer method into a RequestHandler.
template <class Req, class Resp>
RequestHandler bind_backend(Status (KeyServer::*method)(const RequestContext&,
                                                         const Req&, Resp*)) {
    return [method](KeyServer& srv, const RequestContext& ctx,
                    const RequestMessage& arg) -> HandlerResult {
        HandlerResult r;
        const Req* req = std::get_if<Req>(&arg);
        if (!req) {
            r.status = Status::Error(StatusCode::Internal, "REQUEST_TYPE_MISMATCH");
            return r;
        }
        auto resp = std::make_unique<Resp>();
        r.status = (srv.*method)(ctx, *req, resp.get());
        if (r.status.ok()) r.response = std::move(resp);
        return r;
    };
}

// ---- v1 initializers ----
HandlerInfo init_get_entry_v1(const RouteInfo& rinfo);
HandlerInfo init_hkp_lookup_v1(const RouteInfo& rinfo);

// ---- v2 initializers ----
HandlerInfo init_get_entry_v2(const RouteInfo& rinfo);
HandlerInfo init_list_entry_history_v2(const RouteInfo& rinfo);
HandlerInfo init_update_entry_v2(const RouteInfo& rinfo);
HandlerInfo init_list_seh_v2(const RouteInfo& rinfo);
HandlerInfo init_list_update_v2(const RouteInfo& rinfo);
HandlerInfo init_list_steps_v2(const RouteInfo& rinfo);

// Route tables served by ktrest_server.
std::vector<RouteInfo> v1_routes();
std::vector<RouteInfo> v2_routes();

} // namespace ktrest
