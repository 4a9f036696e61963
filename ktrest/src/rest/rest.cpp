/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/rest.hpp"
#include "ktrest/log.hpp"
#include "ktrest/internal/json_timestamp.hpp"
#include "ktrest/internal/utils.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <google/protobuf/util/json_util.h>

namespace ktrest {

namespace pbutil = google::protobuf::util;

static bool is_blank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

// Decodes body into a scratch message of the same type and merges it over
// the path/query fields, so body fields win where both are set.
static Status decode_json_body(const std::string& body, RequestMessage& arg) {
    if (is_blank(body)) return Status::OK();
    return std::visit([&body](auto& msg) -> Status {
        using Msg = std::decay_t<decltype(msg)>;
        Msg decoded;
        pbutil::JsonParseOptions opts;
        opts.ignore_unknown_fields = false;
        const auto st = pbutil::JsonStringToMessage(body, &decoded, opts);
        if (!st.ok()) {
            return Status::Error(StatusCode::InvalidArgument, "BAD_JSON: " + st.ToString());
        }
        msg.MergeFrom(decoded);
        return Status::OK();
    }, arg);
}

static Status render_message(const google::protobuf::Message& msg, HttpResponse& out) {
    if (const auto* raw = dynamic_cast<const v1::HttpBody*>(&msg)) {
        out.content_type = raw->content_type().empty() ? "application/octet-stream"
                                                       : raw->content_type();
        out.body = raw->data();
        return Status::OK();
    }
    pbutil::JsonPrintOptions opts;
    opts.preserve_proto_field_names = true;
    const auto st = pbutil::MessageToJsonString(msg, &out.body, opts);
    if (!st.ok()) {
        return Status::Error(StatusCode::Internal, "ENCODE_FAIL: " + st.ToString());
    }
    return Status::OK();
}

RestServer::RestServer(KeyServer& backend, bool redact_errors)
    : _backend(backend), _redact(redact_errors)
{
}

void RestServer::add_handler(const RouteInfo& rinfo) {
    Binding b;
    b.route = rinfo;
    b.info  = rinfo.initializer(rinfo);
    if (!b.info.parser || !b.info.h) {
        throw std::runtime_error("RestServer: incomplete handler for " +
                                 rinfo.method + " " + rinfo.path);
    }
    _router.add(rinfo.path, rinfo.method, _bindings.size());
    _bindings.push_back(std::move(b));
}

HttpResponse RestServer::error_response(int sc, const std::string& reason) const {
    HttpResponse resp;
    resp.status_code = sc;
    resp.status_text = http_status_text(sc);
    if (_redact) {
        resp.body = R"({"status":"ERROR"})";
    } else {
        resp.body = std::string(R"({"status":"ERROR","reason":")") +
                    internal::json_escape(reason) + R"("})";
    }
    return resp;
}

HttpResponse RestServer::handle(HttpRequest& R, const std::string& peer_ip) const {
    auto m = _router.match(R.method, R.path);
    if (m.kind == internal::Router::MatchKind::NotFound) {
        return error_response(404, "NOT_FOUND");
    }
    if (m.kind == internal::Router::MatchKind::MethodNotAllowed) {
        return error_response(405, "METHOD_NOT_ALLOWED");
    }
    R.routed = true;
    R.path_vars = std::move(m.vars);

    const Binding& b = _bindings[m.binding_id];

    // (a) fresh message from the prototype
    RequestMessage arg = b.info.arg;

    // (b) path / query parameters
    Status st = b.info.parser(R, arg);
    if (!st.ok()) return error_response(http_status_for(st.code), st.reason);

    // (c) RFC3339 strings -> {seconds, nanos}
    std::string body = R.body;
    for (const auto& field : b.info.timestamp_fields) {
        std::string rewritten;
        st = internal::rewrite_timestamps(body, field, rewritten);
        if (!st.ok()) return error_response(400, st.reason);
        body.swap(rewritten);
    }

    // (d) JSON body
    st = decode_json_body(body, arg);
    if (!st.ok()) return error_response(400, st.reason);

    // (e) backend
    RequestContext ctx;
    ctx.peer_ip  = peer_ip;
    ctx.method   = R.method;
    ctx.path     = R.path;
    ctx.received = std::chrono::steady_clock::now();

    HandlerResult res = b.info.h(_backend, ctx, arg);
    if (!res.status.ok()) {
        return error_response(http_status_for(res.status.code),
                              std::string(status_code_name(res.status.code)) +
                              (res.status.reason.empty() ? "" : ": " + res.status.reason));
    }

    HttpResponse resp;
    if (!res.response) {
        resp.body = "{}";
        return resp;
    }
    st = render_message(*res.response, resp);
    if (!st.ok()) {
        ktrest::log_line(LogLevel::Warn, R.method + " " + R.path + " " + st.reason);
        return error_response(500, st.reason);
    }
    return resp;
}

} // namespace ktrest
