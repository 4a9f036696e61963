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

using internal::parse_url_variable;
using internal::query_value;
using internal::uint64_query_param;
using internal::int32_query_param;

static Status required_user_id(const HttpRequest& R, std::string& out) {
    if (!parse_url_variable(R, kUserIdKeyword, out)) {
        return Status::Error(StatusCode::InvalidArgument,
                             std::string("MISSING_PATH_VAR: ") + kUserIdKeyword);
    }
    return Status::OK();
}

// GET /v{1,2}/users/{user_id}?epoch=&app_id=
static Status parse_get_entry(const HttpRequest& R, v2::GetEntryRequest& m) {
    std::string user_id;
    Status st = required_user_id(R, user_id);
    if (!st.ok()) return st;

    std::uint64_t epoch = 0;
    st = uint64_query_param(R, "epoch", epoch);
    if (!st.ok()) return st;

    std::string app_id;
    if (query_value(R, "app_id", app_id)) m.set_app_id(app_id);

    m.set_user_id(user_id);
    m.set_epoch(epoch);
    return Status::OK();
}

// GET /v2/users/{user_id}/history?start_epoch=&page_size=
static Status parse_list_entry_history(const HttpRequest& R, v2::ListEntryHistoryRequest& m) {
    std::string user_id;
    Status st = required_user_id(R, user_id);
    if (!st.ok()) return st;

    std::uint64_t start_epoch = 0;
    std::int32_t page_size = 0;
    st = uint64_query_param(R, "start_epoch", start_epoch);
    if (!st.ok()) return st;
    st = int32_query_param(R, "page_size", page_size);
    if (!st.ok()) return st;

    m.set_user_id(user_id);
    m.set_start_epoch(start_epoch);
    m.set_page_size(page_size);
    return Status::OK();
}

// PUT /v2/users/{user_id}; everything else comes from the body.
static Status parse_update_entry(const HttpRequest& R, v2::UpdateEntryRequest& m) {
    std::string user_id;
    Status st = required_user_id(R, user_id);
    if (!st.ok()) return st;
    m.set_user_id(user_id);
    return Status::OK();
}

static Status parse_list_seh(const HttpRequest& R, v2::ListSEHRequest& m) {
    std::uint64_t start_epoch = 0;
    std::int32_t page_size = 0;
    Status st = uint64_query_param(R, "start_epoch", start_epoch);
    if (!st.ok()) return st;
    st = int32_query_param(R, "page_size", page_size);
    if (!st.ok()) return st;

    m.set_start_epoch(start_epoch);
    m.set_page_size(page_size);
    return Status::OK();
}

// Shared by the update and step listings.
template <class Req>
static Status parse_commitment_page(const HttpRequest& R, Req& m) {
    std::uint64_t start = 0;
    std::int32_t page_size = 0;
    Status st = uint64_query_param(R, "start_commitment_timestamp", start);
    if (!st.ok()) return st;
    st = int32_query_param(R, "page_size", page_size);
    if (!st.ok()) return st;

    m.set_start_commitment_timestamp(start);
    m.set_page_size(page_size);
    return Status::OK();
}

static Status parse_list_update(const HttpRequest& R, v2::ListUpdateRequest& m) {
    return parse_commitment_page(R, m);
}

static Status parse_list_steps(const HttpRequest& R, v2::ListStepsRequest& m) {
    return parse_commitment_page(R, m);
}

HandlerInfo init_get_entry_v2(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v2::GetEntryRequest();
    info.parser = typed_parser(&parse_get_entry);
    info.h      = rinfo.requester;
    return info;
}

HandlerInfo init_list_entry_history_v2(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v2::ListEntryHistoryRequest();
    info.parser = typed_parser(&parse_list_entry_history);
    info.h      = rinfo.requester;
    return info;
}

HandlerInfo init_update_entry_v2(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v2::UpdateEntryRequest();
    info.parser = typed_parser(&parse_update_entry);
    info.h      = rinfo.requester;
    info.timestamp_fields = {kCreationTimeKeyword};
    return info;
}

HandlerInfo init_list_seh_v2(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v2::ListSEHRequest();
    info.parser = typed_parser(&parse_list_seh);
    info.h      = rinfo.requester;
    return info;
}

HandlerInfo init_list_update_v2(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v2::ListUpdateRequest();
    info.parser = typed_parser(&parse_list_update);
    info.h      = rinfo.requester;
    return info;
}

HandlerInfo init_list_steps_v2(const RouteInfo& rinfo) {
    HandlerInfo info;
    info.arg    = v2::ListStepsRequest();
    info.parser = typed_parser(&parse_list_steps);
    info.h      = rinfo.requester;
    return info;
}

} // namespace ktrest
