/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/memory_key_server.hpp"
#include "ktrest/log.hpp"
#include "ktrest/internal/utils.hpp"

#include <algorithm>
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

namespace ktrest {

int MemoryKeyServer::effective_page_size(int32_t requested) {
    if (requested <= 0) return kDefaultPageSize;
    return std::min<int32_t>(requested, kMaxPageSize);
}

Status MemoryKeyServer::GetEntry(const RequestContext&,
                                 const v2::GetEntryRequest& req,
                                 v2::GetEntryResponse* resp)
{
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _entries.find(req.user_id());
    if (it == _entries.end() || it->second.empty()) {
        return Status::Error(StatusCode::NotFound, "user " + req.user_id());
    }
    const auto& hist = it->second;
    if (req.epoch() == 0) {
        *resp->mutable_entry() = hist.back();
        return Status::OK();
    }
    // Latest entry at or before the requested epoch.
    for (auto e = hist.rbegin(); e != hist.rend(); ++e) {
        if (e->epoch() <= req.epoch()) {
            *resp->mutable_entry() = *e;
            return Status::OK();
        }
    }
    return Status::Error(StatusCode::NotFound,
                         "user " + req.user_id() + " at epoch " + std::to_string(req.epoch()));
}

Status MemoryKeyServer::UpdateEntry(const RequestContext& ctx,
                                    const v2::UpdateEntryRequest& req,
                                    v2::UpdateEntryResponse* resp)
{
    if (req.user_id().empty()) {
        return Status::Error(StatusCode::InvalidArgument, "missing user_id");
    }
    if (!req.has_signed_key() || !req.signed_key().has_key()) {
        return Status::Error(StatusCode::InvalidArgument, "missing signed_key.key");
    }
    const v2::SignedKey& sk = req.signed_key();

    std::lock_guard<std::mutex> lk(_mtx);
    auto& hist = _entries[req.user_id()];

    v2::Entry next;
    next.set_user_id(req.user_id());
    next.set_epoch(_heads.size() + 1);
    // One key per app: the new key replaces any key with the same app_id.
    if (!hist.empty()) {
        for (const auto& old : hist.back().signed_keys()) {
            if (old.key().app_id() != sk.key().app_id()) *next.add_signed_keys() = old;
        }
    }
    *next.add_signed_keys() = sk;

    v2::SignedEpochHead head;
    head.set_epoch(next.epoch());
    const auto now = google::protobuf::util::TimeUtil::GetCurrentTime();
    head.mutable_issue_time()->set_seconds(now.seconds());
    head.mutable_issue_time()->set_nanos(now.nanos());
    _root = internal::sha256_bin(_root + next.SerializeAsString());
    head.set_root(_root);

    const uint64_t commitment_ts = _updates.size() + 1;
    v2::EntryUpdate upd;
    upd.set_commitment_timestamp(commitment_ts);
    upd.set_user_id(req.user_id());
    *upd.mutable_signed_key() = sk;

    v2::Step step;
    step.set_commitment_timestamp(commitment_ts);
    step.set_epoch(next.epoch());
    step.set_user_id(req.user_id());

    resp->set_epoch(next.epoch());
    hist.push_back(std::move(next));
    _heads.push_back(std::move(head));
    _updates.push_back(std::move(upd));
    _steps.push_back(std::move(step));

    ktrest::log_line(LogLevel::Info, "update user=" + req.user_id() +
                     " epoch=" + std::to_string(resp->epoch()) +
                     " root=" + internal::bytes_to_hex(
                         reinterpret_cast<const unsigned char*>(_root.data()), _root.size()) +
                     " ip=" + ctx.peer_ip);
    return Status::OK();
}

Status MemoryKeyServer::ListEntryHistory(const RequestContext&,
                                         const v2::ListEntryHistoryRequest& req,
                                         v2::ListEntryHistoryResponse* resp)
{
    const int limit = effective_page_size(req.page_size());
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _entries.find(req.user_id());
    if (it == _entries.end()) {
        return Status::Error(StatusCode::NotFound, "user " + req.user_id());
    }
    for (const auto& e : it->second) {
        if (e.epoch() < req.start_epoch()) continue;
        if (resp->values_size() == limit) {
            resp->set_next_epoch(e.epoch());
            break;
        }
        *resp->add_values() = e;
    }
    return Status::OK();
}

Status MemoryKeyServer::ListSEH(const RequestContext&,
                                const v2::ListSEHRequest& req,
                                v2::ListSEHResponse* resp)
{
    const int limit = effective_page_size(req.page_size());
    std::lock_guard<std::mutex> lk(_mtx);
    // epoch N lives at index N - 1; epoch 0 means "from the first one".
    std::size_t i = req.start_epoch() > 0 ? req.start_epoch() - 1 : 0;
    for (; i < _heads.size(); ++i) {
        if (resp->heads_size() == limit) {
            resp->set_next_epoch(_heads[i].epoch());
            break;
        }
        *resp->add_heads() = _heads[i];
    }
    return Status::OK();
}

Status MemoryKeyServer::ListUpdate(const RequestContext&,
                                   const v2::ListUpdateRequest& req,
                                   v2::ListUpdateResponse* resp)
{
    const int limit = effective_page_size(req.page_size());
    std::lock_guard<std::mutex> lk(_mtx);
    std::size_t i = req.start_commitment_timestamp() > 0 ? req.start_commitment_timestamp() - 1 : 0;
    for (; i < _updates.size(); ++i) {
        if (resp->updates_size() == limit) {
            resp->set_next_commitment_timestamp(_updates[i].commitment_timestamp());
            break;
        }
        *resp->add_updates() = _updates[i];
    }
    return Status::OK();
}

Status MemoryKeyServer::ListSteps(const RequestContext&,
                                  const v2::ListStepsRequest& req,
                                  v2::ListStepsResponse* resp)
{
    const int limit = effective_page_size(req.page_size());
    std::lock_guard<std::mutex> lk(_mtx);
    std::size_t i = req.start_commitment_timestamp() > 0 ? req.start_commitment_timestamp() - 1 : 0;
    for (; i < _steps.size(); ++i) {
        if (resp->steps_size() == limit) {
            resp->set_next_commitment_timestamp(_steps[i].commitment_timestamp());
            break;
        }
        *resp->add_steps() = _steps[i];
    }
    return Status::OK();
}

Status MemoryKeyServer::HkpLookup(const RequestContext&,
                                  const v1::HkpLookupRequest& req,
                                  v1::HttpBody* resp)
{
    if (req.op() != "get") {
        return Status::Error(StatusCode::Unimplemented, "hkp op '" + req.op() + "'");
    }
    if (req.search().empty()) {
        return Status::Error(StatusCode::InvalidArgument, "missing search");
    }

    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _entries.find(req.search());
    if (it == _entries.end() || it->second.empty()) {
        return Status::Error(StatusCode::NotFound, "no keys for " + req.search());
    }
    std::string keys;
    for (const auto& sk : it->second.back().signed_keys()) {
        keys += sk.key().key();
    }
    resp->set_content_type("application/pgp-keys");
    resp->set_data(keys);
    return Status::OK();
}

} // namespace ktrest
