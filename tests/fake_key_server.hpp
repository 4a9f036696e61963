/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <string>
#include "ktrest/key_server.hpp"

namespace ktrest::test_support {

// Records the last request of each kind and answers with canned data.
// `fail` makes every call return that status instead.
class FakeKeyServer : public KeyServer {
public:
    int    calls = 0;
    Status fail;
    RequestContext last_ctx;

    v2::GetEntryRequest         get_entry;
    v2::UpdateEntryRequest      update_entry;
    v2::ListEntryHistoryRequest list_history;
    v2::ListSEHRequest          list_seh;
    v2::ListUpdateRequest       list_update;
    v2::ListStepsRequest        list_steps;
    v1::HkpLookupRequest        hkp;

    Status GetEntry(const RequestContext& ctx, const v2::GetEntryRequest& req,
                    v2::GetEntryResponse* resp) override {
        record(ctx);
        get_entry = req;
        if (!fail.ok()) return fail;
        resp->mutable_entry()->set_user_id(req.user_id());
        resp->mutable_entry()->set_epoch(7);
        return Status::OK();
    }

    Status UpdateEntry(const RequestContext& ctx, const v2::UpdateEntryRequest& req,
                       v2::UpdateEntryResponse* resp) override {
        record(ctx);
        update_entry = req;
        if (!fail.ok()) return fail;
        resp->set_epoch(1);
        return Status::OK();
    }

    Status ListEntryHistory(const RequestContext& ctx, const v2::ListEntryHistoryRequest& req,
                            v2::ListEntryHistoryResponse*) override {
        record(ctx);
        list_history = req;
        return fail;
    }

    Status ListSEH(const RequestContext& ctx, const v2::ListSEHRequest& req,
                   v2::ListSEHResponse*) override {
        record(ctx);
        list_seh = req;
        return fail;
    }

    Status ListUpdate(const RequestContext& ctx, const v2::ListUpdateRequest& req,
                      v2::ListUpdateResponse*) override {
        record(ctx);
        list_update = req;
        return fail;
    }

    Status ListSteps(const RequestContext& ctx, const v2::ListStepsRequest& req,
                     v2::ListStepsResponse*) override {
        record(ctx);
        list_steps = req;
        return fail;
    }

    Status HkpLookup(const RequestContext& ctx, const v1::HkpLookupRequest& req,
                     v1::HttpBody* resp) override {
        record(ctx);
        hkp = req;
        if (!fail.ok()) return fail;
        resp->set_content_type("application/pgp-keys");
        resp->set_data("KEYDATA");
        return Status::OK();
    }

private:
    void record(const RequestContext& ctx) {
        ++calls;
        last_ctx = ctx;
    }
};

} // namespace ktrest::test_support
