/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>
#include "ktrest/status.hpp"
#include "keyserver_v1.pb.h"
#include "keyserver_v2.pb.h"

namespace ktrest {

// Request-scoped data handed to the backend alongside the decoded message.
struct RequestContext {
    std::string peer_ip;
    std::string method;
    std::string path;
    std::chrono::steady_clock::time_point received{};
};

/**
 * Backend the REST handlers call into. Implementations must be safe to call
 * from many connection threads at once.
 */
class KeyServer {
public:
    virtual ~KeyServer() = default;

    virtual Status GetEntry(const RequestContext& ctx,
                            const v2::GetEntryRequest& req,
                            v2::GetEntryResponse* resp) = 0;

    virtual Status UpdateEntry(const RequestContext& ctx,
                               const v2::UpdateEntryRequest& req,
                               v2::UpdateEntryResponse* resp) = 0;

    virtual Status ListEntryHistory(const RequestContext& ctx,
                                    const v2::ListEntryHistoryRequest& req,
                                    v2::ListEntryHistoryResponse* resp) = 0;

    virtual Status ListSEH(const RequestContext& ctx,
                           const v2::ListSEHRequest& req,
                           v2::ListSEHResponse* resp) = 0;

    virtual Status ListUpdate(const RequestContext& ctx,
                              const v2::ListUpdateRequest& req,
                              v2::ListUpdateResponse* resp) = 0;

    virtual Status ListSteps(const RequestContext& ctx,
                             const v2::ListStepsRequest& req,
                             v2::ListStepsResponse* resp) = 0;

    virtual Status HkpLookup(const RequestContext& ctx,
                             const v1::HkpLookupRequest& req,
                             v1::HttpBody* resp) = 0;
};

} // namespace ktrest
