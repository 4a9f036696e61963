/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "ktrest/key_server.hpp"

namespace ktrest {

/**
 * In-memory key directory. Every accepted update opens a new epoch, signs
 * an epoch head over a running SHA-256 root and records one update and one
 * step under a monotonically increasing commitment timestamp.
 */
class MemoryKeyServer : public KeyServer {
public:
    static constexpr int kDefaultPageSize = 16;
    static constexpr int kMaxPageSize     = 128;

    MemoryKeyServer() = default;

    Status GetEntry(const RequestContext& ctx,
                    const v2::GetEntryRequest& req,
                    v2::GetEntryResponse* resp) override;

    Status UpdateEntry(const RequestContext& ctx,
                       const v2::UpdateEntryRequest& req,
                       v2::UpdateEntryResponse* resp) override;

    Status ListEntryHistory(const RequestContext& ctx,
                            const v2::ListEntryHistoryRequest& req,
                            v2::ListEntryHistoryResponse* resp) override;

    Status ListSEH(const RequestContext& ctx,
                   const v2::ListSEHRequest& req,
                   v2::ListSEHResponse* resp) override;

    Status ListUpdate(const RequestContext& ctx,
                      const v2::ListUpdateRequest& req,
                      v2::ListUpdateResponse* resp) override;

    Status ListSteps(const RequestContext& ctx,
                     const v2::ListStepsRequest& req,
                     v2::ListStepsResponse* resp) override;

    Status HkpLookup(const RequestContext& ctx,
                     const v1::HkpLookupRequest& req,
                     v1::HttpBody* resp) override;

private:
    std::mutex _mtx;
    // user_id -> entries, ascending epoch
    std::unordered_map<std::string, std::vector<v2::Entry>> _entries;
    std::vector<v2::SignedEpochHead> _heads;   // _heads[i].epoch == i + 1
    std::vector<v2::EntryUpdate>     _updates; // commitment_timestamp == i + 1
    std::vector<v2::Step>            _steps;   // same indexing as _updates
    std::string _root;                         // last epoch root (32 bytes)

    static int effective_page_size(int32_t requested);
};

} // namespace ktrest
