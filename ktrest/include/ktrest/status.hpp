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
#include <utility>

namespace ktrest {

enum class StatusCode {
    Ok,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    PermissionDenied,
    Unauthenticated,
    FailedPrecondition,
    Unimplemented,
    Unavailable,
    Internal
};

// Outcome of a parser, rewriter or backend call. reason is a short
// machine-friendly tag, optionally followed by detail.
struct Status {
    StatusCode  code = StatusCode::Ok;
    std::string reason;

    bool ok() const { return code == StatusCode::Ok; }

    static Status OK() { return Status{}; }
    static Status Error(StatusCode c, std::string why) {
        return Status{c, std::move(why)};
    }
};

const char* status_code_name(StatusCode c);

// HTTP status used when a Status travels back to the client.
int http_status_for(StatusCode c);
const char* http_status_text(int sc);

} // namespace ktrest
