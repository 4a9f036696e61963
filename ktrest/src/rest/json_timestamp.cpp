/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/json_timestamp.hpp"
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

namespace ktrest::internal {

bool parse_rfc3339(const std::string& s, std::int64_t& seconds, std::int32_t& nanos) {
    if (s.empty()) return false;
    google::protobuf::Timestamp ts;
    if (!google::protobuf::util::TimeUtil::FromString(s, &ts)) return false;
    seconds = ts.seconds();
    nanos   = ts.nanos();
    return true;
}

static std::size_t skip_ws(const std::string& s, std::size_t i) {
    while (i < s.size() &&
           (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) {
        ++i;
    }
    return i;
}

Status rewrite_timestamps(const std::string& body, const std::string& key, std::string& out) {
    if (key.empty() || body.empty()) {
        out = body;
        return Status::OK();
    }

    std::string res;
    res.reserve(body.size() + 32);
    std::size_t copied = 0; // body[0, copied) is already in res
    std::size_t pos = 0;

    while (true) {
        const std::size_t k = body.find(key, pos);
        if (k == std::string::npos) break;

        std::size_t i = k + key.size();
        // closing quote of a quoted key
        if (k > 0 && body[k-1] == '"' && i < body.size() && body[i] == '"') ++i;
        i = skip_ws(body, i);
        if (i < body.size() && body[i] == ':') i = skip_ws(body, i + 1);

        if (i >= body.size() || body[i] != '"') {
            // value is not a quoted string: leave it to the decoder
            pos = k + key.size();
            continue;
        }

        const std::size_t close = body.find('"', i + 1);
        if (close == std::string::npos) break; // unterminated: nothing safe to resume from

        const std::string value = body.substr(i + 1, close - i - 1);
        std::int64_t seconds = 0;
        std::int32_t nanos = 0;
        if (!parse_rfc3339(value, seconds, nanos)) {
            out = body;
            return Status::Error(StatusCode::InvalidArgument,
                                 "BAD_TIMESTAMP: " + key + "=\"" + value + "\"");
        }

        res.append(body, copied, i - copied);
        res += "{\"seconds\": ";
        res += std::to_string(seconds);
        res += ", \"nanos\": ";
        res += std::to_string(nanos);
        res += "}";
        copied = close + 1;
        pos = close + 1;
    }

    res.append(body, copied, std::string::npos);
    out.swap(res);
    return Status::OK();
}

} // namespace ktrest::internal
