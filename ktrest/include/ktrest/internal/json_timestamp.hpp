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
#include <string>
#include "ktrest/status.hpp"

namespace ktrest::internal {

// Parse an RFC3339 timestamp ("2015-05-18T23:58:36.000Z").
bool parse_rfc3339(const std::string& s, std::int64_t& seconds, std::int32_t& nanos);

/**
 * Rewrites every quoted RFC3339 value of `key` in a JSON text into
 * {"seconds": S, "nanos": N}, leaving all other bytes as they are.
 *
 * Not a JSON parser: the key is matched literally (quoted or bare). An
 * occurrence whose value is not quote-delimited is skipped, and an opening
 * quote with no closing quote ends the scan; neither is an error.
 *
 * A quoted value that is not a valid timestamp (the empty string included)
 * fails the whole call: out receives the original body unchanged, including
 * when earlier occurrences had already been converted.
 */
Status rewrite_timestamps(const std::string& body, const std::string& key, std::string& out);

} // namespace ktrest::internal
