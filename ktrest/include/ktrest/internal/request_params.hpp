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
#include "ktrest/http_request.hpp"
#include "ktrest/status.hpp"

namespace ktrest::internal {

// Value bound to a path template variable of the matched route.
// Returns false (and clears out) when the variable is not declared by the
// route or the request was never routed.
bool parse_url_variable(const HttpRequest& R, const std::string& name, std::string& out);

// Decoded query parameter. Returns false (and clears out) when absent.
bool query_value(const HttpRequest& R, const std::string& name, std::string& out);

// Decimal digits only, no sign, must fit the target type.
bool parse_uint64(const std::string& s, std::uint64_t& out);
bool parse_nonneg_int32(const std::string& s, std::int32_t& out);

// Query parameter parsers. Absent or empty leaves out untouched and is OK;
// anything else that does not parse is InvalidArgument.
Status uint64_query_param(const HttpRequest& R, const std::string& name, std::uint64_t& out);
Status int32_query_param(const HttpRequest& R, const std::string& name, std::int32_t& out);

} // namespace ktrest::internal
