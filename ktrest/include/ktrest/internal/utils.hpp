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
#include <cstddef>

namespace ktrest::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// SHA-256 digest, 32 raw bytes (uses OpenSSL from .cpp)
std::string sha256_bin(const std::string& data);

// Lower-case copy
std::string lower_copy(std::string s);

// Escape s for use inside a JSON string literal.
std::string json_escape(const std::string& s);

} // namespace ktrest::internal
