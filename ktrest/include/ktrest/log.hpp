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

namespace ktrest {

enum class LogLevel { Info, Warn, Fatal };

// "[INFO]", "[WARN]" or "[FATAL]".
const char* log_level_tag(LogLevel level);

std::string format_log_line(LogLevel level, const std::string& msg);

// "[<status>] <METHOD> <path> ip=<peer>", then " <detail>" when detail is set.
std::string format_request_line(int status,
                                const std::string& method,
                                const std::string& path,
                                const std::string& peer_ip,
                                const std::string& detail = "");

// Thread-safe logging (to file + stdout). The file is opened on first use;
// set_log_file() switches to another path.
void set_log_file(const std::string& path);
void log_line(LogLevel level, const std::string& msg);
void log_request(int status,
                 const std::string& method,
                 const std::string& path,
                 const std::string& peer_ip,
                 const std::string& detail = "");

} // namespace ktrest
