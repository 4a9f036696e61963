/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path = "ktrest.log";

void write_unlocked(const std::string& line) {
    if (!g_log_ofs.is_open()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
    if (g_log_ofs) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    std::cout << line << '\n';
}
} // namespace

namespace ktrest {

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:  return "[INFO]";
        case LogLevel::Warn:  return "[WARN]";
        case LogLevel::Fatal: return "[FATAL]";
    }
    return "[INFO]";
}

std::string format_log_line(LogLevel level, const std::string& msg) {
    return std::string(log_level_tag(level)) + " " + msg;
}

std::string format_request_line(int status,
                                const std::string& method,
                                const std::string& path,
                                const std::string& peer_ip,
                                const std::string& detail)
{
    std::string line = "[" + std::to_string(status) + "] " + method + " " + path +
                       " ip=" + peer_ip;
    if (!detail.empty()) line += " " + detail;
    return line;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) g_log_ofs.close();
    g_log_ofs.clear();
}

void log_line(LogLevel level, const std::string& msg) {
    const std::string line = format_log_line(level, msg);
    std::lock_guard<std::mutex> lk(g_log_mtx);
    write_unlocked(line);
}

void log_request(int status,
                 const std::string& method,
                 const std::string& path,
                 const std::string& peer_ip,
                 const std::string& detail)
{
    const std::string line = format_request_line(status, method, path, peer_ip, detail);
    std::lock_guard<std::mutex> lk(g_log_mtx);
    write_unlocked(line);
}

} // namespace ktrest
