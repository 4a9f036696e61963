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

struct HttpResponse {
    int status_code = 200;
    std::string status_text = "OK";
    std::string content_type = "application/json";
    std::string body;
};

} // namespace ktrest
