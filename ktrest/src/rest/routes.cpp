/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/handlers.hpp"

namespace ktrest {

static std::string users_path(const char* version, const char* suffix = "") {
    return std::string("/") + version + "/users/{" + kUserIdKeyword + "}" + suffix;
}

std::vector<RouteInfo> v1_routes() {
    return {
        {users_path("v1"), "GET", init_get_entry_v1, bind_backend(&KeyServer::GetEntry)},
        {"/v1/hkp/lookup", "GET", init_hkp_lookup_v1, bind_backend(&KeyServer::HkpLookup)},
    };
}

std::vector<RouteInfo> v2_routes() {
    return {
        {users_path("v2"), "GET", init_get_entry_v2, bind_backend(&KeyServer::GetEntry)},
        {users_path("v2", "/history"), "GET", init_list_entry_history_v2,
         bind_backend(&KeyServer::ListEntryHistory)},
        {users_path("v2"), "PUT", init_update_entry_v2, bind_backend(&KeyServer::UpdateEntry)},
        {"/v2/seh", "GET", init_list_seh_v2, bind_backend(&KeyServer::ListSEH)},
        {"/v2/updates", "GET", init_list_update_v2, bind_backend(&KeyServer::ListUpdate)},
        {"/v2/steps", "GET", init_list_steps_v2, bind_backend(&KeyServer::ListSteps)},
    };
}

} // namespace ktrest
