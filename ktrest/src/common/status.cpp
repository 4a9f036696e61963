/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/status.hpp"

namespace ktrest {

const char* status_code_name(StatusCode c) {
    switch (c) {
        case StatusCode::Ok:                 return "OK";
        case StatusCode::InvalidArgument:    return "INVALID_ARGUMENT";
        case StatusCode::NotFound:           return "NOT_FOUND";
        case StatusCode::AlreadyExists:      return "ALREADY_EXISTS";
        case StatusCode::PermissionDenied:   return "PERMISSION_DENIED";
        case StatusCode::Unauthenticated:    return "UNAUTHENTICATED";
        case StatusCode::FailedPrecondition: return "FAILED_PRECONDITION";
        case StatusCode::Unimplemented:      return "UNIMPLEMENTED";
        case StatusCode::Unavailable:        return "UNAVAILABLE";
        case StatusCode::Internal:           return "INTERNAL";
    }
    return "UNKNOWN";
}

int http_status_for(StatusCode c) {
    switch (c) {
        case StatusCode::Ok:                 return 200;
        case StatusCode::InvalidArgument:    return 400;
        case StatusCode::Unauthenticated:    return 401;
        case StatusCode::PermissionDenied:   return 403;
        case StatusCode::NotFound:           return 404;
        case StatusCode::AlreadyExists:      return 409;
        case StatusCode::FailedPrecondition: return 412;
        case StatusCode::Unimplemented:      return 501;
        case StatusCode::Unavailable:        return 503;
        case StatusCode::Internal:           return 500;
    }
    return 500;
}

const char* http_status_text(int sc) {
    switch (sc) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return sc < 500 ? "Bad Request" : "Internal Server Error";
    }
}

} // namespace ktrest
