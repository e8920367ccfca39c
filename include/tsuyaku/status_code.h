/*
 * Copyright 2018-2025 Project Tsurugi.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace tsuyaku {

/**
 * @brief response status code
 * @details the value is the transport level status (HTTP compatible numbering). Any integer in the range
 * [status_code_min, status_code_max] is accepted, the constants below are the ones used by the builtin taxonomy.
 */
using status_code = std::int32_t;

static constexpr status_code status_code_min = 100;
static constexpr status_code status_code_max = 599;

static constexpr status_code status_bad_request = 400;
static constexpr status_code status_unauthorized = 401;
static constexpr status_code status_forbidden = 403;
static constexpr status_code status_not_found = 404;
static constexpr status_code status_conflict = 409;
static constexpr status_code status_unprocessable_entity = 422;
static constexpr status_code status_internal_server_error = 500;
static constexpr status_code status_service_unavailable = 503;

/**
 * @brief returns whether the status code is in the acceptable range
 */
[[nodiscard]] constexpr inline bool is_valid_status(status_code value) noexcept {
    return status_code_min <= value && value <= status_code_max;
}

/**
 * @brief returns whether the status code represents server side failure
 */
[[nodiscard]] constexpr inline bool is_server_error(status_code value) noexcept {
    return 500 <= value && value <= status_code_max;
}

/**
 * @brief returns the standard reason phrase of the status code.
 * @param value the target value
 * @return the reason phrase, or generic phrase of the status class if the code is not a well-known one
 */
[[nodiscard]] constexpr inline std::string_view reason_phrase(status_code value) noexcept {
    using namespace std::string_view_literals;
    switch (value) {
        case 400: return "Bad Request"sv;
        case 401: return "Unauthorized"sv;
        case 403: return "Forbidden"sv;
        case 404: return "Not Found"sv;
        case 405: return "Method Not Allowed"sv;
        case 408: return "Request Timeout"sv;
        case 409: return "Conflict"sv;
        case 410: return "Gone"sv;
        case 413: return "Payload Too Large"sv;
        case 415: return "Unsupported Media Type"sv;
        case 422: return "Unprocessable Entity"sv;
        case 429: return "Too Many Requests"sv;
        case 500: return "Internal Server Error"sv;
        case 501: return "Not Implemented"sv;
        case 502: return "Bad Gateway"sv;
        case 503: return "Service Unavailable"sv;
        case 504: return "Gateway Timeout"sv;
        default: break;
    }
    if (value >= 500) return "Server Error"sv;
    if (value >= 400) return "Client Error"sv;
    return "Status"sv;
}

} // namespace
