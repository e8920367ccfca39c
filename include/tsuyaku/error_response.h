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

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <tsuyaku/status_code.h>

namespace tsuyaku {

/**
 * @brief error response
 * @details this object represents the structured response produced by translating the error condition.
 * The collaborator serializes it and transmits to the requester.
 */
class error_response {
public:
    using clock = std::chrono::system_clock;

    /**
     * @brief create empty object
     */
    error_response() = default;

    /**
     * @brief destruct the object
     */
    ~error_response() = default;

    error_response(error_response const& other) = default;
    error_response& operator=(error_response const& other) = default;
    error_response(error_response&& other) noexcept = default;
    error_response& operator=(error_response&& other) noexcept = default;

    /**
     * @brief create new object
     * @param status the status code
     * @param message the message
     * @param body structured fields (json object), or null json if none
     * @param timestamp the time the response is created
     */
    error_response(
        status_code status,
        std::string message,
        nlohmann::json body,
        clock::time_point timestamp
    ) noexcept;

    /**
     * @brief accessor to the status code
     */
    [[nodiscard]] status_code status() const noexcept {
        return status_;
    }

    /**
     * @brief accessor to the message
     */
    [[nodiscard]] std::string_view message() const noexcept {
        return message_;
    }

    /**
     * @brief accessor to the structured fields
     * @return json object, or null json if the response has no structured fields
     */
    [[nodiscard]] nlohmann::json const& body() const noexcept {
        return body_;
    }

    /**
     * @brief returns whether the response has structured fields
     */
    [[nodiscard]] bool has_body() const noexcept {
        return ! body_.is_null();
    }

    /**
     * @brief accessor to the timestamp
     */
    [[nodiscard]] clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

private:
    status_code status_{status_internal_server_error};
    std::string message_{};
    nlohmann::json body_{};
    clock::time_point timestamp_{};
};

/**
 * @brief compare the contents of the responses ignoring the timestamp
 * @return true if status, message and body are equal
 */
[[nodiscard]] bool equivalent(error_response const& a, error_response const& b) noexcept;

/**
 * @brief format the timestamp in ISO-8601 UTC with millisecond precision
 */
[[nodiscard]] std::string format_timestamp(error_response::clock::time_point tp);

/**
 * @brief convert the response to json
 * @details the result has "status", "message" and "timestamp" members, and "body" if the response has one.
 */
void to_json(nlohmann::json& j, error_response const& value);

/**
 * @brief appends string representation of the given value.
 * @param out the target output
 * @param value the target value
 * @return the output
 */
std::ostream& operator<<(std::ostream& out, error_response const& value);

}  // namespace tsuyaku
