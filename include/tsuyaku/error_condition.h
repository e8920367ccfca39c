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

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <tsuyaku/error_kind.h>

namespace tsuyaku {

/**
 * @brief error condition
 * @details this object represents the failure signaled by the application logic, to be translated into
 * the error response. The condition is immutable once created except for the cause and details setters used
 * while building it.
 */
class error_condition {
public:
    /**
     * @brief create empty object
     */
    error_condition() = default;

    /**
     * @brief destruct the object
     */
    ~error_condition() = default;

    error_condition(error_condition const& other) = default;
    error_condition& operator=(error_condition const& other) = default;
    error_condition(error_condition&& other) noexcept = default;
    error_condition& operator=(error_condition&& other) noexcept = default;

    /**
     * @brief create new object
     * @param kind the kind of the condition
     * @param message human readable message
     */
    error_condition(
        std::string_view kind,
        std::string_view message
    );

    /**
     * @brief create new object with originating cause
     * @param kind the kind of the condition
     * @param message human readable message
     * @param cause the condition that caused this one
     */
    error_condition(
        std::string_view kind,
        std::string_view message,
        std::shared_ptr<error_condition const> cause
    );

    /**
     * @brief accessor to the kind
     */
    [[nodiscard]] error_kind const& kind() const noexcept;

    /**
     * @brief accessor to the message
     */
    [[nodiscard]] std::string_view message() const noexcept;

    /**
     * @brief accessor to the originating cause
     * @return the cause, or nullptr if there is none
     */
    [[nodiscard]] std::shared_ptr<error_condition const> const& cause() const noexcept;

    /**
     * @brief setter of the originating cause
     */
    error_condition& cause(std::shared_ptr<error_condition const> arg) noexcept;

    /**
     * @brief accessor to the structured details
     * @return the details json object, or null json if none is given
     */
    [[nodiscard]] nlohmann::json const& details() const noexcept;

    /**
     * @brief setter of the structured details
     * @param arg json object carrying payload for the response body builders
     */
    error_condition& details(nlohmann::json arg) noexcept;

    /**
     * @brief list messages of the cause chain
     * @param max_depth maximum number of causes to list
     * @return messages from the direct cause to the root cause
     */
    [[nodiscard]] std::vector<std::string> cause_messages(std::size_t max_depth) const;

private:
    error_kind kind_{};
    std::string message_{};
    std::shared_ptr<error_condition const> cause_{};
    nlohmann::json details_{};
};

/**
 * @brief equality comparison operator
 * @details kind, message, details and the cause chain contents are compared
 */
bool operator==(error_condition const& a, error_condition const& b) noexcept;

/**
 * @brief inequality comparison operator
 */
bool operator!=(error_condition const& a, error_condition const& b) noexcept;

/**
 * @brief appends string representation of the given value.
 * @param out the target output
 * @param value the target value
 * @return the output
 */
std::ostream& operator<<(std::ostream& out, error_condition const& value);

}  // namespace tsuyaku
