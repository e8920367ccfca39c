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
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include <tsuyaku/error_condition.h>
#include <tsuyaku/kind_hierarchy.h>

namespace tsuyaku {

/**
 * @brief exception carrying the error condition
 * @details application logic throws this to signal the error condition of the given kind.
 */
class raised_error : public std::exception {
public:
    /**
     * @brief create empty object
     */
    raised_error() = default;

    /**
     * @brief destruct the object
     */
    ~raised_error() override = default;

    raised_error(raised_error const& other) = default;
    raised_error& operator=(raised_error const& other) = default;
    raised_error(raised_error&& other) noexcept = default;
    raised_error& operator=(raised_error&& other) noexcept = default;

    explicit raised_error(error_condition cond) :
        condition_(std::move(cond)),
        what_(condition_.message())
    {}

    [[nodiscard]] char const* what() const noexcept override {
        return what_.c_str();
    }

    [[nodiscard]] error_condition const& condition() const noexcept {
        return condition_;
    }

private:
    error_condition condition_{};
    std::string what_{};
};

/**
 * @brief throw raised_error with the condition of given kind and message
 * @param kind the kind of the condition
 * @param message human readable message
 * @param details structured payload, or null json
 */
[[noreturn]] void raise_error(std::string_view kind, std::string_view message, nlohmann::json details = {});

/**
 * @brief maximum depth of the nested exceptions converted to the cause chain
 */
static constexpr std::size_t max_nested_exception_depth = 16;

/**
 * @brief create the condition from the exception
 * @details
 * - raised_error yields its condition
 * - other std::exception yields the condition whose kind is the dynamic type name and message is what().
 *   If `known` is given and does not declare the dynamic type, the most specific standard exception type
 *   the exception derives from is used as the kind instead.
 * - any other exception yields the condition of internal kind.
 * If the exception is std::nested_exception, the nested one becomes the cause of the condition.
 * @param ep the exception to convert
 * @param known the hierarchy used to check whether the dynamic type name is a declared kind
 * @return the condition
 */
[[nodiscard]] error_condition condition_from_exception(
    std::exception_ptr const& ep,
    kind_hierarchy const* known = nullptr
) noexcept;

/**
 * @brief create the condition from the exception currently handled
 * @pre called in the catch block
 * @see condition_from_exception()
 */
[[nodiscard]] error_condition condition_from_current_exception(kind_hierarchy const* known = nullptr) noexcept;

/**
 * @brief returns the kind name for the dynamic type of the exception
 * @details standard exception types yield the canonical names (e.g. "std::invalid_argument"), others the
 * demangled type name. Other types in std namespace yield the most specific standard exception type they derive
 * from.
 */
[[nodiscard]] std::string exception_kind(std::exception const& e);

/**
 * @brief returns the kind name of the most specific standard exception type the exception derives from
 */
[[nodiscard]] std::string_view standard_exception_kind(std::exception const& e) noexcept;

/**
 * @brief declare the standard exception types in the hierarchy
 * @details the kinds follow the standard library inheritance. In addition std::invalid_argument,
 * std::domain_error, std::length_error and std::out_of_range have validation kind as supertype so that they
 * resolve to the validation handler.
 */
void register_standard_exceptions(kind_hierarchy& hierarchy);

}  // namespace tsuyaku
