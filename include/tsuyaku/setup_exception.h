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
#include <cstdlib>
#include <exception>
#include <ostream>
#include <string>
#include <string_view>

namespace tsuyaku {

/**
 * @brief error code for setup failures
 */
enum class setup_error : std::int32_t {
    invalid_kind = 1,
    invalid_status,
    hierarchy_cycle,
    config_io_error,
    config_invalid_value,
};

/**
 * @brief returns string representation of the value.
 * @param value the target value
 * @return the corresponded string representation
 */
[[nodiscard]] constexpr inline std::string_view to_string_view(setup_error value) noexcept {
    using namespace std::string_view_literals;
    switch (value) {
        case setup_error::invalid_kind: return "invalid_kind"sv;
        case setup_error::invalid_status: return "invalid_status"sv;
        case setup_error::hierarchy_cycle: return "hierarchy_cycle"sv;
        case setup_error::config_io_error: return "config_io_error"sv;
        case setup_error::config_invalid_value: return "config_invalid_value"sv;
    }
    std::abort();
}

/**
 * @brief appends string representation of the given value.
 * @param out the target output
 * @param value the target value
 * @return the output
 */
inline std::ostream& operator<<(std::ostream& out, setup_error value) {
    return out << to_string_view(value);
}

/**
 * @brief setup exception
 * @details The exception thrown while building the kind hierarchy, the handler registry or the configuration.
 * These objects are built once at process start, so the failure is reported to the caller as exception
 * rather than status. Translation never throws this.
 */
class setup_exception : public std::exception {
public:
    /**
     * @brief create empty object
     */
    setup_exception() = default;

    /**
     * @brief destruct the object
     */
    ~setup_exception() override = default;

    setup_exception(setup_exception const& other) = default;
    setup_exception& operator=(setup_exception const& other) = default;
    setup_exception(setup_exception&& other) noexcept = default;
    setup_exception& operator=(setup_exception&& other) noexcept = default;

    explicit setup_exception(setup_error code, std::string_view msg = {}) :
        code_(code),
        msg_(msg)
    {}

    [[nodiscard]] char const* what() const noexcept override {
        return msg_.c_str();
    }

    [[nodiscard]] setup_error get_code() const noexcept {
        return code_;
    }

private:
    setup_error code_{setup_error::invalid_kind};
    std::string msg_;
};

}  // namespace tsuyaku
