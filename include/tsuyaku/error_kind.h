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

#include <string>
#include <string_view>

namespace tsuyaku {

/**
 * @brief identifier of the error kind
 * @details kinds are plain names. Conditions bridged from C++ exceptions use the demangled type name
 * (e.g. "std::invalid_argument") as their kind.
 */
using error_kind = std::string;

/**
 * @brief builtin error kinds
 */
namespace kinds {

using namespace std::string_view_literals;

/// @brief the requested target does not exist
static constexpr std::string_view not_found = "not_found"sv;

/// @brief the request input is malformed or violates constraints
static constexpr std::string_view validation = "validation"sv;

/// @brief the requester is not authenticated or not permitted
static constexpr std::string_view unauthorized = "unauthorized"sv;

/// @brief the request conflicts with the current state of the target
static constexpr std::string_view conflict = "conflict"sv;

/// @brief unexpected failure, also the catch-all kind
static constexpr std::string_view internal = "internal"sv;

/// @brief alias of not_found, declared with not_found as its supertype
static constexpr std::string_view not_found_alias = "NotFound"sv;

/// @brief alias of validation, declared with validation as its supertype
static constexpr std::string_view validation_alias = "Validation"sv;

/// @brief alias of unauthorized, declared with unauthorized as its supertype
static constexpr std::string_view unauthorized_alias = "Unauthorized"sv;

/// @brief alias of conflict, declared with conflict as its supertype
static constexpr std::string_view conflict_alias = "Conflict"sv;

/// @brief alias of internal, declared with internal as its supertype
static constexpr std::string_view internal_alias = "Internal"sv;

}  // namespace kinds

}  // namespace tsuyaku
