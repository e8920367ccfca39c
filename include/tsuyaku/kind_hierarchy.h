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
#include <functional>
#include <map>
#include <ostream>
#include <string_view>
#include <vector>

#include <tsuyaku/error_kind.h>

namespace tsuyaku {

/**
 * @brief ancestor entry of the kind
 */
struct kind_ancestor {
    /// @brief the ancestor kind (the kind itself for distance 0)
    error_kind kind{};

    /// @brief number of supertype edges from the origin kind
    std::size_t distance{};
};

/**
 * @brief kind hierarchy
 * @details the set of error kinds and their supertypes. A kind can have multiple direct supertypes.
 * The hierarchy is built at process start before the handler registry is built from it, and is not
 * modified afterwards.
 */
class kind_hierarchy {
public:
    /**
     * @brief create empty object
     */
    kind_hierarchy() = default;

    /**
     * @brief declare the kind and its direct supertypes
     * @details supertypes not yet declared are declared implicitly as root kinds. Declaring the kind again
     * appends new supertypes. A rejected declaration leaves the hierarchy unchanged.
     * @param kind the kind to declare
     * @param supertypes direct supertypes of the kind
     * @return this object
     * @throws setup_exception if the kind name is empty, or the declaration introduces a cycle
     */
    kind_hierarchy& add(std::string_view kind, std::vector<error_kind> const& supertypes = {});

    /**
     * @brief returns whether the kind is declared
     */
    [[nodiscard]] bool contains(std::string_view kind) const noexcept;

    /**
     * @brief returns the direct supertypes of the kind
     * @return supertypes in declaration order, or empty if the kind is unknown or a root
     */
    [[nodiscard]] std::vector<error_kind> const& supertypes(std::string_view kind) const noexcept;

    /**
     * @brief list the kind and all of its ancestors
     * @details the list is ordered by distance from the kind (breadth first), and the supertypes at the same
     * level keep their declaration order. Each ancestor appears once with its shortest distance.
     * Unknown kind yields the kind itself only.
     */
    [[nodiscard]] std::vector<kind_ancestor> ancestors(std::string_view kind) const;

    /**
     * @brief returns whether `ancestor` is the kind itself or one of its ancestors
     */
    [[nodiscard]] bool is_a(std::string_view kind, std::string_view ancestor) const;

    /**
     * @brief list the declared kinds in declaration order
     */
    [[nodiscard]] std::vector<error_kind> const& kinds() const noexcept;

    /**
     * @brief returns number of the declared kinds
     */
    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::vector<error_kind> kinds_{};
    std::map<error_kind, std::vector<error_kind>, std::less<>> supertypes_{};

    void declare(std::string_view kind);
};

/**
 * @brief create the hierarchy holding the builtin kinds
 * @details not_found, validation, unauthorized, conflict and internal are declared as root kinds, and
 * NotFound, Validation, Unauthorized, Conflict and Internal as their aliases (direct subkinds)
 */
[[nodiscard]] kind_hierarchy builtin_hierarchy();

/**
 * @brief appends string representation of the given value.
 * @param out the target output
 * @param value the target value
 * @return the output
 */
std::ostream& operator<<(std::ostream& out, kind_hierarchy const& value);

}  // namespace tsuyaku
