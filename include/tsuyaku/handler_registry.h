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
#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <tsuyaku/error_condition.h>
#include <tsuyaku/error_kind.h>
#include <tsuyaku/kind_hierarchy.h>
#include <tsuyaku/status_code.h>

namespace tsuyaku {

/**
 * @brief response body builder
 * @details builds the structured fields of the response from the condition. The result must be a json object,
 * or null json for no structured fields. The builder may throw, and the translator handles the failure.
 */
using body_builder = std::function<nlohmann::json(error_condition const&)>;

/**
 * @brief handler registration
 * @details the association between the error kind and how to build its response
 */
class handler_registration {
public:
    /**
     * @brief create new object
     * @param kind the kind handled by this registration
     * @param status the status code of the response
     * @param builder the body builder, or empty function for no structured fields
     * @param order the registration order
     */
    handler_registration(
        error_kind kind,
        status_code status,
        body_builder builder,
        std::size_t order
    ) noexcept;

    [[nodiscard]] error_kind const& kind() const noexcept {
        return kind_;
    }

    [[nodiscard]] status_code status() const noexcept {
        return status_;
    }

    [[nodiscard]] bool has_builder() const noexcept {
        return static_cast<bool>(builder_);
    }

    /**
     * @brief accessor to the registration order
     * @return zero-origin index of the registration in the registry
     */
    [[nodiscard]] std::size_t order() const noexcept {
        return order_;
    }

    /**
     * @brief build the structured fields for the condition
     * @return the builder result, or null json if this registration has no builder
     * @throws any exception the builder throws
     */
    [[nodiscard]] nlohmann::json build_body(error_condition const& cond) const;

private:
    error_kind kind_{};
    status_code status_{};
    body_builder builder_{};
    std::size_t order_{};
};

/**
 * @brief handler registry
 * @details immutable table resolving each error kind to the registration for its most specific registered
 * ancestor. The object is created by registry_builder::build() and shared read-only by all request handling
 * threads, so no locking is required.
 */
class handler_registry {
public:
    /**
     * @brief find the resolved registration for the kind
     * @param kind the kind of the condition
     * @return the registration, or nullptr if the kind resolves to the default handler
     */
    [[nodiscard]] handler_registration const* find(std::string_view kind) const noexcept;

    /**
     * @brief accessor to the registrations in registration order
     */
    [[nodiscard]] std::vector<handler_registration> const& registrations() const noexcept;

    /**
     * @brief accessor to the hierarchy the table is resolved from
     */
    [[nodiscard]] kind_hierarchy const& hierarchy() const noexcept;

    /**
     * @brief returns number of the kinds resolved to a registration
     */
    [[nodiscard]] std::size_t resolved_count() const noexcept;

private:
    std::vector<handler_registration> registrations_{};
    kind_hierarchy hierarchy_{};
    std::map<error_kind, std::size_t, std::less<>> table_{};

    friend class registry_builder;
};

/**
 * @brief handler registry builder
 * @details collects handler registrations at process start, and resolves them into handler_registry.
 */
class registry_builder {
public:
    /**
     * @brief create new object with the builtin hierarchy
     */
    registry_builder();

    /**
     * @brief create new object
     * @param hierarchy the kind hierarchy used to resolve the most specific registration
     */
    explicit registry_builder(kind_hierarchy hierarchy) noexcept;

    /**
     * @brief add registration
     * @details registering the same kind twice is allowed, but the first registration is used.
     * @param kind the kind to handle
     * @param status the status code of the response
     * @param builder the body builder, or empty function for no structured fields
     * @return this object
     * @throws setup_exception if the kind is empty or the status is out of range
     */
    registry_builder& add(std::string_view kind, status_code status, body_builder builder = {});

    /**
     * @brief accessor to the hierarchy
     * @details use this to declare kinds and supertypes before build()
     */
    [[nodiscard]] kind_hierarchy& hierarchy() noexcept;

    /**
     * @brief returns number of the registrations added so far
     */
    [[nodiscard]] std::size_t size() const noexcept;

    /**
     * @brief returns whether the kind has registration added so far
     */
    [[nodiscard]] bool contains(std::string_view kind) const noexcept;

    /**
     * @brief resolve the registrations
     * @details for each kind, the registrations on its ancestors are the candidates, and the one nearest to
     * the kind wins. Candidates with equal distance are ordered by registration order, first wins.
     * Kinds of registrations missing from the hierarchy are declared as root kinds.
     * @return the immutable registry
     */
    [[nodiscard]] std::shared_ptr<handler_registry const> build() const;

private:
    kind_hierarchy hierarchy_{};
    std::vector<handler_registration> registrations_{};
};

/**
 * @brief create the builder with the builtin registrations
 * @details not_found:404, validation:400, unauthorized:401, conflict:409 and internal:500 are registered
 * without body builders. Callers can add more registrations before building.
 */
[[nodiscard]] registry_builder default_registry_builder();

/**
 * @brief create the registry with the builtin registrations
 */
[[nodiscard]] std::shared_ptr<handler_registry const> default_registry();

/**
 * @brief appends string representation of the given value.
 * @param out the target output
 * @param value the target value
 * @return the output
 */
std::ostream& operator<<(std::ostream& out, handler_registration const& value);

}  // namespace tsuyaku
