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

#include <memory>
#include <string_view>

#include <boost/property_tree/ptree.hpp>

#include <tsuyaku/configuration.h>
#include <tsuyaku/handler_registry.h>

namespace tsuyaku {

/**
 * @brief section name of the translator settings
 */
constexpr static std::string_view configuration_section = "tsuyaku";

/**
 * @brief prefix of the section names declaring kinds, followed by the kind name
 */
constexpr static std::string_view kind_section_prefix = "kind.";

/**
 * @brief prefix of the section names registering handlers, followed by the kind name
 */
constexpr static std::string_view handler_section_prefix = "handler.";

/**
 * @brief read the ini file
 * @param path the path of the ini file
 * @return the property tree read from the file
 * @throws setup_exception with setup_error::config_io_error if the file cannot be read or parsed
 */
[[nodiscard]] boost::property_tree::ptree read_configuration_file(std::string_view path);

/**
 * @brief create the configuration from the property tree
 * @details the values in the `[tsuyaku]` section override the defaults:
 * - default_status
 * - default_message_prefix (enclose with double quotes to keep leading or trailing blanks)
 * - expose_cause_chain
 * - max_cause_depth
 * - log_translations
 * @param pt the property tree
 * @throws setup_exception with setup_error::config_invalid_value if a value is malformed
 */
[[nodiscard]] std::shared_ptr<configuration> configuration_from_tree(boost::property_tree::ptree const& pt);

/**
 * @brief load the configuration from the ini file
 * @param path the path of the ini file
 * @throws setup_exception on io error or malformed value
 */
[[nodiscard]] std::shared_ptr<configuration> load_configuration(std::string_view path);

/**
 * @brief add the kinds and handlers in the property tree to the builder
 * @details `[kind.<name>]` sections declare the kind with the comma separated `supertypes`, and
 * `[handler.<name>]` sections register the handler with the `status` for the kind. Sections are processed in
 * the order they appear, kinds first.
 * @param pt the property tree
 * @param builder the builder to add to
 * @throws setup_exception if a section is malformed
 */
void add_registrations_from_tree(boost::property_tree::ptree const& pt, registry_builder& builder);

/**
 * @brief build the registry from the default registrations and the ones in the ini file
 * @details the standard exception kinds are declared with register_standard_exceptions() before the file is read
 * @param path the path of the ini file
 * @throws setup_exception on io error or malformed section
 */
[[nodiscard]] std::shared_ptr<handler_registry const> registry_from_configuration(std::string_view path);

}  // namespace tsuyaku
