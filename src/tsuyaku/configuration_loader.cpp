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
#include <tsuyaku/configuration_loader.h>

#include <charconv>
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <glog/logging.h>

#include <takatori/util/exception.h>
#include <takatori/util/string_builder.h>

#include <tsuyaku/exception_bridge.h>
#include <tsuyaku/logging.h>
#include <tsuyaku/setup_exception.h>

namespace tsuyaku {

using takatori::util::string_builder;
using takatori::util::throw_exception;

constexpr static std::string_view log_location_prefix = "/:tsuyaku:configuration_loader ";

namespace {

[[noreturn]] void invalid_value(std::string_view key, std::string_view value, std::string_view expected) {
    throw_exception(setup_exception{
        setup_error::config_invalid_value,
        string_builder{} << "invalid configuration value " << key << "=\"" << value << "\" ("
            << expected << " is expected)" << string_builder::to_string
    });
}

std::optional<std::string> get_value(boost::property_tree::ptree const& section, std::string_view key) {
    if(auto v = section.get_optional<std::string>(std::string{key})) {
        return boost::trim_copy(*v);
    }
    return {};
}

template <class T>
T parse_integer(std::string_view key, std::string const& value) {
    T ret{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ret);  //NOLINT
    if(ec != std::errc{} || ptr != value.data() + value.size()) {  //NOLINT
        invalid_value(key, value, "integer");
    }
    return ret;
}

bool parse_bool(std::string_view key, std::string const& value) {
    if(boost::iequals(value, "true")) {
        return true;
    }
    if(boost::iequals(value, "false")) {
        return false;
    }
    invalid_value(key, value, "true or false");
}

// ini values are trimmed, so the value quoted with double quotes keeps its surrounding blanks
std::string unquote(std::string const& value) {
    if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() > prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

boost::property_tree::ptree read_configuration_file(std::string_view path) {
    boost::property_tree::ptree pt{};
    try {
        boost::property_tree::ini_parser::read_ini(std::string{path}, pt);
    } catch (boost::property_tree::ini_parser_error const& e) {
        throw_exception(setup_exception{
            setup_error::config_io_error,
            string_builder{} << "failed to read configuration file \"" << path << "\": " << e.what()
                << string_builder::to_string
        });
    }
    VLOG(log_debug) << log_location_prefix << "configuration file read path:" << path;
    return pt;
}

std::shared_ptr<configuration> configuration_from_tree(boost::property_tree::ptree const& pt) {
    auto ret = std::make_shared<configuration>();
    auto sec = pt.get_child_optional(std::string{configuration_section});
    if(! sec) {
        return ret;
    }
    if(auto v = get_value(*sec, "default_status")) {
        auto st = parse_integer<status_code>("default_status", *v);
        if(! is_valid_status(st)) {
            invalid_value("default_status", *v, "status code in [100, 599]");
        }
        ret->default_status(st);
    }
    if(auto v = get_value(*sec, "default_message_prefix")) {
        ret->default_message_prefix(unquote(*v));
    }
    if(auto v = get_value(*sec, "expose_cause_chain")) {
        ret->expose_cause_chain(parse_bool("expose_cause_chain", *v));
    }
    if(auto v = get_value(*sec, "max_cause_depth")) {
        ret->max_cause_depth(parse_integer<std::size_t>("max_cause_depth", *v));
    }
    if(auto v = get_value(*sec, "log_translations")) {
        ret->log_translations(parse_bool("log_translations", *v));
    }
    VLOG(log_info) << log_location_prefix << "configuration " << *ret;
    return ret;
}

std::shared_ptr<configuration> load_configuration(std::string_view path) {
    return configuration_from_tree(read_configuration_file(path));
}

void add_registrations_from_tree(boost::property_tree::ptree const& pt, registry_builder& builder) {
    for(auto const& [name, section] : pt) {
        if(! starts_with(name, kind_section_prefix)) {
            continue;
        }
        auto kind = name.substr(kind_section_prefix.size());
        std::vector<error_kind> supertypes{};
        if(auto v = get_value(section, "supertypes"); v && ! v->empty()) {
            boost::split(supertypes, *v, boost::is_any_of(","));
            for(auto& s : supertypes) {
                boost::trim(s);
            }
        }
        builder.hierarchy().add(kind, supertypes);
    }
    for(auto const& [name, section] : pt) {
        if(! starts_with(name, handler_section_prefix)) {
            continue;
        }
        auto kind = name.substr(handler_section_prefix.size());
        auto v = get_value(section, "status");
        if(! v) {
            throw_exception(setup_exception{
                setup_error::config_invalid_value,
                string_builder{} << "section [" << name << "] requires status" << string_builder::to_string
            });
        }
        builder.add(kind, parse_integer<status_code>(name + ".status", *v));
        VLOG(log_debug) << log_location_prefix << "handler configured kind:" << kind << " status:" << *v;
    }
}

std::shared_ptr<handler_registry const> registry_from_configuration(std::string_view path) {
    auto pt = read_configuration_file(path);
    registry_builder configured{};
    register_standard_exceptions(configured.hierarchy());
    add_registrations_from_tree(pt, configured);

    // builtin registrations apply only to the kinds not configured by the file
    auto defaults = default_registry();
    for(auto const& reg : defaults->registrations()) {
        if(! configured.contains(reg.kind())) {
            configured.add(reg.kind(), reg.status());
        }
    }
    return configured.build();
}

}  // namespace tsuyaku
