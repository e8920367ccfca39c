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
#include <tsuyaku/exception_bridge.h>

#include <any>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <typeinfo>
#include <variant>
#include <vector>
#include <boost/core/demangle.hpp>
#include <glog/logging.h>

#include <tsuyaku/error_kind.h>
#include <tsuyaku/logging.h>

namespace tsuyaku {

constexpr static std::string_view log_location_prefix = "/:tsuyaku:exception_bridge ";

namespace {

struct standard_type {
    std::string_view name_;
    std::type_info const& type_;
    bool (*derives_)(std::exception const&) noexcept;
};

template <class T>
bool derives_from(std::exception const& e) noexcept {
    return dynamic_cast<T const*>(std::addressof(e)) != nullptr;
}

template <class T>
standard_type entry(std::string_view name) noexcept {
    return standard_type{name, typeid(T), &derives_from<T>};
}

// ordered so that derived types come before their bases
std::vector<standard_type> const& standard_types() {
    static const std::vector<standard_type> types{
        entry<std::filesystem::filesystem_error>("std::filesystem::filesystem_error"),
        entry<std::system_error>("std::system_error"),
        entry<std::range_error>("std::range_error"),
        entry<std::overflow_error>("std::overflow_error"),
        entry<std::underflow_error>("std::underflow_error"),
        entry<std::runtime_error>("std::runtime_error"),
        entry<std::future_error>("std::future_error"),
        entry<std::invalid_argument>("std::invalid_argument"),
        entry<std::domain_error>("std::domain_error"),
        entry<std::length_error>("std::length_error"),
        entry<std::out_of_range>("std::out_of_range"),
        entry<std::logic_error>("std::logic_error"),
        entry<std::bad_array_new_length>("std::bad_array_new_length"),
        entry<std::bad_alloc>("std::bad_alloc"),
        entry<std::bad_any_cast>("std::bad_any_cast"),
        entry<std::bad_cast>("std::bad_cast"),
        entry<std::bad_typeid>("std::bad_typeid"),
        entry<std::bad_function_call>("std::bad_function_call"),
        entry<std::bad_weak_ptr>("std::bad_weak_ptr"),
        entry<std::bad_optional_access>("std::bad_optional_access"),
        entry<std::bad_variant_access>("std::bad_variant_access"),
        entry<std::bad_exception>("std::bad_exception"),
        entry<std::exception>("std::exception"),
    };
    return types;
}

error_condition convert(std::exception_ptr const& ep, kind_hierarchy const* known, std::size_t depth) {
    error_condition ret{};
    std::exception_ptr nested{};
    try {
        std::rethrow_exception(ep);
    } catch (raised_error const& e) {
        ret = e.condition();
        if(auto* n = dynamic_cast<std::nested_exception const*>(std::addressof(e)); n != nullptr) {
            nested = n->nested_ptr();
        }
    } catch (std::exception const& e) {
        auto kind = exception_kind(e);
        if(known != nullptr && ! known->contains(kind)) {
            kind = standard_exception_kind(e);
        }
        ret = error_condition{kind, e.what()};
        if(auto* n = dynamic_cast<std::nested_exception const*>(std::addressof(e)); n != nullptr) {
            nested = n->nested_ptr();
        }
    } catch (std::nested_exception const& e) {
        ret = error_condition{kinds::internal, "unknown exception"};
        nested = e.nested_ptr();
    } catch (...) {
        ret = error_condition{kinds::internal, "unknown exception"};
    }
    if(nested && ! ret.cause()) {
        if(depth < max_nested_exception_depth) {
            ret.cause(std::make_shared<error_condition const>(convert(nested, known, depth + 1)));
        } else {
            VLOG(log_debug) << log_location_prefix << "nested exceptions deeper than "
                << max_nested_exception_depth << " are dropped from the cause chain";
        }
    }
    return ret;
}

}  // namespace

void raise_error(std::string_view kind, std::string_view message, nlohmann::json details) {
    error_condition cond{kind, message};
    cond.details(std::move(details));
    throw raised_error{std::move(cond)};
}

std::string_view standard_exception_kind(std::exception const& e) noexcept {
    for(auto const& t : standard_types()) {
        if(t.derives_(e)) {
            return t.name_;
        }
    }
    return "std::exception";
}

std::string exception_kind(std::exception const& e) {
    auto const& dynamic_type = typeid(e);
    for(auto const& t : standard_types()) {
        if(t.type_ == dynamic_type) {
            return std::string{t.name_};
        }
    }
    auto name = boost::core::demangle(dynamic_type.name());
    // library internal types such as the one created by std::throw_with_nested
    if(name.rfind("std::", 0) == 0) {
        return std::string{standard_exception_kind(e)};
    }
    return name;
}

error_condition condition_from_exception(
    std::exception_ptr const& ep,
    kind_hierarchy const* known
) noexcept {
    if(! ep) {
        return error_condition{kinds::internal, "no exception"};
    }
    try {
        return convert(ep, known, 0);
    } catch (std::exception const& e) {
        LOG(ERROR) << log_location_prefix << "failed to convert exception to error condition: " << e.what();
    }
    return error_condition{kinds::internal, {}};
}

error_condition condition_from_current_exception(kind_hierarchy const* known) noexcept {
    return condition_from_exception(std::current_exception(), known);
}

void register_standard_exceptions(kind_hierarchy& hierarchy) {
    hierarchy.add(kinds::validation);
    hierarchy.add("std::exception");

    hierarchy.add("std::logic_error", {"std::exception"});
    hierarchy.add("std::invalid_argument", {"std::logic_error", error_kind{kinds::validation}});
    hierarchy.add("std::domain_error", {"std::logic_error", error_kind{kinds::validation}});
    hierarchy.add("std::length_error", {"std::logic_error", error_kind{kinds::validation}});
    hierarchy.add("std::out_of_range", {"std::logic_error", error_kind{kinds::validation}});
    hierarchy.add("std::future_error", {"std::logic_error"});

    hierarchy.add("std::runtime_error", {"std::exception"});
    hierarchy.add("std::range_error", {"std::runtime_error"});
    hierarchy.add("std::overflow_error", {"std::runtime_error"});
    hierarchy.add("std::underflow_error", {"std::runtime_error"});
    hierarchy.add("std::system_error", {"std::runtime_error"});
    hierarchy.add("std::filesystem::filesystem_error", {"std::system_error"});

    hierarchy.add("std::bad_alloc", {"std::exception"});
    hierarchy.add("std::bad_array_new_length", {"std::bad_alloc"});
    hierarchy.add("std::bad_cast", {"std::exception"});
    hierarchy.add("std::bad_any_cast", {"std::bad_cast"});
    hierarchy.add("std::bad_typeid", {"std::exception"});
    hierarchy.add("std::bad_function_call", {"std::exception"});
    hierarchy.add("std::bad_weak_ptr", {"std::exception"});
    hierarchy.add("std::bad_optional_access", {"std::exception"});
    hierarchy.add("std::bad_variant_access", {"std::exception"});
    hierarchy.add("std::bad_exception", {"std::exception"});
}

}  // namespace tsuyaku
