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
#include <tsuyaku/handler_registry.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <utility>
#include <glog/logging.h>

#include <takatori/util/exception.h>
#include <takatori/util/string_builder.h>

#include <tsuyaku/logging.h>
#include <tsuyaku/setup_exception.h>

namespace tsuyaku {

using takatori::util::string_builder;
using takatori::util::throw_exception;

constexpr static std::string_view log_location_prefix = "/:tsuyaku:handler_registry ";

handler_registration::handler_registration(
    error_kind kind,
    status_code status,
    body_builder builder,
    std::size_t order
) noexcept :
    kind_(std::move(kind)),
    status_(status),
    builder_(std::move(builder)),
    order_(order)
{}

nlohmann::json handler_registration::build_body(error_condition const& cond) const {
    if(! builder_) {
        return {};
    }
    return builder_(cond);
}

handler_registration const* handler_registry::find(std::string_view kind) const noexcept {
    if(auto it = table_.find(kind); it != table_.end()) {
        return std::addressof(registrations_[it->second]);
    }
    return nullptr;
}

std::vector<handler_registration> const& handler_registry::registrations() const noexcept {
    return registrations_;
}

kind_hierarchy const& handler_registry::hierarchy() const noexcept {
    return hierarchy_;
}

std::size_t handler_registry::resolved_count() const noexcept {
    return table_.size();
}

registry_builder::registry_builder() :
    hierarchy_(builtin_hierarchy())
{}

registry_builder::registry_builder(kind_hierarchy hierarchy) noexcept :
    hierarchy_(std::move(hierarchy))
{}

registry_builder& registry_builder::add(std::string_view kind, status_code status, body_builder builder) {
    if(kind.empty()) {
        throw_exception(setup_exception{setup_error::invalid_kind, "handler registration requires non-empty kind"});
    }
    if(! is_valid_status(status)) {
        throw_exception(setup_exception{
            setup_error::invalid_status,
            string_builder{} << "status code " << status << " registered for kind \"" << kind
                << "\" is out of range [" << status_code_min << ", " << status_code_max << "]"
                << string_builder::to_string
        });
    }
    registrations_.emplace_back(error_kind{kind}, status, std::move(builder), registrations_.size());
    return *this;
}

kind_hierarchy& registry_builder::hierarchy() noexcept {
    return hierarchy_;
}

std::size_t registry_builder::size() const noexcept {
    return registrations_.size();
}

bool registry_builder::contains(std::string_view kind) const noexcept {
    return std::any_of(registrations_.begin(), registrations_.end(), [&](auto const& r) {
        return r.kind() == kind;
    });
}

std::shared_ptr<handler_registry const> registry_builder::build() const {
    auto ret = std::make_shared<handler_registry>();
    ret->registrations_ = registrations_;
    ret->hierarchy_ = hierarchy_;
    auto& h = ret->hierarchy_;

    // first registration for each kind, later ones are shadowed
    std::map<error_kind, std::size_t, std::less<>> exact{};
    for(auto const& r : ret->registrations_) {
        h.add(r.kind());
        if(auto [it, inserted] = exact.emplace(r.kind(), r.order()); ! inserted) {
            LOG(WARNING) << log_location_prefix << "handler registration for kind \"" << r.kind()
                << "\" (status:" << r.status() << ") is shadowed by the earlier registration (status:"
                << ret->registrations_[it->second].status() << ")";
        }
    }

    for(auto const& kind : h.kinds()) {
        constexpr auto npos = std::numeric_limits<std::size_t>::max();
        std::size_t best = npos;
        std::size_t best_distance = npos;
        for(auto const& a : h.ancestors(kind)) {
            if(a.distance > best_distance) {
                break;
            }
            auto it = exact.find(a.kind);
            if(it == exact.end()) {
                continue;
            }
            if(best == npos || it->second < best) {
                best = it->second;
                best_distance = a.distance;
            }
        }
        if(best != npos) {
            ret->table_.emplace(kind, best);
            VLOG(log_trace) << log_location_prefix << "kind:" << kind << " resolved to "
                << ret->registrations_[best] << " distance:" << best_distance;
        }
    }
    VLOG(log_debug) << log_location_prefix << "handler registry built registrations:" << ret->registrations_.size()
        << " kinds:" << h.size() << " resolved:" << ret->table_.size();
    return ret;
}

registry_builder default_registry_builder() {
    registry_builder ret{};
    ret.add(kinds::not_found, status_not_found);
    ret.add(kinds::validation, status_bad_request);
    ret.add(kinds::unauthorized, status_unauthorized);
    ret.add(kinds::conflict, status_conflict);
    ret.add(kinds::internal, status_internal_server_error);
    return ret;
}

std::shared_ptr<handler_registry const> default_registry() {
    return default_registry_builder().build();
}

std::ostream& operator<<(std::ostream& out, handler_registration const& value) {
    return out << "handler_registration "
        << "kind:" << value.kind() << " "
        << "status:" << value.status() << " "
        << "order:" << value.order() << " "
        << "builder:" << (value.has_builder() ? "yes" : "no");  //NOLINT
}

}  // namespace tsuyaku
