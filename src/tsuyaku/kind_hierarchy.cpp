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
#include <tsuyaku/kind_hierarchy.h>

#include <algorithm>
#include <deque>
#include <set>
#include <utility>
#include <glog/logging.h>

#include <takatori/util/exception.h>
#include <takatori/util/string_builder.h>

#include <tsuyaku/logging.h>
#include <tsuyaku/setup_exception.h>

namespace tsuyaku {

using takatori::util::string_builder;
using takatori::util::throw_exception;

constexpr static std::string_view log_location_prefix = "/:tsuyaku:kind_hierarchy ";

void kind_hierarchy::declare(std::string_view kind) {
    if(kind.empty()) {
        throw_exception(setup_exception{setup_error::invalid_kind, "error kind must not be empty"});
    }
    if(supertypes_.find(kind) != supertypes_.end()) {
        return;
    }
    supertypes_.emplace(error_kind{kind}, std::vector<error_kind>{});
    kinds_.emplace_back(kind);
}

kind_hierarchy& kind_hierarchy::add(std::string_view kind, std::vector<error_kind> const& supertypes) {
    if(kind.empty()) {
        throw_exception(setup_exception{setup_error::invalid_kind, "error kind must not be empty"});
    }
    // reject the whole declaration before anything is applied
    for(auto const& s : supertypes) {
        if(s.empty()) {
            throw_exception(setup_exception{
                setup_error::invalid_kind,
                string_builder{} << "empty supertype given for error kind \"" << kind << "\"" << string_builder::to_string
            });
        }
        // adding kind -> s creates a cycle iff kind is already an ancestor of s
        if(is_a(s, kind)) {
            throw_exception(setup_exception{
                setup_error::hierarchy_cycle,
                string_builder{} << "declaring \"" << s << "\" as supertype of \"" << kind
                    << "\" makes the kind hierarchy cyclic" << string_builder::to_string
            });
        }
    }
    declare(kind);
    for(auto const& s : supertypes) {
        declare(s);
        auto& sups = supertypes_.find(kind)->second;
        if(std::find(sups.begin(), sups.end(), s) == sups.end()) {
            sups.emplace_back(s);
            VLOG(log_trace) << log_location_prefix << "supertype declared kind:" << kind << " supertype:" << s;
        }
    }
    return *this;
}

bool kind_hierarchy::contains(std::string_view kind) const noexcept {
    return supertypes_.find(kind) != supertypes_.end();
}

std::vector<error_kind> const& kind_hierarchy::supertypes(std::string_view kind) const noexcept {
    static const std::vector<error_kind> empty{};
    if(auto it = supertypes_.find(kind); it != supertypes_.end()) {
        return it->second;
    }
    return empty;
}

std::vector<kind_ancestor> kind_hierarchy::ancestors(std::string_view kind) const {
    std::vector<kind_ancestor> ret{};
    std::set<error_kind, std::less<>> visited{};
    std::deque<kind_ancestor> queue{};
    queue.push_back(kind_ancestor{error_kind{kind}, 0});
    while(! queue.empty()) {
        auto cur = std::move(queue.front());
        queue.pop_front();
        if(! visited.emplace(cur.kind).second) {
            continue;
        }
        if(auto it = supertypes_.find(cur.kind); it != supertypes_.end()) {
            for(auto const& s : it->second) {
                queue.push_back(kind_ancestor{s, cur.distance + 1});
            }
        }
        ret.emplace_back(std::move(cur));
    }
    return ret;
}

bool kind_hierarchy::is_a(std::string_view kind, std::string_view ancestor) const {
    if(kind == ancestor) {
        return true;
    }
    for(auto const& a : ancestors(kind)) {
        if(a.kind == ancestor) {
            return true;
        }
    }
    return false;
}

std::vector<error_kind> const& kind_hierarchy::kinds() const noexcept {
    return kinds_;
}

std::size_t kind_hierarchy::size() const noexcept {
    return kinds_.size();
}

kind_hierarchy builtin_hierarchy() {
    kind_hierarchy ret{};
    ret.add(kinds::not_found);
    ret.add(kinds::validation);
    ret.add(kinds::unauthorized);
    ret.add(kinds::conflict);
    ret.add(kinds::internal);
    ret.add(kinds::not_found_alias, {error_kind{kinds::not_found}});
    ret.add(kinds::validation_alias, {error_kind{kinds::validation}});
    ret.add(kinds::unauthorized_alias, {error_kind{kinds::unauthorized}});
    ret.add(kinds::conflict_alias, {error_kind{kinds::conflict}});
    ret.add(kinds::internal_alias, {error_kind{kinds::internal}});
    return ret;
}

std::ostream& operator<<(std::ostream& out, kind_hierarchy const& value) {
    out << "kind_hierarchy{";
    bool first = true;
    for(auto const& k : value.kinds()) {
        if(! first) {
            out << " ";
        }
        first = false;
        out << k;
        auto const& sups = value.supertypes(k);
        if(! sups.empty()) {
            out << ":[";
            for(std::size_t i = 0, n = sups.size(); i < n; ++i) {
                if(i != 0) {
                    out << ",";
                }
                out << sups[i];
            }
            out << "]";
        }
    }
    return out << "}";
}

}  // namespace tsuyaku
