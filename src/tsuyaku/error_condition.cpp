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
#include <tsuyaku/error_condition.h>

#include <utility>

namespace tsuyaku {

error_condition::error_condition(
    std::string_view kind,
    std::string_view message
) :
    kind_(kind),
    message_(message)
{}

error_condition::error_condition(
    std::string_view kind,
    std::string_view message,
    std::shared_ptr<error_condition const> cause
) :
    kind_(kind),
    message_(message),
    cause_(std::move(cause))
{}

error_kind const& error_condition::kind() const noexcept {
    return kind_;
}

std::string_view error_condition::message() const noexcept {
    return message_;
}

std::shared_ptr<error_condition const> const& error_condition::cause() const noexcept {
    return cause_;
}

error_condition& error_condition::cause(std::shared_ptr<error_condition const> arg) noexcept {
    cause_ = std::move(arg);
    return *this;
}

nlohmann::json const& error_condition::details() const noexcept {
    return details_;
}

error_condition& error_condition::details(nlohmann::json arg) noexcept {
    details_ = std::move(arg);
    return *this;
}

std::vector<std::string> error_condition::cause_messages(std::size_t max_depth) const {
    std::vector<std::string> ret{};
    auto const* cur = cause_.get();
    while(cur != nullptr && ret.size() < max_depth) {
        ret.emplace_back(cur->message());
        cur = cur->cause().get();
    }
    return ret;
}

bool operator==(error_condition const& a, error_condition const& b) noexcept {
    if(a.kind() != b.kind() || a.message() != b.message() || a.details() != b.details()) {
        return false;
    }
    auto const& ca = a.cause();
    auto const& cb = b.cause();
    if(! ca || ! cb) {
        return ! ca && ! cb;
    }
    return *ca == *cb;
}

bool operator!=(error_condition const& a, error_condition const& b) noexcept {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& out, error_condition const& value) {
    out << "error_condition "
        << "kind:" << value.kind() << " "
        << "message:\"" << value.message() << "\"";
    if(! value.details().is_null()) {
        out << " details:" << value.details().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    if(auto const& c = value.cause(); c) {
        out << " cause:{" << *c << "}";
    }
    return out;
}

}  // namespace tsuyaku
