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
#include <tsuyaku/translator.h>

#include <string>
#include <utility>
#include <glog/logging.h>

#include <takatori/util/string_builder.h>

#include <tsuyaku/logging.h>

namespace tsuyaku {

using takatori::util::string_builder;

constexpr static std::string_view log_location_prefix = "/:tsuyaku:translator ";

translator::translator() :
    translator(default_registry())
{}

translator::translator(
    std::shared_ptr<handler_registry const> registry,
    std::shared_ptr<configuration const> cfg,
    std::shared_ptr<log_sink> sink
) :
    registry_(registry ? std::move(registry) : default_registry()),
    cfg_(cfg ? std::move(cfg) : std::make_shared<configuration const>()),
    sink_(sink ? std::move(sink) : std::make_shared<glog_log_sink>())
{}

static std::string strip_separator(std::string_view prefix) {
    auto pos = prefix.find_last_not_of(": ");
    if(pos == std::string_view::npos) {
        return {};
    }
    return std::string{prefix.substr(0, pos + 1)};
}

void translator::add_causes(error_condition const& cond, nlohmann::json& body) const {
    if(! cfg_->expose_cause_chain() || ! cond.cause()) {
        return;
    }
    auto msgs = cond.cause_messages(cfg_->max_cause_depth());
    if(msgs.empty()) {
        return;
    }
    if(body.is_null()) {
        body = nlohmann::json::object();
    }
    body["causes"] = std::move(msgs);
}

error_response translator::default_response(
    error_condition const& cond,
    error_response::clock::time_point timestamp
) const noexcept {
    std::string msg{};
    if(cond.message().empty()) {
        msg = strip_separator(cfg_->default_message_prefix());
        if(msg.empty()) {
            msg = reason_phrase(cfg_->default_status());
        }
    } else {
        msg = string_builder{} << cfg_->default_message_prefix() << cond.message() << string_builder::to_string;
    }
    nlohmann::json body{};
    add_causes(cond, body);
    return {cfg_->default_status(), std::move(msg), std::move(body), timestamp};
}

error_response translator::translate(error_condition const& cond) const noexcept {
    auto now = error_response::clock::now();
    auto const* reg = registry_->find(cond.kind());
    if(reg == nullptr) {
        VLOG(log_trace) << log_location_prefix << "no registration matched kind:" << cond.kind();
        return default_response(cond, now);
    }
    try {
        auto body = reg->build_body(cond);
        if(! body.is_null() && ! body.is_object()) {
            sink_->internal_failure(
                cond,
                string_builder{} << "body builder for kind \"" << reg->kind() << "\" returned json "
                    << body.type_name() << " where object is expected" << string_builder::to_string,
                nullptr
            );
            return default_response(cond, now);
        }
        add_causes(cond, body);
        std::string msg{cond.message()};
        if(msg.empty()) {
            msg = reason_phrase(reg->status());
        }
        return {reg->status(), std::move(msg), std::move(body), now};
    } catch (std::exception const& e) {
        sink_->internal_failure(
            cond,
            string_builder{} << "body builder for kind \"" << reg->kind() << "\" failed: " << e.what()
                << string_builder::to_string,
            &e
        );
    } catch (...) {
        sink_->internal_failure(
            cond,
            string_builder{} << "body builder for kind \"" << reg->kind() << "\" threw non-standard exception"
                << string_builder::to_string,
            nullptr
        );
    }
    return default_response(cond, now);
}

}  // namespace tsuyaku
