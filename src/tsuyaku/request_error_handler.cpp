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
#include <tsuyaku/request_error_handler.h>

#include <string>
#include <utility>
#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include <tsuyaku/exception_bridge.h>
#include <tsuyaku/logging.h>

namespace tsuyaku {

constexpr static std::string_view log_location_prefix = "/:tsuyaku:request_error_handler ";

request_error_handler::request_error_handler() :
    request_error_handler(std::make_shared<translator const>())
{}

request_error_handler::request_error_handler(std::shared_ptr<translator const> translator) :
    translator_(translator ? std::move(translator) : std::make_shared<tsuyaku::translator const>())
{}

error_response request_error_handler::respond(error_condition const& cond) const noexcept {
    auto res = translator_->translate(cond);
    if(translator_->config().log_translations()) {
        translator_->sink()->translated(cond, res);
    }
    return res;
}

bool request_error_handler::handle(error_condition const& cond, response_writer& writer) const noexcept {
    return write(respond(cond), writer);
}

bool request_error_handler::handle(std::exception_ptr const& ep, response_writer& writer) const noexcept {
    auto cond = condition_from_exception(ep, std::addressof(translator_->registry().hierarchy()));
    return handle(cond, writer);
}

bool request_error_handler::write(error_response const& res, response_writer& writer) const noexcept {
    try {
        nlohmann::json j = res;
        auto body = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        writer.status(res.status());
        writer.message(res.message());
        if(! writer.body(body)) {
            LOG(ERROR) << log_location_prefix << "failed to write response body status:" << res.status();
            return false;
        }
        if(! writer.complete()) {
            LOG(ERROR) << log_location_prefix << "failed to complete response status:" << res.status();
            return false;
        }
        VLOG(log_trace) << log_location_prefix << "response written " << res;
        return true;
    } catch (std::exception const& e) {
        LOG(ERROR) << log_location_prefix << "failed to write response: " << e.what();
    }
    return false;
}

}  // namespace tsuyaku
