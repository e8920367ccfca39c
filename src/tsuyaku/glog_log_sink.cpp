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
#include <tsuyaku/log_sink.h>

#include <glog/logging.h>

#include <takatori/util/exception.h>

#include <tsuyaku/logging.h>
#include <tsuyaku/status_code.h>

namespace tsuyaku {

constexpr static std::string_view log_location_prefix = "/:tsuyaku:glog_log_sink ";

void glog_log_sink::translated(error_condition const& cond, error_response const& res) noexcept {
    if(is_server_error(res.status())) {
        LOG(WARNING) << log_location_prefix << "request failed status:" << res.status() << " " << cond;
        return;
    }
    VLOG(log_debug) << log_location_prefix << "request failed status:" << res.status() << " " << cond;
}

void glog_log_sink::internal_failure(
    error_condition const& cond,
    std::string_view what,
    std::exception const* ex
) noexcept {
    LOG(ERROR) << log_location_prefix << "error translation failed and default response is used: "
        << what << " " << cond;
    if(ex != nullptr) {
        if(auto* tr = takatori::util::find_trace(*ex); tr != nullptr) {
            LOG(ERROR) << log_location_prefix << *tr;
        }
    }
}

}  // namespace tsuyaku
