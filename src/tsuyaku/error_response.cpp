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
#include <tsuyaku/error_response.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace tsuyaku {

error_response::error_response(
    status_code status,
    std::string message,
    nlohmann::json body,
    clock::time_point timestamp
) noexcept :
    status_(status),
    message_(std::move(message)),
    body_(std::move(body)),
    timestamp_(timestamp)
{}

bool equivalent(error_response const& a, error_response const& b) noexcept {
    return a.status() == b.status() &&
        a.message() == b.message() &&
        a.body() == b.body();
}

std::string format_timestamp(error_response::clock::time_point tp) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    auto millis = duration_cast<milliseconds>(tp - secs).count();
    if(millis < 0) {
        secs -= seconds{1};
        millis += 1000;
    }
    std::time_t t = error_response::clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::stringstream ss{};
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

void to_json(nlohmann::json& j, error_response const& value) {
    j = nlohmann::json{
        {"status", value.status()},
        {"message", std::string{value.message()}},
        {"timestamp", format_timestamp(value.timestamp())},
    };
    if(value.has_body()) {
        j["body"] = value.body();
    }
}

std::ostream& operator<<(std::ostream& out, error_response const& value) {
    out << "error_response "
        << "status:" << value.status() << " "
        << "message:\"" << value.message() << "\" "
        << "timestamp:" << format_timestamp(value.timestamp());
    if(value.has_body()) {
        out << " body:" << value.body().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return out;
}

}  // namespace tsuyaku
