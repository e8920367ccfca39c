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

#include <tsuyaku/configuration.h>
#include <tsuyaku/error_condition.h>
#include <tsuyaku/error_response.h>
#include <tsuyaku/handler_registry.h>
#include <tsuyaku/log_sink.h>

namespace tsuyaku {

/**
 * @brief error translator
 * @details maps the error condition to the error response using the handler registry. The translator holds only
 * immutable objects, so a single instance can be shared by concurrent request handling threads.
 */
class translator {
public:
    /**
     * @brief create new object with the builtin registrations and default configuration
     */
    translator();

    /**
     * @brief create new object
     * @param registry the handler registry
     * @param cfg the configuration, or nullptr to use the default
     * @param sink the log sink receiving internal failures, or nullptr to use glog_log_sink
     */
    explicit translator(
        std::shared_ptr<handler_registry const> registry,
        std::shared_ptr<configuration const> cfg = {},
        std::shared_ptr<log_sink> sink = {}
    );

    /**
     * @brief translate the condition
     * @details the most specific registration for the condition kind builds the response. If no registration
     * matches, or the registered body builder fails, the default response is returned. Failures of the builder
     * are reported to the log sink. This function does not report the successful translation itself.
     * @param cond the condition to translate
     * @return the response, timestamp set to the time of this call
     */
    [[nodiscard]] error_response translate(error_condition const& cond) const noexcept;

    /**
     * @brief create the default response for the condition
     * @param cond the condition
     * @param timestamp the timestamp of the response
     */
    [[nodiscard]] error_response default_response(
        error_condition const& cond,
        error_response::clock::time_point timestamp
    ) const noexcept;

    [[nodiscard]] handler_registry const& registry() const noexcept {
        return *registry_;
    }

    [[nodiscard]] configuration const& config() const noexcept {
        return *cfg_;
    }

    [[nodiscard]] std::shared_ptr<log_sink> const& sink() const noexcept {
        return sink_;
    }

private:
    std::shared_ptr<handler_registry const> registry_{};
    std::shared_ptr<configuration const> cfg_{};
    std::shared_ptr<log_sink> sink_{};

    void add_causes(error_condition const& cond, nlohmann::json& body) const;
};

}  // namespace tsuyaku
