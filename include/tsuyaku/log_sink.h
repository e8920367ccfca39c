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

#include <exception>
#include <string_view>

#include <tsuyaku/error_condition.h>
#include <tsuyaku/error_response.h>

namespace tsuyaku {

/**
 * @brief log sink interface
 * @details the logging collaborator receiving the records of the error translation.
 * Implementations must be thread-safe because the translation runs on the request handling threads
 * concurrently.
 */
class log_sink {
public:
    /**
     * @brief create empty object
     */
    log_sink() = default;

    /**
     * @brief destruct the object
     */
    virtual ~log_sink() = default;

    log_sink(log_sink const& other) = default;
    log_sink& operator=(log_sink const& other) = default;
    log_sink(log_sink&& other) noexcept = default;
    log_sink& operator=(log_sink&& other) noexcept = default;

    /**
     * @brief record the translated condition
     * @details called once for each condition handled by request_error_handler
     * @param cond the condition including its cause chain
     * @param res the response produced for the condition
     */
    virtual void translated(error_condition const& cond, error_response const& res) noexcept = 0;

    /**
     * @brief record the failure that occurred inside the translation
     * @details called when the handler for the condition failed and the default response is used instead
     * @param cond the condition being translated
     * @param what description of the failure
     * @param ex the exception caught, or nullptr if the failure is not a std::exception
     */
    virtual void internal_failure(
        error_condition const& cond,
        std::string_view what,
        std::exception const* ex
    ) noexcept = 0;
};

/**
 * @brief log sink writing records with glog
 * @details translated conditions are written with VLOG(log_debug), or LOG(WARNING) if the response status is a
 * server error. Internal failures are written with LOG(ERROR) together with the stack trace if the exception
 * carries one.
 */
class glog_log_sink : public log_sink {
public:
    void translated(error_condition const& cond, error_response const& res) noexcept override;

    void internal_failure(
        error_condition const& cond,
        std::string_view what,
        std::exception const* ex
    ) noexcept override;
};

}  // namespace tsuyaku
