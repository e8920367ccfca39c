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
#include <memory>
#include <string_view>

#include <tsuyaku/error_condition.h>
#include <tsuyaku/error_response.h>
#include <tsuyaku/status_code.h>
#include <tsuyaku/translator.h>

namespace tsuyaku {

/**
 * @brief response writer interface
 * @details the transport side of the request serving collaborator. The request error handler fills the
 * response through this interface and the collaborator transmits it.
 */
class response_writer {
public:
    /**
     * @brief create empty object
     */
    response_writer() = default;

    /**
     * @brief destruct the object
     */
    virtual ~response_writer() = default;

    response_writer(response_writer const& other) = default;
    response_writer& operator=(response_writer const& other) = default;
    response_writer(response_writer&& other) noexcept = default;
    response_writer& operator=(response_writer&& other) noexcept = default;

    /**
     * @brief setter of the transport level status code
     * @param code the status code of the response
     */
    virtual void status(status_code code) = 0;

    /**
     * @brief setter of the response message
     * @param msg the message
     */
    virtual void message(std::string_view msg) = 0;

    /**
     * @brief setter of the response body
     * @param body the serialized response
     * @return true when successful
     * @return false otherwise
     */
    virtual bool body(std::string_view body) = 0;

    /**
     * @brief notify completion of the response
     * @return true when successful
     * @return false otherwise
     */
    virtual bool complete() = 0;
};

/**
 * @brief request error handler
 * @details the entry point for the request serving collaborator. It translates the condition, reports the
 * translation to the log sink once, and writes the response to the writer.
 */
class request_error_handler {
public:
    /**
     * @brief create new object with the default translator
     */
    request_error_handler();

    /**
     * @brief create new object
     * @param translator the translator to use, or nullptr to use the default translator
     */
    explicit request_error_handler(std::shared_ptr<translator const> translator);

    /**
     * @brief handle the condition
     * @param cond the condition raised by the application logic
     * @param writer the writer receiving the response
     * @return true if the response is written successfully
     * @return false if the writer reported an error
     */
    bool handle(error_condition const& cond, response_writer& writer) const noexcept;

    /**
     * @brief handle the exception
     * @details the exception is converted to the condition with condition_from_exception() and then handled
     * @param ep the exception raised by the application logic
     * @param writer the writer receiving the response
     * @return true if the response is written successfully
     * @return false if the writer reported an error
     */
    bool handle(std::exception_ptr const& ep, response_writer& writer) const noexcept;

    /**
     * @brief translate the condition and report it to the log sink without writing
     * @return the translated response
     */
    [[nodiscard]] error_response respond(error_condition const& cond) const noexcept;

    [[nodiscard]] translator const& get_translator() const noexcept {
        return *translator_;
    }

private:
    std::shared_ptr<translator const> translator_{};

    bool write(error_response const& res, response_writer& writer) const noexcept;
};

}  // namespace tsuyaku
