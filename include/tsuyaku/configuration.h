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

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include <tsuyaku/status_code.h>

namespace tsuyaku {

/**
 * @brief error translation configuration
 * @details the object is set up at process start and read-only afterwards. Getters specified with const are
 * thread safe.
 */
class configuration {
public:
    /**
     * @brief accessor for the status code of the default response
     * @return the status used when no registration matches the condition kind
     */
    [[nodiscard]] status_code default_status() const noexcept {
        return default_status_;
    }

    void default_status(status_code arg) noexcept {
        default_status_ = arg;
    }

    /**
     * @brief accessor for the prefix of the default response message
     * @return the prefix prepended to the condition message when no registration matches
     */
    [[nodiscard]] std::string_view default_message_prefix() const noexcept {
        return default_message_prefix_;
    }

    void default_message_prefix(std::string_view arg) noexcept {
        default_message_prefix_ = arg;
    }

    /**
     * @brief accessor for expose cause chain flag
     * @return whether the messages of the cause chain are added to the response body
     */
    [[nodiscard]] bool expose_cause_chain() const noexcept {
        return expose_cause_chain_;
    }

    void expose_cause_chain(bool arg) noexcept {
        expose_cause_chain_ = arg;
    }

    [[nodiscard]] std::size_t max_cause_depth() const noexcept {
        return max_cause_depth_;
    }

    void max_cause_depth(std::size_t arg) noexcept {
        max_cause_depth_ = arg;
    }

    /**
     * @brief accessor for log translations flag
     * @return whether the request error handler reports each translated condition to the log sink
     */
    [[nodiscard]] bool log_translations() const noexcept {
        return log_translations_;
    }

    void log_translations(bool arg) noexcept {
        log_translations_ = arg;
    }

    friend inline std::ostream& operator<<(std::ostream& out, configuration const& cfg) {

        //NOLINTBEGIN
        #define print_non_default(prop)  \
            if(def.prop() != cfg.prop()) { \
                out << #prop ":" << cfg.prop() << " "; \
            }
        //NOLINTEND

        static const configuration def{};
        out << std::boolalpha;
        print_non_default(default_status);
        print_non_default(default_message_prefix);
        print_non_default(expose_cause_chain);
        print_non_default(max_cause_depth);
        print_non_default(log_translations);
        return out;

        #undef print_non_default
    }

private:
    status_code default_status_ = status_internal_server_error;
    std::string default_message_prefix_{"An error occurred: "};
    bool expose_cause_chain_ = false;
    std::size_t max_cause_depth_ = 8;
    bool log_translations_ = true;
};

}  // namespace tsuyaku
