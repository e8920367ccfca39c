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
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <tsuyaku/configuration_loader.h>
#include <tsuyaku/exception_bridge.h>
#include <tsuyaku/request_error_handler.h>
#include <tsuyaku/setup_exception.h>
#include <tsuyaku/translator.h>

DEFINE_string(config, "", "ini file with [tsuyaku] settings and [handler.<kind>] registrations");  //NOLINT
DEFINE_string(kind, "not_found", "kind of the error condition to translate");  //NOLINT
DEFINE_string(message, "post 42 not found", "message of the error condition");  //NOLINT
DEFINE_string(cause, "", "message of the cause condition, empty for no cause");  //NOLINT
DEFINE_bool(std_exception, false, "throw std::invalid_argument with the message instead of the condition");  //NOLINT

namespace tsuyaku::translate_cli {

class stdout_writer : public response_writer {
public:
    void status(status_code code) override {
        std::cout << code << " " << reason_phrase(code) << std::endl;
    }

    void message(std::string_view msg) override {
        std::cout << msg << std::endl;
    }

    bool body(std::string_view body) override {
        std::cout << body << std::endl;
        return static_cast<bool>(std::cout);
    }

    bool complete() override {
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
};

static std::shared_ptr<translator const> create_translator() {
    if(FLAGS_config.empty()) {
        auto builder = default_registry_builder();
        register_standard_exceptions(builder.hierarchy());
        return std::make_shared<translator const>(builder.build());
    }
    auto cfg = load_configuration(FLAGS_config);
    auto registry = registry_from_configuration(FLAGS_config);
    return std::make_shared<translator const>(std::move(registry), std::move(cfg));
}

static bool run() {
    std::shared_ptr<translator const> tr{};
    try {
        tr = create_translator();
    } catch (setup_exception const& e) {
        LOG(ERROR) << "setup failed (" << e.get_code() << "): " << e.what();
        return false;
    }
    request_error_handler handler{tr};
    stdout_writer writer{};
    try {
        if(FLAGS_std_exception) {
            throw std::invalid_argument(FLAGS_message);
        }
        error_condition cond{FLAGS_kind, FLAGS_message};
        if(! FLAGS_cause.empty()) {
            cond.cause(std::make_shared<error_condition const>(kinds::internal, FLAGS_cause));
        }
        return handler.handle(cond, writer);
    } catch (std::exception const&) {
        return handler.handle(std::current_exception(), writer);
    }
}

}  // namespace tsuyaku::translate_cli

extern "C" int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("error translation cli");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);
    if(! tsuyaku::translate_cli::run()) {
        return 1;
    }
    return 0;
}
