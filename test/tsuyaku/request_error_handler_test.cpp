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
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <tsuyaku/configuration.h>
#include <tsuyaku/error_kind.h>
#include <tsuyaku/exception_bridge.h>
#include <tsuyaku/handler_registry.h>
#include <tsuyaku/request_error_handler.h>
#include <tsuyaku/translator.h>
#include <tsuyaku/test_root.h>

namespace tsuyaku::testing {

class request_error_handler_test : public test_root {
public:
    void SetUp() override {
        sink_ = std::make_shared<recording_log_sink>();
    }

    request_error_handler create(
        std::shared_ptr<handler_registry const> registry = default_registry(),
        std::shared_ptr<configuration const> cfg = {}
    ) {
        return request_error_handler{std::make_shared<translator const>(std::move(registry), std::move(cfg), sink_)};
    }

    std::shared_ptr<recording_log_sink> sink_{};
};

TEST_F(request_error_handler_test, handle_condition) {
    auto handler = create();
    recording_writer writer{};
    ASSERT_TRUE(handler.handle(condition(kinds::not_found, "post 42 not found"), writer));
    EXPECT_EQ(404, writer.status_);
    EXPECT_EQ("post 42 not found", writer.message_);
    EXPECT_EQ(1, writer.completed_);

    auto j = nlohmann::json::parse(writer.body_);
    EXPECT_EQ(404, j["status"].get<int>());
    EXPECT_EQ("post 42 not found", j["message"].get<std::string>());
    EXPECT_TRUE(j.contains("timestamp"));
    EXPECT_FALSE(j.contains("body"));
}

TEST_F(request_error_handler_test, logged_exactly_once) {
    auto handler = create();
    recording_writer writer{};
    auto cause = std::make_shared<error_condition const>(kinds::internal, "db down");
    error_condition cond{"Unregistered", "x", cause};
    ASSERT_TRUE(handler.handle(cond, writer));
    ASSERT_EQ(1, sink_->translated_count());
    auto [logged, res] = sink_->translated()[0];
    EXPECT_EQ(cond, logged);
    ASSERT_TRUE(logged.cause());
    EXPECT_EQ("db down", logged.cause()->message());
    EXPECT_EQ(500, res.status());
    EXPECT_EQ("An error occurred: x", res.message());
    EXPECT_EQ(0, sink_->failure_count());
}

TEST_F(request_error_handler_test, builder_failure_logged_once_each) {
    registry_builder builder{};
    builder.add(kinds::not_found, 404, [](error_condition const&) -> nlohmann::json {
        throw std::runtime_error("broken");
    });
    auto handler = create(builder.build());
    recording_writer writer{};
    ASSERT_TRUE(handler.handle(condition(kinds::not_found, "post 42 not found"), writer));
    EXPECT_EQ(500, writer.status_);
    EXPECT_EQ("An error occurred: post 42 not found", writer.message_);
    EXPECT_EQ(1, sink_->failure_count());
    EXPECT_EQ(1, sink_->translated_count());
}

TEST_F(request_error_handler_test, log_translations_disabled) {
    auto cfg = std::make_shared<configuration>();
    cfg->log_translations(false);
    auto handler = create(default_registry(), cfg);
    recording_writer writer{};
    ASSERT_TRUE(handler.handle(condition(kinds::conflict, "taken"), writer));
    EXPECT_EQ(409, writer.status_);
    EXPECT_EQ(0, sink_->translated_count());
}

TEST_F(request_error_handler_test, handle_exception) {
    auto handler = create();
    recording_writer writer{};
    try {
        raise_error(kinds::unauthorized, "token expired");
    } catch (raised_error const&) {
        ASSERT_TRUE(handler.handle(std::current_exception(), writer));
    }
    EXPECT_EQ(401, writer.status_);
    EXPECT_EQ("token expired", writer.message_);
    EXPECT_EQ(1, sink_->translated_count());
}

TEST_F(request_error_handler_test, handle_standard_exception) {
    auto builder = default_registry_builder();
    register_standard_exceptions(builder.hierarchy());
    auto handler = create(builder.build());
    recording_writer writer{};
    ASSERT_TRUE(handler.handle(std::make_exception_ptr(std::length_error("too long")), writer));
    EXPECT_EQ(400, writer.status_);
    EXPECT_EQ("too long", writer.message_);
    EXPECT_EQ("std::length_error", sink_->translated()[0].first.kind());
}

TEST_F(request_error_handler_test, writer_failure) {
    auto handler = create();
    recording_writer writer{};
    writer.body_result_ = false;
    EXPECT_FALSE(handler.handle(condition(kinds::not_found, "x"), writer));
    EXPECT_EQ(0, writer.completed_);
    EXPECT_EQ(1, sink_->translated_count());
}

TEST_F(request_error_handler_test, invalid_utf8_written_completely) {
    registry_builder builder{};
    builder.add(kinds::not_found, 404, [](error_condition const& cond) {
        return cond.details();
    });
    auto handler = create(builder.build());
    recording_writer writer{};
    error_condition cond{kinds::not_found, "post \xff not found"};
    cond.details(nlohmann::json{{"id", "\xc3"}});
    ASSERT_TRUE(handler.handle(cond, writer));
    EXPECT_EQ(404, writer.status_);
    EXPECT_EQ(1, writer.completed_);

    auto j = nlohmann::json::parse(writer.body_);
    EXPECT_EQ(404, j["status"].get<int>());
    EXPECT_EQ("post \xef\xbf\xbd not found", j["message"].get<std::string>());
    EXPECT_EQ("\xef\xbf\xbd", j["body"]["id"].get<std::string>());
    EXPECT_EQ(1, sink_->translated_count());
    EXPECT_EQ(0, sink_->failure_count());
}

TEST_F(request_error_handler_test, invalid_utf8_logged_by_glog_sink) {
    request_error_handler handler{std::make_shared<translator const>(default_registry())};
    recording_writer writer{};
    error_condition cond{"Unregistered", "post \xff failed"};
    cond.details(nlohmann::json{{"id", "\xc3"}});
    ASSERT_TRUE(handler.handle(cond, writer));
    EXPECT_EQ(500, writer.status_);
    EXPECT_EQ(1, writer.completed_);
    auto j = nlohmann::json::parse(writer.body_);
    EXPECT_EQ("An error occurred: post \xef\xbf\xbd failed", j["message"].get<std::string>());
}

TEST_F(request_error_handler_test, null_translator_uses_default) {
    request_error_handler handler{nullptr};
    recording_writer writer{};
    ASSERT_TRUE(handler.handle(condition(kinds::not_found, "post 42 not found"), writer));
    EXPECT_EQ(404, writer.status_);
    EXPECT_EQ("post 42 not found", writer.message_);
    EXPECT_EQ(1, writer.completed_);
    EXPECT_EQ(500, handler.get_translator().translate(condition("Unregistered", "x")).status());
}

TEST_F(request_error_handler_test, respond) {
    auto handler = create();
    auto res = handler.respond(condition(kinds::validation, "bad"));
    EXPECT_EQ(400, res.status());
    EXPECT_EQ(1, sink_->translated_count());
}

}  // namespace tsuyaku::testing
