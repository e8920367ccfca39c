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
#include <tsuyaku/handler_registry.h>
#include <tsuyaku/translator.h>
#include <tsuyaku/test_root.h>

namespace tsuyaku::testing {

class translator_test : public test_root {
public:
    void SetUp() override {
        sink_ = std::make_shared<recording_log_sink>();
    }

    translator create(registry_builder const& builder, std::shared_ptr<configuration const> cfg = {}) {
        return translator{builder.build(), std::move(cfg), sink_};
    }

    std::shared_ptr<recording_log_sink> sink_{};
};

TEST_F(translator_test, registered_kind) {
    auto tr = create(default_registry_builder());
    auto before = error_response::clock::now();
    auto res = tr.translate(condition(kinds::not_found, "post 42 not found"));
    auto after = error_response::clock::now();
    EXPECT_EQ(404, res.status());
    EXPECT_EQ("post 42 not found", res.message());
    EXPECT_FALSE(res.has_body());
    EXPECT_LE(before, res.timestamp());
    EXPECT_LE(res.timestamp(), after);
    EXPECT_EQ(0, sink_->failure_count());
}

TEST_F(translator_test, every_builtin_kind_yields_registered_status) {
    auto tr = create(default_registry_builder());
    EXPECT_EQ(404, tr.translate(condition(kinds::not_found, "m")).status());
    EXPECT_EQ(400, tr.translate(condition(kinds::validation, "m")).status());
    EXPECT_EQ(401, tr.translate(condition(kinds::unauthorized, "m")).status());
    EXPECT_EQ(409, tr.translate(condition(kinds::conflict, "m")).status());
    EXPECT_EQ(500, tr.translate(condition(kinds::internal, "m")).status());
}

TEST_F(translator_test, capitalized_kind_names) {
    auto tr = create(default_registry_builder());
    auto res = tr.translate(error_condition{"NotFound", "post 42 not found"});
    EXPECT_EQ(404, res.status());
    EXPECT_EQ("post 42 not found", res.message());
    EXPECT_EQ(400, tr.translate(condition("Validation", "m")).status());
    EXPECT_EQ(401, tr.translate(condition("Unauthorized", "m")).status());
    EXPECT_EQ(409, tr.translate(condition("Conflict", "m")).status());
    EXPECT_EQ(500, tr.translate(condition("Internal", "m")).status());
    EXPECT_EQ("m", tr.translate(condition("Internal", "m")).message());
    EXPECT_EQ(0, sink_->failure_count());
}

TEST_F(translator_test, unregistered_kind) {
    auto tr = create(default_registry_builder());
    auto res = tr.translate(condition("Unregistered", "x"));
    EXPECT_EQ(500, res.status());
    EXPECT_EQ("An error occurred: x", res.message());
    EXPECT_FALSE(res.has_body());
    EXPECT_EQ(0, sink_->failure_count());
}

TEST_F(translator_test, default_constructed) {
    translator tr{};
    auto res = tr.translate(condition(kinds::not_found, "post 42 not found"));
    EXPECT_EQ(404, res.status());
    EXPECT_EQ("post 42 not found", res.message());
}

TEST_F(translator_test, builder_failure_falls_back_to_default) {
    registry_builder builder{};
    builder.add(kinds::not_found, 404, [](error_condition const&) -> nlohmann::json {
        throw std::runtime_error("builder broken");
    });
    auto tr = create(builder);
    auto res = tr.translate(condition(kinds::not_found, "post 42 not found"));
    EXPECT_EQ(500, res.status());
    EXPECT_EQ("An error occurred: post 42 not found", res.message());
    EXPECT_FALSE(res.has_body());

    ASSERT_EQ(1, sink_->failure_count());
    auto f = sink_->failures()[0];
    EXPECT_EQ(kinds::not_found, f.condition_.kind());
    EXPECT_TRUE(f.has_exception_);
    EXPECT_NE(std::string::npos, f.what_.find("builder broken"));
}

TEST_F(translator_test, builder_non_standard_exception) {
    registry_builder builder{};
    builder.add(kinds::conflict, 409, [](error_condition const&) -> nlohmann::json {
        throw 1;  //NOLINT
    });
    auto tr = create(builder);
    auto res = tr.translate(condition(kinds::conflict, "c"));
    EXPECT_EQ(500, res.status());
    ASSERT_EQ(1, sink_->failure_count());
    EXPECT_FALSE(sink_->failures()[0].has_exception_);
}

TEST_F(translator_test, builder_returning_non_object) {
    registry_builder builder{};
    builder.add(kinds::validation, 400, [](error_condition const&) {
        return nlohmann::json::array({1, 2});
    });
    auto tr = create(builder);
    auto res = tr.translate(condition(kinds::validation, "bad"));
    EXPECT_EQ(500, res.status());
    EXPECT_EQ("An error occurred: bad", res.message());
    EXPECT_EQ(1, sink_->failure_count());
}

TEST_F(translator_test, body_from_builder) {
    registry_builder builder{};
    builder.add(kinds::validation, 422, [](error_condition const& cond) {
        return nlohmann::json{{"field", cond.details().at("field")}};
    });
    auto tr = create(builder);
    auto cond = condition(kinds::validation, "title is empty");
    cond.details(nlohmann::json{{"field", "title"}});
    auto res = tr.translate(cond);
    EXPECT_EQ(422, res.status());
    EXPECT_EQ("title is empty", res.message());
    ASSERT_TRUE(res.has_body());
    EXPECT_EQ("title", res.body()["field"].get<std::string>());
}

TEST_F(translator_test, idempotent) {
    registry_builder builder{};
    builder.add(kinds::validation, 400, [](error_condition const& cond) {
        return nlohmann::json{{"len", cond.message().size()}};
    });
    auto tr = create(builder);
    auto cond = condition(kinds::validation, "bad");
    auto r1 = tr.translate(cond);
    auto r2 = tr.translate(cond);
    EXPECT_TRUE(equivalent(r1, r2));

    auto u1 = tr.translate(condition("Unregistered", "x"));
    auto u2 = tr.translate(condition("Unregistered", "x"));
    EXPECT_TRUE(equivalent(u1, u2));
}

TEST_F(translator_test, most_specific_registration) {
    auto builder = default_registry_builder();
    builder.hierarchy().add("post_not_found", {error_kind{kinds::not_found}});
    builder.hierarchy().add("deleted_post", {"post_not_found"});
    builder.add("post_not_found", 410);
    auto tr = create(builder);
    EXPECT_EQ(410, tr.translate(condition("deleted_post", "gone")).status());
    EXPECT_EQ(410, tr.translate(condition("post_not_found", "gone")).status());
    EXPECT_EQ(404, tr.translate(condition(kinds::not_found, "gone")).status());
}

TEST_F(translator_test, tie_broken_by_registration_order) {
    registry_builder builder{};
    builder.hierarchy().add("title_taken", {error_kind{kinds::validation}, error_kind{kinds::conflict}});
    builder.add(kinds::conflict, 409);
    builder.add(kinds::validation, 400);
    auto tr = create(builder);
    EXPECT_EQ(409, tr.translate(condition("title_taken", "taken")).status());
}

TEST_F(translator_test, empty_message) {
    auto tr = create(default_registry_builder());
    auto res = tr.translate(condition(kinds::not_found, ""));
    EXPECT_EQ(404, res.status());
    EXPECT_EQ("Not Found", res.message());

    auto def = tr.translate(condition("Unregistered", ""));
    EXPECT_EQ(500, def.status());
    EXPECT_EQ("An error occurred", def.message());
}

TEST_F(translator_test, configured_default) {
    auto cfg = std::make_shared<configuration>();
    cfg->default_status(503);
    cfg->default_message_prefix("Unavailable - ");
    auto tr = create(default_registry_builder(), cfg);
    auto res = tr.translate(condition("Unregistered", "x"));
    EXPECT_EQ(503, res.status());
    EXPECT_EQ("Unavailable - x", res.message());

    cfg->default_message_prefix("");
    auto res2 = tr.translate(condition("Unregistered", ""));
    EXPECT_EQ("Service Unavailable", res2.message());
}

TEST_F(translator_test, expose_cause_chain) {
    auto cfg = std::make_shared<configuration>();
    cfg->expose_cause_chain(true);
    cfg->max_cause_depth(1);
    auto tr = create(default_registry_builder(), cfg);
    auto root = std::make_shared<error_condition const>(kinds::internal, "disk full");
    auto mid = std::make_shared<error_condition const>(kinds::internal, "write failed", root);
    error_condition cond{kinds::conflict, "save failed", mid};

    auto res = tr.translate(cond);
    EXPECT_EQ(409, res.status());
    ASSERT_TRUE(res.has_body());
    EXPECT_EQ((nlohmann::json::array({"write failed"})), res.body()["causes"]);

    auto def = tr.translate(error_condition{"Unregistered", "x", mid});
    ASSERT_TRUE(def.has_body());
    EXPECT_EQ((nlohmann::json::array({"write failed"})), def.body()["causes"]);
}

TEST_F(translator_test, cause_chain_hidden_by_default) {
    auto tr = create(default_registry_builder());
    auto cause = std::make_shared<error_condition const>(kinds::internal, "disk full");
    auto res = tr.translate(error_condition{kinds::conflict, "save failed", cause});
    EXPECT_FALSE(res.has_body());
}

}  // namespace tsuyaku::testing
