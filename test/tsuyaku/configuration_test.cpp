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
#include <sstream>
#include <string>
#include <gtest/gtest.h>

#include <tsuyaku/configuration.h>
#include <tsuyaku/test_root.h>

namespace tsuyaku::testing {

class configuration_test : public test_root {};

TEST_F(configuration_test, defaults) {
    configuration c{};
    EXPECT_EQ(500, c.default_status());
    EXPECT_EQ("An error occurred: ", c.default_message_prefix());
    EXPECT_FALSE(c.expose_cause_chain());
    EXPECT_EQ(8, c.max_cause_depth());
    EXPECT_TRUE(c.log_translations());
}

TEST_F(configuration_test, print_default) {
    configuration c{};
    std::stringstream ss{};
    ss << c;
    EXPECT_EQ("", ss.str());
}

TEST_F(configuration_test, print_non_default_values) {
    configuration c{};
    c.default_status(503);
    c.expose_cause_chain(true);
    c.max_cause_depth(3);
    std::stringstream ss{};
    ss << c;
    EXPECT_EQ("default_status:503 expose_cause_chain:true max_cause_depth:3 ", ss.str());
}

}  // namespace tsuyaku::testing
