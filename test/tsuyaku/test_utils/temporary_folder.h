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
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace tsuyaku::test {

/**
 * @brief temporary directory for the files used by tests
 */
class temporary_folder {
public:
    void prepare() {
        auto pattern = boost::filesystem::temp_directory_path();
        pattern /= "tsuyaku-test-%%%%%%%%";
        for (std::size_t i = 0; i < 10U; ++i) {
            auto candidate = boost::filesystem::unique_path(pattern);
            if (boost::filesystem::create_directories(candidate)) {
                path_ = candidate;
                break;
            }
        }
    }

    void clean() {
        if (!path_.empty()) {
            boost::filesystem::remove_all(path_);
            path_.clear();
        }
    }

    [[nodiscard]] std::string path() const {
        if (path_.empty() || !boost::filesystem::exists(path_)) {
            throw std::runtime_error("temporary folder has not been initialized yet");
        }
        return path_.string();
    }

    /**
     * @brief create the file in the folder
     * @param name the file name
     * @param content the file content
     * @return the path of the created file
     */
    std::string write_file(std::string_view name, std::string_view content) const {
        auto p = boost::filesystem::path{path()} / std::string{name};
        boost::filesystem::ofstream out{p};
        out << content;
        if (!out) {
            throw std::runtime_error("failed to write " + p.string());
        }
        return p.string();
    }

private:
    boost::filesystem::path path_;
};

}  // namespace tsuyaku::test
