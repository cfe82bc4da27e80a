#pragma once
#include <array>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include <gtest/gtest.h>
#include "sandbox_probe/environment.hpp"

namespace sandbox_probe::test_support {

    // Clears the probe variables for the duration of a test and restores them afterwards.
    class ProbeEnvTest : public ::testing::Test {
    protected:
        void SetUp() override {
            for (std::size_t i = 0; i < kVars.size(); ++i) {
                if (const char* value = std::getenv(kVars[i])) {
                    saved_[i] = std::string(value);
                }
                unsetenv(kVars[i]);
            }

            std::string pattern = (std::filesystem::temp_directory_path() / "sandbox-probe-XXXXXX").string();
            ASSERT_NE(mkdtemp(pattern.data()), nullptr);
            scratch_ = pattern;
        }

        void TearDown() override {
            for (std::size_t i = 0; i < kVars.size(); ++i) {
                if (saved_[i]) {
                    setenv(kVars[i], saved_[i]->c_str(), 1);
                } else {
                    unsetenv(kVars[i]);
                }
            }

            std::error_code ec;
            std::filesystem::remove_all(scratch_, ec);
        }

        static void set_var(const char* name, const std::string& value) {
            ASSERT_EQ(setenv(name, value.c_str(), 1), 0);
        }

        std::filesystem::path write_file(const std::string& name, const std::string& content) const {
            const auto path = scratch_ / name;
            std::ofstream out(path, std::ios::binary);
            out << content;
            return path;
        }

        static std::string read_file(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            std::ostringstream oss;
            oss << in.rdbuf();
            return oss.str();
        }

        static std::vector<std::string> split_lines(const std::string& text) {
            std::vector<std::string> lines;
            std::istringstream in(text);
            for (std::string line; std::getline(in, line);) {
                lines.push_back(line);
            }
            return lines;
        }

        std::filesystem::path scratch_;

    private:
        static constexpr std::array<const char*, 4> kVars = {
            kCaseIdVar, kEvidenceUidVar, kEvidencePathVar, kOutputDirVar};

        std::array<std::optional<std::string>, 4> saved_;
    };
}
