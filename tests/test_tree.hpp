//! # Temporary Document Trees
//!
//! Fixture base for tests that need a content root on disk. Each test gets
//! its own directory under the system temp path, named after the test, and
//! removed again in TearDown.

#pragma once

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

class TempTreeTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               (std::string("doclink_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const std::string& rel, const std::string& content) {
        fs::path full = root / rel;
        fs::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out << content;
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(root / rel, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    /// Moves a document the way `git mv` would.
    void move(const std::string& from, const std::string& to) {
        fs::path target = root / to;
        fs::create_directories(target.parent_path());
        fs::rename(root / from, target);
    }
};
