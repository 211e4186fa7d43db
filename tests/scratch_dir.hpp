#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace satish_test {

// Fresh directory under the system temp dir, removed on teardown.
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() /
                ("satish_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                 std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path path(const std::string& rel) const { return root_ / rel; }

    std::filesystem::path touch(const std::string& rel, const std::string& content = "x") const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream ofs(p, std::ios::binary);
        ofs << content;
        return p;
    }

    static std::string slurp(const std::filesystem::path& p) {
        std::ifstream ifs(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }

    std::filesystem::path root_;
};

inline std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace satish_test
