#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace opr {
namespace tests {

/**
 * Test Fixture base: a scratch content directory per test
 *
 * write() creates parent directories as needed; write_executable() also
 * sets the owner execute bit.
 */
class ContentDirectoryTest : public ::testing::Test {
protected:
    std::filesystem::path root_;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                ("operator_test_" + std::to_string(::getpid()) + "_" + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::string root() const { return root_.string(); }

    std::filesystem::path write(const std::string &relative_path, const std::string &content) {
        std::filesystem::path path = root_ / relative_path;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        file.close();
        return path;
    }

    std::filesystem::path write_executable(const std::string &relative_path, const std::string &script) {
        auto path = write(relative_path, script);
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
        return path;
    }
};

}  // namespace tests
}  // namespace opr
