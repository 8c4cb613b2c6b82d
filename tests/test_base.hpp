#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include <chrono>
#include <fstream>
#include <unistd.h>
#include "core/file_utils.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory on disk
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_files_dir_ = std::filesystem::temp_directory_path() /
                          ("media_resolver_test_" + std::to_string(getpid()) + "_" + info->test_suite_name() + "_" +
                           info->name());
        std::filesystem::remove_all(test_files_dir_);
        std::filesystem::create_directories(test_files_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_files_dir_, ec);
    }

    // Helper to create a file with the given bytes, creating parent directories
    std::string createFile(const std::string &relative_path, const std::vector<uint8_t> &bytes)
    {
        std::filesystem::path file_path = test_files_dir_ / relative_path;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        ofs.close();
        return file_path.string();
    }

    // Helper to create a dummy file for tests
    std::string createDummyFile(const std::string &relative_path, const std::string &content = "dummy content")
    {
        return createFile(relative_path, std::vector<uint8_t>(content.begin(), content.end()));
    }

    // A file that starts with a JPEG signature
    std::string createJpeg(const std::string &relative_path)
    {
        return createFile(relative_path, {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0x4A, 0x46, 0x49, 0x46, 0x00, 0x01});
    }

    // Set the modification time to a fixed offset from now
    void setAge(const std::string &path, std::chrono::seconds age)
    {
        auto when = std::filesystem::file_time_type::clock::now() - age;
        std::filesystem::last_write_time(path, when);
    }

    std::string getTestFilesDir() const { return test_files_dir_.string(); }

private:
    std::filesystem::path test_files_dir_;
};
