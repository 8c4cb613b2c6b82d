#include <gtest/gtest.h>
#include "core/file_utils.hpp"
#include "test_base.hpp"
#include <filesystem>
#include <vector>
#include <string>
#include <cstdlib>

namespace fs = std::filesystem;

class FileUtilsTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        createDummyFile("DCIM/IMG_0001.jpg");
        createDummyFile("DCIM/IMG_0002.png");
        createDummyFile("DCIM/Camera/VID_0001.mp4");
        createDummyFile("DCIM/Screenshots/shot.webp");
        root_ = getTestFilesDir() + "/DCIM";
    }

    std::string root_;
};

TEST_F(FileUtilsTest, ScanFindsFilesInSubdirectories)
{
    std::vector<std::string> files;
    FileUtils::scanDirectoryRecursively(root_, [&files](const std::string &file_path)
                                        { files.push_back(file_path); });

    EXPECT_EQ(files.size(), 4u);
    bool found_video = false;
    for (const auto &file : files)
    {
        if (file.find("Camera/VID_0001.mp4") != std::string::npos)
            found_video = true;
    }
    EXPECT_TRUE(found_video);
}

TEST_F(FileUtilsTest, ValidDirectory)
{
    EXPECT_TRUE(FileUtils::isValidDirectory(root_));
    EXPECT_FALSE(FileUtils::isValidDirectory(root_ + "/IMG_0001.jpg"));
    EXPECT_FALSE(FileUtils::isValidDirectory(getTestFilesDir() + "/nonexistent_dir"));
}

TEST_F(FileUtilsTest, ScanOfMissingRootThrows)
{
    EXPECT_THROW(FileUtils::scanDirectoryRecursively(getTestFilesDir() + "/missing", [](const std::string &) {}),
                 fs::filesystem_error);
}

TEST_F(FileUtilsTest, FileStatusOfRegularFile)
{
    std::string path = createDummyFile("status/file.jpg", "12345");
    FileStatus status = FileUtils::getFileStatus(path);
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.size, 5u);
    EXPECT_GT(status.modification_time.time_since_epoch().count(), 0);
}

TEST_F(FileUtilsTest, FileStatusOfMissingAndDirectory)
{
    EXPECT_EQ(FileUtils::getFileStatus(getTestFilesDir() + "/nope.jpg").state, FileStatus::State::NOT_FOUND);
    EXPECT_EQ(FileUtils::getFileStatus(getTestFilesDir() + "/nope/deeper.jpg").state, FileStatus::State::NOT_FOUND);
    EXPECT_EQ(FileUtils::getFileStatus(root_).state, FileStatus::State::NOT_REGULAR);
}

TEST_F(FileUtilsTest, ReadFileHeaderIsBounded)
{
    std::string path = createDummyFile("header.bin", "abcdefghijklmnop");
    auto header = FileUtils::readFileHeader(path, 4);
    ASSERT_EQ(header.size(), 4u);
    EXPECT_EQ(header[0], 'a');
    EXPECT_EQ(header[3], 'd');

    std::string short_path = createDummyFile("short.bin", "ab");
    EXPECT_EQ(FileUtils::readFileHeader(short_path, 12).size(), 2u);
    EXPECT_TRUE(FileUtils::readFileHeader(getTestFilesDir() + "/missing.bin", 12).empty());
}

TEST(FileUriTest, RoundTripsAbsolutePaths)
{
    std::string uri = FileUtils::toFileUri("/storage/DCIM/My Photo.jpg");
    EXPECT_EQ(uri.rfind("file://", 0), 0u);
    EXPECT_EQ(uri.find(' '), std::string::npos);
    auto path = FileUtils::fromFileUri(uri);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "/storage/DCIM/My Photo.jpg");
}

TEST(FileUriTest, AcceptsBarePathsAndRejectsOtherSchemes)
{
    EXPECT_EQ(FileUtils::fromFileUri("/tmp/a.jpg").value_or(""), "/tmp/a.jpg");
    EXPECT_EQ(FileUtils::fromFileUri("file://localhost/tmp/a.jpg").value_or(""), "/tmp/a.jpg");
    EXPECT_FALSE(FileUtils::fromFileUri("https://example.com/a.jpg").has_value());
    EXPECT_FALSE(FileUtils::fromFileUri("content://media/external/images/1").has_value());
    EXPECT_FALSE(FileUtils::fromFileUri("file://DCIM/Camera/a.jpg").has_value());
    EXPECT_FALSE(FileUtils::fromFileUri("").has_value());
    EXPECT_FALSE(FileUtils::fromFileUri("relative/a.jpg").has_value());
}

TEST(FileUtilsHashTest, StringHashIsStableSha256)
{
    EXPECT_EQ(FileUtils::computeStringHash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(FileUtils::computeStringHash("/a.jpg"), FileUtils::computeStringHash("/a.jpg"));
    EXPECT_NE(FileUtils::computeStringHash("/a.jpg"), FileUtils::computeStringHash("/b.jpg"));
}

TEST(FileUtilsPathTest, ExpandsHomeDirectory)
{
    const char *home = std::getenv("HOME");
    if (!home)
        GTEST_SKIP() << "HOME not set";
    EXPECT_EQ(FileUtils::expandUserPath("~/Pictures"), std::string(home) + "/Pictures");
    EXPECT_EQ(FileUtils::expandUserPath("/abs/path"), "/abs/path");
}
