#include <gtest/gtest.h>
#include "core/filesystem_media_source.hpp"
#include "core/media_resolution_service.hpp"
#include "core/file_access.hpp"
#include "test_base.hpp"
#include <chrono>

using namespace std::chrono_literals;

class FilesystemMediaSourceTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        camera_ = getTestFilesDir() + "/DCIM/Camera";
        downloads_ = getTestFilesDir() + "/Download";
        canonical_camera_ = FileUtils::canonicalPath(camera_);

        setAge(createJpeg("DCIM/Camera/IMG_0001.jpg"), 3h);
        setAge(createJpeg("DCIM/Camera/IMG_0002.jpg"), 1h);
        setAge(createJpeg("DCIM/Camera/Trips/beach.jpg"), 2h);
        setAge(createDummyFile("DCIM/Camera/notes.txt"), 30min);
        setAge(createDummyFile("DCIM/Camera/VID_0001.mp4", "not really a video"), 10min);
        setAge(createFile("Download/meme.png", {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00}), 5h);
    }

    FilesystemMediaSource defaultSource() const
    {
        return FilesystemMediaSource(DirectoryConfig{}, {camera_, downloads_, getTestFilesDir() + "/missing"});
    }

    std::string camera_;
    std::string downloads_;
    std::string canonical_camera_;
};

TEST_F(FilesystemMediaSourceTest, DefaultRootsBecomeAlbums)
{
    auto albums = defaultSource().listAlbums(AssetFilter{});
    ASSERT_EQ(albums.size(), 2u);
    EXPECT_EQ(albums[0].name, "Camera");
    EXPECT_EQ(albums[1].name, "Download");
}

TEST_F(FilesystemMediaSourceTest, EnabledDirectoriesReplaceDefaults)
{
    DirectoryConfig directories;
    directories.enabled = true;
    directories.paths = {downloads_};
    FilesystemMediaSource source(directories, {camera_});

    auto albums = source.listAlbums(AssetFilter{});
    ASSERT_EQ(albums.size(), 1u);
    EXPECT_EQ(albums[0].name, "Download");

    directories.enabled = false;
    FilesystemMediaSource disabled(directories, {camera_});
    ASSERT_EQ(disabled.listAlbums(AssetFilter{}).size(), 1u);
    EXPECT_EQ(disabled.listAlbums(AssetFilter{})[0].name, "Camera");
}

TEST_F(FilesystemMediaSourceTest, EnumeratesSupportedFilesNewestFirst)
{
    auto source = defaultSource();
    auto albums = source.listAlbums(AssetFilter{});
    auto assets = source.getAssets(albums[0], AssetFilter{}, 0, 100);

    ASSERT_EQ(assets.size(), 4u);
    EXPECT_EQ(assets[0].title, "VID_0001.mp4");
    EXPECT_EQ(assets[0].kind, MediaKind::VIDEO);
    EXPECT_EQ(assets[1].title, "IMG_0002.jpg");
    EXPECT_EQ(assets[2].title, "beach.jpg");
    EXPECT_EQ(assets[3].title, "IMG_0001.jpg");
    EXPECT_EQ(assets[2].relative_path, canonical_camera_ + "/Trips");
    EXPECT_EQ(assets[1].id, FileUtils::computeStringHash(assets[1].source_ref));
}

TEST_F(FilesystemMediaSourceTest, PagingAndKindFilter)
{
    auto source = defaultSource();
    auto camera = source.listAlbums(AssetFilter{})[0];

    AssetFilter photos;
    photos.kind = MediaKind::PHOTO;
    auto page = source.getAssets(camera, photos, 1, 3);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].title, "beach.jpg");
    EXPECT_EQ(page[1].title, "IMG_0001.jpg");
    EXPECT_TRUE(source.getAssets(camera, photos, 5, 10).empty());
}

TEST_F(FilesystemMediaSourceTest, DateFilterUsesModificationTime)
{
    auto source = defaultSource();
    auto camera = source.listAlbums(AssetFilter{})[0];

    AssetFilter recent;
    auto now = std::chrono::system_clock::now();
    recent.date_range = DateRange{now - 90min, now};
    auto assets = source.getAssets(camera, recent, 0, 100);
    ASSERT_EQ(assets.size(), 2u);
    EXPECT_EQ(assets[0].title, "VID_0001.mp4");
    EXPECT_EQ(assets[1].title, "IMG_0002.jpg");
}

TEST_F(FilesystemMediaSourceTest, MissingAlbumRootThrows)
{
    MediaAlbum gone{"gone", "gone", getTestFilesDir() + "/gone"};
    EXPECT_THROW(defaultSource().getAssets(gone, AssetFilter{}, 0, 10), std::filesystem::filesystem_error);
}

TEST_F(FilesystemMediaSourceTest, ResolveFilePathRequiresExistingFile)
{
    auto source = defaultSource();
    RawAssetHandle handle;
    handle.source_ref = camera_ + "/IMG_0001.jpg";
    EXPECT_EQ(source.resolveFilePath(handle).value_or(""), handle.source_ref);

    handle.source_ref = camera_ + "/deleted.jpg";
    EXPECT_FALSE(source.resolveFilePath(handle).has_value());
    handle.source_ref.clear();
    EXPECT_FALSE(source.resolveFilePath(handle).has_value());
}

TEST_F(FilesystemMediaSourceTest, ServiceResolvesRealFiles)
{
    auto source = std::make_shared<FilesystemMediaSource>(DirectoryConfig{}, std::vector<std::string>{camera_, downloads_});
    MediaResolutionService service(source, std::make_shared<LocalFileAccess>(), EngineOptions{});

    MediaQuery query = MediaQuery::fromText("beach");
    auto records = service.resolveQuery(query);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].mime_type, "image/jpeg");
    EXPECT_EQ(records[0].file_uri, FileUtils::toFileUri(canonical_camera_ + "/Trips/beach.jpg"));
    EXPECT_EQ(records[0].device_metadata.file_size_bytes, 12u);

    auto latest = service.latestImage(std::string("Download"));
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->mime_type, "image/png");
}

TEST_F(FilesystemMediaSourceTest, ValidationRecoversMovedFileByName)
{
    auto source = std::make_shared<FilesystemMediaSource>(DirectoryConfig{}, std::vector<std::string>{camera_, downloads_});
    MediaResolutionService service(source, std::make_shared<LocalFileAccess>(), EngineOptions{});

    std::string old_uri = FileUtils::toFileUri(getTestFilesDir() + "/Old/IMG_0002.jpg");
    auto result = service.validate(old_uri);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.recovered);
    EXPECT_EQ(result.effective_uri, FileUtils::toFileUri(canonical_camera_ + "/IMG_0002.jpg"));

    auto empty = createDummyFile("DCIM/Camera/empty.jpg", "");
    EXPECT_EQ(service.validate(FileUtils::toFileUri(empty)).failure_reason, ValidationFailure::EMPTY);
}
