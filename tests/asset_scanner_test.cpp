#include <gtest/gtest.h>
#include "core/asset_scanner.hpp"
#include "fakes.hpp"
#include "logging/logger.hpp"

class AssetScannerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        source_ = std::make_shared<FakeMediaSource>();
        source_->addAlbum("camera", "Camera", "/storage/DCIM/Camera");
        source_->addAlbum("screens", "Screenshots", "/storage/Pictures/Screenshots");
        source_->addAlbum("downloads", "Download", "/storage/Download");

        source_->addAsset("camera", makeHandle("c1", 100));
        source_->addAsset("camera", makeHandle("c2", 10));
        source_->addAsset("camera", makeHandle("cv", 50, "", MediaKind::VIDEO));
        source_->addAsset("screens", makeHandle("s1", 200));
        source_->addAsset("downloads", makeHandle("d1", 150));
    }

    AssetFilter filter_;
    std::shared_ptr<FakeMediaSource> source_;
};

TEST_F(AssetScannerTest, ScansAllAlbumsNewestFirst)
{
    AssetScanner scanner(source_, ScanOptions{});
    auto handles = scanner.scan(std::nullopt, filter_);

    ASSERT_EQ(handles.size(), 5u);
    EXPECT_EQ(handles.front().id, "s1");
    EXPECT_EQ(handles.back().id, "c2");
    for (size_t i = 1; i < handles.size(); ++i)
        EXPECT_GE(handles[i - 1].creation_time, handles[i].creation_time);
}

TEST_F(AssetScannerTest, FailingAlbumIsSkipped)
{
    source_->failAlbum("screens");
    AssetScanner scanner(source_, ScanOptions{});
    auto handles = scanner.scan(std::nullopt, filter_);

    ASSERT_EQ(handles.size(), 4u);
    for (const auto &handle : handles)
        EXPECT_NE(handle.id, "s1");
}

TEST_F(AssetScannerTest, ListingFailureYieldsEmptyResult)
{
    source_->fail_listing = true;
    AssetScanner scanner(source_, ScanOptions{});
    EXPECT_TRUE(scanner.scan(std::nullopt, filter_).empty());
}

TEST_F(AssetScannerTest, UnsupportedSourceYieldsEmptyResult)
{
    AssetScanner scanner(std::make_shared<UnsupportedMediaSource>(), ScanOptions{});
    EXPECT_TRUE(scanner.scan(std::nullopt, filter_).empty());

    source_->supported = false;
    AssetScanner fake_scanner(source_, ScanOptions{});
    EXPECT_TRUE(fake_scanner.scan(std::nullopt, filter_).empty());
}

TEST_F(AssetScannerTest, DirectoryScopeMatchesPathOrName)
{
    AssetScanner scanner(source_, ScanOptions{});

    auto by_path = scanner.scan(std::string("/storage/Download"), filter_);
    ASSERT_EQ(by_path.size(), 1u);
    EXPECT_EQ(by_path[0].id, "d1");

    auto by_name = scanner.scan(std::string("/some/other/root/Screenshots/"), filter_);
    ASSERT_EQ(by_name.size(), 1u);
    EXPECT_EQ(by_name[0].id, "s1");
}

TEST_F(AssetScannerTest, UnknownDirectoryFallsBackToFirstAlbum)
{
    AssetScanner scanner(source_, ScanOptions{});
    auto handles = scanner.scan(std::string("/nowhere/Holidays"), filter_);
    ASSERT_EQ(handles.size(), 3u);
    for (const auto &handle : handles)
        EXPECT_EQ(handle.id[0], 'c');
}

TEST_F(AssetScannerTest, PageSizeCapsEachAlbum)
{
    for (int i = 0; i < 30; ++i)
        source_->addAsset("downloads", makeHandle("bulk" + std::to_string(i), 1000 + i));

    ScanOptions options;
    options.page_size = 10;
    AssetScanner scanner(source_, options);
    auto handles = scanner.scan(std::string("Download"), filter_);

    ASSERT_EQ(handles.size(), 10u);
    EXPECT_EQ(handles.front().id, "bulk29");
}

TEST_F(AssetScannerTest, FilterIsReappliedToSourceOutput)
{
    AssetFilter photos_only;
    photos_only.kind = MediaKind::PHOTO;
    AssetScanner scanner(source_, ScanOptions{});
    for (const auto &handle : scanner.scan(std::nullopt, photos_only))
        EXPECT_EQ(handle.kind, MediaKind::PHOTO);

    AssetFilter recent;
    recent.date_range = DateRange{testTime(100), testTime(160)};
    auto handles = scanner.scan(std::nullopt, recent);
    ASSERT_EQ(handles.size(), 2u);
    EXPECT_EQ(handles[0].id, "d1");
    EXPECT_EQ(handles[1].id, "c1");
}

TEST_F(AssetScannerTest, ResolveScopeWithoutDirectoryKeepsAllAlbums)
{
    std::vector<MediaAlbum> albums = {{"1", "A", "/a"}, {"2", "B", "/b"}};
    EXPECT_EQ(AssetScanner::resolveScope(albums, std::nullopt).size(), 2u);
    EXPECT_TRUE(AssetScanner::resolveScope({}, std::string("/a")).empty());
}
