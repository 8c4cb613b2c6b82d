#include <gtest/gtest.h>
#include "core/media_resolution_service.hpp"
#include "fakes.hpp"
#include "logging/logger.hpp"
#include <map>
#include <set>

class MediaResolutionServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        source_ = std::make_shared<FakeMediaSource>();
        files_ = std::make_shared<FakeFileAccess>();
        source_->addAlbum("camera", "Camera");
        source_->addAlbum("screens", "Screenshots");
        source_->addAlbum("whatsapp", "WhatsApp");
    }

    void addPhoto(const std::string &album, const std::string &id, int64_t offset, const std::string &title = "")
    {
        RawAssetHandle handle = makeHandle(id, offset, title);
        source_->addAsset(album, handle);
        files_->addFile("/media/" + album + "/" + handle.title, 2048);
    }

    MediaResolutionService makeService(EngineOptions options = EngineOptions{})
    {
        return MediaResolutionService(source_, files_, options);
    }

    std::shared_ptr<FakeMediaSource> source_;
    std::shared_ptr<FakeFileAccess> files_;
};

TEST_F(MediaResolutionServiceTest, EndToEndDeduplicatesAcrossAlbums)
{
    const std::vector<std::string> albums = {"camera", "screens", "whatsapp"};
    std::map<std::string, RawAssetHandle> camera_handles;
    int duplicates = 0;
    for (size_t a = 0; a < albums.size(); ++a)
    {
        for (int i = 0; i < 50; ++i)
        {
            // The first 10 photos of the second and third album are the same assets as camera photos
            RawAssetHandle handle;
            if (a > 0 && i < 10)
            {
                handle = camera_handles.at("camera-" + std::to_string(i + (a - 1) * 10));
                ++duplicates;
            }
            else
            {
                handle = makeHandle(albums[a] + "-" + std::to_string(i), static_cast<int64_t>(a * 1000 + i));
            }
            if (a == 0)
                camera_handles[handle.id] = handle;

            source_->addAsset(albums[a], handle);
            files_->addFile("/media/" + albums[a] + "/" + handle.title, 2048);
        }
    }
    ASSERT_EQ(duplicates, 20);

    MediaQuery query;
    query.media_kind = MediaKind::PHOTO;
    auto records = makeService().resolveQuery(query);

    ASSERT_EQ(records.size(), 130u);
    std::set<std::string> ids;
    for (size_t i = 0; i < records.size(); ++i)
    {
        ids.insert(records[i].id);
        EXPECT_EQ(records[i].mime_type.rfind("image/", 0), 0u);
        if (i > 0)
            EXPECT_GE(records[i - 1].device_metadata.creation_time, records[i].device_metadata.creation_time);
    }
    EXPECT_EQ(ids.size(), 130u);
}

TEST_F(MediaResolutionServiceTest, FindCandidatesAppliesTerms)
{
    addPhoto("camera", "1", 10, "beach.jpg");
    addPhoto("camera", "2", 20, "city.jpg");
    addPhoto("screens", "3", 30, "Beach-volley.png");

    MediaQuery query = MediaQuery::fromText("beach");
    auto candidates = makeService().findCandidates(query);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].id, "3");
    EXPECT_EQ(candidates[1].id, "1");
}

TEST_F(MediaResolutionServiceTest, PostValidationDropsPlaceholdersThatDoNotResolve)
{
    addPhoto("camera", "live", 10);
    source_->addAsset("camera", makeHandle("cloud", 20), std::nullopt);

    auto validated = makeService().resolveQuery(MediaQuery{});
    ASSERT_EQ(validated.size(), 1u);
    EXPECT_EQ(validated[0].id, "live");

    EngineOptions options;
    options.resolver.validate_results = false;
    auto raw = makeService(options).resolveQuery(MediaQuery{});
    ASSERT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw[0].id, "cloud");
    EXPECT_TRUE(raw[0].is_placeholder);
}

TEST_F(MediaResolutionServiceTest, LatestImageSkipsVideos)
{
    addPhoto("camera", "older", 10);
    addPhoto("screens", "newest-photo", 50);
    RawAssetHandle clip = makeHandle("clip", 99, "", MediaKind::VIDEO);
    source_->addAsset("camera", clip);
    files_->addFile("/media/camera/" + clip.title, 4096);

    auto latest = makeService().latestImage();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, "newest-photo");

    auto in_camera = makeService().latestImage(std::string("/any/Camera"));
    ASSERT_TRUE(in_camera.has_value());
    EXPECT_EQ(in_camera->id, "older");
}

TEST_F(MediaResolutionServiceTest, LatestImageOfEmptyLibrary)
{
    EXPECT_FALSE(makeService().latestImage().has_value());
}

TEST_F(MediaResolutionServiceTest, RecentMediaContextIsLimited)
{
    for (int i = 0; i < 30; ++i)
        addPhoto("camera", "p" + std::to_string(i), i);

    auto context = makeService().recentMediaContext(25);
    ASSERT_TRUE(context.contains("media_context"));
    const auto &media_context = context["media_context"];
    EXPECT_EQ(media_context["total_count"], 25);
    ASSERT_EQ(media_context["recent_media"].size(), 25u);
    EXPECT_EQ(media_context["recent_media"][0]["id"], "p29");
    EXPECT_TRUE(media_context["last_updated"].is_string());
    EXPECT_FALSE(media_context.contains("error"));
}

TEST_F(MediaResolutionServiceTest, RecoverSelectionAppendsReplacement)
{
    addPhoto("camera", "kept", 30, "kept.jpg");
    addPhoto("camera", "fresh", 40, "fresh.jpg");

    CandidateRecord kept;
    kept.id = "kept";
    kept.file_uri = "file:///media/camera/kept.jpg";
    kept.mime_type = "image/jpeg";
    kept.device_metadata.creation_time = testTime(30);

    CandidateRecord lost = kept;
    lost.id = "deleted";
    lost.file_uri = "file:///media/camera/deleted.jpg";
    lost.device_metadata.creation_time = testTime(-5000);

    auto service = makeService();
    auto without_query = service.recoverSelection({kept, lost});
    ASSERT_EQ(without_query.size(), 1u);

    auto with_query = service.recoverSelection({kept, lost}, MediaQuery{});
    ASSERT_EQ(with_query.size(), 2u);
    EXPECT_EQ(with_query[0].id, "kept");
    EXPECT_EQ(with_query[1].id, "fresh");
}

TEST_F(MediaResolutionServiceTest, ValidateDelegatesToValidator)
{
    addPhoto("camera", "a", 1, "a.jpg");
    auto service = makeService();
    EXPECT_TRUE(service.validate("file:///media/camera/a.jpg").is_valid);
    EXPECT_EQ(service.validate("ftp://host/a.jpg").failure_reason, ValidationFailure::INVALID_URI);
}

TEST_F(MediaResolutionServiceTest, UnsupportedPlatformReturnsNothing)
{
    MediaResolutionService service(std::make_shared<UnsupportedMediaSource>(), files_, EngineOptions{});
    EXPECT_TRUE(service.resolveQuery(MediaQuery::fromText("anything")).empty());
    EXPECT_FALSE(service.latestImage().has_value());
    EXPECT_EQ(service.recentMediaContext()["media_context"]["total_count"], 0);
}
