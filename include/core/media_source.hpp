#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/media_types.hpp"

/**
 * @brief Capability interface to the device media index
 *
 * Listing and paging may throw; callers isolate failures per album and per item.
 * Implementations must be safe to call concurrently.
 */
class MediaSource
{
public:
    virtual ~MediaSource() = default;

    /**
     * @brief Whether this platform has a media index at all
     */
    virtual bool isSupported() const = 0;

    /**
     * @brief Albums that may contain assets matching the filter, in source order
     */
    virtual std::vector<MediaAlbum> listAlbums(const AssetFilter &filter) const = 0;

    /**
     * @brief Assets of an album in [start, end), newest first, already filtered
     */
    virtual std::vector<RawAssetHandle> getAssets(const MediaAlbum &album, const AssetFilter &filter,
                                                  size_t start, size_t end) const = 0;

    /**
     * @brief Resolve the live local file backing a handle
     * @return Absolute path, or std::nullopt when the source cannot produce a file
     */
    virtual std::optional<std::string> resolveFilePath(const RawAssetHandle &asset) const = 0;
};

/**
 * @brief Source for platforms without a media index; every query is empty
 */
class UnsupportedMediaSource : public MediaSource
{
public:
    bool isSupported() const override { return false; }

    std::vector<MediaAlbum> listAlbums(const AssetFilter &) const override { return {}; }

    std::vector<RawAssetHandle> getAssets(const MediaAlbum &, const AssetFilter &, size_t, size_t) const override
    {
        return {};
    }

    std::optional<std::string> resolveFilePath(const RawAssetHandle &) const override { return std::nullopt; }
};
