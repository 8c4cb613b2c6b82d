#pragma once

#include <string>
#include <vector>
#include "core/media_source.hpp"

/**
 * @brief MediaSource backed by directories on the local file system
 *
 * When the directory preferences are enabled and non-empty, each configured path is an
 * album; otherwise the default album roots are. Files are classified by extension, dated
 * by modification time and probed for dimensions, duration, orientation and location.
 */
class FilesystemMediaSource : public MediaSource
{
public:
    FilesystemMediaSource(const DirectoryConfig &directories, const std::vector<std::string> &default_roots);

    bool isSupported() const override { return true; }

    std::vector<MediaAlbum> listAlbums(const AssetFilter &filter) const override;

    /**
     * @throws std::filesystem::filesystem_error if the album root cannot be read
     */
    std::vector<RawAssetHandle> getAssets(const MediaAlbum &album, const AssetFilter &filter,
                                          size_t start, size_t end) const override;

    std::optional<std::string> resolveFilePath(const RawAssetHandle &asset) const override;

    /**
     * @brief Album roots in effect for the current directory preferences
     */
    std::vector<std::string> effectiveRoots() const;

private:
    DirectoryConfig directories_;
    std::vector<std::string> default_roots_;
};
