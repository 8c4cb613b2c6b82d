#include "core/filesystem_media_source.hpp"
#include "core/file_utils.hpp"
#include "core/format_classifier.hpp"
#include "core/media_probe.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <set>

namespace
{
    struct FileEntry
    {
        std::string path;
        MediaTime modification_time;
        MediaKind kind;
    };
}

FilesystemMediaSource::FilesystemMediaSource(const DirectoryConfig &directories,
                                             const std::vector<std::string> &default_roots)
    : directories_(directories), default_roots_(default_roots)
{
}

std::vector<std::string> FilesystemMediaSource::effectiveRoots() const
{
    if (directories_.enabled && !directories_.paths.empty())
    {
        return std::vector<std::string>(directories_.paths.begin(), directories_.paths.end());
    }
    return default_roots_;
}

std::vector<MediaAlbum> FilesystemMediaSource::listAlbums(const AssetFilter &) const
{
    std::vector<MediaAlbum> albums;
    std::set<std::string> seen;

    for (const auto &root : effectiveRoots())
    {
        std::string expanded = FileUtils::expandUserPath(root);
        if (!FileUtils::isValidDirectory(expanded))
        {
            Logger::warn("Skipping missing media directory: " + root);
            continue;
        }

        std::string canonical = FileUtils::canonicalPath(expanded);
        if (!seen.insert(canonical).second)
        {
            continue;
        }

        MediaAlbum album;
        album.id = canonical;
        album.path = canonical;
        album.name = fs::path(canonical).filename().string();
        if (album.name.empty())
        {
            album.name = canonical;
        }
        albums.push_back(album);
    }

    Logger::debug("Filesystem source exposes " + std::to_string(albums.size()) + " album(s)");
    return albums;
}

std::vector<RawAssetHandle> FilesystemMediaSource::getAssets(const MediaAlbum &album, const AssetFilter &filter,
                                                             size_t start, size_t end) const
{
    std::vector<RawAssetHandle> assets;
    if (end <= start)
    {
        return assets;
    }

    std::vector<FileEntry> entries;
    FileUtils::scanDirectoryRecursively(album.path, [&](const std::string &file_path)
                                        {
        auto classification = FormatClassifier::classify(file_path);
        if (!classification.supported)
            return;
        auto kind = FormatClassifier::kindOf(classification.mime_type);
        if (!kind || (filter.kind && *filter.kind != *kind))
            return;

        FileStatus status = FileUtils::getFileStatus(file_path);
        if (!status.ok())
        {
            Logger::debug("Skipping " + file_path + ": " + status.toString());
            return;
        }
        if (filter.date_range && !filter.date_range->contains(status.modification_time))
            return;

        entries.push_back({file_path, status.modification_time, *kind}); });

    std::sort(entries.begin(), entries.end(), [](const FileEntry &a, const FileEntry &b)
              {
        if (a.modification_time != b.modification_time)
            return a.modification_time > b.modification_time;
        return a.path < b.path; });

    // Probing is the expensive part, so stop as soon as the page is full
    size_t matched = 0;
    for (const auto &entry : entries)
    {
        if (matched >= end)
        {
            break;
        }

        fs::path path(entry.path);
        RawAssetHandle handle;
        handle.id = FileUtils::computeStringHash(entry.path);
        handle.creation_time = entry.modification_time;
        handle.title = path.filename().string();
        handle.relative_path = path.parent_path().string();
        handle.kind = entry.kind;
        handle.source_ref = entry.path;

        ProbedMetadata probed = MediaProbe::probe(entry.path, entry.kind);
        handle.width = probed.width;
        handle.height = probed.height;
        handle.duration_seconds = probed.duration_seconds;
        handle.orientation = probed.orientation;
        handle.latitude = probed.latitude;
        handle.longitude = probed.longitude;

        if (!filter.matches(handle))
        {
            continue;
        }
        if (matched >= start)
        {
            assets.push_back(handle);
        }
        ++matched;
    }

    return assets;
}

std::optional<std::string> FilesystemMediaSource::resolveFilePath(const RawAssetHandle &asset) const
{
    if (asset.source_ref.empty())
    {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::exists(asset.source_ref, ec))
    {
        return std::nullopt;
    }
    return asset.source_ref;
}
