#include "core/asset_scanner.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace
{
    std::string lastPathComponent(const std::string &path)
    {
        std::string trimmed = path;
        while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\'))
        {
            trimmed.pop_back();
        }
        return std::filesystem::path(trimmed).filename().string();
    }
}

AssetScanner::AssetScanner(std::shared_ptr<const MediaSource> source, const ScanOptions &options)
    : source_(std::move(source)), options_(options)
{
}

std::vector<MediaAlbum> AssetScanner::resolveScope(const std::vector<MediaAlbum> &albums,
                                                   const std::optional<std::string> &directory)
{
    if (!directory || albums.empty())
    {
        return albums;
    }

    for (const auto &album : albums)
    {
        if (!album.path.empty() && album.path == *directory)
        {
            return {album};
        }
    }

    std::string wanted = lastPathComponent(*directory);
    for (const auto &album : albums)
    {
        if (album.name == wanted)
        {
            return {album};
        }
    }

    Logger::warn("No album matches directory '" + *directory + "', using '" + albums.front().name + "'");
    return {albums.front()};
}

std::vector<RawAssetHandle> AssetScanner::scan(const std::optional<std::string> &directory,
                                               const AssetFilter &filter) const
{
    if (!source_ || !source_->isSupported())
    {
        Logger::debug("Media source unsupported on this platform, nothing to scan");
        return {};
    }

    std::vector<MediaAlbum> albums;
    try
    {
        albums = resolveScope(source_->listAlbums(filter), directory);
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to list albums: " + std::string(e.what()));
        return {};
    }

    if (albums.empty())
    {
        Logger::info("No albums available to scan");
        return {};
    }

    // One slot per album so workers never share a container
    std::vector<std::vector<RawAssetHandle>> slots(albums.size());
    std::atomic<size_t> failed_albums{0};

    tbb::task_arena arena(std::max(1, options_.max_scan_threads));
    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, albums.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              try
                                              {
                                                  slots[i] = scanAlbum(albums[i], filter);
                                              }
                                              catch (const std::exception &e)
                                              {
                                                  failed_albums++;
                                                  Logger::warn("Skipping album '" + albums[i].name + "': " + e.what());
                                              }
                                          }
                                      }); });

    std::vector<RawAssetHandle> handles;
    for (auto &slot : slots)
    {
        handles.insert(handles.end(), std::make_move_iterator(slot.begin()), std::make_move_iterator(slot.end()));
    }

    std::stable_sort(handles.begin(), handles.end(), [](const RawAssetHandle &a, const RawAssetHandle &b)
                     { return a.creation_time > b.creation_time; });

    Logger::info("Scanned " + std::to_string(albums.size()) + " album(s), " +
                 std::to_string(failed_albums.load()) + " failed, " + std::to_string(handles.size()) + " asset(s)");
    return handles;
}

std::vector<RawAssetHandle> AssetScanner::scanAlbum(const MediaAlbum &album, const AssetFilter &filter) const
{
    std::vector<RawAssetHandle> page = source_->getAssets(album, filter, 0, options_.page_size);

    // Re-apply the filter; a source may return more than it was asked for
    std::vector<RawAssetHandle> accepted;
    accepted.reserve(std::min(page.size(), options_.page_size));
    for (auto &asset : page)
    {
        if (accepted.size() >= options_.page_size)
            break;
        if (filter.matches(asset))
            accepted.push_back(std::move(asset));
    }

    Logger::debug("Album '" + album.name + "' contributed " + std::to_string(accepted.size()) + " asset(s)");
    return accepted;
}
