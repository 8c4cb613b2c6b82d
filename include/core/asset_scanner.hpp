#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/engine_options.hpp"
#include "core/media_source.hpp"

/**
 * @brief Enumerates raw asset handles across the albums in scope
 *
 * Albums are read in parallel on a TBB arena limited to ScanOptions::max_scan_threads.
 * An album that throws is logged and skipped; scanning itself never throws.
 */
class AssetScanner
{
public:
    AssetScanner(std::shared_ptr<const MediaSource> source, const ScanOptions &options);

    /**
     * @brief Collect handles matching the filter, newest first
     * @param directory Restrict to one album; std::nullopt scans every album
     * @param filter Kind, date and duration constraints
     * @return Up to page_size handles per album, concatenated and sorted by creation time
     */
    std::vector<RawAssetHandle> scan(const std::optional<std::string> &directory, const AssetFilter &filter) const;

    /**
     * @brief Pick the albums to scan for a directory scope
     *
     * Matches an album whose path equals the directory, then one whose name equals the
     * directory's last path component, else falls back to the first album.
     */
    static std::vector<MediaAlbum> resolveScope(const std::vector<MediaAlbum> &albums,
                                                const std::optional<std::string> &directory);

private:
    std::vector<RawAssetHandle> scanAlbum(const MediaAlbum &album, const AssetFilter &filter) const;

    std::shared_ptr<const MediaSource> source_;
    ScanOptions options_;
};
