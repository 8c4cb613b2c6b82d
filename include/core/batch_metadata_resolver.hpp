#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "core/engine_options.hpp"
#include "core/file_access.hpp"
#include "core/media_source.hpp"

/**
 * @brief Progress event emitted after each batch
 */
struct BatchProgress
{
    size_t batch_index = 0; // Zero-based
    size_t batch_count = 0;
    size_t submitted = 0;   // Items in this batch
    size_t accepted = 0;    // Records this batch produced
};

/**
 * @brief Turns raw handles into CandidateRecords in bounded, time-limited batches
 *
 * Batches run one after another. Every item of a batch runs on its own detached worker
 * and must finish within item_timeout_ms of the batch start; slow, failing, missing,
 * empty and unsupported items are dropped without retry. A worker that misses the
 * deadline is abandoned and runs to completion in the background, holding shared
 * ownership of the source and file access.
 */
class BatchMetadataResolver
{
public:
    using ProgressCallback = std::function<void(const BatchProgress &)>;

    BatchMetadataResolver(std::shared_ptr<const MediaSource> source,
                          std::shared_ptr<const FileAccess> file_access,
                          const ResolverOptions &options);

    /**
     * @brief Resolve handles into records
     * @param assets Handles in the order records should appear
     * @param on_progress Optional callback invoked once per batch on the calling thread
     * @return Records in batch order, submission order within a batch; never throws
     */
    std::vector<CandidateRecord> resolve(const std::vector<RawAssetHandle> &assets,
                                         ProgressCallback on_progress = nullptr) const;

    /**
     * @brief Resolve one handle synchronously
     * @return The record, or std::nullopt when the item must be dropped
     * @throws whatever the media source or file access throws
     */
    static std::optional<CandidateRecord> resolveItem(const MediaSource &source, const FileAccess &file_access,
                                                      const RawAssetHandle &asset, bool allow_placeholder);

    /**
     * @brief Synthesized location "relative_path/title" used when no live file exists
     */
    static std::string placeholderPath(const RawAssetHandle &asset);

private:
    std::shared_ptr<const MediaSource> source_;
    std::shared_ptr<const FileAccess> file_access_;
    ResolverOptions options_;
};
