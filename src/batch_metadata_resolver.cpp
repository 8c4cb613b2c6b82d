#include "core/batch_metadata_resolver.hpp"
#include "core/error_recovery.hpp"
#include "core/file_utils.hpp"
#include "core/format_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <system_error>
#include <utility>

namespace
{
    DeviceMetadata metadataFromHandle(const RawAssetHandle &asset, uint64_t file_size_bytes)
    {
        DeviceMetadata metadata;
        metadata.creation_time = asset.creation_time;
        metadata.latitude = asset.latitude;
        metadata.longitude = asset.longitude;
        metadata.width = asset.width;
        metadata.height = asset.height;
        metadata.file_size_bytes = file_size_bytes;
        metadata.duration_seconds = asset.duration_seconds;
        metadata.orientation = asset.orientation;
        return metadata;
    }
}

BatchMetadataResolver::BatchMetadataResolver(std::shared_ptr<const MediaSource> source,
                                             std::shared_ptr<const FileAccess> file_access,
                                             const ResolverOptions &options)
    : source_(std::move(source)), file_access_(std::move(file_access)), options_(options)
{
    if (options_.batch_size == 0)
    {
        options_.batch_size = 1;
    }
}

std::string BatchMetadataResolver::placeholderPath(const RawAssetHandle &asset)
{
    std::string name = asset.title.empty() ? asset.id : asset.title;
    if (asset.relative_path.empty())
    {
        return "/" + name;
    }
    if (asset.relative_path.back() == '/')
    {
        return asset.relative_path + name;
    }
    return asset.relative_path + "/" + name;
}

std::optional<CandidateRecord> BatchMetadataResolver::resolveItem(const MediaSource &source,
                                                                  const FileAccess &file_access,
                                                                  const RawAssetHandle &asset,
                                                                  bool allow_placeholder)
{
    std::optional<std::string> live_path = source.resolveFilePath(asset);
    if (!live_path)
    {
        if (!allow_placeholder)
        {
            Logger::debug("No file for asset " + asset.id + ", dropping");
            return std::nullopt;
        }

        std::string path = placeholderPath(asset);
        auto classification = FormatClassifier::classify(path);
        if (!classification.supported)
        {
            Logger::debug("Placeholder for asset " + asset.id + " has unsupported format, dropping");
            return std::nullopt;
        }

        Logger::warn("No file for asset " + asset.id + ", using placeholder " + path);
        CandidateRecord record;
        record.id = asset.id;
        record.file_uri = FileUtils::toFileUri(path);
        record.mime_type = classification.mime_type;
        record.device_metadata = metadataFromHandle(asset, 0);
        record.is_placeholder = true;
        return record;
    }

    auto classification = FormatClassifier::classify(*live_path);
    if (!classification.supported)
    {
        Logger::debug("Unsupported format, dropping " + *live_path);
        return std::nullopt;
    }

    FileStatus status = file_access.stat(*live_path);
    if (!status.ok())
    {
        Logger::debug("Dropping " + *live_path + ": " + status.toString());
        return std::nullopt;
    }
    if (status.size == 0)
    {
        Logger::debug("Dropping empty file " + *live_path);
        return std::nullopt;
    }

    CandidateRecord record;
    record.id = asset.id;
    record.file_uri = FileUtils::toFileUri(*live_path);
    record.mime_type = classification.mime_type;
    record.device_metadata = metadataFromHandle(asset, status.size);
    return record;
}

std::vector<CandidateRecord> BatchMetadataResolver::resolve(const std::vector<RawAssetHandle> &assets,
                                                            ProgressCallback on_progress) const
{
    std::vector<CandidateRecord> records;
    if (assets.empty() || !source_ || !file_access_)
    {
        return records;
    }

    const size_t batch_size = options_.batch_size;
    const size_t batch_count = (assets.size() + batch_size - 1) / batch_size;
    Logger::info("Resolving " + std::to_string(assets.size()) + " asset(s) in " + std::to_string(batch_count) +
                 " batch(es) of " + std::to_string(batch_size));

    for (size_t batch_index = 0; batch_index < batch_count; ++batch_index)
    {
        const size_t begin = batch_index * batch_size;
        const size_t end = std::min(begin + batch_size, assets.size());
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.item_timeout_ms);

        std::vector<std::pair<std::string, std::future<std::optional<CandidateRecord>>>> pending;
        pending.reserve(end - begin);
        for (size_t i = begin; i < end; ++i)
        {
            auto source = source_;
            auto file_access = file_access_;
            RawAssetHandle asset = assets[i];
            bool allow_placeholder = options_.allow_placeholder_uris;
            try
            {
                pending.emplace_back(asset.id, ErrorRecovery::launchDetached([source, file_access, asset, allow_placeholder]()
                                                                             { return resolveItem(*source, *file_access, asset, allow_placeholder); }));
            }
            catch (const std::system_error &e)
            {
                Logger::error("Could not start worker for asset " + assets[i].id + ": " + e.what());
            }
        }

        size_t accepted = 0;
        for (auto &item : pending)
        {
            auto outcome = ErrorRecovery::awaitWithDeadline(item.second, deadline, "resolve asset " + item.first);
            if (outcome && *outcome)
            {
                records.push_back(std::move(**outcome));
                ++accepted;
            }
        }

        Logger::debug("Batch " + std::to_string(batch_index + 1) + "/" + std::to_string(batch_count) + ": " +
                      std::to_string(accepted) + " of " + std::to_string(end - begin) + " accepted");

        if (on_progress)
        {
            on_progress(BatchProgress{batch_index, batch_count, end - begin, accepted});
        }
    }

    Logger::info("Resolved " + std::to_string(records.size()) + " of " + std::to_string(assets.size()) +
                 " asset(s)");
    return records;
}
