#include "core/media_resolution_service.hpp"
#include "core/deduplicator.hpp"
#include "core/term_filter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <unordered_set>

MediaResolutionService::MediaResolutionService(std::shared_ptr<const MediaSource> source,
                                               std::shared_ptr<const FileAccess> file_access,
                                               const EngineOptions &options)
    : options_(options),
      scanner_(source, options.scan),
      resolver_(source, file_access, options.resolver),
      validator_(source, file_access, options.validation)
{
}

std::vector<RawAssetHandle> MediaResolutionService::findCandidates(const MediaQuery &query) const
{
    AssetFilter filter = AssetFilter::fromQuery(query, options_.scan.max_video_duration_seconds);
    std::vector<RawAssetHandle> scanned = scanner_.scan(query.directory, filter);
    std::vector<RawAssetHandle> unique = Deduplicator::dedupe(scanned);
    std::vector<RawAssetHandle> candidates = TermFilter::filter(unique, query.terms, query.original_query);

    Logger::info("Query '" + query.original_query + "': " + std::to_string(scanned.size()) + " scanned, " +
                 std::to_string(unique.size()) + " unique, " + std::to_string(candidates.size()) + " candidate(s)");
    return candidates;
}

std::vector<CandidateRecord> MediaResolutionService::resolveQuery(const MediaQuery &query,
                                                                  BatchMetadataResolver::ProgressCallback on_progress) const
{
    std::vector<CandidateRecord> records = resolver_.resolve(findCandidates(query), on_progress);
    if (!options_.resolver.validate_results)
    {
        return records;
    }
    return validator_.postFilter(records);
}

ValidationResult MediaResolutionService::validate(const std::string &uri) const
{
    return validator_.validate(uri);
}

ValidationResult MediaResolutionService::validate(const CandidateRecord &record) const
{
    return validator_.validate(record);
}

std::optional<CandidateRecord> MediaResolutionService::latestImage(const std::optional<std::string> &directory) const
{
    MediaQuery query;
    query.media_kind = MediaKind::PHOTO;
    query.directory = directory;

    std::vector<RawAssetHandle> candidates = findCandidates(query);
    if (candidates.empty())
    {
        Logger::info("No images found in " + directory.value_or("any album"));
        return std::nullopt;
    }

    // Only the newest batch is worth resolving
    candidates.resize(std::min(candidates.size(), options_.resolver.batch_size));
    std::vector<CandidateRecord> records = resolver_.resolve(candidates);
    if (options_.resolver.validate_results)
    {
        records = validator_.postFilter(records);
    }
    if (records.empty())
    {
        return std::nullopt;
    }
    return records.front();
}

nlohmann::json MediaResolutionService::recentMediaContext(size_t limit) const
{
    nlohmann::json context;
    try
    {
        std::vector<RawAssetHandle> candidates = findCandidates(MediaQuery{});
        if (candidates.size() > limit)
        {
            candidates.resize(limit);
        }

        std::vector<CandidateRecord> records = resolver_.resolve(candidates);
        context["recent_media"] = candidatesToJson(records);
        context["total_count"] = records.size();
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to build media context: " + std::string(e.what()));
        context["recent_media"] = nlohmann::json::array();
        context["total_count"] = 0;
        context["error"] = e.what();
    }
    context["last_updated"] = toIso8601(std::chrono::system_clock::now());

    nlohmann::json result;
    result["media_context"] = context;
    return result;
}

std::vector<CandidateRecord> MediaResolutionService::recoverSelection(const std::vector<CandidateRecord> &selection,
                                                                      const std::optional<MediaQuery> &query) const
{
    std::vector<CandidateRecord> kept = validator_.postFilter(selection);
    if (kept.size() == selection.size() || !query)
    {
        return kept;
    }

    Logger::info("Lost " + std::to_string(selection.size() - kept.size()) +
                 " item(s) from the selection, looking for a replacement");

    std::unordered_set<std::string> selected_ids;
    for (const auto &record : selection)
    {
        selected_ids.insert(record.id);
    }

    for (const auto &record : resolveQuery(*query))
    {
        if (selected_ids.count(record.id) == 0)
        {
            kept.push_back(record);
            break;
        }
    }
    return kept;
}
