#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/asset_scanner.hpp"
#include "core/batch_metadata_resolver.hpp"
#include "core/engine_options.hpp"
#include "core/uri_validator.hpp"

/**
 * @brief Entry point of the resolution pipeline
 *
 * Wires scanner, deduplicator, term filter, batch resolver and validator around an
 * injected media source and file access. Holds no per-query state, so one instance
 * may serve concurrent callers.
 */
class MediaResolutionService
{
public:
    MediaResolutionService(std::shared_ptr<const MediaSource> source,
                           std::shared_ptr<const FileAccess> file_access,
                           const EngineOptions &options);

    /**
     * @brief Scan, deduplicate and term-filter the assets a query selects
     * @return Unique handles, newest first
     */
    std::vector<RawAssetHandle> findCandidates(const MediaQuery &query) const;

    /**
     * @brief Full pipeline: candidates resolved into records, optionally post-validated
     * @param on_progress Optional per-batch progress callback
     */
    std::vector<CandidateRecord> resolveQuery(const MediaQuery &query,
                                              BatchMetadataResolver::ProgressCallback on_progress = nullptr) const;

    ValidationResult validate(const std::string &uri) const;
    ValidationResult validate(const CandidateRecord &record) const;

    /**
     * @brief Newest photo in a directory scope (or in every album)
     * @return The resolved record, or std::nullopt when nothing resolves
     */
    std::optional<CandidateRecord> latestImage(const std::optional<std::string> &directory = std::nullopt) const;

    /**
     * @brief Summary of the most recent media for downstream prompt building
     * @return {"media_context": {"recent_media", "total_count", "last_updated"}}; on failure the
     *         context is empty and carries an "error" string
     */
    nlohmann::json recentMediaContext(size_t limit = 25) const;

    /**
     * @brief Re-validate a stored selection
     *
     * Valid items are kept, recovered items point at their new location. If items were lost
     * and a query is given, the first candidate of that query not already selected is appended.
     */
    std::vector<CandidateRecord> recoverSelection(const std::vector<CandidateRecord> &selection,
                                                  const std::optional<MediaQuery> &query = std::nullopt) const;

    const EngineOptions &options() const { return options_; }

private:
    EngineOptions options_;
    AssetScanner scanner_;
    BatchMetadataResolver resolver_;
    UriValidator validator_;
};
