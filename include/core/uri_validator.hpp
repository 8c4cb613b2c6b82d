#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/engine_options.hpp"
#include "core/file_access.hpp"
#include "core/media_source.hpp"

/**
 * @brief Identity clues used to find a stale reference again in the media index
 */
struct RecoveryHint
{
    std::string id;
    std::string title;                      // File name of the stale reference
    std::optional<MediaTime> creation_time; // Set when validating a full record
    uint64_t file_size_bytes = 0;           // 0 when unknown
};

/**
 * @brief Validates stored media references and recovers stale ones
 *
 * A reference that still resolves is checked for readability, length, format and (for
 * images) header signature. A reference that no longer resolves is looked up again
 * through the media source by id, then exact file name, then a file name that differs only by
 * copy markers ("_2", "(2)", "_copy") and keeps the extension, then creation time and size.
 * Every call is independent; failures are reported in the ValidationResult, never thrown.
 */
class UriValidator
{
public:
    UriValidator(std::shared_ptr<const MediaSource> source,
                 std::shared_ptr<const FileAccess> file_access,
                 const ValidatorOptions &options);

    ValidationResult validate(const std::string &uri) const;

    ValidationResult validate(const CandidateRecord &record) const;

    /**
     * @brief Keep valid records, pointing recovered ones at their new location
     */
    std::vector<CandidateRecord> postFilter(const std::vector<CandidateRecord> &records) const;

    /**
     * @brief Search the media index for an asset matching the hint
     * @return Path of a live, non-empty file, or std::nullopt
     */
    static std::optional<std::string> findReplacement(const MediaSource &source, const FileAccess &file_access,
                                                      const ValidatorOptions &options, const RecoveryHint &hint);

private:
    ValidationResult validateWithHint(const std::string &uri, const std::optional<std::string> &path,
                                      const RecoveryHint &hint) const;
    ValidationResult checkExistingFile(const std::string &uri, const std::string &path, uint64_t size) const;
    ValidationResult recover(const std::string &uri, const RecoveryHint &hint) const;

    std::shared_ptr<const MediaSource> source_;
    std::shared_ptr<const FileAccess> file_access_;
    ValidatorOptions options_;
};
