#include "core/uri_validator.hpp"
#include "core/error_recovery.hpp"
#include "core/file_utils.hpp"
#include "core/format_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>

namespace
{
    enum class MatchStrategy
    {
        ID,
        TITLE,
        COPY_NAME,
        CREATION_TIME_AND_SIZE
    };

    const char *strategyName(MatchStrategy strategy)
    {
        switch (strategy)
        {
        case MatchStrategy::ID:
            return "id";
        case MatchStrategy::TITLE:
            return "title";
        case MatchStrategy::COPY_NAME:
            return "copy name";
        case MatchStrategy::CREATION_TIME_AND_SIZE:
            return "creation time and size";
        }
        return "unknown";
    }

    std::string fileNameOf(const std::string &path)
    {
        return std::filesystem::path(path).filename().string();
    }

    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Removes one trailing copy marker: "_2", "(2)", "_copy" or " copy"
    bool stripCopyMarker(std::string &base)
    {
        size_t digits_start = base.find_last_not_of("0123456789");
        size_t digit_count = digits_start == std::string::npos ? 0 : base.size() - digits_start - 1;
        if (digit_count >= 1 && digit_count <= 2 && base[digits_start] == '_')
        {
            // Longer runs are camera counters (IMG_1234), not copy counters
            base.erase(digits_start);
            return true;
        }

        if (base.size() > 2 && base.back() == ')')
        {
            size_t open = base.rfind('(');
            if (open != std::string::npos && open + 2 < base.size() &&
                base.find_first_not_of("0123456789", open + 1) == base.size() - 1)
            {
                base.erase(open);
                while (!base.empty() && base.back() == ' ')
                    base.pop_back();
                return true;
            }
        }

        for (const char *marker : {"_copy", "_Copy", " copy", " Copy"})
        {
            if (endsWith(base, marker))
            {
                base.erase(base.size() - std::string(marker).size());
                return true;
            }
        }
        return false;
    }

    std::string lowerExtension(const std::string &file_name)
    {
        std::string extension = std::filesystem::path(file_name).extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
        return extension;
    }

    // True when stripping copy markers from copy_name reaches original_name
    bool isCopyOf(const std::string &copy_name, const std::string &original_name)
    {
        if (lowerExtension(copy_name) != lowerExtension(original_name))
        {
            return false;
        }

        std::string original = std::filesystem::path(original_name).stem().string();
        if (original.size() < 3)
        {
            return false;
        }

        std::string base = std::filesystem::path(copy_name).stem().string();
        while (stripCopyMarker(base))
        {
            if (base == original)
            {
                return true;
            }
        }
        return false;
    }

    bool withinTolerance(MediaTime a, MediaTime b, int tolerance_ms)
    {
        auto delta = a > b ? a - b : b - a;
        return delta <= std::chrono::milliseconds(tolerance_ms);
    }

    bool strategyApplies(MatchStrategy strategy, const RecoveryHint &hint)
    {
        switch (strategy)
        {
        case MatchStrategy::ID:
            return !hint.id.empty();
        case MatchStrategy::TITLE:
            return !hint.title.empty();
        case MatchStrategy::COPY_NAME:
            return !lowerExtension(hint.title).empty();
        case MatchStrategy::CREATION_TIME_AND_SIZE:
            // Needs a known size; placeholders have none
            return hint.creation_time.has_value() && hint.file_size_bytes != 0;
        }
        return false;
    }

    bool matchesHint(MatchStrategy strategy, const RawAssetHandle &asset, const RecoveryHint &hint, int tolerance_ms)
    {
        switch (strategy)
        {
        case MatchStrategy::ID:
            return asset.id == hint.id;
        case MatchStrategy::TITLE:
            return asset.title == hint.title;
        case MatchStrategy::COPY_NAME:
            return isCopyOf(asset.title, hint.title) || isCopyOf(hint.title, asset.title);
        case MatchStrategy::CREATION_TIME_AND_SIZE:
            return withinTolerance(asset.creation_time, *hint.creation_time, tolerance_ms);
        }
        return false;
    }
}

UriValidator::UriValidator(std::shared_ptr<const MediaSource> source,
                           std::shared_ptr<const FileAccess> file_access,
                           const ValidatorOptions &options)
    : source_(std::move(source)), file_access_(std::move(file_access)), options_(options)
{
}

ValidationResult UriValidator::validate(const std::string &uri) const
{
    auto path = FileUtils::fromFileUri(uri);
    RecoveryHint hint;
    if (path)
    {
        hint.title = fileNameOf(*path);
    }
    return validateWithHint(uri, path, hint);
}

ValidationResult UriValidator::validate(const CandidateRecord &record) const
{
    auto path = FileUtils::fromFileUri(record.file_uri);
    RecoveryHint hint;
    hint.id = record.id;
    hint.title = path ? fileNameOf(*path) : "";
    hint.creation_time = record.device_metadata.creation_time;
    hint.file_size_bytes = record.device_metadata.file_size_bytes;
    return validateWithHint(record.file_uri, path, hint);
}

ValidationResult UriValidator::validateWithHint(const std::string &uri, const std::optional<std::string> &path,
                                                const RecoveryHint &hint) const
{
    if (!path)
    {
        // A record still carries its id, so it can be found again without a usable path
        if (!hint.id.empty())
        {
            Logger::debug("Unusable URI '" + uri + "', recovering asset " + hint.id);
            return recover(uri, hint);
        }
        Logger::debug("Rejecting URI '" + uri + "': not a local file URI");
        return ValidationResult::failure(uri, ValidationFailure::INVALID_URI);
    }

    FileStatus status = file_access_->stat(*path);
    switch (status.state)
    {
    case FileStatus::State::OK:
        return checkExistingFile(uri, *path, status.size);
    case FileStatus::State::PERMISSION_DENIED:
        Logger::debug("Permission denied for " + *path);
        return ValidationResult::failure(uri, ValidationFailure::PERMISSION_DENIED);
    default:
        Logger::debug("Stale reference " + *path + " (" + status.toString() + "), attempting recovery");
        return recover(uri, hint);
    }
}

ValidationResult UriValidator::checkExistingFile(const std::string &uri, const std::string &path, uint64_t size) const
{
    if (size == 0)
    {
        return ValidationResult::failure(uri, ValidationFailure::EMPTY);
    }

    auto classification = FormatClassifier::classify(path);
    if (!classification.supported)
    {
        return ValidationResult::failure(uri, ValidationFailure::UNSUPPORTED);
    }

    if (options_.check_image_headers && FormatClassifier::kindOf(classification.mime_type) == MediaKind::PHOTO)
    {
        auto header = file_access_->readHeader(path, FormatClassifier::HEADER_PROBE_BYTES);
        if (!FormatClassifier::hasValidImageHeader(header, classification.mime_type))
        {
            Logger::warn("Image header does not match " + classification.mime_type + ": " + path);
            return ValidationResult::failure(uri, ValidationFailure::CORRUPT);
        }
    }

    return ValidationResult::valid(uri);
}

ValidationResult UriValidator::recover(const std::string &uri, const RecoveryHint &hint) const
{
    if (!source_ || !source_->isSupported())
    {
        return ValidationResult::failure(uri, ValidationFailure::NOT_FOUND);
    }

    std::optional<std::string> replacement;
    try
    {
        auto source = source_;
        auto file_access = file_access_;
        auto options = options_;
        replacement = ErrorRecovery::callWithTimeout([source, file_access, options, hint]()
                                                     { return findReplacement(*source, *file_access, options, hint); },
                                                     options_.recovery_timeout_ms, "recover " + uri);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Recovery failed for " + uri + ": " + e.what());
        return ValidationResult::failure(uri, ValidationFailure::NOT_FOUND);
    }

    if (!replacement)
    {
        Logger::debug("No replacement found for " + uri);
        return ValidationResult::failure(uri, ValidationFailure::NOT_FOUND);
    }

    if (!FormatClassifier::isSupportedFile(*replacement))
    {
        return ValidationResult::failure(uri, ValidationFailure::UNSUPPORTED);
    }

    std::string recovered_uri = FileUtils::toFileUri(*replacement);
    Logger::info("Recovered " + uri + " as " + recovered_uri);
    return ValidationResult::valid(recovered_uri, true);
}

std::optional<std::string> UriValidator::findReplacement(const MediaSource &source, const FileAccess &file_access,
                                                         const ValidatorOptions &options, const RecoveryHint &hint)
{
    // No kind, date or duration constraint while searching
    AssetFilter filter;
    filter.max_video_duration_seconds = 0;

    std::vector<RawAssetHandle> assets;
    for (const auto &album : source.listAlbums(filter))
    {
        try
        {
            auto page = source.getAssets(album, filter, 0, options.recovery_page_size);
            assets.insert(assets.end(), page.begin(), page.end());
        }
        catch (const std::exception &e)
        {
            Logger::warn("Skipping album '" + album.name + "' during recovery: " + e.what());
        }
    }

    // Strongest identity first
    const MatchStrategy strategies[] = {MatchStrategy::ID, MatchStrategy::TITLE, MatchStrategy::COPY_NAME,
                                        MatchStrategy::CREATION_TIME_AND_SIZE};
    for (MatchStrategy strategy : strategies)
    {
        if (!strategyApplies(strategy, hint))
        {
            continue;
        }

        for (const auto &asset : assets)
        {
            if (!matchesHint(strategy, asset, hint, options.creation_time_tolerance_ms))
            {
                continue;
            }

            auto path = source.resolveFilePath(asset);
            if (!path)
            {
                continue;
            }
            FileStatus status = file_access.stat(*path);
            if (!status.ok() || status.size == 0)
            {
                continue;
            }
            if (strategy == MatchStrategy::CREATION_TIME_AND_SIZE && status.size != hint.file_size_bytes)
            {
                continue;
            }

            Logger::debug("Matched asset " + asset.id + " by " + strategyName(strategy));
            return path;
        }
    }
    return std::nullopt;
}

std::vector<CandidateRecord> UriValidator::postFilter(const std::vector<CandidateRecord> &records) const
{
    std::vector<CandidateRecord> valid_records;
    for (const auto &record : records)
    {
        ValidationResult result = validate(record);
        if (!result.is_valid)
        {
            Logger::debug("Dropping " + record.id + ": " +
                          validationFailureToString(result.failure_reason.value_or(ValidationFailure::NOT_FOUND)));
            continue;
        }

        CandidateRecord updated = record;
        if (result.recovered || record.is_placeholder)
        {
            updated.file_uri = result.effective_uri;
            updated.mime_type = FormatClassifier::classify(result.effective_uri).mime_type;
            updated.is_placeholder = false;
            auto path = FileUtils::fromFileUri(result.effective_uri);
            if (path)
            {
                FileStatus status = file_access_->stat(*path);
                if (status.ok())
                {
                    updated.device_metadata.file_size_bytes = status.size;
                }
            }
        }
        valid_records.push_back(updated);
    }
    return valid_records;
}
