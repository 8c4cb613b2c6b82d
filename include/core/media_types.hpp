#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using MediaTime = std::chrono::system_clock::time_point;

enum class MediaKind
{
    PHOTO,
    VIDEO
};

/**
 * @brief Typed reason a stored media reference failed validation
 */
enum class ValidationFailure
{
    NOT_FOUND,         // Reference no longer resolves and could not be recovered
    PERMISSION_DENIED, // File exists but cannot be read
    EMPTY,             // File exists but has zero length
    UNSUPPORTED,       // Format is outside the supported allow-list
    CORRUPT,           // Image header does not match the extension
    INVALID_URI        // Not a file URI or absolute path
};

std::string mediaKindToString(MediaKind kind);
std::optional<MediaKind> mediaKindFromString(const std::string &value);
std::string validationFailureToString(ValidationFailure reason);

/**
 * @brief Format a time point as an ISO-8601 UTC string with fractional seconds
 */
std::string toIso8601(MediaTime time);

/**
 * @brief Parse an ISO-8601 timestamp or date
 * @param value Text such as "2024-06-01T10:00:00Z" or "2024-06-01"
 * @param end_of_day When the value is a bare date, return the last microsecond of that day
 * @return Parsed time, or std::nullopt if the text is not ISO-8601
 */
std::optional<MediaTime> parseIso8601(const std::string &value, bool end_of_day = false);

/**
 * @brief Inclusive creation-time window
 */
struct DateRange
{
    MediaTime start;
    MediaTime end;

    bool contains(MediaTime time) const { return time >= start && time <= end; }
};

/**
 * @brief Search request produced by the natural-language parser
 */
struct MediaQuery
{
    std::vector<std::string> terms;
    std::string original_query;
    std::optional<DateRange> date_range;
    std::optional<MediaKind> media_kind;
    std::optional<std::string> directory;

    /**
     * @brief Build a query from the parser's JSON object
     * @throws std::invalid_argument on malformed fields
     */
    static MediaQuery fromJson(const nlohmann::json &json);

    /**
     * @brief Build a query from raw text; whitespace-separated words become the terms
     */
    static MediaQuery fromText(const std::string &text);
};

/**
 * @brief Cached snapshot of an asset as reported by the media index
 */
struct RawAssetHandle
{
    std::string id;
    MediaTime creation_time{};
    std::optional<double> latitude;
    std::optional<double> longitude;
    int width = 0;
    int height = 0;
    double duration_seconds = 0.0;
    int orientation = 0;       // Clockwise rotation in degrees
    std::string title;         // Display title, usually the file name
    std::string relative_path; // Directory of the asset inside its album
    MediaKind kind = MediaKind::PHOTO;
    std::string source_ref;    // Opaque locator the media source uses to re-resolve the file
};

struct DeviceMetadata
{
    MediaTime creation_time{};
    std::optional<double> latitude;
    std::optional<double> longitude;
    int width = 0;
    int height = 0;
    uint64_t file_size_bytes = 0;
    double duration_seconds = 0.0;
    int orientation = 0;
};

/**
 * @brief Normalized, selectable media item produced by a resolution pass
 */
struct CandidateRecord
{
    std::string id;
    std::string file_uri;
    std::string mime_type;
    DeviceMetadata device_metadata;
    bool is_placeholder = false; // URI was synthesized because the live file was unavailable

    nlohmann::json toJson() const;
};

struct ValidationResult
{
    bool is_valid = false;
    std::string effective_uri;
    std::optional<ValidationFailure> failure_reason;
    bool recovered = false;

    static ValidationResult valid(const std::string &uri, bool recovered = false);
    static ValidationResult failure(const std::string &uri, ValidationFailure reason);

    nlohmann::json toJson() const;
};

/**
 * @brief User directory preferences, resolved by the caller
 */
struct DirectoryConfig
{
    bool enabled = false;
    std::set<std::string> paths;
};

/**
 * @brief One enumeration unit of a media source (an OS album or a scanned directory)
 */
struct MediaAlbum
{
    std::string id;
    std::string name;
    std::string path;
};

/**
 * @brief Enumeration constraints handed to the media source
 *
 * Dimension limits are ignored; videos longer than the duration cap are excluded.
 */
struct AssetFilter
{
    std::optional<DateRange> date_range;
    std::optional<MediaKind> kind;
    double max_video_duration_seconds = 15 * 60;

    bool matches(const RawAssetHandle &asset) const;

    static AssetFilter fromQuery(const MediaQuery &query, double max_video_duration_seconds);
};

nlohmann::json candidatesToJson(const std::vector<CandidateRecord> &records);
