#include "core/media_types.hpp"
#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Timestamp.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), ::tolower);
        return value;
    }

    MediaTime requireTime(const nlohmann::json &node, const std::string &field, bool end_of_day)
    {
        if (!node.contains(field) || !node[field].is_string())
        {
            throw std::invalid_argument("date_range." + field + " must be an ISO-8601 string");
        }
        auto parsed = parseIso8601(node[field].get<std::string>(), end_of_day);
        if (!parsed)
        {
            throw std::invalid_argument("Invalid date_range." + field + ": " + node[field].get<std::string>());
        }
        return *parsed;
    }

    nlohmann::json optionalToJson(const std::optional<double> &value)
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
}

std::string mediaKindToString(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::PHOTO:
        return "photo";
    case MediaKind::VIDEO:
        return "video";
    }
    return "photo";
}

std::optional<MediaKind> mediaKindFromString(const std::string &value)
{
    std::string lower = toLower(trim(value));
    if (lower == "photo" || lower == "image")
        return MediaKind::PHOTO;
    if (lower == "video")
        return MediaKind::VIDEO;
    return std::nullopt;
}

std::string validationFailureToString(ValidationFailure reason)
{
    switch (reason)
    {
    case ValidationFailure::NOT_FOUND:
        return "NotFound";
    case ValidationFailure::PERMISSION_DENIED:
        return "PermissionDenied";
    case ValidationFailure::EMPTY:
        return "Empty";
    case ValidationFailure::UNSUPPORTED:
        return "Unsupported";
    case ValidationFailure::CORRUPT:
        return "Corrupt";
    case ValidationFailure::INVALID_URI:
        return "InvalidUri";
    }
    return "NotFound";
}

std::string toIso8601(MediaTime time)
{
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
    Poco::Timestamp timestamp(static_cast<Poco::Timestamp::TimeVal>(micros));
    return Poco::DateTimeFormatter::format(timestamp, Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}

std::optional<MediaTime> parseIso8601(const std::string &value, bool end_of_day)
{
    std::string text = trim(value);
    bool date_only = text.size() == 10 && text[4] == '-' && text[7] == '-';
    if (date_only)
    {
        text += "T00:00:00Z";
    }

    Poco::DateTime parsed;
    int tzd = 0;
    if (!Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FRAC_FORMAT, text, parsed, tzd) &&
        !Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FORMAT, text, parsed, tzd))
    {
        return std::nullopt;
    }
    parsed.makeUTC(tzd);

    MediaTime time(std::chrono::duration_cast<MediaTime::duration>(
        std::chrono::microseconds(parsed.timestamp().epochMicroseconds())));
    if (date_only && end_of_day)
    {
        time += std::chrono::duration_cast<MediaTime::duration>(std::chrono::hours(24) - std::chrono::microseconds(1));
    }
    return time;
}

MediaQuery MediaQuery::fromJson(const nlohmann::json &json)
{
    if (!json.is_object())
    {
        throw std::invalid_argument("Media query must be a JSON object");
    }

    MediaQuery query;

    if (json.contains("terms") && !json["terms"].is_null())
    {
        if (!json["terms"].is_array())
        {
            throw std::invalid_argument("terms must be an array of strings");
        }
        for (const auto &term : json["terms"])
        {
            if (!term.is_string())
            {
                throw std::invalid_argument("terms must be an array of strings");
            }
            // An empty term would match every title
            if (!trim(term.get<std::string>()).empty())
            {
                query.terms.push_back(term.get<std::string>());
            }
        }
    }

    if (json.contains("original_query") && json["original_query"].is_string())
    {
        query.original_query = json["original_query"].get<std::string>();
    }

    if (json.contains("date_range") && !json["date_range"].is_null())
    {
        const auto &range = json["date_range"];
        if (!range.is_object())
        {
            throw std::invalid_argument("date_range must be an object with start and end");
        }
        DateRange date_range{requireTime(range, "start", false), requireTime(range, "end", true)};
        if (date_range.end < date_range.start)
        {
            throw std::invalid_argument("date_range.end is before date_range.start");
        }
        query.date_range = date_range;
    }

    if (json.contains("media_type") && !json["media_type"].is_null())
    {
        if (!json["media_type"].is_string())
        {
            throw std::invalid_argument("media_type must be a string");
        }
        std::string media_type = toLower(trim(json["media_type"].get<std::string>()));
        if (!media_type.empty() && media_type != "all")
        {
            query.media_kind = mediaKindFromString(media_type);
            if (!query.media_kind)
            {
                throw std::invalid_argument("Unknown media_type: " + media_type);
            }
        }
    }

    if (json.contains("directory") && json["directory"].is_string() &&
        !trim(json["directory"].get<std::string>()).empty())
    {
        query.directory = trim(json["directory"].get<std::string>());
    }

    return query;
}

MediaQuery MediaQuery::fromText(const std::string &text)
{
    MediaQuery query;
    query.original_query = trim(text);

    std::istringstream stream(query.original_query);
    std::string word;
    while (stream >> word)
    {
        query.terms.push_back(word);
    }
    return query;
}

nlohmann::json CandidateRecord::toJson() const
{
    nlohmann::json metadata;
    metadata["creation_time"] = toIso8601(device_metadata.creation_time);
    metadata["latitude"] = optionalToJson(device_metadata.latitude);
    metadata["longitude"] = optionalToJson(device_metadata.longitude);
    metadata["width"] = device_metadata.width;
    metadata["height"] = device_metadata.height;
    metadata["file_size_bytes"] = device_metadata.file_size_bytes;
    if (mime_type.rfind("video/", 0) == 0)
        metadata["duration"] = device_metadata.duration_seconds;
    else
        metadata["duration"] = nullptr;
    metadata["orientation"] = device_metadata.orientation;

    nlohmann::json json;
    json["id"] = id;
    json["file_uri"] = file_uri;
    json["mime_type"] = mime_type;
    json["device_metadata"] = metadata;
    if (is_placeholder)
    {
        json["is_placeholder"] = true;
    }
    return json;
}

ValidationResult ValidationResult::valid(const std::string &uri, bool recovered)
{
    ValidationResult result;
    result.is_valid = true;
    result.effective_uri = uri;
    result.recovered = recovered;
    return result;
}

ValidationResult ValidationResult::failure(const std::string &uri, ValidationFailure reason)
{
    ValidationResult result;
    result.is_valid = false;
    result.effective_uri = uri;
    result.failure_reason = reason;
    return result;
}

nlohmann::json ValidationResult::toJson() const
{
    nlohmann::json json;
    json["is_valid"] = is_valid;
    json["effective_uri"] = effective_uri;
    json["failure_reason"] = failure_reason ? nlohmann::json(validationFailureToString(*failure_reason))
                                            : nlohmann::json(nullptr);
    json["recovered"] = recovered;
    return json;
}

bool AssetFilter::matches(const RawAssetHandle &asset) const
{
    if (kind && asset.kind != *kind)
    {
        return false;
    }
    if (date_range && !date_range->contains(asset.creation_time))
    {
        return false;
    }
    if (asset.kind == MediaKind::VIDEO && max_video_duration_seconds > 0 &&
        asset.duration_seconds > max_video_duration_seconds)
    {
        return false;
    }
    return true;
}

AssetFilter AssetFilter::fromQuery(const MediaQuery &query, double max_video_duration_seconds)
{
    AssetFilter filter;
    filter.date_range = query.date_range;
    filter.kind = query.media_kind;
    filter.max_video_duration_seconds = max_video_duration_seconds;
    return filter;
}

nlohmann::json candidatesToJson(const std::vector<CandidateRecord> &records)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto &record : records)
    {
        array.push_back(record.toJson());
    }
    return array;
}
