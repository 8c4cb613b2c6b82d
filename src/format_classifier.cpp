#include "core/format_classifier.hpp"
#include <algorithm>
#include <cctype>

const std::string FormatClassifier::UNKNOWN_MIME_TYPE = "application/octet-stream";

const std::unordered_map<std::string, std::string> FormatClassifier::image_mime_types_ = {
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"bmp", "image/bmp"},
    {"webp", "image/webp"},
    {"heic", "image/heic"},
    {"heif", "image/heif"},
    {"tiff", "image/tiff"},
    {"tif", "image/tiff"}};

const std::unordered_map<std::string, std::string> FormatClassifier::video_mime_types_ = {
    {"mp4", "video/mp4"},
    {"mov", "video/quicktime"},
    {"avi", "video/x-msvideo"},
    {"mkv", "video/x-matroska"},
    {"webm", "video/webm"},
    {"m4v", "video/x-m4v"},
    {"3gp", "video/3gpp"},
    {"flv", "video/x-flv"},
    {"wmv", "video/x-ms-wmv"},
    {"mpg", "video/mpeg"},
    {"mpeg", "video/mpeg"}};

FormatClassification FormatClassifier::classify(const std::string &path)
{
    std::string ext = getFileExtension(path);

    auto image_it = image_mime_types_.find(ext);
    if (image_it != image_mime_types_.end())
    {
        return {image_it->second, true};
    }

    auto video_it = video_mime_types_.find(ext);
    if (video_it != video_mime_types_.end())
    {
        return {video_it->second, true};
    }

    return {UNKNOWN_MIME_TYPE, false};
}

bool FormatClassifier::isSupportedFile(const std::string &path)
{
    return classify(path).supported;
}

bool FormatClassifier::isSupportedMimeType(const std::string &mime_type)
{
    auto has_value = [&mime_type](const std::unordered_map<std::string, std::string> &table)
    {
        return std::any_of(table.begin(), table.end(), [&mime_type](const auto &entry)
                           { return entry.second == mime_type; });
    };
    return has_value(image_mime_types_) || has_value(video_mime_types_);
}

std::optional<MediaKind> FormatClassifier::kindOf(const std::string &mime_type)
{
    if (mime_type.rfind("image/", 0) == 0)
        return MediaKind::PHOTO;
    if (mime_type.rfind("video/", 0) == 0)
        return MediaKind::VIDEO;
    return std::nullopt;
}

std::string FormatClassifier::getFileExtension(const std::string &path)
{
    // Only the last path segment can carry the extension
    size_t slash_pos = path.find_last_of("/\\");
    size_t dot_pos = path.find_last_of('.');
    if (dot_pos == std::string::npos || (slash_pos != std::string::npos && dot_pos < slash_pos))
    {
        return "";
    }

    std::string extension = path.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    return extension;
}

bool FormatClassifier::hasValidImageHeader(const std::vector<uint8_t> &bytes, const std::string &mime_type)
{
    if (bytes.empty())
    {
        return false;
    }

    const auto &b = bytes;
    if (mime_type == "image/jpeg")
    {
        return b.size() >= 8 && b[0] == 0xFF && b[1] == 0xD8 && b[2] == 0xFF;
    }
    if (mime_type == "image/png")
    {
        return b.size() >= 8 && b[0] == 0x89 && b[1] == 0x50 && b[2] == 0x4E && b[3] == 0x47 &&
               b[4] == 0x0D && b[5] == 0x0A && b[6] == 0x1A && b[7] == 0x0A;
    }
    if (mime_type == "image/gif")
    {
        // GIF87a or GIF89a
        return b.size() >= 8 && b[0] == 0x47 && b[1] == 0x49 && b[2] == 0x46 && b[3] == 0x38 &&
               (b[4] == 0x37 || b[4] == 0x39) && b[5] == 0x61;
    }
    if (mime_type == "image/bmp")
    {
        return b.size() >= 8 && b[0] == 0x42 && b[1] == 0x4D;
    }
    if (mime_type == "image/webp")
    {
        return b.size() >= 12 && b[0] == 0x52 && b[1] == 0x49 && b[2] == 0x46 && b[3] == 0x46 &&
               b[8] == 0x57 && b[9] == 0x45 && b[10] == 0x42 && b[11] == 0x50;
    }
    if (mime_type == "image/tiff")
    {
        return b.size() >= 8 &&
               ((b[0] == 0x49 && b[1] == 0x49 && b[2] == 0x2A && b[3] == 0x00) ||
                (b[0] == 0x4D && b[1] == 0x4D && b[2] == 0x00 && b[3] == 0x2A));
    }

    // HEIC/HEIF would need a container parser
    return true;
}
