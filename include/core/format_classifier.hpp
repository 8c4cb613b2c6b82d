#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/media_types.hpp"

/**
 * @brief Outcome of classifying a path by its extension
 */
struct FormatClassification
{
    std::string mime_type;
    bool supported = false;
};

/**
 * @brief Extension-based MIME classification against fixed image and video allow-lists
 *
 * All methods are pure; unknown extensions classify as application/octet-stream.
 */
class FormatClassifier
{
public:
    static const std::string UNKNOWN_MIME_TYPE;

    /**
     * @brief Classify a file path or URI by extension
     * @param path File path, URI or bare file name
     * @return MIME type and whether it is in the supported allow-list
     */
    static FormatClassification classify(const std::string &path);

    /**
     * @brief Check if a file is supported for display
     * @param path Path to the file to check
     * @return true if the extension maps to a supported image or video type
     */
    static bool isSupportedFile(const std::string &path);

    static bool isSupportedMimeType(const std::string &mime_type);

    /**
     * @brief Media kind implied by a MIME type
     * @return PHOTO for image/*, VIDEO for video/*, std::nullopt otherwise
     */
    static std::optional<MediaKind> kindOf(const std::string &mime_type);

    /**
     * @brief Lower-cased extension without the dot, or "" when there is none
     */
    static std::string getFileExtension(const std::string &path);

    /**
     * @brief Check the leading bytes of an image against the signature of its MIME type
     *
     * JPEG, PNG, GIF, BMP, WebP and TIFF are checked; HEIC/HEIF and non-image types only
     * require a non-empty header.
     */
    static bool hasValidImageHeader(const std::vector<uint8_t> &bytes, const std::string &mime_type);

    // Number of leading bytes hasValidImageHeader inspects
    static constexpr size_t HEADER_PROBE_BYTES = 12;

private:
    static const std::unordered_map<std::string, std::string> image_mime_types_;
    static const std::unordered_map<std::string, std::string> video_mime_types_;
};
