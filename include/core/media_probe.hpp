#pragma once

#include <optional>
#include <string>
#include "core/media_types.hpp"

/**
 * @brief Dimensions, duration, orientation and location read from a media file
 */
struct ProbedMetadata
{
    int width = 0;
    int height = 0;
    double duration_seconds = 0.0;
    int orientation = 0;
    std::optional<double> latitude;
    std::optional<double> longitude;
};

/**
 * @brief Reads container and EXIF metadata from local media files
 *
 * Images are read with Exiv2, videos with FFmpeg. Probing never throws: an unreadable
 * file yields zeroed metadata and a debug log line.
 */
class MediaProbe
{
public:
    static ProbedMetadata probe(const std::string &file_path, MediaKind kind);

    static ProbedMetadata probeImage(const std::string &file_path);

    static ProbedMetadata probeVideo(const std::string &file_path);

    /**
     * @brief Map an EXIF orientation tag (1..8) to clockwise degrees
     */
    static int exifOrientationToDegrees(int exif_orientation);

    /**
     * @brief Parse an ISO 6709 location string such as "+37.7749-122.4194/"
     * @return true and the coordinates when at least latitude and longitude are present
     */
    static bool parseIso6709(const std::string &location, double &latitude, double &longitude);

    /**
     * @brief Normalize a rotation in degrees to one of 0, 90, 180, 270
     */
    static int normalizeRotation(int degrees);
};
