#include "core/media_probe.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <exiv2/exiv2.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace
{
    std::optional<double> readGpsCoordinate(const Exiv2::ExifData &exif_data, const std::string &value_key,
                                            const std::string &ref_key)
    {
        auto value_it = exif_data.findKey(Exiv2::ExifKey(value_key));
        if (value_it == exif_data.end() || value_it->count() < 3)
        {
            return std::nullopt;
        }

        double coordinate = 0.0;
        double divisor = 1.0;
        for (size_t i = 0; i < 3; ++i)
        {
            Exiv2::Rational part = value_it->toRational(i);
            if (part.second == 0)
            {
                return std::nullopt;
            }
            coordinate += static_cast<double>(part.first) / part.second / divisor;
            divisor *= 60.0;
        }

        auto ref_it = exif_data.findKey(Exiv2::ExifKey(ref_key));
        if (ref_it != exif_data.end())
        {
            std::string ref = ref_it->toString();
            if (ref == "S" || ref == "W")
            {
                coordinate = -coordinate;
            }
        }
        return coordinate;
    }

    const char *dictValue(AVDictionary *dict, const char *key)
    {
        AVDictionaryEntry *entry = av_dict_get(dict, key, nullptr, 0);
        return entry ? entry->value : nullptr;
    }
}

ProbedMetadata MediaProbe::probe(const std::string &file_path, MediaKind kind)
{
    return kind == MediaKind::VIDEO ? probeVideo(file_path) : probeImage(file_path);
}

ProbedMetadata MediaProbe::probeImage(const std::string &file_path)
{
    ProbedMetadata metadata;
    try
    {
        Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(file_path);
        image->readMetadata();

        metadata.width = static_cast<int>(image->pixelWidth());
        metadata.height = static_cast<int>(image->pixelHeight());

        const Exiv2::ExifData &exif_data = image->exifData();
        if (exif_data.empty())
        {
            return metadata;
        }

        auto orientation_it = exif_data.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
        if (orientation_it != exif_data.end())
        {
            metadata.orientation = exifOrientationToDegrees(static_cast<int>(orientation_it->toInt64()));
        }

        auto latitude = readGpsCoordinate(exif_data, "Exif.GPSInfo.GPSLatitude", "Exif.GPSInfo.GPSLatitudeRef");
        auto longitude = readGpsCoordinate(exif_data, "Exif.GPSInfo.GPSLongitude", "Exif.GPSInfo.GPSLongitudeRef");
        if (latitude && longitude)
        {
            metadata.latitude = latitude;
            metadata.longitude = longitude;
        }
    }
    catch (const Exiv2::Error &e)
    {
        Logger::debug("Exiv2 could not read " + file_path + ": " + e.what());
        return ProbedMetadata{};
    }
    catch (const std::exception &e)
    {
        Logger::debug("Image probe failed for " + file_path + ": " + e.what());
        return ProbedMetadata{};
    }
    return metadata;
}

ProbedMetadata MediaProbe::probeVideo(const std::string &file_path)
{
    ProbedMetadata metadata;
    AVFormatContextRAII format_ctx;

    int result = avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr);
    if (result < 0)
    {
        Logger::debug("FFmpeg could not open " + file_path + ": " + ffmpegErrorString(result));
        return metadata;
    }

    result = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (result < 0)
    {
        Logger::debug("FFmpeg could not read stream info of " + file_path + ": " + ffmpegErrorString(result));
        return metadata;
    }

    if (format_ctx.get()->duration > 0)
    {
        metadata.duration_seconds = static_cast<double>(format_ctx.get()->duration) / AV_TIME_BASE;
    }

    int stream_index = av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream_index >= 0)
    {
        AVStream *stream = format_ctx.get()->streams[stream_index];
        metadata.width = stream->codecpar->width;
        metadata.height = stream->codecpar->height;

        if (const char *rotate = dictValue(stream->metadata, "rotate"))
        {
            metadata.orientation = normalizeRotation(std::atoi(rotate));
        }
    }

    const char *location = dictValue(format_ctx.get()->metadata, "location");
    if (!location)
    {
        location = dictValue(format_ctx.get()->metadata, "com.apple.quicktime.location.ISO6709");
    }
    double latitude = 0.0;
    double longitude = 0.0;
    if (location && parseIso6709(location, latitude, longitude))
    {
        metadata.latitude = latitude;
        metadata.longitude = longitude;
    }

    return metadata;
}

int MediaProbe::exifOrientationToDegrees(int exif_orientation)
{
    switch (exif_orientation)
    {
    case 3:
    case 4:
        return 180;
    case 5:
    case 6:
        return 90;
    case 7:
    case 8:
        return 270;
    default:
        return 0;
    }
}

bool MediaProbe::parseIso6709(const std::string &location, double &latitude, double &longitude)
{
    double lat = 0.0;
    double lon = 0.0;
    if (std::sscanf(location.c_str(), "%lf%lf", &lat, &lon) != 2)
    {
        return false;
    }
    if (std::fabs(lat) > 90.0 || std::fabs(lon) > 180.0)
    {
        return false;
    }
    latitude = lat;
    longitude = lon;
    return true;
}

int MediaProbe::normalizeRotation(int degrees)
{
    int normalized = ((degrees % 360) + 360) % 360;
    // Snap to the nearest quarter turn
    return ((normalized + 45) / 90 % 4) * 90;
}
