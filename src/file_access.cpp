#include "core/file_access.hpp"

FileStatus LocalFileAccess::stat(const std::string &path) const
{
    return FileUtils::getFileStatus(path);
}

std::vector<uint8_t> LocalFileAccess::readHeader(const std::string &path, size_t max_bytes) const
{
    return FileUtils::readFileHeader(path, max_bytes);
}
