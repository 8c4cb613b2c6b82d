#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/file_utils.hpp"

/**
 * @brief File system capability used by the resolver and the validator
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class FileAccess
{
public:
    virtual ~FileAccess() = default;

    /**
     * @brief Existence, readability and length of a path
     */
    virtual FileStatus stat(const std::string &path) const = 0;

    /**
     * @brief First max_bytes bytes of a file, or fewer if the file is shorter
     */
    virtual std::vector<uint8_t> readHeader(const std::string &path, size_t max_bytes) const = 0;
};

/**
 * @brief FileAccess over the local file system
 */
class LocalFileAccess : public FileAccess
{
public:
    FileStatus stat(const std::string &path) const override;
    std::vector<uint8_t> readHeader(const std::string &path, size_t max_bytes) const override;
};
