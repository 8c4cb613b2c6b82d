#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <optional>
#include <cstdint>
#include "core/media_types.hpp"

namespace fs = std::filesystem;

/**
 * @brief Result of probing a path without reading its content
 */
struct FileStatus
{
    enum class State
    {
        OK,
        NOT_FOUND,
        PERMISSION_DENIED,
        NOT_REGULAR,
        IO_ERROR
    };

    State state = State::NOT_FOUND;
    uint64_t size = 0;
    MediaTime modification_time{};
    std::string error_message;

    bool ok() const { return state == State::OK; }

    // Convert to string for logging/debugging
    std::string toString() const;
};

/**
 * @brief File utilities for efficient file operations
 */
class FileUtils
{
public:
    /**
     * @brief Stat a path and check that it is a readable regular file
     * @param file_path Path to the file
     * @return FileStatus with size and modification time when state is OK
     */
    static FileStatus getFileStatus(const std::string &file_path);

    /**
     * @brief Read up to max_bytes from the start of a file
     * @return The bytes read; empty if the file cannot be opened
     */
    static std::vector<uint8_t> readFileHeader(const std::string &file_path, size_t max_bytes);

    /**
     * Scans a directory recursively and calls the provided function for each file.
     * Failures below the root are logged and skipped; a failure to open the root throws.
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * Computes SHA256 hash of a string
     * @param value Input bytes
     * @return SHA256 hash as hexadecimal string, empty on failure
     */
    static std::string computeStringHash(const std::string &value);

    /**
     * @brief Build a file:// URI for a path; absolute paths get an empty authority
     */
    static std::string toFileUri(const std::string &path);

    /**
     * @brief Extract the local path from a file:// URI or an absolute path
     * @return Decoded path, or std::nullopt for other schemes, remote hosts and empty paths
     */
    static std::optional<std::string> fromFileUri(const std::string &uri);

    /**
     * @brief Expand a leading "~" to $HOME
     */
    static std::string expandUserPath(const std::string &path);

    /**
     * @brief Canonical form of a path, falling back to the lexically normal form
     */
    static std::string canonicalPath(const std::string &path);

    static MediaTime fromEpochSeconds(int64_t seconds, int64_t nanoseconds = 0);
};
