#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/evp.h>
#include <Poco/URI.h>
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory() && !entry.is_symlink())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // The root must be readable; deeper failures only cost that subtree
            if (current_path == fs::path(dir_path))
            {
                throw;
            }
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::string FileUtils::computeStringHash(const std::string &value)
{
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;
    if (EVP_Digest(value.data(), value.size(), hash, &hash_length, EVP_sha256(), nullptr) != 1)
        return "";
    std::stringstream ss;
    for (unsigned int i = 0; i < hash_length; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::string FileStatus::toString() const
{
    static const char *names[] = {"OK", "NOT_FOUND", "PERMISSION_DENIED", "NOT_REGULAR", "IO_ERROR"};
    std::stringstream ss;
    ss << "FileStatus{"
       << "state=" << names[static_cast<int>(state)] << ", "
       << "size=" << size;
    if (!error_message.empty())
        ss << ", error='" << error_message << "'";
    ss << "}";
    return ss.str();
}

FileStatus FileUtils::getFileStatus(const std::string &file_path)
{
    FileStatus status;
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0)
    {
        int err = errno;
        status.error_message = std::strerror(err);
        if (err == ENOENT || err == ENOTDIR)
            status.state = FileStatus::State::NOT_FOUND;
        else if (err == EACCES || err == EPERM)
            status.state = FileStatus::State::PERMISSION_DENIED;
        else
            status.state = FileStatus::State::IO_ERROR;
        return status;
    }

    if (!S_ISREG(st.st_mode))
    {
        status.state = FileStatus::State::NOT_REGULAR;
        return status;
    }

    if (access(file_path.c_str(), R_OK) != 0)
    {
        int err = errno;
        status.error_message = std::strerror(err);
        status.state = (err == EACCES || err == EPERM) ? FileStatus::State::PERMISSION_DENIED
                                                       : FileStatus::State::IO_ERROR;
        return status;
    }

    status.state = FileStatus::State::OK;
    status.size = static_cast<uint64_t>(st.st_size);
    status.modification_time = fromEpochSeconds(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    return status;
}

std::vector<uint8_t> FileUtils::readFileHeader(const std::string &file_path, size_t max_bytes)
{
    std::vector<uint8_t> header;
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return header;
    header.resize(max_bytes);
    file.read(reinterpret_cast<char *>(header.data()), static_cast<std::streamsize>(max_bytes));
    header.resize(static_cast<size_t>(file.gcount()));
    return header;
}

std::string FileUtils::toFileUri(const std::string &path)
{
    if (path.empty() || path[0] != '/')
    {
        // Relative paths cannot be expressed as a hierarchical file URI
        return "file://" + path;
    }
    Poco::URI uri;
    uri.setScheme("file");
    uri.setPath(path);
    return uri.toString();
}

std::optional<std::string> FileUtils::fromFileUri(const std::string &uri)
{
    if (uri.empty())
        return std::nullopt;
    if (uri[0] == '/')
        return uri;

    try
    {
        Poco::URI parsed(uri);
        if (parsed.getScheme() != "file" || parsed.getPath().empty())
        {
            return std::nullopt;
        }
        if (!parsed.getHost().empty() && parsed.getHost() != "localhost")
        {
            // file://DCIM/x.jpg style locations name no local file
            return std::nullopt;
        }
        return parsed.getPath();
    }
    catch (const Poco::Exception &e)
    {
        Logger::debug("Cannot parse URI '" + uri + "': " + e.displayText());
        return std::nullopt;
    }
}

std::string FileUtils::expandUserPath(const std::string &path)
{
    if (path.empty() || path[0] != '~')
        return path;
    const char *home = std::getenv("HOME");
    if (!home)
        return path;
    return std::string(home) + path.substr(1);
}

std::string FileUtils::canonicalPath(const std::string &path)
{
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
    if (ec)
    {
        return fs::path(path).lexically_normal().string();
    }
    return canonical.string();
}

MediaTime FileUtils::fromEpochSeconds(int64_t seconds, int64_t nanoseconds)
{
    auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanoseconds);
    return MediaTime(std::chrono::duration_cast<MediaTime::duration>(since_epoch));
}
