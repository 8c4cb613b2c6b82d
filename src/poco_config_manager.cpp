#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

nlohmann::json PocoConfigManager::defaultConfig()
{
    return {
        {"log_level", "INFO"},
        {"scan",
         {{"page_size", 100},
          {"max_video_duration_seconds", 900},
          {"max_scan_threads", 4},
          {"default_albums", {"~/Pictures", "~/Videos", "~/DCIM/Camera", "~/Downloads"}}}},
        {"resolver",
         {{"batch_size", 5},
          {"item_timeout_ms", 3000},
          {"allow_placeholder_uris", true},
          {"validate_results", true}}},
        {"validation",
         {{"check_image_headers", true},
          {"recovery_page_size", 500},
          {"recovery_timeout_ms", 5000},
          {"creation_time_tolerance_ms", 1000}}},
        {"directories",
         {{"enabled", false},
          {"paths", nlohmann::json::array()}}}};
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    replaceConfig(defaultConfig());
}

void PocoConfigManager::replaceConfig(const nlohmann::json &config)
{
    std::istringstream in(config.dump());
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    tmp->load(in);
    cfg_ = tmp;
}

nlohmann::json PocoConfigManager::snapshot() const
{
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;

    try
    {
        nlohmann::json file_config = nlohmann::json::parse(in);
        if (!file_config.is_object())
        {
            Logger::error("Config file " + path + " must contain a JSON object");
            return false;
        }
        nlohmann::json merged = defaultConfig();
        merged.merge_patch(file_config);
        replaceConfig(merged);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to parse config file " + path + ": " + e.what());
        return false;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to load config file " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot();
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Arrays are replaced as a whole, null removes a key
    nlohmann::json merged = snapshot();
    merged.merge_patch(patch);
    replaceConfig(merged);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

std::vector<std::string> PocoConfigManager::getStringList(const std::string &key) const
{
    std::vector<std::string> values;
    auto keys = split(key, '.');
    if (keys.empty())
        return values;

    std::string leaf = keys.back();
    keys.pop_back();
    std::string parent;
    for (const auto &part : keys)
        parent += parent.empty() ? part : "." + part;

    nlohmann::json section = parent.empty() ? getAll() : getNestedConfig(parent);
    if (!section.contains(leaf) || !section[leaf].is_array())
        return values;

    for (const auto &item : section[leaf])
    {
        if (item.is_string() && !item.get<std::string>().empty())
            values.push_back(item.get<std::string>());
    }
    return values;
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

ScanOptions PocoConfigManager::getScanOptions() const
{
    ScanOptions options;
    options.page_size = static_cast<size_t>(getInt("scan.page_size", 100));
    options.max_video_duration_seconds = getDouble("scan.max_video_duration_seconds", 900.0);
    options.max_scan_threads = getInt("scan.max_scan_threads", 4);
    return options;
}

ResolverOptions PocoConfigManager::getResolverOptions() const
{
    ResolverOptions options;
    options.batch_size = static_cast<size_t>(getInt("resolver.batch_size", 5));
    options.item_timeout_ms = getInt("resolver.item_timeout_ms", 3000);
    options.allow_placeholder_uris = getBool("resolver.allow_placeholder_uris", true);
    options.validate_results = getBool("resolver.validate_results", true);
    return options;
}

ValidatorOptions PocoConfigManager::getValidatorOptions() const
{
    ValidatorOptions options;
    options.check_image_headers = getBool("validation.check_image_headers", true);
    options.recovery_page_size = static_cast<size_t>(getInt("validation.recovery_page_size", 500));
    options.recovery_timeout_ms = getInt("validation.recovery_timeout_ms", 5000);
    options.creation_time_tolerance_ms = getInt("validation.creation_time_tolerance_ms", 1000);
    return options;
}

EngineOptions PocoConfigManager::getEngineOptions() const
{
    EngineOptions options;
    options.scan = getScanOptions();
    options.resolver = getResolverOptions();
    options.validation = getValidatorOptions();
    return options;
}

DirectoryConfig PocoConfigManager::getDirectoryConfig() const
{
    DirectoryConfig config;
    config.enabled = getBool("directories.enabled", false);
    for (const auto &path : getStringList("directories.paths"))
    {
        config.paths.insert(path);
    }
    return config;
}

std::vector<std::string> PocoConfigManager::getDefaultAlbumRoots() const
{
    return getStringList("scan.default_albums");
}

// Configuration validation
bool PocoConfigManager::validateConfig() const
{
    try
    {
        std::string log_level = getLogLevel();
        if (!Logger::isValidLevel(log_level))
        {
            Logger::error("Invalid log level: " + log_level);
            return false;
        }

        int page_size = getInt("scan.page_size", 100);
        if (page_size <= 0 || page_size > 10000)
        {
            Logger::error("Invalid scan page size: " + std::to_string(page_size));
            return false;
        }

        double max_duration = getDouble("scan.max_video_duration_seconds", 900.0);
        if (max_duration <= 0)
        {
            Logger::error("Invalid max video duration: " + std::to_string(max_duration));
            return false;
        }

        int scan_threads = getInt("scan.max_scan_threads", 4);
        if (scan_threads < 1 || scan_threads > 64)
        {
            Logger::error("Invalid max scan threads: " + std::to_string(scan_threads) + " (must be 1-64)");
            return false;
        }

        int batch_size = getInt("resolver.batch_size", 5);
        if (batch_size < 1 || batch_size > 64)
        {
            Logger::error("Invalid resolver batch size: " + std::to_string(batch_size) + " (must be 1-64)");
            return false;
        }

        const std::vector<std::string> timeout_keys = {"resolver.item_timeout_ms", "validation.recovery_timeout_ms"};
        for (const auto &key : timeout_keys)
        {
            int timeout = getInt(key, 0);
            if (timeout <= 0)
            {
                Logger::error("Invalid timeout " + key + ": " + std::to_string(timeout));
                return false;
            }
        }

        int recovery_page_size = getInt("validation.recovery_page_size", 500);
        if (recovery_page_size <= 0 || recovery_page_size > 10000)
        {
            Logger::error("Invalid recovery page size: " + std::to_string(recovery_page_size));
            return false;
        }

        if (getInt("validation.creation_time_tolerance_ms", 1000) < 0)
        {
            Logger::error("Invalid creation time tolerance");
            return false;
        }

        const std::vector<std::string> flag_keys = {"resolver.allow_placeholder_uris", "resolver.validate_results",
                                                    "validation.check_image_headers", "directories.enabled"};
        for (const auto &key : flag_keys)
        {
            try
            {
                getBool(key, false);
            }
            catch (const Poco::Exception &e)
            {
                Logger::error("Invalid boolean " + key + ": " + e.displayText());
                return false;
            }
        }

        return true;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid configuration value: " + e.displayText());
        return false;
    }
}

// Helper methods for nested configuration
nlohmann::json PocoConfigManager::getNestedConfig(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    try
    {
        // Get the full config and extract the nested section
        auto current = snapshot();
        for (const auto &key : split(prefix, '.'))
        {
            if (current.contains(key) && current[key].is_object())
            {
                current = current[key];
            }
            else
            {
                return nlohmann::json::object();
            }
        }
        return current;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Failed to read config section " + prefix + ": " + e.what());
        return nlohmann::json::object();
    }
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
