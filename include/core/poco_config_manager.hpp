#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/engine_options.hpp"
#include "core/media_types.hpp"

/**
 * @brief JSON configuration with built-in defaults and typed option getters
 *
 * Keys are addressed with dots ("resolver.batch_size"). A loaded file is merged over the
 * defaults, so it only needs the keys it changes.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    bool getBool(const std::string &key, bool def = false) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    std::string getLogLevel() const;

    // Engine option sections
    ScanOptions getScanOptions() const;
    ResolverOptions getResolverOptions() const;
    ValidatorOptions getValidatorOptions() const;
    EngineOptions getEngineOptions() const;

    // Media directories
    DirectoryConfig getDirectoryConfig() const;
    std::vector<std::string> getDefaultAlbumRoots() const;

    // Configuration validation
    bool validateConfig() const;

    // Utility methods
    static nlohmann::json defaultConfig();

private:
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void initializeDefaultConfig();
    void replaceConfig(const nlohmann::json &config);
    nlohmann::json snapshot() const;
    nlohmann::json getNestedConfig(const std::string &prefix) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
