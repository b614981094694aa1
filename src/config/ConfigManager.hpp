#pragma once

#include "EnvFile.hpp"
#include "SiteConfig.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Reads pagelingo.toml into a SiteConfig. Each section is owned by one
// registered handler; missing sections are handed an empty table so the
// defaults stay in place.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "pagelingo.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Parses the file (absent file = all defaults), applies the
    // environment, then validates.
    bool load();
    bool loadFromString(std::string_view text, const std::string& source_name = "<string>");

    const SiteConfig& site() const { return site_; }
    SiteConfig& site() { return site_; }
    const toml::table& root() const;
    const std::string& path() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

    void setEnvLookup(config::EnvLookup lookup) { env_lookup_ = std::move(lookup); }

private:
    void registerSiteTables();
    bool dispatch();
    bool validate();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
    SiteConfig site_;
    bool default_locale_explicit_ = false;
    config::EnvLookup env_lookup_;
};
