#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , env_lookup_([](const char* name) { return static_cast<const char*>(std::getenv(name)); })
{
    registerSiteTables();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

void ConfigManager::registerSiteTables()
{
    registerTable("site",
                  { [this](const toml::table& t)
                    {
                        site_.root = t["root"].value_or(site_.root);
                        site_.content_dir = t["content_dir"].value_or(site_.content_dir);
                        if (const auto* arr = t["locales"].as_array())
                        {
                            for (const auto& node : *arr)
                            {
                                if (auto locale = node.value<std::string>(); locale && !locale->empty())
                                {
                                    if (!site_.hasLocale(*locale))
                                        site_.locales.push_back(*locale);
                                }
                                else
                                {
                                    PLOG_WARNING << "[site].locales: ignoring non-string entry";
                                }
                            }
                        }
                        if (auto def = t["default_locale"].value<std::string>())
                        {
                            site_.default_locale = *def;
                            default_locale_explicit_ = true;
                        }
                    } },
                  { "root", "content_dir", "locales", "default_locale" });

    registerTable("translator",
                  { [this](const toml::table& t)
                    {
                        site_.backend = t["backend"].value_or(site_.backend);
                        site_.base_url = t["base_url"].value_or(site_.base_url);
                        site_.model = t["model"].value_or(site_.model);
                        site_.api_key = t["api_key"].value_or(site_.api_key);
                        site_.prompt = t["prompt"].value_or(site_.prompt);
                        if (auto n = t["max_concurrent_requests"].value<std::int64_t>())
                            site_.max_concurrent_requests = static_cast<std::size_t>(std::max<std::int64_t>(1, *n));
                        if (auto n = t["max_retries"].value<std::int64_t>())
                            site_.max_retries = static_cast<int>(std::max<std::int64_t>(0, *n));
                        if (auto s = t["request_interval_seconds"].value<double>())
                            site_.request_interval_seconds = std::max(0.0, *s);
                    } },
                  { "backend", "base_url", "model", "api_key", "prompt", "max_concurrent_requests", "max_retries",
                    "request_interval_seconds" });

    registerTable("alternates",
                  { [this](const toml::table& t) { site_.update_alternates = t["update"].value_or(site_.update_alternates); } },
                  { "update" });

    registerTable("logging",
                  { [this](const toml::table& t)
                    {
                        if (auto level = t["level"].value<std::int64_t>())
                            site_.log_level = static_cast<int>(std::clamp<std::int64_t>(*level, 0, 6));
                        site_.log_file = t["file"].value_or(site_.log_file);
                        site_.log_append = t["append"].value_or(site_.log_append);
                        site_.log_console = t["console"].value_or(site_.log_console);
                    } },
                  { "level", "file", "append", "console" });
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::string env_error;
    if (!config::loadDotEnv(".env", &env_error))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Could not apply .env file",
                                            env_error);
    }

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No " << config_path_ << " found, using defaults";
        return loadFromString("", config_path_);
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), config_path_);
}

bool ConfigManager::loadFromString(std::string_view text, const std::string& source_name)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(text, source_name));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                          error_details + "\nFile: " + source_name);
        return false;
    }

    if (!dispatch())
        return false;

    config::applyEnvironmentOverrides(site_, env_lookup_);
    return validate();
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

bool ConfigManager::dispatch()
{
    site_ = SiteConfig{};
    default_locale_explicit_ = false;

    for (const auto& handler : handlers_)
    {
        if (const auto* node = root_->get(handler.path); node && !node->is_table())
        {
            last_error_ = "[" + handler.path + "] must be a table";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid configuration",
                                              last_error_);
            return false;
        }

        if (const toml::table* section = resolveTablePath(*root_, handler.path))
        {
            for (const auto& [key, value] : *section)
            {
                const std::string name(key.str());
                if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), name) == handler.ownedKeys.end())
                {
                    PLOG_WARNING << "Unknown key '" << name << "' in [" << handler.path << "]";
                }
            }
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }
    return true;
}

bool ConfigManager::validate()
{
    if (site_.locales.empty())
    {
        last_error_ = "no locales configured; set [site].locales";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "No locales configured",
                                          "Add a locales list to the [site] section of " + config_path_);
        return false;
    }

    if (!default_locale_explicit_ && !site_.hasLocale(site_.default_locale))
    {
        site_.default_locale = site_.locales.front();
    }
    else if (!site_.hasLocale(site_.default_locale))
    {
        PLOG_WARNING << "Default locale '" << site_.default_locale << "' not in locale list, adding it";
        site_.locales.insert(site_.locales.begin(), site_.default_locale);
    }

    if (site_.backend != "openai")
    {
        last_error_ = "unsupported translator backend: " + site_.backend;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Unsupported translator backend",
                                          site_.backend);
        return false;
    }

    PLOG_DEBUG << "Configuration: " << site_.locales.size() << " locales, default '" << site_.default_locale
               << "', content " << site_.content_dir << ", model " << site_.model;
    return true;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        auto* tbl = it->second.as_table();
        if (!tbl)
            return nullptr;

        current = tbl;
    }

    return current;
}
