#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Resolved run configuration. Built once by ConfigManager and passed by
// reference into every operation that needs it.
struct SiteConfig
{
    std::string root = ".";
    std::string content_dir = "src/content/pages";
    std::vector<std::string> locales;
    std::string default_locale = "en";

    std::string backend = "openai";
    std::string base_url = "https://api.openai.com";
    std::string model = "gpt-4.1";
    std::string api_key;
    std::string prompt;
    std::size_t max_concurrent_requests = 2;
    int max_retries = 2;
    double request_interval_seconds = 0.0;

    bool update_alternates = true;

    int log_level = 4;
    std::string log_file = "logs/pagelingo.log";
    bool log_append = true;
    bool log_console = true;

    bool isDefaultLocale(const std::string& locale) const { return locale == default_locale; }

    bool hasLocale(const std::string& locale) const
    {
        for (const auto& l : locales)
        {
            if (l == locale)
                return true;
        }
        return false;
    }
};
