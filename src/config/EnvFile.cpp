#include "EnvFile.hpp"
#include "SiteConfig.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <fstream>

namespace config
{

namespace
{

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string unquote(const std::string& value)
{
    if (value.size() >= 2)
    {
        const char q = value.front();
        if ((q == '"' || q == '\'') && value.back() == q)
            return value.substr(1, value.size() - 2);
    }
    // Unquoted values may carry a trailing comment.
    const auto hash = value.find(" #");
    return hash == std::string::npos ? value : trim(value.substr(0, hash));
}

} // namespace

bool loadDotEnv(const std::string& path, std::string* error)
{
    std::ifstream in(path);
    if (!in)
        return true;

    std::string line;
    int line_no = 0;
    int loaded = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#')
            continue;
        if (entry.rfind("export ", 0) == 0)
            entry = trim(entry.substr(7));

        const auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            PLOG_WARNING << path << ":" << line_no << ": ignoring malformed line";
            continue;
        }

        const std::string key = trim(entry.substr(0, eq));
        const std::string value = unquote(trim(entry.substr(eq + 1)));
        if (::setenv(key.c_str(), value.c_str(), 0) != 0)
        {
            if (error)
                *error = "failed to set environment variable " + key;
            return false;
        }
        ++loaded;
    }

    PLOG_DEBUG << "Loaded " << loaded << " entries from " << path;
    return true;
}

void applyEnvironmentOverrides(SiteConfig& config, const EnvLookup& lookup)
{
    if (!lookup)
        return;

    auto value = [&](const char* name) -> std::string
    {
        const char* v = lookup(name);
        return v ? std::string(v) : std::string();
    };

    if (auto key = value("OPENAI_API_KEY"); !key.empty())
        config.api_key = key;
    if (auto model = value("AI_TRANSLATE_MODEL"); !model.empty())
        config.model = model;
    if (auto dir = value("AI_TRANSLATE_CONTENT_DIR"); !dir.empty())
        config.content_dir = dir;
    if (auto update = value("AI_TRANSLATE_UPDATE_ALTERNATES"); update == "false")
        config.update_alternates = false;
}

} // namespace config
