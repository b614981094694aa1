#include "LocaleResolver.hpp"

#include "../config/SiteConfig.hpp"

namespace content
{

std::string localeOf(const std::string& relative_path, const SiteConfig& config)
{
    const auto slash = relative_path.find('/');
    if (slash == std::string::npos)
        return config.default_locale;

    const std::string first = relative_path.substr(0, slash);
    if (config.hasLocale(first) && !config.isDefaultLocale(first))
        return first;
    return config.default_locale;
}

std::string basePath(const std::string& relative_path, const std::string& locale, const SiteConfig& config)
{
    if (config.isDefaultLocale(locale))
        return relative_path;

    const std::string prefix = locale + "/";
    if (relative_path.compare(0, prefix.size(), prefix) == 0)
        return relative_path.substr(prefix.size());
    return relative_path;
}

std::string targetPath(const std::string& base_path, const std::string& target_locale, const SiteConfig& config)
{
    if (config.isDefaultLocale(target_locale))
        return base_path;
    return target_locale + "/" + base_path;
}

std::string fileStem(const std::string& path)
{
    std::string name = path;
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos)
        name = name.substr(slash + 1);

    auto ends_with = [](const std::string& value, const std::string& suffix)
    {
        return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (ends_with(name, ".mdx"))
        name.resize(name.size() - 4);
    else if (ends_with(name, ".md"))
        name.resize(name.size() - 3);
    return name;
}

} // namespace content
