#include "ContentScanner.hpp"

#include "LocaleResolver.hpp"
#include "../config/SiteConfig.hpp"

#include <plog/Log.h>

namespace content
{

ContentScanner::ContentScanner(const SiteConfig& config, const IDocumentStore& store)
    : config_(config)
    , store_(store)
{
}

std::vector<Document> ContentScanner::scan() const
{
    std::vector<Document> documents;
    for (const auto& path : store_.list())
    {
        auto raw = store_.read(path);
        if (!raw)
            continue;
        documents.push_back(loadDocument(path, *raw, config_));
    }
    PLOG_INFO << "Scanned " << documents.size() << " document(s)";
    return documents;
}

SiblingSet ContentScanner::collectSiblings(const std::string& base_path) const
{
    SiblingSet set;
    set.base_path = base_path;
    for (const auto& locale : config_.locales)
    {
        const std::string path = targetPath(base_path, locale, config_);
        if (!store_.exists(path))
            continue;
        auto text = store_.read(path);
        if (!text)
            continue;
        set.members.push_back(SiblingDocument{ locale, path, std::move(*text) });
    }
    return set;
}

bool ContentScanner::inLocaleDirectory(const std::string& path, const std::string& locale) const
{
    return localeOf(path, config_) == locale;
}

std::optional<std::string> ContentScanner::findByPermalink(const std::string& locale,
                                                           const std::string& permalink) const
{
    if (permalink.empty())
        return std::nullopt;

    for (const auto& path : store_.list())
    {
        if (!inLocaleDirectory(path, locale))
            continue;

        if (fileStem(path) == permalink)
            return path;

        auto raw = store_.read(path);
        if (!raw)
            continue;
        auto fm = FrontMatter::split(*raw);
        if (!fm)
            continue;
        if (HeaderView::load(fm->header).permalink() == permalink)
            return path;
    }
    return std::nullopt;
}

} // namespace content
