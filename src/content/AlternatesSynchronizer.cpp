#include "AlternatesSynchronizer.hpp"

#include "ContentScanner.hpp"
#include "Document.hpp"
#include "FieldPatcher.hpp"
#include "FrontMatter.hpp"
#include "HeaderParser.hpp"
#include "../config/SiteConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace content
{

namespace
{

const std::string* findValue(const StringPairs& entries, const std::string& key)
{
    for (const auto& entry : entries)
    {
        if (entry.first == key)
            return &entry.second;
    }
    return nullptr;
}

struct Participant
{
    const SiblingDocument* doc = nullptr;
    StringPairs entries;
};

} // namespace

AlternatesSynchronizer::AlternatesSynchronizer(const SiteConfig& config, IDocumentStore& store)
    : config_(config)
    , store_(store)
{
}

StringPairs AlternatesSynchronizer::merge(const std::vector<StringPairs>& maps_in_order)
{
    StringPairs merged;
    for (const auto& map : maps_in_order)
    {
        for (const auto& [locale, value] : map)
        {
            const std::string* existing = findValue(merged, locale);
            if (!existing)
            {
                merged.emplace_back(locale, value);
            }
            else if (*existing != value)
            {
                PLOG_DEBUG << "alternates conflict for '" << locale << "': keeping '" << *existing << "' over '"
                           << value << "'";
            }
        }
    }
    return merged;
}

bool AlternatesSynchronizer::sameEntries(const StringPairs& a, const StringPairs& b)
{
    if (a.size() != b.size())
        return false;
    for (const auto& [key, value] : a)
    {
        const std::string* other = findValue(b, key);
        if (!other || *other != value)
            return false;
    }
    return true;
}

StringPairs AlternatesSynchronizer::canonicalOrder(const StringPairs& merged) const
{
    StringPairs ordered;
    ordered.reserve(merged.size());
    for (const auto& locale : config_.locales)
    {
        if (const std::string* value = findValue(merged, locale))
            ordered.emplace_back(locale, *value);
    }
    for (const auto& entry : merged)
    {
        if (std::find(config_.locales.begin(), config_.locales.end(), entry.first) == config_.locales.end())
            ordered.push_back(entry);
    }
    return ordered;
}

std::vector<std::string> AlternatesSynchronizer::sync(const SiblingSet& siblings)
{
    std::vector<std::string> modified;

    std::vector<Participant> participants;
    for (const auto& member : siblings.members)
    {
        auto fm = FrontMatter::split(member.text);
        if (!fm || !fm->has_header_lines)
            continue;
        if (!HeaderParser::hasField(HeaderParser::parse(fm->header), kAlternatesKey))
            continue;

        auto entries = HeaderView::load(fm->header).alternates(kAlternatesKey);
        if (!entries)
        {
            // Its own entries are unknown, so it can neither contribute nor be patched safely.
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Synchronization,
                                                "Alternates left untouched, header is not readable YAML",
                                                "Path: " + member.path);
            continue;
        }

        Participant p;
        p.doc = &member;
        p.entries = std::move(*entries);
        participants.push_back(std::move(p));
    }

    if (participants.empty())
    {
        PLOG_DEBUG << "No sibling of '" << siblings.base_path << "' declares alternates";
        return modified;
    }

    std::vector<StringPairs> maps;
    maps.reserve(participants.size());
    for (const auto& p : participants)
        maps.push_back(p.entries);
    const StringPairs merged = canonicalOrder(merge(maps));

    for (const auto& p : participants)
    {
        if (sameEntries(p.entries, merged))
            continue;

        const auto result = FieldPatcher::patch(p.doc->text, kAlternatesKey, merged);
        if (!result.changed())
            continue;

        if (!store_.write(p.doc->path, result.text))
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Synchronization,
                                              "Failed to update alternates", "Path: " + p.doc->path);
            continue;
        }

        PLOG_INFO << "Updated alternates in " << p.doc->path;
        modified.push_back(p.doc->path);
    }

    return modified;
}

std::vector<std::string> AlternatesSynchronizer::syncBasePath(const std::string& base_path)
{
    ContentScanner scanner(config_, store_);
    return sync(scanner.collectSiblings(base_path));
}

} // namespace content
