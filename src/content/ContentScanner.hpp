#pragma once

#include "Document.hpp"
#include "IDocumentStore.hpp"
#include "SiblingSet.hpp"

#include <optional>
#include <string>
#include <vector>

struct SiteConfig;

namespace content
{

class ContentScanner
{
public:
    ContentScanner(const SiteConfig& config, const IDocumentStore& store);

    std::vector<Document> scan() const;

    SiblingSet collectSiblings(const std::string& base_path) const;

    // Path of the document in `locale` whose `permalink` field, or file stem,
    // equals `permalink`.
    std::optional<std::string> findByPermalink(const std::string& locale, const std::string& permalink) const;

private:
    bool inLocaleDirectory(const std::string& path, const std::string& locale) const;

    const SiteConfig& config_;
    const IDocumentStore& store_;
};

} // namespace content
