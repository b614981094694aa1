#pragma once

#include "IDocumentStore.hpp"
#include "SiblingSet.hpp"
#include "YamlScalar.hpp"

#include <string>
#include <vector>

struct SiteConfig;

namespace content
{

// Keeps the `alternates` map identical across the variants of one page.
//
// Only siblings whose header already has the field take part. Their maps are
// merged in configured locale order, first value seen for a locale wins, and
// every participant missing an entry is patched in place. A converged set
// produces no writes.
class AlternatesSynchronizer
{
public:
    AlternatesSynchronizer(const SiteConfig& config, IDocumentStore& store);

    // Returns the paths that were rewritten.
    std::vector<std::string> sync(const SiblingSet& siblings);

    // Convenience: collect the sibling set for `base_path` and sync it.
    std::vector<std::string> syncBasePath(const std::string& base_path);

    static StringPairs merge(const std::vector<StringPairs>& maps_in_order);
    static bool sameEntries(const StringPairs& a, const StringPairs& b);

    // Configured locales first, then the rest in first-seen order.
    StringPairs canonicalOrder(const StringPairs& merged) const;

private:
    const SiteConfig& config_;
    IDocumentStore& store_;
};

} // namespace content
