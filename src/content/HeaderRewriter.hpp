#pragma once

#include "HeaderLine.hpp"
#include "YamlScalar.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace content
{

// Nested block written into translated output, e.g.
//   _ai-translator:
//     source: about.md
//     hash: 0123abcd4567
struct MetadataBlock
{
    std::string key;
    StringPairs attributes;
};

struct RewriteRequest
{
    // Value std::nullopt removes the field. A replacement whose key does not
    // occur in the header is appended after the last line.
    std::vector<std::pair<std::string, std::optional<std::string>>> replacements;
    std::string private_prefix = "_";
    std::string marker_key = "_translateTo";
    MetadataBlock metadata;
};

class HeaderRewriter
{
public:
    // Single forward pass over `lines`. Lines that no rule touches are copied
    // from their raw text, so their bytes, order and indentation survive.
    static std::string rewrite(const HeaderLines& lines, const RewriteRequest& request);

    static std::vector<std::string> renderMetadata(const MetadataBlock& metadata);
};

} // namespace content
