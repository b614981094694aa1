#pragma once

#include <string>
#include <utility>
#include <vector>

namespace content
{

// Ordered string map, kept in insertion order.
using StringPairs = std::vector<std::pair<std::string, std::string>>;

namespace yaml
{

constexpr const char* kIndent = "  ";

bool isAbsoluteUrl(const std::string& value);

// True when the plain form of `value` would not read back as the same string.
bool needsQuotes(const std::string& value);

std::string quote(const std::string& value);

// Plain when safe, double-quoted otherwise.
std::string renderScalar(const std::string& value);

// `key: value` for single-line values. A value with line breaks becomes a
// folded block: `key: >-` and one indented line per value line.
std::vector<std::string> renderScalarField(const std::string& key, const std::string& value);

// `key:` followed by one indented `subkey: subvalue` line per entry. Absolute
// URLs and empty strings are always quoted.
std::vector<std::string> renderMapField(const std::string& key, const StringPairs& entries);

} // namespace yaml
} // namespace content
