#pragma once

#include "FrontMatter.hpp"

#include <string>
#include <vector>

struct SiteConfig;

namespace content
{

constexpr const char* kMarkerKey = "_translateTo";
constexpr const char* kPrivatePrefix = "_";
constexpr const char* kMetadataKey = "_ai-translator";
constexpr const char* kAlternatesKey = "alternates";
constexpr std::size_t kHashLength = 12;

struct Document
{
    std::string path; // relative to the content directory, '/'-separated
    std::string locale;
    std::string raw;
    bool has_header = false;
    std::string header;
    std::string body;
    std::string hash;
    TranslateTarget translate_to;

    // Locales this document should be translated into, never its own.
    std::vector<std::string> targetLocales(const SiteConfig& config) const;
};

Document loadDocument(const std::string& relative_path, const std::string& raw, const SiteConfig& config);

// Fixed-length hex prefix of the SHA-256 of `raw`.
std::string contentHash(const std::string& raw);

} // namespace content
