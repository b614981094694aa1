#pragma once

#include <string>

struct SiteConfig;

namespace content
{

// Path convention: documents of the default locale live at the content root,
// every other locale under a directory named after its code.

/// Locale of a document, taken from the first path segment.
std::string localeOf(const std::string& relative_path, const SiteConfig& config);

/// Relative path with the leading `locale/` segment removed.
std::string basePath(const std::string& relative_path, const std::string& locale, const SiteConfig& config);

/// Path a variant of `base_path` in `target_locale` must occupy.
std::string targetPath(const std::string& base_path, const std::string& target_locale, const SiteConfig& config);

/// File name of `path` without directories and without the .md/.mdx extension.
std::string fileStem(const std::string& path);

} // namespace content
