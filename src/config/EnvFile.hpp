#pragma once

#include <functional>
#include <string>

struct SiteConfig;

namespace config
{

using EnvLookup = std::function<const char*(const char*)>;

// Reads KEY=VALUE lines into the process environment. Variables that are
// already set keep their value. A missing file is not an error.
bool loadDotEnv(const std::string& path, std::string* error = nullptr);

// OPENAI_API_KEY, AI_TRANSLATE_MODEL, AI_TRANSLATE_CONTENT_DIR and
// AI_TRANSLATE_UPDATE_ALTERNATES.
void applyEnvironmentOverrides(SiteConfig& config, const EnvLookup& lookup);

} // namespace config
