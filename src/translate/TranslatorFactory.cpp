#include "ITranslator.hpp"
#include "OpenAITranslator.hpp"
#include "../config/SiteConfig.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

namespace translate
{
std::unique_ptr<ITranslator> createTranslator(Backend backend)
{
    switch (backend)
    {
    case Backend::OpenAI:
        return std::make_unique<OpenAITranslator>();
    default:
        return nullptr;
    }
}

bool backendFromString(const std::string& name, Backend& out)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "openai" || lower.empty())
    {
        out = Backend::OpenAI;
        return true;
    }
    return false;
}

BackendConfig BackendConfig::from(const ::SiteConfig& site)
{
    BackendConfig out;
    if (!backendFromString(site.backend, out.backend))
        out.backend = Backend::OpenAI;
    out.base_url = site.base_url;
    out.model = site.model;
    out.api_key = site.api_key;
    out.prompt = site.prompt;
    out.max_concurrent_requests = site.max_concurrent_requests == 0 ? 1 : site.max_concurrent_requests;
    out.request_interval_seconds = site.request_interval_seconds < 0.0 ? 0.0 : site.request_interval_seconds;
    out.max_retries = site.max_retries < 0 ? 0 : site.max_retries;
    return out;
}
} // namespace translate
