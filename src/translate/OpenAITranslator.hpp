#pragma once

#include "ILLMTranslator.hpp"

namespace translate
{

// Any OpenAI-compatible chat completions endpoint.
class OpenAITranslator : public ILLMTranslator
{
public:
    static std::string normalizeURL(const std::string& base_url);

protected:
    const char* providerName() const override;
    std::string validateConfig(const BackendConfig& cfg) const override;
    bool hasValidRuntimeConfig() const override;
    ProviderLimits providerLimits() const override;
    void buildHeaders(const Job& job, std::vector<Header>& headers) const override;
    std::string buildUrl(const Job& job) const override;
    void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const override;
    ParseResult parseResponse(const Job& job, const HttpResponse& resp, Completed& out) const override;
};

} // namespace translate
