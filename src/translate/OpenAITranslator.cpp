#include "OpenAITranslator.hpp"
#include "ResponseParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace translate
{

const char* OpenAITranslator::providerName() const
{
    return "OpenAI";
}

std::string OpenAITranslator::validateConfig(const BackendConfig& cfg) const
{
    if (cfg.api_key.empty())
        return "Missing API key";
    if (cfg.base_url.empty())
        return "Missing base URL";
    if (cfg.model.empty())
        return "Missing model";
    return {};
}

bool OpenAITranslator::hasValidRuntimeConfig() const
{
    return !cfg_.api_key.empty() && !cfg_.model.empty() && !cfg_.base_url.empty();
}

ILLMTranslator::ProviderLimits OpenAITranslator::providerLimits() const
{
    ProviderLimits limits;
    limits.max_input_bytes = helpers::LengthLimits::OPENAI_API_MAX;
    return limits;
}

void OpenAITranslator::buildHeaders(const Job&, std::vector<Header>& headers) const
{
    headers.push_back({ "Content-Type", "application/json" });
    headers.push_back({ "Authorization", std::string("Bearer ") + cfg_.api_key });
}

std::string OpenAITranslator::buildUrl(const Job&) const
{
    return normalizeURL(cfg_.base_url);
}

void OpenAITranslator::buildRequestBody(const Job&, const Prompt& prompt, nlohmann::json& body) const
{
    body["model"] = cfg_.model;
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : prompt.messages)
    {
        std::string role = "user";
        switch (message.role)
        {
        case Role::System:
            role = "system";
            break;
        case Role::Assistant:
            role = "assistant";
            break;
        default:
            role = "user";
            break;
        }
        messages.push_back({ { "role", role }, { "content", message.content } });
    }
    body["messages"] = std::move(messages);
    body["temperature"] = 0.3;
}

ILLMTranslator::ParseResult OpenAITranslator::parseResponse(const Job& job, const HttpResponse& resp,
                                                            Completed& out) const
{
    ParseResult result;
    try
    {
        auto json = nlohmann::json::parse(resp.text);
        if (!json.contains("choices") || json["choices"].empty())
        {
            result.error_message = "missing choices in response";
            return result;
        }

        const auto& choice = json["choices"].at(0);
        if (!choice.contains("message") || !choice["message"].contains("content") ||
            !choice["message"]["content"].is_string())
        {
            result.error_message = "missing message content";
            return result;
        }

        const auto reply = choice["message"]["content"].get<std::string>();
        if (choice.contains("finish_reason") && choice["finish_reason"] == "length")
        {
            PLOG_WARNING << "OpenAI reply for " << job.request.target_locale << " was truncated at the token limit";
        }

        std::vector<std::string> requested;
        requested.reserve(job.request.fields.size());
        for (const auto& field : job.request.fields)
            requested.push_back(field.first);

        auto parsed = ResponseParser::parse(reply, requested);
        if (parsed.body.empty() && !job.request.body.empty())
        {
            result.error_message = "empty translation in response";
            return result;
        }

        out.fields = std::move(parsed.fields);
        out.body = std::move(parsed.body);
        result.ok = true;
        return result;
    }
    catch (const nlohmann::json::exception& ex)
    {
        result.error_message = std::string("parse error: ") + ex.what();
        return result;
    }
}

std::string OpenAITranslator::normalizeURL(const std::string& base_url)
{
    std::string url = base_url;

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    if (url.empty())
        return url;

    size_t scheme_end = url.find("://");
    size_t path_start = (scheme_end != std::string::npos) ? url.find('/', scheme_end + 3) : url.find('/');

    if (path_start != std::string::npos)
    {
        std::string path = url.substr(path_start);
        if (path.find("/v1/chat/completions") != std::string::npos)
            return url;
        if (path == "/v1")
            return url + "/chat/completions";
        return url;
    }

    return url + "/v1/chat/completions";
}

} // namespace translate
