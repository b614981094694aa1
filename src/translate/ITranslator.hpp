#pragma once

#include "../content/YamlScalar.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <memory>

struct SiteConfig;

namespace translate
{
    enum class Backend
    {
        OpenAI = 0
    };

    struct BackendConfig
    {
        Backend backend = Backend::OpenAI;
        std::string base_url;
        std::string model;
        std::string api_key;
        std::string prompt;
        std::size_t max_concurrent_requests = 1;
        double request_interval_seconds = 0.0;
        int max_retries = 0;

        static BackendConfig from(const ::SiteConfig& site);
    };

    // One document into one locale.
    struct TranslationJob
    {
        std::string source_locale;
        std::string target_locale;
        content::StringPairs fields; // translatable header fields, in header order
        std::string body;
        std::string prompt_override;
    };

    struct Completed
    {
        std::uint64_t id = 0;
        content::StringPairs fields;
        std::string body;
        bool failed = false;
        std::string error_message;
    };

    class ITranslator
    {
    public:
        virtual ~ITranslator() = default;
        virtual bool init(const BackendConfig& cfg) = 0;
        virtual bool isReady() const = 0;
        virtual void shutdown() = 0;
        virtual bool submit(const TranslationJob& job, std::uint64_t& out_id) = 0;
        virtual bool drain(std::vector<Completed>& out) = 0;
        virtual std::string lastError() const = 0;
    };

    // Factory function to create translators based on backend type
    std::unique_ptr<ITranslator> createTranslator(Backend backend);
    bool backendFromString(const std::string& name, Backend& out);
}
