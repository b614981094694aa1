#include <catch2/catch_test_macros.hpp>
#include "translate/OpenAITranslator.hpp"
#include "../utils/mock_http.hpp"

#include <string>
#include <type_traits>
#include <utility>

using namespace translate;

namespace {

// Exposes the request and response hooks so they can be driven without a
// network.
class TestableOpenAITranslator : public OpenAITranslator {
public:
    using ILLMTranslator::Job;
    using ILLMTranslator::ParseResult;
    using ILLMTranslator::Prompt;
    using ILLMTranslator::Role;
    using ILLMTranslator::buildPrompt;
    using OpenAITranslator::buildRequestBody;
    using OpenAITranslator::parseResponse;
};

BackendConfig validConfig() {
    BackendConfig config;
    config.backend = Backend::OpenAI;
    config.api_key = "test-key";
    config.base_url = "https://api.openai.com";
    config.model = "gpt-4.1";
    return config;
}

TestableOpenAITranslator::Job makeJob() {
    TestableOpenAITranslator::Job job;
    job.id = 7;
    job.request.source_locale = "en";
    job.request.target_locale = "ru";
    job.request.fields = {{"title", "About"}, {"description", "Who we are"}};
    job.request.body = "# About\n\nHello.";
    return job;
}

}  // namespace

TEST_CASE("OpenAI Translator", "[translate][openai]") {

    SECTION("Initialization") {
        OpenAITranslator translator;

        SECTION("Fails without an API key") {
            BackendConfig config = validConfig();
            config.api_key.clear();
            REQUIRE_FALSE(translator.init(config));
            REQUIRE_FALSE(translator.isReady());
            REQUIRE(std::string(translator.lastError()) == "Missing API key");
        }

        SECTION("Fails without a model") {
            BackendConfig config = validConfig();
            config.model.clear();
            REQUIRE_FALSE(translator.init(config));
            REQUIRE(std::string(translator.lastError()) == "Missing model");
        }

        SECTION("Succeeds with valid config") {
            REQUIRE(translator.init(validConfig()));
            REQUIRE(translator.isReady());
            translator.shutdown();
            REQUIRE_FALSE(translator.isReady());
        }

        SECTION("Not ready without proper initialization") {
            REQUIRE_FALSE(translator.isReady());
        }
    }

    SECTION("Submission") {
        OpenAITranslator translator;
        TranslationJob job;
        job.source_locale = "en";
        job.body = "Hello";
        std::uint64_t id = 0;

        SECTION("Rejects jobs before init") {
            job.target_locale = "ru";
            REQUIRE_FALSE(translator.submit(job, id));
            REQUIRE(std::string(translator.lastError()) == "translator not ready");
        }

        SECTION("Rejects a job without target locale") {
            REQUIRE(translator.init(validConfig()));
            REQUIRE_FALSE(translator.submit(job, id));
            REQUIRE(std::string(translator.lastError()) == "missing target locale");
        }

        SECTION("Last error is handed out as a copy") {
            STATIC_REQUIRE(std::is_same_v<decltype(std::declval<const ITranslator&>().lastError()), std::string>);

            REQUIRE_FALSE(translator.submit(job, id));
            const std::string before = translator.lastError();
            REQUIRE(translator.init(validConfig()));
            REQUIRE_FALSE(translator.submit(job, id));
            REQUIRE(before == "translator not ready");
            REQUIRE(translator.lastError() == "missing target locale");
        }

        SECTION("Nothing to drain before any work finished") {
            std::vector<Completed> out;
            REQUIRE_FALSE(translator.drain(out));
            REQUIRE(out.empty());
        }
    }
}

TEST_CASE("OpenAI URL normalization", "[translate][openai]") {
    REQUIRE(OpenAITranslator::normalizeURL("https://api.openai.com") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("https://api.openai.com/") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("https://proxy.local/v1") == "https://proxy.local/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("https://proxy.local/v1/chat/completions") ==
            "https://proxy.local/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("http://localhost:11434/api/chat") == "http://localhost:11434/api/chat");
    REQUIRE(OpenAITranslator::normalizeURL("").empty());
}

TEST_CASE("OpenAI prompt construction", "[translate][openai]") {
    TestableOpenAITranslator translator;
    REQUIRE(translator.init(validConfig()));
    const auto job = makeJob();

    SECTION("Default system prompt names both languages") {
        const auto prompt = translator.buildPrompt(job);
        REQUIRE(prompt.messages.size() == 2);
        REQUIRE(prompt.messages[0].role == TestableOpenAITranslator::Role::System);
        REQUIRE(prompt.messages[0].content.find("Translate from en to ru.") != std::string::npos);
        REQUIRE(prompt.messages[1].content ==
                "FRONTMATTER:\ntitle: About\ndescription: Who we are\n\nCONTENT:\n# About\n\nHello.");
    }

    SECTION("A per-job prompt wins over the default") {
        auto custom = job;
        custom.request.prompt_override = "Translate {source_lang} into {target_lang} formally.";
        const auto prompt = translator.buildPrompt(custom);
        REQUIRE(prompt.messages[0].content == "Translate en into ru formally.");
    }

    SECTION("A body without fields is sent alone") {
        TranslationJob bare;
        bare.body = "Just text";
        REQUIRE(ILLMTranslator::buildUserMessage(bare) == "Just text");
    }

    SECTION("Request body carries model, messages and temperature") {
        nlohmann::json body;
        translator.buildRequestBody(job, translator.buildPrompt(job), body);
        REQUIRE(body["model"] == "gpt-4.1");
        REQUIRE(body["temperature"] == 0.3);
        REQUIRE(body["messages"].size() == 2);
        REQUIRE(body["messages"][0]["role"] == "system");
        REQUIRE(body["messages"][1]["role"] == "user");
    }
}

TEST_CASE("OpenAI response parsing", "[translate][openai]") {
    TestableOpenAITranslator translator;
    const auto job = makeJob();
    Completed out;

    SECTION("Structured reply") {
        const auto resp = test_utils::MockResponses::openai_success(
            "FRONTMATTER:\ntitle: O nas\ndescription: Kto my\n\nCONTENT:\n# O nas\n\nPrivet.");
        const auto result = translator.parseResponse(job, resp, out);
        REQUIRE(result.ok);
        REQUIRE(out.fields == content::StringPairs{{"title", "O nas"}, {"description", "Kto my"}});
        REQUIRE(out.body == "# O nas\n\nPrivet.");
    }

    SECTION("Truncated reply is still accepted") {
        const auto resp = test_utils::MockResponses::openai_truncated("# O nas\n\nPri");
        const auto result = translator.parseResponse(job, resp, out);
        REQUIRE(result.ok);
        REQUIRE(out.body == "# O nas\n\nPri");
        REQUIRE(out.fields.empty());
    }

    SECTION("Empty translation is an error") {
        const auto resp = test_utils::MockResponses::openai_success("FRONTMATTER:\ntitle: O nas\nCONTENT:\n");
        const auto result = translator.parseResponse(job, resp, out);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error_message == "empty translation in response");
    }

    SECTION("Invalid JSON") {
        const auto result = translator.parseResponse(job, test_utils::MockResponses::openai_invalid_json(), out);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error_message.rfind("parse error", 0) == 0);
    }

    SECTION("No choices") {
        const auto result = translator.parseResponse(job, test_utils::MockResponses::openai_no_choices(), out);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error_message == "missing choices in response");
    }
}
