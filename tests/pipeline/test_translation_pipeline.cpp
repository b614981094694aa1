#include <catch2/catch_test_macros.hpp>
#include "config/SiteConfig.hpp"
#include "content/Document.hpp"
#include "content/YamlScalar.hpp"
#include "pipeline/TranslationPipeline.hpp"
#include "utils/memory_store.hpp"
#include "utils/mock_translator.hpp"

using namespace pipeline;
using Status = TranslationResult::Status;

namespace
{

const std::string kAbout = "---\n"
                           "title: About\n"
                           "description: Who we are\n"
                           "_translateTo: [ru]\n"
                           "tags:\n"
                           "  - team\n"
                           "---\n"
                           "\n"
                           "# About\n"
                           "\n"
                           "Hello.\n";

SiteConfig siteConfig()
{
    SiteConfig config;
    config.locales = { "en", "ru", "de" };
    config.default_locale = "en";
    config.api_key = "test-key";
    config.model = "gpt-test";
    config.max_concurrent_requests = 2;
    return config;
}

std::string fixedDate()
{
    return "2024-01-02";
}

translate::Completed russianAbout(const translate::TranslationJob&)
{
    translate::Completed done;
    done.fields = { { "title", "O nas" }, { "description", "Kto my" } };
    done.body = "# O nas\n\nPrivet.";
    return done;
}

} // namespace

TEST_CASE("TranslationPipeline writes a translated variant", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", kAbout);
    test_utils::MockTranslator translator;
    translator.respond = russianAbout;

    TranslationPipeline runner(config, store, &translator, fixedDate);
    const auto results = runner.translate({});

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].status == Status::Created);
    REQUIRE(results[0].source == "about.md");
    REQUIRE(results[0].target == "ru/about.md");
    REQUIRE(results[0].locale == "ru");

    REQUIRE(translator.jobs.size() == 1);
    const auto& job = translator.jobs[0];
    REQUIRE(job.source_locale == "en");
    REQUIRE(job.target_locale == "ru");
    REQUIRE(job.fields == content::StringPairs{ { "title", "About" }, { "description", "Who we are" } });
    REQUIRE(job.body == "# About\n\nHello.");

    const std::string hash = content::yaml::renderScalar(content::contentHash(kAbout));
    REQUIRE(store.at("ru/about.md") == "---\n"
                                       "title: O nas\n"
                                       "description: Kto my\n"
                                       "_ai-translator:\n"
                                       "  source: about.md\n"
                                       "  hash: " + hash + "\n"
                                       "  model: gpt-test\n"
                                       "  date: 2024-01-02\n"
                                       "tags:\n"
                                       "  - team\n"
                                       "---\n"
                                       "\n"
                                       "# O nas\n"
                                       "\n"
                                       "Privet.\n");
}

TEST_CASE("TranslationPipeline drops an untranslated description", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", kAbout);
    test_utils::MockTranslator translator;
    translator.respond = [](const translate::TranslationJob&) {
        translate::Completed done;
        done.fields = { { "title", "O nas" } };
        done.body = "Privet.";
        return done;
    };

    TranslationPipeline runner(config, store, &translator, fixedDate);
    runner.translate({});

    const auto& out = store.at("ru/about.md");
    REQUIRE(out.find("title: O nas\n") != std::string::npos);
    REQUIRE(out.find("description:") == std::string::npos);
}

TEST_CASE("TranslationPipeline skips variants that already exist", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", kAbout);
    store.put("ru/about.md", "---\ntitle: Manual\n---\n\nHand written.\n");
    test_utils::MockTranslator translator;

    TranslationPipeline runner(config, store, &translator, fixedDate);

    SECTION("by path")
    {
        const auto results = runner.translate({});
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].status == Status::Skipped);
        REQUIRE(results[0].reason == "exists");
        REQUIRE(translator.jobs.empty());
        REQUIRE(store.at("ru/about.md") == "---\ntitle: Manual\n---\n\nHand written.\n");
    }

    SECTION("force overwrites")
    {
        TranslateOptions options;
        options.force = true;
        const auto results = runner.translate(options);
        REQUIRE(results[0].status == Status::Created);
        REQUIRE(store.at("ru/about.md").find("[ru] # About") != std::string::npos);
    }
}

TEST_CASE("TranslationPipeline skips variants found by permalink", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", "---\ntitle: About\n_translateTo: [ru]\nalternates:\n  en: about\n  ru: o-nas\n---\n\nBody\n");
    store.put("ru/o-nas.md", "---\ntitle: O nas\n---\n\nTelo\n");
    test_utils::MockTranslator translator;

    TranslationPipeline runner(config, store, &translator, fixedDate);
    const auto results = runner.translate({});

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].status == Status::Skipped);
    REQUIRE(results[0].reason == "permalink exists");
    REQUIRE_FALSE(store.exists("ru/about.md"));
}

TEST_CASE("TranslationPipeline dry run plans without side effects", "[pipeline]")
{
    auto config = siteConfig();
    config.api_key.clear();
    test_utils::MemoryStore store;
    store.put("about.md", kAbout);
    store.put("team.md", "---\ntitle: Team\n_translateTo: all\n---\n\nPeople\n");

    TranslationPipeline runner(config, store, nullptr, fixedDate);
    TranslateOptions options;
    options.dry_run = true;
    const auto results = runner.translate(options);

    REQUIRE(results.size() == 3);
    for (const auto& r : results)
        REQUIRE(r.status == Status::Planned);
    REQUIRE(results[1].target == "ru/team.md");
    REQUIRE(results[2].target == "de/team.md");
    REQUIRE(store.writeCount() == 0);
}

TEST_CASE("TranslationPipeline refuses to start without credentials", "[pipeline]")
{
    auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", kAbout);
    test_utils::MockTranslator translator;

    SECTION("missing API key")
    {
        config.api_key.clear();
        TranslationPipeline runner(config, store, &translator, fixedDate);
        REQUIRE_THROWS_AS(runner.translate({}), PreconditionError);
    }

    SECTION("missing translator")
    {
        TranslationPipeline runner(config, store, nullptr, fixedDate);
        REQUIRE_THROWS_AS(runner.translate({}), PreconditionError);
    }

    SECTION("translator not ready")
    {
        translator.ready = false;
        TranslationPipeline runner(config, store, &translator, fixedDate);
        REQUIRE_THROWS_AS(runner.translate({}), PreconditionError);
    }

    REQUIRE(store.writeCount() == 0);
}

TEST_CASE("TranslationPipeline isolates failing units", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", "---\ntitle: About\n_translateTo: [ru, de]\n---\n\nBody\n");
    test_utils::MockTranslator translator;

    SECTION("translation failure")
    {
        translator.respond = [](const translate::TranslationJob& job) {
            if (job.target_locale == "de") {
                translate::Completed failed;
                failed.failed = true;
                failed.error_message = "HTTP 500";
                return failed;
            }
            return test_utils::MockTranslator::echo(job);
        };

        TranslationPipeline runner(config, store, &translator, fixedDate);
        const auto results = runner.translate({});

        REQUIRE(results.size() == 2);
        REQUIRE(results[0].status == Status::Created);
        REQUIRE(results[1].status == Status::Failed);
        REQUIRE(results[1].error == "HTTP 500");
        REQUIRE(store.exists("ru/about.md"));
        REQUIRE_FALSE(store.exists("de/about.md"));
    }

    SECTION("write failure")
    {
        store.failWritesTo("ru/about.md");
        TranslationPipeline runner(config, store, &translator, fixedDate);
        const auto results = runner.translate({});

        REQUIRE(results[0].status == Status::Failed);
        REQUIRE(results[0].error == "failed to write ru/about.md");
        REQUIRE(results[1].status == Status::Created);
    }
}

TEST_CASE("TranslationPipeline translates non-default sources into the default locale", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("ru/blog/post.md", "---\ntitle: Post\n_translateTo: [en]\n---\n\nTekst\n");
    test_utils::MockTranslator translator;

    TranslationPipeline runner(config, store, &translator, fixedDate);
    const auto results = runner.translate({});

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].target == "blog/post.md");
    REQUIRE(translator.jobs[0].source_locale == "ru");
    REQUIRE(store.exists("blog/post.md"));
}

TEST_CASE("TranslationPipeline honours the file filter", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", kAbout);
    store.put("docs/team.md", "---\ntitle: Team\n_translateTo: [de]\n---\n\nPeople\n");
    test_utils::MockTranslator translator;

    TranslationPipeline runner(config, store, &translator, fixedDate);
    TranslateOptions options;
    options.file = "team";
    const auto results = runner.translate(options);

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].source == "docs/team.md");
    REQUIRE(results[0].target == "de/docs/team.md");
}

TEST_CASE("TranslationPipeline stops dispatching once cancelled", "[pipeline]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", "---\ntitle: About\n_translateTo: all\n---\n\nBody\n");
    test_utils::MockTranslator translator;
    std::atomic<bool> cancel{ true };

    TranslationPipeline runner(config, store, &translator, fixedDate);
    TranslateOptions options;
    options.cancel_flag = &cancel;
    const auto results = runner.translate(options);

    REQUIRE(results.size() == 2);
    for (const auto& r : results)
    {
        REQUIRE(r.status == Status::Skipped);
        REQUIRE(r.reason == "cancelled");
    }
    REQUIRE(translator.jobs.empty());
    REQUIRE(store.writeCount() == 0);
}

TEST_CASE("TranslationPipeline links new variants through alternates", "[pipeline][alternates]")
{
    auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", "---\ntitle: About\n_translateTo: [ru]\nalternates:\n  en: about\n---\n\nBody\n");
    store.put("de/about.md", "---\ntitle: Ueber\nalternates:\n  de: ueber-uns\n---\n\nText\n");
    test_utils::MockTranslator translator;

    SECTION("every opted-in sibling gains the full map")
    {
        TranslationPipeline runner(config, store, &translator, fixedDate);
        const auto results = runner.translate({});

        REQUIRE(results.size() == 1);
        REQUIRE(results[0].status == Status::Created);
        REQUIRE(results[0].alternates_updated ==
                std::vector<std::string>{ "about.md", "ru/about.md", "de/about.md" });

        const std::string merged = "alternates:\n  en: about\n  ru: about\n  de: ueber-uns\n";
        REQUIRE(store.at("about.md") == "---\ntitle: About\n_translateTo: [ru]\n" + merged + "---\n\nBody\n");
        REQUIRE(store.at("de/about.md") == "---\ntitle: Ueber\n" + merged + "---\n\nText\n");
        REQUIRE(store.at("ru/about.md").find(merged) != std::string::npos);

        SECTION("a second run changes nothing")
        {
            store.resetWriteCount();
            const auto again = runner.translate({});
            REQUIRE(again[0].status == Status::Skipped);
            REQUIRE(store.writeCount() == 0);
        }
    }

    SECTION("synchronisation can be switched off")
    {
        config.update_alternates = false;
        TranslationPipeline runner(config, store, &translator, fixedDate);
        const auto results = runner.translate({});

        REQUIRE(results[0].alternates_updated.empty());
        REQUIRE(store.at("de/about.md") == "---\ntitle: Ueber\nalternates:\n  de: ueber-uns\n---\n\nText\n");
    }
}

TEST_CASE("TranslationPipeline status report", "[pipeline][status]")
{
    const auto config = siteConfig();
    test_utils::MemoryStore store;
    store.put("about.md", "---\ntitle: About\n_translateTo: all\n---\n\nBody\n");
    store.put("ru/about.md", "---\ntitle: O nas\n_ai-translator:\n  source: about.md\n---\n\nTelo\n");
    store.put("team.md", "---\ntitle: Team\n_translateTo: [de]\n---\n\nPeople\n");
    store.put("de/team.md", "---\ntitle: Mannschaft\n---\n\nLeute\n");
    store.put("plain.md", "---\ntitle: Plain\n---\n");

    TranslationPipeline runner(config, store, nullptr, fixedDate);
    const auto rows = runner.status();

    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].source == "about.md");
    REQUIRE(rows[0].locales.size() == 2);
    REQUIRE(rows[0].locales[0].locale == "ru");
    REQUIRE(rows[0].locales[0].state == LocaleStatus::State::Ai);
    REQUIRE(rows[0].locales[0].path == "ru/about.md");
    REQUIRE(rows[0].locales[1].locale == "de");
    REQUIRE(rows[0].locales[1].state == LocaleStatus::State::Pending);
    REQUIRE(rows[0].locales[1].path.empty());

    REQUIRE(rows[1].source == "team.md");
    REQUIRE(rows[1].locales[0].state == LocaleStatus::State::Exists);
    REQUIRE(std::string(toString(rows[1].locales[0].state)) == "exists");
}

TEST_CASE("TranslationPipeline date stamp", "[pipeline]")
{
    const auto today = TranslationPipeline::utcToday();
    REQUIRE(today.size() == 10);
    REQUIRE(today[4] == '-');
    REQUIRE(today[7] == '-');
}
