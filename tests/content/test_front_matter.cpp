#include <catch2/catch_test_macros.hpp>
#include "content/FrontMatter.hpp"

using namespace content;

TEST_CASE("FrontMatter splits at the delimiters", "[content][frontmatter]")
{
    SECTION("plain document")
    {
        const std::string doc = "---\ntitle: A\n---\n\nBody\n";
        const auto fm = FrontMatter::split(doc);
        REQUIRE(fm.has_value());
        REQUIRE(fm->has_header_lines);
        REQUIRE(fm->header == "title: A");
        REQUIRE(fm->body == "\nBody\n");
        REQUIRE(fm->join() == doc);
    }

    SECTION("byte order mark and CRLF survive a round trip")
    {
        const std::string doc = "\xEF\xBB\xBF---\r\ntitle: A\r\n---\r\nBody";
        const auto fm = FrontMatter::split(doc);
        REQUIRE(fm.has_value());
        REQUIRE(fm->header == "title: A\r");
        REQUIRE(fm->body == "Body");
        REQUIRE(fm->join() == doc);
    }

    SECTION("closing delimiter at end of file")
    {
        const auto fm = FrontMatter::split("---\ntitle: A\n---");
        REQUIRE(fm.has_value());
        REQUIRE(fm->close == "---");
        REQUIRE(fm->body.empty());
    }

    SECTION("no header")
    {
        REQUIRE_FALSE(FrontMatter::hasHeader("Body only"));
        REQUIRE_FALSE(FrontMatter::hasHeader("---\ntitle: never closed\n"));
        REQUIRE_FALSE(FrontMatter::hasHeader("----\ntitle: A\n----\n"));
    }
}

TEST_CASE("FrontMatter compose lays out generated files", "[content][frontmatter]")
{
    REQUIRE(FrontMatter::compose("title: A", "Body") == "---\ntitle: A\n---\n\nBody\n");
    REQUIRE(FrontMatter::compose("title: A", "Body\n") == "---\ntitle: A\n---\n\nBody\n");
}

TEST_CASE("HeaderView typed accessors", "[content][frontmatter]")
{
    const auto view = HeaderView::load("title: Hello\n"
                                       "draft: true\n"
                                       "flag: \"true\"\n"
                                       "permalink: about-us\n"
                                       "tags:\n"
                                       "  - a\n");
    REQUIRE(view.valid());
    REQUIRE(view.stringField("title") == std::optional<std::string>("Hello"));
    REQUIRE_FALSE(view.stringField("draft").has_value());
    REQUIRE(view.stringField("flag") == std::optional<std::string>("true"));
    REQUIRE_FALSE(view.stringField("tags").has_value());
    REQUIRE(view.permalink() == std::optional<std::string>("about-us"));
    REQUIRE(view.hasField("tags"));
    REQUIRE_FALSE(view.hasField("missing"));

    SECTION("broken YAML gives an invalid view")
    {
        const auto broken = HeaderView::load("title: [unclosed");
        REQUIRE_FALSE(broken.valid());
        REQUIRE_FALSE(broken.stringField("title").has_value());
    }
}

TEST_CASE("HeaderView reads the translate marker", "[content][frontmatter]")
{
    auto target = [](const std::string& header) { return HeaderView::load(header).translateTo("_translateTo"); };

    const auto list = target("_translateTo: [ru, de, ru]");
    REQUIRE(list.kind == TranslateTarget::Kind::Locales);
    REQUIRE(list.locales == std::vector<std::string>{ "ru", "de" });

    REQUIRE(target("_translateTo: all").kind == TranslateTarget::Kind::All);

    const auto single = target("_translateTo: ja");
    REQUIRE(single.kind == TranslateTarget::Kind::Locales);
    REQUIRE(single.locales == std::vector<std::string>{ "ja" });

    REQUIRE(target("_translateTo: false").kind == TranslateTarget::Kind::Disabled);
    REQUIRE(target("_translateTo:").kind == TranslateTarget::Kind::Disabled);
    REQUIRE(target("title: A").kind == TranslateTarget::Kind::Disabled);
}

TEST_CASE("HeaderView reads alternates", "[content][frontmatter]")
{
    const auto entries = HeaderView::load("alternates:\n  en: ''\n  ru: /ru/x\n  de:\n").alternates("alternates");
    REQUIRE(entries.has_value());
    REQUIRE(*entries == StringPairs{ { "en", "" }, { "ru", "/ru/x" }, { "de", "" } });

    const auto null_value = HeaderView::load("alternates:\ntitle: A").alternates("alternates");
    REQUIRE(null_value.has_value());
    REQUIRE(null_value->empty());

    REQUIRE_FALSE(HeaderView::load("alternates: nope").alternates("alternates").has_value());
    REQUIRE_FALSE(HeaderView::load("summary: note: colon\nalternates:\n  en: about").alternates("alternates").has_value());

    REQUIRE_FALSE(HeaderView::load("title: A").alternates("alternates").has_value());
}
