#include <catch2/catch_test_macros.hpp>
#include "content/HeaderParser.hpp"

using namespace content;

TEST_CASE("HeaderParser classifies every line", "[content][parser]")
{
    const std::string header = "title: Hello\n"
                               "# note\n"
                               "\n"
                               "tags:\n"
                               "  - a\n"
                               "not a field line\n"
                               "  # indented comment\n"
                               "  nested: value\n"
                               "empty:";

    const auto lines = HeaderParser::parse(header);
    REQUIRE(lines.size() == 9);

    const auto* title = asField(lines[0]);
    REQUIRE(title != nullptr);
    REQUIRE(title->key == "title");
    REQUIRE(title->value == "Hello");

    REQUIRE(std::holds_alternative<CommentLine>(lines[1]));
    REQUIRE(std::holds_alternative<BlankLine>(lines[2]));
    REQUIRE(asField(lines[3]) != nullptr);

    const auto* item = std::get_if<ContinuationLine>(&lines[4]);
    REQUIRE(item != nullptr);
    REQUIRE(item->indent == 2);

    // Malformed lines degrade to continuations.
    const auto* loose = std::get_if<ContinuationLine>(&lines[5]);
    REQUIRE(loose != nullptr);
    REQUIRE(loose->indent == 0);

    REQUIRE(std::holds_alternative<CommentLine>(lines[6]));

    // Only zero-indent lines are fields.
    REQUIRE(isContinuation(lines[7]));

    const auto* empty = asField(lines[8]);
    REQUIRE(empty != nullptr);
    REQUIRE(empty->key == "empty");
    REQUIRE(empty->value.empty());
}

TEST_CASE("HeaderParser keeps values containing colons whole", "[content][parser]")
{
    const auto lines = HeaderParser::parse("url: https://example.com/a:b");
    const auto* field = asField(lines[0]);
    REQUIRE(field != nullptr);
    REQUIRE(field->key == "url");
    REQUIRE(field->value == "https://example.com/a:b");
}

TEST_CASE("HeaderParser join reproduces the input", "[content][parser]")
{
    SECTION("LF")
    {
        const std::string header = "a: 1\n\n# c\n  - x\nb: 2";
        REQUIRE(HeaderParser::join(HeaderParser::parse(header)) == header);
    }

    SECTION("CRLF lines keep their carriage return")
    {
        const std::string header = "a: 1\r\n  \r\nb: 2\r";
        const auto lines = HeaderParser::parse(header);
        REQUIRE(asField(lines[0]) != nullptr);
        REQUIRE(asField(lines[0])->value == "1");
        REQUIRE(std::holds_alternative<BlankLine>(lines[1]));
        REQUIRE(HeaderParser::join(lines) == header);
    }
}

TEST_CASE("HeaderParser hasField only sees top-level keys", "[content][parser]")
{
    const auto lines = HeaderParser::parse("alternates:\n  en: about\ntitle: x");
    REQUIRE(HeaderParser::hasField(lines, "alternates"));
    REQUIRE(HeaderParser::hasField(lines, "title"));
    REQUIRE_FALSE(HeaderParser::hasField(lines, "en"));
}
