#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"

namespace
{

bool parse(std::vector<std::string> args, Application::Options& out, std::string& error)
{
    return Application::parseCommandLineArgs(args, out, error);
}

} // namespace

TEST_CASE("Command line defaults", "[app][cli]")
{
    Application::Options options;
    std::string error;
    REQUIRE(parse({}, options, error));
    REQUIRE(options.file.empty());
    REQUIRE(options.config_path == "pagelingo.toml");
    REQUIRE_FALSE(options.status);
    REQUIRE_FALSE(options.dry_run);
    REQUIRE_FALSE(options.force);
}

TEST_CASE("Command line flags and file filter", "[app][cli]")
{
    Application::Options options;
    std::string error;

    SECTION("long forms")
    {
        REQUIRE(parse({ "about.md", "--dry-run", "--force", "--verbose", "--config", "site.toml" }, options, error));
        REQUIRE(options.file == "about.md");
        REQUIRE(options.dry_run);
        REQUIRE(options.force);
        REQUIRE(options.verbose);
        REQUIRE(options.config_path == "site.toml");
    }

    SECTION("short forms")
    {
        REQUIRE(parse({ "-s", "-n", "-f", "-v" }, options, error));
        REQUIRE(options.status);
        REQUIRE(options.dry_run);
        REQUIRE(options.force);
        REQUIRE(options.verbose);
    }

    SECTION("help and version")
    {
        REQUIRE(parse({ "--help", "--version" }, options, error));
        REQUIRE(options.show_help);
        REQUIRE(options.show_version);
    }
}

TEST_CASE("Command line errors", "[app][cli]")
{
    Application::Options options;
    std::string error;

    SECTION("unknown option")
    {
        REQUIRE_FALSE(parse({ "--bogus" }, options, error));
        REQUIRE(error == "unknown option: --bogus");
    }

    SECTION("missing config path")
    {
        REQUIRE_FALSE(parse({ "--config" }, options, error));
        REQUIRE(error == "--config requires a path");
    }

    SECTION("two file filters")
    {
        REQUIRE_FALSE(parse({ "a.md", "b.md" }, options, error));
        REQUIRE(error == "only one file filter may be given");
    }
}

TEST_CASE("Application exits early for help and bad usage", "[app][cli]")
{
    char prog[] = "pagelingo";
    char help[] = "--help";
    char bogus[] = "--bogus";

    char* help_argv[] = { prog, help, nullptr };
    REQUIRE(Application(2, help_argv).run() == 0);

    char* bogus_argv[] = { prog, bogus, nullptr };
    REQUIRE(Application(2, bogus_argv).run() == 1);
}
