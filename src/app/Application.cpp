#include "Application.hpp"

#include "../config/ConfigManager.hpp"
#include "../content/FileDocumentStore.hpp"
#include "../pipeline/TranslationPipeline.hpp"
#include "../translate/ITranslator.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef PAGELINGO_VERSION_STRING
#define PAGELINGO_VERSION_STRING "0.0.0"
#endif

namespace
{

std::atomic<bool> g_cancel_requested{ false };

void handleInterrupt(int)
{
    g_cancel_requested.store(true);
}

} // namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application()
{
    cleanup();
}

bool Application::parseCommandLineArgs(const std::vector<std::string>& args, Options& out, std::string& error)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const char* arg = args[i].c_str();
        if (std::strcmp(arg, "--status") == 0 || std::strcmp(arg, "-s") == 0)
            out.status = true;
        else if (std::strcmp(arg, "--dry-run") == 0 || std::strcmp(arg, "-n") == 0)
            out.dry_run = true;
        else if (std::strcmp(arg, "--force") == 0 || std::strcmp(arg, "-f") == 0)
            out.force = true;
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
            out.verbose = true;
        else if (std::strcmp(arg, "--version") == 0)
            out.show_version = true;
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
            out.show_help = true;
        else if (std::strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= args.size())
            {
                error = "--config requires a path";
                return false;
            }
            out.config_path = args[++i];
        }
        else if (arg[0] == '-')
        {
            error = std::string("unknown option: ") + arg;
            return false;
        }
        else if (out.file.empty())
            out.file = args[i];
        else
        {
            error = "only one file filter may be given";
            return false;
        }
    }
    return true;
}

int Application::run()
{
    std::string error;
    if (!parseCommandLineArgs(args_, options_, error))
    {
        std::cerr << "pagelingo: " << error << "\n\n";
        printUsage();
        return 1;
    }

    if (options_.show_help)
    {
        printUsage();
        return 0;
    }
    if (options_.show_version)
    {
        std::cout << "pagelingo " << PAGELINGO_VERSION_STRING << "\n";
        return 0;
    }

    if (!initialize())
        return 1;

    installSignalHandlers();

    int code = options_.status ? runStatus() : runTranslate();
    cleanup();
    return code;
}

void Application::requestExit()
{
    g_cancel_requested.store(true);
}

bool Application::initialize()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    if (!config_->load())
    {
        std::cerr << "Configuration error: " << config_->lastError() << "\n";
        return false;
    }

    if (!initializeLogging())
        return false;

    const auto& site = config_->site();
    const auto content_root = std::filesystem::path(site.root) / site.content_dir;
    store_ = std::make_unique<content::FileDocumentStore>(content_root);
    PLOG_INFO << "pagelingo " << PAGELINGO_VERSION_STRING << ": content " << content_root.generic_string()
              << ", locales " << site.locales.size() << ", default " << site.default_locale;
    return true;
}

bool Application::initializeLogging()
{
    const auto& site = config_->site();
    if (!utils::LogManager::Initialize(site))
    {
        std::cerr << "Failed to initialize logging system\n";
        return false;
    }

    if (options_.verbose)
    {
        utils::LogManager::SetDefaultLogLevel(plog::debug);
        utils::Diagnostics::SetVerbose(true);
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = site.log_file,
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = site.log_console });
}

void Application::installSignalHandlers()
{
    g_cancel_requested.store(false);
    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);
}

int Application::runStatus()
{
    const auto& site = config_->site();
    pipeline::TranslationPipeline runner(site, *store_, nullptr);
    const auto rows = runner.status();

    std::cout << "\nLocales: ";
    for (std::size_t i = 0; i < site.locales.size(); ++i)
        std::cout << (i ? ", " : "") << site.locales[i];
    std::cout << "\nDefault: " << site.default_locale << "\n\n";

    printStatus(rows);
    return 0;
}

int Application::runTranslate()
{
    const auto& site = config_->site();

    if (!options_.dry_run && !site.api_key.empty())
    {
        translate::Backend backend = translate::Backend::OpenAI;
        if (!translate::backendFromString(site.backend, backend))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown translator backend, using OpenAI", site.backend);
        }
        translator_ = translate::createTranslator(backend);
        if (translator_ && !translator_->init(translate::BackendConfig::from(site)))
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                              "Failed to initialize translator", translator_->lastError());
        }
    }

    pipeline::TranslateOptions options;
    options.file = options_.file;
    options.dry_run = options_.dry_run;
    options.force = options_.force;
    options.cancel_flag = &g_cancel_requested;

    pipeline::TranslationPipeline runner(site, *store_, translator_.get());
    std::vector<pipeline::TranslationResult> results;
    try
    {
        results = runner.translate(options);
    }
    catch (const pipeline::PreconditionError& e)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Cannot start translation",
                                          e.what());
        std::cerr << "\n" << e.what() << "\n";
        return 1;
    }

    printSummary(results);
    return 0;
}

void Application::printUsage() const
{
    std::cout << "Usage: pagelingo [file] [options]\n"
                 "\n"
                 "Translates Markdown pages marked with _translateTo into the configured locales.\n"
                 "\n"
                 "Options:\n"
                 "  -s, --status        Show translation status per page and locale\n"
                 "  -n, --dry-run       Show what would be translated without calling the API\n"
                 "  -f, --force         Overwrite existing translations\n"
                 "      --config PATH   Configuration file (default: pagelingo.toml)\n"
                 "  -v, --verbose       Debug logging\n"
                 "      --version       Print version\n"
                 "  -h, --help          Show this help\n"
                 "\n"
                 "Arguments:\n"
                 "  file                Only process pages whose path or name contains this text\n";
}

void Application::printStatus(const std::vector<pipeline::StatusRow>& rows) const
{
    if (rows.empty())
    {
        std::cout << "No files marked for translation.\n\n"
                     "To translate a file, add _translateTo to its frontmatter:\n"
                     "  _translateTo: [ja, de]\n";
        return;
    }

    for (const auto& row : rows)
    {
        std::cout << row.source << " -> ";
        for (std::size_t i = 0; i < row.locales.size(); ++i)
        {
            const auto& entry = row.locales[i];
            std::cout << (i ? ", " : "") << entry.locale << ":" << pipeline::toString(entry.state);
        }
        std::cout << "\n";
    }
}

void Application::printSummary(const std::vector<pipeline::TranslationResult>& results) const
{
    using Status = pipeline::TranslationResult::Status;
    std::size_t created = 0, skipped = 0, failed = 0, planned = 0;
    std::vector<std::string> updated;
    for (const auto& r : results)
    {
        switch (r.status)
        {
        case Status::Created:
            ++created;
            break;
        case Status::Skipped:
            ++skipped;
            break;
        case Status::Failed:
            ++failed;
            break;
        case Status::Planned:
            ++planned;
            break;
        }
        for (const auto& path : r.alternates_updated)
        {
            if (std::find(updated.begin(), updated.end(), path) == updated.end())
                updated.push_back(path);
        }
    }

    std::cout << "\nDone: " << created << " created, " << skipped << " skipped, " << failed << " failed";
    if (planned > 0)
        std::cout << ", " << planned << " planned";
    std::cout << "\n";

    for (const auto& r : results)
    {
        if (r.status == Status::Failed)
            std::cout << "  failed: " << r.target << ": " << r.error << "\n";
    }
    if (!updated.empty())
    {
        std::cout << "Alternates updated:\n";
        for (const auto& path : updated)
            std::cout << "  " << path << "\n";
    }

    const auto problems = utils::ErrorReporter::TakeReports(utils::ErrorSeverity::Error);
    if (!problems.empty())
    {
        std::cout << "Problems:\n";
        for (const auto& report : problems)
            std::cout << "  " << utils::ErrorReporter::FormatLine(report) << "\n";
    }
}

void Application::cleanup()
{
    if (translator_)
    {
        translator_->shutdown();
        translator_.reset();
    }
    store_.reset();
}
