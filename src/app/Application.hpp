#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

class ConfigManager;

namespace content
{
class FileDocumentStore;
}

namespace translate
{
class ITranslator;
}

namespace pipeline
{
struct TranslationResult;
struct StatusRow;
} // namespace pipeline

class Application
{
public:
    struct Options
    {
        std::string file;
        std::string config_path = "pagelingo.toml";
        bool status = false;
        bool dry_run = false;
        bool force = false;
        bool verbose = false;
        bool show_version = false;
        bool show_help = false;
    };

    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

    // Returns false and sets `error` on an unknown flag or a missing value.
    static bool parseCommandLineArgs(const std::vector<std::string>& args, Options& out, std::string& error);

private:
    bool initialize();
    bool initializeLogging();
    void installSignalHandlers();

    int runStatus();
    int runTranslate();

    void printUsage() const;
    void printStatus(const std::vector<pipeline::StatusRow>& rows) const;
    void printSummary(const std::vector<pipeline::TranslationResult>& results) const;
    void cleanup();

    std::vector<std::string> args_;
    Options options_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<content::FileDocumentStore> store_;
    std::unique_ptr<translate::ITranslator> translator_;
};
