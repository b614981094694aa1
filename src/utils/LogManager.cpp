#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../config/SiteConfig.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/MessageOnlyFormatter.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const SiteConfig& config)
{
    if (s_initialized)
        return true;

    s_append_logs = config.log_append;
    if (config.log_level >= 0 && config.log_level <= 6)
    {
        s_default_level = static_cast<plog::Severity>(config.log_level);
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        plog::Severity level = config.level_override.value_or(s_default_level);
        plog::IAppender* first_appender = nullptr;

        if (!config.filepath.empty() && PrepareLogDirectory(config.filepath))
        {
            bool append = config.append_override.value_or(s_append_logs);
            if (!append)
            {
                std::ofstream(config.filepath, std::ios::trunc).close();
            }

            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, config.backup_count);
            first_appender = file_appender.get();
            s_appenders.push_back(std::move(file_appender));
        }

        std::unique_ptr<plog::IAppender> console_appender;
        if (config.add_console_appender)
        {
            console_appender = std::make_unique<plog::ConsoleAppender<plog::MessageOnlyFormatter>>(plog::streamStdErr);
        }

        if (!first_appender && !console_appender)
        {
            return false;
        }

        if (first_appender)
        {
            plog::init<InstanceId>(level, first_appender);
            if (console_appender)
            {
                if (auto logger = plog::get<InstanceId>())
                {
                    logger->addAppender(console_appender.get());
                }
            }
        }
        else
        {
            plog::init<InstanceId>(level, console_appender.get());
        }

        if (console_appender)
        {
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::SetDefaultLogLevel(plog::Severity level)
{
    s_default_level = level;
    if (auto logger = plog::get<0>())
    {
        logger->setMaxSeverity(level);
    }
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
        return false;
    }
    return true;
}

} // namespace utils
