#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,  // logging, startup
    Configuration,   // TOML parsing, invalid config, missing credentials
    Storage,         // reading or writing documents
    Translation,     // translation service failures
    Synchronization, // alternates propagation
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the run continues
    Fatal    // Critical error, run should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Non-technical, actionable message for users
    std::string technical_details; // Technical details for logs
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);

    bool isFatal() const { return severity == ErrorSeverity::Fatal; }
};

/**
 * @brief Thread-safe error reporter
 *
 * Every report is logged through plog and kept until the end of the run,
 * where the CLI prints the ones that need the user's attention. Translator
 * worker threads report from off the main thread, hence the lock.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Storage,
 *                              "Failed to write translation",
 *                              "Path: ru/about.md");
 *
 *   // After the run:
 *   for (const auto& e : ErrorReporter::TakeReports(ErrorSeverity::Error)) { ... }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message User-friendly message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    /**
     * @brief Remove and return the kept reports at or above `min_severity`
     *
     * Reports below the threshold are discarded as well.
     */
    static std::vector<ErrorReport> TakeReports(ErrorSeverity min_severity = ErrorSeverity::Info);

    static std::size_t CountAtLeast(ErrorSeverity min_severity);

    static void ClearErrors();

    // "[Alternates] Failed to update alternates (Path: de/about.md)"
    static std::string FormatLine(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);

    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_reports;
    static constexpr std::size_t MAX_KEPT_REPORTS = 500;
};

} // namespace utils
