#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <ctime>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_reports;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);

    std::string log_msg = "[" + CategoryToString(category) + "] " + user_message;
    if (!technical_details.empty())
        log_msg += " | Details: " + technical_details;

    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << log_msg;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << log_msg;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << log_msg;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << log_msg;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_reports.size() >= MAX_KEPT_REPORTS)
    {
        // Drop the oldest report of the lowest severity present.
        auto victim = std::min_element(s_reports.begin(), s_reports.end(),
                                       [](const ErrorReport& a, const ErrorReport& b)
                                       { return a.severity < b.severity; });
        s_reports.erase(victim);
    }
    s_reports.push_back(std::move(report));
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

std::vector<ErrorReport> ErrorReporter::TakeReports(ErrorSeverity min_severity)
{
    std::vector<ErrorReport> all;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        all.swap(s_reports);
    }

    std::vector<ErrorReport> kept;
    for (auto& report : all)
    {
        if (report.severity >= min_severity)
            kept.push_back(std::move(report));
    }
    return kept;
}

std::size_t ErrorReporter::CountAtLeast(ErrorSeverity min_severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return static_cast<std::size_t>(std::count_if(s_reports.begin(), s_reports.end(),
                                                  [min_severity](const ErrorReport& r)
                                                  { return r.severity >= min_severity; }));
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_reports.clear();
}

std::string ErrorReporter::FormatLine(const ErrorReport& report)
{
    std::string line = "[" + CategoryToString(report.category) + "] " + report.user_message;
    if (!report.technical_details.empty())
        line += " (" + report.technical_details + ")";
    return line;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Storage:
        return "Storage";
    case ErrorCategory::Translation:
        return "Translation";
    case ErrorCategory::Synchronization:
        return "Alternates";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char buf[32] = {};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

} // namespace utils
