#pragma once

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace pipeline
{

struct TranslateOptions
{
    std::string file; // substring of the relative path or the file name; empty = all
    bool dry_run = false;
    bool force = false;
    const std::atomic<bool>* cancel_flag = nullptr;
};

struct TranslationResult
{
    enum class Status
    {
        Created,
        Skipped,
        Failed,
        Planned
    };

    std::string source;
    std::string target;
    std::string locale;
    Status status = Status::Skipped;
    std::string reason; // why a unit was skipped
    std::string error;  // why a unit failed
    std::vector<std::string> alternates_updated;
};

struct LocaleStatus
{
    enum class State
    {
        Ai,
        Exists,
        Pending
    };

    std::string locale;
    State state = State::Pending;
    std::string path; // where the variant was found, empty when pending
};

struct StatusRow
{
    std::string source;
    std::vector<LocaleStatus> locales;
};

// Raised before any unit runs when the run cannot start at all.
class PreconditionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

inline const char* toString(TranslationResult::Status status)
{
    switch (status)
    {
    case TranslationResult::Status::Created:
        return "created";
    case TranslationResult::Status::Skipped:
        return "skipped";
    case TranslationResult::Status::Failed:
        return "failed";
    case TranslationResult::Status::Planned:
        return "planned";
    }
    return "unknown";
}

inline const char* toString(LocaleStatus::State state)
{
    switch (state)
    {
    case LocaleStatus::State::Ai:
        return "ai";
    case LocaleStatus::State::Exists:
        return "exists";
    case LocaleStatus::State::Pending:
        return "pending";
    }
    return "unknown";
}

} // namespace pipeline
