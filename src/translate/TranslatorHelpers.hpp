#pragma once
#include <string>
#include <cstddef>

namespace translate
{
namespace helpers
{

// Backend-specific text length limits (in bytes)
struct LengthLimits
{
    // Whole documents go out in one request; stay well inside a 128k-token context.
    static constexpr std::size_t OPENAI_API_MAX = 200000;
};

constexpr int kMaxTimeoutMs = 10 * 60 * 1000;

// Calculate adaptive timeout based on text length
// base_timeout_ms: minimum timeout
// text_length: byte count
// Returns: timeout in milliseconds, capped at kMaxTimeoutMs
inline int calculate_adaptive_timeout(int base_timeout_ms, std::size_t text_length)
{
    // Add 1 second per 100 bytes; output is roughly as long as the input
    const std::size_t extra_ms = (text_length / 100) * 1000;
    const std::size_t total = static_cast<std::size_t>(base_timeout_ms) + extra_ms;
    return total > static_cast<std::size_t>(kMaxTimeoutMs) ? kMaxTimeoutMs : static_cast<int>(total);
}

// Check if text length is within limits
struct LengthCheckResult
{
    bool ok;
    std::string error_message;
    std::size_t text_length;
    std::size_t byte_size;
};

inline LengthCheckResult check_text_length(const std::string& text, std::size_t max_length, const char* backend_name)
{
    LengthCheckResult result;
    result.text_length = text.size();
    result.byte_size = text.length();

    if (text.empty())
    {
        result.ok = false;
        result.error_message = "Empty text";
        return result;
    }

    if (result.byte_size > max_length)
    {
        result.ok = false;
        result.error_message = std::string(backend_name) + " text too long: " + std::to_string(result.byte_size) +
                               " bytes (limit: " + std::to_string(max_length) + " bytes). " +
                               "Consider splitting the document.";
        return result;
    }

    result.ok = true;
    return result;
}

// Categorize HTTP errors
enum class HttpErrorType
{
    Success,
    Timeout,
    PayloadTooLarge,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        // Network/transport errors
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
    {
        return HttpErrorType::Success;
    }

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 413: // Payload Too Large
        return HttpErrorType::PayloadTooLarge;
    case 400:
    case 401:
    case 403:
    case 404:
    case 429:
        return HttpErrorType::ClientError;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        return HttpErrorType::Other;
    }
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        return "Request timeout - document may be too long to translate in time.";
    case HttpErrorType::PayloadTooLarge:
        return "HTTP 413 Payload Too Large - document exceeds API limits.";
    case HttpErrorType::NetworkError:
        return "Network error: " + text_snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    default:
        return "HTTP " + std::to_string(status_code) + ": " + text_snippet;
    }
}

} // namespace helpers
} // namespace translate
