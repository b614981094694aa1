#pragma once

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace translate
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 45000;
    std::atomic<bool>* cancel_flag = nullptr;

    // Optional adaptive timeout based on text length
    bool use_adaptive_timeout = true;
    std::size_t text_length_hint = 0; // Set this for adaptive timeout calculation
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    double retry_after_seconds = 0.0; // from a delta-seconds Retry-After header, 0 when absent

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// JSON POST helper
HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

// Parses the delta-seconds form of Retry-After. HTTP-date values and garbage yield 0.
double parse_retry_after(const std::string& value);

} // namespace translate
