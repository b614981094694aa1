#include "../utils/HttpCommon.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace
{

bool iequals(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

void apply_session_config(cpr::Session& session, const translate::SessionConfig& cfg)
{
    session.SetConnectTimeout(cpr::ConnectTimeout{cfg.connect_timeout_ms});
    session.SetTimeout(cpr::Timeout{cfg.timeout_ms});
    if (!cfg.cancel_flag)
        return;

    // Returning false from the progress callback aborts the transfer; keep going while the flag is set.
    session.SetProgressCallback(cpr::ProgressCallback(
        [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
        {
            auto* flag = reinterpret_cast<std::atomic<bool>*>(userdata);
            return flag && flag->load();
        },
        reinterpret_cast<intptr_t>(cfg.cancel_flag)));
}

cpr::Header to_cpr_header(const std::vector<translate::Header>& headers, bool json_body)
{
    cpr::Header out;
    bool has_content_type = false;
    for (const auto& h : headers)
    {
        if (iequals(h.name, "Content-Type"))
            has_content_type = true;
        out.emplace(h.name, h.value);
    }
    if (json_body && !has_content_type)
        out.emplace("Content-Type", "application/json");
    return out;
}

translate::HttpResponse to_response(cpr::Response&& r)
{
    translate::HttpResponse out;
    if (r.error)
    {
        out.error = r.error.message;
        return out;
    }
    out.status_code = static_cast<int>(r.status_code);
    out.text = std::move(r.text);
    for (const auto& [name, value] : r.header)
    {
        if (iequals(name, "Retry-After"))
        {
            out.retry_after_seconds = translate::parse_retry_after(value);
            break;
        }
    }
    return out;
}

} // namespace

namespace translate
{

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetHeader(to_cpr_header(headers, true));
    session.SetBody(cpr::Body{body});
    apply_session_config(session, cfg);
    return to_response(session.Post());
}

double parse_retry_after(const std::string& value)
{
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return 0.0;
    auto end = value.find_last_not_of(" \t");
    const std::string trimmed = value.substr(begin, end - begin + 1);
    if (!std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        return 0.0;
    // Cap absurd values; the retry loop sleeps on this.
    const long seconds = std::strtol(trimmed.c_str(), nullptr, 10);
    return static_cast<double>(std::min(seconds, 600L));
}

} // namespace translate
