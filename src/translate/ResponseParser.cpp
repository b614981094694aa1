#include "ResponseParser.hpp"

#include <algorithm>
#include <cctype>

namespace translate
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string toUpper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true)
    {
        const auto nl = text.find('\n', start);
        if (nl == std::string::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

bool isRequested(const std::vector<std::string>& requested, const std::string& key)
{
    return std::find(requested.begin(), requested.end(), key) != requested.end();
}

} // namespace

void ResponseParser::assign(ParsedTranslation& out, const std::string& key, const std::string& value)
{
    for (auto& entry : out.fields)
    {
        if (entry.first == key)
        {
            entry.second = value;
            return;
        }
    }
    out.fields.emplace_back(key, value);
}

ParsedTranslation ResponseParser::parse(const std::string& response, const std::vector<std::string>& requested)
{
    ParsedTranslation out;
    const auto lines = splitLines(trim(response));
    std::size_t content_start = 0;

    auto field_of = [&](const std::string& line, std::string& key, std::string& value)
    {
        const auto colon = line.find(':');
        if (colon == std::string::npos)
            return false;
        key = toLower(trim(line.substr(0, colon)));
        value = trim(line.substr(colon + 1));
        return true;
    };

    if (!lines.empty() && toUpper(lines[0]).find("FRONTMATTER") != std::string::npos)
    {
        content_start = 1;
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            const std::string line = trim(lines[i]);
            const bool content_marker = toUpper(line) == "CONTENT:";
            if (content_marker || (!line.empty() && line[0] == '#'))
            {
                content_start = content_marker ? i + 1 : i;
                break;
            }
            std::string key, value;
            if (field_of(line, key, value) && isRequested(requested, key))
                assign(out, key, value);
        }
    }
    else
    {
        const std::size_t limit = std::min<std::size_t>(lines.size(), 5);
        for (std::size_t i = 0; i < limit; ++i)
        {
            const std::string line = trim(lines[i]);
            if (line.empty() || line[0] == '#')
            {
                content_start = i;
                if (line.empty() && i + 1 < lines.size() && !lines[i + 1].empty() && lines[i + 1][0] == '#')
                    content_start = i + 1;
                break;
            }
            std::string key, value;
            if (field_of(line, key, value) && isRequested(requested, key))
            {
                assign(out, key, value);
                content_start = i + 1;
            }
        }
    }

    while (content_start < lines.size() && trim(lines[content_start]).empty())
        ++content_start;

    std::string body;
    for (std::size_t i = content_start; i < lines.size(); ++i)
    {
        if (i > content_start)
            body += '\n';
        body += lines[i];
    }
    out.body = trim(body);
    return out;
}

} // namespace translate
