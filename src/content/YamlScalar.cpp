#include "YamlScalar.hpp"

#include <cctype>

namespace content
{
namespace yaml
{

namespace
{

std::string toLower(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool looksLikeNumber(const std::string& s)
{
    std::size_t i = 0;
    if (s[0] == '+' || s[0] == '-')
        i = 1;
    if (i >= s.size())
        return false;
    if (s.compare(i, std::string::npos, ".inf") == 0 || s.compare(i, std::string::npos, ".Inf") == 0)
        return true;
    if (s == ".nan" || s == ".NaN")
        return true;

    bool any_digit = false;
    bool dot = false;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c >= '0' && c <= '9')
        {
            any_digit = true;
            continue;
        }
        if (c == '.' && !dot)
        {
            dot = true;
            continue;
        }
        if ((c == 'e' || c == 'E' || c == 'x' || c == 'o' || c == '_') && any_digit)
            continue;
        return false;
    }
    return any_digit;
}

bool looksLikeBoolOrNull(const std::string& s)
{
    const std::string t = toLower(s);
    return t == "true" || t == "false" || t == "yes" || t == "no" || t == "on" || t == "off" || t == "y" ||
           t == "n" || t == "null" || t == "~";
}

} // namespace

bool isAbsoluteUrl(const std::string& value)
{
    return value.compare(0, 7, "http://") == 0 || value.compare(0, 8, "https://") == 0;
}

bool needsQuotes(const std::string& value)
{
    if (value.empty())
        return true;

    if (std::isspace(static_cast<unsigned char>(value.front())) ||
        std::isspace(static_cast<unsigned char>(value.back())))
        return true;

    for (char c : value)
    {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F)
            return true;
    }

    static const std::string indicators = "-?:,[]{}#&*!|>'\"%@`";
    if (indicators.find(value.front()) != std::string::npos)
        return true;

    if (value.find(": ") != std::string::npos || value.find(" #") != std::string::npos)
        return true;
    if (value.back() == ':')
        return true;

    return looksLikeNumber(value) || looksLikeBoolOrNull(value);
}

std::string quote(const std::string& value)
{
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value)
    {
        switch (c)
        {
        case '\\':
            out += "\\\\";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    out.push_back('"');
    return out;
}

std::string renderScalar(const std::string& value)
{
    return needsQuotes(value) ? quote(value) : value;
}

std::vector<std::string> renderScalarField(const std::string& key, const std::string& value)
{
    if (value.find('\n') == std::string::npos)
        return { key + ": " + renderScalar(value) };

    std::vector<std::string> value_lines;
    std::size_t start = 0;
    while (start <= value.size())
    {
        auto end = value.find('\n', start);
        if (end == std::string::npos)
            end = value.size();
        std::string line = value.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        value_lines.push_back(std::move(line));
        start = end + 1;
    }
    // `>-` strips the final line break, trailing empty lines carry nothing.
    while (!value_lines.empty() && value_lines.back().empty())
        value_lines.pop_back();

    std::vector<std::string> lines;
    lines.push_back(key + ": >-");
    for (const auto& line : value_lines)
        lines.push_back(line.empty() ? std::string() : std::string(kIndent) + line);
    return lines;
}

std::vector<std::string> renderMapField(const std::string& key, const StringPairs& entries)
{
    std::vector<std::string> lines;
    if (entries.empty())
    {
        lines.push_back(key + ": {}");
        return lines;
    }

    lines.push_back(key + ":");
    for (const auto& [sub_key, sub_value] : entries)
    {
        const std::string rendered =
            (sub_value.empty() || isAbsoluteUrl(sub_value)) ? quote(sub_value) : renderScalar(sub_value);
        const std::string rendered_key = needsQuotes(sub_key) ? quote(sub_key) : sub_key;
        lines.push_back(std::string(kIndent) + rendered_key + ": " + rendered);
    }
    return lines;
}

} // namespace yaml
} // namespace content
