#include "HeaderParser.hpp"

#include <regex>

namespace content
{

namespace
{

const std::regex& fieldPattern()
{
    static const std::regex pattern(R"(^([A-Za-z_][A-Za-z0-9_\-]*):(?:[ \t]+(.*?))?[ \t]*$)",
                                    std::regex_constants::ECMAScript);
    return pattern;
}

std::string stripCarriageReturn(const std::string& s)
{
    if (!s.empty() && s.back() == '\r')
        return s.substr(0, s.size() - 1);
    return s;
}

std::size_t leadingWhitespace(const std::string& s)
{
    std::size_t n = 0;
    while (n < s.size() && (s[n] == ' ' || s[n] == '\t'))
        ++n;
    return n;
}

} // namespace

HeaderLines HeaderParser::parse(const std::string& header_text)
{
    HeaderLines lines;
    std::size_t start = 0;
    while (true)
    {
        const auto nl = header_text.find('\n', start);
        if (nl == std::string::npos)
        {
            lines.push_back(classify(header_text.substr(start)));
            break;
        }
        lines.push_back(classify(header_text.substr(start, nl - start)));
        start = nl + 1;
    }
    return lines;
}

std::string HeaderParser::join(const HeaderLines& lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i)
            out.push_back('\n');
        out += rawText(lines[i]);
    }
    return out;
}

bool HeaderParser::hasField(const HeaderLines& lines, const std::string& key)
{
    for (const auto& line : lines)
    {
        const auto* field = asField(line);
        if (field && field->key == key)
            return true;
    }
    return false;
}

HeaderLine HeaderParser::classify(const std::string& raw)
{
    const std::string line = stripCarriageReturn(raw);
    const std::size_t indent = leadingWhitespace(line);

    if (indent == line.size())
        return BlankLine{ raw };

    if (line[indent] == '#')
        return CommentLine{ raw };

    if (indent == 0)
    {
        std::smatch m;
        if (std::regex_match(line, m, fieldPattern()))
            return FieldLine{ raw, m[1].str(), m[2].matched ? m[2].str() : std::string() };
    }

    return ContinuationLine{ raw, indent };
}

} // namespace content
