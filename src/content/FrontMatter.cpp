#include "FrontMatter.hpp"

#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace content
{

namespace
{

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

bool isDelimiterLine(const std::string& text, std::size_t begin, std::size_t end)
{
    std::size_t len = end - begin;
    if (len > 0 && text[begin + len - 1] == '\r')
        --len;
    return len == 3 && text.compare(begin, 3, kDelimiter) == 0;
}

bool isPlainFalse(const YAML::Node& node)
{
    if (!node.IsScalar() || node.Tag() == "!")
        return false;
    const std::string& s = node.Scalar();
    return s == "false" || s == "False" || s == "FALSE";
}

bool isPlainBool(const YAML::Node& node)
{
    if (!node.IsScalar() || node.Tag() == "!")
        return false;
    const std::string& s = node.Scalar();
    return isPlainFalse(node) || s == "true" || s == "True" || s == "TRUE";
}

void addUnique(std::vector<std::string>& out, const std::string& value)
{
    if (!value.empty() && std::find(out.begin(), out.end(), value) == out.end())
        out.push_back(value);
}

} // namespace

std::optional<FrontMatter> FrontMatter::split(const std::string& document)
{
    std::size_t pos = 0;
    if (document.compare(0, 3, kUtf8Bom) == 0)
        pos = 3;

    const auto first_nl = document.find('\n', pos);
    if (first_nl == std::string::npos || !isDelimiterLine(document, pos, first_nl))
        return std::nullopt;

    FrontMatter fm;
    fm.open = document.substr(0, first_nl + 1);

    const std::size_t header_begin = first_nl + 1;
    std::size_t line_begin = header_begin;
    while (line_begin <= document.size())
    {
        auto line_end = document.find('\n', line_begin);
        const bool last_line = line_end == std::string::npos;
        if (last_line)
            line_end = document.size();

        if (isDelimiterLine(document, line_begin, line_end))
        {
            if (line_begin > header_begin)
            {
                fm.has_header_lines = true;
                fm.header = document.substr(header_begin, line_begin - 1 - header_begin);
            }
            const std::size_t close_end = last_line ? line_end : line_end + 1;
            fm.close = document.substr(line_begin, close_end - line_begin);
            fm.body = document.substr(close_end);
            return fm;
        }

        if (last_line)
            break;
        line_begin = line_end + 1;
    }

    return std::nullopt;
}

bool FrontMatter::hasHeader(const std::string& document)
{
    return split(document).has_value();
}

std::string FrontMatter::compose(const std::string& header, const std::string& body)
{
    std::string out;
    out.reserve(header.size() + body.size() + 16);
    out += kDelimiter;
    out += "\n";
    out += header;
    out += "\n";
    out += kDelimiter;
    out += "\n\n";
    out += body;
    if (out.empty() || out.back() != '\n')
        out += "\n";
    return out;
}

std::string FrontMatter::join() const
{
    std::string out = open;
    if (has_header_lines)
    {
        out += header;
        out += "\n";
    }
    out += close;
    out += body;
    return out;
}

HeaderView HeaderView::load(const std::string& header_text)
{
    HeaderView view;
    try
    {
        view.root_ = YAML::Load(header_text);
        view.valid_ = view.root_.IsMap();
        if (!view.valid_ && view.root_.IsDefined() && !view.root_.IsNull())
            PLOG_WARNING << "Header is not a mapping: " << utils::Diagnostics::Preview(header_text);
    }
    catch (const YAML::Exception& ex)
    {
        PLOG_WARNING << "Header could not be parsed as YAML (" << ex.what()
                     << "): " << utils::Diagnostics::Preview(header_text);
        view.valid_ = false;
    }
    return view;
}

bool HeaderView::hasField(const std::string& key) const
{
    if (!valid_)
        return false;
    return static_cast<bool>(root_[key]);
}

std::optional<std::string> HeaderView::stringField(const std::string& key) const
{
    if (!valid_)
        return std::nullopt;
    const YAML::Node node = root_[key];
    if (!node || !node.IsScalar())
        return std::nullopt;
    // Plain booleans are not text.
    if (isPlainBool(node))
        return std::nullopt;
    return node.Scalar();
}

TranslateTarget HeaderView::translateTo(const std::string& marker_key) const
{
    TranslateTarget target;
    if (!valid_)
        return target;

    const YAML::Node node = root_[marker_key];
    if (!node || node.IsNull() || isPlainBool(node))
        return target;

    if (node.IsSequence())
    {
        target.kind = TranslateTarget::Kind::Locales;
        for (const auto& item : node)
        {
            if (item.IsScalar())
                addUnique(target.locales, item.Scalar());
        }
        return target;
    }

    if (node.IsScalar())
    {
        if (node.Scalar() == "all")
        {
            target.kind = TranslateTarget::Kind::All;
            return target;
        }
        target.kind = TranslateTarget::Kind::Locales;
        addUnique(target.locales, node.Scalar());
    }
    return target;
}

std::optional<StringPairs> HeaderView::alternates(const std::string& key) const
{
    if (!valid_)
        return std::nullopt;

    const YAML::Node node = root_[key];
    if (!node)
        return std::nullopt;

    StringPairs entries;
    if (node.IsNull())
        return entries;
    if (!node.IsMap())
        return std::nullopt;

    for (const auto& kv : node)
    {
        if (!kv.first.IsScalar())
            continue;
        const std::string locale = kv.first.Scalar();
        std::string value;
        if (kv.second.IsScalar())
            value = kv.second.Scalar();
        else if (!kv.second.IsNull())
            continue;
        entries.emplace_back(locale, value);
    }
    return entries;
}

} // namespace content
