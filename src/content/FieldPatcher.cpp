#include "FieldPatcher.hpp"

#include "FrontMatter.hpp"
#include "HeaderParser.hpp"

#include <plog/Log.h>

namespace content
{

std::vector<std::string> FieldPatcher::render(const std::string& field_name, const FieldValue& value)
{
    if (const auto* scalar = std::get_if<std::string>(&value))
        return yaml::renderScalarField(field_name, *scalar);
    return yaml::renderMapField(field_name, std::get<StringPairs>(value));
}

PatchResult FieldPatcher::patch(const std::string& document, const std::string& field_name, const FieldValue& value)
{
    PatchResult result;
    result.text = document;

    auto fm = FrontMatter::split(document);
    if (!fm)
    {
        PLOG_DEBUG << "No header delimiters, skipping patch of '" << field_name << "'";
        return result;
    }

    HeaderLines lines;
    if (fm->has_header_lines)
        lines = HeaderParser::parse(fm->header);

    const std::vector<std::string> rendered = render(field_name, value);

    std::vector<std::string> out;
    out.reserve(lines.size() + rendered.size());
    bool replaced = false;
    bool skipping = false;

    for (const auto& line : lines)
    {
        if (const auto* field = asField(line))
        {
            skipping = false;
            if (field->key == field_name)
            {
                skipping = true;
                if (!replaced)
                {
                    out.insert(out.end(), rendered.begin(), rendered.end());
                    replaced = true;
                }
                continue;
            }
        }
        else if (isContinuation(line) && skipping)
        {
            continue;
        }
        out.push_back(rawText(line));
    }

    if (!replaced)
        out.insert(out.end(), rendered.begin(), rendered.end());

    std::string header;
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        if (i)
            header.push_back('\n');
        header += out[i];
    }

    if (fm->has_header_lines && header == fm->header)
    {
        result.status = PatchResult::Status::Unchanged;
        return result;
    }

    fm->header = std::move(header);
    fm->has_header_lines = true;
    result.text = fm->join();
    result.status = PatchResult::Status::Updated;
    return result;
}

} // namespace content
