#include "HeaderRewriter.hpp"

#include <plog/Log.h>

#include <set>

namespace content
{

namespace
{

void appendLines(std::vector<std::string>& out, const std::vector<std::string>& lines)
{
    out.insert(out.end(), lines.begin(), lines.end());
}

} // namespace

std::vector<std::string> HeaderRewriter::renderMetadata(const MetadataBlock& metadata)
{
    std::vector<std::string> lines;
    if (metadata.key.empty() || metadata.attributes.empty())
        return lines;

    lines.push_back(metadata.key + ":");
    for (const auto& [name, value] : metadata.attributes)
        lines.push_back(std::string(yaml::kIndent) + name + ": " + yaml::renderScalar(value));
    return lines;
}

std::string HeaderRewriter::rewrite(const HeaderLines& lines, const RewriteRequest& request)
{
    auto findReplacement = [&request](const std::string& key) -> const std::optional<std::string>*
    {
        for (const auto& entry : request.replacements)
        {
            if (entry.first == key)
                return &entry.second;
        }
        return nullptr;
    };

    auto isPrivate = [&request](const std::string& key)
    {
        return !request.private_prefix.empty() && key.compare(0, request.private_prefix.size(), request.private_prefix) == 0;
    };

    std::vector<std::string> out;
    out.reserve(lines.size() + request.metadata.attributes.size() + 1);

    std::set<std::string> seen_keys;
    bool metadata_injected = false;
    // Set while the continuations of the current field belong to a value
    // that has been dropped or replaced.
    bool skipping = false;

    for (const auto& line : lines)
    {
        if (const auto* field = asField(line))
        {
            skipping = false;
            seen_keys.insert(field->key);

            if (isPrivate(field->key))
            {
                skipping = true;
                if (field->key == request.marker_key && !metadata_injected)
                {
                    const auto block = renderMetadata(request.metadata);
                    if (!block.empty())
                    {
                        appendLines(out, block);
                        metadata_injected = true;
                    }
                }
                continue;
            }

            if (const auto* replacement = findReplacement(field->key))
            {
                skipping = true;
                if (replacement->has_value())
                    appendLines(out, yaml::renderScalarField(field->key, **replacement));
                continue;
            }

            out.push_back(field->raw);
            continue;
        }

        if (isContinuation(line))
        {
            if (!skipping)
                out.push_back(rawText(line));
            continue;
        }

        out.push_back(rawText(line));
    }

    for (const auto& [key, value] : request.replacements)
    {
        if (!value.has_value() || seen_keys.count(key) > 0)
            continue;
        appendLines(out, yaml::renderScalarField(key, *value));
        seen_keys.insert(key);
    }

    if (!metadata_injected)
        appendLines(out, renderMetadata(request.metadata));

    PLOG_DEBUG << "Header rewritten: " << lines.size() << " lines in, " << out.size() << " lines out";

    std::string text;
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        if (i)
            text.push_back('\n');
        text += out[i];
    }
    return text;
}

} // namespace content
