#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace content
{

// One physical line of a header block. The header is the ordered sequence
// of these; lines that are not rewritten are always reproduced from `raw`.

struct CommentLine
{
    std::string raw;
};

struct BlankLine
{
    std::string raw;
};

// Top-level `key: value` line. Only recognised at indentation zero.
struct FieldLine
{
    std::string raw;
    std::string key;
    std::string value;
};

// Anything else. Owned by the nearest preceding FieldLine.
struct ContinuationLine
{
    std::string raw;
    std::size_t indent = 0;
};

using HeaderLine = std::variant<CommentLine, BlankLine, FieldLine, ContinuationLine>;
using HeaderLines = std::vector<HeaderLine>;

inline const std::string& rawText(const HeaderLine& line)
{
    return std::visit([](const auto& l) -> const std::string& { return l.raw; }, line);
}

inline const FieldLine* asField(const HeaderLine& line)
{
    return std::get_if<FieldLine>(&line);
}

inline bool isContinuation(const HeaderLine& line)
{
    return std::holds_alternative<ContinuationLine>(line);
}

} // namespace content
