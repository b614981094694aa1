#pragma once

#include "HeaderLine.hpp"

#include <string>

namespace content
{

class HeaderParser
{
public:
    // Classify every line of `header_text`. Never fails: a line that is not
    // blank, a comment or a zero-indent field becomes a continuation.
    static HeaderLines parse(const std::string& header_text);

    // Inverse of parse for an untouched sequence.
    static std::string join(const HeaderLines& lines);

    static bool hasField(const HeaderLines& lines, const std::string& key);

private:
    static HeaderLine classify(const std::string& raw);
};

} // namespace content
