#pragma once

#include "../content/YamlScalar.hpp"

#include <string>
#include <vector>

namespace translate
{

struct ParsedTranslation
{
    content::StringPairs fields;
    std::string body;
};

// Recovers translated header fields and the translated body from a model
// reply. Only keys named in `requested` are kept; keys are matched
// lower-cased.
//
// A reply whose first line mentions FRONTMATTER is read as `key: value`
// lines up to a `CONTENT:` line (or the first heading). Otherwise the first
// five lines are scanned for leading `key: value` lines, stopping at a
// heading or blank line. Leading blank lines are removed from the body.
class ResponseParser
{
public:
    static ParsedTranslation parse(const std::string& response, const std::vector<std::string>& requested);

private:
    static void assign(ParsedTranslation& out, const std::string& key, const std::string& value);
};

} // namespace translate
