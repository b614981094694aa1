#pragma once

#include "YamlScalar.hpp"

#include <string>
#include <variant>

namespace content
{

using FieldValue = std::variant<std::string, StringPairs>;

struct PatchResult
{
    enum class Status
    {
        NoHeader,  // document has no delimited header, nothing to do
        Unchanged, // rendered field already present byte for byte
        Updated
    };

    Status status = Status::NoHeader;
    std::string text; // full document; equals the input unless Updated

    bool changed() const { return status == Status::Updated; }
};

class FieldPatcher
{
public:
    // Replace the top-level field `field_name` (and its continuation lines)
    // with a freshly rendered value, or append it at the end of the header.
    // Every other header line and the body are kept as they are.
    static PatchResult patch(const std::string& document, const std::string& field_name, const FieldValue& value);

    static std::vector<std::string> render(const std::string& field_name, const FieldValue& value);
};

} // namespace content
