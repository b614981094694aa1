#pragma once

#include <string>
#include <vector>

namespace content
{

struct SiblingDocument
{
    std::string locale;
    std::string path;
    std::string text;
};

// All variants of one logical page, in configured locale order. Rebuilt from
// the path convention on every pass, never persisted.
struct SiblingSet
{
    std::string base_path;
    std::vector<SiblingDocument> members;
};

} // namespace content
