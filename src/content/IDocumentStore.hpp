#pragma once

#include <optional>
#include <string>
#include <vector>

namespace content
{

// Locale-organised document tree. Paths are relative to the content root and
// always use '/' as separator.
class IDocumentStore
{
public:
    virtual ~IDocumentStore() = default;

    virtual bool exists(const std::string& path) const = 0;
    virtual std::optional<std::string> read(const std::string& path) const = 0;
    // Creates missing parent directories. Returns false on failure.
    virtual bool write(const std::string& path, const std::string& text) = 0;
    // Every .md/.mdx document, sorted.
    virtual std::vector<std::string> list() const = 0;
};

} // namespace content
