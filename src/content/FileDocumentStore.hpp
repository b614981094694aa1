#pragma once

#include "IDocumentStore.hpp"

#include <filesystem>

namespace content
{

class FileDocumentStore : public IDocumentStore
{
public:
    explicit FileDocumentStore(std::filesystem::path root);

    bool exists(const std::string& path) const override;
    std::optional<std::string> read(const std::string& path) const override;
    bool write(const std::string& path, const std::string& text) override;
    std::vector<std::string> list() const override;

    const std::filesystem::path& root() const { return root_; }

    static bool isDocumentPath(const std::filesystem::path& path);

private:
    std::filesystem::path root_;
};

} // namespace content
