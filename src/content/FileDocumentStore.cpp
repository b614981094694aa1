#include "FileDocumentStore.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace content
{

FileDocumentStore::FileDocumentStore(fs::path root)
    : root_(std::move(root))
{
}

bool FileDocumentStore::isDocumentPath(const fs::path& path)
{
    const auto ext = path.extension().string();
    return ext == ".md" || ext == ".mdx";
}

bool FileDocumentStore::exists(const std::string& path) const
{
    std::error_code ec;
    return fs::is_regular_file(root_ / fs::path(path), ec);
}

std::optional<std::string> FileDocumentStore::read(const std::string& path) const
{
    const fs::path full = root_ / fs::path(path);
    std::ifstream file(full, std::ios::binary);
    if (!file.is_open())
    {
        std::error_code ec;
        if (fs::exists(full, ec))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Failed to read document",
                                                "Path: " + full.string());
        }
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool FileDocumentStore::write(const std::string& path, const std::string& text)
{
    const fs::path full = root_ / fs::path(path);

    std::error_code ec;
    const auto parent_path = full.parent_path();
    if (!parent_path.empty())
    {
        fs::create_directories(parent_path, ec);
        if (ec)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Failed to create document directory",
                                              "Path: " + parent_path.string() + " | Error: " + ec.message());
            return false;
        }
    }

    std::ofstream file(full, std::ios::trunc | std::ios::binary);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Failed to open document for writing",
                                          "Path: " + full.string());
        return false;
    }

    file << text;
    file.flush();
    if (!file.good())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Error writing document",
                                          "Path: " + full.string());
        return false;
    }

    PLOG_DEBUG << "Wrote " << text.size() << " bytes to " << full.string();
    return true;
}

std::vector<std::string> FileDocumentStore::list() const
{
    std::vector<std::string> paths;
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Content directory not found",
                                            "Path: " + root_.string());
        return paths;
    }

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec))
    {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !isDocumentPath(it->path()))
            continue;
        paths.push_back(it->path().lexically_relative(root_).generic_string());
    }

    if (ec)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Content scan stopped early",
                                            "Path: " + root_.string() + " | Error: " + ec.message());
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace content
