#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace utils
{

class Diagnostics
{
public:
    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Limit in code points, not bytes.
    static void SetMaxPreview(std::size_t code_points) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // One-line, length-capped rendering of document text for log messages.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace utils
