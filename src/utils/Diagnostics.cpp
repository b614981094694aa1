#include "Diagnostics.hpp"

#include <utf8proc.h>

#include <algorithm>

namespace utils
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t code_points) noexcept
{
    if (code_points == 0)
        code_points = 1;
    max_preview_.store(code_points, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(std::min(text.size(), limit * 4) + 16);

    const auto* data = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    std::size_t count = 0;
    while (pos < len && count < limit)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(data + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Invalid sequence: show one replacement byte and move on.
            out.push_back('?');
            ++pos;
            ++count;
            continue;
        }

        switch (codepoint)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.append(text.data() + pos, static_cast<std::size_t>(bytes));
            break;
        }
        pos += bytes;
        ++count;
    }

    if (pos < len)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 && c != '\n' && c != '\r' && c != '\t';
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace utils
