#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace matching
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 100 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::string source(text);
    const std::size_t cut = utf8_prefix_length(source, MaxPreview());

    std::string out = source.substr(0, cut);
    std::replace_if(out.begin(), out.end(),
                    [](char ch)
                    {
                        return ch == '\n' || ch == '\r' || ch == '\t';
                    },
                    ' ');

    if (cut < source.size())
        out += "...";

    sanitize(out);
    return out;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 || c == 0x7F;
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace matching
