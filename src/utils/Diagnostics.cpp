#include "Diagnostics.hpp"

#include <cctype>

namespace utils
{

namespace
{

constexpr unsigned kAllStages = static_cast<unsigned>(TraceStage::Resolve) |
                                static_cast<unsigned>(TraceStage::Render) |
                                static_cast<unsigned>(TraceStage::Store);

bool isContinuationByte(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

void appendEscaped(std::string& out, char ch)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    const auto byte = static_cast<unsigned char>(ch);
    switch (ch)
    {
    case '\n':
        out += "\\n";
        return;
    case '\r':
        out += "\\r";
        return;
    case '\t':
        out += "\\t";
        return;
    default:
        break;
    }
    if (byte < 0x20 || byte == 0x7F)
    {
        out += "\\x";
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
        return;
    }
    out.push_back(ch);
}

} // namespace

std::atomic<unsigned> Diagnostics::stages_{ 0 };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    stages_.store(enabled ? kAllStages : 0u, std::memory_order_relaxed);
}

void Diagnostics::SetVerbose(TraceStage stage, bool enabled) noexcept
{
    const auto bit = static_cast<unsigned>(stage);
    if (enabled)
        stages_.fetch_or(bit, std::memory_order_relaxed);
    else
        stages_.fetch_and(~bit, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose(TraceStage stage) noexcept
{
    return (stages_.load(std::memory_order_relaxed) & static_cast<unsigned>(stage)) != 0;
}

std::optional<TraceStage> Diagnostics::ParseStage(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (lower == "resolve")
        return TraceStage::Resolve;
    if (lower == "render")
        return TraceStage::Render;
    if (lower == "store")
        return TraceStage::Store;
    return std::nullopt;
}

const char* Diagnostics::StageName(TraceStage stage) noexcept
{
    switch (stage)
    {
    case TraceStage::Resolve:
        return "resolve";
    case TraceStage::Render:
        return "render";
    case TraceStage::Store:
        return "store";
    }
    return "unknown";
}

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = text.size();
    if (cut > MaxPreview())
    {
        cut = MaxPreview();
        while (cut > 0 && isContinuationByte(text[cut]))
            --cut;
    }

    std::string out;
    out.reserve(cut + 24);
    for (std::size_t i = 0; i < cut; ++i)
        appendEscaped(out, text[i]);

    if (cut < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

} // namespace utils
