#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace utils
{

// Engine stages that can trace to the diagnostics logger.
enum class TraceStage : unsigned
{
    Resolve = 1u << 0,
    Render = 1u << 1,
    Store = 1u << 2,
};

// Per-stage trace switches and log-safe previews of label text.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    // Turns tracing on or off for every stage.
    static void SetVerbose(bool enabled) noexcept;
    static void SetVerbose(TraceStage stage, bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose(TraceStage stage) noexcept;

    // "resolve", "render" or "store", any case.
    [[nodiscard]] static std::optional<TraceStage> ParseStage(std::string_view name);
    [[nodiscard]] static const char* StageName(TraceStage stage) noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /**
     * @brief Single-line preview of a label text or pattern
     *
     * Control characters are escaped. Text longer than MaxPreview() bytes is
     * cut on a UTF-8 code point boundary and gets a "... (N bytes)" suffix.
     */
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<unsigned> stages_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace utils
