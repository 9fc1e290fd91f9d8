#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pattern
{

using DateTime = std::chrono::system_clock::time_point;
using Value = std::variant<std::string, std::int64_t, double, bool, DateTime>;

// Renders one argument itself, replacing the placeholder's own formatting.
using CustomFormatter = std::function<std::string(const Value& value, const std::string& locale)>;

/**
 * @brief One positional argument of a render call
 *
 * Besides the value, a call site may attach a style (e.g. a date layout such
 * as "dd/MM/yyyy") that overrides the style written in the stored pattern, or a
 * custom formatter. This keeps stored patterns generic while call sites vary
 * the presentation.
 */
struct Argument
{
    Value value;
    std::optional<std::string> style;
    CustomFormatter formatter;

    Argument(std::string v) : value(std::move(v)) {}
    Argument(const char* v) : value(std::string(v)) {}
    Argument(int v) : value(static_cast<std::int64_t>(v)) {}
    Argument(unsigned int v) : value(static_cast<std::int64_t>(v)) {}
    Argument(long v) : value(static_cast<std::int64_t>(v)) {}
    Argument(unsigned long v) : value(fromUnsigned(v)) {}
    Argument(long long v) : value(static_cast<std::int64_t>(v)) {}
    Argument(unsigned long long v) : value(fromUnsigned(v)) {}
    Argument(double v) : value(v) {}
    Argument(bool v) : value(v) {}
    Argument(DateTime v) : value(v) {}

    static Argument withStyle(Value value, std::string style)
    {
        Argument arg(std::move(value));
        arg.style = std::move(style);
        return arg;
    }

    static Argument withFormatter(Value value, CustomFormatter formatter)
    {
        Argument arg(std::move(value));
        arg.formatter = std::move(formatter);
        return arg;
    }

private:
    explicit Argument(Value v) : value(std::move(v)) {}

    // Values past the int64 range are kept as double rather than wrapped.
    static Value fromUnsigned(unsigned long long v)
    {
        if (v > static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max()))
            return static_cast<double>(v);
        return static_cast<std::int64_t>(v);
    }
};

using Arguments = std::vector<Argument>;

} // namespace pattern
