#pragma once

#include "Argument.hpp"
#include "CompiledPattern.hpp"

#include <cstdint>
#include <string>

namespace pattern
{

/**
 * @brief Locale-aware number and date primitives backed by ICU
 *
 * Number styles: "" (locale default), "integer", "percent", "currency" or a
 * decimal pattern such as "#,##0.00".
 * Date/time styles: "short", "medium" (default), "long", "full" or a date
 * pattern such as "yyyy-MM-dd HH:mm".
 *
 * ICU formatters are created per call, so one instance can be shared freely.
 * Throws PatternFormatError when ICU rejects a style.
 */
class LocaleFormatter
{
public:
    explicit LocaleFormatter(std::string time_zone = "UTC");

    [[nodiscard]] std::string formatNumber(double value, const std::string& style, const std::string& locale) const;
    [[nodiscard]] std::string formatNumber(std::int64_t value, const std::string& style,
                                           const std::string& locale) const;

    // type is Date, Time, or None for a combined short date + time
    [[nodiscard]] std::string formatDate(DateTime value, ArgType type, const std::string& style,
                                         const std::string& locale) const;

    const std::string& timeZone() const { return time_zone_; }

private:
    std::string time_zone_;
};

} // namespace pattern
