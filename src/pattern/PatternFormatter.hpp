#pragma once

#include "Argument.hpp"
#include "CompiledPattern.hpp"
#include "LocaleFormatter.hpp"

#include <string>

namespace pattern
{

/**
 * @brief Renders a compiled pattern against positional arguments
 *
 * Either the whole string is produced or PatternFormatError is thrown:
 * missing argument index, non-numeric value for number/choice, non-date value
 * for date/time, or a choice argument below the first bound.
 */
class PatternFormatter
{
public:
    explicit PatternFormatter(LocaleFormatter locale_formatter = LocaleFormatter());

    [[nodiscard]] std::string render(const CompiledPattern& compiled, const Arguments& args,
                                     const std::string& locale) const;

    const LocaleFormatter& localeFormatter() const { return locale_formatter_; }

private:
    void renderInto(std::string& out, const CompiledPattern& compiled, const Arguments& args,
                    const std::string& locale, int depth) const;
    std::string formatPlaceholder(const Segment& segment, const Arguments& args, const std::string& locale,
                                  int depth) const;
    std::string formatUntyped(const Argument& arg, const std::string& style, const std::string& locale) const;
    std::string formatChoice(const Segment& segment, const Argument& arg, const Arguments& args,
                             const std::string& locale, int depth) const;

    LocaleFormatter locale_formatter_;
};

} // namespace pattern
