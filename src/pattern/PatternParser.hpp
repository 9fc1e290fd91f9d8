#pragma once

#include "CompiledPattern.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pattern
{

/**
 * @brief Compiles message pattern strings
 *
 * Syntax:
 *   literal text with positional placeholders {n}, {n,type} and {n,type,style},
 *   type one of number, date, time, choice.
 *
 * Quoting: '' is an apostrophe. A single apostrophe right before a brace (or a
 * '|' inside a choice style) opens a quoted literal closed by the next single
 * apostrophe. Any other apostrophe is plain text, so "l'heure" needs no escaping.
 *
 * Choice styles are rules "bound#message" (argument >= bound) and
 * "bound<message" (argument > bound) separated by '|', in ascending order.
 * "≤" is accepted for '#', "∞" and "-∞" as bounds. Messages are patterns.
 *
 * Throws PatternParseError on malformed input.
 */
class PatternParser
{
public:
    [[nodiscard]] static std::shared_ptr<const CompiledPattern> parse(const std::string& pattern);

    // Parses a standalone choice style, used when a call site overrides the
    // style of a choice placeholder.
    [[nodiscard]] static std::vector<ChoiceRule> parseChoiceStyle(const std::string& style);
};

} // namespace pattern
