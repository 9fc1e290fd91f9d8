#include "PatternFormatter.hpp"
#include "PatternErrors.hpp"
#include "PatternParser.hpp"

#include <cmath>

namespace pattern
{

namespace
{

// Choice messages may nest further choices; bounded to stop runaway patterns.
constexpr int kMaxChoiceDepth = 16;

const char* typeName(ArgType type)
{
    switch (type)
    {
    case ArgType::None:
        return "plain";
    case ArgType::Number:
        return "number";
    case ArgType::Date:
        return "date";
    case ArgType::Time:
        return "time";
    case ArgType::Choice:
        return "choice";
    }
    return "plain";
}

const char* valueKind(const Value& value)
{
    if (std::holds_alternative<std::string>(value))
        return "string";
    if (std::holds_alternative<std::int64_t>(value))
        return "integer";
    if (std::holds_alternative<double>(value))
        return "double";
    if (std::holds_alternative<bool>(value))
        return "boolean";
    return "date";
}

PatternFormatError mismatch(const Segment& segment, const Argument& arg)
{
    return PatternFormatError(std::string("argument ") + std::to_string(segment.index) + " is a " +
                              valueKind(arg.value) + ", " + typeName(segment.type) + " placeholder needs " +
                              (segment.type == ArgType::Date || segment.type == ArgType::Time ? "a date"
                                                                                              : "a number"));
}

} // namespace

PatternFormatter::PatternFormatter(LocaleFormatter locale_formatter)
    : locale_formatter_(std::move(locale_formatter))
{
}

std::string PatternFormatter::render(const CompiledPattern& compiled, const Arguments& args,
                                     const std::string& locale) const
{
    std::string out;
    out.reserve(compiled.source.size() + 16);
    renderInto(out, compiled, args, locale, 0);
    return out;
}

void PatternFormatter::renderInto(std::string& out, const CompiledPattern& compiled, const Arguments& args,
                                  const std::string& locale, int depth) const
{
    for (const auto& segment : compiled.segments)
    {
        if (segment.kind == Segment::Kind::Literal)
        {
            out += segment.text;
        }
        else
        {
            out += formatPlaceholder(segment, args, locale, depth);
        }
    }
}

std::string PatternFormatter::formatPlaceholder(const Segment& segment, const Arguments& args,
                                                const std::string& locale, int depth) const
{
    if (segment.index >= args.size())
    {
        throw PatternFormatError("missing argument " + std::to_string(segment.index) + " (" +
                                 std::to_string(args.size()) + " given)");
    }

    const Argument& arg = args[segment.index];
    if (arg.formatter)
    {
        return arg.formatter(arg.value, locale);
    }

    const std::string& style = arg.style ? *arg.style : segment.style;

    switch (segment.type)
    {
    case ArgType::None:
        return formatUntyped(arg, style, locale);

    case ArgType::Number:
        if (const auto* i = std::get_if<std::int64_t>(&arg.value))
            return locale_formatter_.formatNumber(*i, style, locale);
        if (const auto* d = std::get_if<double>(&arg.value))
            return locale_formatter_.formatNumber(*d, style, locale);
        throw mismatch(segment, arg);

    case ArgType::Date:
    case ArgType::Time:
        if (const auto* when = std::get_if<DateTime>(&arg.value))
            return locale_formatter_.formatDate(*when, segment.type, style, locale);
        throw mismatch(segment, arg);

    case ArgType::Choice:
        return formatChoice(segment, arg, args, locale, depth);
    }

    throw PatternFormatError("unsupported placeholder type");
}

std::string PatternFormatter::formatUntyped(const Argument& arg, const std::string& style,
                                            const std::string& locale) const
{
    if (const auto* s = std::get_if<std::string>(&arg.value))
        return *s;
    if (const auto* i = std::get_if<std::int64_t>(&arg.value))
        return locale_formatter_.formatNumber(*i, style, locale);
    if (const auto* d = std::get_if<double>(&arg.value))
        return locale_formatter_.formatNumber(*d, style, locale);
    if (const auto* b = std::get_if<bool>(&arg.value))
        return *b ? "true" : "false";
    return locale_formatter_.formatDate(std::get<DateTime>(arg.value), ArgType::None, style, locale);
}

std::string PatternFormatter::formatChoice(const Segment& segment, const Argument& arg, const Arguments& args,
                                           const std::string& locale, int depth) const
{
    double number = 0.0;
    if (const auto* i = std::get_if<std::int64_t>(&arg.value))
        number = static_cast<double>(*i);
    else if (const auto* d = std::get_if<double>(&arg.value))
        number = *d;
    else
        throw mismatch(segment, arg);

    if (std::isnan(number))
    {
        throw PatternFormatError("argument " + std::to_string(segment.index) + " is NaN, no choice range matches");
    }
    if (depth >= kMaxChoiceDepth)
    {
        throw PatternFormatError("choice nesting too deep");
    }

    std::vector<ChoiceRule> overridden;
    const std::vector<ChoiceRule>* rules = &segment.choices;
    if (arg.style)
    {
        overridden = PatternParser::parseChoiceStyle(*arg.style);
        rules = &overridden;
    }

    const ChoiceRule* selected = nullptr;
    for (const auto& rule : *rules)
    {
        bool admits = rule.inclusive ? number >= rule.bound : number > rule.bound;
        if (!admits)
            break;
        selected = &rule;
    }

    if (!selected)
    {
        throw PatternFormatError("no choice range matches argument " + std::to_string(segment.index) + " (" +
                                 std::to_string(number) + ")");
    }

    std::string out;
    renderInto(out, *selected->message, args, locale, depth + 1);
    return out;
}

} // namespace pattern
