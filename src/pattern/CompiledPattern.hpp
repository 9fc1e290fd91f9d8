#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pattern
{

// Closed set of placeholder types. Unknown type names fail at parse time.
enum class ArgType
{
    None,   // {0}
    Number, // {0,number[,style]}
    Date,   // {0,date[,style]}
    Time,   // {0,time[,style]}
    Choice  // {0,choice,rules}
};

struct CompiledPattern;

// "bound#message" (inclusive) or "bound<message" (exclusive).
struct ChoiceRule
{
    double bound = 0.0;
    bool inclusive = true;
    std::shared_ptr<const CompiledPattern> message;
};

struct Segment
{
    enum class Kind
    {
        Literal,
        Placeholder
    };

    Kind kind = Kind::Literal;
    std::string text; // literal text, quotes already resolved

    std::size_t index = 0;
    ArgType type = ArgType::None;
    std::string style;
    std::vector<ChoiceRule> choices; // only for ArgType::Choice
};

// Immutable once built; shared between concurrent renders.
struct CompiledPattern
{
    std::string source;
    std::vector<Segment> segments;

    bool hasPlaceholders() const
    {
        for (const auto& segment : segments)
        {
            if (segment.kind == Segment::Kind::Placeholder)
                return true;
        }
        return false;
    }
};

} // namespace pattern
