#include <catch2/catch_test_macros.hpp>
#include "pattern/PatternErrors.hpp"
#include "pattern/PatternParser.hpp"

#include <cmath>

using namespace pattern;

TEST_CASE("PatternParser - segments", "[pattern][parser]")
{
    SECTION("Literal only")
    {
        auto compiled = PatternParser::parse("Just text");
        REQUIRE(compiled->segments.size() == 1);
        REQUIRE(compiled->segments[0].kind == Segment::Kind::Literal);
        REQUIRE(compiled->segments[0].text == "Just text");
        REQUIRE_FALSE(compiled->hasPlaceholders());
    }

    SECTION("Placeholders with type and style")
    {
        auto compiled = PatternParser::parse("Hello {0}, you owe {1,number,currency}");
        REQUIRE(compiled->source == "Hello {0}, you owe {1,number,currency}");
        REQUIRE(compiled->segments.size() == 4);
        REQUIRE(compiled->segments[1].kind == Segment::Kind::Placeholder);
        REQUIRE(compiled->segments[1].index == 0);
        REQUIRE(compiled->segments[1].type == ArgType::None);
        REQUIRE(compiled->segments[3].index == 1);
        REQUIRE(compiled->segments[3].type == ArgType::Number);
        REQUIRE(compiled->segments[3].style == "currency");
    }

    SECTION("Date and time types")
    {
        auto compiled = PatternParser::parse("{0,date,yyyy-MM-dd} {0,time}");
        REQUIRE(compiled->segments[0].type == ArgType::Date);
        REQUIRE(compiled->segments[0].style == "yyyy-MM-dd");
        REQUIRE(compiled->segments[2].type == ArgType::Time);
    }

    SECTION("Quoting")
    {
        auto compiled = PatternParser::parse("'{0}' isn''t l'heure");
        REQUIRE(compiled->segments.size() == 1);
        REQUIRE(compiled->segments[0].text == "{0} isn't l'heure");
    }
}

TEST_CASE("PatternParser - choice rules", "[pattern][parser]")
{
    auto compiled = PatternParser::parse("{0,choice,0#no files|1#one file|1<{0} files}");
    REQUIRE(compiled->segments.size() == 1);

    const auto& choices = compiled->segments[0].choices;
    REQUIRE(compiled->segments[0].type == ArgType::Choice);
    REQUIRE(choices.size() == 3);
    REQUIRE(choices[0].bound == 0.0);
    REQUIRE(choices[0].inclusive);
    REQUIRE(choices[2].bound == 1.0);
    REQUIRE_FALSE(choices[2].inclusive);
    REQUIRE(choices[2].message->hasPlaceholders());

    SECTION("Quoted selector characters inside a rule message")
    {
        auto rules = PatternParser::parseChoiceStyle("0#'#'1|1<a'|'b");
        REQUIRE(rules.size() == 2);
        REQUIRE(rules[0].message->segments.size() == 1);
        REQUIRE(rules[0].message->segments[0].text == "#1");
        REQUIRE(rules[1].message->segments[0].text == "a|b");
    }

    SECTION("Infinity bounds and the less-or-equal sign")
    {
        auto rules = PatternParser::parseChoiceStyle("-∞<below|0≤zero or more|∞#infinite");
        REQUIRE(rules.size() == 3);
        REQUIRE(std::isinf(rules[0].bound));
        REQUIRE(rules[0].bound < 0);
        REQUIRE(rules[1].inclusive);
        REQUIRE(std::isinf(rules[2].bound));
    }
}

TEST_CASE("PatternParser - malformed patterns", "[pattern][parser]")
{
    SECTION("Unterminated placeholder")
    {
        try
        {
            (void)PatternParser::parse("Hello {0");
            FAIL("expected PatternParseError");
        }
        catch (const PatternParseError& e)
        {
            REQUIRE(e.offset() == 6);
        }
    }

    SECTION("Unmatched closing brace")
    {
        try
        {
            (void)PatternParser::parse("ab}");
            FAIL("expected PatternParseError");
        }
        catch (const PatternParseError& e)
        {
            REQUIRE(e.offset() == 2);
        }
    }

    REQUIRE_THROWS_AS(PatternParser::parse("{name}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{0,money}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{0,choice}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{0,choice,one|two}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{0,choice,abc#x}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{0,choice,2#two|1#one}"), PatternParseError);
    REQUIRE_THROWS_AS(PatternParser::parse("{0,choice,0#{1}"), PatternParseError);
}
