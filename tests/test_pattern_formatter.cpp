#include <catch2/catch_test_macros.hpp>
#include "pattern/PatternErrors.hpp"
#include "pattern/PatternFormatter.hpp"
#include "pattern/PatternParser.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <variant>

using namespace pattern;

namespace
{

std::string format(const std::string& text, const Arguments& args, const std::string& locale = "en")
{
    PatternFormatter formatter;
    return formatter.render(*PatternParser::parse(text), args, locale);
}

// 2024-03-15 12:00:00 UTC
DateTime march15()
{
    return DateTime(std::chrono::seconds(1710504000));
}

} // namespace

TEST_CASE("PatternFormatter - choice selection", "[pattern][formatter]")
{
    const std::string files = "{0,choice,0#no files|1#one file|1<{0} files}";

    REQUIRE(format(files, { 0 }) == "no files");
    REQUIRE(format(files, { 1 }) == "one file");
    REQUIRE(format(files, { 5 }) == "5 files");
    REQUIRE(format(files, { 1.5 }) == "1.5 files");

    SECTION("Argument below the first bound is an error")
    {
        REQUIRE_THROWS_AS(format("{0,choice,1#one|2#two}", { 0 }), PatternFormatError);
        REQUIRE_THROWS_AS(format(files, { -1 }), PatternFormatError);
    }

    SECTION("NaN matches no range")
    {
        REQUIRE_THROWS_AS(format(files, { std::numeric_limits<double>::quiet_NaN() }), PatternFormatError);
    }

    SECTION("Nested choices")
    {
        const std::string nested = "{0,choice,0#empty|1#{1,choice,0#one red|1#one blue}}";
        REQUIRE(format(nested, { 1, 0 }) == "one red");
        REQUIRE(format(nested, { 1, 1 }) == "one blue");
    }
}

TEST_CASE("PatternFormatter - literals and quoting", "[pattern][formatter]")
{
    REQUIRE(format("No placeholders here.", {}) == "No placeholders here.");
    REQUIRE(format("No placeholders here.", {}, "de") == "No placeholders here.");
    REQUIRE(format("Keine Platzhalter, 1.234 Stück.", {}, "de") == "Keine Platzhalter, 1.234 Stück.");
    REQUIRE(format("プレースホルダーなし 1,234", {}, "ja") == "プレースホルダーなし 1,234");
    REQUIRE(format("{0,choice,0#'#'1|1<x}", { 0 }) == "#1");
    REQUIRE(format("l'heure est {0}", { "midi" }) == "l'heure est midi");
    REQUIRE(format("It''s '{'{0}'}'", { "x" }) == "It's {x}");
    REQUIRE(format("{0} and {0} again", { "a" }) == "a and a again");
    REQUIRE(format("flag={0}", { true }) == "flag=true");
}

TEST_CASE("PatternFormatter - numbers follow the locale", "[pattern][formatter]")
{
    REQUIRE(format("{0,number}", { 1234567 }, "en") == "1,234,567");
    REQUIRE(format("{0,number}", { 1234567 }, "de") == "1.234.567");
    REQUIRE(format("{0}", { 42 }) == "42");
    REQUIRE(format("{0,number,integer}", { 3.7 }) == "4");
    REQUIRE(format("{0,number,percent}", { 0.25 }) == "25%");
    REQUIRE(format("{0,number,#,##0.00}", { 1234.5 }) == "1,234.50");
    REQUIRE(format("{0,number,#,##0.00}", { 1234.5 }, "de_DE") == "1.234,50");
}

TEST_CASE("PatternFormatter - large unsigned arguments keep their sign", "[pattern][formatter]")
{
    const Argument largest(std::numeric_limits<unsigned long>::max());
    REQUIRE(std::holds_alternative<double>(largest.value));
    REQUIRE(std::get<double>(largest.value) > 0.0);
    const std::string text = format("{0,number,integer}", { std::numeric_limits<unsigned long long>::max() });
    REQUIRE(text.rfind("18,446,744,073,709,55", 0) == 0);

    const Argument small(42ul);
    REQUIRE(std::holds_alternative<std::int64_t>(small.value));
    REQUIRE(format("{0}", { 42ul }) == "42");
}

TEST_CASE("PatternFormatter - dates", "[pattern][formatter]")
{
    REQUIRE(format("{0,date,yyyy-MM-dd}", { march15() }) == "2024-03-15");
    REQUIRE(format("{0,time,HH:mm}", { march15() }) == "12:00");

    SECTION("Time zone of the formatter applies")
    {
        PatternFormatter tokyo{ LocaleFormatter("Asia/Tokyo") };
        REQUIRE(tokyo.render(*PatternParser::parse("{0,time,HH:mm}"), { march15() }, "en") == "21:00");
    }
}

TEST_CASE("PatternFormatter - call-site overrides", "[pattern][formatter]")
{
    SECTION("Style override replaces the stored style")
    {
        REQUIRE(format("Due {0,date,yyyy-MM-dd}", { Argument::withStyle(march15(), "dd/MM/yyyy") }) ==
                "Due 15/03/2024");
        REQUIRE(format("{0,choice,0#a|1#b}", { Argument::withStyle(std::int64_t{ 2 }, "0#none|1#some") }) == "some");
    }

    SECTION("Custom formatter wins")
    {
        auto spelled = Argument::withFormatter(std::int64_t{ 5 },
                                               [](const Value& value, const std::string& locale)
                                               {
                                                   return std::get<std::int64_t>(value) == 5 && locale == "fr"
                                                              ? std::string("cinq")
                                                              : std::string("?");
                                               });
        REQUIRE(format("{0,number} fichiers", { spelled }, "fr") == "cinq fichiers");
    }
}

TEST_CASE("PatternFormatter - argument errors", "[pattern][formatter]")
{
    REQUIRE_THROWS_AS(format("{1}", { "only one" }), PatternFormatError);
    REQUIRE_THROWS_AS(format("{0}", {}), PatternFormatError);
    REQUIRE_THROWS_AS(format("{0,number}", { "text" }), PatternFormatError);
    REQUIRE_THROWS_AS(format("{0,date}", { 12 }), PatternFormatError);
    REQUIRE_THROWS_AS(format("{0,choice,0#a}", { "zero" }), PatternFormatError);
}
