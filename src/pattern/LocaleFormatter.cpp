#include "LocaleFormatter.hpp"
#include "PatternErrors.hpp"

#include <unicode/datefmt.h>
#include <unicode/dcfmtsym.h>
#include <unicode/decimfmt.h>
#include <unicode/locid.h>
#include <unicode/numfmt.h>
#include <unicode/smpdtfmt.h>
#include <unicode/timezone.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace pattern
{

namespace
{

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Accepts both "pt_BR" and "pt-BR"; unknown tags fall back to the root locale.
icu::Locale toIcuLocale(const std::string& tag)
{
    std::string bcp47 = tag;
    std::replace(bcp47.begin(), bcp47.end(), '_', '-');
    UErrorCode status = U_ZERO_ERROR;
    icu::Locale locale = icu::Locale::forLanguageTag(bcp47, status);
    if (U_FAILURE(status) || locale.isBogus())
    {
        return icu::Locale::getRoot();
    }
    return locale;
}

std::string toUtf8(const icu::UnicodeString& text)
{
    std::string out;
    text.toUTF8String(out);
    return out;
}

std::unique_ptr<icu::NumberFormat> createNumberFormat(const std::string& style, const icu::Locale& locale)
{
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::NumberFormat> fmt;
    const std::string key = toLower(style);

    if (key.empty())
    {
        fmt.reset(icu::NumberFormat::createInstance(locale, status));
    }
    else if (key == "integer")
    {
        fmt.reset(icu::NumberFormat::createInstance(locale, status));
        if (fmt && U_SUCCESS(status))
        {
            fmt->setMaximumFractionDigits(0);
        }
    }
    else if (key == "percent")
    {
        fmt.reset(icu::NumberFormat::createPercentInstance(locale, status));
    }
    else if (key == "currency")
    {
        fmt.reset(icu::NumberFormat::createCurrencyInstance(locale, status));
    }
    else
    {
        // DecimalFormat adopts the symbols, including on failure.
        auto* symbols = new icu::DecimalFormatSymbols(locale, status);
        fmt = std::make_unique<icu::DecimalFormat>(icu::UnicodeString::fromUTF8(style), symbols, status);
    }

    if (U_FAILURE(status) || !fmt)
    {
        throw PatternFormatError("invalid number style '" + style + "': " + u_errorName(status));
    }
    return fmt;
}

bool dateStyleKeyword(const std::string& key, icu::DateFormat::EStyle& out)
{
    if (key == "short")
        out = icu::DateFormat::kShort;
    else if (key == "medium")
        out = icu::DateFormat::kMedium;
    else if (key == "long")
        out = icu::DateFormat::kLong;
    else if (key == "full")
        out = icu::DateFormat::kFull;
    else
        return false;
    return true;
}

} // namespace

LocaleFormatter::LocaleFormatter(std::string time_zone)
    : time_zone_(std::move(time_zone))
{
}

std::string LocaleFormatter::formatNumber(double value, const std::string& style, const std::string& locale) const
{
    auto fmt = createNumberFormat(style, toIcuLocale(locale));
    icu::UnicodeString out;
    fmt->format(value, out);
    return toUtf8(out);
}

std::string LocaleFormatter::formatNumber(std::int64_t value, const std::string& style,
                                          const std::string& locale) const
{
    auto fmt = createNumberFormat(style, toIcuLocale(locale));
    icu::UnicodeString out;
    fmt->format(static_cast<int64_t>(value), out);
    return toUtf8(out);
}

std::string LocaleFormatter::formatDate(DateTime value, ArgType type, const std::string& style,
                                        const std::string& locale) const
{
    const icu::Locale icu_locale = toIcuLocale(locale);
    const std::string key = toLower(style);

    std::unique_ptr<icu::DateFormat> fmt;
    icu::DateFormat::EStyle date_style = type == ArgType::None ? icu::DateFormat::kShort : icu::DateFormat::kMedium;
    if (key.empty() || dateStyleKeyword(key, date_style))
    {
        if (type == ArgType::Date)
            fmt.reset(icu::DateFormat::createDateInstance(date_style, icu_locale));
        else if (type == ArgType::Time)
            fmt.reset(icu::DateFormat::createTimeInstance(date_style, icu_locale));
        else
            fmt.reset(icu::DateFormat::createDateTimeInstance(date_style, date_style, icu_locale));
    }
    else
    {
        UErrorCode status = U_ZERO_ERROR;
        fmt = std::make_unique<icu::SimpleDateFormat>(icu::UnicodeString::fromUTF8(style), icu_locale, status);
        if (U_FAILURE(status))
        {
            throw PatternFormatError("invalid date style '" + style + "': " + u_errorName(status));
        }
    }

    if (!fmt)
    {
        throw PatternFormatError("no date format available for locale '" + locale + "'");
    }

    fmt->adoptTimeZone(icu::TimeZone::createTimeZone(icu::UnicodeString::fromUTF8(time_zone_)));

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    icu::UnicodeString out;
    fmt->format(static_cast<UDate>(millis), out);
    return toUtf8(out);
}

} // namespace pattern
