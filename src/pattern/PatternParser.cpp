#include "PatternParser.hpp"
#include "PatternErrors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace pattern
{

namespace
{

constexpr const char* kInfinity = "\xE2\x88\x9E";     // U+221E
constexpr const char* kLessOrEqual = "\xE2\x89\xA4";  // U+2264
constexpr std::size_t kMaxArgumentIndex = 1000000;

std::string trim(const std::string& s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Position of the byte after a quoted section opened at `open`, or n when the
// quote is never closed.
std::size_t skipQuoted(const std::string& src, std::size_t open)
{
    std::size_t j = open + 1;
    while (j < src.size())
    {
        if (src[j] == '\'')
        {
            if (j + 1 < src.size() && src[j + 1] == '\'')
            {
                j += 2;
                continue;
            }
            return j + 1;
        }
        ++j;
    }
    return src.size();
}

bool opensQuote(const std::string& src, std::size_t i, bool in_choice)
{
    if (i + 1 >= src.size())
        return false;
    char next = src[i + 1];
    return next == '{' || next == '}' || (in_choice && (next == '|' || next == '#'));
}

std::vector<ChoiceRule> parseChoice(const std::string& style, std::size_t base);

class Parser
{
public:
    Parser(const std::string& src, std::size_t base, bool in_choice)
        : src_(src)
        , base_(base)
        , in_choice_(in_choice)
    {
    }

    std::shared_ptr<CompiledPattern> run()
    {
        auto compiled = std::make_shared<CompiledPattern>();
        compiled->source = src_;

        const std::size_t n = src_.size();
        while (pos_ < n)
        {
            char c = src_[pos_];
            if (c == '\'')
            {
                if (pos_ + 1 < n && src_[pos_ + 1] == '\'')
                {
                    literal_.push_back('\'');
                    pos_ += 2;
                    continue;
                }
                if (opensQuote(src_, pos_, in_choice_))
                {
                    readQuoted();
                    continue;
                }
                literal_.push_back(c);
                ++pos_;
                continue;
            }
            if (c == '{')
            {
                flushLiteral(*compiled);
                compiled->segments.push_back(readPlaceholder());
                continue;
            }
            if (c == '}')
            {
                throw PatternParseError("unmatched '}'", base_ + pos_);
            }
            literal_.push_back(c);
            ++pos_;
        }
        flushLiteral(*compiled);
        return compiled;
    }

private:
    void readQuoted()
    {
        ++pos_; // opening apostrophe
        while (pos_ < src_.size())
        {
            if (src_[pos_] == '\'')
            {
                if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\'')
                {
                    literal_.push_back('\'');
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                return;
            }
            literal_.push_back(src_[pos_++]);
        }
    }

    void flushLiteral(CompiledPattern& compiled)
    {
        if (literal_.empty())
            return;
        Segment segment;
        segment.kind = Segment::Kind::Literal;
        segment.text = std::move(literal_);
        compiled.segments.push_back(std::move(segment));
        literal_.clear();
    }

    std::size_t findClosingBrace(std::size_t from) const
    {
        int depth = 1;
        for (std::size_t i = from; i < src_.size(); ++i)
        {
            char ch = src_[i];
            if (ch == '\'')
            {
                if (i + 1 < src_.size() && src_[i + 1] == '\'')
                {
                    ++i;
                    continue;
                }
                if (opensQuote(src_, i, true))
                {
                    i = skipQuoted(src_, i) - 1;
                }
                continue;
            }
            if (ch == '{')
            {
                ++depth;
            }
            else if (ch == '}')
            {
                if (--depth == 0)
                    return i;
            }
        }
        return std::string::npos;
    }

    Segment readPlaceholder()
    {
        const std::size_t open = pos_;
        const std::size_t close = findClosingBrace(open + 1);
        if (close == std::string::npos)
        {
            throw PatternParseError("unterminated placeholder", base_ + open);
        }

        const std::string body = src_.substr(open + 1, close - open - 1);
        const std::size_t body_base = base_ + open + 1;

        Segment segment;
        segment.kind = Segment::Kind::Placeholder;

        std::size_t i = 0;
        while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i])))
            ++i;

        const std::size_t digits_start = i;
        std::size_t index = 0;
        while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i])))
        {
            index = index * 10 + static_cast<std::size_t>(body[i] - '0');
            if (index > kMaxArgumentIndex)
                throw PatternParseError("argument index too large", body_base + digits_start);
            ++i;
        }
        if (i == digits_start)
        {
            throw PatternParseError("argument index expected", body_base + i);
        }
        segment.index = index;

        while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i])))
            ++i;

        if (i < body.size())
        {
            if (body[i] != ',')
                throw PatternParseError("',' or '}' expected after argument index", body_base + i);
            ++i;

            const std::size_t type_start = i;
            std::size_t type_end = body.find(',', type_start);
            if (type_end == std::string::npos)
                type_end = body.size();

            const std::string type_name = toLower(trim(body.substr(type_start, type_end - type_start)));
            if (type_name.empty())
                throw PatternParseError("argument type expected", body_base + type_start);

            if (type_name == "number")
                segment.type = ArgType::Number;
            else if (type_name == "date")
                segment.type = ArgType::Date;
            else if (type_name == "time")
                segment.type = ArgType::Time;
            else if (type_name == "choice")
                segment.type = ArgType::Choice;
            else
                throw PatternParseError("unknown argument type '" + type_name + "'", body_base + type_start);

            if (type_end < body.size())
            {
                const std::size_t style_start = type_end + 1;
                std::string style = body.substr(style_start);
                if (segment.type == ArgType::Choice)
                {
                    segment.choices = parseChoice(style, body_base + style_start);
                    segment.style = std::move(style);
                }
                else
                {
                    segment.style = trim(style);
                }
            }
        }

        if (segment.type == ArgType::Choice && segment.choices.empty())
        {
            throw PatternParseError("choice style expected", body_base);
        }

        pos_ = close + 1;
        return segment;
    }

    const std::string& src_;
    std::size_t base_;
    bool in_choice_;
    std::size_t pos_ = 0;
    std::string literal_;
};

double parseBound(const std::string& text, std::size_t offset)
{
    const std::string bound = trim(text);
    if (bound == kInfinity || bound == std::string("+") + kInfinity)
        return std::numeric_limits<double>::infinity();
    if (bound == std::string("-") + kInfinity)
        return -std::numeric_limits<double>::infinity();

    double value = 0.0;
    const char* first = bound.data();
    const char* last = bound.data() + bound.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (bound.empty() || ec != std::errc() || ptr != last)
    {
        throw PatternParseError("invalid choice bound '" + bound + "'", offset);
    }
    return value;
}

// Splits a choice style at top level '|' separators, skipping quoted text and
// nested placeholders. Returns (part, offset within style) pairs.
std::vector<std::pair<std::string, std::size_t>> splitRules(const std::string& style)
{
    std::vector<std::pair<std::string, std::size_t>> parts;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < style.size(); ++i)
    {
        char ch = style[i];
        if (ch == '\'')
        {
            if (i + 1 < style.size() && style[i + 1] == '\'')
            {
                ++i;
                continue;
            }
            if (opensQuote(style, i, true))
            {
                i = skipQuoted(style, i) - 1;
            }
            continue;
        }
        if (ch == '{')
            ++depth;
        else if (ch == '}')
            --depth;
        else if (ch == '|' && depth == 0)
        {
            parts.emplace_back(style.substr(start, i - start), start);
            start = i + 1;
        }
    }
    parts.emplace_back(style.substr(start), start);
    return parts;
}

std::vector<ChoiceRule> parseChoice(const std::string& style, std::size_t base)
{
    std::vector<ChoiceRule> rules;
    for (const auto& [part, part_offset] : splitRules(style))
    {
        const std::size_t offset = base + part_offset;

        std::size_t sep = std::string::npos;
        std::size_t sep_len = 1;
        bool inclusive = true;
        for (std::size_t i = 0; i < part.size(); ++i)
        {
            if (part[i] == '#' || part[i] == '<')
            {
                sep = i;
                inclusive = part[i] == '#';
                break;
            }
            if (part.compare(i, 3, kLessOrEqual) == 0)
            {
                sep = i;
                sep_len = 3;
                inclusive = true;
                break;
            }
        }
        if (sep == std::string::npos)
        {
            throw PatternParseError("choice rule without '#' or '<'", offset);
        }

        ChoiceRule rule;
        rule.bound = parseBound(part.substr(0, sep), offset);
        rule.inclusive = inclusive;

        const std::string message = part.substr(sep + sep_len);
        rule.message = Parser(message, offset + sep + sep_len, true).run();

        if (!rules.empty())
        {
            const ChoiceRule& prev = rules.back();
            bool ascending = rule.bound > prev.bound ||
                             (rule.bound == prev.bound && prev.inclusive && !rule.inclusive);
            if (!ascending)
                throw PatternParseError("choice bounds must be ascending", offset);
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

} // namespace

std::shared_ptr<const CompiledPattern> PatternParser::parse(const std::string& pattern)
{
    return Parser(pattern, 0, false).run();
}

std::vector<ChoiceRule> PatternParser::parseChoiceStyle(const std::string& style)
{
    return parseChoice(style, 0);
}

} // namespace pattern
