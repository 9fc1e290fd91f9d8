#include "KeyDeriver.hpp"

#include <utf8proc.h>
#include <plog/Log.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

namespace keys
{

namespace
{

constexpr const char* kEmptySlug = "empty";
constexpr std::size_t kHashSuffixLength = 9; // '_' + 8 hex digits

bool isAsciiDigit(char c) { return c >= '0' && c <= '9'; }

std::uint64_t fnv1a64(const std::string& data)
{
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data)
    {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::string hashSuffix(const std::string& data)
{
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << static_cast<std::uint32_t>(fnv1a64(data) & 0xffffffffULL);
    return oss.str();
}

// Returns std::nullopt when the input is not valid UTF-8.
std::optional<std::string> utf8procMap(const std::string& text, utf8proc_option_t options)
{
    if (text.empty())
        return std::string();

    utf8proc_uint8_t* mapped = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &mapped,
                                        static_cast<utf8proc_option_t>(options | UTF8PROC_STABLE));
    if (len < 0 || !mapped)
    {
        PLOG_WARNING << "utf8proc mapping failed: " << utf8proc_errmsg(len);
        return std::nullopt;
    }

    std::string out(reinterpret_cast<char*>(mapped), static_cast<std::size_t>(len));
    std::free(mapped);
    return out;
}

bool isLetterOrNumber(utf8proc_category_t cat)
{
    switch (cat)
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

bool isCombiningMark(utf8proc_category_t cat)
{
    return cat == UTF8PROC_CATEGORY_MN || cat == UTF8PROC_CATEGORY_MC;
}

// Splits a slug into code point byte offsets so truncation never cuts a
// multi-byte sequence.
std::vector<std::size_t> codePointOffsets(const std::string& s)
{
    std::vector<std::size_t> offsets;
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80)
            offsets.push_back(i);
    }
    return offsets;
}

std::string asciiSlug(const std::string& text)
{
    std::string out;
    bool pending_sep = false;
    for (unsigned char c : text)
    {
        if (c < 0x80 && std::isalnum(c))
        {
            if (pending_sep && !out.empty())
                out.push_back('_');
            pending_sep = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        else
        {
            pending_sep = true;
        }
    }
    return out;
}

} // namespace

KeyDeriver::KeyDeriver()
    : KeyDeriver(Options{})
{
}

KeyDeriver::KeyDeriver(Options options)
    : options_(options)
{
}

labels::LabelIdentifier KeyDeriver::derive(const std::string& name_space, const std::string& category,
                                           const std::string& default_text,
                                           const std::optional<std::string>& explicit_key) const
{
    if (explicit_key && !explicit_key->empty())
    {
        return { name_space, *explicit_key };
    }

    std::string key = slug(name_space);
    key += '_';
    key += slug(category);
    key += '_';
    key += slug(normalize(default_text));
    return { name_space, std::move(key) };
}

std::string KeyDeriver::normalize(const std::string& text) const
{
    // NFKC first so full-width digits and braces are seen as their ASCII forms.
    const auto nfkc = static_cast<utf8proc_option_t>(UTF8PROC_COMPOSE | UTF8PROC_COMPAT);
    std::string source = utf8procMap(text, nfkc).value_or(text);

    std::string stripped;
    stripped.reserve(source.size());

    const std::size_t n = source.size();
    std::size_t i = 0;
    while (i < n)
    {
        char c = source[i];

        if (c == '\'')
        {
            if (i + 1 < n && source[i + 1] == '\'')
            {
                stripped.push_back('\'');
                i += 2;
                continue;
            }
            if (i + 1 < n && (source[i + 1] == '{' || source[i + 1] == '}'))
            {
                // Quoted literal: the braces are text, not a placeholder.
                std::size_t end = source.find('\'', i + 1);
                if (end == std::string::npos)
                    end = n;
                stripped.append(source, i + 1, end - (i + 1));
                i = end == n ? n : end + 1;
                continue;
            }
            stripped.push_back(c);
            ++i;
            continue;
        }

        if (c == '{')
        {
            std::size_t depth = 0;
            std::size_t j = i;
            for (; j < n; ++j)
            {
                if (source[j] == '{')
                {
                    ++depth;
                }
                else if (source[j] == '}')
                {
                    if (--depth == 0)
                        break;
                }
            }
            if (j >= n)
            {
                // Unbalanced brace: keep the remainder as plain text.
                stripped.append(source, i, std::string::npos);
                break;
            }
            stripped.push_back(' ');
            i = j + 1;
            continue;
        }

        if (isAsciiDigit(c))
        {
            while (i < n && (isAsciiDigit(source[i]) ||
                             ((source[i] == '.' || source[i] == ',') && i + 1 < n && isAsciiDigit(source[i + 1]))))
            {
                ++i;
            }
            stripped.push_back(' ');
            continue;
        }

        stripped.push_back(c);
        ++i;
    }

    // Collapse whitespace runs and trim.
    std::string out;
    out.reserve(stripped.size());
    bool pending_space = false;
    for (char ch : stripped)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty())
            out.push_back(' ');
        pending_space = false;
        out.push_back(ch);
    }
    return out;
}

std::string KeyDeriver::slug(const std::string& text) const
{
    std::string out;
    auto folded =
        utf8procMap(text, static_cast<utf8proc_option_t>(UTF8PROC_COMPOSE | UTF8PROC_COMPAT | UTF8PROC_CASEFOLD));
    if (!folded)
    {
        out = asciiSlug(text);
    }
    else
    {
        const auto* data = reinterpret_cast<const utf8proc_uint8_t*>(folded->data());
        utf8proc_ssize_t remaining = static_cast<utf8proc_ssize_t>(folded->size());
        bool pending_sep = false;
        while (remaining > 0)
        {
            utf8proc_int32_t cp = 0;
            utf8proc_ssize_t consumed = utf8proc_iterate(data, remaining, &cp);
            if (consumed <= 0)
                break;
            data += consumed;
            remaining -= consumed;

            utf8proc_category_t cat = utf8proc_category(cp);
            bool keep = isLetterOrNumber(cat) || (isCombiningMark(cat) && !out.empty() && !pending_sep);
            if (!keep)
            {
                pending_sep = true;
                continue;
            }

            if (pending_sep && !out.empty())
                out.push_back('_');
            pending_sep = false;

            utf8proc_uint8_t buf[4];
            utf8proc_ssize_t written = utf8proc_encode_char(cp, buf);
            out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(written));
        }
    }

    if (out.empty())
        return kEmptySlug;

    auto offsets = codePointOffsets(out);
    if (offsets.size() <= options_.max_length)
        return out;

    const std::string suffix = hashSuffix(out);
    const std::size_t keep = options_.max_length > kHashSuffixLength ? options_.max_length - kHashSuffixLength : 0;
    std::string truncated = out.substr(0, keep < offsets.size() ? offsets[keep] : out.size());
    while (!truncated.empty() && truncated.back() == '_')
        truncated.pop_back();

    if (truncated.empty())
        return suffix;
    return truncated + "_" + suffix;
}

} // namespace keys
