#include "Label.hpp"

#include <algorithm>
#include <cctype>

namespace labels
{

std::string toString(InterfaceType type)
{
    switch (type)
    {
    case InterfaceType::Text:
        return "text";
    case InterfaceType::Voice:
        return "voice";
    }
    return "text";
}

std::optional<InterfaceType> parseInterfaceType(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "text")
        return InterfaceType::Text;
    if (lower == "voice")
        return InterfaceType::Voice;
    return std::nullopt;
}

std::string LabelIdentifier::toString() const { return name_space + "/" + key; }

int VariantScope::specificity() const
{
    return (connector_type ? 1 : 0) + (interface_type ? 1 : 0);
}

std::string VariantScope::toString() const
{
    std::string out = locale;
    out += "|";
    out += connector_type.value_or("*");
    out += "|";
    out += interface_type ? labels::toString(*interface_type) : std::string("*");
    return out;
}

const LocalizedVariant* Label::findVariant(const VariantScope& scope) const
{
    auto it = std::find_if(variants.begin(), variants.end(),
                           [&](const LocalizedVariant& v) { return v.scope == scope; });
    return it == variants.end() ? nullptr : &*it;
}

LocalizedVariant* Label::findVariant(const VariantScope& scope)
{
    auto it = std::find_if(variants.begin(), variants.end(),
                           [&](const LocalizedVariant& v) { return v.scope == scope; });
    return it == variants.end() ? nullptr : &*it;
}

void Label::putVariant(LocalizedVariant variant)
{
    if (auto* existing = findVariant(variant.scope))
    {
        *existing = std::move(variant);
        return;
    }
    variants.push_back(std::move(variant));
}

std::vector<VariantScope> candidateScopes(const std::string& locale,
                                          const std::optional<std::string>& connector_type,
                                          const std::optional<InterfaceType>& interface_type)
{
    std::vector<VariantScope> out;
    out.reserve(4);
    auto add = [&](VariantScope scope)
    {
        if (std::find(out.begin(), out.end(), scope) == out.end())
            out.push_back(std::move(scope));
    };

    add({ locale, connector_type, interface_type });
    add({ locale, connector_type, std::nullopt });
    add({ locale, std::nullopt, interface_type });
    add({ locale, std::nullopt, std::nullopt });
    return out;
}

} // namespace labels
