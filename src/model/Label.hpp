#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace labels
{

// Output modality a variant is scoped to.
enum class InterfaceType
{
    Text = 0,
    Voice = 1
};

std::string toString(InterfaceType type);
std::optional<InterfaceType> parseInterfaceType(const std::string& name);

struct LabelIdentifier
{
    std::string name_space; // deployment scope, immutable once assigned
    std::string key;

    bool operator==(const LabelIdentifier& other) const = default;

    // "namespace/key", used in logs and as a cache key component
    std::string toString() const;
};

// (locale, connector?, interface?) tuple. Absent connector/interface means the
// variant applies to every channel/modality of the locale.
struct VariantScope
{
    std::string locale;
    std::optional<std::string> connector_type;
    std::optional<InterfaceType> interface_type;

    bool operator==(const VariantScope& other) const = default;

    // 0 = (locale, -, -) ... 2 = (locale, connector, interface)
    int specificity() const;
    std::string toString() const;
};

struct LocalizedVariant
{
    VariantScope scope;
    std::vector<std::string> alternatives; // never empty once stored
    bool validated = false;

    bool operator==(const LocalizedVariant& other) const = default;
};

// Aggregate root owned by the label store.
struct Label
{
    LabelIdentifier identifier;
    std::string default_locale;
    std::string default_text;
    std::vector<LocalizedVariant> variants;

    const LocalizedVariant* findVariant(const VariantScope& scope) const;
    LocalizedVariant* findVariant(const VariantScope& scope);

    // Replaces the variant with the same scope, or appends it.
    void putVariant(LocalizedVariant variant);
};

// Caller context of one render call.
struct RequestContext
{
    std::string locale;
    std::optional<std::string> connector_type;
    std::optional<InterfaceType> interface_type;
};

// Ephemeral result of resolution.
struct ResolvedPattern
{
    std::string pattern;
    std::optional<LocalizedVariant> variant; // absent when falling back to the default text
    bool freshly_created = false;
};

// Usage counters kept per (identifier, scope).
struct LabelUsage
{
    std::uint64_t count = 0;
    std::chrono::system_clock::time_point last_used{};
};

// Candidate scopes, most specific first, with duplicates removed when the
// context carries no connector and/or interface.
std::vector<VariantScope> candidateScopes(const std::string& locale,
                                          const std::optional<std::string>& connector_type,
                                          const std::optional<InterfaceType>& interface_type);

} // namespace labels
