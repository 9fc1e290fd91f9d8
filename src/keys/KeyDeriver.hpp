#pragma once

#include "model/Label.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace keys
{

/**
 * @brief Maps a default text literal plus its calling context to a stable label key.
 *
 * Derived keys look like `slug(namespace)_slug(category)_slug(text)`. Before
 * slugging, `{...}` placeholders and raw numeric fragments are removed from the
 * text so that "You have 3 files" and "You have 12 files" share one key.
 * Arguments therefore have to go through placeholders; text built with
 * host-language interpolation must be rendered raw.
 *
 * Pure: no store access, safe to share between threads.
 */
class KeyDeriver
{
public:
    struct Options
    {
        // Upper bound in code points of each slug, hash suffix included.
        std::size_t max_length = 48;
    };

    KeyDeriver();
    explicit KeyDeriver(Options options);

    /**
     * @brief Compute the identifier of a label
     * @param explicit_key When present and non-empty it is used verbatim.
     */
    [[nodiscard]] labels::LabelIdentifier derive(const std::string& name_space, const std::string& category,
                                                 const std::string& default_text,
                                                 const std::optional<std::string>& explicit_key = std::nullopt) const;

    // Default text with placeholders and numbers removed and whitespace
    // collapsed. Two texts with the same key but different normalized forms
    // are a key collision.
    [[nodiscard]] std::string normalize(const std::string& text) const;

    // NFKC + case folded, non alphanumeric runs replaced by '_', bounded length.
    [[nodiscard]] std::string slug(const std::string& text) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};

} // namespace keys
