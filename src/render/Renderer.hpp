#pragma once

#include "keys/KeyDeriver.hpp"
#include "model/Label.hpp"
#include "pattern/Argument.hpp"
#include "pattern/PatternCache.hpp"
#include "pattern/PatternFormatter.hpp"
#include "resolve/RandomSource.hpp"
#include "resolve/ResolutionEngine.hpp"
#include "store/ILabelStore.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace labels
{

struct EngineConfig;

// What a call site asks to render.
struct LabelRequest
{
    std::string name_space;
    std::string category;
    std::string default_text;
    std::optional<std::string> explicit_key;
    std::vector<LocalizedVariant> default_variants;

    // Key derived from (namespace, category, text).
    static LabelRequest text(std::string name_space, std::string category, std::string default_text);

    // Caller-chosen key, for texts whose derived keys would collide.
    static LabelRequest withKey(std::string name_space, std::string key, std::string default_text);

    // Adds a code-declared translation, seeded when the label is first created.
    LabelRequest& withDefault(std::string locale, std::string text);
};

struct RenderOutcome
{
    std::string text;                  // rendered text, or the unformatted default text
    bool succeeded = true;
    std::optional<std::string> error;  // reason when falling back
};

/**
 * @brief Caller-facing entry point: derive, resolve, format
 *
 * The store and random source are injected; the renderer owns the compiled
 * pattern cache and drops entries when the store reports an edited variant.
 * Safe to call from many threads.
 */
class Renderer
{
public:
    struct Options
    {
        ResolutionEngine::Options resolution;
        std::size_t pattern_cache_capacity = 4096;
        std::string time_zone = "UTC";

        static Options from(const EngineConfig& config);
    };

    explicit Renderer(ILabelStore& store, std::shared_ptr<IRandomSource> random = nullptr);
    Renderer(ILabelStore& store, std::shared_ptr<IRandomSource> random, Options options);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    /**
     * @brief Render a label for a request context
     * @throws pattern::PatternParseError stored pattern is malformed
     * @throws pattern::PatternFormatError arguments do not fit the pattern
     * @throws StoreUnavailableError the store failed
     */
    [[nodiscard]] std::string render(const LabelRequest& request, const RequestContext& context,
                                     const pattern::Arguments& args = {});

    // Formats `text` as a pattern directly: no key, no store access, no caching.
    [[nodiscard]] std::string raw(const std::string& text, const std::string& locale,
                                  const pattern::Arguments& args = {});

    // Like render(), but engine errors yield the unformatted default text.
    [[nodiscard]] RenderOutcome renderOrFallback(const LabelRequest& request, const RequestContext& context,
                                                 const pattern::Arguments& args = {});

    [[nodiscard]] LabelIdentifier identify(const LabelRequest& request) const;

    // Administrative edit path.
    void saveVariant(const LabelIdentifier& identifier, const LocalizedVariant& variant);

    ResolutionEngine& engine() { return engine_; }
    const pattern::PatternCache& cache() const { return cache_; }
    const keys::KeyDeriver& keyDeriver() const { return deriver_; }

    static std::string cacheOwner(const LabelIdentifier& identifier, const VariantScope& scope);

private:
    ILabelStore& store_;
    Options options_;
    keys::KeyDeriver deriver_;
    ResolutionEngine engine_;
    pattern::PatternCache cache_;
    pattern::PatternFormatter formatter_;
    std::size_t listener_token_ = 0;
};

} // namespace labels
