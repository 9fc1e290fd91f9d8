#pragma once

#include "RandomSource.hpp"
#include "keys/KeyDeriver.hpp"
#include "model/Label.hpp"
#include "store/ILabelStore.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace labels
{

struct ResolveRequest
{
    LabelIdentifier identifier;
    std::string default_text;
    // Collision detection only applies to derived keys; explicit keys are
    // unique by contract.
    bool derived_key = true;
    // Code-declared variants for other locales, seeded when the label is created.
    std::vector<LocalizedVariant> default_variants;
};

/**
 * @brief Resolves a label identifier to one concrete pattern string
 *
 * Search order for a context (l, c, i): (l,c,i), (l,c,-), (l,-,i), (l,-,-),
 * then the same against the label's default locale, then the default text.
 * Unknown identifiers are created on first use with one unvalidated variant
 * at (l,-,-) holding the default text.
 *
 * The engine keeps no label state between calls; everything is read from the
 * store per request.
 */
class ResolutionEngine
{
public:
    struct Options
    {
        std::string default_locale = "en"; // used when a context carries no locale
        bool track_usage = true;
        keys::KeyDeriver::Options key_options;
    };

    ResolutionEngine(ILabelStore& store, std::shared_ptr<IRandomSource> random);
    ResolutionEngine(ILabelStore& store, std::shared_ptr<IRandomSource> random, Options options);

    // Throws StoreUnavailableError when the store fails.
    [[nodiscard]] ResolvedPattern resolve(const LabelIdentifier& identifier, const std::string& default_text,
                                          const RequestContext& context);
    [[nodiscard]] ResolvedPattern resolve(const ResolveRequest& request, const RequestContext& context);

    std::uint64_t collisionCount() const { return collisions_.load(std::memory_order_relaxed); }
    const Options& options() const { return options_; }

private:
    UpsertResult createLabel(const ResolveRequest& request, const std::string& locale);
    void checkCollision(Label& label, const std::string& incoming_text);
    const LocalizedVariant* chooseVariant(const Label& label, const std::string& locale,
                                          const RequestContext& context) const;

    ILabelStore& store_;
    std::shared_ptr<IRandomSource> random_;
    Options options_;
    keys::KeyDeriver deriver_;

    std::atomic<std::uint64_t> collisions_{ 0 };
    std::mutex reported_mutex_;
    std::unordered_set<std::string> reported_collisions_;
};

} // namespace labels
