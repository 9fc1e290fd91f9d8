#include "ResolutionEngine.hpp"
#include "model/LabelErrors.hpp"
#include "utils/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace labels
{

using utils::Diagnostics;

ResolutionEngine::ResolutionEngine(ILabelStore& store, std::shared_ptr<IRandomSource> random)
    : ResolutionEngine(store, std::move(random), Options{})
{
}

ResolutionEngine::ResolutionEngine(ILabelStore& store, std::shared_ptr<IRandomSource> random, Options options)
    : store_(store)
    , random_(random ? std::move(random) : processRandomSource())
    , options_(std::move(options))
    , deriver_(options_.key_options)
{
}

ResolvedPattern ResolutionEngine::resolve(const LabelIdentifier& identifier, const std::string& default_text,
                                          const RequestContext& context)
{
    ResolveRequest request;
    request.identifier = identifier;
    request.default_text = default_text;
    return resolve(request, context);
}

ResolvedPattern ResolutionEngine::resolve(const ResolveRequest& request, const RequestContext& context)
{
    const std::string locale = context.locale.empty() ? options_.default_locale : context.locale;

    ResolvedPattern resolved;
    std::optional<Label> label = store_.getLabel(request.identifier);
    if (!label)
    {
        UpsertResult created = createLabel(request, locale);
        resolved.freshly_created = created.inserted;
        label = std::move(created.label);
    }
    else if (request.derived_key)
    {
        checkCollision(*label, request.default_text);
    }

    const LocalizedVariant* chosen = chooseVariant(*label, locale, context);
    if (chosen)
    {
        const std::size_t index = random_->pick(chosen->alternatives.size());
        resolved.pattern = chosen->alternatives[index < chosen->alternatives.size() ? index : 0];
        resolved.variant = *chosen;
        if (options_.track_usage)
        {
            store_.recordUsage(label->identifier, chosen->scope);
        }
    }
    else
    {
        resolved.pattern = label->default_text;
    }

    if (Diagnostics::IsVerbose(utils::TraceStage::Resolve))
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[ResolutionEngine] label=" << request.identifier.toString() << " locale=" << locale
            << " variant=" << (chosen ? chosen->scope.toString() : std::string("default-text"))
            << " created=" << (resolved.freshly_created ? "yes" : "no")
            << " pattern=" << Diagnostics::Preview(resolved.pattern);
    }
    return resolved;
}

UpsertResult ResolutionEngine::createLabel(const ResolveRequest& request, const std::string& locale)
{
    Label label;
    label.identifier = request.identifier;
    label.default_locale = locale;
    label.default_text = request.default_text;
    label.variants.push_back(LocalizedVariant{ VariantScope{ locale, std::nullopt, std::nullopt },
                                               { request.default_text },
                                               false });
    // A code-declared translation takes the place of the default text in its scope.
    for (const auto& seeded : request.default_variants)
    {
        if (!seeded.alternatives.empty())
            label.putVariant(seeded);
    }

    try
    {
        UpsertResult result = store_.upsertIfAbsent(std::move(label));
        if (result.inserted)
        {
            PLOG_INFO << "[ResolutionEngine] created label " << request.identifier.toString() << " (" << locale << ")";
        }
        return result;
    }
    catch (const StoreWriteConflict& conflict)
    {
        // A concurrent writer created the row first: read it back once.
        PLOG_WARNING << "[ResolutionEngine] create conflict for " << request.identifier.toString() << ": "
                     << conflict.what() << ", retrying as read";
        if (auto existing = store_.getLabel(request.identifier))
        {
            return UpsertResult{ std::move(*existing), false };
        }
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Store, "Label creation failed",
                                          request.identifier.toString() + ": " + conflict.what());
        throw StoreUnavailableError("label " + request.identifier.toString() +
                                    " could not be created or read after a write conflict");
    }
}

void ResolutionEngine::checkCollision(Label& label, const std::string& incoming_text)
{
    if (label.default_text == incoming_text)
        return;

    const std::string stored_form = deriver_.normalize(label.default_text);
    const std::string incoming_form = deriver_.normalize(incoming_text);
    if (stored_form == incoming_form)
        return;

    collisions_.fetch_add(1, std::memory_order_relaxed);

    bool first_report = false;
    {
        std::lock_guard<std::mutex> lock(reported_mutex_);
        first_report = reported_collisions_.insert(label.identifier.toString() + '\x1f' + incoming_form).second;
    }

    if (first_report)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::KeyCollision,
                                            "Two default texts derive the same label key",
                                            label.identifier.toString() + ": '" +
                                                Diagnostics::Preview(label.default_text) + "' replaced by '" +
                                                Diagnostics::Preview(incoming_text) + "'");
    }
    else
    {
        PLOG_WARNING << "[ResolutionEngine] key collision on " << label.identifier.toString();
    }

    // Last writer wins. The seeded first-use variant follows the default text;
    // validated or edited variants are left alone.
    const std::string previous_text = label.default_text;
    store_.replaceDefaultText(label.identifier, incoming_text);
    label.default_text = incoming_text;

    const VariantScope seeded_scope{ label.default_locale, std::nullopt, std::nullopt };
    const LocalizedVariant* seeded = label.findVariant(seeded_scope);
    if (seeded && !seeded->validated && seeded->alternatives == std::vector<std::string>{ previous_text })
    {
        LocalizedVariant updated = *seeded;
        updated.alternatives = { incoming_text };
        store_.saveVariant(label.identifier, updated);
        label.putVariant(std::move(updated));
    }
}

const LocalizedVariant* ResolutionEngine::chooseVariant(const Label& label, const std::string& locale,
                                                        const RequestContext& context) const
{
    auto search = [&](const std::string& search_locale) -> const LocalizedVariant*
    {
        for (const auto& scope : candidateScopes(search_locale, context.connector_type, context.interface_type))
        {
            const LocalizedVariant* variant = label.findVariant(scope);
            if (variant && !variant->alternatives.empty())
                return variant;
        }
        return nullptr;
    };

    if (const auto* variant = search(locale))
        return variant;
    if (!label.default_locale.empty() && label.default_locale != locale)
        return search(label.default_locale);
    return nullptr;
}

} // namespace labels
