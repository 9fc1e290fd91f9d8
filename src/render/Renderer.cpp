#include "Renderer.hpp"
#include "config/EngineConfig.hpp"
#include "model/LabelErrors.hpp"
#include "pattern/PatternErrors.hpp"
#include "pattern/PatternParser.hpp"
#include "utils/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace labels
{

using utils::Diagnostics;

namespace
{

RenderOutcome fallback(const LabelRequest& request, utils::ErrorCategory category, const std::string& reason)
{
    utils::ErrorReporter::ReportWarning(category, "Label rendered with its unformatted default text",
                                        request.name_space + "/" + Diagnostics::Preview(request.default_text) +
                                            ": " + reason);
    RenderOutcome outcome;
    outcome.text = request.default_text;
    outcome.succeeded = false;
    outcome.error = reason;
    return outcome;
}

} // namespace

LabelRequest LabelRequest::text(std::string name_space, std::string category, std::string default_text)
{
    LabelRequest request;
    request.name_space = std::move(name_space);
    request.category = std::move(category);
    request.default_text = std::move(default_text);
    return request;
}

LabelRequest LabelRequest::withKey(std::string name_space, std::string key, std::string default_text)
{
    LabelRequest request;
    request.name_space = std::move(name_space);
    request.explicit_key = std::move(key);
    request.default_text = std::move(default_text);
    return request;
}

LabelRequest& LabelRequest::withDefault(std::string locale, std::string text)
{
    LocalizedVariant variant;
    variant.scope.locale = std::move(locale);
    variant.alternatives.push_back(std::move(text));
    variant.validated = true;
    default_variants.push_back(std::move(variant));
    return *this;
}

Renderer::Options Renderer::Options::from(const EngineConfig& config)
{
    Options options;
    options.resolution.default_locale = config.default_locale;
    options.resolution.track_usage = config.track_usage;
    options.resolution.key_options.max_length = config.key_max_length;
    options.pattern_cache_capacity = config.pattern_cache_capacity;
    options.time_zone = config.time_zone;
    return options;
}

Renderer::Renderer(ILabelStore& store, std::shared_ptr<IRandomSource> random)
    : Renderer(store, std::move(random), Options{})
{
}

Renderer::Renderer(ILabelStore& store, std::shared_ptr<IRandomSource> random, Options options)
    : store_(store)
    , options_(std::move(options))
    , deriver_(options_.resolution.key_options)
    , engine_(store, std::move(random), options_.resolution)
    , cache_(options_.pattern_cache_capacity)
    , formatter_(pattern::LocaleFormatter(options_.time_zone))
{
    listener_token_ = store_.addChangeListener(
        [this](const LabelIdentifier& identifier, const VariantScope& scope)
        {
            const std::size_t dropped = cache_.invalidate(cacheOwner(identifier, scope));
            if (dropped > 0)
            {
                PLOG_DEBUG << "[Renderer] dropped " << dropped << " compiled pattern(s) of " << identifier.toString()
                           << " " << scope.toString();
            }
        });
}

Renderer::~Renderer()
{
    store_.removeChangeListener(listener_token_);
}

std::string Renderer::cacheOwner(const LabelIdentifier& identifier, const VariantScope& scope)
{
    return identifier.toString() + "#" + scope.toString();
}

LabelIdentifier Renderer::identify(const LabelRequest& request) const
{
    return deriver_.derive(request.name_space, request.category, request.default_text, request.explicit_key);
}

std::string Renderer::render(const LabelRequest& request, const RequestContext& context,
                             const pattern::Arguments& args)
{
    ResolveRequest resolve_request;
    resolve_request.identifier = identify(request);
    resolve_request.default_text = request.default_text;
    resolve_request.derived_key = !(request.explicit_key && !request.explicit_key->empty());
    resolve_request.default_variants = request.default_variants;

    ResolvedPattern resolved = engine_.resolve(resolve_request, context);

    const std::string owner = resolved.variant ? cacheOwner(resolve_request.identifier, resolved.variant->scope)
                                               : resolve_request.identifier.toString() + "#default";
    auto compiled = cache_.get(owner, resolved.pattern);

    const std::string& locale = context.locale.empty() ? options_.resolution.default_locale : context.locale;
    std::string text = formatter_.render(*compiled, args, locale);

    if (Diagnostics::IsVerbose(utils::TraceStage::Render))
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[Renderer] label=" << resolve_request.identifier.toString()
                                              << " output=" << Diagnostics::Preview(text);
    }
    return text;
}

std::string Renderer::raw(const std::string& text, const std::string& locale, const pattern::Arguments& args)
{
    // Ad-hoc text is compiled per call so it never evicts label patterns.
    auto compiled = pattern::PatternParser::parse(text);
    return formatter_.render(*compiled, args, locale.empty() ? options_.resolution.default_locale : locale);
}

RenderOutcome Renderer::renderOrFallback(const LabelRequest& request, const RequestContext& context,
                                         const pattern::Arguments& args)
{
    try
    {
        RenderOutcome outcome;
        outcome.text = render(request, context, args);
        return outcome;
    }
    catch (const pattern::PatternParseError& ex)
    {
        return fallback(request, utils::ErrorCategory::Pattern, ex.what());
    }
    catch (const pattern::PatternFormatError& ex)
    {
        return fallback(request, utils::ErrorCategory::Pattern, ex.what());
    }
    catch (const StoreUnavailableError& ex)
    {
        return fallback(request, utils::ErrorCategory::Store, ex.what());
    }
    catch (const LabelError& ex)
    {
        return fallback(request, utils::ErrorCategory::Resolution, ex.what());
    }
}

void Renderer::saveVariant(const LabelIdentifier& identifier, const LocalizedVariant& variant)
{
    store_.saveVariant(identifier, variant);
    PLOG_INFO << "[Renderer] variant " << variant.scope.toString() << " of " << identifier.toString() << " saved";
}

} // namespace labels
