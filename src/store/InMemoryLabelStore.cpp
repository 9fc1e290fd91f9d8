#include "InMemoryLabelStore.hpp"
#include "model/LabelErrors.hpp"
#include "utils/Diagnostics.hpp"

#include <plog/Log.h>

namespace labels
{

std::string InMemoryLabelStore::rowKey(const LabelIdentifier& identifier)
{
    std::string key;
    key.reserve(identifier.name_space.size() + identifier.key.size() + 1);
    key += identifier.name_space;
    key += '\x1f';
    key += identifier.key;
    return key;
}

std::string InMemoryLabelStore::usageKey(const LabelIdentifier& identifier, const VariantScope& scope)
{
    return rowKey(identifier) + '\x1f' + scope.toString();
}

std::optional<Label> InMemoryLabelStore::getLabel(const LabelIdentifier& identifier) const
{
    std::shared_lock lock(mutex_);
    auto it = labels_.find(rowKey(identifier));
    if (it == labels_.end())
        return std::nullopt;
    return it->second;
}

UpsertResult InMemoryLabelStore::upsertIfAbsent(Label label)
{
    const std::string key = rowKey(label.identifier);
    std::unique_lock lock(mutex_);
    auto [it, inserted] = labels_.try_emplace(key, std::move(label));
    if (inserted)
    {
        PLOG_DEBUG << "[InMemoryLabelStore] created " << it->second.identifier.toString();
    }
    return UpsertResult{ it->second, inserted };
}

std::optional<LocalizedVariant> InMemoryLabelStore::findVariant(const LabelIdentifier& identifier,
                                                                const VariantScope& scope) const
{
    std::shared_lock lock(mutex_);
    auto it = labels_.find(rowKey(identifier));
    if (it == labels_.end())
        return std::nullopt;
    if (const auto* variant = it->second.findVariant(scope))
        return *variant;
    return std::nullopt;
}

void InMemoryLabelStore::saveVariant(const LabelIdentifier& identifier, const LocalizedVariant& variant)
{
    if (variant.alternatives.empty())
    {
        throw LabelError("variant " + variant.scope.toString() + " of " + identifier.toString() +
                         " has no alternatives");
    }

    {
        std::unique_lock lock(mutex_);
        auto it = labels_.find(rowKey(identifier));
        if (it == labels_.end())
        {
            throw LabelError("unknown label " + identifier.toString());
        }
        it->second.putVariant(variant);
    }
    if (utils::Diagnostics::IsVerbose(utils::TraceStage::Store))
    {
        PLOG_INFO_(utils::Diagnostics::kLogInstance)
            << "[InMemoryLabelStore] saved " << identifier.toString() << " " << variant.scope.toString()
            << " validated=" << (variant.validated ? "yes" : "no")
            << " first=" << utils::Diagnostics::Preview(variant.alternatives.front());
    }
    notify(identifier, variant.scope);
}

void InMemoryLabelStore::replaceDefaultText(const LabelIdentifier& identifier, const std::string& default_text)
{
    std::unique_lock lock(mutex_);
    auto it = labels_.find(rowKey(identifier));
    if (it == labels_.end())
    {
        throw LabelError("unknown label " + identifier.toString());
    }
    it->second.default_text = default_text;
    if (utils::Diagnostics::IsVerbose(utils::TraceStage::Store))
    {
        PLOG_INFO_(utils::Diagnostics::kLogInstance) << "[InMemoryLabelStore] default text of "
                                                     << identifier.toString() << " is now "
                                                     << utils::Diagnostics::Preview(default_text);
    }
}

void InMemoryLabelStore::recordUsage(const LabelIdentifier& identifier, const VariantScope& scope)
{
    std::lock_guard<std::mutex> lock(usage_mutex_);
    auto& entry = usage_[usageKey(identifier, scope)];
    ++entry.count;
    entry.last_used = std::chrono::system_clock::now();
}

std::optional<LabelUsage> InMemoryLabelStore::usage(const LabelIdentifier& identifier, const VariantScope& scope) const
{
    std::lock_guard<std::mutex> lock(usage_mutex_);
    auto it = usage_.find(usageKey(identifier, scope));
    if (it == usage_.end())
        return std::nullopt;
    return it->second;
}

std::vector<Label> InMemoryLabelStore::listLabels() const
{
    std::shared_lock lock(mutex_);
    std::vector<Label> out;
    out.reserve(labels_.size());
    for (const auto& [key, label] : labels_)
    {
        out.push_back(label);
    }
    return out;
}

std::size_t InMemoryLabelStore::addChangeListener(ChangeListener listener)
{
    std::unique_lock lock(listener_mutex_);
    const std::size_t token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void InMemoryLabelStore::removeChangeListener(std::size_t token)
{
    std::unique_lock lock(listener_mutex_);
    listeners_.erase(token);
}

std::size_t InMemoryLabelStore::size() const
{
    std::shared_lock lock(mutex_);
    return labels_.size();
}

void InMemoryLabelStore::notify(const LabelIdentifier& identifier, const VariantScope& scope) const
{
    // Held for the whole dispatch: removeChangeListener() waits for running calls.
    std::shared_lock lock(listener_mutex_);
    for (const auto& [token, listener] : listeners_)
    {
        listener(identifier, scope);
    }
}

} // namespace labels
