#pragma once

#include "ILabelStore.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace labels
{

// Process-local label store. Reference implementation of ILabelStore and the
// store used by the command line tool and the tests.
class InMemoryLabelStore : public ILabelStore
{
public:
    InMemoryLabelStore() = default;

    InMemoryLabelStore(const InMemoryLabelStore&) = delete;
    InMemoryLabelStore& operator=(const InMemoryLabelStore&) = delete;

    std::optional<Label> getLabel(const LabelIdentifier& identifier) const override;
    UpsertResult upsertIfAbsent(Label label) override;
    std::optional<LocalizedVariant> findVariant(const LabelIdentifier& identifier,
                                                const VariantScope& scope) const override;
    void saveVariant(const LabelIdentifier& identifier, const LocalizedVariant& variant) override;
    void replaceDefaultText(const LabelIdentifier& identifier, const std::string& default_text) override;
    void recordUsage(const LabelIdentifier& identifier, const VariantScope& scope) override;
    std::optional<LabelUsage> usage(const LabelIdentifier& identifier, const VariantScope& scope) const override;
    std::vector<Label> listLabels() const override;
    std::size_t addChangeListener(ChangeListener listener) override;
    void removeChangeListener(std::size_t token) override;

    std::size_t size() const;

private:
    static std::string rowKey(const LabelIdentifier& identifier);
    static std::string usageKey(const LabelIdentifier& identifier, const VariantScope& scope);
    void notify(const LabelIdentifier& identifier, const VariantScope& scope) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Label> labels_;

    mutable std::mutex usage_mutex_;
    std::unordered_map<std::string, LabelUsage> usage_;

    mutable std::shared_mutex listener_mutex_;
    std::map<std::size_t, ChangeListener> listeners_;
    std::size_t next_token_ = 1;
};

} // namespace labels
