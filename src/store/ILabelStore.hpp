#pragma once

#include "model/Label.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace labels
{

struct UpsertResult
{
    Label label;           // the persisted row, ours or a concurrent writer's
    bool inserted = false; // true when this call created it
};

// Called after a variant of a label was written (edit or import).
using ChangeListener = std::function<void(const LabelIdentifier& identifier, const VariantScope& scope)>;

/**
 * @brief Contract of the label store collaborator
 *
 * The store owns label lifetime and hands out copies. Implementations must
 * allow concurrent readers and serialize writes per identifier; upsertIfAbsent
 * creates at most one row per identifier.
 *
 * Failures of the backing storage surface as StoreUnavailableError. A create
 * that lost a race may surface as StoreWriteConflict.
 */
class ILabelStore
{
public:
    virtual ~ILabelStore() = default;

    virtual std::optional<Label> getLabel(const LabelIdentifier& identifier) const = 0;

    // Atomic create-or-fetch keyed by (namespace, key).
    virtual UpsertResult upsertIfAbsent(Label label) = 0;

    virtual std::optional<LocalizedVariant> findVariant(const LabelIdentifier& identifier,
                                                        const VariantScope& scope) const = 0;

    // Administrative edit: insert or replace the variant at its scope and
    // notify change listeners.
    virtual void saveVariant(const LabelIdentifier& identifier, const LocalizedVariant& variant) = 0;

    // Last-writer-wins update used when two default texts collide on one key.
    virtual void replaceDefaultText(const LabelIdentifier& identifier, const std::string& default_text) = 0;

    virtual void recordUsage(const LabelIdentifier& identifier, const VariantScope& scope) = 0;
    virtual std::optional<LabelUsage> usage(const LabelIdentifier& identifier, const VariantScope& scope) const = 0;

    virtual std::vector<Label> listLabels() const = 0;

    // Returns a token for removeChangeListener. Listeners run on the writing
    // thread and must not add or remove listeners themselves.
    virtual std::size_t addChangeListener(ChangeListener listener) = 0;

    // Returns only after every running call of the listener has finished, so
    // the listener's captures may be destroyed afterwards.
    virtual void removeChangeListener(std::size_t token) = 0;
};

} // namespace labels
