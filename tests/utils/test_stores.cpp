#include "test_stores.hpp"

#include "model/LabelErrors.hpp"

namespace test_utils
{

using namespace labels;

std::optional<Label> ConflictingStore::getLabel(const LabelIdentifier& identifier) const
{
    return inner_.getLabel(identifier);
}

UpsertResult ConflictingStore::upsertIfAbsent(Label label)
{
    conflicts_.fetch_add(1);
    const std::string id = label.identifier.toString();
    if (concurrent_writer_)
    {
        label.default_text = "written by the other writer";
        (void)inner_.upsertIfAbsent(std::move(label));
    }
    throw StoreWriteConflict("unique violation on " + id);
}

std::optional<LocalizedVariant> ConflictingStore::findVariant(const LabelIdentifier& identifier,
                                                              const VariantScope& scope) const
{
    return inner_.findVariant(identifier, scope);
}

void ConflictingStore::saveVariant(const LabelIdentifier& identifier, const LocalizedVariant& variant)
{
    inner_.saveVariant(identifier, variant);
}

void ConflictingStore::replaceDefaultText(const LabelIdentifier& identifier, const std::string& default_text)
{
    inner_.replaceDefaultText(identifier, default_text);
}

void ConflictingStore::recordUsage(const LabelIdentifier& identifier, const VariantScope& scope)
{
    inner_.recordUsage(identifier, scope);
}

std::optional<LabelUsage> ConflictingStore::usage(const LabelIdentifier& identifier, const VariantScope& scope) const
{
    return inner_.usage(identifier, scope);
}

std::vector<Label> ConflictingStore::listLabels() const { return inner_.listLabels(); }

std::size_t ConflictingStore::addChangeListener(ChangeListener listener)
{
    return inner_.addChangeListener(std::move(listener));
}

void ConflictingStore::removeChangeListener(std::size_t token) { inner_.removeChangeListener(token); }

namespace
{
[[noreturn]] void down() { throw StoreUnavailableError("connection refused"); }
} // namespace

std::optional<Label> UnavailableStore::getLabel(const LabelIdentifier&) const { down(); }
UpsertResult UnavailableStore::upsertIfAbsent(Label) { down(); }
std::optional<LocalizedVariant> UnavailableStore::findVariant(const LabelIdentifier&, const VariantScope&) const
{
    down();
}
void UnavailableStore::saveVariant(const LabelIdentifier&, const LocalizedVariant&) { down(); }
void UnavailableStore::replaceDefaultText(const LabelIdentifier&, const std::string&) { down(); }
void UnavailableStore::recordUsage(const LabelIdentifier&, const VariantScope&) { down(); }
std::optional<LabelUsage> UnavailableStore::usage(const LabelIdentifier&, const VariantScope&) const { down(); }
std::vector<Label> UnavailableStore::listLabels() const { down(); }
std::size_t UnavailableStore::addChangeListener(ChangeListener) { return 0; }
void UnavailableStore::removeChangeListener(std::size_t) {}

} // namespace test_utils
