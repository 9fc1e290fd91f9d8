#pragma once

#include "ILabelStore.hpp"
#include "model/Label.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace labels
{

// One exported label: identity, default text and every stored variant.
struct LabelRecord
{
    LabelIdentifier identifier;
    std::string default_locale;
    std::string default_text;
    std::vector<LocalizedVariant> variants;
};

struct MergeStats
{
    std::size_t labels_created = 0;
    std::size_t variants_written = 0;
    std::size_t variants_skipped = 0;
};

/**
 * @brief Bulk import and export of labels as JSON
 *
 * Document shape:
 *   { "labels": [ { "namespace", "key", "default_locale", "default_text",
 *                   "variants": [ { "locale", "connector"?, "interface"?,
 *                                   "alternatives": [...], "validated" } ] } ] }
 *
 * Merging never deletes. Validated variants overwrite the stored variant of
 * the same scope; unvalidated ones are only added where no variant exists.
 */
class LabelImporter
{
public:
    static bool parse(const std::string& jsonContent, std::vector<LabelRecord>& outRecords, std::string& outError);
    static bool parseFile(const std::string& filePath, std::vector<LabelRecord>& outRecords, std::string& outError);

    static std::string serialize(const std::vector<LabelRecord>& records, int indent = 2);

    static MergeStats merge(ILabelStore& store, const std::vector<LabelRecord>& records);
    static std::vector<LabelRecord> exportAll(const ILabelStore& store);

private:
    static bool validate(const LabelRecord& record, std::string& outError);
};

} // namespace labels
