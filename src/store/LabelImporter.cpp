#include "LabelImporter.hpp"
#include "model/LabelErrors.hpp"
#include "utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace labels
{

void to_json(json& j, const LocalizedVariant& variant)
{
    j = json{ { "locale", variant.scope.locale },
              { "alternatives", variant.alternatives },
              { "validated", variant.validated } };
    if (variant.scope.connector_type)
        j["connector"] = *variant.scope.connector_type;
    if (variant.scope.interface_type)
        j["interface"] = toString(*variant.scope.interface_type);
}

void from_json(const json& j, LocalizedVariant& variant)
{
    variant.scope.locale = j.at("locale").get<std::string>();
    if (j.contains("connector") && !j["connector"].is_null())
        variant.scope.connector_type = j["connector"].get<std::string>();
    if (j.contains("interface") && !j["interface"].is_null())
    {
        const auto name = j["interface"].get<std::string>();
        variant.scope.interface_type = parseInterfaceType(name);
        if (!variant.scope.interface_type)
            throw LabelError("unknown interface type '" + name + "'");
    }
    variant.alternatives = j.at("alternatives").get<std::vector<std::string>>();
    variant.validated = j.value("validated", false);
}

void to_json(json& j, const LabelRecord& record)
{
    j = json{ { "namespace", record.identifier.name_space },
              { "key", record.identifier.key },
              { "default_locale", record.default_locale },
              { "default_text", record.default_text },
              { "variants", record.variants } };
}

void from_json(const json& j, LabelRecord& record)
{
    record.identifier.name_space = j.at("namespace").get<std::string>();
    record.identifier.key = j.at("key").get<std::string>();
    record.default_locale = j.value("default_locale", "");
    record.default_text = j.value("default_text", "");
    if (j.contains("variants"))
        record.variants = j["variants"].get<std::vector<LocalizedVariant>>();
}

bool LabelImporter::parse(const std::string& jsonContent, std::vector<LabelRecord>& outRecords, std::string& outError)
{
    try
    {
        json document = json::parse(jsonContent);
        if (!document.contains("labels") || !document["labels"].is_array())
        {
            outError = "Label document missing 'labels' array";
            return false;
        }

        std::vector<LabelRecord> records = document["labels"].get<std::vector<LabelRecord>>();
        for (const auto& record : records)
        {
            if (!validate(record, outError))
                return false;
        }

        outRecords = std::move(records);
        PLOG_INFO << "Label document parsed: " << outRecords.size() << " label(s)";
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
    catch (const LabelError& e)
    {
        outError = std::string("Invalid label document: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool LabelImporter::parseFile(const std::string& filePath, std::vector<LabelRecord>& outRecords, std::string& outError)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open label file: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), outRecords, outError);
}

std::string LabelImporter::serialize(const std::vector<LabelRecord>& records, int indent)
{
    json document;
    document["labels"] = records;
    return document.dump(indent);
}

bool LabelImporter::validate(const LabelRecord& record, std::string& outError)
{
    const std::string where = record.identifier.toString();
    if (record.identifier.name_space.empty() || record.identifier.key.empty())
    {
        outError = "Label '" + where + "' has an empty namespace or key";
        return false;
    }
    if (record.default_text.empty())
    {
        outError = "Label '" + where + "' has no default text";
        return false;
    }
    for (const auto& variant : record.variants)
    {
        if (variant.scope.locale.empty())
        {
            outError = "Label '" + where + "' has a variant without locale";
            return false;
        }
        if (variant.alternatives.empty())
        {
            outError = "Label '" + where + "' variant " + variant.scope.toString() + " has no alternatives";
            return false;
        }
    }
    return true;
}

MergeStats LabelImporter::merge(ILabelStore& store, const std::vector<LabelRecord>& records)
{
    MergeStats stats;
    for (const auto& record : records)
    {
        std::optional<Label> existing = store.getLabel(record.identifier);
        if (!existing)
        {
            Label label;
            label.identifier = record.identifier;
            label.default_locale = record.default_locale;
            label.default_text = record.default_text;
            try
            {
                UpsertResult result = store.upsertIfAbsent(std::move(label));
                if (result.inserted)
                    ++stats.labels_created;
                existing = std::move(result.label);
            }
            catch (const StoreWriteConflict&)
            {
                existing = store.getLabel(record.identifier);
                if (!existing)
                    throw StoreUnavailableError("label " + record.identifier.toString() + " could not be imported");
            }
        }

        for (const auto& variant : record.variants)
        {
            const bool present = existing->findVariant(variant.scope) != nullptr;
            if (present && !variant.validated)
            {
                ++stats.variants_skipped;
                continue;
            }
            try
            {
                store.saveVariant(record.identifier, variant);
                ++stats.variants_written;
            }
            catch (const StoreUnavailableError&)
            {
                throw;
            }
            catch (const LabelError& e)
            {
                ++stats.variants_skipped;
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Store, "Imported variant rejected",
                                                    record.identifier.toString() + " " + variant.scope.toString() +
                                                        ": " + e.what());
            }
        }
    }

    PLOG_INFO << "Label import: " << stats.labels_created << " created, " << stats.variants_written
              << " variant(s) written, " << stats.variants_skipped << " skipped";
    return stats;
}

std::vector<LabelRecord> LabelImporter::exportAll(const ILabelStore& store)
{
    std::vector<LabelRecord> records;
    for (auto& label : store.listLabels())
    {
        LabelRecord record;
        record.identifier = std::move(label.identifier);
        record.default_locale = std::move(label.default_locale);
        record.default_text = std::move(label.default_text);
        record.variants = std::move(label.variants);
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace labels
