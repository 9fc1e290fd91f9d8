#include <catch2/catch_test_macros.hpp>
#include "store/InMemoryLabelStore.hpp"
#include "store/LabelImporter.hpp"

#include <nlohmann/json.hpp>

using namespace labels;

namespace
{

const char* kDocument = R"({
  "labels": [
    {
      "namespace": "shop",
      "key": "shop_cart_items",
      "default_locale": "en",
      "default_text": "{0,choice,0#empty|1#one item|1<{0} items}",
      "variants": [
        { "locale": "en", "alternatives": ["{0,choice,0#empty|1#one item|1<{0} items}"], "validated": true },
        { "locale": "de", "alternatives": ["{0,choice,0#leer|1#ein Artikel|1<{0} Artikel}"], "validated": true },
        { "locale": "de", "connector": "sms", "interface": "voice", "alternatives": ["Artikel: {0}"] }
      ]
    }
  ]
})";

} // namespace

TEST_CASE("LabelImporter - parse", "[store][import]")
{
    std::vector<LabelRecord> records;
    std::string error;
    REQUIRE(LabelImporter::parse(kDocument, records, error));
    REQUIRE(records.size() == 1);

    const auto& record = records[0];
    REQUIRE(record.identifier == LabelIdentifier{ "shop", "shop_cart_items" });
    REQUIRE(record.variants.size() == 3);
    REQUIRE(record.variants[2].scope.connector_type == std::optional<std::string>("sms"));
    REQUIRE(record.variants[2].scope.interface_type == InterfaceType::Voice);
    REQUIRE_FALSE(record.variants[2].validated);

    SECTION("Rejected documents")
    {
        std::vector<LabelRecord> none;
        REQUIRE_FALSE(LabelImporter::parse("{ not json", none, error));
        REQUIRE_FALSE(LabelImporter::parse(R"({"items": []})", none, error));
        REQUIRE_FALSE(LabelImporter::parse(
            R"({"labels": [{"namespace": "a", "key": "b", "default_text": "x",
                "variants": [{"locale": "en", "alternatives": []}]}]})",
            none, error));
        REQUIRE_FALSE(LabelImporter::parse(
            R"({"labels": [{"namespace": "a", "key": "b", "default_text": "x",
                "variants": [{"locale": "en", "interface": "hologram", "alternatives": ["x"]}]}]})",
            none, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(none.empty());
    }
}

TEST_CASE("LabelImporter - merge rules", "[store][import]")
{
    InMemoryLabelStore store;
    std::vector<LabelRecord> records;
    std::string error;
    REQUIRE(LabelImporter::parse(kDocument, records, error));

    auto stats = LabelImporter::merge(store, records);
    REQUIRE(stats.labels_created == 1);
    REQUIRE(stats.variants_written == 3);
    REQUIRE(store.getLabel({ "shop", "shop_cart_items" })->variants.size() == 3);

    SECTION("Unvalidated variants never overwrite")
    {
        LabelRecord update = records[0];
        update.variants = { { { "de", std::nullopt, std::nullopt }, { "draft" }, false },
                            { { "fr", std::nullopt, std::nullopt }, { "{0} articles" }, false } };
        auto second = LabelImporter::merge(store, { update });
        REQUIRE(second.labels_created == 0);
        REQUIRE(second.variants_written == 1);
        REQUIRE(second.variants_skipped == 1);
        REQUIRE(store.findVariant(update.identifier, { "de", std::nullopt, std::nullopt })->alternatives.front() !=
                "draft");
    }

    SECTION("Validated variants overwrite")
    {
        LabelRecord update = records[0];
        update.variants = { { { "de", std::nullopt, std::nullopt }, { "Korb: {0}" }, true } };
        (void)LabelImporter::merge(store, { update });
        REQUIRE(store.findVariant(update.identifier, { "de", std::nullopt, std::nullopt })->alternatives.front() ==
                "Korb: {0}");
    }
}

TEST_CASE("LabelImporter - export", "[store][import]")
{
    InMemoryLabelStore store;
    std::vector<LabelRecord> records;
    std::string error;
    REQUIRE(LabelImporter::parse(kDocument, records, error));
    (void)LabelImporter::merge(store, records);

    auto exported = LabelImporter::exportAll(store);
    REQUIRE(exported.size() == 1);
    REQUIRE(exported[0].default_text == records[0].default_text);

    auto document = nlohmann::json::parse(LabelImporter::serialize(exported));
    REQUIRE(document["labels"].size() == 1);
    REQUIRE(document["labels"][0]["key"] == "shop_cart_items");
    REQUIRE(document["labels"][0]["variants"][2]["connector"] == "sms");
    REQUIRE(document["labels"][0]["variants"][0].contains("connector") == false);
}
