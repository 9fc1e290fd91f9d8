#include <catch2/catch_test_macros.hpp>
#include "config/EngineConfig.hpp"
#include "pattern/PatternErrors.hpp"
#include "render/Renderer.hpp"
#include "store/InMemoryLabelStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/test_stores.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using namespace labels;

namespace
{
const RequestContext kEnglish{ "en", std::nullopt, std::nullopt };
const RequestContext kGerman{ "de", std::nullopt, std::nullopt };
} // namespace

TEST_CASE("Renderer - end to end", "[render]")
{
    InMemoryLabelStore store;
    Renderer renderer(store);

    auto files = LabelRequest::text("app", "files", "{0,choice,0#no files|1#one file|1<{0} files}");
    REQUIRE(renderer.render(files, kEnglish, { 0 }) == "no files");
    REQUIRE(renderer.render(files, kEnglish, { 1 }) == "one file");
    REQUIRE(renderer.render(files, kEnglish, { 5 }) == "5 files");
    REQUIRE(store.size() == 1);

    SECTION("Numbers follow the request locale even on a fallback variant")
    {
        auto count = LabelRequest::text("app", "files", "{0,number} items");
        REQUIRE(renderer.render(count, kEnglish, { 1234 }) == "1,234 items");
        REQUIRE(renderer.render(count, kGerman, { 1234 }) == "1.234 items");
    }

    SECTION("Explicit keys")
    {
        auto title = LabelRequest::withKey("app", "checkout.title", "Checkout");
        REQUIRE(renderer.identify(title).key == "checkout.title");
        REQUIRE(renderer.render(title, kEnglish) == "Checkout");
        REQUIRE(store.getLabel({ "app", "checkout.title" }).has_value());
    }

    SECTION("Code-declared translations")
    {
        auto greeting = LabelRequest::text("app", "ui", "Hello {0}").withDefault("de", "Hallo {0}");
        REQUIRE(renderer.render(greeting, kGerman, { "Ana" }) == "Hallo Ana");
        REQUIRE(renderer.render(greeting, kEnglish, { "Ana" }) == "Hallo Ana");
    }

    SECTION("Format errors propagate")
    {
        auto greeting = LabelRequest::text("app", "ui", "Hello {0}");
        REQUIRE_THROWS_AS(renderer.render(greeting, kEnglish), pattern::PatternFormatError);
    }
}

TEST_CASE("Renderer - raw rendering never touches the store", "[render]")
{
    InMemoryLabelStore store;
    Renderer renderer(store);

    REQUIRE(renderer.raw("There are 3 files", "en") == "There are 3 files");
    REQUIRE(renderer.raw("{0} of {1}", "en", { 2, 10 }) == "2 of 10");
    REQUIRE(renderer.raw("{0,number}", "", { 1000 }) == "1,000");
    REQUIRE(store.size() == 0);
    REQUIRE(renderer.cache().size() == 0);
}

TEST_CASE("Renderer - raw rendering keeps label patterns cached", "[render][cache]")
{
    InMemoryLabelStore store;
    Renderer::Options options;
    options.pattern_cache_capacity = 4;
    Renderer renderer(store, nullptr, options);

    auto greeting = LabelRequest::text("app", "ui", "Hello {0}");
    REQUIRE(renderer.render(greeting, kEnglish, { "Ann" }) == "Hello Ann");
    REQUIRE(renderer.cache().misses() == 1);

    for (int i = 0; i < 4; ++i)
    {
        (void)renderer.raw("{0} of 4", "en", { i });
        (void)renderer.raw("step " + std::to_string(i), "en");
    }

    REQUIRE(renderer.render(greeting, kEnglish, { "Ann" }) == "Hello Ann");
    REQUIRE(renderer.cache().misses() == 1);
    REQUIRE(renderer.cache().hits() == 1);
}

TEST_CASE("Renderer - edited variants are served immediately", "[render][cache]")
{
    InMemoryLabelStore store;
    Renderer renderer(store);

    auto greeting = LabelRequest::text("app", "ui", "Hello {0}");
    REQUIRE(renderer.render(greeting, kEnglish, { "Bob" }) == "Hello Bob");
    REQUIRE(renderer.cache().size() == 1);

    const LabelIdentifier id = renderer.identify(greeting);
    renderer.saveVariant(id, { { "en", std::nullopt, std::nullopt }, { "Hi {0}!" }, true });
    REQUIRE(renderer.cache().size() == 0);
    REQUIRE(renderer.render(greeting, kEnglish, { "Bob" }) == "Hi Bob!");

    SECTION("Edits through the store reach the renderer too")
    {
        store.saveVariant(id, { { "en", std::nullopt, std::nullopt }, { "Yo {0}" }, true });
        REQUIRE(renderer.render(greeting, kEnglish, { "Bob" }) == "Yo Bob");
    }
}

TEST_CASE("Renderer - colliding default texts render the latest text", "[render][collision]")
{
    utils::ErrorReporter::ClearErrors();
    InMemoryLabelStore store;
    Renderer renderer(store);

    auto first = LabelRequest::text("app", "ui", "Hello, world");
    auto second = LabelRequest::text("app", "ui", "Hello world!");
    REQUIRE(renderer.identify(first).key == "app_ui_hello_world");
    REQUIRE(renderer.identify(second).key == "app_ui_hello_world");

    REQUIRE(renderer.render(first, kEnglish) == "Hello, world");
    REQUIRE(renderer.render(second, kEnglish) == "Hello world!");
    REQUIRE(renderer.engine().collisionCount() == 1);

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Renderer - renderers can be destroyed while variants are saved", "[render][concurrency]")
{
    InMemoryLabelStore store;
    const LabelIdentifier id{ "app", "app_ui_hello" };
    {
        Renderer seeder(store);
        REQUIRE(seeder.render(LabelRequest::text("app", "ui", "Hello"), kEnglish) == "Hello");
    }

    std::atomic<bool> done{ false };
    std::thread writer(
        [&]
        {
            int n = 0;
            while (!done)
            {
                LocalizedVariant edited{ { "en", std::nullopt, std::nullopt }, { "Hello " + std::to_string(n++) }, true };
                store.saveVariant(id, edited);
            }
        });

    for (int i = 0; i < 200; ++i)
    {
        auto renderer = std::make_unique<Renderer>(store);
        (void)renderer->render(LabelRequest::text("app", "ui", "Hello"), kEnglish);
    }
    done = true;
    writer.join();

    REQUIRE(store.getLabel(id)->variants.size() == 1);
}

TEST_CASE("Renderer - renderOrFallback", "[render]")
{
    utils::ErrorReporter::ClearErrors();

    SECTION("Pattern errors fall back to the default text")
    {
        InMemoryLabelStore store;
        Renderer renderer(store);
        auto greeting = LabelRequest::text("app", "ui", "Hello {0}");
        (void)renderer.render(greeting, kEnglish, { "x" });
        renderer.saveVariant(renderer.identify(greeting), { { "en", std::nullopt, std::nullopt }, { "Hi {0" }, true });

        auto outcome = renderer.renderOrFallback(greeting, kEnglish, { "x" });
        REQUIRE_FALSE(outcome.succeeded);
        REQUIRE(outcome.text == "Hello {0}");
        REQUIRE(outcome.error.has_value());
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Pattern);
    }

    SECTION("Store failures fall back to the default text")
    {
        test_utils::UnavailableStore store;
        Renderer renderer(store);
        auto outcome = renderer.renderOrFallback(LabelRequest::text("app", "ui", "Welcome"), kEnglish);
        REQUIRE_FALSE(outcome.succeeded);
        REQUIRE(outcome.text == "Welcome");
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Store);
    }

    SECTION("Success")
    {
        InMemoryLabelStore store;
        Renderer renderer(store);
        auto outcome = renderer.renderOrFallback(LabelRequest::text("app", "ui", "Hi {0}"), kEnglish, { "Eve" });
        REQUIRE(outcome.succeeded);
        REQUIRE(outcome.text == "Hi Eve");
        REQUIRE_FALSE(outcome.error.has_value());
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Renderer - options from configuration", "[render][config]")
{
    EngineConfig config;
    config.default_locale = "de";
    config.key_max_length = 20;
    config.pattern_cache_capacity = 8;
    config.track_usage = false;
    config.time_zone = "Europe/Berlin";

    auto options = Renderer::Options::from(config);
    REQUIRE(options.resolution.default_locale == "de");
    REQUIRE(options.resolution.key_options.max_length == 20);
    REQUIRE_FALSE(options.resolution.track_usage);
    REQUIRE(options.pattern_cache_capacity == 8);
    REQUIRE(options.time_zone == "Europe/Berlin");

    InMemoryLabelStore store;
    Renderer renderer(store, nullptr, options);
    REQUIRE(renderer.cache().capacity() == 8);
    REQUIRE(renderer.keyDeriver().options().max_length == 20);
    REQUIRE(renderer.render(LabelRequest::text("app", "ui", "{0,number}"), RequestContext{}, { 1000 }) == "1.000");
}
