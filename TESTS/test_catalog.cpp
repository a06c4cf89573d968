#include "doctest/doctest.h"

#include <cstdlib>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog/catalog_paths.hpp"
#include "catalog/category_reference.hpp"
#include "catalog/color_dictionary.hpp"
#include "catalog/sheet_catalog.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"
#include "utils/log.hpp"

using namespace charsheet;
using charsheet::testing::CatalogFixture;
using nlohmann::json;

TEST_CASE("sheet definition maps body types to category paths") {
    const json raw = {
        {"layer_1", {{"male", "torso/clothes/shirt/male///"}, {"teen", "torso/clothes/shirt/teen"}}},
        {"variants", {"white", "blue"}},
    };
    auto def = SheetDefinition::from_json(raw, "shirt.json");
    REQUIRE(def.has_value());
    CHECK(def->category_path(BodyType::Male).value() == "torso/clothes/shirt/male");
    CHECK(def->category_path(BodyType::Child).value() == "torso/clothes/shirt/teen");
    CHECK_FALSE(def->category_path(BodyType::Female).has_value());
    CHECK(def->variants == std::vector<std::string>{"white", "blue"});
    CHECK(def->supports_animation("walk"));
}

TEST_CASE("sheet definition rejects documents without the definition shape") {
    std::string problem;
    CHECK_FALSE(SheetDefinition::from_json(json::array(), "a.json", &problem).has_value());
    CHECK(problem == "not_an_object");
    CHECK_FALSE(SheetDefinition::from_json(json{{"variants", json::array()}}, "b.json", &problem).has_value());
    CHECK(problem == "missing_layer_1");
    CHECK_FALSE(SheetDefinition::from_json(json{{"layer_1", json::object()}}, "c.json", &problem).has_value());
    CHECK(problem == "missing_variants");
}

TEST_CASE("catalog skips malformed definitions and keeps the rest") {
    log::ScopedLevel quiet(log::Level::Error);
    CatalogFixture fx("catalog_skip");
    fx.standard_body_and_head();
    testing::write_text(fx.defs / "broken.json", "{ not json");
    fx.definition("nested/hat.json", {{"layer_1", {{"male", "hat/cap/male"}}}, {"variants", {"red"}}});
    fx.definition("notes.json", json::array({1, 2, 3}));

    SheetCatalog catalog(fx.defs);
    CHECK_FALSE(catalog.loaded());
    REQUIRE(catalog.find("body.json") != nullptr);
    CHECK(catalog.loaded());
    CHECK(catalog.find("nested/hat.json") != nullptr);
    CHECK(catalog.find("broken.json") == nullptr);
    CHECK(catalog.all().size() == 3);
    REQUIRE(catalog.load_notes().size() == 2);
    CHECK(catalog.load_notes()[0].file == "broken.json");
    CHECK(catalog.load_notes()[1].reason == "not_an_object");
}

TEST_CASE("catalog with a missing directory is fatal") {
    CatalogFixture fx("catalog_missing");
    CHECK_THROWS_AS(SheetCatalog(fx.root / "nope"), CatalogError);
}

TEST_CASE("concurrent first access loads the catalog exactly once") {
    CatalogFixture fx("catalog_threads");
    fx.standard_body_and_head();
    for (int i = 0; i < 40; ++i) {
        fx.definition("item_" + std::to_string(i) + ".json",
                      {{"layer_1", {{"male", "misc/item" + std::to_string(i)}}}, {"variants", {"a", "b"}}});
    }

    SheetCatalog catalog(fx.defs);
    std::vector<std::thread> threads;
    std::vector<std::size_t> sizes(8, 0);
    std::vector<const SheetDefinition*> bodies(8, nullptr);
    for (std::size_t t = 0; t < sizes.size(); ++t) {
        threads.emplace_back([&, t]() {
            bodies[t] = catalog.find("body.json");
            sizes[t] = catalog.all().size();
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (std::size_t t = 0; t < sizes.size(); ++t) {
        CHECK(sizes[t] == 42);
        CHECK(bodies[t] == bodies[0]);
    }
    CHECK(bodies[0] != nullptr);
}

TEST_CASE("category reference validates its shape") {
    CHECK_THROWS_WITH_AS(CategoryReference::from_json(json::object()), "category_reference_not_array", CatalogError);
    CHECK_THROWS_WITH_AS(CategoryReference::from_json(json::array({{{"category", "hair"}}})),
                         "category_reference_invalid_shape", CatalogError);

    const auto ref = CategoryReference::from_json(json::array({
        {{"category", "hair"}, {"items", {"hair_long.json"}}},
        {{"category", "hat"}, {"items", {"hat_cap.json"}}, {"required", true}},
        {{"category", "hair"}, {"items", {"hair_short.json", "hair_long.json"}}},
    }));
    REQUIRE(ref.find("hair") != nullptr);
    CHECK(ref.find("hair")->items.front() == "hair_short.json");
    CHECK(ref.find("hat")->required);
    CHECK(ref.find("cape") == nullptr);
}

TEST_CASE("colour dictionary normalizes keys") {
    const auto dict = ColorDictionary::from_json(json{{"  Dark   Red ", {"maroon", "red"}}, {"bad", 3}});
    REQUIRE(dict.synonyms_for("dark red") != nullptr);
    CHECK(dict.synonyms_for("DARK\tRED")->front() == "maroon");
    CHECK(dict.synonyms_for("bad") == nullptr);
    CHECK(dict.size() == 1);
    CHECK_THROWS_AS(ColorDictionary::from_json(json::array()), CatalogError);
}

TEST_CASE("catalog paths honour the environment override and list candidates on failure") {
    CatalogFixture fx("catalog_paths");
    ::unsetenv("ULPC_SHEET_DEFS");
    ::unsetenv("CHARSHEET_SPRITES_ROOT");
    ::setenv("CHARSHEET_SHEET_DEFS", fx.defs.string().c_str(), 1);
    const auto paths = CatalogPaths::discover(fx.root / "elsewhere");
    CHECK(paths.definitions == fx.defs);
    CHECK(paths.spritesheets == fx.root / "spritesheets");
    ::unsetenv("CHARSHEET_SHEET_DEFS");

    const auto fallback = CatalogPaths::discover(fx.root);
    CHECK(fallback.definitions == fx.root / "sheet_definitions");

    try {
        CatalogPaths::discover(fx.root / "empty");
        FAIL("expected CatalogError");
    } catch (const CatalogError& ex) {
        CHECK(std::string(ex.what()).find("assets/ulpc/sheet_definitions") != std::string::npos);
    }
}
