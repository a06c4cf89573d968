#include "doctest/doctest.h"

#include <memory>

#include <nlohmann/json.hpp>

#include "catalog/category_reference.hpp"
#include "catalog/color_dictionary.hpp"
#include "catalog/sheet_catalog.hpp"
#include "core/errors.hpp"
#include "resolve/invariant_enforcer.hpp"
#include "resolve/resolver.hpp"
#include "resolve/variant_strategies.hpp"
#include "test_support.hpp"

using namespace charsheet;
using charsheet::testing::CatalogFixture;
using nlohmann::json;

namespace {

ColorDictionary sample_dictionary() {
    ColorDictionary dict;
    dict.add("crimson", {"scarlet", "red"});
    dict.add("amber", {"gold"});
    return dict;
}

const TraceEntry* find_entry(const std::vector<TraceEntry>& trace, const std::string& category) {
    const TraceEntry* found = nullptr;
    for (const auto& entry : trace) {
        if (entry.category == category) {
            found = &entry;
        }
    }
    return found;
}

struct ResolverFixture {
    CatalogFixture fx{"resolver"};
    std::unique_ptr<SheetCatalog> catalog;
    CategoryReference reference;
    ColorDictionary dict = sample_dictionary();

    ResolverFixture() {
        fx.standard_body_and_head();
        fx.definition("heads_pale.json", {
            {"layer_1", {{"male", "head/heads/human/male"}}},
            {"variants", {"pale", "light", "amber"}},
        });
        fx.definition("shirt_longsleeve.json", {
            {"layer_1", {{"male", "torso/clothes/longsleeve/male"}}},
            {"variants", {"blue", "red", "white"}},
        });
        fx.definition("shirt_tunic.json", {
            {"layer_1", {{"female", "torso/clothes/tunic/female"}}},
            {"variants", {"brown"}},
        });
        fx.definition("hair_plain.json", {
            {"layer_1", {{"male", "hair/plain/adult"}}},
            {"variants", json::array()},
        });
        catalog = std::make_unique<SheetCatalog>(fx.defs);
        reference = CategoryReference::from_json(json::array({
            {{"category", "shirts"}, {"items", {"shirt_tunic.json", "shirt_longsleeve.json"}}},
            {{"category", "hair"}, {"items", {"hair_plain.json"}}},
            {{"category", "cape"}, {"items", {"cape_missing.json"}}},
        }));
    }

    Resolver resolver() const { return Resolver(*catalog, reference, dict); }
};

SemanticSelection selection(const std::string& head, std::vector<CategorySelection> categories) {
    SemanticSelection sel;
    sel.body_type = BodyType::Male;
    sel.head_type = head;
    sel.categories = std::move(categories);
    return sel;
}

}

TEST_CASE("variant selector runs direct, dictionary, then first-variant strategies") {
    const ColorDictionary dict = sample_dictionary();
    const VariantSelector selector = VariantSelector::standard();
    const std::vector<std::string> variants{"blue", "red", "white"};

    auto direct = selector.choose(std::string("  RED "), variants, dict);
    CHECK(direct.variant.value() == "red");
    CHECK(direct.note == "direct_match");

    auto synonym = selector.choose(std::string("crimson"), variants, dict);
    CHECK(synonym.variant.value() == "red");
    CHECK(synonym.note == "dict_match");

    auto fallback = selector.choose(std::string("teal"), variants, dict);
    CHECK(fallback.variant.value() == "blue");
    CHECK(fallback.note == "fallback_first_variant");

    auto unspecified = selector.choose(std::nullopt, variants, dict);
    CHECK(unspecified.variant.value() == "blue");
    CHECK(unspecified.note == "no_preferred_colour_fallback_first");

    auto empty = selector.choose(std::string("red"), {}, dict);
    CHECK_FALSE(empty.variant.has_value());
    CHECK(empty.note == "no_variants_available");
}

TEST_CASE("variant selector without a fallback strategy can leave the variant unresolved") {
    const VariantSelector strict({std::make_shared<DirectMatchStrategy>()});
    auto choice = strict.choose(std::string("green"), {"blue"}, ColorDictionary{});
    CHECK_FALSE(choice.variant.has_value());
}

TEST_CASE("resolver builds body, head and requested categories in order") {
    ResolverFixture f;
    const auto result = f.resolver().resolve(selection("heads_human_male.json", {
        {"body", std::string("amber"), {}},
        {"shirts", std::string("crimson"), {}},
    }));

    REQUIRE(result.ok);
    REQUIRE(result.build.has_value());
    const Build& build = *result.build;
    REQUIRE(build.layers.size() == 3);
    CHECK(build.layers[0].category == "body/bodies/male");
    CHECK(build.layers[0].variant == "amber");
    CHECK(build.layers[1].category == "head/heads/human/male");
    CHECK(build.layers[2].category == "torso/clothes/longsleeve/male");
    CHECK(build.layers[2].variant == "red");
    CHECK(build.animations == std::vector<std::string>{"idle"});

    const TraceEntry* shirts = find_entry(result.trace, "shirts");
    REQUIRE(shirts != nullptr);
    CHECK(shirts->has_note("dict_match"));
    CHECK(shirts->item.value() == "shirt_longsleeve.json");

    // The tunic has no male mapping, so it was tried first and recorded.
    bool saw_tunic = false;
    for (const auto& entry : result.trace) {
        if (entry.item && *entry.item == "shirt_tunic.json") {
            saw_tunic = entry.has_note("no_layer_1_mapping_for:male");
        }
    }
    CHECK(saw_tunic);
}

TEST_CASE("a female round-headed character gets red long hair for crimson through the dictionary") {
    CatalogFixture fx{"resolver_round_head"};
    fx.standard_body_and_head();
    fx.definition("heads_round.json", {
        {"layer_1", {{"female", "head/heads/round/female"}, {"male", "head/heads/round/male"}}},
        {"variants", {"light", "amber"}},
    });
    fx.definition("hair_long.json", {
        {"layer_1", {{"female", "hair/long/adult"}}},
        {"variants", {"black", "red", "blonde"}},
    });
    const SheetCatalog catalog(fx.defs);
    const CategoryReference reference = CategoryReference::from_json(json::array({
        {{"category", "hair"}, {"items", {"hair_long.json"}}},
    }));
    ColorDictionary dict;
    dict.add("crimson", {"red"});

    SemanticSelection sel;
    sel.body_type = BodyType::Female;
    sel.head_type = "heads_round.json";
    sel.categories = {{"hair", std::string("crimson"), {"hair_long.json"}}};

    const auto result = Resolver(catalog, reference, dict).resolve(sel);
    REQUIRE(result.ok);
    const Build& build = *result.build;
    REQUIRE(build.layers.size() == 3);
    CHECK(build.layers[0].category == "body/bodies/female");
    CHECK(build.layers[1].category == "head/heads/round/female");
    CHECK(build.layers[2].category == "hair/long/adult");
    CHECK(build.layers[2].variant == "red");

    const TraceEntry* hair = find_entry(result.trace, "hair");
    REQUIRE(hair != nullptr);
    CHECK(hair->has_note("dict_match"));
    CHECK(hair->preferred_colour.value() == "crimson");
    CHECK(hair->chosen_variant.value() == "red");
}

TEST_CASE("optional categories degrade to trace notes") {
    ResolverFixture f;
    const auto result = f.resolver().resolve(selection("heads_human_male.json", {
        {"hair", std::string("black"), {}},
        {"cape", std::nullopt, {}},
        {"wings", std::nullopt, {"wings.json"}},
    }));

    REQUIRE(result.ok);
    CHECK(result.build->layers.size() == 2);

    const TraceEntry* hair_item = nullptr;
    for (const auto& entry : result.trace) {
        if (entry.item && *entry.item == "hair_plain.json") {
            hair_item = &entry;
        }
    }
    REQUIRE(hair_item != nullptr);
    CHECK(hair_item->has_note("no_variants_available"));
    CHECK(hair_item->has_note("no_variant_resolved"));

    CHECK(find_entry(result.trace, "hair")->has_note("no_compatible_item_found"));

    bool missing_cape = false;
    for (const auto& entry : result.trace) {
        missing_cape = missing_cape || entry.has_note("missing_def:cape_missing.json");
    }
    CHECK(missing_cape);

    CHECK(find_entry(result.trace, "wings")->has_note("unknown_category_in_reference"));
    CHECK(result.unknown_categories == std::vector<std::string>{"wings"});
}

TEST_CASE("caller items outside the reference are ignored") {
    ResolverFixture f;
    const auto result = f.resolver().resolve(selection("heads_human_male.json", {
        {"shirts", std::string("white"), {"shirt_unlisted.json", "shirt_longsleeve.json"}},
    }));
    REQUIRE(result.ok);
    REQUIRE(result.build->layers.size() == 3);
    CHECK(result.build->layers[2].variant == "white");
}

TEST_CASE("unresolvable head fails the resolution") {
    ResolverFixture f;
    const auto result = f.resolver().resolve(selection("heads_missing.json", {}));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.build.has_value());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].reason == "required_category_unresolved");
    CHECK(result.errors[0].category == "head");
    CHECK(find_entry(result.trace, "head")->has_note("missing_def:heads_missing.json"));

    std::vector<TraceEntry> trace;
    try {
        f.resolver().resolve_or_throw(selection("heads_missing.json", {}), trace);
        FAIL("expected ResolutionError");
    } catch (const ResolutionError& ex) {
        CHECK(ex.category() == "head");
        CHECK(ex.item() == "heads_missing.json");
    }
    CHECK_FALSE(trace.empty());
}

TEST_CASE("body types without a body mapping fail on the body stage") {
    ResolverFixture f;
    SemanticSelection sel = selection("heads_human_male.json", {});
    sel.body_type = BodyType::Muscular;
    const auto result = f.resolver().resolve(sel);
    CHECK_FALSE(result.ok);
    REQUIRE_FALSE(result.errors.empty());
    CHECK(result.errors[0].category == "body");
}

TEST_CASE("enforcer overwrites the head variant with the body variant and notes it") {
    ResolverFixture f;
    auto result = f.resolver().resolve(selection("heads_pale.json", {{"body", std::string("amber"), {}}}));
    REQUIRE(result.ok);
    Build build = *result.build;
    CHECK(build.head_layer()->variant == "pale");

    CHECK(enforce_head_matches_body(build, result.trace));
    CHECK(build.head_layer()->variant == "amber");
    CHECK(build.body_layer()->variant == "amber");
    CHECK(find_entry(result.trace, "head")->has_note("head_variant_overridden_to_body:from=pale:to=amber"));

    // Second pass has nothing to do.
    const auto notes_before = find_entry(result.trace, "head")->notes.size();
    CHECK_FALSE(enforce_head_matches_body(build, result.trace));
    CHECK(find_entry(result.trace, "head")->notes.size() == notes_before);
}

TEST_CASE("enforcer leaves builds without both layers alone") {
    Build build;
    build.layers.push_back(Layer{"head/heads/human/male", "pale", {}, {}, {}, {}});
    std::vector<TraceEntry> trace;
    CHECK_FALSE(enforce_head_matches_body(build, trace));
    CHECK(build.layers[0].variant == "pale");
}
