#include "resolve/variant_strategies.hpp"

#include <algorithm>
#include <utility>

#include "catalog/color_dictionary.hpp"
#include "resolve/trace.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace {

const std::string* find_normalized(const std::vector<std::string>& variants, const std::string& wanted) {
    const std::string key = strings::normalize_key(wanted);
    auto it = std::find_if(variants.begin(), variants.end(), [&](const std::string& v) {
        return strings::normalize_key(v) == key;
    });
    return it == variants.end() ? nullptr : &*it;
}

}

VariantOutcome VariantOutcome::resolved(std::string variant, std::string note) {
    VariantOutcome outcome;
    outcome.kind = Kind::Resolved;
    outcome.variant = std::move(variant);
    outcome.note = std::move(note);
    return outcome;
}

VariantOutcome VariantOutcome::not_applicable() {
    return VariantOutcome{};
}

VariantOutcome DirectMatchStrategy::apply(const VariantRequest& request) const {
    if (const std::string* hit = find_normalized(request.variants, request.preferred_colour)) {
        return VariantOutcome::resolved(*hit, std::string(trace_notes::direct_match));
    }
    return VariantOutcome::not_applicable();
}

VariantOutcome DictionaryMatchStrategy::apply(const VariantRequest& request) const {
    const auto* synonyms = request.dictionary.synonyms_for(request.preferred_colour);
    if (!synonyms) {
        return VariantOutcome::not_applicable();
    }
    for (const auto& candidate : *synonyms) {
        if (const std::string* hit = find_normalized(request.variants, candidate)) {
            return VariantOutcome::resolved(*hit, std::string(trace_notes::dict_match));
        }
    }
    return VariantOutcome::not_applicable();
}

VariantOutcome FirstVariantFallbackStrategy::apply(const VariantRequest& request) const {
    if (request.variants.empty()) {
        return VariantOutcome::not_applicable();
    }
    return VariantOutcome::resolved(request.variants.front(), std::string(trace_notes::fallback_first_variant));
}

VariantSelector::VariantSelector(std::vector<std::shared_ptr<const VariantStrategy>> strategies)
    : strategies_(std::move(strategies)) {}

VariantSelector VariantSelector::standard() {
    return VariantSelector({
        std::make_shared<DirectMatchStrategy>(),
        std::make_shared<DictionaryMatchStrategy>(),
        std::make_shared<FirstVariantFallbackStrategy>(),
    });
}

VariantChoice VariantSelector::choose(const std::optional<std::string>& preferred_colour,
                                      const std::vector<std::string>& variants,
                                      const ColorDictionary& dictionary) const {
    if (variants.empty()) {
        return VariantChoice{std::nullopt, std::string(trace_notes::no_variants_available)};
    }
    if (!preferred_colour || strings::is_blank(*preferred_colour)) {
        return VariantChoice{variants.front(), std::string(trace_notes::no_preferred_fallback_first)};
    }

    const VariantRequest request{*preferred_colour, variants, dictionary};
    for (const auto& strategy : strategies_) {
        VariantOutcome outcome = strategy->apply(request);
        if (outcome.is_resolved()) {
            return VariantChoice{std::move(outcome.variant), std::move(outcome.note)};
        }
    }
    return VariantChoice{std::nullopt, std::string()};
}

}
