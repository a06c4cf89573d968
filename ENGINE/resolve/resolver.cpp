#include "resolve/resolver.hpp"

#include <algorithm>
#include <utility>

#include "catalog/category_reference.hpp"
#include "catalog/color_dictionary.hpp"
#include "catalog/sheet_catalog.hpp"
#include "core/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace {

constexpr const char* kRequiredUnresolved = "required_category_unresolved";

std::string describe(const TraceEntry& entry) {
    std::string text = "[Resolver] " + entry.category;
    if (entry.item) {
        text += " item=" + *entry.item;
    }
    for (const auto& note : entry.notes) {
        text += " " + note;
    }
    return text;
}

TraceEntry unresolved_category_entry(const CategorySelection& sel, std::string_view note) {
    TraceEntry entry;
    entry.category = sel.category;
    entry.preferred_colour = sel.preferred_colour;
    entry.notes.emplace_back(note);
    return entry;
}

bool is_head_like(const std::string& category) {
    return category == "head" || strings::starts_with(category, "heads_");
}

}

Resolver::Resolver(const SheetCatalog& catalog,
                   const CategoryReference& reference,
                   const ColorDictionary& dictionary,
                   VariantSelector selector)
    : catalog_(catalog),
      reference_(reference),
      dictionary_(dictionary),
      selector_(std::move(selector)) {}

TraceEntry Resolver::resolve_item(const std::string& category,
                                  const std::string& item_file,
                                  const std::optional<std::string>& preferred_colour,
                                  BodyType body_type,
                                  Build& build) const {
    TraceEntry entry;
    entry.category = category;
    entry.preferred_colour = preferred_colour;
    entry.item = item_file;

    const SheetDefinition* def = catalog_.find(item_file);
    if (!def) {
        entry.notes.push_back(std::string(trace_notes::missing_def_prefix) + item_file);
        return entry;
    }

    auto path = def->category_path(body_type);
    if (!path) {
        entry.notes.push_back(std::string(trace_notes::no_layer_mapping_prefix) +
                              std::string(body_types::to_string(body_type)));
        return entry;
    }

    VariantChoice choice = selector_.choose(preferred_colour, def->variants, dictionary_);
    if (!choice.note.empty()) {
        entry.notes.push_back(choice.note);
    }
    if (!choice.variant) {
        entry.notes.emplace_back(trace_notes::no_variant_resolved);
        return entry;
    }

    entry.resolved_path = *path;
    entry.chosen_variant = *choice.variant;

    Layer layer;
    layer.category = *path;
    layer.variant = *choice.variant;
    build.layers.push_back(std::move(layer));
    return entry;
}

ResolveResult Resolver::resolve(const SemanticSelection& selection, const ResolveOptions& options) const {
    ResolveResult result;
    Build build;
    build.animations = options.animations.empty() ? std::vector<std::string>{"idle"} : options.animations;

    auto record = [&](TraceEntry entry) -> const TraceEntry& {
        log::debug(describe(entry));
        result.trace.push_back(std::move(entry));
        return result.trace.back();
    };

    // Body: caller's ordered candidates, or the canonical definition.
    {
        const CategorySelection* body_sel = selection.find_category("body");
        std::vector<std::string> items;
        if (body_sel && !body_sel->items.empty()) {
            items = body_sel->items;
        } else {
            items.push_back(options.default_body_item);
        }
        const std::optional<std::string> preferred = body_sel ? body_sel->preferred_colour : std::nullopt;

        bool resolved = false;
        for (const auto& item : items) {
            if (record(resolve_item("body", item, preferred, selection.body_type, build)).resolved()) {
                resolved = true;
                break;
            }
        }
        if (!resolved) {
            log::error("[Resolver] Required category 'body' unresolved");
            result.errors.push_back(ResolveFailure{kRequiredUnresolved, "body", items.empty() ? std::string() : items.back()});
            return result;
        }
    }

    // Head: head_type is the only candidate.
    {
        if (!record(resolve_item("head", selection.head_type, std::nullopt, selection.body_type, build)).resolved()) {
            log::error("[Resolver] Required category 'head' unresolved (item '" + selection.head_type + "')");
            result.errors.push_back(ResolveFailure{kRequiredUnresolved, "head", selection.head_type});
            return result;
        }
    }

    // Everything else, in caller order.
    for (const auto& sel : selection.categories) {
        if (sel.category == "body" || is_head_like(sel.category)) {
            continue;
        }

        const CategoryReferenceEntry* ref = reference_.find(sel.category);
        if (!ref || ref->items.empty()) {
            log::warn("[Resolver] Unknown category '" + sel.category + "' skipped");
            record(unresolved_category_entry(sel, trace_notes::unknown_category));
            result.unknown_categories.push_back(sel.category);
            continue;
        }

        std::vector<std::string> ordered;
        if (sel.items.empty()) {
            ordered = ref->items;
        } else {
            for (const auto& item : sel.items) {
                if (std::find(ref->items.begin(), ref->items.end(), item) != ref->items.end()) {
                    ordered.push_back(item);
                }
            }
        }

        bool resolved = false;
        for (const auto& item : ordered) {
            if (record(resolve_item(sel.category, item, sel.preferred_colour, selection.body_type, build)).resolved()) {
                resolved = true;
                break;
            }
        }
        if (!resolved) {
            log::info("[Resolver] No compatible item for '" + sel.category + "'");
            record(unresolved_category_entry(sel, trace_notes::no_compatible_item));
        }
    }

    result.ok = true;
    result.build = std::move(build);
    return result;
}

Build Resolver::resolve_or_throw(const SemanticSelection& selection,
                                 std::vector<TraceEntry>& trace,
                                 const ResolveOptions& options) const {
    ResolveResult result = resolve(selection, options);
    trace = std::move(result.trace);
    if (!result.ok || !result.build) {
        const ResolveFailure failure = result.errors.empty()
            ? ResolveFailure{kRequiredUnresolved, "body", std::string()}
            : result.errors.front();
        throw ResolutionError(failure.reason, failure.category, failure.item);
    }
    return std::move(*result.build);
}

}
