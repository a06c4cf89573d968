#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace charsheet {

namespace trace_notes {

inline constexpr std::string_view direct_match                = "direct_match";
inline constexpr std::string_view dict_match                  = "dict_match";
inline constexpr std::string_view fallback_first_variant      = "fallback_first_variant";
inline constexpr std::string_view no_preferred_fallback_first = "no_preferred_colour_fallback_first";
inline constexpr std::string_view no_variants_available       = "no_variants_available";
inline constexpr std::string_view no_variant_resolved         = "no_variant_resolved";
inline constexpr std::string_view unknown_category            = "unknown_category_in_reference";
inline constexpr std::string_view no_compatible_item          = "no_compatible_item_found";
inline constexpr std::string_view missing_def_prefix          = "missing_def:";
inline constexpr std::string_view no_layer_mapping_prefix     = "no_layer_1_mapping_for:";
inline constexpr std::string_view head_override_prefix        = "head_variant_overridden_to_body:";

}

// Audit record of one resolution attempt. Entries are only ever appended to; the
// invariant enforcer may append one note to an existing head entry.
struct TraceEntry {
    std::string category;
    std::optional<std::string> preferred_colour;
    std::optional<std::string> item;
    std::optional<std::string> resolved_path;
    std::optional<std::string> chosen_variant;
    std::vector<std::string> notes;

    bool resolved() const { return resolved_path.has_value() && chosen_variant.has_value(); }
    bool has_note(std::string_view note) const;
};

nlohmann::json trace_to_json(const std::vector<TraceEntry>& trace);

}
