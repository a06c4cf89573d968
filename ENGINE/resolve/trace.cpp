#include "resolve/trace.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace charsheet {

namespace {

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}

bool TraceEntry::has_note(std::string_view note) const {
    return std::find(notes.begin(), notes.end(), note) != notes.end();
}

nlohmann::json trace_to_json(const std::vector<TraceEntry>& trace) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : trace) {
        out.push_back({
            {"category", entry.category},
            {"preferred_colour", optional_string(entry.preferred_colour)},
            {"item", optional_string(entry.item)},
            {"resolved_path", optional_string(entry.resolved_path)},
            {"chosen_variant", optional_string(entry.chosen_variant)},
            {"notes", entry.notes},
        });
    }
    return out;
}

}
