#include "resolve/invariant_enforcer.hpp"

#include <string>

#include "utils/log.hpp"

namespace charsheet {

bool enforce_head_matches_body(Build& build, std::vector<TraceEntry>& trace) {
    Layer* body = build.body_layer();
    Layer* head = build.head_layer();
    if (!body || !head || body->variant.empty()) {
        return false;
    }
    if (head->variant == body->variant) {
        return false;
    }

    const std::string from = head->variant.empty() ? std::string("null") : head->variant;
    head->variant = body->variant;

    const std::string note = std::string(trace_notes::head_override_prefix) + "from=" + from + ":to=" + body->variant;
    for (auto it = trace.rbegin(); it != trace.rend(); ++it) {
        if (it->category == "head" && it->item && it->resolved()) {
            it->notes.push_back(note);
            break;
        }
    }
    log::info("[InvariantEnforcer] " + note);
    return true;
}

}
