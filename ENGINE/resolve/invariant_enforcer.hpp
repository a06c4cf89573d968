#pragma once

#include <vector>

#include "build/build.hpp"
#include "resolve/trace.hpp"

namespace charsheet {

// The one place allowed to mutate a resolved build: the body layer's variant is the
// single source of truth, so a differing head variant is overwritten with it and the
// latest resolved head trace entry gets a
// "head_variant_overridden_to_body:from=<old>:to=<new>" note.
// No-op when either layer is missing. Returns true when the head was changed.
bool enforce_head_matches_body(Build& build, std::vector<TraceEntry>& trace);

}
