#pragma once

#include <optional>
#include <string>
#include <vector>

#include "build/build.hpp"
#include "resolve/selection.hpp"
#include "resolve/trace.hpp"
#include "resolve/variant_strategies.hpp"

namespace charsheet {

class SheetCatalog;
class CategoryReference;
class ColorDictionary;

struct ResolveOptions {
    std::vector<std::string> animations{"idle"};
    std::string default_body_item = "body.json";
};

struct ResolveFailure {
    std::string reason;
    std::string category;
    std::string item;
};

struct ResolveResult {
    bool ok = false;
    std::optional<Build> build;
    std::vector<TraceEntry> trace;
    std::vector<ResolveFailure> errors;
    // Category names the caller asked for that the reference does not know.
    std::vector<std::string> unknown_categories;
};

// Turns a semantic selection into an ordered, not yet validated layer list.
// Body then head are required; every other category degrades to a trace note.
class Resolver {
public:
    Resolver(const SheetCatalog& catalog,
             const CategoryReference& reference,
             const ColorDictionary& dictionary,
             VariantSelector selector = VariantSelector::standard());

    ResolveResult resolve(const SemanticSelection& selection,
                          const ResolveOptions& options = ResolveOptions{}) const;

    // As resolve(), but throws ResolutionError when a required category is unresolved.
    Build resolve_or_throw(const SemanticSelection& selection,
                           std::vector<TraceEntry>& trace,
                           const ResolveOptions& options = ResolveOptions{}) const;

private:
    TraceEntry resolve_item(const std::string& category,
                            const std::string& item_file,
                            const std::optional<std::string>& preferred_colour,
                            BodyType body_type,
                            Build& build) const;

    const SheetCatalog& catalog_;
    const CategoryReference& reference_;
    const ColorDictionary& dictionary_;
    VariantSelector selector_;
};

}
