#pragma once

#include <vector>

#include "build/build.hpp"
#include "core/errors.hpp"
#include "validate/variant_contract.hpp"

namespace charsheet {

// Gatekeeper in front of composition. Checks the schema shape (known categories,
// per-category variant membership, exactly one body and one head layer) and then,
// independently of the enforcer, that head.variant == body.variant. Never mutates
// the build.
class BuildValidator {
public:
    explicit BuildValidator(const VariantContract& contract);

    // Throws BuildValidationError listing every failure.
    void validate(const Build& build) const;

    std::vector<FieldFailure> check(const Build& build) const;

private:
    void check_shape(const Build& build, std::vector<FieldFailure>& failures) const;

    const VariantContract& contract_;
};

// Cross-field rule on its own. Throws BuildValidationError on mismatch; no-op when
// either layer is absent.
void assert_head_body_variant_equal(const Build& build);

}
