#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace charsheet {

class ColorDictionary;

struct VariantRequest {
    const std::string& preferred_colour;
    const std::vector<std::string>& variants;
    const ColorDictionary& dictionary;
};

// Tagged result of one strategy: either a variant plus the reason it was chosen,
// or "not applicable" so the next strategy runs.
struct VariantOutcome {
    enum class Kind {
        Resolved,
        NotApplicable,
    };

    Kind kind = Kind::NotApplicable;
    std::string variant;
    std::string note;

    static VariantOutcome resolved(std::string variant, std::string note);
    static VariantOutcome not_applicable();

    bool is_resolved() const { return kind == Kind::Resolved; }
};

class VariantStrategy {
public:
    virtual ~VariantStrategy() = default;
    virtual const char* name() const = 0;
    virtual VariantOutcome apply(const VariantRequest& request) const = 0;
};

// Case/whitespace-insensitive equality between the preferred colour and a variant.
class DirectMatchStrategy : public VariantStrategy {
public:
    const char* name() const override { return "direct"; }
    VariantOutcome apply(const VariantRequest& request) const override;
};

// Tries each synonym of the preferred colour, in dictionary order.
class DictionaryMatchStrategy : public VariantStrategy {
public:
    const char* name() const override { return "dictionary"; }
    VariantOutcome apply(const VariantRequest& request) const override;
};

// First allowed variant; always applicable when variants exist.
class FirstVariantFallbackStrategy : public VariantStrategy {
public:
    const char* name() const override { return "fallback"; }
    VariantOutcome apply(const VariantRequest& request) const override;
};

struct VariantChoice {
    std::optional<std::string> variant;
    std::string note;
};

// Runs its strategies in order and stops at the first resolved outcome.
class VariantSelector {
public:
    explicit VariantSelector(std::vector<std::shared_ptr<const VariantStrategy>> strategies);

    // direct -> dictionary -> first-variant fallback.
    static VariantSelector standard();

    // A missing or blank preferred colour skips straight to the first variant with
    // its own note; an empty variant list yields no variant.
    VariantChoice choose(const std::optional<std::string>& preferred_colour,
                         const std::vector<std::string>& variants,
                         const ColorDictionary& dictionary) const;

private:
    std::vector<std::shared_ptr<const VariantStrategy>> strategies_;
};

}
