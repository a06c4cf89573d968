#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace charsheet {

class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& message) : std::runtime_error(message) {}
};

// Raised when body or head cannot be resolved; names the category (and item, when known).
class ResolutionError : public std::runtime_error {
public:
    ResolutionError(std::string reason, std::string category, std::string item);

    const std::string& reason() const { return reason_; }
    const std::string& category() const { return category_; }
    const std::string& item() const { return item_; }

private:
    std::string reason_;
    std::string category_;
    std::string item_;
};

struct FieldFailure {
    std::string path;
    std::string message;
};

class BuildValidationError : public std::runtime_error {
public:
    explicit BuildValidationError(std::vector<FieldFailure> failures);

    const std::vector<FieldFailure>& failures() const { return failures_; }

private:
    std::vector<FieldFailure> failures_;
};

// Semantic selection rejected at the boundary; one failure per bad field.
class SelectionError : public std::runtime_error {
public:
    explicit SelectionError(std::vector<FieldFailure> failures);

    const std::vector<FieldFailure>& failures() const { return failures_; }

private:
    std::vector<FieldFailure> failures_;
};

class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message) : std::runtime_error(message) {}
};

class AssetResolutionError : public std::runtime_error {
public:
    explicit AssetResolutionError(const std::string& message) : std::runtime_error(message) {}
};

}
