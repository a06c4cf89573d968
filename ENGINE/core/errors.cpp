#include "core/errors.hpp"

#include <sstream>
#include <utility>

namespace charsheet {

namespace {

std::string describe_resolution(const std::string& reason, const std::string& category, const std::string& item) {
    std::ostringstream oss;
    oss << reason << ": category '" << category << "'";
    if (!item.empty()) {
        oss << " (item '" << item << "')";
    }
    return oss.str();
}

std::string join_failures(const char* prefix, const std::vector<FieldFailure>& failures) {
    std::ostringstream oss;
    oss << prefix;
    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << failures[i].path << " " << failures[i].message;
    }
    return oss.str();
}

}

ResolutionError::ResolutionError(std::string reason, std::string category, std::string item)
    : std::runtime_error(describe_resolution(reason, category, item)),
      reason_(std::move(reason)),
      category_(std::move(category)),
      item_(std::move(item)) {}

BuildValidationError::BuildValidationError(std::vector<FieldFailure> failures)
    : std::runtime_error(join_failures("Invalid build: ", failures)),
      failures_(std::move(failures)) {}

SelectionError::SelectionError(std::vector<FieldFailure> failures)
    : std::runtime_error(join_failures("Invalid selection: ", failures)),
      failures_(std::move(failures)) {}

}
