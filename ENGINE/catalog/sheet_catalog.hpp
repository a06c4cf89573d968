#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "catalog/sheet_definition.hpp"

namespace charsheet {

struct CatalogLoadNote {
    std::string file;
    std::string reason;
};

// Read-only directory of sheet definitions. The directory is scanned once, on first
// use, under a load-once guard; afterwards the catalog is immutable and safe to share
// between threads.
class SheetCatalog {
public:
    // Throws CatalogError when the directory does not exist.
    explicit SheetCatalog(std::filesystem::path definitions_dir);

    SheetCatalog(const SheetCatalog&) = delete;
    SheetCatalog& operator=(const SheetCatalog&) = delete;

    const std::filesystem::path& definitions_dir() const { return definitions_dir_; }

    // `file` is relative to the definitions directory, e.g. "hair_long.json".
    const SheetDefinition* find(const std::string& file) const;

    const std::map<std::string, SheetDefinition>& all() const;
    const std::vector<CatalogLoadNote>& load_notes() const;

    bool loaded() const;

private:
    void ensure_loaded() const;
    void load_all() const;

    std::filesystem::path definitions_dir_;
    mutable std::once_flag load_once_;
    mutable std::map<std::string, SheetDefinition> definitions_;
    mutable std::vector<CatalogLoadNote> notes_;
    mutable bool loaded_ = false;
};

}
