#include "catalog/sheet_catalog.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

#include "core/errors.hpp"
#include "utils/json_io.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> discover_definition_files(const fs::path& root) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log::warn(std::string("[SheetCatalog] Unable to enumerate '") + root.generic_string() + "': " + ec.message());
        return files;
    }
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            log::warn(std::string("[SheetCatalog] Error while enumerating '") + root.generic_string() + "': " + ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (strings::to_lower_copy(it->path().extension().string()) == ".json") {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}

SheetCatalog::SheetCatalog(fs::path definitions_dir)
    : definitions_dir_(std::move(definitions_dir)) {
    std::error_code ec;
    if (!fs::is_directory(definitions_dir_, ec)) {
        std::ostringstream oss;
        oss << "Sheet definitions directory not found: '" << definitions_dir_.generic_string() << "'";
        throw CatalogError(oss.str());
    }
}

const SheetDefinition* SheetCatalog::find(const std::string& file) const {
    ensure_loaded();
    const std::string key = fs::path(file).lexically_normal().generic_string();
    auto it = definitions_.find(key);
    return it == definitions_.end() ? nullptr : &it->second;
}

const std::map<std::string, SheetDefinition>& SheetCatalog::all() const {
    ensure_loaded();
    return definitions_;
}

const std::vector<CatalogLoadNote>& SheetCatalog::load_notes() const {
    ensure_loaded();
    return notes_;
}

bool SheetCatalog::loaded() const {
    ensure_loaded();
    return loaded_;
}

void SheetCatalog::ensure_loaded() const {
    std::call_once(load_once_, [this]() { load_all(); });
}

void SheetCatalog::load_all() const {
    std::map<std::string, SheetDefinition> definitions;
    std::vector<CatalogLoadNote> notes;

    for (const auto& path : discover_definition_files(definitions_dir_)) {
        const std::string key = path.lexically_relative(definitions_dir_).generic_string();
        nlohmann::json document;
        if (!json_io::load_json(path, document)) {
            notes.push_back(CatalogLoadNote{key, "unreadable_or_invalid_json"});
            log::warn("[SheetCatalog] Skipping unreadable definition '" + key + "'");
            continue;
        }
        std::string problem;
        auto def = SheetDefinition::from_json(document, key, &problem);
        if (!def) {
            notes.push_back(CatalogLoadNote{key, problem});
            log::debug("[SheetCatalog] Skipping '" + key + "': " + problem);
            continue;
        }
        definitions.emplace(key, std::move(*def));
    }

    log::info("[SheetCatalog] Loaded " + std::to_string(definitions.size()) + " definitions from '" +
              definitions_dir_.generic_string() + "' (" + std::to_string(notes.size()) + " skipped)");

    definitions_ = std::move(definitions);
    notes_ = std::move(notes);
    loaded_ = true;
}

}
