#include "catalog/color_dictionary.hpp"

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "utils/json_io.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

ColorDictionary ColorDictionary::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw CatalogError("color_dictionary_not_object");
    }
    ColorDictionary dict;
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (!it.value().is_array()) {
            log::warn("[ColorDictionary] Ignoring non-array entry '" + it.key() + "'");
            continue;
        }
        std::vector<std::string> synonyms;
        for (const auto& s : it.value()) {
            if (s.is_string()) {
                synonyms.push_back(s.get<std::string>());
            }
        }
        dict.add(it.key(), std::move(synonyms));
    }
    return dict;
}

ColorDictionary ColorDictionary::load(const std::filesystem::path& path) {
    nlohmann::json document;
    if (!json_io::load_json(path, document)) {
        throw CatalogError("Unable to read colour dictionary '" + path.generic_string() + "'");
    }
    return from_json(document);
}

void ColorDictionary::add(std::string_view colour, std::vector<std::string> synonyms) {
    entries_[strings::normalize_key(colour)] = std::move(synonyms);
}

const std::vector<std::string>* ColorDictionary::synonyms_for(std::string_view colour) const {
    auto it = entries_.find(strings::normalize_key(colour));
    return it == entries_.end() ? nullptr : &it->second;
}

}
