#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace charsheet {

// Colour name -> ordered synonym candidates. Keys are stored normalized.
class ColorDictionary {
public:
    ColorDictionary() = default;

    static ColorDictionary from_json(const nlohmann::json& value);
    static ColorDictionary load(const std::filesystem::path& path);

    void add(std::string_view colour, std::vector<std::string> synonyms);

    // nullptr when the colour has no entry.
    const std::vector<std::string>* synonyms_for(std::string_view colour) const;

    std::size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, std::vector<std::string>> entries_;
};

}
