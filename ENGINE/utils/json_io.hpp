#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace charsheet::json_io {

// Returns nullopt when the file is missing, unreadable or not valid JSON.
std::optional<nlohmann::json> load_json(const std::filesystem::path& file_path);
bool load_json(const std::filesystem::path& file_path, nlohmann::json& out_json);

// Writes pretty-printed JSON, creating parent directories. Throws std::runtime_error on failure.
void save_json(const std::filesystem::path& file_path, const nlohmann::json& value);

}
