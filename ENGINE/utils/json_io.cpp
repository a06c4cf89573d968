#include "utils/json_io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "utils/log.hpp"

namespace charsheet::json_io {

bool load_json(const std::filesystem::path& file_path, nlohmann::json& out_json) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return false;
    }
    try {
        file >> out_json;
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        log::warn(std::string("[json_io] Failed to parse '") + file_path.generic_string() + "': " + e.what());
        return false;
    }
}

std::optional<nlohmann::json> load_json(const std::filesystem::path& file_path) {
    nlohmann::json value;
    if (load_json(file_path, value)) {
        return value;
    }
    return std::nullopt;
}

void save_json(const std::filesystem::path& file_path, const nlohmann::json& value) {
    const auto parent = file_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec && !std::filesystem::exists(parent)) {
            std::ostringstream oss;
            oss << "Failed to create directory '" << parent.generic_string() << "': " << ec.message();
            throw std::runtime_error(oss.str());
        }
    }

    std::ofstream out(file_path);
    if (!out.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open '" << file_path.generic_string() << "' for writing.";
        throw std::runtime_error(oss.str());
    }
    out << value.dump(2);
    if (!out.good()) {
        std::ostringstream oss;
        oss << "Failed while writing '" << file_path.generic_string() << "'.";
        throw std::runtime_error(oss.str());
    }
}

}
