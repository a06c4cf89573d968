#include "utils/staged_publish.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "utils/log.hpp"

namespace charsheet::staged_publish {

namespace fs = std::filesystem;

namespace {

fs::path parking_dir_for(const fs::path& staging) {
    return staging.parent_path() / (staging.filename().string() + ".previous");
}

void roll_back(const std::vector<std::string>& placed,
               const std::vector<std::string>& parked,
               const fs::path& parking,
               const fs::path& out_dir) {
    std::error_code ec;
    for (auto it = placed.rbegin(); it != placed.rend(); ++it) {
        fs::remove_all(out_dir / *it, ec);
        if (ec) {
            log::error("[staged_publish] Could not remove '" + (out_dir / *it).generic_string() + "': " + ec.message());
        }
    }
    for (const auto& name : parked) {
        fs::rename(parking / name, out_dir / name, ec);
        if (ec) {
            log::error("[staged_publish] Could not restore '" + (out_dir / name).generic_string() + "': " + ec.message());
        }
    }
}

}

std::vector<std::string> entry_names(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void commit(const fs::path& staging, const std::vector<std::string>& names, const fs::path& out_dir) {
    const fs::path parking = parking_dir_for(staging);
    std::error_code ec;
    fs::remove_all(parking, ec);
    if (ec) {
        fs::remove_all(staging, ec);
        throw std::runtime_error("Unable to clear '" + parking.generic_string() + "' before publishing");
    }

    std::vector<std::string> parked;
    std::vector<std::string> placed;
    try {
        fs::create_directories(out_dir);
        fs::create_directories(parking);
        for (const auto& name : names) {
            const fs::path target = out_dir / name;
            if (fs::exists(fs::symlink_status(target))) {
                fs::rename(target, parking / name);
                parked.push_back(name);
            }
            fs::rename(staging / name, target);
            placed.push_back(name);
        }
    } catch (const std::exception& e) {
        log::error(std::string("[staged_publish] Publishing into '") + out_dir.generic_string() + "' failed: " + e.what());
        roll_back(placed, parked, parking, out_dir);
        fs::remove_all(parking, ec);
        fs::remove_all(staging, ec);
        throw;
    }

    fs::remove_all(parking, ec);
    if (ec) {
        log::warn("[staged_publish] Could not remove '" + parking.generic_string() + "': " + ec.message());
    }
    fs::remove_all(staging, ec);
    if (ec) {
        log::warn("[staged_publish] Could not remove '" + staging.generic_string() + "': " + ec.message());
    }
}

}
