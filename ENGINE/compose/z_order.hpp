#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace charsheet {

// Category prefix -> stacking depth (lower is drawn first). The longest matching
// prefix wins; categories with no match use the fallback depth.
class ZOrderTable {
public:
    ZOrderTable() = default;
    ZOrderTable(std::vector<std::pair<std::string, int>> entries, int fallback);

    // body < head < clothing < hair/headwear < accessories.
    static ZOrderTable defaults();

    // `{ "<prefix>": z, ... }`, optionally with "*" for the fallback depth.
    static ZOrderTable from_json(const nlohmann::json& value);

    int z_for(const std::string& category) const;
    int fallback() const { return fallback_; }

private:
    std::vector<std::pair<std::string, int>> entries_;
    int fallback_ = 60;
};

}
