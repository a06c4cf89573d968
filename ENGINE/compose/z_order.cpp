#include "compose/z_order.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "utils/string_utils.hpp"

namespace charsheet {

ZOrderTable::ZOrderTable(std::vector<std::pair<std::string, int>> entries, int fallback)
    : entries_(std::move(entries)), fallback_(fallback) {}

ZOrderTable ZOrderTable::defaults() {
    return ZOrderTable({
        {"body/",        0},
        {"head/",        10},
        {"eyes/",        12},
        {"facial/",      14},
        {"feet/",        20},
        {"legs/",        22},
        {"torso/",       30},
        {"clothes/",     30},
        {"dress/",       30},
        {"arms/",        34},
        {"shoulders/",   36},
        {"beards/",      40},
        {"hair/",        42},
        {"hat/",         46},
        {"headwear/",    46},
        {"neck/",        60},
        {"accessories/", 60},
        {"cape/",        62},
        {"backpack/",    64},
        {"shield/",      70},
        {"weapon/",      72},
    }, 60);
}

ZOrderTable ZOrderTable::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("z-order table must be a JSON object");
    }
    std::vector<std::pair<std::string, int>> entries;
    int fallback = defaults().fallback();
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (!it.value().is_number_integer()) {
            throw std::runtime_error("z-order entry '" + it.key() + "' must be an integer");
        }
        if (it.key() == "*") {
            fallback = it.value().get<int>();
        } else {
            entries.emplace_back(it.key(), it.value().get<int>());
        }
    }
    return ZOrderTable(std::move(entries), fallback);
}

int ZOrderTable::z_for(const std::string& category) const {
    std::size_t best_len = 0;
    int z = fallback_;
    for (const auto& [prefix, depth] : entries_) {
        if (prefix.size() > best_len && strings::starts_with(category, prefix)) {
            best_len = prefix.size();
            z = depth;
        }
    }
    return z;
}

}
