#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace charsheet::staged_publish {

// Top-level entry names of `dir`, sorted.
std::vector<std::string> entry_names(const std::filesystem::path& dir);

// Moves each named entry of `staging` into `out_dir`, replacing entries of the same name.
// Replaced entries are parked beside `staging` until every move lands. If any move fails the
// entries already moved are removed, the parked ones are put back and the error is rethrown.
// `staging` is removed either way.
void commit(const std::filesystem::path& staging,
            const std::vector<std::string>& names,
            const std::filesystem::path& out_dir);

}
