#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace charsheet::strings {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string trim_copy(std::string_view value) {
    std::size_t start = 0;
    std::size_t end = value.size();

    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

// Lowercase, collapse whitespace runs to one space, trim.
inline std::string normalize_key(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

inline bool is_blank(std::string_view value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

inline bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::string strip_trailing_slashes(std::string value) {
    while (!value.empty() && (value.back() == '/' || value.back() == '\\')) {
        value.pop_back();
    }
    return value;
}

inline std::string zero_pad(long long number, int width) {
    std::string digits = std::to_string(number);
    if (width > 0 && static_cast<int>(digits.size()) < width) {
        digits.insert(digits.begin(), static_cast<std::size_t>(width) - digits.size(), '0');
    }
    return digits;
}

inline std::string title_case_first(std::string value) {
    if (!value.empty()) {
        value[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
    }
    return value;
}

}
