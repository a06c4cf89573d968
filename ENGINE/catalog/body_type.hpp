#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace charsheet {

enum class BodyType {
    Male,
    Muscular,
    Female,
    Teen,
    Child,
};

namespace body_types {

inline constexpr std::string_view male     = "male";
inline constexpr std::string_view muscular = "muscular";
inline constexpr std::string_view female   = "female";
inline constexpr std::string_view teen     = "teen";
inline constexpr std::string_view child    = "child";

inline constexpr std::array<std::string_view, 5> all{ male, muscular, female, teen, child };

inline std::string_view to_string(BodyType type) {
    switch (type) {
        case BodyType::Male:     return male;
        case BodyType::Muscular: return muscular;
        case BodyType::Female:   return female;
        case BodyType::Teen:     return teen;
        case BodyType::Child:    return child;
    }
    return male;
}

inline std::optional<BodyType> parse(std::string_view value) {
    if (value == male) return BodyType::Male;
    if (value == muscular) return BodyType::Muscular;
    if (value == female) return BodyType::Female;
    if (value == teen) return BodyType::Teen;
    if (value == child) return BodyType::Child;
    return std::nullopt;
}

}

}
