#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace charsheet {

inline constexpr std::string_view kBuildSchema      = "ulpc.build/1.0";
inline constexpr std::string_view kGeneratorProject = "Universal-LPC-Spritesheet-Character-Generator";

inline constexpr std::string_view kBodyNamespace = "body/bodies/";
inline constexpr std::string_view kHeadNamespace = "head/heads/";

enum class TintMode {
    Multiply,
    Screen,
    Overlay,
    Replace,
};

enum class OutputMode {
    Full,
    SplitByAnimation,
    SplitByFrame,
    Both,
};

std::string_view to_string(TintMode mode);
std::optional<TintMode> parse_tint_mode(std::string_view value);
std::string_view to_string(OutputMode mode);
std::optional<OutputMode> parse_output_mode(std::string_view value);

struct LayerOffset {
    int x = 0;
    int y = 0;
};

struct LayerTint {
    std::string rgb;
    TintMode mode = TintMode::Multiply;
};

struct Layer {
    std::string category;
    std::string variant;
    std::optional<bool> visible;
    std::optional<int> z_override;
    std::optional<LayerOffset> offset;
    std::optional<LayerTint> tint;

    bool is_visible() const { return visible.value_or(true); }
    bool is_body() const;
    bool is_head() const;
};

struct FrameSize {
    int w = 0;
    int h = 0;

    bool operator==(const FrameSize& other) const { return w == other.w && h == other.h; }
    bool operator!=(const FrameSize& other) const { return !(*this == other); }
};

struct BuildOutput {
    std::optional<OutputMode> mode;
    std::optional<FrameSize> frame_size;
    std::optional<int> zero_pad;
    std::optional<int> fps;
};

struct Generator {
    std::string project{kGeneratorProject};
    std::string version = "internal";
};

struct Build {
    std::string schema{kBuildSchema};
    Generator generator;
    std::vector<std::string> animations;
    std::vector<Layer> layers;
    std::optional<BuildOutput> output;

    // First layer in the body/head namespace, or nullptr.
    Layer* body_layer();
    Layer* head_layer();
    const Layer* body_layer() const;
    const Layer* head_layer() const;

    // Compares the serialized form.
    bool operator==(const Build& other) const;
    bool operator!=(const Build& other) const { return !(*this == other); }
};

nlohmann::json build_to_json(const Build& build);

// Strict boundary parser. Every malformed field is collected and reported together
// in a BuildValidationError.
Build build_from_json(const nlohmann::json& value);

}
