#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "build/build.hpp"
#include "compose/z_order.hpp"
#include "resolve/resolver.hpp"
#include "slice/frame_slicer.hpp"

namespace charsheet {

struct PipelineConfig {
    std::vector<std::string> animations{"idle"};
    int zero_pad = 3;
    int fps = 8;
    bool orientation_dirs = true;
    OutputMode output_mode = OutputMode::Both;
    std::optional<FrameSize> frame_size;
    std::string slug = "character";
    ZOrderTable z_order = ZOrderTable::defaults();

    static PipelineConfig defaults();
    // Unknown or mistyped keys keep their defaults.
    static PipelineConfig from_json(const nlohmann::json* obj);
    // Defaults when the file is missing; throws std::runtime_error when it is unreadable JSON.
    static PipelineConfig load(const std::filesystem::path& path);

    void clamp();
    void apply_to_json(nlohmann::json& obj) const;

    // Fields a Build declares in its `output` block take precedence.
    void merge_build_output(const BuildOutput& output);

    bool writes_sheets() const;
    bool writes_frames() const;

    SliceOptions slice_options() const;
    ResolveOptions resolve_options() const;
};

}
