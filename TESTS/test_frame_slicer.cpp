#include "doctest/doctest.h"

#include <filesystem>

#include <nlohmann/json.hpp>

#include "compose/compositor.hpp"
#include "core/errors.hpp"
#include "slice/frame_slicer.hpp"
#include "utils/log.hpp"
#include "utils/staged_publish.hpp"
#include "test_support.hpp"

using namespace charsheet;
namespace fs = std::filesystem;

namespace {

GridInfo grid(int frame, int rows, int cols, std::vector<Facing> directions = {}) {
    GridInfo g;
    g.frame = FrameSize{frame, frame};
    g.rows = rows;
    g.cols = cols;
    g.directions = std::move(directions);
    return g;
}

}

TEST_CASE("slicing yields rows times columns frames") {
    auto sheet = testing::striped_sheet(4, 4, 3);
    const auto result = slice(sheet.get(), grid(4, 4, 3), "walk");

    CHECK(result.frames.size() == 12);
    CHECK(result.manifest.frame_count() == 12);
    CHECK(result.manifest.frame_size == FrameSize{4, 4});
    CHECK(result.manifest.fps == 8);
    REQUIRE(result.manifest.folders.size() == 4);
    CHECK(result.manifest.folders[0].first == "Walk_back");
    CHECK(result.manifest.folders[3].first == "Walk_right");
    CHECK(result.manifest.folders[0].second.front() == "Walk_back/character_walk_000.png");
    CHECK(result.frames.back().file_name == "character_walk_011.png");
    for (const auto& frame : result.frames) {
        CHECK(frame.pixels->w == 4);
        CHECK(frame.pixels->h == 4);
    }
}

TEST_CASE("frames are exact pixel rectangles") {
    auto sheet = testing::striped_sheet(4, 2, 2);
    testing::fill_rect(sheet.get(), SDL_Rect{5, 6, 1, 1}, 250, 1, 2, 255);
    const auto result = slice(sheet.get(), grid(4, 2, 2), "idle");
    REQUIRE(result.frames.size() == 4);
    const Frame& f = result.frames[3];
    CHECK(f.source_row == 1);
    CHECK(f.source_col == 1);
    CHECK(testing::red_at(f.pixels.get(), 1, 2) == 250);
    CHECK(testing::red_at(f.pixels.get(), 0, 0) == 50);
}

TEST_CASE("explicit row labels are canonicalized into the facing cycle") {
    auto sheet = testing::striped_sheet(4, 5, 2);
    const auto result = slice(sheet.get(),
                              grid(4, 5, 2, {Facing::Front, Facing::Right, Facing::Back, Facing::Left, Facing::Front}),
                              "walk");

    REQUIRE(result.manifest.orientations.size() == 5);
    CHECK(result.manifest.orientations[0] == Facing::Back);
    CHECK(result.manifest.orientations[1] == Facing::Left);
    CHECK(result.manifest.orientations[2] == Facing::Front);
    CHECK(result.manifest.orientations[3] == Facing::Right);
    CHECK(result.manifest.orientations[4] == Facing::Front);

    // Output position 0 is source row 2 (back), whose stripe red value is 2 * 40 + 10.
    CHECK(testing::red_at(result.frames[0].pixels.get(), 0, 0) == 90);
    CHECK(result.frames[0].source_row == 2);
    CHECK(result.frames[0].index == 0);
    CHECK(result.frames[2].source_row == 3);
    CHECK(result.frames[4].source_row == 0);
    CHECK(result.frames[6].source_row == 1);
    CHECK(result.frames[8].source_row == 4);

    REQUIRE(result.manifest.folders.size() == 5);
    CHECK(result.manifest.folders[4].first == "Walk_front_row4");
    CHECK(result.manifest.frames_in("Walk_back")->size() == 2);
}

TEST_CASE("canonical order keeps source order when the cycle is incomplete") {
    const std::vector<std::optional<Facing>> partial{Facing::Right, Facing::Back, std::nullopt};
    CHECK(canonical_row_order(partial) == std::vector<int>{0, 1, 2});

    const std::vector<std::optional<Facing>> full{std::nullopt, Facing::Right, Facing::Front, Facing::Left, Facing::Back};
    CHECK(canonical_row_order(full) == std::vector<int>{4, 3, 2, 1, 0});
}

TEST_CASE("rows without metadata get default labels") {
    const auto six = assign_row_facings(grid(4, 6, 1));
    REQUIRE(six.size() == 6);
    CHECK(six[0] == Facing::Back);
    CHECK(six[1] == Facing::Left);
    CHECK(six[2] == Facing::Front);
    CHECK(six[3] == Facing::Right);
    CHECK_FALSE(six[4].has_value());

    const auto single = assign_row_facings(grid(4, 1, 3));
    REQUIRE(single.size() == 1);
    CHECK_FALSE(single[0].has_value());

    // A directions list that does not cover every row is ignored.
    const auto mismatched = assign_row_facings(grid(4, 2, 1, {Facing::Front}));
    CHECK(mismatched[0] == Facing::Back);

    auto sheet = testing::striped_sheet(4, 6, 1);
    const auto result = slice(sheet.get(), grid(4, 6, 1), "hurt");
    CHECK(result.manifest.folders[4].first == "Hurt_row4");
    CHECK(result.manifest.folders[5].first == "Hurt_row5");
    CHECK(result.manifest.orientations.size() == 4);
}

TEST_CASE("single row sheets use one folder and options shape names") {
    auto sheet = testing::striped_sheet(4, 1, 3);
    SliceOptions options;
    options.zero_pad = 5;
    options.fps = 12;
    options.slug = "hero";
    const auto result = slice(sheet.get(), grid(4, 1, 3), "idle", options);
    REQUIRE(result.manifest.folders.size() == 1);
    CHECK(result.manifest.folders[0].first == "Idle");
    CHECK(result.frames[2].id() == "Idle/hero_idle_00002.png");
    CHECK(result.manifest.fps == 12);
    CHECK(result.manifest.orientations.empty());

    options.orientation_dirs = false;
    auto striped = testing::striped_sheet(4, 4, 1);
    const auto flat = slice(striped.get(), grid(4, 4, 1), "idle", options);
    REQUIRE(flat.manifest.folders.size() == 1);
    CHECK(flat.manifest.folders[0].first == "idle");
    CHECK(flat.manifest.folders[0].second.size() == 4);
}

TEST_CASE("non-divisible rasters are rejected, never cropped") {
    auto sheet = testing::solid_surface(10, 8, 1, 1, 1, 255);
    try {
        slice(sheet.get(), grid(4, 2, 2), "idle");
        FAIL("expected GeometryError");
    } catch (const GeometryError& ex) {
        CHECK(std::string(ex.what()).find("10x8") != std::string::npos);
    }

    auto exact = testing::solid_surface(8, 8, 1, 1, 1, 255);
    CHECK_THROWS_AS(slice(exact.get(), grid(4, 3, 2), "idle"), GeometryError);
}

TEST_CASE("manifest json lists folders in output order") {
    auto sheet = testing::striped_sheet(4, 4, 2);
    const auto result = slice(sheet.get(), grid(4, 4, 2), "run");
    const nlohmann::json doc = result.manifest.to_json();
    CHECK(doc["animation"] == "run");
    CHECK(doc["frame_size"]["w"] == 4);
    CHECK(doc["frame_count"] == 8);
    CHECK(doc["orientations"] == nlohmann::json::array({"back", "left", "front", "right"}));
    CHECK(doc["folders"][1] == "Run_left");
    CHECK(doc["frames"]["Run_left"].size() == 2);
}

TEST_CASE("slicing a composed raster uses its grid") {
    ComposedRaster raster;
    raster.pixels = testing::striped_sheet(4, 4, 3);
    raster.grid = grid(4, 4, 3);
    raster.animation = "slash";
    const auto result = slice(raster);
    CHECK(result.manifest.animation == "slash");
    CHECK(result.frames.size() == static_cast<std::size_t>(raster.grid.rows * raster.grid.cols));
}

TEST_CASE("frames are written under their folders") {
    const fs::path out = testing::unique_temp_dir("slice_write");
    auto sheet = testing::striped_sheet(4, 4, 2);
    const auto result = slice(sheet.get(), grid(4, 4, 2), "walk");

    testing::write_text(out / "Walk_back" / "stale.png", "old");
    const auto written = write_frames(result, out);
    CHECK(written.size() == 8);
    for (const auto& path : written) {
        CHECK(fs::is_regular_file(path));
    }
    CHECK(fs::exists(out / "Walk_front" / "character_walk_004.png"));
    CHECK_FALSE(fs::exists(out / "Walk_back" / "stale.png"));
    CHECK_FALSE(fs::exists(out / ".staging_walk"));

    auto reread = surface_utils::load_png_rgba(out / "Walk_back" / "character_walk_000.png");
    REQUIRE(reread);
    CHECK(testing::red_at(reread.get(), 0, 0) == 10);

    std::error_code ec;
    fs::remove_all(out, ec);
}

TEST_CASE("a failed publish restores the previous folders and removes staging") {
    const fs::path out = testing::unique_temp_dir("publish_rollback");
    const fs::path staging = out / ".staging_walk";
    testing::write_text(out / "Walk_back" / "old.png", "old back");
    testing::write_text(out / "Walk_left" / "old.png", "old left");
    testing::write_text(out / "notes.txt", "untouched");
    testing::write_text(staging / "Walk_back" / "new.png", "new back");

    {
        log::ScopedLevel quiet(log::Level::Error);
        CHECK_THROWS(staged_publish::commit(staging, {"Walk_back", "Walk_left"}, out));
    }
    CHECK(fs::exists(out / "Walk_back" / "old.png"));
    CHECK_FALSE(fs::exists(out / "Walk_back" / "new.png"));
    CHECK(fs::exists(out / "Walk_left" / "old.png"));
    CHECK(fs::exists(out / "notes.txt"));
    CHECK_FALSE(fs::exists(staging));
    CHECK_FALSE(fs::exists(out / ".staging_walk.previous"));

    testing::write_text(staging / "Walk_back" / "new.png", "new back");
    testing::write_text(staging / "Walk_left" / "new.png", "new left");
    staged_publish::commit(staging, staged_publish::entry_names(staging), out);
    CHECK(fs::exists(out / "Walk_back" / "new.png"));
    CHECK_FALSE(fs::exists(out / "Walk_back" / "old.png"));
    CHECK(fs::exists(out / "Walk_left" / "new.png"));
    CHECK(fs::exists(out / "notes.txt"));
    CHECK_FALSE(fs::exists(staging));

    std::error_code ec;
    fs::remove_all(out, ec);
}
