#pragma once

#include <SDL.h>
#include <SDL_image.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "asset/surface_utils.hpp"

namespace charsheet::testing {

namespace fs = std::filesystem;

inline fs::path unique_temp_dir(const std::string& label) {
    static std::atomic<int> counter{0};
#ifdef PROJECT_ROOT
    const fs::path base = fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    const fs::path base = fs::temp_directory_path() / "charsheet_tests";
#endif
    const fs::path dir = base / (label + "_" + std::to_string(counter.fetch_add(1)));
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir;
}

inline void write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
    out << text;
}

inline void write_json(const fs::path& path, const nlohmann::json& value) {
    write_text(path, value.dump(2));
}

inline surface_utils::SurfacePtr solid_surface(int w, int h, Uint8 r, Uint8 g, Uint8 b, Uint8 a) {
    auto surface = surface_utils::create_rgba_surface(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            Uint8* px = surface_utils::pixel_at(surface.get(), x, y);
            px[0] = r;
            px[1] = g;
            px[2] = b;
            px[3] = a;
        }
    }
    return surface;
}

inline void fill_rect(SDL_Surface* surface, const SDL_Rect& rect, Uint8 r, Uint8 g, Uint8 b, Uint8 a) {
    for (int y = rect.y; y < rect.y + rect.h; ++y) {
        for (int x = rect.x; x < rect.x + rect.w; ++x) {
            Uint8* px = surface_utils::pixel_at(surface, x, y);
            px[0] = r;
            px[1] = g;
            px[2] = b;
            px[3] = a;
        }
    }
}

inline void write_png(const fs::path& path, SDL_Surface* surface) {
    fs::create_directories(path.parent_path());
    surface_utils::save_png(surface, path);
}

// Every row gets its own red value (row * 40 + 10) so row order is observable after slicing.
inline surface_utils::SurfacePtr striped_sheet(int frame, int rows, int cols) {
    auto surface = surface_utils::create_rgba_surface(frame * cols, frame * rows);
    for (int r = 0; r < rows; ++r) {
        fill_rect(surface.get(), SDL_Rect{0, r * frame, frame * cols, frame},
                  static_cast<Uint8>(r * 40 + 10), 0, static_cast<Uint8>(r), 255);
    }
    return surface;
}

inline Uint8 red_at(const SDL_Surface* surface, int x, int y) {
    return surface_utils::pixel_at(surface, x, y)[0];
}

// Minimal on-disk asset tree:
//   root/sheet_definitions/*.json
//   root/spritesheets/<category>/<animation>/<variant>.png
//   root/category_reference.json
struct CatalogFixture {
    fs::path root;
    fs::path defs;
    fs::path sprites;

    explicit CatalogFixture(const std::string& label)
        : root(unique_temp_dir(label)),
          defs(root / "sheet_definitions"),
          sprites(root / "spritesheets") {
        fs::create_directories(defs);
        fs::create_directories(sprites);
    }

    ~CatalogFixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void definition(const std::string& file, const nlohmann::json& value) const {
        write_json(defs / file, value);
    }

    void reference(const nlohmann::json& value) const {
        write_json(root / "category_reference.json", value);
    }

    void sprite(const std::string& category, const std::string& animation, const std::string& variant,
                SDL_Surface* surface) const {
        write_png(sprites / category / animation / (variant + ".png"), surface);
    }

    // body.json (light, amber, olive) and heads_human_male.json (light, amber, olive, pale).
    void standard_body_and_head() const {
        definition("body.json", {
            {"name", "Body"},
            {"layer_1", {{"male", "body/bodies/male/"}, {"female", "body/bodies/female"}, {"teen", "body/bodies/teen"}}},
            {"variants", {"light", "amber", "olive"}},
        });
        definition("heads_human_male.json", {
            {"name", "Human male head"},
            {"layer_1", {{"male", "head/heads/human/male"}, {"female", "head/heads/human/female"}}},
            {"variants", {"light", "amber", "olive", "pale"}},
        });
    }
};

}
