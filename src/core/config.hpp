#pragma once

#include "core/types.hpp"
#include "terminal/terminal.hpp"
#include "glyph/glyph_packer.hpp"
#include "mapping/colorizer.hpp"
#include "mapping/gradient.hpp"
#include "scene/obj_loader.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace pepterm {

constexpr int CONFIG_VERSION = 1;

struct ConfigView {
    float fov = 1.7f;
    float near_clip = 0.1f;
    float distance_multiplier = 1.2f;
    float min_distance_multiplier = 0.05f;
    float max_distance_multiplier = 10.0f;
    float initial_yaw = 0.3f;
    float initial_pitch = 0.2f;
    float pitch_limit = 1.56f;
};

struct ConfigInput {
    float drag_speed = 30.0f;
    float pan_speed = 0.1f;
    float scroll_step = 0.03f;
    bool auto_rotate = true;
    float auto_rotate_speed = 0.002f;
};

struct ConfigRender {
    GlyphMode glyph_mode = GlyphMode::Braille;
    float char_aspect = 2.0f;
    ColorSource color_source = ColorSource::Sequence;
    float depth_blend = 0.5f;
    CellColorRule cell_color = CellColorRule::Average;
    int band_rows = 16;
    bool show_status = true;
};

struct ConfigColor {
    GradientId scheme = GradientId::Coolwarm;
    // Empty means detect from COLORTERM/TERM.
    std::optional<ColorMode> mode;
};

struct ConfigLoader {
    MeshMode primitive_mode = MeshMode::Wireframe;
    float min_edge_length = 0.1f;
    int max_edges = 50000;
    std::string pymol_path = "pymol";
    int cartoon_sampling = 3;
    std::string cache_dir;
};

struct ConfigDebug {
    bool profile_live = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigView view;
    ConfigInput input;
    ConfigRender render;
    ConfigColor color;
    ConfigLoader loader;
    ConfigDebug debug;

    std::string config_path;
    int fps = 30;

    bool validate(std::string& error) const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

const char* color_mode_name(ColorMode mode);
std::optional<ColorMode> parse_color_mode(const std::string& name);
std::optional<ColorSource> parse_color_source(const std::string& name);
std::optional<CellColorRule> parse_cell_color_rule(const std::string& name);

std::string get_home_dir();

}
