#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml++/toml.hpp>

#include <filesystem>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unistd.h>
#include <pwd.h>

namespace pepterm {

namespace {

std::string get_app_data_dir() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

std::string lowercase(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
    return false;
}

bool finite_in_range(float v, float lo, float hi) {
    return std::isfinite(v) && v >= lo && v <= hi;
}

}

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::None: return "none";
        case ColorMode::Ansi16: return "ansi16";
        case ColorMode::Ansi256: return "ansi256";
        case ColorMode::Truecolor: return "truecolor";
    }
    return "none";
}

std::optional<ColorMode> parse_color_mode(const std::string& name) {
    const std::string lower = lowercase(name);
    if (lower == "none" || lower == "mono") return ColorMode::None;
    if (lower == "ansi16" || lower == "16") return ColorMode::Ansi16;
    if (lower == "ansi256" || lower == "256") return ColorMode::Ansi256;
    if (lower == "truecolor" || lower == "24bit") return ColorMode::Truecolor;
    return std::nullopt;
}

std::optional<ColorSource> parse_color_source(const std::string& name) {
    const std::string lower = lowercase(name);
    if (lower == "sequence") return ColorSource::Sequence;
    if (lower == "depth") return ColorSource::Depth;
    if (lower == "blend") return ColorSource::Blend;
    return std::nullopt;
}

std::optional<CellColorRule> parse_cell_color_rule(const std::string& name) {
    const std::string lower = lowercase(name);
    if (lower == "average") return CellColorRule::Average;
    if (lower == "nearest") return CellColorRule::Nearest;
    return std::nullopt;
}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/pepterm";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (!finite_in_range(view.fov, 0.1f, 3.0f)) {
        error = "view.fov must be between 0.1 and 3.0 radians";
        return false;
    }
    if (!finite_in_range(view.near_clip, 1e-4f, 10.0f)) {
        error = "view.near_clip must be between 0.0001 and 10";
        return false;
    }
    if (!finite_in_range(view.distance_multiplier, 0.01f, 100.0f)) {
        error = "view.distance_multiplier must be between 0.01 and 100";
        return false;
    }
    if (!finite_in_range(view.min_distance_multiplier, 1e-4f, 100.0f) ||
        !finite_in_range(view.max_distance_multiplier, 1e-4f, 1000.0f) ||
        view.min_distance_multiplier >= view.max_distance_multiplier) {
        error = "view.min_distance_multiplier must be positive and below view.max_distance_multiplier";
        return false;
    }
    if (!finite_in_range(view.pitch_limit, 0.0f, 1.5707f)) {
        error = "view.pitch_limit must be between 0 and pi/2";
        return false;
    }
    if (!std::isfinite(view.initial_yaw) || !std::isfinite(view.initial_pitch)) {
        error = "view.initial_yaw and view.initial_pitch must be finite";
        return false;
    }
    if (!finite_in_range(input.drag_speed, 0.0f, 1000.0f)) {
        error = "input.drag_speed must be between 0 and 1000";
        return false;
    }
    if (!finite_in_range(input.pan_speed, 0.0f, 10.0f)) {
        error = "input.pan_speed must be between 0 and 10";
        return false;
    }
    if (!finite_in_range(input.scroll_step, 0.0f, 1.0f)) {
        error = "input.scroll_step must be between 0 and 1";
        return false;
    }
    if (!finite_in_range(input.auto_rotate_speed, -1.0f, 1.0f)) {
        error = "input.auto_rotate_speed must be between -1 and 1";
        return false;
    }
    if (!finite_in_range(render.char_aspect, 0.5f, 4.0f)) {
        error = "render.char_aspect must be between 0.5 and 4";
        return false;
    }
    if (!finite_in_range(render.depth_blend, 0.0f, 1.0f)) {
        error = "render.depth_blend must be between 0 and 1";
        return false;
    }
    if (render.band_rows < 1 || render.band_rows > 1024) {
        error = "render.band_rows must be between 1 and 1024";
        return false;
    }
    if (!finite_in_range(loader.min_edge_length, 0.0f, 1000.0f)) {
        error = "loader.min_edge_length must be between 0 and 1000";
        return false;
    }
    if (loader.max_edges < 0) {
        error = "loader.max_edges must be non-negative";
        return false;
    }
    if (loader.cartoon_sampling < 1 || loader.cartoon_sampling > 20) {
        error = "loader.cartoon_sampling must be between 1 and 20";
        return false;
    }
    if (fps < 1 || fps > 120) {
        error = "fps must be between 1 and 120";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        set_error(error, "file not found: " + path);
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                set_error(error, "unsupported config_version " + std::to_string(*v));
                return std::nullopt;
            }
        }

        if (auto v = tbl["fps"].value<int>()) cfg.fps = *v;

        if (auto view = tbl["view"]) {
            if (auto v = view["fov"].value<double>()) cfg.view.fov = static_cast<float>(*v);
            if (auto v = view["near_clip"].value<double>()) cfg.view.near_clip = static_cast<float>(*v);
            if (auto v = view["distance_multiplier"].value<double>()) cfg.view.distance_multiplier = static_cast<float>(*v);
            if (auto v = view["min_distance_multiplier"].value<double>()) cfg.view.min_distance_multiplier = static_cast<float>(*v);
            if (auto v = view["max_distance_multiplier"].value<double>()) cfg.view.max_distance_multiplier = static_cast<float>(*v);
            if (auto v = view["initial_yaw"].value<double>()) cfg.view.initial_yaw = static_cast<float>(*v);
            if (auto v = view["initial_pitch"].value<double>()) cfg.view.initial_pitch = static_cast<float>(*v);
            if (auto v = view["pitch_limit"].value<double>()) cfg.view.pitch_limit = static_cast<float>(*v);
        }

        if (auto input = tbl["input"]) {
            if (auto v = input["drag_speed"].value<double>()) cfg.input.drag_speed = static_cast<float>(*v);
            if (auto v = input["pan_speed"].value<double>()) cfg.input.pan_speed = static_cast<float>(*v);
            if (auto v = input["scroll_step"].value<double>()) cfg.input.scroll_step = static_cast<float>(*v);
            if (auto v = input["auto_rotate"].value<bool>()) cfg.input.auto_rotate = *v;
            if (auto v = input["auto_rotate_speed"].value<double>()) cfg.input.auto_rotate_speed = static_cast<float>(*v);
        }

        if (auto render = tbl["render"]) {
            if (auto v = render["glyph_mode"].value<std::string>()) {
                auto mode = parse_glyph_mode(*v);
                if (!mode) {
                    set_error(error, "unknown render.glyph_mode '" + *v + "'");
                    return std::nullopt;
                }
                cfg.render.glyph_mode = *mode;
            }
            if (auto v = render["char_aspect"].value<double>()) cfg.render.char_aspect = static_cast<float>(*v);
            if (auto v = render["color_source"].value<std::string>()) {
                auto source = parse_color_source(*v);
                if (!source) {
                    set_error(error, "unknown render.color_source '" + *v + "'");
                    return std::nullopt;
                }
                cfg.render.color_source = *source;
            }
            if (auto v = render["depth_blend"].value<double>()) cfg.render.depth_blend = static_cast<float>(*v);
            if (auto v = render["cell_color"].value<std::string>()) {
                auto rule = parse_cell_color_rule(*v);
                if (!rule) {
                    set_error(error, "unknown render.cell_color '" + *v + "'");
                    return std::nullopt;
                }
                cfg.render.cell_color = *rule;
            }
            if (auto v = render["band_rows"].value<int>()) cfg.render.band_rows = *v;
            if (auto v = render["show_status"].value<bool>()) cfg.render.show_status = *v;
        }

        if (auto color = tbl["color"]) {
            if (auto v = color["scheme"].value<std::string>()) {
                auto scheme = parse_gradient(*v);
                if (!scheme) {
                    set_error(error, "unknown color.scheme '" + *v + "'");
                    return std::nullopt;
                }
                cfg.color.scheme = *scheme;
            }
            if (auto v = color["mode"].value<std::string>()) {
                if (lowercase(*v) != "auto") {
                    auto mode = parse_color_mode(*v);
                    if (!mode) {
                        set_error(error, "unknown color.mode '" + *v + "'");
                        return std::nullopt;
                    }
                    cfg.color.mode = *mode;
                }
            }
        }

        if (auto loader = tbl["loader"]) {
            if (auto v = loader["primitive_mode"].value<std::string>()) {
                auto mode = parse_mesh_mode(*v);
                if (!mode) {
                    set_error(error, "unknown loader.primitive_mode '" + *v + "'");
                    return std::nullopt;
                }
                cfg.loader.primitive_mode = *mode;
            }
            if (auto v = loader["min_edge_length"].value<double>()) cfg.loader.min_edge_length = static_cast<float>(*v);
            if (auto v = loader["max_edges"].value<int>()) cfg.loader.max_edges = *v;
            if (auto v = loader["pymol_path"].value<std::string>()) cfg.loader.pymol_path = *v;
            if (auto v = loader["cartoon_sampling"].value<int>()) cfg.loader.cartoon_sampling = *v;
            if (auto v = loader["cache_dir"].value<std::string>()) cfg.loader.cache_dir = *v;
        }

        if (auto debug = tbl["debug"]) {
            if (auto v = debug["profile_live"].value<bool>()) cfg.debug.profile_live = *v;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        set_error(error, std::string(e.description()));
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config d = Config::defaults();

    if (override.view.fov != d.view.fov) result.view.fov = override.view.fov;
    if (override.view.near_clip != d.view.near_clip) result.view.near_clip = override.view.near_clip;
    if (override.view.distance_multiplier != d.view.distance_multiplier)
        result.view.distance_multiplier = override.view.distance_multiplier;
    if (override.view.min_distance_multiplier != d.view.min_distance_multiplier)
        result.view.min_distance_multiplier = override.view.min_distance_multiplier;
    if (override.view.max_distance_multiplier != d.view.max_distance_multiplier)
        result.view.max_distance_multiplier = override.view.max_distance_multiplier;
    if (override.view.initial_yaw != d.view.initial_yaw) result.view.initial_yaw = override.view.initial_yaw;
    if (override.view.initial_pitch != d.view.initial_pitch) result.view.initial_pitch = override.view.initial_pitch;
    if (override.view.pitch_limit != d.view.pitch_limit) result.view.pitch_limit = override.view.pitch_limit;

    if (override.input.drag_speed != d.input.drag_speed) result.input.drag_speed = override.input.drag_speed;
    if (override.input.pan_speed != d.input.pan_speed) result.input.pan_speed = override.input.pan_speed;
    if (override.input.scroll_step != d.input.scroll_step) result.input.scroll_step = override.input.scroll_step;
    result.input.auto_rotate = override.input.auto_rotate;
    if (override.input.auto_rotate_speed != d.input.auto_rotate_speed)
        result.input.auto_rotate_speed = override.input.auto_rotate_speed;

    if (override.render.glyph_mode != d.render.glyph_mode) result.render.glyph_mode = override.render.glyph_mode;
    if (override.render.char_aspect != d.render.char_aspect) result.render.char_aspect = override.render.char_aspect;
    if (override.render.color_source != d.render.color_source)
        result.render.color_source = override.render.color_source;
    if (override.render.depth_blend != d.render.depth_blend) result.render.depth_blend = override.render.depth_blend;
    if (override.render.cell_color != d.render.cell_color) result.render.cell_color = override.render.cell_color;
    if (override.render.band_rows != d.render.band_rows) result.render.band_rows = override.render.band_rows;
    result.render.show_status = override.render.show_status;

    if (override.color.scheme != d.color.scheme) result.color.scheme = override.color.scheme;
    if (override.color.mode) result.color.mode = override.color.mode;

    if (override.loader.primitive_mode != d.loader.primitive_mode)
        result.loader.primitive_mode = override.loader.primitive_mode;
    if (override.loader.min_edge_length != d.loader.min_edge_length)
        result.loader.min_edge_length = override.loader.min_edge_length;
    if (override.loader.max_edges != d.loader.max_edges) result.loader.max_edges = override.loader.max_edges;
    if (!override.loader.pymol_path.empty() && override.loader.pymol_path != d.loader.pymol_path)
        result.loader.pymol_path = override.loader.pymol_path;
    if (override.loader.cartoon_sampling != d.loader.cartoon_sampling)
        result.loader.cartoon_sampling = override.loader.cartoon_sampling;
    if (!override.loader.cache_dir.empty()) result.loader.cache_dir = override.loader.cache_dir;

    result.debug = override.debug;
    if (!override.config_path.empty()) result.config_path = override.config_path;
    if (override.fps != d.fps) result.fps = override.fps;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.scheme) config.color.scheme = *args.scheme;
    if (args.glyph_mode) config.render.glyph_mode = *args.glyph_mode;
    if (args.mesh_mode) config.loader.primitive_mode = *args.mesh_mode;
    if (args.color_mode) config.color.mode = *args.color_mode;
    if (args.fps > 0) config.fps = args.fps;
    if (args.no_auto_rotate) config.input.auto_rotate = false;
    if (args.profile_live) config.debug.profile_live = true;
    return config;
}

}
