#pragma once

#include "terminal/terminal.hpp"
#include "glyph/glyph_packer.hpp"
#include "mapping/gradient.hpp"
#include "scene/obj_loader.hpp"
#include <optional>
#include <string>

namespace pepterm {

enum class Command {
    View,
    CacheInfo,
    CacheClear
};

struct Args {
    Command command = Command::View;
    std::string input;
    std::string chain;
    std::string config_path;
    std::string snapshot_path;

    std::optional<GradientId> scheme;
    std::optional<GlyphMode> glyph_mode;
    std::optional<MeshMode> mesh_mode;
    std::optional<ColorMode> color_mode;

    int fps = 0;
    int snapshot_cols = 0;
    int snapshot_rows = 0;

    bool no_auto_rotate = false;
    bool profile_live = false;
    bool show_help = false;
    bool show_version = false;

    // First rejected argument, reported by the caller.
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);
void print_version();

}
