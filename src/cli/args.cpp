#include "args.hpp"
#include "core/config.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <algorithm>

#ifndef PEPTERM_VERSION
#define PEPTERM_VERSION "0.1.0"
#endif

namespace pepterm {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find("..") != std::string::npos) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

static void reject(Args& args, const std::string& message) {
    if (args.error.empty()) args.error = message;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    int first = 1;
    if (argc > 1 && strcmp(argv[1], "cache") == 0) {
        args.command = Command::CacheInfo;
        first = 2;
        if (argc > 2 && strcmp(argv[2], "clear") == 0) {
            args.command = Command::CacheClear;
            first = 3;
        }
    }

    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            args.show_version = true;
            return args;
        }

        if (strcmp(arg, "-n") == 0 || strcmp(arg, "--chain") == 0) {
            if (i + 1 < argc) {
                args.chain = argv[++i];
            } else {
                reject(args, "--chain requires a chain identifier");
            }
        }
        else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--color") == 0) {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                args.scheme = parse_gradient(name);
                if (!args.scheme) reject(args, "Unknown color scheme '" + name + "'");
            } else {
                reject(args, "--color requires a scheme name");
            }
        }
        else if (strcmp(arg, "--glyph") == 0) {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                args.glyph_mode = parse_glyph_mode(name);
                if (!args.glyph_mode) reject(args, "Unknown glyph mode '" + name + "'");
            } else {
                reject(args, "--glyph requires braille, block or quadrant");
            }
        }
        else if (strcmp(arg, "--mode") == 0) {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                args.mesh_mode = parse_mesh_mode(name);
                if (!args.mesh_mode) reject(args, "Unknown primitive mode '" + name + "'");
            } else {
                reject(args, "--mode requires wireframe, surface or points");
            }
        }
        else if (strcmp(arg, "--color-mode") == 0) {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                args.color_mode = parse_color_mode(name);
                if (!args.color_mode) reject(args, "Unknown color mode '" + name + "'");
            } else {
                reject(args, "--color-mode requires none, ansi16, ansi256 or truecolor");
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
            } else {
                reject(args, "--config requires a file");
            }
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fps") == 0) {
            if (i + 1 < argc) {
                args.fps = clamp_int(std::atoi(argv[++i]), 1, 120, 30);
            } else {
                reject(args, "--fps requires a frame rate");
            }
        }
        else if (strcmp(arg, "--snapshot") == 0) {
            if (i + 1 < argc) {
                args.snapshot_path = argv[++i];
                if (!validate_path(args.snapshot_path)) {
                    reject(args, "Invalid snapshot path '" + args.snapshot_path + "'");
                    args.snapshot_path.clear();
                }
            } else {
                reject(args, "--snapshot requires an output file");
            }
        }
        else if (strcmp(arg, "--size") == 0) {
            if (i + 1 < argc) {
                int cols = 0;
                int rows = 0;
                if (std::sscanf(argv[++i], "%dx%d", &cols, &rows) == 2) {
                    args.snapshot_cols = clamp_int(cols, 1, 1000, 0);
                    args.snapshot_rows = clamp_int(rows, 1, 500, 0);
                }
                if (args.snapshot_cols == 0 || args.snapshot_rows == 0) {
                    reject(args, "--size expects COLSxROWS");
                }
            } else {
                reject(args, "--size expects COLSxROWS");
            }
        }
        else if (strcmp(arg, "--no-rotate") == 0) {
            args.no_auto_rotate = true;
        }
        else if (strcmp(arg, "--profile-live") == 0) {
            args.profile_live = true;
        }
        else if (arg[0] != '-' && args.input.empty()) {
            args.input = arg;
        }
        else {
            reject(args, std::string("Unexpected argument '") + arg + "'");
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("pepterm: View protein structures in your terminal\n\n");
    printf("Usage:\n");
    printf("  %s [OPTIONS] <PDB_ID>          Fetch and view a structure from the PDB\n", prog);
    printf("  %s [OPTIONS] <file.pdb|.cif>   View a local structure file\n", prog);
    printf("  %s [OPTIONS] <file.obj>        View an OBJ mesh\n", prog);
    printf("  %s cache                       Show cache info\n", prog);
    printf("  %s cache clear                 Clear cached files\n\n", prog);
    printf("OPTIONS:\n");
    printf("  -n, --chain <CHAIN>     Show only the specified chain (e.g. A, B)\n");
    printf("  -c, --color <SCHEME>    Color scheme (default: coolwarm)\n");
    printf("      --glyph <MODE>      Glyphs: braille, block, quadrant\n");
    printf("      --mode <MODE>       Primitives: wireframe, surface, points\n");
    printf("      --color-mode <M>    Terminal colors: none, 16, 256, truecolor\n");
    printf("      --config <FILE>     Config file path (default: ~/.config/pepterm/config.toml)\n");
    printf("  -f, --fps <N>           Target FPS (default: 30, range: 1-120)\n");
    printf("      --snapshot <FILE>   Render one frame to .png or .txt and exit\n");
    printf("      --size <COLSxROWS>  Snapshot grid size (default: terminal size)\n");
    printf("      --no-rotate         Start with auto-rotation off\n");
    printf("      --profile-live      Output per-frame profiling as JSONL to stderr\n");
    printf("  -v, --version           Show version\n");
    printf("  -h, --help              Show this help\n");
    printf("\nCOLOR SCHEMES:\n");
    printf("  coolwarm     Blue to red diverging (default)\n");
    printf("  rainbow      N-to-C terminal rainbow\n");
    printf("  blues        Sequential blue gradient\n");
    printf("  greens       Sequential green gradient\n");
    printf("  reds         Sequential red gradient\n");
    printf("  oranges      Sequential orange gradient\n");
    printf("  purples      Sequential purple gradient\n");
    printf("  viridis      Perceptually uniform (blue-green-yellow)\n");
    printf("  plasma       Purple to yellow\n");
    printf("  magma        Black to white via purple\n");
    printf("  inferno      Black to yellow via red\n");
    printf("  spectral     Spectral rainbow\n");
    printf("  white        White monochrome\n");
    printf("\nINTERACTIVE CONTROLS:\n");
    printf("  Mouse drag              Rotate around the model (disables auto-rotate)\n");
    printf("  Shift + drag            Pan the view\n");
    printf("  Scroll up/down          Zoom in/out\n");
    printf("  Arrow keys              Rotate\n");
    printf("  w/a/s/d                 Pan\n");
    printf("  +/-                     Zoom\n");
    printf("  r                       Toggle auto-rotation\n");
    printf("  c                       Cycle color schemes\n");
    printf("  m                       Cycle glyph mode\n");
    printf("  0                       Reset view\n");
    printf("  q/Esc/Ctrl+C            Quit\n");
    printf("\nRequires PyMOL for cartoon generation from PDB IDs and structure files.\n");
}

void print_version() {
    printf("pepterm %s\n", PEPTERM_VERSION);
}

}
