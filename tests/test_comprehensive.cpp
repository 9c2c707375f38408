#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/cli/args.hpp"
#include "../src/glyph/glyph_packer.hpp"
#include "../src/mapping/colorizer.hpp"
#include "../src/mapping/gradient.hpp"
#include "../src/render/projector.hpp"
#include "../src/render/rasterizer.hpp"
#include "../src/scene/camera.hpp"
#include "../src/scene/cartoon_source.hpp"
#include "../src/scene/model.hpp"
#include "../src/terminal/input.hpp"
#include "../src/terminal/terminal.hpp"

using namespace pepterm;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static bool near(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) < eps;
}

static Camera front_camera(float distance = 5.0f) {
    CameraPose pose;
    pose.distance = distance;
    CameraLimits limits;
    limits.min_distance = 1.0f;
    limits.max_distance = 10.0f;
    limits.pitch_limit = 1.5f;
    return Camera(Vec3(0, 0, 0), pose, limits);
}

static Projector make_projector(int cols, int rows) {
    Projector projector;
    Viewport vp;
    vp.cols = cols;
    vp.rows = rows;
    vp.sub_x = 2;
    vp.sub_y = 4;
    projector.set_viewport(vp);
    return projector;
}

static SubcellBuffer draw(const Model& model, const Camera& camera, const Projector& projector,
                          Rasterizer& rasterizer) {
    std::vector<ProjectedVertex> projected;
    projector.project_model(camera, model, projected);
    SubcellBuffer target(projector.viewport().width(), projector.viewport().height());
    rasterizer.rasterize(model, projected, projector, target);
    return target;
}

static Model flat_triangle(float z, float attribute) {
    std::vector<Vertex> v = {
        {Vec3(-1, -1, z), attribute},
        {Vec3(1, -1, z), attribute},
        {Vec3(0, 1, z), attribute},
    };
    return Model(v, {Primitive::triangle(0, 1, 2)});
}

// --- Gradients ---

TEST(gradient_endpoints) {
    assert(gradient_color(GradientId::Coolwarm, 0.0f) == Rgb(59, 76, 192));
    assert(gradient_color(GradientId::Coolwarm, 1.0f) == Rgb(180, 4, 38));
    assert(gradient_color(GradientId::Rainbow, 0.0f) == Rgb(0, 0, 255));
    assert(gradient_color(GradientId::Rainbow, 1.0f) == Rgb(255, 0, 0));
    assert(gradient_color(GradientId::White, 0.3f) == Rgb::white());
}

TEST(gradient_midpoints) {
    struct Expected {
        GradientId id;
        Rgb mid;
    };
    const Expected cases[] = {
        {GradientId::Rainbow, Rgb(0, 255, 0)},
        {GradientId::Blues, Rgb(107, 174, 214)},
        {GradientId::Greens, Rgb(116, 196, 118)},
        {GradientId::Reds, Rgb(251, 106, 74)},
        {GradientId::Oranges, Rgb(253, 141, 60)},
        {GradientId::Purples, Rgb(158, 154, 200)},
        // Ten stops: halfway between the fifth and sixth.
        {GradientId::Viridis, Rgb(34, 144, 139)},
        {GradientId::Plasma, Rgb(203, 70, 121)},
        {GradientId::Magma, Rgb(181, 54, 122)},
        // Eight stops: halfway between the fourth and fifth.
        {GradientId::Inferno, Rgb(185, 57, 82)},
        {GradientId::Coolwarm, Rgb(221, 221, 221)},
        {GradientId::Spectral, Rgb(255, 255, 191)},
    };
    for (const Expected& e : cases) {
        const Rgb mid = gradient_color(e.id, 0.5f);
        assert(mid == e.mid);
        assert(mid != gradient_color(e.id, 0.0f));
        assert(mid != gradient_color(e.id, 1.0f));
    }
    assert(gradient_color(GradientId::White, 0.5f) == Rgb::white());
}

TEST(gradient_clamps_parameter) {
    assert(gradient_color(GradientId::Viridis, -2.0f) == gradient_color(GradientId::Viridis, 0.0f));
    assert(gradient_color(GradientId::Viridis, 7.0f) == gradient_color(GradientId::Viridis, 1.0f));
    assert(gradient_color(GradientId::Magma, std::nanf("")) == gradient_color(GradientId::Magma, 0.0f));
}

TEST(gradient_names_round_trip) {
    for (int i = 0; i < GRADIENT_COUNT; ++i) {
        GradientId id = static_cast<GradientId>(i);
        auto parsed = parse_gradient(gradient_name(id));
        assert(parsed && *parsed == id);
    }
    assert(parse_gradient("COOLWARM") == GradientId::Coolwarm);
    assert(!parse_gradient("sepia"));
}

TEST(gradient_cycle_wraps) {
    assert(next_gradient(GradientId::White) == GradientId::Rainbow);
    GradientId id = GradientId::Coolwarm;
    for (int i = 0; i < GRADIENT_COUNT; ++i) id = next_gradient(id);
    assert(id == GradientId::Coolwarm);
}

// --- Camera ---

TEST(camera_basis_at_rest) {
    Camera cam = front_camera();
    Vec3 t = cam.to_camera_space(Vec3(0, 0, 0));
    assert(near(t.x, 0.0f) && near(t.y, 0.0f) && near(t.z, 5.0f));

    Vec3 r = cam.to_camera_space(Vec3(1, 0, 0));
    assert(near(r.x, 1.0f) && near(r.y, 0.0f));

    Vec3 u = cam.to_camera_space(Vec3(0, 1, 0));
    assert(near(u.y, 1.0f) && near(u.x, 0.0f));
}

TEST(camera_limits) {
    Camera cam = front_camera();
    cam.zoom(100.0f);
    assert(near(cam.pose().distance, 10.0f));
    cam.zoom(-100.0f);
    assert(near(cam.pose().distance, 1.0f));

    cam.orbit(0.0f, 5.0f);
    assert(near(cam.pose().pitch, 1.5f));
    cam.orbit(0.0f, -10.0f);
    assert(near(cam.pose().pitch, -1.5f));

    cam.orbit(20.0f, 0.0f);
    assert(cam.pose().yaw >= -3.1416f && cam.pose().yaw <= 3.1416f);
}

TEST(camera_reset_restores_initial) {
    Camera cam = front_camera();
    cam.orbit(0.7f, 0.3f);
    cam.pan(0.5f, -0.25f);
    cam.zoom(2.0f);
    assert(cam.pose() != cam.initial_pose());
    cam.reset();
    assert(cam.pose() == cam.initial_pose());
}

TEST(camera_pan_offsets_view) {
    Camera cam = front_camera();
    cam.pan(2.0f, -1.0f);
    Vec3 t = cam.to_camera_space(Vec3(0, 0, 0));
    assert(near(t.x, 2.0f) && near(t.y, -1.0f));
}

TEST(camera_wrap_angle_non_finite) {
    assert(Camera::wrap_angle(std::nanf("")) == 0.0f);
    assert(near(Camera::wrap_angle(0.5f), 0.5f));
}

// --- Projector ---

TEST(projector_center_maps_to_middle) {
    Camera cam = front_camera();
    Projector projector = make_projector(40, 10);
    ProjectedVertex pv = projector.project(cam, Vec3(0, 0, 0));
    assert(pv.visible);
    assert(near(pv.sx, 40.0f) && near(pv.sy, 20.0f));
}

TEST(projector_behind_camera_not_visible) {
    Camera cam = front_camera();
    Projector projector = make_projector(40, 10);
    ProjectedVertex pv = projector.project(cam, Vec3(0, 0, -10));
    assert(!pv.visible);
}

TEST(projector_subcell_bounds) {
    Projector projector = make_projector(40, 10);
    int ix = -1, iy = -1;
    assert(!projector.subcell_index(80.0f, 0.0f, ix, iy));
    assert(!projector.subcell_index(-0.01f, 5.0f, ix, iy));
    assert(projector.subcell_index(0.0f, 0.0f, ix, iy) && ix == 0 && iy == 0);
    assert(projector.subcell_index(79.99f, 39.99f, ix, iy) && ix == 79 && iy == 39);
}

TEST(projector_indices_stay_in_viewport) {
    Camera cam = front_camera(3.0f);
    Projector projector = make_projector(30, 8);
    for (int i = -20; i <= 20; ++i) {
        for (int j = -20; j <= 20; ++j) {
            ProjectedVertex pv = projector.project(cam, Vec3(i * 0.25f, j * 0.25f, 0.0f));
            int ix = 0, iy = 0;
            if (pv.visible && projector.subcell_index(pv.sx, pv.sy, ix, iy)) {
                assert(ix >= 0 && ix < 60);
                assert(iy >= 0 && iy < 32);
            }
        }
    }
}

// --- Rasterizer ---

TEST(rasterizer_point) {
    Model model({{Vec3(0, 0, 0), 0.5f}}, {Primitive::point(0)});
    Camera cam = front_camera();
    Projector projector = make_projector(40, 10);
    Rasterizer rasterizer;
    SubcellBuffer out = draw(model, cam, projector, rasterizer);
    assert(out.at(40, 20).covered());
    assert(near(out.at(40, 20).attribute, 0.5f));
    assert(rasterizer.stats().points == 1);
}

TEST(rasterizer_line_is_continuous) {
    Model model({{Vec3(-1, 0, 0), 0.0f}, {Vec3(1, 0, 0), 1.0f}}, {Primitive::line(0, 1)});
    Camera cam = front_camera();
    Projector projector = make_projector(40, 10);
    Rasterizer rasterizer;
    SubcellBuffer out = draw(model, cam, projector, rasterizer);

    int first = -1, last = -1;
    for (int x = 0; x < out.width(); ++x) {
        if (out.at(x, 20).covered()) {
            if (first < 0) first = x;
            last = x;
        }
    }
    assert(first >= 0);
    for (int x = first; x <= last; ++x) {
        assert(out.at(x, 20).covered());
    }
    assert(out.at(first, 20).attribute < out.at(last, 20).attribute);
}

TEST(rasterizer_nearest_wins) {
    Model far_then_near({
        {Vec3(-1, -1, 0), 0.0f}, {Vec3(1, -1, 0), 0.0f}, {Vec3(0, 1, 0), 0.0f},
        {Vec3(-1, -1, -1), 1.0f}, {Vec3(1, -1, -1), 1.0f}, {Vec3(0, 1, -1), 1.0f},
    }, {Primitive::triangle(0, 1, 2), Primitive::triangle(3, 4, 5)});
    Model near_then_far({
        {Vec3(-1, -1, -1), 1.0f}, {Vec3(1, -1, -1), 1.0f}, {Vec3(0, 1, -1), 1.0f},
        {Vec3(-1, -1, 0), 0.0f}, {Vec3(1, -1, 0), 0.0f}, {Vec3(0, 1, 0), 0.0f},
    }, {Primitive::triangle(0, 1, 2), Primitive::triangle(3, 4, 5)});

    Camera cam = front_camera();
    Projector projector = make_projector(40, 10);
    Rasterizer rasterizer;

    SubcellBuffer a = draw(far_then_near, cam, projector, rasterizer);
    SubcellBuffer b = draw(near_then_far, cam, projector, rasterizer);
    assert(a.at(40, 20).covered() && b.at(40, 20).covered());
    assert(near(a.at(40, 20).attribute, 1.0f));
    assert(near(b.at(40, 20).attribute, 1.0f));
}

TEST(rasterizer_equal_depth_keeps_first) {
    Model model({
        {Vec3(-1, -1, 0), 0.2f}, {Vec3(1, -1, 0), 0.2f}, {Vec3(0, 1, 0), 0.2f},
        {Vec3(-1, -1, 0), 0.8f}, {Vec3(1, -1, 0), 0.8f}, {Vec3(0, 1, 0), 0.8f},
    }, {Primitive::triangle(0, 1, 2), Primitive::triangle(3, 4, 5)});
    Camera cam = front_camera();
    Projector projector = make_projector(40, 10);
    Rasterizer rasterizer;
    SubcellBuffer out = draw(model, cam, projector, rasterizer);
    assert(near(out.at(40, 20).attribute, 0.2f));
}

TEST(rasterizer_banding_matches_serial) {
    Model model = flat_triangle(0.0f, 0.4f);
    Camera cam = front_camera(3.0f);
    Projector projector = make_projector(40, 10);

    Rasterizer::Config serial_cfg;
    serial_cfg.parallel = false;
    serial_cfg.band_rows = 1000;
    Rasterizer serial(serial_cfg);

    Rasterizer::Config banded_cfg;
    banded_cfg.parallel = true;
    banded_cfg.band_rows = 3;
    Rasterizer banded(banded_cfg);

    SubcellBuffer a = draw(model, cam, projector, serial);
    SubcellBuffer b = draw(model, cam, projector, banded);
    for (int y = 0; y < a.height(); ++y) {
        for (int x = 0; x < a.width(); ++x) {
            assert(a.at(x, y).covered() == b.at(x, y).covered());
        }
    }
}

TEST(rasterizer_rejects_bad_indices) {
    std::vector<Vertex> v = {{Vec3(0, 0, 0), 0.0f}};
    std::vector<Primitive> p = {Primitive::line(0, 7)};
    Model model(v, p);
    assert(model.validate().failure());

    Camera cam = front_camera();
    Projector projector = make_projector(10, 4);
    Rasterizer rasterizer;
    draw(model, cam, projector, rasterizer);
    assert(rasterizer.stats().culled == 1);
}

// --- Colorizer ---

TEST(colorizer_sequence_and_depth) {
    Subcell cell;
    cell.depth = 6.0f;
    cell.attribute = 0.0f;

    Colorizer seq;
    assert(seq.shade(cell, GradientId::Coolwarm) == Rgb(59, 76, 192));

    Colorizer::Config cfg;
    cfg.source = ColorSource::Depth;
    Colorizer depth(cfg);
    depth.set_depth_range(4.0f, 6.0f);
    assert(near(depth.parameter(cell), 1.0f));
    cell.depth = 4.0f;
    assert(near(depth.parameter(cell), 0.0f));
    cell.depth = 100.0f;
    assert(near(depth.parameter(cell), 1.0f));
}

TEST(colorizer_cell_average_and_nearest) {
    SubcellBuffer buf(2, 4);
    buf.test_and_set(0, 0, 5.0f, 0.0f);
    buf.test_and_set(1, 3, 3.0f, 1.0f);

    std::vector<Rgb> colors;
    Colorizer average;
    average.colorize(buf, 2, 4, GradientId::Coolwarm, colors);
    assert(colors.size() == 1);
    assert(colors[0] == Rgb(119, 40, 115));

    Colorizer::Config cfg;
    cfg.cell_rule = CellColorRule::Nearest;
    Colorizer nearest(cfg);
    nearest.colorize(buf, 2, 4, GradientId::Coolwarm, colors);
    assert(colors[0] == Rgb(180, 4, 38));
}

TEST(colorizer_empty_cell_default) {
    SubcellBuffer buf(4, 4);
    std::vector<Rgb> colors;
    Colorizer colorizer;
    colorizer.colorize(buf, 2, 4, GradientId::Viridis, colors);
    assert(colors.size() == 2);
    assert(colors[0] == Rgb::white() && colors[1] == Rgb::white());
}

// --- Glyph packer ---

TEST(packer_braille_bits) {
    assert(GlyphPacker::braille_glyph(0) == GlyphPacker::BLANK);
    assert(GlyphPacker::braille_glyph(0xFF) == 0x28FF);
    assert(GlyphPacker::braille_bit(0, 0) == 0x01);
    assert(GlyphPacker::braille_bit(3, 1) == 0x80);
    assert(GlyphPacker::braille_bit(4, 0) == 0);

    SubcellBuffer buf(2, 4);
    buf.test_and_set(0, 0, 1.0f, 0.0f);
    buf.test_and_set(1, 3, 1.0f, 0.0f);
    GlyphPacker packer(GlyphMode::Braille);
    assert(packer.pack_cell(buf, 0, 0) == 0x2881);
}

TEST(packer_block_density) {
    GlyphPacker packer(GlyphMode::Block);
    assert(packer.sub_x() == 2 && packer.sub_y() == 2);

    SubcellBuffer buf(2, 2);
    assert(packer.pack_cell(buf, 0, 0) == GlyphPacker::BLANK);
    buf.test_and_set(0, 0, 1.0f, 0.0f);
    assert(packer.pack_cell(buf, 0, 0) == GlyphPacker::BLOCK_LIGHT);
    buf.test_and_set(1, 0, 1.0f, 0.0f);
    assert(packer.pack_cell(buf, 0, 0) == GlyphPacker::BLOCK_MEDIUM);
    buf.test_and_set(0, 1, 1.0f, 0.0f);
    assert(packer.pack_cell(buf, 0, 0) == GlyphPacker::BLOCK_DARK);
    buf.test_and_set(1, 1, 1.0f, 0.0f);
    assert(packer.pack_cell(buf, 0, 0) == GlyphPacker::BLOCK_FULL);
}

TEST(packer_quadrants) {
    GlyphPacker packer(GlyphMode::Quadrant);
    SubcellBuffer buf(4, 2);
    buf.test_and_set(0, 0, 1.0f, 0.0f);
    for (int y = 0; y < 2; ++y) {
        for (int x = 2; x < 4; ++x) buf.test_and_set(x, y, 1.0f, 0.0f);
    }
    std::vector<uint32_t> glyphs;
    packer.pack(buf, glyphs);
    assert(glyphs.size() == 2);
    assert(glyphs[0] == 0x2598);
    assert(glyphs[1] == 0x2588);
}

TEST(packer_mode_names) {
    assert(parse_glyph_mode("dots") == GlyphMode::Braille);
    assert(parse_glyph_mode("BLOCKS") == GlyphMode::Block);
    assert(!parse_glyph_mode("ascii"));
    assert(next_glyph_mode(GlyphMode::Braille) == GlyphMode::Block);
    assert(next_glyph_mode(GlyphMode::Quadrant) == GlyphMode::Braille);
}

// --- Terminal ---

TEST(terminal_color_codes) {
    assert(Terminal::color_code(ColorMode::None, 1, 2, 3, true).empty());
    assert(Terminal::color_code(ColorMode::Truecolor, 1, 2, 3, true) == "\033[38;2;1;2;3m");
    assert(Terminal::color_code(ColorMode::Ansi256, 255, 0, 0, true) == "\033[38;5;196m");
    assert(Terminal::color_code(ColorMode::Ansi16, 255, 0, 0, true) == "\033[91m");
}

TEST(terminal_rgb_to_256) {
    assert(Terminal::rgb_to_256(0, 0, 0) == 16);
    assert(Terminal::rgb_to_256(255, 255, 255) == 231);
    assert(Terminal::rgb_to_256(255, 0, 0) == 196);
}

TEST(terminal_rgb_to_16) {
    assert(Terminal::rgb_to_16(0, 0, 0) == 0);
    assert(Terminal::rgb_to_16(255, 0, 0) == 9);
    assert(Terminal::rgb_to_16(255, 255, 255) == 15);
}

// --- Input parser ---

TEST(input_keys) {
    InputParser parser;
    parser.feed("q\x03");
    auto e = parser.next();
    assert(e && e->type == EventType::Key && e->key == Key::Char && e->ch == 'q');
    e = parser.next();
    assert(e && e->type == EventType::Quit);
    assert(!parser.next());
}

TEST(input_arrows) {
    InputParser parser;
    parser.feed("\033[A\033OD");
    auto e = parser.next();
    assert(e && e->key == Key::Up);
    e = parser.next();
    assert(e && e->key == Key::Left);
}

TEST(input_sgr_mouse) {
    InputParser parser;
    parser.feed("\033[<0;10;5M\033[<36;12;6M\033[<0;12;6m\033[<64;1;1M\033[<65;1;1M");

    auto e = parser.next();
    assert(e && e->type == EventType::MousePress);
    assert(e->col == 9 && e->row == 4 && !e->shift);

    e = parser.next();
    assert(e && e->type == EventType::MouseDrag && e->shift);
    assert(e->col == 11 && e->row == 5);

    e = parser.next();
    assert(e && e->type == EventType::MouseRelease);

    e = parser.next();
    assert(e && e->type == EventType::Scroll && e->scroll == -1);
    e = parser.next();
    assert(e && e->type == EventType::Scroll && e->scroll == 1);
}

TEST(input_partial_sequence) {
    InputParser parser;
    parser.feed("\033[<0;1");
    assert(!parser.next());
    assert(parser.pending() > 0);
    parser.feed("0;5M");
    auto e = parser.next();
    assert(e && e->type == EventType::MousePress && e->col == 9);
    assert(parser.pending() == 0);
}

TEST(input_lone_escape_and_unknown_csi) {
    InputParser parser;
    parser.feed("\033");
    assert(!parser.next());
    auto e = parser.flush_pending();
    assert(e && e->key == Key::Escape);

    parser.feed("\033[2~x");
    e = parser.next();
    assert(e && e->key == Key::Char && e->ch == 'x');
}

// --- Config and CLI ---

static Args parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(&w[0]);
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

TEST(config_defaults_valid) {
    Config cfg = Config::defaults();
    std::string error;
    assert(cfg.validate(error));
    assert(cfg.color.scheme == GradientId::Coolwarm);
    assert(cfg.fps == 30);
    assert(!cfg.color.mode);
}

TEST(config_validate_ranges) {
    Config cfg = Config::defaults();
    std::string error;
    cfg.view.fov = 5.0f;
    assert(!cfg.validate(error));
    assert(error.find("fov") != std::string::npos);

    cfg = Config::defaults();
    cfg.view.min_distance_multiplier = 20.0f;
    assert(!cfg.validate(error));
}

TEST(config_merge_and_overrides) {
    Config over = Config::defaults();
    over.view.fov = 1.0f;
    Config merged = merge_config(Config::defaults(), over);
    assert(near(merged.view.fov, 1.0f));
    assert(near(merged.view.near_clip, 0.1f));

    Args args = parse({"pepterm", "1crn", "-c", "viridis", "-f", "60", "--no-rotate", "--color-mode", "256"});
    Config cfg = apply_cli_overrides(Config::defaults(), args);
    assert(cfg.color.scheme == GradientId::Viridis);
    assert(cfg.fps == 60);
    assert(!cfg.input.auto_rotate);
    assert(cfg.color.mode && *cfg.color.mode == ColorMode::Ansi256);
}

TEST(args_parsing) {
    Args args = parse({"pepterm", "1ABC", "-n", "A", "--glyph", "block", "--mode", "surface"});
    assert(args.error.empty());
    assert(args.command == Command::View);
    assert(args.input == "1ABC" && args.chain == "A");
    assert(args.glyph_mode && *args.glyph_mode == GlyphMode::Block);
    assert(args.mesh_mode && *args.mesh_mode == MeshMode::Surface);

    args = parse({"pepterm", "cache", "clear"});
    assert(args.command == Command::CacheClear);

    args = parse({"pepterm", "--bogus"});
    assert(!args.error.empty());

    args = parse({"pepterm", "x.obj", "--size", "wide"});
    assert(!args.error.empty());

    args = parse({"pepterm", "x.obj", "--snapshot", "../out.png"});
    assert(!args.error.empty());

    // Value-taking flags at the end of the command line.
    for (const char* flag : {"--color-mode", "--fps", "-f", "--snapshot", "--size"}) {
        args = parse({"pepterm", "x.obj", flag});
        assert(!args.error.empty());
        assert(args.error.find(flag[1] == '-' ? flag : "--fps") != std::string::npos);
    }
}

TEST(input_classification) {
    assert(classify_input("1ABC") == InputKind::PdbId);
    assert(classify_input("model.OBJ") == InputKind::ObjFile);
    assert(classify_input("protein.pdb") == InputKind::StructureFile);
    assert(classify_input("data/thing") == InputKind::StructureFile);

    StructureCache cache("/tmp/pepterm-cache");
    assert(cache.remote_obj_path("1abc", "a") == "/tmp/pepterm-cache/1ABC_A.obj");
    assert(cache.local_obj_path("/data/prot.cif", "") == "/tmp/pepterm-cache/local_prot.obj");
    assert(selection_commands("b").find("chain B") != std::string::npos);
}

int main() {
    std::cout << "=== pepterm unit tests ===\n\n";

    std::cout << "--- Gradient Tests ---\n";
    RUN_TEST(gradient_endpoints);
    RUN_TEST(gradient_midpoints);
    RUN_TEST(gradient_clamps_parameter);
    RUN_TEST(gradient_names_round_trip);
    RUN_TEST(gradient_cycle_wraps);

    std::cout << "\n--- Camera Tests ---\n";
    RUN_TEST(camera_basis_at_rest);
    RUN_TEST(camera_limits);
    RUN_TEST(camera_reset_restores_initial);
    RUN_TEST(camera_pan_offsets_view);
    RUN_TEST(camera_wrap_angle_non_finite);

    std::cout << "\n--- Projector Tests ---\n";
    RUN_TEST(projector_center_maps_to_middle);
    RUN_TEST(projector_behind_camera_not_visible);
    RUN_TEST(projector_subcell_bounds);
    RUN_TEST(projector_indices_stay_in_viewport);

    std::cout << "\n--- Rasterizer Tests ---\n";
    RUN_TEST(rasterizer_point);
    RUN_TEST(rasterizer_line_is_continuous);
    RUN_TEST(rasterizer_nearest_wins);
    RUN_TEST(rasterizer_equal_depth_keeps_first);
    RUN_TEST(rasterizer_banding_matches_serial);
    RUN_TEST(rasterizer_rejects_bad_indices);

    std::cout << "\n--- Colorizer Tests ---\n";
    RUN_TEST(colorizer_sequence_and_depth);
    RUN_TEST(colorizer_cell_average_and_nearest);
    RUN_TEST(colorizer_empty_cell_default);

    std::cout << "\n--- Glyph Packer Tests ---\n";
    RUN_TEST(packer_braille_bits);
    RUN_TEST(packer_block_density);
    RUN_TEST(packer_quadrants);
    RUN_TEST(packer_mode_names);

    std::cout << "\n--- Terminal Tests ---\n";
    RUN_TEST(terminal_color_codes);
    RUN_TEST(terminal_rgb_to_256);
    RUN_TEST(terminal_rgb_to_16);

    std::cout << "\n--- Input Tests ---\n";
    RUN_TEST(input_keys);
    RUN_TEST(input_arrows);
    RUN_TEST(input_sgr_mouse);
    RUN_TEST(input_partial_sequence);
    RUN_TEST(input_lone_escape_and_unknown_csi);

    std::cout << "\n--- Config Tests ---\n";
    RUN_TEST(config_defaults_valid);
    RUN_TEST(config_validate_ranges);
    RUN_TEST(config_merge_and_overrides);
    RUN_TEST(args_parsing);
    RUN_TEST(input_classification);

    std::cout << "=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
