#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>
#include <vector>
#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/core/session.hpp"
#include "../src/render/projector.hpp"
#include "../src/render/rasterizer.hpp"
#include "../src/render/terminal_renderer.hpp"
#include "../src/scene/camera.hpp"
#include "../src/scene/model.hpp"
#include "../src/terminal/terminal.hpp"

using namespace pepterm;

static Camera camera_at(float distance) {
    CameraPose pose;
    pose.distance = distance;
    CameraLimits limits;
    limits.min_distance = 0.5f;
    limits.max_distance = 50.0f;
    return Camera(Vec3(0, 0, 0), pose, limits);
}

static Projector viewport(int cols, int rows) {
    Projector projector;
    Viewport vp;
    vp.cols = cols;
    vp.rows = rows;
    projector.set_viewport(vp);
    return projector;
}

static int covered_count(const SubcellBuffer& buf) {
    int n = 0;
    for (int y = 0; y < buf.height(); ++y) {
        for (int x = 0; x < buf.width(); ++x) {
            if (buf.at(x, y).covered()) n++;
        }
    }
    return n;
}

void test_empty_model() {
    std::cout << "Testing empty model rendering...\n";

    Model empty;
    assert(empty.empty());
    assert(empty.scale() == 1.0f);
    assert(empty.validate().success());

    RenderSession session(empty, Config::defaults(), "empty");
    session.resize(20, 6);
    const Pipeline::Frame& frame = session.render_frame();
    assert(frame.cols == 20 && frame.rows == 5);
    assert(frame.occupied_cells == 0);
    for (const GlyphCell& cell : frame.cells) {
        assert(cell.codepoint == ' ');
    }

    std::cout << "✓ Empty model test passed\n";
}

void test_off_screen_primitives() {
    std::cout << "Testing off-screen primitives...\n";

    Model model({{Vec3(100, 0, 0), 0.0f}, {Vec3(100, 5, 0), 1.0f}, {Vec3(0, 0, -50), 0.5f}},
                {Primitive::point(0), Primitive::line(0, 1), Primitive::point(2)});
    Camera cam = camera_at(5.0f);
    Projector projector = viewport(20, 6);

    std::vector<ProjectedVertex> projected;
    projector.project_model(cam, model, projected);
    SubcellBuffer target(projector.viewport().width(), projector.viewport().height());
    Rasterizer rasterizer;
    rasterizer.rasterize(model, projected, projector, target);

    assert(covered_count(target) == 0);
    assert(rasterizer.stats().culled == 3);

    std::cout << "✓ Off-screen test passed\n";
}

void test_near_plane_clipping() {
    std::cout << "Testing near-plane clipping...\n";

    // Both primitives cross the camera plane.
    Model model({{Vec3(-1, 0, -20), 0.0f}, {Vec3(1, 0, -20), 0.0f}, {Vec3(0, 0.5f, 2), 1.0f},
                 {Vec3(0.2f, -0.2f, -30), 0.0f}, {Vec3(0.2f, -0.2f, 3), 1.0f}},
                {Primitive::triangle(0, 1, 2), Primitive::line(3, 4)});
    Camera cam = camera_at(5.0f);
    Projector projector = viewport(30, 8);

    std::vector<ProjectedVertex> projected;
    projector.project_model(cam, model, projected);
    assert(!projected[0].visible && !projected[3].visible);
    assert(projected[2].visible && projected[4].visible);

    SubcellBuffer target(projector.viewport().width(), projector.viewport().height());
    Rasterizer rasterizer;
    rasterizer.rasterize(model, projected, projector, target);

    assert(rasterizer.stats().lines == 1);
    assert(covered_count(target) > 0);
    for (int y = 0; y < target.height(); ++y) {
        for (int x = 0; x < target.width(); ++x) {
            const Subcell& s = target.at(x, y);
            if (s.covered()) {
                assert(s.depth >= projector.near_clip() - 1e-4f);
                assert(std::isfinite(s.attribute));
            }
        }
    }

    std::cout << "✓ Near-plane clipping test passed\n";
}

void test_huge_projected_coordinates() {
    std::cout << "Testing primitives projecting far outside the grid...\n";

    Model model({{Vec3(-1, -1, 0), 0.0f}, {Vec3(-1, 1, 0), 0.5f}, {Vec3(1e12f, 0, 0), 1.0f},
                 {Vec3(-1e12f, -1e12f, 0), 0.0f}},
                {Primitive::triangle(0, 1, 2), Primitive::line(3, 2), Primitive::point(3)});
    Camera cam = camera_at(5.0f);
    Projector projector = viewport(20, 6);

    std::vector<ProjectedVertex> projected;
    projector.project_model(cam, model, projected);
    assert(projected[2].sx > 1e10f);

    SubcellBuffer target(projector.viewport().width(), projector.viewport().height());
    Rasterizer rasterizer;
    rasterizer.rasterize(model, projected, projector, target);

    assert(covered_count(target) > 0);
    for (int y = 0; y < target.height(); ++y) {
        for (int x = 0; x < target.width(); ++x) {
            const Subcell& s = target.at(x, y);
            if (s.covered()) assert(std::isfinite(s.depth));
        }
    }

    std::cout << "✓ Huge coordinate test passed\n";
}

void test_tiny_model() {
    std::cout << "Testing a model smaller than the default near plane...\n";

    Model tiny({{Vec3(-0.02f, -0.02f, 0), 0.0f}, {Vec3(0.02f, -0.02f, 0), 0.5f},
                {Vec3(0, 0.02f, 0), 1.0f}},
               {Primitive::triangle(0, 1, 2)});
    assert(tiny.scale() < 0.1f);

    RenderSession session(tiny, Config::defaults(), "tiny");
    assert(session.camera().pose().distance < Config::defaults().view.near_clip);
    session.resize(20, 6);
    const Pipeline::Frame& frame = session.render_frame();
    assert(frame.occupied_cells > 0);
    assert(session.pipeline().projector().near_clip() < session.camera().pose().distance);

    // Ordinary models keep the configured near plane.
    Model big({{Vec3(-5, -5, 0), 0.0f}, {Vec3(5, -5, 0), 0.5f}, {Vec3(0, 5, 0), 1.0f}},
              {Primitive::triangle(0, 1, 2)});
    RenderSession big_session(big, Config::defaults(), "big");
    assert(big_session.pipeline().projector().near_clip() == Config::defaults().view.near_clip);

    std::cout << "✓ Tiny model test passed\n";
}

void test_resize() {
    std::cout << "Testing grid resize...\n";

    Model model({{Vec3(0, 0, 0), 0.0f}, {Vec3(1, 1, 1), 1.0f}}, {Primitive::line(0, 1)});
    RenderSession session(model, Config::defaults(), "line");

    session.resize(0, 0);
    const Pipeline::Frame& none = session.render_frame();
    assert(none.cells.empty());
    assert(none.occupied_cells == 0);

    session.resize(1, 1);
    assert(session.render_frame().cells.empty());

    session.resize(20, 6);
    const Pipeline::Frame& grown = session.render_frame();
    assert(grown.cells.size() == 20u * 5u);
    assert(session.pipeline().subcells().width() == 40);
    assert(session.pipeline().subcells().height() == 20);

    session.resize(7, 3);
    const Pipeline::Frame& shrunk = session.render_frame();
    assert(shrunk.cells.size() == 7u * 2u);

    std::cout << "✓ Resize test passed\n";
}

void test_bounds_checked_access() {
    std::cout << "Testing sub-cell bounds checking...\n";

    SubcellBuffer buf(4, 4);
    assert(!buf.get(3, 3).covered());
    bool threw = false;
    try {
        buf.get(4, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw && "Should throw on out of bounds index");
    assert(!buf.test_and_set(-1, 0, 1.0f, 0.0f));

    Model bad({{Vec3(std::numeric_limits<float>::quiet_NaN(), 0, 0), 0.0f}}, {Primitive::point(0)});
    assert(bad.validate().error == ErrorCode::INVALID_FORMAT);

    std::cout << "✓ Bounds checking test passed\n";
}

void test_write_failure() {
    std::cout << "Testing terminal write failure...\n";

    Terminal term(-1, -1);
    assert(!term.get_info().is_tty);
    Result r = term.write("x");
    assert(r.failure() && r.error == ErrorCode::DEVICE_ERROR);

    TerminalRenderer renderer(term, ColorMode::Ansi256);
    renderer.set_grid_size(2, 1);
    std::vector<GlyphCell> cells(2);
    cells[0].codepoint = 0x2847;

    r = renderer.render(cells, "status");
    assert(r.failure());
    // Nothing reached the screen, so everything is still pending.
    assert(renderer.diff(cells).size() == 2);

    assert(term.enter_interactive(false).failure());
    assert(!term.interactive());

    std::cout << "✓ Write failure test passed\n";
}

int main() {
    std::cout << "Running critical fixes validation tests...\n\n";

    try {
        test_empty_model();
        test_off_screen_primitives();
        test_near_plane_clipping();
        test_huge_projected_coordinates();
        test_tiny_model();
        test_resize();
        test_bounds_checked_access();
        test_write_failure();

        std::cout << "\n✓ All critical fixes tests passed!\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "✗ Test failed with exception: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "✗ Test failed with unknown exception\n";
        return 1;
    }
}
