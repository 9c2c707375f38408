#include "rasterizer.hpp"
#include <utility>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace pepterm {

namespace {

inline float edge(float ax, float ay, float bx, float by, float px, float py) {
    return (px - ax) * (by - ay) - (py - ay) * (bx - ax);
}

// Saturates far outside any grid; callers clip the result to the viewport.
inline int floor_to_int(float v) {
    constexpr float LIMIT = 1.0e9f;
    if (!(v > -LIMIT)) return -static_cast<int>(LIMIT);
    if (v > LIMIT) return static_cast<int>(LIMIT);
    return static_cast<int>(std::floor(v));
}

}

Rasterizer::Rasterizer(const Config& config) : config_(config) {}

Rasterizer::ScreenVertex Rasterizer::to_screen(const ClipVertex& cv, const Projector& projector) {
    ScreenVertex sv;
    projector.to_screen(cv.camera, sv.x, sv.y);
    sv.depth = cv.camera.z;
    sv.attribute = cv.attribute;
    return sv;
}

void Rasterizer::rasterize(const Model& model, const std::vector<ProjectedVertex>& projected,
                           const Projector& projector, SubcellBuffer& target) {
    stats_ = Stats{};
    screen_prims_.clear();

    if (target.empty() || model.empty()) return;

    const auto& vertices = model.vertices();
    const uint32_t n = static_cast<uint32_t>(std::min(vertices.size(), projected.size()));

    for (const Primitive& prim : model.primitives()) {
        stats_.submitted++;
        bool valid = true;
        for (int k = 0; k < prim.vertex_count(); ++k) {
            if (prim.indices[k] >= n) valid = false;
        }
        if (!valid) {
            stats_.culled++;
            continue;
        }

        const size_t before = screen_prims_.size();
        switch (prim.kind) {
            case PrimitiveKind::Point: {
                const uint32_t i = prim.indices[0];
                setup_point(projected[i], vertices[i].attribute, projector);
                break;
            }
            case PrimitiveKind::Line: {
                const uint32_t i = prim.indices[0];
                const uint32_t j = prim.indices[1];
                setup_line({projected[i].camera, vertices[i].attribute},
                           {projected[j].camera, vertices[j].attribute}, projector);
                break;
            }
            case PrimitiveKind::Triangle: {
                const uint32_t i = prim.indices[0];
                const uint32_t j = prim.indices[1];
                const uint32_t k = prim.indices[2];
                setup_triangle({projected[i].camera, vertices[i].attribute},
                               {projected[j].camera, vertices[j].attribute},
                               {projected[k].camera, vertices[k].attribute}, projector);
                break;
            }
        }
        if (screen_prims_.size() == before) {
            stats_.culled++;
        }
    }

    if (screen_prims_.empty()) return;

    const int height = target.height();
    const int band_rows = std::max(1, config_.band_rows);
    const int bands = (height + band_rows - 1) / band_rows;
    const int prim_count = static_cast<int>(screen_prims_.size());

    // Each band owns a disjoint row range and visits primitives in
    // submission order, so the result matches a serial pass.
#ifdef HAS_OPENMP
    #pragma omp parallel for schedule(dynamic) if(config_.parallel && bands > 1)
#endif
    for (int band = 0; band < bands; ++band) {
        const int y0 = band * band_rows;
        const int y1 = std::min(height, y0 + band_rows);
        for (int p = 0; p < prim_count; ++p) {
            const ScreenPrimitive& prim = screen_prims_[p];
            if (prim.max_row < y0 || prim.min_row >= y1) continue;
            draw_band(prim, y0, y1, target);
        }
    }
}

void Rasterizer::setup_point(const ProjectedVertex& pv, float attribute, const Projector& projector) {
    if (!pv.visible || !projector.in_bounds(pv.sx, pv.sy)) return;

    ScreenPrimitive sp;
    sp.kind = PrimitiveKind::Point;
    sp.v[0] = {pv.sx, pv.sy, pv.camera.z, attribute};
    sp.min_row = sp.max_row = floor_to_int(pv.sy);
    screen_prims_.push_back(sp);
    stats_.points++;
}

void Rasterizer::setup_line(ClipVertex a, ClipVertex b, const Projector& projector) {
    const float near_z = projector.near_clip();
    const bool a_behind = a.camera.z < near_z;
    const bool b_behind = b.camera.z < near_z;
    if (a_behind && b_behind) return;

    if (a_behind || b_behind) {
        const float t = (near_z - a.camera.z) / (b.camera.z - a.camera.z);
        ClipVertex c;
        c.camera = Vec3::lerp(a.camera, b.camera, t);
        c.camera.z = near_z;
        c.attribute = a.attribute + (b.attribute - a.attribute) * t;
        if (a_behind) a = c; else b = c;
    }

    ScreenVertex sa = to_screen(a, projector);
    ScreenVertex sb = to_screen(b, projector);

    const Viewport& vp = projector.viewport();
    if (!clip_segment_to_rect(sa, sb, static_cast<float>(vp.width()), static_cast<float>(vp.height()))) {
        return;
    }

    ScreenPrimitive sp;
    sp.kind = PrimitiveKind::Line;
    sp.v[0] = sa;
    sp.v[1] = sb;
    sp.min_row = floor_to_int(std::min(sa.y, sb.y));
    sp.max_row = floor_to_int(std::max(sa.y, sb.y));
    screen_prims_.push_back(sp);
    stats_.lines++;
}

// Liang-Barsky against [0,w]x[0,h]; depth and attribute follow the parameter.
bool Rasterizer::clip_segment_to_rect(ScreenVertex& a, ScreenVertex& b, float w, float h) {
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    float t0 = 0.0f;
    float t1 = 1.0f;

    const float p[4] = {-dx, dx, -dy, dy};
    const float q[4] = {a.x, w - a.x, a.y, h - a.y};

    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0f) {
            if (q[i] < 0.0f) return false;
            continue;
        }
        const float r = q[i] / p[i];
        if (p[i] < 0.0f) {
            if (r > t1) return false;
            if (r > t0) t0 = r;
        } else {
            if (r < t0) return false;
            if (r < t1) t1 = r;
        }
    }

    const ScreenVertex orig_a = a;
    const ScreenVertex orig_b = b;
    auto at = [&](float t) {
        ScreenVertex v;
        v.x = orig_a.x + dx * t;
        v.y = orig_a.y + dy * t;
        v.depth = orig_a.depth + (orig_b.depth - orig_a.depth) * t;
        v.attribute = orig_a.attribute + (orig_b.attribute - orig_a.attribute) * t;
        return v;
    };
    if (t0 > 0.0f) a = at(t0);
    if (t1 < 1.0f) b = at(t1);
    return true;
}

void Rasterizer::setup_triangle(const ClipVertex& a, const ClipVertex& b, const ClipVertex& c,
                                const Projector& projector) {
    const float near_z = projector.near_clip();
    const ClipVertex in[3] = {a, b, c};

    // Sutherland-Hodgman against the near plane: at most four vertices out.
    ClipVertex poly[4];
    int count = 0;
    for (int i = 0; i < 3; ++i) {
        const ClipVertex& cur = in[i];
        const ClipVertex& nxt = in[(i + 1) % 3];
        const bool cur_in = cur.camera.z >= near_z;
        const bool nxt_in = nxt.camera.z >= near_z;

        if (cur_in) poly[count++] = cur;
        if (cur_in != nxt_in) {
            const float t = (near_z - cur.camera.z) / (nxt.camera.z - cur.camera.z);
            ClipVertex iv;
            iv.camera = Vec3::lerp(cur.camera, nxt.camera, t);
            iv.camera.z = near_z;
            iv.attribute = cur.attribute + (nxt.attribute - cur.attribute) * t;
            poly[count++] = iv;
        }
    }
    if (count < 3) return;

    const ScreenVertex s0 = to_screen(poly[0], projector);
    for (int i = 1; i + 1 < count; ++i) {
        emit_triangle(s0, to_screen(poly[i], projector), to_screen(poly[i + 1], projector), projector);
    }
}

void Rasterizer::emit_triangle(ScreenVertex v0, ScreenVertex v1, ScreenVertex v2, const Projector& projector) {
    float area = edge(v0.x, v0.y, v1.x, v1.y, v2.x, v2.y);
    if (std::abs(area) < 1e-6f || !std::isfinite(area)) return;
    if (area < 0.0f) {
        std::swap(v1, v2);
        area = -area;
    }

    const Viewport& vp = projector.viewport();
    const float min_x = std::min({v0.x, v1.x, v2.x});
    const float max_x = std::max({v0.x, v1.x, v2.x});
    const float min_y = std::min({v0.y, v1.y, v2.y});
    const float max_y = std::max({v0.y, v1.y, v2.y});
    if (max_x < 0.0f || max_y < 0.0f ||
        min_x >= static_cast<float>(vp.width()) || min_y >= static_cast<float>(vp.height())) {
        return;
    }

    ScreenPrimitive sp;
    sp.kind = PrimitiveKind::Triangle;
    sp.v[0] = v0;
    sp.v[1] = v1;
    sp.v[2] = v2;
    sp.area = area;
    sp.min_row = std::max(0, floor_to_int(min_y));
    sp.max_row = std::min(vp.height() - 1, floor_to_int(max_y));
    screen_prims_.push_back(sp);
    stats_.triangles++;
}

void Rasterizer::draw_band(const ScreenPrimitive& prim, int y0, int y1, SubcellBuffer& target) {
    switch (prim.kind) {
        case PrimitiveKind::Point: {
            const int ix = floor_to_int(prim.v[0].x);
            const int iy = floor_to_int(prim.v[0].y);
            if (iy >= y0 && iy < y1) {
                target.test_and_set(ix, iy, prim.v[0].depth, prim.v[0].attribute);
            }
            break;
        }
        case PrimitiveKind::Line:
            draw_line(prim, y0, y1, target);
            break;
        case PrimitiveKind::Triangle:
            draw_triangle(prim, y0, y1, target);
            break;
    }
}

void Rasterizer::draw_line(const ScreenPrimitive& prim, int y0, int y1, SubcellBuffer& target) {
    const ScreenVertex& a = prim.v[0];
    const ScreenVertex& b = prim.v[1];
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const int steps = static_cast<int>(std::ceil(std::max(std::abs(dx), std::abs(dy))));

    if (steps == 0) {
        const int iy = floor_to_int(a.y);
        if (iy >= y0 && iy < y1) {
            target.test_and_set(floor_to_int(a.x), iy, std::min(a.depth, b.depth), a.attribute);
        }
        return;
    }

    const float inv_steps = 1.0f / static_cast<float>(steps);
    for (int i = 0; i <= steps; ++i) {
        const float t = static_cast<float>(i) * inv_steps;
        const int iy = floor_to_int(a.y + dy * t);
        if (iy < y0 || iy >= y1) continue;
        const int ix = floor_to_int(a.x + dx * t);
        const float depth = a.depth + (b.depth - a.depth) * t;
        const float attr = a.attribute + (b.attribute - a.attribute) * t;
        target.test_and_set(ix, iy, depth, attr);
    }
}

void Rasterizer::draw_triangle(const ScreenPrimitive& prim, int y0, int y1, SubcellBuffer& target) {
    const ScreenVertex& v0 = prim.v[0];
    const ScreenVertex& v1 = prim.v[1];
    const ScreenVertex& v2 = prim.v[2];
    const float inv_area = 1.0f / prim.area;

    const int x_begin = std::max(0, floor_to_int(std::min({v0.x, v1.x, v2.x})));
    const int x_end = std::min(target.width() - 1, floor_to_int(std::max({v0.x, v1.x, v2.x})));
    const int row_begin = std::max(y0, prim.min_row);
    const int row_end = std::min(y1 - 1, prim.max_row);

    for (int y = row_begin; y <= row_end; ++y) {
        const float py = static_cast<float>(y) + 0.5f;
        for (int x = x_begin; x <= x_end; ++x) {
            const float px = static_cast<float>(x) + 0.5f;
            const float w0 = edge(v1.x, v1.y, v2.x, v2.y, px, py);
            const float w1 = edge(v2.x, v2.y, v0.x, v0.y, px, py);
            const float w2 = edge(v0.x, v0.y, v1.x, v1.y, px, py);
            if (w0 < 0.0f || w1 < 0.0f || w2 < 0.0f) continue;

            const float l0 = w0 * inv_area;
            const float l1 = w1 * inv_area;
            const float l2 = w2 * inv_area;
            const float depth = l0 * v0.depth + l1 * v1.depth + l2 * v2.depth;
            const float attr = l0 * v0.attribute + l1 * v1.attribute + l2 * v2.attribute;
            target.test_and_set(x, y, depth, attr);
        }
    }
}

}
