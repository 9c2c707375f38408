#pragma once

#include "core/types.hpp"
#include "scene/model.hpp"
#include "render/projector.hpp"
#include <vector>

namespace pepterm {

class Rasterizer {
public:
    struct Config {
        int band_rows = 16;
        bool parallel = true;
    };

    struct Stats {
        int submitted = 0;
        int culled = 0;
        int points = 0;
        int lines = 0;
        int triangles = 0;
    };

    Rasterizer() : Rasterizer(Config{}) {}
    explicit Rasterizer(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Fills target (already sized to the projector viewport) with the
    // nearest sample of every primitive. target is not cleared here.
    void rasterize(const Model& model, const std::vector<ProjectedVertex>& projected,
                   const Projector& projector, SubcellBuffer& target);

    const Stats& stats() const { return stats_; }

private:
    struct ScreenVertex {
        float x = 0.0f;
        float y = 0.0f;
        float depth = 0.0f;
        float attribute = 0.0f;
    };

    struct ClipVertex {
        Vec3 camera;
        float attribute = 0.0f;
    };

    struct ScreenPrimitive {
        PrimitiveKind kind = PrimitiveKind::Point;
        ScreenVertex v[3];
        int min_row = 0;
        int max_row = 0;
        float area = 0.0f;
    };

    Config config_;
    Stats stats_;
    std::vector<ScreenPrimitive> screen_prims_;

    void setup_point(const ProjectedVertex& pv, float attribute, const Projector& projector);
    void setup_line(ClipVertex a, ClipVertex b, const Projector& projector);
    void setup_triangle(const ClipVertex& a, const ClipVertex& b, const ClipVertex& c,
                        const Projector& projector);
    void emit_triangle(ScreenVertex v0, ScreenVertex v1, ScreenVertex v2, const Projector& projector);

    static bool clip_segment_to_rect(ScreenVertex& a, ScreenVertex& b, float w, float h);
    static ScreenVertex to_screen(const ClipVertex& cv, const Projector& projector);

    static void draw_band(const ScreenPrimitive& prim, int y0, int y1, SubcellBuffer& target);
    static void draw_line(const ScreenPrimitive& prim, int y0, int y1, SubcellBuffer& target);
    static void draw_triangle(const ScreenPrimitive& prim, int y0, int y1, SubcellBuffer& target);
};

}
