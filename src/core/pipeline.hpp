#pragma once

#include "core/types.hpp"
#include "glyph/glyph_packer.hpp"
#include "mapping/colorizer.hpp"
#include "mapping/gradient.hpp"
#include "render/projector.hpp"
#include "render/rasterizer.hpp"
#include "scene/camera.hpp"
#include "scene/model.hpp"
#include <vector>

namespace pepterm {

// Projector -> Rasterizer -> Colorizer -> GlyphPacker for one frame.
class Pipeline {
public:
    struct Config {
        int cols = 80;
        int rows = 24;
        GlyphMode glyph_mode = GlyphMode::Braille;
        float char_aspect = 2.0f;
        float fov = 1.7f;
        float near_clip = 0.1f;
        ColorSource color_source = ColorSource::Sequence;
        float depth_blend = 0.5f;
        CellColorRule cell_color = CellColorRule::Average;
        int band_rows = 16;
        bool parallel = true;
    };

    struct Frame {
        int cols = 0;
        int rows = 0;
        std::vector<GlyphCell> cells;
        int occupied_cells = 0;
    };

    struct Timings {
        double project_ms = 0.0;
        double raster_ms = 0.0;
        double color_ms = 0.0;
        double pack_ms = 0.0;

        double total_ms() const { return project_ms + raster_ms + color_ms + pack_ms; }
    };

    Pipeline() : Pipeline(Config{}) {}
    explicit Pipeline(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    void set_grid_size(int cols, int rows);
    void set_glyph_mode(GlyphMode mode);
    GlyphMode glyph_mode() const { return packer_.mode(); }

    const Viewport& viewport() const { return projector_.viewport(); }
    const Projector& projector() const { return projector_; }

    const Frame& render(const Model& model, const Camera& camera, GradientId gradient);

    const Frame& frame() const { return frame_; }
    const SubcellBuffer& subcells() const { return subcells_; }
    const Timings& timings() const { return timings_; }
    const Rasterizer::Stats& raster_stats() const { return rasterizer_.stats(); }

    // Per sub-cell colors of the last frame, row-major at viewport resolution.
    void subcell_colors(GradientId gradient, std::vector<Rgb>& out) const;

private:
    Config config_;
    Projector projector_;
    Rasterizer rasterizer_;
    Colorizer colorizer_;
    GlyphPacker packer_;

    SubcellBuffer subcells_;
    std::vector<ProjectedVertex> projected_;
    std::vector<Rgb> cell_colors_;
    std::vector<uint32_t> glyphs_;
    Frame frame_;
    Timings timings_;

    void apply_config();
};

}
