#include "pipeline.hpp"
#include <chrono>

namespace pepterm {

namespace {

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
}

}

Pipeline::Pipeline(const Config& config) : config_(config) {
    apply_config();
}

void Pipeline::set_config(const Config& config) {
    config_ = config;
    apply_config();
}

void Pipeline::apply_config() {
    packer_.set_mode(config_.glyph_mode);

    Projector::Config proj_cfg;
    proj_cfg.fov = config_.fov;
    proj_cfg.near_clip = config_.near_clip;
    projector_.set_config(proj_cfg);

    Viewport viewport;
    viewport.cols = std::max(0, config_.cols);
    viewport.rows = std::max(0, config_.rows);
    viewport.sub_x = packer_.sub_x();
    viewport.sub_y = packer_.sub_y();
    viewport.char_aspect = config_.char_aspect;
    projector_.set_viewport(viewport);

    Rasterizer::Config raster_cfg;
    raster_cfg.band_rows = config_.band_rows;
    raster_cfg.parallel = config_.parallel;
    rasterizer_.set_config(raster_cfg);

    Colorizer::Config color_cfg;
    color_cfg.source = config_.color_source;
    color_cfg.depth_blend = config_.depth_blend;
    color_cfg.cell_rule = config_.cell_color;
    colorizer_.set_config(color_cfg);
}

void Pipeline::set_grid_size(int cols, int rows) {
    config_.cols = cols;
    config_.rows = rows;
    apply_config();
}

void Pipeline::set_glyph_mode(GlyphMode mode) {
    config_.glyph_mode = mode;
    apply_config();
}

const Pipeline::Frame& Pipeline::render(const Model& model, const Camera& camera, GradientId gradient) {
    const Viewport& vp = projector_.viewport();

    auto stage_start = std::chrono::high_resolution_clock::now();
    if (subcells_.width() != vp.width() || subcells_.height() != vp.height()) {
        subcells_.resize(vp.width(), vp.height());
    } else {
        subcells_.clear();
    }
    projector_.project_model(camera, model, projected_);
    timings_.project_ms = elapsed_ms(stage_start);

    stage_start = std::chrono::high_resolution_clock::now();
    rasterizer_.rasterize(model, projected_, projector_, subcells_);
    timings_.raster_ms = elapsed_ms(stage_start);

    stage_start = std::chrono::high_resolution_clock::now();
    const float distance = camera.pose().distance;
    const float radius = model.radius();
    colorizer_.set_depth_range(distance - radius, distance + radius);
    colorizer_.colorize(subcells_, vp.sub_x, vp.sub_y, gradient, cell_colors_);
    timings_.color_ms = elapsed_ms(stage_start);

    stage_start = std::chrono::high_resolution_clock::now();
    packer_.pack(subcells_, glyphs_);

    frame_.cols = vp.cols;
    frame_.rows = vp.rows;
    frame_.occupied_cells = 0;
    frame_.cells.assign(glyphs_.size(), GlyphCell{});
    for (size_t i = 0; i < glyphs_.size(); ++i) {
        if (glyphs_[i] == GlyphPacker::BLANK) continue;
        frame_.cells[i].codepoint = glyphs_[i];
        frame_.cells[i].fg = cell_colors_[i];
        frame_.occupied_cells++;
    }
    timings_.pack_ms = elapsed_ms(stage_start);

    return frame_;
}

void Pipeline::subcell_colors(GradientId gradient, std::vector<Rgb>& out) const {
    colorizer_.colorize_subcells(subcells_, gradient, out);
}

}
