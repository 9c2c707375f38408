#pragma once

#include "core/types.hpp"
#include "mapping/gradient.hpp"
#include <vector>

namespace pepterm {

enum class ColorSource {
    Sequence,
    Depth,
    Blend
};

enum class CellColorRule {
    Average,
    Nearest
};

class Colorizer {
public:
    struct Config {
        ColorSource source = ColorSource::Sequence;
        float depth_blend = 0.5f;
        CellColorRule cell_rule = CellColorRule::Average;
    };

    Colorizer() : Colorizer(Config{}) {}
    explicit Colorizer(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Camera-space depths mapped to 0 and 1 by the depth source.
    void set_depth_range(float near_depth, float far_depth);

    float parameter(const Subcell& cell) const;
    Rgb shade(const Subcell& cell, GradientId gradient) const {
        return gradient_color(gradient, parameter(cell));
    }

    // One color per character cell of a sub_x by sub_y block; empty
    // cells keep the default white.
    void colorize(const SubcellBuffer& subcells, int sub_x, int sub_y, GradientId gradient,
                  std::vector<Rgb>& cell_colors) const;

    // Per sub-cell colors for image output; uncovered entries are black.
    void colorize_subcells(const SubcellBuffer& subcells, GradientId gradient,
                           std::vector<Rgb>& out) const;

private:
    Config config_;
    float near_depth_ = 0.0f;
    float inv_depth_span_ = 0.0f;

    float normalized_depth(float depth) const;
};

}
