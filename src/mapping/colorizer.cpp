#include "colorizer.hpp"

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace pepterm {

Colorizer::Colorizer(const Config& config) : config_(config) {}

void Colorizer::set_depth_range(float near_depth, float far_depth) {
    near_depth_ = near_depth;
    const float span = far_depth - near_depth;
    inv_depth_span_ = span > 1e-6f ? 1.0f / span : 0.0f;
}

float Colorizer::normalized_depth(float depth) const {
    if (inv_depth_span_ == 0.0f) return 0.0f;
    return std::clamp((depth - near_depth_) * inv_depth_span_, 0.0f, 1.0f);
}

float Colorizer::parameter(const Subcell& cell) const {
    switch (config_.source) {
        case ColorSource::Sequence:
            return std::clamp(cell.attribute, 0.0f, 1.0f);
        case ColorSource::Depth:
            return normalized_depth(cell.depth);
        case ColorSource::Blend: {
            const float w = std::clamp(config_.depth_blend, 0.0f, 1.0f);
            return (1.0f - w) * std::clamp(cell.attribute, 0.0f, 1.0f) + w * normalized_depth(cell.depth);
        }
    }
    return 0.0f;
}

void Colorizer::colorize(const SubcellBuffer& subcells, int sub_x, int sub_y, GradientId gradient,
                         std::vector<Rgb>& cell_colors) const {
    if (sub_x <= 0 || sub_y <= 0) {
        cell_colors.clear();
        return;
    }
    const int cols = subcells.width() / sub_x;
    const int rows = subcells.height() / sub_y;
    cell_colors.assign(static_cast<size_t>(cols) * rows, Rgb::white());

#ifdef HAS_OPENMP
    #pragma omp parallel for if(rows > 8)
#endif
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            uint32_t sum_r = 0, sum_g = 0, sum_b = 0, count = 0;
            float best_depth = std::numeric_limits<float>::infinity();
            const Subcell* nearest = nullptr;

            for (int dy = 0; dy < sub_y; ++dy) {
                for (int dx = 0; dx < sub_x; ++dx) {
                    const Subcell& cell = subcells.at(col * sub_x + dx, row * sub_y + dy);
                    if (!cell.covered()) continue;
                    if (config_.cell_rule == CellColorRule::Nearest) {
                        if (cell.depth < best_depth) {
                            best_depth = cell.depth;
                            nearest = &cell;
                        }
                    } else {
                        const Rgb c = shade(cell, gradient);
                        sum_r += c.r;
                        sum_g += c.g;
                        sum_b += c.b;
                        count++;
                    }
                }
            }

            Rgb& out = cell_colors[static_cast<size_t>(row) * cols + col];
            if (nearest) {
                out = shade(*nearest, gradient);
            } else if (count > 0) {
                out = Rgb(static_cast<uint8_t>(sum_r / count),
                          static_cast<uint8_t>(sum_g / count),
                          static_cast<uint8_t>(sum_b / count));
            }
        }
    }
}

void Colorizer::colorize_subcells(const SubcellBuffer& subcells, GradientId gradient,
                                  std::vector<Rgb>& out) const {
    const auto& cells = subcells.cells();
    out.assign(cells.size(), Rgb());
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i].covered()) {
            out[i] = shade(cells[i], gradient);
        }
    }
}

}
