#include "projector.hpp"

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace pepterm {

Projector::Projector(const Config& config) : config_(config) {
    update_scales();
}

void Projector::set_config(const Config& config) {
    config_ = config;
    update_scales();
}

void Projector::set_viewport(const Viewport& viewport) {
    viewport_ = viewport;
    update_scales();
}

void Projector::update_scales() {
    const float half_fov = std::clamp(config_.fov, 0.05f, 3.0f) * 0.5f;
    x_scale_ = 1.0f / std::tan(half_fov);

    // Vertical scale keeps the physical aspect of the grid: a sub-cell is
    // 1/sub_x wide and char_aspect/sub_y tall in character-width units.
    y_scale_ = x_scale_;
    if (!viewport_.empty() && viewport_.sub_x > 0 && viewport_.sub_y > 0) {
        const float phys_w = static_cast<float>(viewport_.cols);
        const float phys_h = static_cast<float>(viewport_.rows) * viewport_.char_aspect;
        if (phys_h > 0.0f) {
            y_scale_ = x_scale_ * phys_w / phys_h;
        }
    }
}

ProjectedVertex Projector::project(const Camera& camera, const Vec3& world) const {
    ProjectedVertex pv;
    pv.camera = camera.to_camera_space(world);
    if (pv.camera.z >= config_.near_clip) {
        to_screen(pv.camera, pv.sx, pv.sy);
        pv.visible = true;
    }
    return pv;
}

void Projector::project_model(const Camera& camera, const Model& model,
                              std::vector<ProjectedVertex>& out) const {
    const auto& vertices = model.vertices();
    const int n = static_cast<int>(vertices.size());
    out.resize(vertices.size());

#ifdef HAS_OPENMP
    #pragma omp parallel for if(n > 4096)
#endif
    for (int i = 0; i < n; ++i) {
        out[i] = project(camera, vertices[i].position);
    }
}

bool Projector::subcell_index(float sx, float sy, int& ix, int& iy) const {
    if (!in_bounds(sx, sy)) return false;
    ix = static_cast<int>(std::floor(sx));
    iy = static_cast<int>(std::floor(sy));
    // Guard float rounding right at the upper edge.
    if (ix >= viewport_.width()) ix = viewport_.width() - 1;
    if (iy >= viewport_.height()) iy = viewport_.height() - 1;
    return true;
}

}
