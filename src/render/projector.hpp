#pragma once

#include "core/types.hpp"
#include "scene/camera.hpp"
#include "scene/model.hpp"
#include <vector>

namespace pepterm {

// Character grid plus the sub-cell subdivision of each character.
struct Viewport {
    int cols = 0;
    int rows = 0;
    int sub_x = 2;
    int sub_y = 4;
    float char_aspect = 2.0f;

    int width() const { return cols * sub_x; }
    int height() const { return rows * sub_y; }
    bool empty() const { return cols <= 0 || rows <= 0; }
};

struct ProjectedVertex {
    Vec3 camera;
    float sx = 0.0f;
    float sy = 0.0f;
    bool visible = false;
};

class Projector {
public:
    struct Config {
        float fov = 1.7f;
        float near_clip = 0.1f;
    };

    Projector() : Projector(Config{}) {}
    explicit Projector(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    void set_viewport(const Viewport& viewport);
    const Viewport& viewport() const { return viewport_; }

    float near_clip() const { return config_.near_clip; }

    // Perspective divide of a camera-space point with z >= near_clip.
    void to_screen(const Vec3& cam, float& sx, float& sy) const {
        const float inv_z = 1.0f / cam.z;
        sx = (cam.x * inv_z * x_scale_ + 1.0f) * 0.5f * static_cast<float>(viewport_.width());
        sy = (1.0f - cam.y * inv_z * y_scale_) * 0.5f * static_cast<float>(viewport_.height());
    }

    ProjectedVertex project(const Camera& camera, const Vec3& world) const;
    void project_model(const Camera& camera, const Model& model,
                       std::vector<ProjectedVertex>& out) const;

    // Inclusive lower edge, exclusive upper edge.
    bool in_bounds(float sx, float sy) const {
        return sx >= 0.0f && sy >= 0.0f &&
               sx < static_cast<float>(viewport_.width()) &&
               sy < static_cast<float>(viewport_.height());
    }

    bool subcell_index(float sx, float sy, int& ix, int& iy) const;

private:
    Config config_;
    Viewport viewport_;
    float x_scale_ = 1.0f;
    float y_scale_ = 1.0f;

    void update_scales();
};

}
