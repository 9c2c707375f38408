#pragma once

#include "core/types.hpp"

namespace pepterm {

struct CameraPose {
    float yaw = 0.0f;
    float pitch = 0.0f;
    float distance = 1.0f;
    float pan_x = 0.0f;
    float pan_y = 0.0f;

    bool operator==(const CameraPose& other) const {
        return yaw == other.yaw && pitch == other.pitch && distance == other.distance &&
               pan_x == other.pan_x && pan_y == other.pan_y;
    }
    bool operator!=(const CameraPose& other) const { return !(*this == other); }
};

struct CameraLimits {
    float min_distance = 0.01f;
    float max_distance = 1000.0f;
    float pitch_limit = 1.56f;
};

// Orbit camera around a fixed target. Camera space is x right, y up,
// z along the view direction.
class Camera {
public:
    Camera();
    Camera(const Vec3& target, const CameraPose& initial, const CameraLimits& limits);

    void orbit(float delta_yaw, float delta_pitch);
    void pan(float dx, float dy);
    void zoom(float delta_distance);
    void set_pose(const CameraPose& pose);
    void reset();

    const CameraPose& pose() const { return pose_; }
    const CameraPose& initial_pose() const { return initial_; }
    const CameraLimits& limits() const { return limits_; }
    const Vec3& target() const { return target_; }

    Vec3 forward() const { return forward_; }
    Vec3 right() const { return right_; }
    Vec3 up() const { return up_; }

    Vec3 to_camera_space(const Vec3& world) const {
        const Vec3 d = world - target_;
        return {d.dot(right_) + pose_.pan_x,
                d.dot(up_) + pose_.pan_y,
                d.dot(forward_) + pose_.distance};
    }

    static float wrap_angle(float a);

private:
    Vec3 target_;
    CameraPose pose_;
    CameraPose initial_;
    CameraLimits limits_;
    Vec3 forward_{0.0f, 0.0f, 1.0f};
    Vec3 right_{1.0f, 0.0f, 0.0f};
    Vec3 up_{0.0f, 1.0f, 0.0f};

    CameraPose clamp_pose(CameraPose pose) const;
    void update_basis();
};

}
