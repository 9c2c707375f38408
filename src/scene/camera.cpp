#include "camera.hpp"

namespace pepterm {

namespace {
constexpr float PI = 3.14159265358979323846f;
constexpr float TWO_PI = 2.0f * PI;
}

Camera::Camera() : Camera(Vec3(), CameraPose{}, CameraLimits{}) {}

Camera::Camera(const Vec3& target, const CameraPose& initial, const CameraLimits& limits)
    : target_(target), limits_(limits) {
    if (limits_.min_distance <= 0.0f) limits_.min_distance = 1e-3f;
    if (limits_.max_distance < limits_.min_distance) limits_.max_distance = limits_.min_distance;
    initial_ = clamp_pose(initial);
    pose_ = initial_;
    update_basis();
}

float Camera::wrap_angle(float a) {
    if (!std::isfinite(a)) return 0.0f;
    a = std::fmod(a + PI, TWO_PI);
    if (a <= 0.0f) a += TWO_PI;
    return a - PI;
}

CameraPose Camera::clamp_pose(CameraPose pose) const {
    pose.yaw = wrap_angle(pose.yaw);
    if (!std::isfinite(pose.pitch)) pose.pitch = 0.0f;
    pose.pitch = std::clamp(pose.pitch, -limits_.pitch_limit, limits_.pitch_limit);
    if (!std::isfinite(pose.distance)) pose.distance = limits_.max_distance;
    pose.distance = std::clamp(pose.distance, limits_.min_distance, limits_.max_distance);
    if (!std::isfinite(pose.pan_x)) pose.pan_x = 0.0f;
    if (!std::isfinite(pose.pan_y)) pose.pan_y = 0.0f;
    return pose;
}

void Camera::update_basis() {
    const float sy = std::sin(pose_.yaw);
    const float cy = std::cos(pose_.yaw);
    const float sp = std::sin(pose_.pitch);
    const float cp = std::cos(pose_.pitch);

    // Eye sits at target - forward * distance.
    forward_ = Vec3(-sy * cp, -sp, cy * cp);
    right_ = Vec3(cy, 0.0f, sy);
    up_ = forward_.cross(right_);
}

void Camera::orbit(float delta_yaw, float delta_pitch) {
    CameraPose p = pose_;
    p.yaw += delta_yaw;
    p.pitch += delta_pitch;
    set_pose(p);
}

void Camera::pan(float dx, float dy) {
    CameraPose p = pose_;
    p.pan_x += dx;
    p.pan_y += dy;
    set_pose(p);
}

void Camera::zoom(float delta_distance) {
    CameraPose p = pose_;
    p.distance += delta_distance;
    set_pose(p);
}

void Camera::set_pose(const CameraPose& pose) {
    pose_ = clamp_pose(pose);
    update_basis();
}

void Camera::reset() {
    pose_ = initial_;
    update_basis();
}

}
