#pragma once

#include "core/types.hpp"
#include <array>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace pepterm {

struct Vertex {
    Vec3 position;
    float attribute = 0.0f;
};

enum class PrimitiveKind : uint8_t {
    Point = 1,
    Line = 2,
    Triangle = 3
};

struct Primitive {
    PrimitiveKind kind = PrimitiveKind::Point;
    std::array<uint32_t, 3> indices{{0, 0, 0}};

    int vertex_count() const { return static_cast<int>(kind); }

    static Primitive point(uint32_t a) { return {PrimitiveKind::Point, {{a, a, a}}}; }
    static Primitive line(uint32_t a, uint32_t b) { return {PrimitiveKind::Line, {{a, b, b}}}; }
    static Primitive triangle(uint32_t a, uint32_t b, uint32_t c) {
        return {PrimitiveKind::Triangle, {{a, b, c}}};
    }
};

struct Bounds {
    Vec3 min;
    Vec3 max;
    bool empty = true;

    Vec3 center() const { return (min + max) * 0.5f; }
    float diagonal() const { return (max - min).length(); }
};

// Read-only geometry shared by every frame of a viewing session.
class Model {
public:
    Model() = default;
    Model(std::vector<Vertex> vertices, std::vector<Primitive> primitives);

    const std::vector<Vertex>& vertices() const { return vertices_; }
    const std::vector<Primitive>& primitives() const { return primitives_; }

    bool empty() const { return vertices_.empty(); }
    size_t count(PrimitiveKind kind) const;

    const Bounds& bounds() const { return bounds_; }
    Vec3 center() const { return bounds_.empty ? Vec3() : bounds_.center(); }
    float diagonal() const { return bounds_.empty ? 0.0f : bounds_.diagonal(); }
    float radius() const { return diagonal() * 0.5f; }

    // Length scale used for camera distance and motion; never zero.
    float scale() const;

    Result validate() const;

private:
    std::vector<Vertex> vertices_;
    std::vector<Primitive> primitives_;
    Bounds bounds_;

    void compute_bounds();
};

}
