#include "model.hpp"
#include <utility>

namespace pepterm {

Model::Model(std::vector<Vertex> vertices, std::vector<Primitive> primitives)
    : vertices_(std::move(vertices)), primitives_(std::move(primitives)) {
    compute_bounds();
}

void Model::compute_bounds() {
    bounds_ = Bounds{};
    if (vertices_.empty()) return;

    bounds_.min = vertices_[0].position;
    bounds_.max = vertices_[0].position;
    bounds_.empty = false;

    for (const auto& v : vertices_) {
        const Vec3& p = v.position;
        bounds_.min.x = std::min(bounds_.min.x, p.x);
        bounds_.min.y = std::min(bounds_.min.y, p.y);
        bounds_.min.z = std::min(bounds_.min.z, p.z);
        bounds_.max.x = std::max(bounds_.max.x, p.x);
        bounds_.max.y = std::max(bounds_.max.y, p.y);
        bounds_.max.z = std::max(bounds_.max.z, p.z);
    }
}

size_t Model::count(PrimitiveKind kind) const {
    size_t n = 0;
    for (const auto& p : primitives_) {
        if (p.kind == kind) n++;
    }
    return n;
}

float Model::scale() const {
    float d = diagonal();
    return d > 1e-6f ? d : 1.0f;
}

Result Model::validate() const {
    const size_t n = vertices_.size();
    for (size_t i = 0; i < primitives_.size(); ++i) {
        const Primitive& prim = primitives_[i];
        for (int k = 0; k < prim.vertex_count(); ++k) {
            if (prim.indices[k] >= n) {
                return Result::fail(ErrorCode::INVALID_FORMAT,
                    "primitive " + std::to_string(i) + " references vertex " +
                    std::to_string(prim.indices[k]) + " of " + std::to_string(n));
            }
        }
    }
    for (const auto& v : vertices_) {
        if (!std::isfinite(v.position.x) || !std::isfinite(v.position.y) || !std::isfinite(v.position.z)) {
            return Result::fail(ErrorCode::INVALID_FORMAT, "vertex position is not finite");
        }
    }
    return Result::ok();
}

}
