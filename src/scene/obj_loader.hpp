#pragma once

#include "core/types.hpp"
#include "scene/model.hpp"
#include <istream>
#include <optional>
#include <string>

namespace pepterm {

// How polygon records become primitives.
enum class MeshMode {
    Wireframe,
    Surface,
    Points
};

std::optional<MeshMode> parse_mesh_mode(const std::string& name);

struct ObjLoadOptions {
    MeshMode mode = MeshMode::Wireframe;
    float min_edge_length = 0.1f;
    size_t max_edges = 50000;
};

// Reads "v" and "f"/"fo" records. Each vertex carries its index normalized
// over the range of indices referenced by faces, so cartoon exports color
// from one chain terminus to the other.
Result parse_obj(std::istream& in, const ObjLoadOptions& options, Model& out);
Result load_obj(const std::string& path, const ObjLoadOptions& options, Model& out);

}
