#include "obj_loader.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <set>
#include <utility>

namespace pepterm {

namespace {

std::string join_continuations(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();

    std::string joined;
    joined.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            size_t j = i + 1;
            if (j < text.size() && text[j] == '\r') ++j;
            if (j < text.size() && text[j] == '\n') {
                joined.push_back(' ');
                i = j;
                continue;
            }
        }
        joined.push_back(text[i]);
    }
    return joined;
}

bool parse_float(const std::string& token, float& out) {
    if (token.empty()) return false;
    char* end = nullptr;
    out = std::strtof(token.c_str(), &end);
    return end != token.c_str() && *end == '\0' && std::isfinite(out);
}

// Vertex reference of a face token ("7", "7/1", "7//3", "-2/1/1") as a
// zero-based index, or -1 when unusable.
long resolve_index(const std::string& token, size_t vertex_count) {
    const std::string head = token.substr(0, token.find('/'));
    if (head.empty()) return -1;
    char* end = nullptr;
    long value = std::strtol(head.c_str(), &end, 10);
    if (end == head.c_str() || *end != '\0' || value == 0) return -1;
    if (value < 0) {
        long idx = static_cast<long>(vertex_count) + value;
        return idx >= 0 ? idx : -1;
    }
    return value - 1;
}

// Endpoint positions snapped to a 0.001 grid, smaller endpoint first, so
// coincident vertices from separate faces share one edge.
using EdgeKey = std::array<int64_t, 6>;

constexpr float EDGE_SNAP = 0.001f;

EdgeKey edge_key(const Vec3& a, const Vec3& b) {
    const std::array<int64_t, 3> pa = {std::llround(a.x / EDGE_SNAP), std::llround(a.y / EDGE_SNAP),
                                       std::llround(a.z / EDGE_SNAP)};
    const std::array<int64_t, 3> pb = {std::llround(b.x / EDGE_SNAP), std::llround(b.y / EDGE_SNAP),
                                       std::llround(b.z / EDGE_SNAP)};
    const auto& lo = pa < pb ? pa : pb;
    const auto& hi = pa < pb ? pb : pa;
    return {lo[0], lo[1], lo[2], hi[0], hi[1], hi[2]};
}

}

std::optional<MeshMode> parse_mesh_mode(const std::string& name) {
    std::string lower = name;
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "wireframe" || lower == "lines") return MeshMode::Wireframe;
    if (lower == "surface" || lower == "triangles") return MeshMode::Surface;
    if (lower == "points") return MeshMode::Points;
    return std::nullopt;
}

Result parse_obj(std::istream& in, const ObjLoadOptions& options, Model& out) {
    const std::string text = join_continuations(in);

    std::vector<Vertex> vertices;
    std::vector<std::vector<uint32_t>> faces;

    std::istringstream lines(text);
    std::string line;
    int line_no = 0;
    while (std::getline(lines, line)) {
        line_no++;
        std::istringstream fields(line);
        std::string keyword;
        if (!(fields >> keyword) || keyword[0] == '#') continue;

        if (keyword == "v") {
            std::string sx, sy, sz;
            Vertex v;
            if (!(fields >> sx >> sy >> sz) ||
                !parse_float(sx, v.position.x) ||
                !parse_float(sy, v.position.y) ||
                !parse_float(sz, v.position.z)) {
                return Result::fail(ErrorCode::INVALID_FORMAT,
                                    "Invalid vertex on line " + std::to_string(line_no));
            }
            vertices.push_back(v);
        } else if (keyword == "f" || keyword == "fo") {
            std::vector<uint32_t> face;
            std::string token;
            while (fields >> token) {
                long idx = resolve_index(token, vertices.size());
                if (idx >= 0) face.push_back(static_cast<uint32_t>(idx));
            }
            if (face.size() >= 2) faces.push_back(std::move(face));
        }
    }

    if (vertices.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "No vertices found in OBJ");
    }

    // Forward references are legal in OBJ; drop only those never satisfied.
    for (auto& face : faces) {
        face.erase(std::remove_if(face.begin(), face.end(),
                                  [&](uint32_t i) { return i >= vertices.size(); }),
                   face.end());
    }

    uint32_t min_idx = UINT32_MAX;
    uint32_t max_idx = 0;
    for (const auto& face : faces) {
        for (uint32_t idx : face) {
            min_idx = std::min(min_idx, idx);
            max_idx = std::max(max_idx, idx);
        }
    }
    if (min_idx == UINT32_MAX) {
        min_idx = 0;
        max_idx = static_cast<uint32_t>(vertices.size() - 1);
    }
    const float range = max_idx > min_idx ? static_cast<float>(max_idx - min_idx) : 1.0f;
    for (size_t i = 0; i < vertices.size(); ++i) {
        float t = (static_cast<float>(i) - static_cast<float>(min_idx)) / range;
        vertices[i].attribute = std::clamp(t, 0.0f, 1.0f);
    }

    std::vector<Primitive> primitives;

    if (options.mode == MeshMode::Wireframe) {
        std::set<EdgeKey> seen;
        const float min_len_sq = options.min_edge_length * options.min_edge_length;
        for (const auto& face : faces) {
            if (face.size() < 2) continue;
            for (size_t i = 0; i < face.size(); ++i) {
                const uint32_t a = face[i];
                const uint32_t b = face[(i + 1) % face.size()];
                if (a == b) continue;
                const EdgeKey key = edge_key(vertices[a].position, vertices[b].position);
                if (std::equal(key.begin(), key.begin() + 3, key.begin() + 3)) continue;
                if (!seen.insert(key).second) continue;
                const Vec3 d = vertices[b].position - vertices[a].position;
                if (d.dot(d) < min_len_sq) continue;
                primitives.push_back(Primitive::line(a, b));
            }
        }
        if (options.max_edges > 0 && primitives.size() > options.max_edges) {
            const size_t step = (primitives.size() + options.max_edges - 1) / options.max_edges;
            std::vector<Primitive> kept;
            kept.reserve(primitives.size() / step + 1);
            for (size_t i = 0; i < primitives.size(); i += step) {
                kept.push_back(primitives[i]);
            }
            primitives.swap(kept);
        }
    } else if (options.mode == MeshMode::Surface) {
        for (const auto& face : faces) {
            if (face.size() == 2) {
                primitives.push_back(Primitive::line(face[0], face[1]));
                continue;
            }
            for (size_t i = 1; i + 1 < face.size(); ++i) {
                primitives.push_back(Primitive::triangle(face[0], face[i], face[i + 1]));
            }
        }
    }

    if (options.mode == MeshMode::Points || faces.empty()) {
        primitives.clear();
        primitives.reserve(vertices.size());
        for (size_t i = 0; i < vertices.size(); ++i) {
            primitives.push_back(Primitive::point(static_cast<uint32_t>(i)));
        }
    }

    out = Model(std::move(vertices), std::move(primitives));
    return out.validate();
}

Result load_obj(const std::string& path, const ObjLoadOptions& options, Model& out) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "OBJ file not found: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open OBJ file: " + path);
    }
    return parse_obj(file, options, out);
}

}
