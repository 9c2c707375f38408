#pragma once

#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace pepterm {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    MEMORY_ERROR,
    PROCESSING_ERROR,
    TOOL_ERROR,
    INVALID_ARGUMENT,
    DEVICE_ERROR
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;

    Rgb() = default;
    Rgb(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    static Rgb white() { return Rgb(255, 255, 255); }

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

struct Vec3 {
    float x = 0.0f, y = 0.0f, z = 0.0f;

    Vec3() = default;
    Vec3(float x, float y, float z) : x(x), y(y), z(z) {}

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }

    float dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }
    Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }
    float length() const { return std::sqrt(dot(*this)); }

    static Vec3 lerp(const Vec3& a, const Vec3& b, float t) {
        return a + (b - a) * t;
    }
};

// One terminal character: glyph plus foreground color.
struct GlyphCell {
    uint32_t codepoint = ' ';
    Rgb fg = Rgb::white();

    bool operator==(const GlyphCell& other) const {
        return codepoint == other.codepoint && fg == other.fg;
    }
    bool operator!=(const GlyphCell& other) const { return !(*this == other); }
};

struct Subcell {
    float depth = std::numeric_limits<float>::infinity();
    float attribute = 0.0f;

    bool covered() const { return depth != std::numeric_limits<float>::infinity(); }
};

class SubcellBuffer {
public:
    SubcellBuffer() = default;
    SubcellBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h) {}

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    void resize(int w, int h) {
        width_ = std::max(0, w);
        height_ = std::max(0, h);
        data_.assign(static_cast<size_t>(width_) * height_, Subcell{});
    }

    void clear() {
        std::fill(data_.begin(), data_.end(), Subcell{});
    }

    bool contains(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    const Subcell& at(int x, int y) const {
        return data_[static_cast<size_t>(y) * width_ + x];
    }

    Subcell& at(int x, int y) {
        return data_[static_cast<size_t>(y) * width_ + x];
    }

    const Subcell& get(int x, int y) const {
        if (!contains(x, y)) throw std::out_of_range("SubcellBuffer::get");
        return at(x, y);
    }

    // Nearest-wins write; equal depth keeps the earlier sample.
    bool test_and_set(int x, int y, float depth, float attribute) {
        if (!contains(x, y)) return false;
        Subcell& cell = at(x, y);
        if (depth < cell.depth) {
            cell.depth = depth;
            cell.attribute = attribute;
            return true;
        }
        return false;
    }

    int covered_count() const {
        int n = 0;
        for (const auto& c : data_) {
            if (c.covered()) n++;
        }
        return n;
    }

    const std::vector<Subcell>& cells() const { return data_; }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Subcell> data_;
};

}
