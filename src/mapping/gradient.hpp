#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace pepterm {

// Cycle order matches the 'c' key.
enum class GradientId {
    Rainbow = 0,
    Blues,
    Greens,
    Reds,
    Oranges,
    Purples,
    Viridis,
    Plasma,
    Magma,
    Inferno,
    Coolwarm,
    Spectral,
    White
};

constexpr int GRADIENT_COUNT = 13;

Rgb gradient_color(GradientId id, float t);
const char* gradient_name(GradientId id);
std::optional<GradientId> parse_gradient(const std::string& name);
GradientId next_gradient(GradientId id);

}
