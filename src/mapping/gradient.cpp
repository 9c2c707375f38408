#include "gradient.hpp"
#include <cctype>

namespace pepterm {

namespace {

struct Stop {
    uint8_t r, g, b;
};

const Stop BLUES[] = {
    {247, 251, 255}, {222, 235, 247}, {198, 219, 239}, {158, 202, 225},
    {107, 174, 214}, {66, 146, 198}, {33, 113, 181}, {8, 81, 156}, {8, 48, 107}
};

const Stop GREENS[] = {
    {247, 252, 245}, {229, 245, 224}, {199, 233, 192}, {161, 217, 155},
    {116, 196, 118}, {65, 171, 93}, {35, 139, 69}, {0, 109, 44}, {0, 68, 27}
};

const Stop REDS[] = {
    {255, 245, 240}, {254, 224, 210}, {252, 187, 161}, {252, 146, 114},
    {251, 106, 74}, {239, 59, 44}, {203, 24, 29}, {165, 15, 21}, {103, 0, 13}
};

const Stop ORANGES[] = {
    {255, 245, 235}, {254, 230, 206}, {253, 208, 162}, {253, 174, 107},
    {253, 141, 60}, {241, 105, 19}, {217, 72, 1}, {166, 54, 3}, {127, 39, 4}
};

const Stop PURPLES[] = {
    {252, 251, 253}, {239, 237, 245}, {218, 218, 235}, {188, 189, 220},
    {158, 154, 200}, {128, 125, 186}, {106, 81, 163}, {84, 39, 143}, {63, 0, 125}
};

const Stop VIRIDIS[] = {
    {68, 1, 84}, {72, 40, 120}, {62, 74, 137}, {49, 104, 142},
    {38, 130, 142}, {31, 158, 137}, {53, 183, 121}, {109, 205, 89},
    {180, 222, 44}, {253, 231, 37}
};

const Stop PLASMA[] = {
    {13, 8, 135}, {75, 3, 161}, {125, 3, 168}, {168, 34, 150},
    {203, 70, 121}, {229, 107, 93}, {248, 148, 65}, {253, 195, 40},
    {240, 249, 33}
};

const Stop MAGMA[] = {
    {0, 0, 4}, {28, 16, 68}, {79, 18, 123}, {129, 37, 129},
    {181, 54, 122}, {229, 80, 100}, {251, 135, 97}, {254, 194, 135},
    {252, 253, 191}
};

const Stop INFERNO[] = {
    {0, 0, 4}, {40, 11, 84}, {101, 21, 110}, {159, 42, 99},
    {212, 72, 66}, {245, 125, 21}, {250, 193, 39}, {252, 255, 164}
};

const Stop COOLWARM[] = {
    {59, 76, 192}, {98, 130, 234}, {141, 176, 254}, {184, 208, 249},
    {221, 221, 221}, {245, 196, 173}, {244, 154, 123}, {222, 96, 77},
    {180, 4, 38}
};

const Stop SPECTRAL[] = {
    {158, 1, 66}, {213, 62, 79}, {244, 109, 67}, {253, 174, 97},
    {254, 224, 139}, {255, 255, 191}, {230, 245, 152}, {171, 221, 164},
    {102, 194, 165}, {50, 136, 189}, {94, 79, 162}
};

const char* const NAMES[GRADIENT_COUNT] = {
    "rainbow", "blues", "greens", "reds", "oranges", "purples", "viridis",
    "plasma", "magma", "inferno", "coolwarm", "spectral", "white"
};

template <size_t N>
Rgb interpolate(const Stop (&stops)[N], float t) {
    const float idx = t * static_cast<float>(N - 1);
    const size_t i = std::min(static_cast<size_t>(std::floor(idx)), N - 2);
    const float frac = idx - static_cast<float>(i);

    const Stop& a = stops[i];
    const Stop& b = stops[i + 1];
    return Rgb(
        static_cast<uint8_t>(a.r + frac * (static_cast<float>(b.r) - a.r)),
        static_cast<uint8_t>(a.g + frac * (static_cast<float>(b.g) - a.g)),
        static_cast<uint8_t>(a.b + frac * (static_cast<float>(b.b) - a.b))
    );
}

// Blue -> cyan -> green -> yellow -> red in four linear segments.
Rgb rainbow(float t) {
    if (t < 0.25f) {
        const float s = t / 0.25f;
        return Rgb(0, static_cast<uint8_t>(s * 255.0f), 255);
    }
    if (t < 0.5f) {
        const float s = (t - 0.25f) / 0.25f;
        return Rgb(0, 255, static_cast<uint8_t>(255.0f * (1.0f - s)));
    }
    if (t < 0.75f) {
        const float s = (t - 0.5f) / 0.25f;
        return Rgb(static_cast<uint8_t>(s * 255.0f), 255, 0);
    }
    const float s = (t - 0.75f) / 0.25f;
    return Rgb(255, static_cast<uint8_t>(255.0f * (1.0f - s)), 0);
}

}

Rgb gradient_color(GradientId id, float t) {
    if (!std::isfinite(t)) t = 0.0f;
    t = std::clamp(t, 0.0f, 1.0f);

    switch (id) {
        case GradientId::Rainbow: return rainbow(t);
        case GradientId::Blues: return interpolate(BLUES, t);
        case GradientId::Greens: return interpolate(GREENS, t);
        case GradientId::Reds: return interpolate(REDS, t);
        case GradientId::Oranges: return interpolate(ORANGES, t);
        case GradientId::Purples: return interpolate(PURPLES, t);
        case GradientId::Viridis: return interpolate(VIRIDIS, t);
        case GradientId::Plasma: return interpolate(PLASMA, t);
        case GradientId::Magma: return interpolate(MAGMA, t);
        case GradientId::Inferno: return interpolate(INFERNO, t);
        case GradientId::Coolwarm: return interpolate(COOLWARM, t);
        case GradientId::Spectral: return interpolate(SPECTRAL, t);
        case GradientId::White: return Rgb::white();
    }
    return Rgb::white();
}

const char* gradient_name(GradientId id) {
    const int i = static_cast<int>(id);
    if (i < 0 || i >= GRADIENT_COUNT) return "unknown";
    return NAMES[i];
}

std::optional<GradientId> parse_gradient(const std::string& name) {
    std::string lower = name;
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (int i = 0; i < GRADIENT_COUNT; ++i) {
        if (lower == NAMES[i]) return static_cast<GradientId>(i);
    }
    return std::nullopt;
}

GradientId next_gradient(GradientId id) {
    return static_cast<GradientId>((static_cast<int>(id) + 1) % GRADIENT_COUNT);
}

}
