#include "glyph_packer.hpp"
#include <cctype>

namespace pepterm {

namespace {

const uint8_t BRAILLE_BITS[4][2] = {
    {0x01, 0x08},
    {0x02, 0x10},
    {0x04, 0x20},
    {0x40, 0x80}
};

const uint32_t QUADRANTS[16] = {
    0x0020, 0x2598, 0x259D, 0x2580,
    0x2596, 0x258C, 0x259E, 0x259B,
    0x2597, 0x259A, 0x2590, 0x259C,
    0x2584, 0x2599, 0x259F, 0x2588
};

}

const char* glyph_mode_name(GlyphMode mode) {
    switch (mode) {
        case GlyphMode::Braille: return "braille";
        case GlyphMode::Block: return "block";
        case GlyphMode::Quadrant: return "quadrant";
    }
    return "braille";
}

std::optional<GlyphMode> parse_glyph_mode(const std::string& name) {
    std::string lower = name;
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "braille" || lower == "dots") return GlyphMode::Braille;
    if (lower == "block" || lower == "blocks") return GlyphMode::Block;
    if (lower == "quadrant") return GlyphMode::Quadrant;
    return std::nullopt;
}

GlyphMode next_glyph_mode(GlyphMode mode) {
    switch (mode) {
        case GlyphMode::Braille: return GlyphMode::Block;
        case GlyphMode::Block: return GlyphMode::Quadrant;
        case GlyphMode::Quadrant: return GlyphMode::Braille;
    }
    return GlyphMode::Braille;
}

GlyphPacker::GlyphPacker(GlyphMode mode) : mode_(mode) {}

uint8_t GlyphPacker::braille_bit(int row, int col) {
    if (row < 0 || row > 3 || col < 0 || col > 1) return 0;
    return BRAILLE_BITS[row][col];
}

uint32_t GlyphPacker::braille_glyph(uint8_t bits) {
    if (bits == 0) return BLANK;
    return BRAILLE_BASE + bits;
}

uint32_t GlyphPacker::density_glyph(int occupied, int total) {
    if (total <= 0 || occupied <= 0) return BLANK;
    const float coverage = static_cast<float>(occupied) / static_cast<float>(total);
    if (coverage < 0.375f) return BLOCK_LIGHT;
    if (coverage < 0.625f) return BLOCK_MEDIUM;
    if (coverage < 0.875f) return BLOCK_DARK;
    return BLOCK_FULL;
}

uint32_t GlyphPacker::quadrant_glyph(uint8_t mask) {
    return QUADRANTS[mask & 0x0F];
}

uint32_t GlyphPacker::pack_cell(const SubcellBuffer& subcells, int col, int row) const {
    const int sx = sub_x();
    const int sy = sub_y();
    const int x0 = col * sx;
    const int y0 = row * sy;

    switch (mode_) {
        case GlyphMode::Braille: {
            uint8_t bits = 0;
            for (int dy = 0; dy < 4; ++dy) {
                for (int dx = 0; dx < 2; ++dx) {
                    if (subcells.contains(x0 + dx, y0 + dy) && subcells.at(x0 + dx, y0 + dy).covered()) {
                        bits |= BRAILLE_BITS[dy][dx];
                    }
                }
            }
            return braille_glyph(bits);
        }
        case GlyphMode::Block: {
            int occupied = 0;
            for (int dy = 0; dy < sy; ++dy) {
                for (int dx = 0; dx < sx; ++dx) {
                    if (subcells.contains(x0 + dx, y0 + dy) && subcells.at(x0 + dx, y0 + dy).covered()) {
                        occupied++;
                    }
                }
            }
            return density_glyph(occupied, sx * sy);
        }
        case GlyphMode::Quadrant: {
            uint8_t mask = 0;
            for (int dy = 0; dy < 2; ++dy) {
                for (int dx = 0; dx < 2; ++dx) {
                    if (subcells.contains(x0 + dx, y0 + dy) && subcells.at(x0 + dx, y0 + dy).covered()) {
                        mask |= static_cast<uint8_t>(1u << (dy * 2 + dx));
                    }
                }
            }
            return quadrant_glyph(mask);
        }
    }
    return BLANK;
}

void GlyphPacker::pack(const SubcellBuffer& subcells, std::vector<uint32_t>& glyphs) const {
    const int cols = subcells.width() / sub_x();
    const int rows = subcells.height() / sub_y();
    glyphs.assign(static_cast<size_t>(cols) * rows, BLANK);

    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            glyphs[static_cast<size_t>(row) * cols + col] = pack_cell(subcells, col, row);
        }
    }
}

}
