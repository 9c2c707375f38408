#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace pepterm {

enum class GlyphMode {
    Braille,
    Block,
    Quadrant
};

const char* glyph_mode_name(GlyphMode mode);
std::optional<GlyphMode> parse_glyph_mode(const std::string& name);
GlyphMode next_glyph_mode(GlyphMode mode);

class GlyphPacker {
public:
    explicit GlyphPacker(GlyphMode mode = GlyphMode::Braille);

    void set_mode(GlyphMode mode) { mode_ = mode; }
    GlyphMode mode() const { return mode_; }

    int sub_x() const { return 2; }
    int sub_y() const { return mode_ == GlyphMode::Braille ? 4 : 2; }

    uint32_t pack_cell(const SubcellBuffer& subcells, int col, int row) const;
    void pack(const SubcellBuffer& subcells, std::vector<uint32_t>& glyphs) const;

    // Dot bit for sub-cell (row 0..3, col 0..1) of a Braille character.
    static uint8_t braille_bit(int row, int col);
    static uint32_t braille_glyph(uint8_t bits);
    static uint32_t density_glyph(int occupied, int total);
    // bit0 upper-left, bit1 upper-right, bit2 lower-left, bit3 lower-right.
    static uint32_t quadrant_glyph(uint8_t mask);

    static constexpr uint32_t BRAILLE_BASE = 0x2800;
    static constexpr uint32_t BLANK = 0x0020;
    static constexpr uint32_t BLOCK_LIGHT = 0x2591;
    static constexpr uint32_t BLOCK_MEDIUM = 0x2592;
    static constexpr uint32_t BLOCK_DARK = 0x2593;
    static constexpr uint32_t BLOCK_FULL = 0x2588;

private:
    GlyphMode mode_;
};

}
