#pragma once

#include "core/types.hpp"
#include "terminal/terminal.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace pepterm {

struct CellUpdate {
    int row = 0;
    int col = 0;
    uint32_t codepoint = ' ';
    Rgb fg;
};

// Emits only the cells that changed since the previous frame, batching runs
// of equal color into a single escape sequence.
class TerminalRenderer {
public:
    TerminalRenderer(Terminal& term, ColorMode color_mode);

    void set_grid_size(int cols, int rows);
    void set_status_enabled(bool enabled) { status_enabled_ = enabled; }
    ColorMode color_mode() const { return color_mode_; }
    int cols() const { return cols_; }
    int rows() const { return rows_; }

    // Forces the next frame to repaint every cell.
    void invalidate();

    // Row-major list of cells that differ from the last presented frame.
    std::vector<CellUpdate> diff(const std::vector<GlyphCell>& cells) const;

    // Builds the byte stream for a frame plus an optional status line drawn
    // on the row below the grid, and records the frame as presented.
    const std::string& compose(const std::vector<GlyphCell>& cells, const std::string& status);

    Result render(const std::vector<GlyphCell>& cells, const std::string& status = "");

private:
    Terminal& term_;
    ColorMode color_mode_;
    int cols_ = 0;
    int rows_ = 0;
    std::vector<GlyphCell> prev_buffer_;
    std::string prev_status_;
    bool status_dirty_ = true;
    bool status_enabled_ = true;
    std::string out_buffer_;

    void append_utf8(uint32_t cp);
    void append_cursor_move(int row, int col);
    bool changed(const std::vector<GlyphCell>& cells, size_t idx) const;
};

std::string encode_utf8(uint32_t cp);

// First cols code points of a UTF-8 string, space padded to cols.
std::string fit_columns(const std::string& text, int cols);

}
