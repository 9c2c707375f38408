#include "terminal_renderer.hpp"
#include <charconv>
#include <system_error>
#include <algorithm>

namespace pepterm {

namespace {
    // Never produced by the packer, so every cell differs after invalidate().
    constexpr uint32_t INVALID_CODEPOINT = 0;
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result += static_cast<char>(cp);
    } else if (cp < 0x800) {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

std::string fit_columns(const std::string& text, int cols) {
    if (cols <= 0) return std::string();
    std::string line;
    int used = 0;
    size_t i = 0;
    while (i < text.size() && used < cols) {
        size_t len = 1;
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead >= 0xF0) len = 4;
        else if (lead >= 0xE0) len = 3;
        else if (lead >= 0xC0) len = 2;
        if (i + len > text.size()) break;
        line.append(text, i, len);
        i += len;
        used++;
    }
    line.append(static_cast<size_t>(cols - used), ' ');
    return line;
}

TerminalRenderer::TerminalRenderer(Terminal& term, ColorMode color_mode)
    : term_(term), color_mode_(color_mode) {}

void TerminalRenderer::set_grid_size(int cols, int rows) {
    cols_ = std::max(0, cols);
    rows_ = std::max(0, rows);
    invalidate();
    const size_t reserve_bytes = static_cast<size_t>(cols_) * static_cast<size_t>(rows_) * 8;
    if (out_buffer_.capacity() < reserve_bytes) {
        out_buffer_.reserve(reserve_bytes);
    }
}

void TerminalRenderer::invalidate() {
    GlyphCell sentinel;
    sentinel.codepoint = INVALID_CODEPOINT;
    prev_buffer_.assign(static_cast<size_t>(cols_) * rows_, sentinel);
    status_dirty_ = true;
}

bool TerminalRenderer::changed(const std::vector<GlyphCell>& cells, size_t idx) const {
    if (idx >= prev_buffer_.size()) return true;
    return cells[idx] != prev_buffer_[idx];
}

std::vector<CellUpdate> TerminalRenderer::diff(const std::vector<GlyphCell>& cells) const {
    std::vector<CellUpdate> updates;
    for (int y = 0; y < rows_; ++y) {
        for (int x = 0; x < cols_; ++x) {
            size_t idx = static_cast<size_t>(y) * cols_ + x;
            if (idx >= cells.size()) return updates;
            if (changed(cells, idx)) {
                updates.push_back({y, x, cells[idx].codepoint, cells[idx].fg});
            }
        }
    }
    return updates;
}

const std::string& TerminalRenderer::compose(const std::vector<GlyphCell>& cells, const std::string& status) {
    out_buffer_.clear();
    int cursor_x = -1;
    int cursor_y = -1;

    for (int y = 0; y < rows_; ++y) {
        int x = 0;
        while (x < cols_) {
            size_t idx = static_cast<size_t>(y) * cols_ + x;
            if (idx >= cells.size()) break;

            if (!changed(cells, idx)) {
                x++;
                continue;
            }

            const GlyphCell& cell = cells[idx];
            const int target_x = x + 1;
            const int target_y = y + 1;
            if (cursor_x != target_x || cursor_y != target_y) {
                append_cursor_move(target_y, target_x);
            }

            if (color_mode_ != ColorMode::None) {
                out_buffer_ += Terminal::color_code(color_mode_, cell.fg.r, cell.fg.g, cell.fg.b, true);
            }

            int run_end = x;
            for (int rx = x + 1; rx < cols_; ++rx) {
                size_t ridx = static_cast<size_t>(y) * cols_ + rx;
                if (ridx >= cells.size() || !changed(cells, ridx)) break;
                if (color_mode_ != ColorMode::None && cells[ridx].fg != cell.fg) break;
                run_end = rx;
            }

            for (int rx = x; rx <= run_end; ++rx) {
                append_utf8(cells[static_cast<size_t>(y) * cols_ + rx].codepoint);
            }

            cursor_x = run_end + 2;
            cursor_y = target_y;
            x = run_end + 1;
        }
    }

    if (status_enabled_ && (status_dirty_ || status != prev_status_)) {
        const std::string line = fit_columns(status, cols_);
        append_cursor_move(rows_ + 1, 1);
        out_buffer_ += Terminal::RESET_COLORS;
        out_buffer_ += line;
        prev_status_ = status;
        status_dirty_ = false;
    }

    prev_buffer_ = cells;
    prev_buffer_.resize(static_cast<size_t>(cols_) * rows_);
    return out_buffer_;
}

Result TerminalRenderer::render(const std::vector<GlyphCell>& cells, const std::string& status) {
    const std::string& bytes = compose(cells, status);
    if (bytes.empty()) return Result::ok();

    Result r = term_.write(bytes);
    if (r.failure()) {
        invalidate();
    }
    return r;
}

void TerminalRenderer::append_cursor_move(int row, int col) {
    out_buffer_.push_back('\033');
    out_buffer_.push_back('[');

    char tmp[16];
    auto row_res = std::to_chars(tmp, tmp + sizeof(tmp), row);
    if (row_res.ec == std::errc()) {
        out_buffer_.append(tmp, row_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back(';');

    auto col_res = std::to_chars(tmp, tmp + sizeof(tmp), col);
    if (col_res.ec == std::errc()) {
        out_buffer_.append(tmp, col_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back('H');
}

void TerminalRenderer::append_utf8(uint32_t cp) {
    out_buffer_ += encode_utf8(cp);
}

}
