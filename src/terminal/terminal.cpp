#include "terminal.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sys/ioctl.h>

namespace pepterm {

namespace {
    const uint8_t ANSI16_PALETTE[16][3] = {
        {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
        {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
        {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
        {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
    };

    struct Color256Lookup {
        std::array<uint8_t, 256> r{};
        std::array<uint8_t, 256> g{};
        std::array<uint8_t, 256> b{};

        Color256Lookup() {
            for (int i = 0; i < 16; ++i) {
                r[i] = ANSI16_PALETTE[i][0];
                g[i] = ANSI16_PALETTE[i][1];
                b[i] = ANSI16_PALETTE[i][2];
            }

            for (int i = 16; i < 232; ++i) {
                int idx = i - 16;
                int rv = idx / 36;
                int gv = (idx % 36) / 6;
                int bv = idx % 6;
                r[i] = rv ? static_cast<uint8_t>(55 + rv * 40) : 0;
                g[i] = gv ? static_cast<uint8_t>(55 + gv * 40) : 0;
                b[i] = bv ? static_cast<uint8_t>(55 + bv * 40) : 0;
            }

            for (int i = 232; i < 256; ++i) {
                uint8_t gray = static_cast<uint8_t>(8 + (i - 232) * 10);
                r[i] = g[i] = b[i] = gray;
            }
        }
    };

    const Color256Lookup& color256_lookup() {
        static const Color256Lookup lookup;
        return lookup;
    }

    Result write_all(int fd, const char* data, size_t size) {
        size_t written = 0;
        while (written < size) {
            ssize_t n = ::write(fd, data + written, size - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Result::fail(ErrorCode::DEVICE_ERROR,
                                    std::string("Terminal write failed: ") + std::strerror(errno));
            }
            if (n == 0) {
                return Result::fail(ErrorCode::DEVICE_ERROR, "Terminal write returned no progress");
            }
            written += static_cast<size_t>(n);
        }
        return Result::ok();
    }

    Result write_all(int fd, const std::string& s) {
        return write_all(fd, s.data(), s.size());
    }
}

Terminal::Terminal(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

Terminal::~Terminal() {
    if (!interactive() && !mouse_enabled_ && !cursor_hidden_) return;
    Result r = restore();
    if (r.failure()) {
        std::cerr << "Warning: " << r.message << "\n";
    }
}

TerminalInfo Terminal::get_info() const {
    TerminalInfo info;

    winsize ws;
    if (ioctl(out_fd_, TIOCGWINSZ, &ws) == 0) {
        info.cols = ws.ws_col;
        info.rows = ws.ws_row;
    }

    if (info.cols <= 0) info.cols = 80;
    if (info.rows <= 0) info.rows = 24;

    info.color_mode = detect_color_mode();
    info.is_tty = isatty(in_fd_) == 1 && isatty(out_fd_) == 1;
    return info;
}

Size Terminal::get_size() const {
    TerminalInfo info = get_info();
    return {info.cols, info.rows};
}

ColorMode Terminal::detect_color_mode() {
    const char* colorterm = std::getenv("COLORTERM");
    if (colorterm) {
        std::string ct(colorterm);
        if (ct == "truecolor" || ct == "24bit") {
            return ColorMode::Truecolor;
        }
    }

    const char* term = std::getenv("TERM");
    if (term) {
        std::string t(term);
        if (t.find("256color") != std::string::npos) {
            return ColorMode::Ansi256;
        }
    }

    return ColorMode::Ansi16;
}

Result Terminal::enter_interactive(bool mouse) {
    if (isatty(in_fd_) != 1) {
        return Result::fail(ErrorCode::DEVICE_ERROR, "Input is not a terminal");
    }

    if (!raw_mode_) {
        if (tcgetattr(in_fd_, &original_termios_) != 0) {
            return Result::fail(ErrorCode::DEVICE_ERROR,
                                std::string("tcgetattr failed: ") + std::strerror(errno));
        }
        termios raw = original_termios_;
        raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
        raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
        raw.c_cflag |= CS8;
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(in_fd_, TCSAFLUSH, &raw) != 0) {
            return Result::fail(ErrorCode::DEVICE_ERROR,
                                std::string("tcsetattr failed: ") + std::strerror(errno));
        }
        raw_mode_ = true;
    }

    std::string seq;
    if (!in_alt_screen_) seq += ALT_SCREEN_ON;
    if (!cursor_hidden_) seq += CURSOR_HIDE;
    if (mouse && !mouse_enabled_) seq += MOUSE_ON;
    seq += CLEAR;

    Result r = write_all(out_fd_, seq);
    if (r.failure()) return r;

    in_alt_screen_ = true;
    cursor_hidden_ = true;
    mouse_enabled_ = mouse_enabled_ || mouse;
    return Result::ok();
}

Result Terminal::restore() {
    std::string seq;
    if (mouse_enabled_) seq += MOUSE_OFF;
    seq += RESET_COLORS;
    if (cursor_hidden_) seq += CURSOR_SHOW;
    if (in_alt_screen_) seq += ALT_SCREEN_OFF;

    Result first = write_all(out_fd_, seq);
    mouse_enabled_ = false;
    cursor_hidden_ = false;
    in_alt_screen_ = false;

    if (raw_mode_) {
        if (tcsetattr(in_fd_, TCSAFLUSH, &original_termios_) != 0 && first.success()) {
            first = Result::fail(ErrorCode::DEVICE_ERROR,
                                 std::string("Failed to restore terminal mode: ") + std::strerror(errno));
        }
        raw_mode_ = false;
    }
    return first;
}

Result Terminal::clear_screen() {
    return write_all(out_fd_, CLEAR);
}

Result Terminal::write(const std::string& s) {
    return write_all(out_fd_, s);
}

std::string Terminal::color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg) {
    char buf[32];
    switch (mode) {
        case ColorMode::None:
            return "";
        case ColorMode::Ansi16: {
            int idx = rgb_to_16(r, g, b);
            int base;
            int color_idx;
            if (idx < 8) {
                base = fg ? 30 : 40;
                color_idx = idx;
            } else {
                base = fg ? 90 : 100;
                color_idx = idx - 8;
            }
            snprintf(buf, sizeof(buf), "\033[%dm", base + color_idx);
            return buf;
        }
        case ColorMode::Ansi256: {
            int idx = rgb_to_256(r, g, b);
            snprintf(buf, sizeof(buf), fg ? "\033[38;5;%dm" : "\033[48;5;%dm", idx);
            return buf;
        }
        case ColorMode::Truecolor:
            snprintf(buf, sizeof(buf), fg ? "\033[38;2;%d;%d;%dm" : "\033[48;2;%d;%d;%dm", r, g, b);
            return buf;
    }
    return "";
}

uint8_t Terminal::rgb_to_256(uint8_t r, uint8_t g, uint8_t b) {
    const Color256Lookup& lookup = color256_lookup();
    uint8_t best_idx = 0;
    uint32_t best_dist = UINT32_MAX;

    // Palette entries 0..15 are user-configurable; match against the fixed cube and ramp.
    for (int i = 16; i < 256; ++i) {
        int dr = r - lookup.r[i];
        int dg = g - lookup.g[i];
        int db = b - lookup.b[i];
        uint32_t dist = static_cast<uint32_t>(dr * dr + dg * dg + db * db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

uint8_t Terminal::rgb_to_16(uint8_t r, uint8_t g, uint8_t b) {
    uint8_t best_idx = 0;
    uint32_t best_dist = UINT32_MAX;

    for (int i = 0; i < 16; ++i) {
        int dr = r - ANSI16_PALETTE[i][0];
        int dg = g - ANSI16_PALETTE[i][1];
        int db = b - ANSI16_PALETTE[i][2];
        uint32_t dist = static_cast<uint32_t>(dr * dr + dg * dg + db * db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

}
