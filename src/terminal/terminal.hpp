#pragma once

#include "core/types.hpp"
#include <string>
#include <termios.h>
#include <unistd.h>

namespace pepterm {

enum class ColorMode {
    None,
    Ansi16,
    Ansi256,
    Truecolor
};

struct TerminalInfo {
    int cols = 80;
    int rows = 24;
    ColorMode color_mode = ColorMode::Truecolor;
    bool is_tty = false;
};

// Owns the controlling terminal for an interactive session. Raw mode, the
// alternate screen, the hidden cursor and mouse reporting are acquired by
// enter_interactive() and released by restore() or the destructor.
class Terminal {
public:
    explicit Terminal(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    TerminalInfo get_info() const;
    Size get_size() const;
    static ColorMode detect_color_mode();

    Result enter_interactive(bool mouse);
    Result restore();
    bool interactive() const { return raw_mode_ || in_alt_screen_; }

    Result clear_screen();
    Result write(const std::string& s);

    int input_fd() const { return in_fd_; }
    int output_fd() const { return out_fd_; }

    static std::string color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg);
    static uint8_t rgb_to_256(uint8_t r, uint8_t g, uint8_t b);
    static uint8_t rgb_to_16(uint8_t r, uint8_t g, uint8_t b);

    static constexpr const char* ALT_SCREEN_ON = "\033[?1049h";
    static constexpr const char* ALT_SCREEN_OFF = "\033[?1049l";
    static constexpr const char* CURSOR_HIDE = "\033[?25l";
    static constexpr const char* CURSOR_SHOW = "\033[?25h";
    // Button events, drag motion, SGR extended coordinates.
    static constexpr const char* MOUSE_ON = "\033[?1000h\033[?1002h\033[?1006h";
    static constexpr const char* MOUSE_OFF = "\033[?1006l\033[?1002l\033[?1000l";
    static constexpr const char* CLEAR = "\033[2J\033[H";
    static constexpr const char* RESET_COLORS = "\033[0m";

private:
    int in_fd_;
    int out_fd_;
    termios original_termios_{};
    bool raw_mode_ = false;
    bool in_alt_screen_ = false;
    bool cursor_hidden_ = false;
    bool mouse_enabled_ = false;
};

}
