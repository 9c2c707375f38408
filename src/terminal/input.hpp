#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pepterm {

enum class EventType {
    Key,
    MousePress,
    MouseDrag,
    MouseRelease,
    Scroll,
    Resize,
    Quit
};

enum class Key {
    None,
    Char,
    Up,
    Down,
    Left,
    Right,
    Escape
};

struct InputEvent {
    EventType type = EventType::Key;
    Key key = Key::None;
    char ch = 0;
    int col = 0;
    int row = 0;
    int button = 0;
    bool shift = false;
    // -1 wheel up, +1 wheel down.
    int scroll = 0;

    static InputEvent character(char c) {
        InputEvent e;
        e.type = EventType::Key;
        e.key = Key::Char;
        e.ch = c;
        return e;
    }
    static InputEvent special(Key k) {
        InputEvent e;
        e.type = EventType::Key;
        e.key = k;
        return e;
    }
    static InputEvent mouse(EventType type, int col, int row, int button, bool shift) {
        InputEvent e;
        e.type = type;
        e.col = col;
        e.row = row;
        e.button = button;
        e.shift = shift;
        return e;
    }
    static InputEvent wheel(int direction, int col, int row) {
        InputEvent e;
        e.type = EventType::Scroll;
        e.scroll = direction;
        e.col = col;
        e.row = row;
        return e;
    }
    static InputEvent of(EventType type) {
        InputEvent e;
        e.type = type;
        return e;
    }
};

// Incremental decoder for raw terminal input: printable keys, arrow keys,
// Ctrl-C and SGR (1006) mouse reports.
class InputParser {
public:
    void feed(const char* data, size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Next complete event, or nullopt when the buffer holds only a partial sequence.
    std::optional<InputEvent> next();

    // Resolves a pending lone ESC into an Escape key once no more input follows.
    std::optional<InputEvent> flush_pending();

    // True when the buffer holds only an ESC that may still start a sequence.
    bool awaiting_escape() const;

    size_t pending() const { return buffer_.size(); }

private:
    std::string buffer_;

    std::optional<InputEvent> parse_csi(size_t& consumed, bool& complete);
};

// Bounded-wait reader over a file descriptor.
class InputReader {
public:
    explicit InputReader(int fd) : fd_(fd) {}

    // Waits up to timeout_ms for input and appends decoded events. A closed
    // input stream yields a Quit event.
    Result poll_events(int timeout_ms, std::vector<InputEvent>& events);

private:
    int fd_;
    InputParser parser_;

    Result wait_readable(int timeout_ms, bool& ready);
    Result read_available(std::vector<InputEvent>& events, bool& closed);
};

// Process signal bridge: SIGINT/SIGTERM/SIGHUP request quit, SIGWINCH requests resize.
Result install_signal_handlers();
bool quit_requested();
bool take_resize_request();

}
