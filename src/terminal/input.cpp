#include "input.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace pepterm {

namespace {

constexpr char ESC = '\033';
constexpr char CTRL_C = 0x03;
// Longest control sequence kept while waiting for its final byte.
constexpr size_t MAX_SEQUENCE = 64;
constexpr int ESCAPE_WAIT_MS = 25;
constexpr int ESCAPE_WAIT_ATTEMPTS = 4;

volatile std::sig_atomic_t g_quit = 0;
volatile std::sig_atomic_t g_resize = 0;

void on_quit_signal(int) { g_quit = 1; }
void on_resize_signal(int) { g_resize = 1; }

std::optional<Key> arrow_for(char final_byte) {
    switch (final_byte) {
        case 'A': return Key::Up;
        case 'B': return Key::Down;
        case 'C': return Key::Right;
        case 'D': return Key::Left;
        default: return std::nullopt;
    }
}

bool parse_sgr_fields(const std::string& s, size_t begin, size_t end, int out[3]) {
    int field = 0;
    int value = 0;
    bool have_digit = false;
    for (size_t i = begin; i < end; ++i) {
        char c = s[i];
        if (c >= '0' && c <= '9') {
            if (value > 100000) return false;
            value = value * 10 + (c - '0');
            have_digit = true;
        } else if (c == ';') {
            if (!have_digit || field >= 2) return false;
            out[field++] = value;
            value = 0;
            have_digit = false;
        } else {
            return false;
        }
    }
    if (!have_digit || field != 2) return false;
    out[2] = value;
    return true;
}

}

void InputParser::feed(const char* data, size_t size) {
    buffer_.append(data, size);
}

std::optional<InputEvent> InputParser::parse_csi(size_t& consumed, bool& complete) {
    complete = false;
    consumed = 0;
    if (buffer_.size() < 3) return std::nullopt;

    if (buffer_[2] == '<') {
        size_t end = 3;
        while (end < buffer_.size() && buffer_[end] != 'M' && buffer_[end] != 'm') {
            char c = buffer_[end];
            if (!((c >= '0' && c <= '9') || c == ';')) break;
            ++end;
        }
        if (end >= buffer_.size()) {
            if (buffer_.size() > MAX_SEQUENCE) {
                complete = true;
                consumed = buffer_.size();
            }
            return std::nullopt;
        }

        complete = true;
        consumed = end + 1;
        const char final_byte = buffer_[end];
        int fields[3] = {0, 0, 0};
        if ((final_byte != 'M' && final_byte != 'm') || !parse_sgr_fields(buffer_, 3, end, fields)) {
            return std::nullopt;
        }

        const int b = fields[0];
        const int col = fields[1] - 1;
        const int row = fields[2] - 1;
        const bool shift = (b & 4) != 0;
        const int button = b & 3;

        if (b & 64) {
            if (final_byte != 'M') return std::nullopt;
            return InputEvent::wheel((b & 1) ? 1 : -1, col, row);
        }
        if (final_byte == 'm') {
            return InputEvent::mouse(EventType::MouseRelease, col, row, button, shift);
        }
        if (b & 32) {
            if (button == 3) return std::nullopt;
            return InputEvent::mouse(EventType::MouseDrag, col, row, button, shift);
        }
        return InputEvent::mouse(EventType::MousePress, col, row, button, shift);
    }

    for (size_t i = 2; i < buffer_.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(buffer_[i]);
        if (c >= 0x40 && c <= 0x7E) {
            complete = true;
            consumed = i + 1;
            if (auto key = arrow_for(static_cast<char>(c))) {
                return InputEvent::special(*key);
            }
            return std::nullopt;
        }
    }
    if (buffer_.size() > MAX_SEQUENCE) {
        complete = true;
        consumed = buffer_.size();
    }
    return std::nullopt;
}

std::optional<InputEvent> InputParser::next() {
    while (!buffer_.empty()) {
        const char c = buffer_[0];

        if (c == CTRL_C) {
            buffer_.erase(0, 1);
            return InputEvent::of(EventType::Quit);
        }

        if (c == ESC) {
            if (buffer_.size() < 2) return std::nullopt;
            const char c1 = buffer_[1];
            if (c1 == '[') {
                size_t consumed = 0;
                bool complete = false;
                auto event = parse_csi(consumed, complete);
                if (!complete) return std::nullopt;
                buffer_.erase(0, consumed);
                if (event) return event;
                continue;
            }
            if (c1 == 'O') {
                if (buffer_.size() < 3) return std::nullopt;
                const char c2 = buffer_[2];
                buffer_.erase(0, 3);
                if (auto key = arrow_for(c2)) return InputEvent::special(*key);
                continue;
            }
            buffer_.erase(0, 1);
            return InputEvent::special(Key::Escape);
        }

        buffer_.erase(0, 1);
        if (static_cast<unsigned char>(c) >= 0x80) continue;
        return InputEvent::character(c);
    }
    return std::nullopt;
}

bool InputParser::awaiting_escape() const {
    return buffer_.size() == 1 && buffer_[0] == ESC;
}

std::optional<InputEvent> InputParser::flush_pending() {
    if (awaiting_escape()) {
        buffer_.clear();
        return InputEvent::special(Key::Escape);
    }
    return std::nullopt;
}

Result InputReader::wait_readable(int timeout_ms, bool& ready) {
    ready = false;
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) return Result::ok();
        return Result::fail(ErrorCode::DEVICE_ERROR, std::string("poll failed: ") + std::strerror(errno));
    }
    if (rc == 0) return Result::ok();
    if (pfd.revents & POLLNVAL) {
        return Result::fail(ErrorCode::DEVICE_ERROR, "Input descriptor is not open");
    }
    ready = true;
    return Result::ok();
}

Result InputReader::read_available(std::vector<InputEvent>& events, bool& closed) {
    closed = false;
    char buf[256];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return Result::ok();
        return Result::fail(ErrorCode::DEVICE_ERROR, std::string("read failed: ") + std::strerror(errno));
    }
    if (n == 0) {
        closed = true;
        events.push_back(InputEvent::of(EventType::Quit));
        return Result::ok();
    }

    parser_.feed(buf, static_cast<size_t>(n));
    while (auto e = parser_.next()) {
        events.push_back(*e);
    }
    return Result::ok();
}

Result InputReader::poll_events(int timeout_ms, std::vector<InputEvent>& events) {
    bool ready = false;
    Result r = wait_readable(timeout_ms, ready);
    if (r.failure()) return r;
    if (!ready) {
        if (auto e = parser_.flush_pending()) events.push_back(*e);
        return Result::ok();
    }

    bool closed = false;
    r = read_available(events, closed);
    if (r.failure() || closed) return r;

    // A read that ends on ESC may have split a control sequence; give the
    // continuation bytes a short window before treating it as the Escape key.
    for (int attempt = 0; attempt < ESCAPE_WAIT_ATTEMPTS && parser_.awaiting_escape(); ++attempt) {
        r = wait_readable(ESCAPE_WAIT_MS, ready);
        if (r.failure()) return r;
        if (!ready) break;
        r = read_available(events, closed);
        if (r.failure() || closed) return r;
    }
    if (auto e = parser_.flush_pending()) events.push_back(*e);
    return Result::ok();
}

Result install_signal_handlers() {
    struct sigaction quit_action{};
    quit_action.sa_handler = on_quit_signal;
    sigemptyset(&quit_action.sa_mask);

    struct sigaction resize_action{};
    resize_action.sa_handler = on_resize_signal;
    sigemptyset(&resize_action.sa_mask);

    if (sigaction(SIGINT, &quit_action, nullptr) != 0 ||
        sigaction(SIGTERM, &quit_action, nullptr) != 0 ||
        sigaction(SIGHUP, &quit_action, nullptr) != 0 ||
        sigaction(SIGWINCH, &resize_action, nullptr) != 0) {
        return Result::fail(ErrorCode::DEVICE_ERROR,
                            std::string("Failed to install signal handlers: ") + std::strerror(errno));
    }
    return Result::ok();
}

bool quit_requested() {
    return g_quit != 0;
}

bool take_resize_request() {
    if (g_resize == 0) return false;
    g_resize = 0;
    return true;
}

}
