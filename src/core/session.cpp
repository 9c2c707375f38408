#include "session.hpp"
#include "render/terminal_renderer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace pepterm {

namespace {

constexpr float KEY_ROTATE_STEP = 0.1f;
constexpr float KEY_PAN_FACTOR = 0.5f;
// Near plane never exceeds this fraction of the model's diagonal.
constexpr float NEAR_CLIP_FRACTION = 0.01f;

Camera make_camera(const Model& model, const Config& config) {
    const float scale = model.scale();

    CameraPose initial;
    initial.yaw = config.view.initial_yaw;
    initial.pitch = config.view.initial_pitch;
    initial.distance = scale * config.view.distance_multiplier;

    CameraLimits limits;
    limits.min_distance = scale * config.view.min_distance_multiplier;
    limits.max_distance = scale * config.view.max_distance_multiplier;
    limits.pitch_limit = config.view.pitch_limit;

    return Camera(model.center(), initial, limits);
}

Pipeline::Config make_pipeline_config(const Model& model, const Config& config) {
    Pipeline::Config pc;
    pc.glyph_mode = config.render.glyph_mode;
    pc.char_aspect = config.render.char_aspect;
    pc.fov = config.view.fov;
    pc.near_clip = std::min(config.view.near_clip, model.scale() * NEAR_CLIP_FRACTION);
    pc.color_source = config.render.color_source;
    pc.depth_blend = config.render.depth_blend;
    pc.cell_color = config.render.cell_color;
    pc.band_rows = config.render.band_rows;
    return pc;
}

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();
}

}

std::string format_status_line(const std::string& input, GradientId scheme, bool auto_rotate,
                               double fps, int width) {
    std::ostringstream medium;
    medium << input << " | " << gradient_name(scheme) << " | "
           << (auto_rotate ? "auto" : "manual") << " | "
           << std::fixed << std::setprecision(0) << fps << "fps";
    const std::string status_medium = medium.str();
    const std::string status_full = status_medium + " | [r]otate [c]olor [0]reset [q]uit";
    const std::string status_short = input + " | " + gradient_name(scheme);

    const size_t w = width > 0 ? static_cast<size_t>(width) : 0;
    if (w > status_full.size()) return status_full;
    if (w > status_medium.size()) return status_medium;
    if (w > status_short.size()) return status_short;
    return "";
}

void print_perf_summary(const RunStats& stats) {
    if (stats.frames == 0 || stats.wall_s <= 0.0) {
        std::cerr << "[PERF] no frames processed.\n";
        return;
    }
    const double effective_fps = static_cast<double>(stats.frames) / stats.wall_s;
    const double processing_fps = static_cast<double>(stats.frames) / std::max(stats.processing_s, 1e-9);
    const double known = stats.project_s + stats.raster_s + stats.color_s + stats.pack_s + stats.present_s;
    const double misc = std::max(0.0, stats.processing_s - known);
    auto pct = [&](double seconds) -> double {
        return stats.processing_s > 0.0 ? 100.0 * seconds / stats.processing_s : 0.0;
    };

    std::cerr << std::fixed << std::setprecision(2)
              << "[PERF] frames=" << stats.frames
              << ", dropped=" << stats.dropped_frames
              << ", wall_s=" << stats.wall_s
              << ", effective_fps=" << effective_fps
              << ", processing_fps=" << processing_fps
              << "\n";
    std::cerr << std::fixed << std::setprecision(2)
              << "[PERF_STAGES] project_s=" << stats.project_s
              << ", raster_s=" << stats.raster_s
              << ", color_s=" << stats.color_s
              << ", pack_s=" << stats.pack_s
              << ", present_s=" << stats.present_s
              << ", misc_s=" << misc
              << "\n";
    std::cerr << std::fixed << std::setprecision(1)
              << "[PERF_STAGES_PCT] project=" << pct(stats.project_s) << "%"
              << ", raster=" << pct(stats.raster_s) << "%"
              << ", color=" << pct(stats.color_s) << "%"
              << ", pack=" << pct(stats.pack_s) << "%"
              << ", present=" << pct(stats.present_s) << "%"
              << ", misc=" << pct(misc) << "%"
              << "\n";
}

RenderSession::RenderSession(const Model& model, const Config& config, std::string input_label)
    : model_(model),
      config_(config),
      input_label_(std::move(input_label)),
      camera_(make_camera(model, config)),
      pipeline_(make_pipeline_config(model, config)),
      gradient_(config.color.scheme),
      auto_rotate_(config.input.auto_rotate) {}

float RenderSession::view_width() const {
    return static_cast<float>(std::max(1, pipeline_.viewport().cols));
}

void RenderSession::handle_event(const InputEvent& event) {
    switch (event.type) {
        case EventType::Quit:
            quit_ = true;
            break;
        case EventType::Resize:
            resize_pending_ = true;
            break;
        case EventType::Key:
            handle_key(event);
            break;
        case EventType::MousePress:
            pan_mode_ = event.shift;
            start_col_ = event.col;
            start_row_ = event.row;
            pointer_events_++;
            break;
        case EventType::MouseDrag: {
            pan_mode_ = event.shift;
            if (!pan_mode_) auto_rotate_ = false;
            // Velocity grows with the distance from where the drag started.
            const float delta_x = static_cast<float>(event.col - start_col_);
            const float delta_y = static_cast<float>(start_row_ - event.row);
            speed_x_ = delta_x / view_width() * config_.input.drag_speed;
            speed_y_ = delta_y / view_width() * config_.input.drag_speed;
            pointer_events_++;
            break;
        }
        case EventType::MouseRelease:
            break;
        case EventType::Scroll:
            camera_.zoom(static_cast<float>(event.scroll) * model_.scale() * config_.input.scroll_step);
            break;
    }
}

void RenderSession::handle_key(const InputEvent& event) {
    const float scale = model_.scale();
    const float pan_step = scale * config_.input.pan_speed * KEY_PAN_FACTOR;
    const float zoom_step = scale * config_.input.scroll_step;

    switch (event.key) {
        case Key::Escape:
            quit_ = true;
            return;
        case Key::Left:
            auto_rotate_ = false;
            camera_.orbit(KEY_ROTATE_STEP, 0.0f);
            return;
        case Key::Right:
            auto_rotate_ = false;
            camera_.orbit(-KEY_ROTATE_STEP, 0.0f);
            return;
        case Key::Up:
            auto_rotate_ = false;
            camera_.orbit(0.0f, -KEY_ROTATE_STEP);
            return;
        case Key::Down:
            auto_rotate_ = false;
            camera_.orbit(0.0f, KEY_ROTATE_STEP);
            return;
        case Key::None:
            return;
        case Key::Char:
            break;
    }

    switch (event.ch) {
        case 'q':
        case 'Q':
            quit_ = true;
            break;
        case 'r':
        case 'R':
            auto_rotate_ = !auto_rotate_;
            break;
        case 'c':
        case 'C':
            gradient_ = next_gradient(gradient_);
            break;
        case 'm':
        case 'M':
            pipeline_.set_glyph_mode(next_glyph_mode(pipeline_.glyph_mode()));
            break;
        case '0':
            reset_view();
            break;
        case '+':
        case '=':
            camera_.zoom(-zoom_step);
            break;
        case '-':
        case '_':
            camera_.zoom(zoom_step);
            break;
        case 'w':
        case 'W':
            camera_.pan(0.0f, pan_step);
            break;
        case 's':
        case 'S':
            camera_.pan(0.0f, -pan_step);
            break;
        case 'a':
        case 'A':
            camera_.pan(-pan_step, 0.0f);
            break;
        case 'd':
        case 'D':
            camera_.pan(pan_step, 0.0f);
            break;
        default:
            break;
    }
}

void RenderSession::reset_view() {
    camera_.reset();
    auto_rotate_ = true;
    pan_mode_ = false;
    speed_x_ = 0.0f;
    speed_y_ = 0.0f;
}

void RenderSession::advance_animation() {
    if (pointer_events_ == 0) {
        speed_x_ = 0.0f;
        speed_y_ = 0.0f;
        pan_mode_ = false;
    }
    pointer_events_ = 0;

    if (pan_mode_) {
        const float step = model_.scale() * config_.input.pan_speed;
        camera_.pan(speed_x_ * step, speed_y_ * step);
    } else if (auto_rotate_) {
        camera_.orbit(config_.input.auto_rotate_speed, 0.0f);
    } else if (speed_x_ != 0.0f || speed_y_ != 0.0f) {
        camera_.orbit(-speed_x_, -speed_y_);
    }
}

void RenderSession::resize(int term_cols, int term_rows) {
    const int status_rows = config_.render.show_status ? 1 : 0;
    pipeline_.set_grid_size(std::max(0, term_cols), std::max(0, term_rows - status_rows));
}

const Pipeline::Frame& RenderSession::render_frame() {
    return pipeline_.render(model_, camera_, gradient_);
}

std::string RenderSession::status_line(int width, double fps) const {
    return format_status_line(input_label_, gradient_, auto_rotate_, fps, width);
}

Result RenderSession::run(Terminal& terminal) {
    using clock = std::chrono::high_resolution_clock;

    InputReader reader(terminal.input_fd());
    const ColorMode color_mode = config_.color.mode ? *config_.color.mode : Terminal::detect_color_mode();
    TerminalRenderer renderer(terminal, color_mode);
    renderer.set_status_enabled(config_.render.show_status);

    Size size = terminal.get_size();
    resize(size.width, size.height);
    renderer.set_grid_size(pipeline_.viewport().cols, pipeline_.viewport().rows);

    const int target_fps = std::clamp(config_.fps, 1, 120);
    const auto frame_duration = std::chrono::duration<double>(1.0 / target_fps);

    stats_ = RunStats{};
    std::vector<InputEvent> events;
    int wait_ms = 0;
    double shown_fps = 0.0;
    bool have_prev = false;
    clock::time_point prev_start;
    const auto session_start = std::chrono::steady_clock::now();

    while (!quit_) {
        events.clear();
        Result r = reader.poll_events(wait_ms, events);
        if (r.failure()) return r;

        const auto start = clock::now();
        if (have_prev) {
            const double since = std::chrono::duration<double>(start - prev_start).count();
            if (since > 0.0) shown_fps = 1.0 / since;
        }
        prev_start = start;
        have_prev = true;

        for (const InputEvent& e : events) handle_event(e);
        if (quit_ || quit_requested()) break;

        if (take_resize_request() || resize_pending_) {
            resize_pending_ = false;
            size = terminal.get_size();
            resize(size.width, size.height);
            renderer.set_grid_size(pipeline_.viewport().cols, pipeline_.viewport().rows);
            r = terminal.clear_screen();
            if (r.failure()) return r;
        }

        advance_animation();
        const Pipeline::Frame& frame = render_frame();

        // Frame was rendered for the old grid.
        if (take_resize_request()) {
            resize_pending_ = true;
            stats_.dropped_frames++;
            wait_ms = 0;
            continue;
        }

        const auto present_start = clock::now();
        r = renderer.render(frame.cells, status_line(frame.cols, shown_fps));
        if (r.failure()) return r;
        const double present_s = seconds_since(present_start);

        const auto elapsed = clock::now() - start;
        const double elapsed_s = std::chrono::duration<double>(elapsed).count();
        const Pipeline::Timings& t = pipeline_.timings();
        stats_.processing_s += elapsed_s;
        stats_.project_s += t.project_ms / 1000.0;
        stats_.raster_s += t.raster_ms / 1000.0;
        stats_.color_s += t.color_ms / 1000.0;
        stats_.pack_s += t.pack_ms / 1000.0;
        stats_.present_s += present_s;

        if (config_.debug.profile_live) {
            const double ms = elapsed_s * 1000.0;
            std::cerr << "{\"frame\":" << stats_.frames
                      << ",\"ms\":" << ms
                      << ",\"fps\":" << (ms > 0.0 ? 1000.0 / ms : 0.0)
                      << ",\"project_ms\":" << t.project_ms
                      << ",\"raster_ms\":" << t.raster_ms
                      << ",\"color_ms\":" << t.color_ms
                      << ",\"pack_ms\":" << t.pack_ms
                      << ",\"present_ms\":" << present_s * 1000.0
                      << ",\"cells\":" << frame.occupied_cells
                      << "}\n";
        }
        stats_.frames++;

        const auto remaining = frame_duration - elapsed;
        wait_ms = remaining > std::chrono::nanoseconds(0)
            ? static_cast<int>(std::ceil(std::chrono::duration<double, std::milli>(remaining).count()))
            : 0;
    }

    stats_.wall_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - session_start).count();
    return Result::ok();
}

}
