#pragma once

#include "core/config.hpp"
#include "core/pipeline.hpp"
#include "scene/camera.hpp"
#include "scene/model.hpp"
#include "terminal/input.hpp"
#include "terminal/terminal.hpp"
#include <string>

namespace pepterm {

// Builds the status bar, falling back to shorter forms on narrow terminals.
// Returns an empty string when even the shortest form does not fit.
std::string format_status_line(const std::string& input, GradientId scheme, bool auto_rotate,
                               double fps, int width);

struct RunStats {
    int frames = 0;
    int dropped_frames = 0;
    double wall_s = 0.0;
    double processing_s = 0.0;
    double project_s = 0.0;
    double raster_s = 0.0;
    double color_s = 0.0;
    double pack_s = 0.0;
    double present_s = 0.0;
};

// Writes the [PERF] summary lines to stderr.
void print_perf_summary(const RunStats& stats);

// Interactive viewing state for one model: camera, drag tracking, color
// scheme and the frame loop that ties input to the terminal.
class RenderSession {
public:
    RenderSession(const Model& model, const Config& config, std::string input_label);

    // Applies one decoded input event. Drag velocity is consumed by the next
    // advance_animation() call.
    void handle_event(const InputEvent& event);

    // Per-frame camera update: pan or manual orbit from the current drag, or
    // one auto-rotation step. A frame without pointer events stops the drag.
    void advance_animation();

    // Sets the glyph grid from a terminal size, reserving a row for the status bar.
    void resize(int term_cols, int term_rows);

    const Pipeline::Frame& render_frame();

    std::string status_line(int width, double fps) const;

    Result run(Terminal& terminal);

    const Camera& camera() const { return camera_; }
    const Pipeline& pipeline() const { return pipeline_; }
    GradientId gradient() const { return gradient_; }
    GlyphMode glyph_mode() const { return pipeline_.glyph_mode(); }
    bool auto_rotate() const { return auto_rotate_; }
    bool pan_mode() const { return pan_mode_; }
    bool quit() const { return quit_; }
    const RunStats& run_stats() const { return stats_; }

private:
    const Model& model_;
    Config config_;
    std::string input_label_;
    Camera camera_;
    Pipeline pipeline_;
    GradientId gradient_;

    bool auto_rotate_;
    bool pan_mode_ = false;
    bool quit_ = false;
    bool resize_pending_ = false;

    int start_col_ = 0;
    int start_row_ = 0;
    float speed_x_ = 0.0f;
    float speed_y_ = 0.0f;
    int pointer_events_ = 0;
    RunStats stats_;

    void handle_key(const InputEvent& event);
    void reset_view();
    float view_width() const;
};

}
