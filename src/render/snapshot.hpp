#pragma once

#include "core/types.hpp"
#include "core/pipeline.hpp"
#include "mapping/gradient.hpp"
#include <optional>
#include <string>

namespace pepterm {

enum class SnapshotFormat {
    Png,
    Text
};

// Chosen from the file extension (.png or .txt, case-insensitive).
std::optional<SnapshotFormat> snapshot_format(const std::string& path);

// One line of UTF-8 glyphs per grid row.
Result write_text_snapshot(const std::string& path, const Pipeline::Frame& frame);

// Sub-cell colors of the last rendered frame, one block of `pixel_scale`
// pixels per sub-cell on a black background. Needs OpenCV.
Result write_png_snapshot(const std::string& path, const Pipeline& pipeline,
                          GradientId gradient, int pixel_scale = 4);

Result save_snapshot(const std::string& path, const Pipeline& pipeline, GradientId gradient);

}
