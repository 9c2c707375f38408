#include "snapshot.hpp"
#include "render/terminal_renderer.hpp"
#include <cctype>
#include <fstream>
#include <vector>

#ifdef PEPTERM_USE_OPENCV
#include <opencv2/opencv.hpp>
#endif

namespace pepterm {

static bool has_extension(const std::string& path, const std::string& ext) {
    if (path.size() < ext.size()) return false;
    std::string tail = path.substr(path.size() - ext.size());
    for (char& c : tail) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tail == ext;
}

std::optional<SnapshotFormat> snapshot_format(const std::string& path) {
    if (has_extension(path, ".png")) return SnapshotFormat::Png;
    if (has_extension(path, ".txt")) return SnapshotFormat::Text;
    return std::nullopt;
}

Result write_text_snapshot(const std::string& path, const Pipeline::Frame& frame) {
    std::ofstream out(path);
    if (!out) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open snapshot file: " + path);
    }

    for (int y = 0; y < frame.rows; ++y) {
        for (int x = 0; x < frame.cols; ++x) {
            const size_t idx = static_cast<size_t>(y) * frame.cols + x;
            if (idx < frame.cells.size()) {
                out << encode_utf8(frame.cells[idx].codepoint);
            }
        }
        out << '\n';
    }

    if (!out) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Failed to write snapshot: " + path);
    }
    return Result::ok();
}

#ifdef PEPTERM_USE_OPENCV

Result write_png_snapshot(const std::string& path, const Pipeline& pipeline,
                          GradientId gradient, int pixel_scale) {
    const SubcellBuffer& subcells = pipeline.subcells();
    if (subcells.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Snapshot grid is empty");
    }

    std::vector<Rgb> colors;
    pipeline.subcell_colors(gradient, colors);

    cv::Mat image(subcells.height(), subcells.width(), CV_8UC3, cv::Scalar(0, 0, 0));
    for (int y = 0; y < subcells.height(); ++y) {
        cv::Vec3b* row = image.ptr<cv::Vec3b>(y);
        for (int x = 0; x < subcells.width(); ++x) {
            const Rgb& c = colors[static_cast<size_t>(y) * subcells.width() + x];
            row[x] = cv::Vec3b(c.b, c.g, c.r);
        }
    }

    cv::Mat scaled;
    const int scale = std::max(1, pixel_scale);
    cv::resize(image, scaled, cv::Size(image.cols * scale, image.rows * scale), 0, 0, cv::INTER_NEAREST);

    try {
        if (!cv::imwrite(path, scaled)) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "Failed to write snapshot: " + path);
        }
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, std::string("Failed to write snapshot: ") + e.what());
    }
    return Result::ok();
}

#else

Result write_png_snapshot(const std::string& path, const Pipeline&, GradientId, int) {
    return Result::fail(ErrorCode::INVALID_ARGUMENT,
                        "PNG snapshots need OpenCV; rebuild with OpenCV or use .txt: " + path);
}

#endif

Result save_snapshot(const std::string& path, const Pipeline& pipeline, GradientId gradient) {
    auto format = snapshot_format(path);
    if (!format) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Snapshot file must end in .png or .txt: " + path);
    }
    if (*format == SnapshotFormat::Text) {
        return write_text_snapshot(path, pipeline.frame());
    }
    return write_png_snapshot(path, pipeline, gradient);
}

}
