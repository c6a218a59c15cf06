#include "shotmontage/auto_crop.h"
#include "shotmontage/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>

namespace ShotMontage {

namespace {

// Walks from index begin towards end (exclusive) and returns the first index
// whose luminance differs from the previous sample by more than threshold.
static int FindEdge(const std::vector<float>& line, int begin, int end, float threshold) {
    const int step = (end >= begin) ? 1 : -1;
    for (int i = begin + step; i != end; i += step) {
        if (std::abs(line[static_cast<size_t>(i)] - line[static_cast<size_t>(i - step)]) >
            threshold) {
            return i;
        }
    }
    return -1;
}

static int HorizontalBand(int width, int height, const AutoCropConfig& config) {
    if (height <= 0) { return 0; }
    const float aspect = static_cast<float>(width) / static_cast<float>(height);
    if (aspect <= config.wide_aspect_limit) { return 0; }
    const float framed = static_cast<float>(height) * config.reference_aspect;
    return std::max(0, static_cast<int>(std::floor((static_cast<float>(width) - framed) / 2.0f)));
}

} // namespace

CenterLineProfile SampleCenterLines(const cv::Mat& image) {
    if (image.empty()) { throw InputError("SampleCenterLines: image is empty"); }

    // Only the two centre lines are converted, never the whole frame.
    const cv::Mat row_bgr = detail::EnsureBgr(image.row(image.rows / 2));
    const cv::Mat col_bgr = detail::EnsureBgr(image.col(image.cols / 2));

    CenterLineProfile profile;
    profile.row.resize(static_cast<size_t>(image.cols));
    profile.column.resize(static_cast<size_t>(image.rows));
    for (int x = 0; x < row_bgr.cols; ++x) {
        profile.row[static_cast<size_t>(x)] = detail::Luminance(row_bgr.at<cv::Vec3b>(0, x));
    }
    for (int y = 0; y < col_bgr.rows; ++y) {
        profile.column[static_cast<size_t>(y)] = detail::Luminance(col_bgr.at<cv::Vec3b>(y, 0));
    }
    return profile;
}

std::optional<Rect> ScanCandidate(const CenterLineProfile& profile, float threshold,
                                  const AutoCropConfig& config) {
    const int width  = static_cast<int>(profile.row.size());
    const int height = static_cast<int>(profile.column.size());
    if (width < 4 || height < 4) { return std::nullopt; }

    const int band   = HorizontalBand(width, height, config);
    const int margin = std::max(0, config.edge_margin);
    const int mid_x  = width / 2;
    const int mid_y  = height / 2;

    const int left_start   = band + margin;
    const int right_start  = width - 1 - band - margin;
    const int top_start    = margin;
    const int bottom_start = std::min(
        height - 1, static_cast<int>(std::floor(config.bottom_start_ratio * height)));

    if (left_start >= mid_x || right_start <= mid_x || top_start >= mid_y ||
        bottom_start <= mid_y) {
        return std::nullopt;
    }

    const int left   = FindEdge(profile.row, left_start, mid_x, threshold);
    const int right  = FindEdge(profile.row, right_start, mid_x, threshold);
    const int top    = FindEdge(profile.column, top_start, mid_y, threshold);
    const int bottom = FindEdge(profile.column, bottom_start, mid_y, threshold);
    if (left < 0 || right < 0 || top < 0 || bottom < 0) { return std::nullopt; }
    if (right < left || bottom < top) { return std::nullopt; }

    return Rect{left, top, right - left + 1, bottom - top + 1};
}

bool IsPlausibleCrop(const Rect& candidate, int image_width, int image_height,
                     const AutoCropConfig& config) {
    if (candidate.Empty() || image_width <= 0 || image_height <= 0) { return false; }
    if (!Rect{0, 0, image_width, image_height}.Contains(candidate)) { return false; }
    if (candidate.width < config.min_width_ratio * image_width) { return false; }
    if (candidate.height < config.min_height_ratio * image_height) { return false; }

    const float aspect = static_cast<float>(candidate.width) / static_cast<float>(candidate.height);
    if (aspect > config.max_aspect) { return false; }

    const float bottom_limit = (config.bottom_start_ratio + config.bottom_tolerance) * image_height;
    if (static_cast<float>(candidate.Bottom()) > bottom_limit) { return false; }
    return true;
}

std::optional<Rect> DetectCropRect(const cv::Mat& image, const AutoCropConfig& config) {
    const CenterLineProfile profile = SampleCenterLines(image);

    for (float threshold : config.thresholds) {
        std::optional<Rect> candidate = ScanCandidate(profile, threshold, config);
        if (!candidate) {
            spdlog::debug("AutoCrop: threshold {:.1f}: no edge on some side", threshold);
            continue;
        }
        if (!IsPlausibleCrop(*candidate, image.cols, image.rows, config)) {
            spdlog::debug("AutoCrop: threshold {:.1f}: rejected ({},{} {}x{})", threshold,
                          candidate->x, candidate->y, candidate->width, candidate->height);
            continue;
        }
        spdlog::info("AutoCrop: detected crop ({},{} {}x{}) at threshold {:.1f}", candidate->x,
                     candidate->y, candidate->width, candidate->height, threshold);
        return candidate;
    }

    spdlog::info("AutoCrop: no plausible crop rectangle in {}x{} image", image.cols, image.rows);
    return std::nullopt;
}

} // namespace ShotMontage
