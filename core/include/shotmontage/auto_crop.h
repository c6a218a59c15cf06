/// \file auto_crop.h
/// \brief Crop-rectangle detection from luminance edges along the centre lines.

#pragma once

#include "geometry.h"

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// Tuning for DetectCropRect(). Defaults suit framed game screenshots.
struct AutoCropConfig {
    /// Luminance-difference thresholds, tried strictest first.
    std::vector<float> thresholds = {48.0f, 32.0f, 24.0f, 16.0f, 10.0f, 6.0f};

    int edge_margin = 2; ///< Pixels skipped at each end before scanning.

    /// Above this width/height ratio the horizontal scans skip the pillar-box
    /// band a reference_aspect frame of the same height would leave.
    float wide_aspect_limit = 2.0f;
    float reference_aspect  = 16.0f / 9.0f;

    float bottom_start_ratio = 0.95f; ///< Bottom scan starts at this fraction of height.
    float bottom_tolerance   = 0.01f; ///< Accepted bottom edge may exceed the start by this.

    float min_width_ratio  = 0.30f; ///< Minimum candidate width / image width.
    float min_height_ratio = 0.30f; ///< Minimum candidate height / image height.
    float max_aspect       = 4.0f;  ///< Maximum candidate width / height.
};

/// Luminance samples along the centre row and centre column.
struct CenterLineProfile {
    std::vector<float> row;    ///< size == image width
    std::vector<float> column; ///< size == image height
};

/// Extracts luminance (0.299R + 0.587G + 0.114B) of the centre row and column of
/// an 8-bit BGR/BGRA/gray image. Throws InputError on an empty image.
CenterLineProfile SampleCenterLines(const cv::Mat& image);

/// Runs the four edge scans at one threshold and returns the raw candidate, or
/// nullopt when any scan finds no edge. No plausibility filtering.
std::optional<Rect> ScanCandidate(const CenterLineProfile& profile, float threshold,
                                  const AutoCropConfig& config = {});

/// True when \p candidate passes the size, aspect and bottom-edge filter for an
/// image of the given size.
bool IsPlausibleCrop(const Rect& candidate, int image_width, int image_height,
                     const AutoCropConfig& config = {});

/// Detects the crop rectangle, relaxing the threshold until a plausible
/// candidate appears. Returns nullopt when no threshold succeeds.
std::optional<Rect> DetectCropRect(const cv::Mat& image, const AutoCropConfig& config = {});

} // namespace ShotMontage
