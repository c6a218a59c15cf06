/// \file detail/cv_utils.h
/// \brief Internal OpenCV utility functions shared across core modules.

#pragma once

#include "shotmontage/error.h"

#include <opencv2/imgproc.hpp>

#include <string>

namespace ShotMontage::detail {

/// Ensure the input image is in BGR CV_8U format.
/// Handles BGRA (4-channel), grayscale (1-channel), and BGR (3-channel) inputs.
/// Converts higher bit-depth images (e.g. 16-bit PNG) to 8-bit.
/// Returns an empty Mat if input is empty.
inline cv::Mat EnsureBgr(const cv::Mat& src) {
    if (src.empty()) { return cv::Mat(); }

    cv::Mat img = src;
    if (img.depth() != CV_8U) {
        double scale = (img.depth() == CV_16U || img.depth() == CV_16S) ? 1.0 / 256.0 : 1.0;
        if (img.depth() == CV_32F || img.depth() == CV_64F) { scale = 255.0; }
        img.convertTo(img, CV_8U, scale);
    }

    if (img.channels() == 3) { return img; }
    if (img.channels() == 4) {
        cv::Mat bgr;
        cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
        return bgr;
    }
    if (img.channels() == 1) {
        cv::Mat bgr;
        cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
        return bgr;
    }
    throw InputError("Unsupported image channel count: " + std::to_string(img.channels()));
}

/// Rec.601 luma of one 8-bit BGR pixel.
inline float Luminance(const cv::Vec3b& bgr) {
    return 0.299f * bgr[2] + 0.587f * bgr[1] + 0.114f * bgr[0];
}

} // namespace ShotMontage::detail
