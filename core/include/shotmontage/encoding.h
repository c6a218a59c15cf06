/// \file encoding.h
/// \brief Montage encoding and output naming.

#pragma once

#include "common.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// Encodes an OpenCV image to PNG format.
/// \param image Input image (BGR or grayscale)
/// \return PNG-encoded image data
std::vector<uint8_t> EncodePng(const cv::Mat& image);

/// Encodes an OpenCV image to JPEG format.
/// \param image Input image (BGR or grayscale)
/// \param quality JPEG quality [1,100]
/// \return JPEG-encoded image data
std::vector<uint8_t> EncodeJpeg(const cv::Mat& image, int quality = 95);

/// Encodes an OpenCV image to WebP format.
/// \param image Input image (BGR or grayscale)
/// \param quality WebP quality [1,100]
/// \return WebP-encoded image data
std::vector<uint8_t> EncodeWebp(const cv::Mat& image, int quality = 80);

/// Encodes \p image in \p format (quality ignored for PNG).
std::vector<uint8_t> EncodeImage(const cv::Mat& image, OutputFormat format, int quality);

/// Encodes on a worker thread while the caller waits with a timeout.
///
/// A worker left running by a timeout keeps its own reference to the pixels. It
/// is joined before the next Encode() starts and when the encoder is destroyed.
class BackgroundEncoder {
public:
    BackgroundEncoder() = default;
    ~BackgroundEncoder();

    BackgroundEncoder(const BackgroundEncoder&)            = delete;
    BackgroundEncoder& operator=(const BackgroundEncoder&) = delete;

    /// Encodes \p image in \p format, waiting at most \p timeout. Throws
    /// InputError for an empty image, EncodeError on codec failure or when the
    /// timeout expires.
    std::vector<uint8_t> Encode(const cv::Mat& image, OutputFormat format, int quality,
                                std::chrono::milliseconds timeout);

    /// Blocks until a worker abandoned by a timeout has finished.
    void Join();

    /// True while a worker is attached, i.e. after a timeout and before Join().
    bool busy() const { return worker_.joinable(); }

private:
    std::thread worker_;
};

/// Suggested download name: "montage_YYYYMMDD_HHMMSS.<ext>" in local time.
std::string SuggestedFilename(OutputFormat format,
                              std::chrono::system_clock::time_point when =
                                  std::chrono::system_clock::now());

/// Writes \p data to \p path. Throws IOError on failure.
void WriteBlob(const std::vector<uint8_t>& data, const std::string& path);

} // namespace ShotMontage
