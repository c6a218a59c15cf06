/// \file bitmap.h
/// \brief Image sources and the closable decoded bitmap.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// One input image: either a file path or encoded bytes (bytes take priority).
struct ImageSource {
    std::string path;            ///< File to read (ignored if buffer is non-empty).
    std::vector<uint8_t> buffer; ///< Encoded PNG/JPEG bytes.
    std::string name;            ///< Display name for logs.

    static ImageSource FromPath(const std::string& path);
    static ImageSource FromBuffer(std::vector<uint8_t> bytes, const std::string& name = "");

    /// Name for logs: name, else path, else "(buffer)".
    std::string Label() const;
};

/// Decoded 8-bit BGR pixels with exclusive ownership. Close() drops the pixel
/// memory immediately; the destructor closes as well.
class Bitmap {
public:
    Bitmap() = default;
    explicit Bitmap(cv::Mat pixels);
    ~Bitmap() { Close(); }

    Bitmap(const Bitmap&)            = delete;
    Bitmap& operator=(const Bitmap&) = delete;
    Bitmap(Bitmap&& other) noexcept;
    Bitmap& operator=(Bitmap&& other) noexcept;

    int width() const { return pixels_.cols; }
    int height() const { return pixels_.rows; }
    bool closed() const { return pixels_.empty(); }

    /// Read-only pixel access. Throws InputError once closed.
    const cv::Mat& pixels() const;

    void Close() noexcept;

private:
    cv::Mat pixels_;
};

/// Decodes a source into a Bitmap. The primary path decodes as 8-bit colour;
/// when that yields nothing, the fallback decodes unchanged (any depth, any
/// channel count) and normalises to 8-bit BGR. Throws IOError when a path
/// cannot be read and DecodeError when both decode paths fail.
Bitmap DecodeBitmap(const ImageSource& source);

} // namespace ShotMontage
