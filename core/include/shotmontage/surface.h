/// \file surface.h
/// \brief Reusable raster surface with explicit footprint control.

#pragma once

#include "color.h"
#include "geometry.h"

#include <cstddef>
#include <string>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// An 8-bit BGR drawing surface. The buffer is (re)allocated by Resize() and
/// released by Shrink(); all drawing goes through Context(), which fails with
/// SurfaceError when no buffer is available.
class Surface {
public:
    explicit Surface(std::string name);

    Surface(const Surface&)            = delete;
    Surface& operator=(const Surface&) = delete;

    /// Resizes to width x height. Contents are undefined afterwards unless the
    /// size did not change. Throws SurfaceError on invalid size or allocation failure.
    void Resize(int width, int height);

    /// Releases the pixel buffer. Safe to call repeatedly.
    void Shrink() noexcept;

    /// Writable drawing context. Throws SurfaceError if the surface has no buffer.
    cv::Mat& Context();

    /// Fills the whole surface.
    void Fill(const Color& color);

    /// Fills \p rect clipped to the surface bounds.
    void FillRect(const Rect& rect, const Color& color);

    /// Copies \p region of \p src to (dst_x, dst_y). Both sides are clipped.
    void DrawRegion(const cv::Mat& src, const Rect& region, int dst_x, int dst_y);

    /// Copies the whole of \p other onto this surface at (dst_x, dst_y).
    void Blit(const Surface& other, int dst_x, int dst_y);

    int width() const { return pixels_.cols; }
    int height() const { return pixels_.rows; }

    /// Bytes currently held by the pixel buffer (0 after Shrink()).
    size_t Footprint() const { return pixels_.empty() ? 0 : pixels_.total() * pixels_.elemSize(); }

    /// Read-only view of the pixels (may be empty).
    const cv::Mat& pixels() const { return pixels_; }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    cv::Mat pixels_;
};

} // namespace ShotMontage
