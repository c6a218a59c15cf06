#include "shotmontage/surface.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>

#include <string>
#include <utility>

namespace ShotMontage {

Surface::Surface(std::string name) : name_(std::move(name)) {}

void Surface::Resize(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw SurfaceError("Surface '" + name_ + "': invalid size " + std::to_string(width) +
                           "x" + std::to_string(height));
    }
    if (pixels_.cols == width && pixels_.rows == height && pixels_.type() == CV_8UC3) {
        return;
    }
    try {
        pixels_.create(height, width, CV_8UC3);
    } catch (const cv::Exception& e) {
        pixels_.release();
        throw SurfaceError("Surface '" + name_ + "': cannot allocate " + std::to_string(width) +
                           "x" + std::to_string(height) + ": " + e.what());
    }
    spdlog::debug("Surface '{}': resized to {}x{}", name_, width, height);
}

void Surface::Shrink() noexcept {
    if (pixels_.empty()) { return; }
    pixels_.release();
    spdlog::debug("Surface '{}': released", name_);
}

cv::Mat& Surface::Context() {
    if (pixels_.empty()) {
        throw SurfaceError("Surface '" + name_ + "': no drawing context (not allocated)");
    }
    return pixels_;
}

void Surface::Fill(const Color& color) { Context().setTo(color.ToBgrScalar()); }

void Surface::FillRect(const Rect& rect, const Color& color) {
    cv::Mat& ctx       = Context();
    const Rect clipped = rect.Intersect(Rect{0, 0, ctx.cols, ctx.rows});
    if (clipped.Empty()) { return; }
    ctx(clipped.ToCv()).setTo(color.ToBgrScalar());
}

void Surface::DrawRegion(const cv::Mat& src, const Rect& region, int dst_x, int dst_y) {
    cv::Mat& ctx = Context();
    if (src.empty()) { return; }

    // Clip against the source, then shift the destination by the same amount.
    const Rect src_clip = region.Intersect(Rect{0, 0, src.cols, src.rows});
    if (src_clip.Empty()) { return; }
    const int dx = src_clip.x - region.x;
    const int dy = src_clip.y - region.y;

    const Rect dst{dst_x + dx, dst_y + dy, src_clip.width, src_clip.height};
    const Rect dst_clip = dst.Intersect(Rect{0, 0, ctx.cols, ctx.rows});
    if (dst_clip.Empty()) { return; }

    const Rect from{src_clip.x + (dst_clip.x - dst.x), src_clip.y + (dst_clip.y - dst.y),
                    dst_clip.width, dst_clip.height};
    src(from.ToCv()).copyTo(ctx(dst_clip.ToCv()));
}

void Surface::Blit(const Surface& other, int dst_x, int dst_y) {
    if (other.pixels_.empty()) {
        throw SurfaceError("Surface '" + other.name_ + "': no drawing context (not allocated)");
    }
    DrawRegion(other.pixels_, Rect{0, 0, other.width(), other.height()}, dst_x, dst_y);
}

} // namespace ShotMontage
