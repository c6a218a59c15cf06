/// \file geometry.h
/// \brief Pixel and ratio rectangles shared by detection and compositing.

#pragma once

#include <algorithm>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// Axis-aligned pixel rectangle. Width and height are never negative.
struct Rect {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    int Right() const { return x + width; }   ///< Exclusive right edge.
    int Bottom() const { return y + height; } ///< Exclusive bottom edge.

    bool Empty() const { return width <= 0 || height <= 0; }

    /// True when \p other lies entirely inside this rectangle.
    bool Contains(const Rect& other) const {
        return other.x >= x && other.y >= y && other.Right() <= Right() &&
               other.Bottom() <= Bottom();
    }

    /// Intersection with \p other; empty (0x0 at this origin) when disjoint.
    Rect Intersect(const Rect& other) const {
        const int x0 = std::max(x, other.x);
        const int y0 = std::max(y, other.y);
        const int x1 = std::min(Right(), other.Right());
        const int y1 = std::min(Bottom(), other.Bottom());
        if (x1 <= x0 || y1 <= y0) { return Rect{x0, y0, 0, 0}; }
        return Rect{x0, y0, x1 - x0, y1 - y0};
    }

    /// Same rectangle shifted by (dx, dy).
    Rect Translated(int dx, int dy) const { return Rect{x + dx, y + dy, width, height}; }

    cv::Rect ToCv() const { return cv::Rect(x, y, width, height); }

    bool operator==(const Rect&) const = default;
};

/// A region expressed as fractions of the crop rectangle.
struct RatioRect {
    float rx0 = 0.0f;
    float ry0 = 0.0f;
    float rx1 = 0.0f;
    float ry1 = 0.0f;

    /// All values inside [0,1] and not reversed.
    bool IsValid() const {
        auto in01 = [](float v) { return v >= 0.0f && v <= 1.0f; };
        return in01(rx0) && in01(ry0) && in01(rx1) && in01(ry1) && rx0 <= rx1 && ry0 <= ry1;
    }

    bool operator==(const RatioRect&) const = default;
};

/// Corner-form box as reported by text recognition (x1/y1 exclusive).
struct WordBox {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    bool operator==(const WordBox&) const = default;
};

} // namespace ShotMontage
