/// \file color.h
/// \brief 8-bit RGB colour with CSS-style hex parsing.

#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// Opaque 8-bit sRGB colour.
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    /// Parses "#RRGGBB" or "#RGB" (case-insensitive, leading '#' optional).
    /// Throws InputError on malformed input.
    static Color FromHex(const std::string& hex);

    /// Lowercase "#rrggbb".
    std::string ToHex() const;

    /// OpenCV BGR scalar for drawing on 8UC3 surfaces.
    cv::Scalar ToBgrScalar() const { return cv::Scalar(b, g, r); }

    bool operator==(const Color&) const = default;
};

} // namespace ShotMontage
