/// \file common.h
/// \brief Common enumerations used throughout ShotMontage.

#pragma once

#include <cstdint>
#include <string>

namespace ShotMontage {

/// How a mask slot obtains its rectangle.
enum class MaskMode : uint8_t {
    Manual = 0, ///< User-entered pixel rectangle in source-image coordinates.
    Ratio  = 1, ///< Fractions of the crop rectangle.
    Ocr    = 2, ///< Anchored on a label found by text recognition.
};

/// Convert MaskMode to its persisted string ("manual" / "ratio" / "ocr").
std::string ToMaskModeString(MaskMode mode);

/// Parse MaskMode from "manual" / "ratio" / "ocr".
MaskMode FromMaskModeString(const std::string& str);

/// The two independent mask slots.
enum class MaskSlotId : uint8_t {
    Enemy = 0, ///< Right-hand label area.
    Self  = 1, ///< Left-hand label area.
};

/// Human-readable slot name ("enemy" / "self").
const char* MaskSlotName(MaskSlotId slot);

/// Encoded output image format.
enum class OutputFormat : uint8_t {
    Webp = 0,
    Png  = 1,
    Jpeg = 2,
};

/// Convert OutputFormat to its persisted string ("webp" / "png" / "jpeg").
std::string ToOutputFormatString(OutputFormat format);

/// Parse OutputFormat from "webp" / "png" / "jpeg" (also "jpg").
OutputFormat FromOutputFormatString(const std::string& str);

/// File extension without the dot ("webp" / "png" / "jpg").
const char* OutputFormatExtension(OutputFormat format);

/// MIME type of the encoded blob.
const char* OutputFormatMimeType(OutputFormat format);

} // namespace ShotMontage
