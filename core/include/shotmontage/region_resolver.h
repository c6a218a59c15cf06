/// \file region_resolver.h
/// \brief Mask-rectangle resolution (manual / ratio / OCR) and run geometry.

#pragma once

#include "color.h"
#include "common.h"
#include "geometry.h"
#include "ocr.h"
#include "settings.h"

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// A resolved mask: where to paint and with what.
struct MaskFill {
    Rect rect; ///< Source-image coordinates.
    Color color;

    bool operator==(const MaskFill&) const = default;
};

/// Geometry frozen for the per-image loop of one run.
struct ResolvedGeometry {
    Rect crop;
    std::optional<MaskFill> enemy_mask;
    std::optional<MaskFill> self_mask;

    const std::optional<MaskFill>& Mask(MaskSlotId id) const {
        return id == MaskSlotId::Enemy ? enemy_mask : self_mask;
    }
};

/// Automatic feature that was disabled because detection found nothing.
enum class DetectionFallback : uint8_t {
    CropAutoDisabled, ///< Auto-crop found no plausible rectangle.
    EnemyMaskManual,  ///< Enemy slot OCR found no anchor word.
    SelfMaskManual,   ///< Self slot OCR found no anchor word.
};

/// Short description for user notifications.
const char* DetectionFallbackToString(DetectionFallback fallback);

/// Placement of the OCR search window and anchor handling.
struct OcrRegionConfig {
    float band_height_ratio = 0.25f; ///< Search band height / crop height, from the crop top.
    int padding             = 4;     ///< Pixels added around the anchor word.
    std::string anchor_pattern = "^[A-Za-z]{1,3}\\.[0-9]+$";
};

/// Ratio-mode rectangle inside \p crop. Ratios are clamped to [0,1].
Rect ResolveRatioRect(const Rect& crop, const RatioRect& ratio);

/// Sub-region of the reference image handed to the OCR engine for \p slot:
/// the slot's horizontal half of the crop and the top band. Clipped to the image.
Rect OcrSearchRegion(MaskSlotId slot, const Rect& crop, int image_width, int image_height,
                     const OcrRegionConfig& config = {});

/// Picks the anchor among \p words (full-image coordinates): words matching
/// the pattern, topmost first, ties by x0 then input order. Returns the mask
/// rectangle grown by padding, extended to the crop's outer edge on the slot's
/// side and clamped to the crop, or nullopt when nothing matches.
std::optional<Rect> SelectOcrMaskRect(MaskSlotId slot, const std::vector<DetectedWord>& words,
                                      const Rect& crop, const OcrRegionConfig& config = {});

/// Runs recognition on the slot's search region of \p reference, translates
/// words to full-image coordinates and applies SelectOcrMaskRect().
std::optional<Rect> ResolveOcrRect(MaskSlotId slot, const cv::Mat& reference, const Rect& crop,
                                   IOcrEngine& engine, const OcrRegionConfig& config = {});

/// Result of resolving both slots.
struct MaskResolution {
    std::optional<MaskFill> enemy_mask;
    std::optional<MaskFill> self_mask;
    MaskSlot enemy_slot; ///< Slot as it should be persisted after fallbacks.
    MaskSlot self_slot;
    std::vector<DetectionFallback> fallbacks;
};

/// Resolves both mask slots against \p crop. Disabled slots produce no fill.
/// OCR slots acquire \p ocr lazily; a slot whose OCR finds no anchor keeps its
/// previous rectangle, switches to manual mode and is listed in fallbacks.
MaskResolution ResolveMasks(const Settings& settings, const Rect& crop, const cv::Mat& reference,
                            ScopedOcrEngine& ocr, const OcrRegionConfig& config = {});

} // namespace ShotMontage
