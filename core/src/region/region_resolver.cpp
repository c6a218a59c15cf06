#include "shotmontage/region_resolver.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <regex>
#include <string>
#include <vector>

namespace ShotMontage {

namespace {

static float Clamp01(float v) { return std::clamp(v, 0.0f, 1.0f); }

static int RoundScaled(float ratio, int extent) {
    return static_cast<int>(std::lround(static_cast<double>(Clamp01(ratio)) * extent));
}

static DetectionFallback FallbackFor(MaskSlotId slot) {
    return slot == MaskSlotId::Enemy ? DetectionFallback::EnemyMaskManual
                                     : DetectionFallback::SelfMaskManual;
}

} // namespace

const char* DetectionFallbackToString(DetectionFallback fallback) {
    switch (fallback) {
    case DetectionFallback::CropAutoDisabled:
        return "auto-crop found no plausible rectangle; using manual crop";
    case DetectionFallback::EnemyMaskManual:
        return "enemy mask OCR found no anchor; using manual rectangle";
    case DetectionFallback::SelfMaskManual:
        return "self mask OCR found no anchor; using manual rectangle";
    }
    return "unknown fallback";
}

Rect ResolveRatioRect(const Rect& crop, const RatioRect& ratio) {
    const int x0 = RoundScaled(ratio.rx0, crop.width);
    const int y0 = RoundScaled(ratio.ry0, crop.height);
    const int x1 = RoundScaled(ratio.rx1, crop.width);
    const int y1 = RoundScaled(ratio.ry1, crop.height);
    return Rect{crop.x + x0, crop.y + y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

Rect OcrSearchRegion(MaskSlotId slot, const Rect& crop, int image_width, int image_height,
                     const OcrRegionConfig& config) {
    const int half = crop.width / 2;
    const int band = std::max(
        1, static_cast<int>(std::lround(static_cast<double>(config.band_height_ratio) *
                                        crop.height)));

    const Rect region = (slot == MaskSlotId::Self)
                            ? Rect{crop.x, crop.y, half, band}
                            : Rect{crop.x + half, crop.y, crop.width - half, band};
    return region.Intersect(Rect{0, 0, image_width, image_height});
}

std::optional<Rect> SelectOcrMaskRect(MaskSlotId slot, const std::vector<DetectedWord>& words,
                                      const Rect& crop, const OcrRegionConfig& config) {
    const std::regex pattern(config.anchor_pattern);

    const DetectedWord* best = nullptr;
    for (const DetectedWord& word : words) {
        if (!std::regex_match(word.text, pattern)) { continue; }
        // Strict comparisons keep the earlier word on a full tie.
        if (!best || word.bbox.y0 < best->bbox.y0 ||
            (word.bbox.y0 == best->bbox.y0 && word.bbox.x0 < best->bbox.x0)) {
            best = &word;
        }
    }
    if (!best) { return std::nullopt; }

    int x0 = best->bbox.x0 - config.padding;
    int y0 = best->bbox.y0 - config.padding;
    int x1 = best->bbox.x1 + config.padding;
    int y1 = best->bbox.y1 + config.padding;
    if (slot == MaskSlotId::Enemy) {
        x1 = crop.Right();
    } else {
        x0 = crop.x;
    }

    const Rect grown{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
    const Rect clamped = grown.Intersect(crop);
    spdlog::debug("OCR: {} anchor '{}' at ({},{})-({},{}) -> mask ({},{} {}x{})",
                  MaskSlotName(slot), best->text, best->bbox.x0, best->bbox.y0, best->bbox.x1,
                  best->bbox.y1, clamped.x, clamped.y, clamped.width, clamped.height);
    return clamped;
}

std::optional<Rect> ResolveOcrRect(MaskSlotId slot, const cv::Mat& reference, const Rect& crop,
                                   IOcrEngine& engine, const OcrRegionConfig& config) {
    if (reference.empty()) { throw InputError("ResolveOcrRect: reference image is empty"); }

    const Rect region = OcrSearchRegion(slot, crop, reference.cols, reference.rows, config);
    if (region.Empty()) {
        spdlog::warn("OCR: {} search region lies outside the image", MaskSlotName(slot));
        return std::nullopt;
    }

    std::vector<DetectedWord> words = engine.Recognize(reference(region.ToCv()));
    for (DetectedWord& word : words) {
        word.bbox.x0 += region.x;
        word.bbox.x1 += region.x;
        word.bbox.y0 += region.y;
        word.bbox.y1 += region.y;
    }
    spdlog::debug("OCR: {} region ({},{} {}x{}): {} word(s)", MaskSlotName(slot), region.x,
                  region.y, region.width, region.height, words.size());
    return SelectOcrMaskRect(slot, words, crop, config);
}

MaskResolution ResolveMasks(const Settings& settings, const Rect& crop, const cv::Mat& reference,
                            ScopedOcrEngine& ocr, const OcrRegionConfig& config) {
    MaskResolution result;
    result.enemy_slot = settings.enemy_mask;
    result.self_slot  = settings.self_mask;

    for (MaskSlotId id : {MaskSlotId::Enemy, MaskSlotId::Self}) {
        MaskSlot& slot               = (id == MaskSlotId::Enemy) ? result.enemy_slot
                                                                 : result.self_slot;
        std::optional<MaskFill>& out = (id == MaskSlotId::Enemy) ? result.enemy_mask
                                                                 : result.self_mask;
        if (!slot.enabled) { continue; }

        switch (slot.mode) {
        case MaskMode::Manual:
            out = MaskFill{slot.rect, slot.color};
            break;
        case MaskMode::Ratio:
            out = MaskFill{ResolveRatioRect(crop, slot.ratio), slot.color};
            break;
        case MaskMode::Ocr: {
            std::optional<Rect> rect = ResolveOcrRect(id, reference, crop, ocr.Get(), config);
            if (rect) {
                slot.rect = *rect;
                out       = MaskFill{*rect, slot.color};
            } else {
                spdlog::warn("OCR: no anchor for {} mask, falling back to manual rectangle",
                             MaskSlotName(id));
                slot.mode = MaskMode::Manual;
                out       = MaskFill{slot.rect, slot.color};
                result.fallbacks.push_back(FallbackFor(id));
            }
            break;
        }
        }
        spdlog::info("Mask {}: mode={}, rect=({},{} {}x{})", MaskSlotName(id),
                     ToMaskModeString(slot.mode), out->rect.x, out->rect.y, out->rect.width,
                     out->rect.height);
    }
    return result;
}

} // namespace ShotMontage
