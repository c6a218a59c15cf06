#include "shotmontage/pipeline.h"
#include "shotmontage/compositor.h"
#include "shotmontage/encoding.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace ShotMontage {
namespace {

void NotifyProgress(const ProgressCallback& cb, RunPhase phase, float progress) {
    if (cb) { cb(phase, progress); }
}

/// Clears the processing flag when a run leaves Run(), however it leaves.
class ProcessingGuard {
public:
    explicit ProcessingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ProcessingGuard() { flag_.store(false); }

    ProcessingGuard(const ProcessingGuard&)            = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

/// Returns every run-scoped resource to its minimal footprint on scope exit.
class RunScope {
public:
    RunScope(Surface& scratch, Surface& montage, ScopedOcrEngine& ocr)
        : scratch_(scratch), montage_(montage), ocr_(ocr) {}
    ~RunScope() {
        ocr_.Release();
        scratch_.Shrink();
        montage_.Shrink();
    }

    RunScope(const RunScope&)            = delete;
    RunScope& operator=(const RunScope&) = delete;

private:
    Surface& scratch_;
    Surface& montage_;
    ScopedOcrEngine& ocr_;
};

void ValidateRequest(const MontageRequest& request, bool has_ocr_factory) {
    if (request.images.empty()) { throw InputError("Please select at least one image."); }
    ValidateSettings(request.settings);

    for (MaskSlotId id : {MaskSlotId::Enemy, MaskSlotId::Self}) {
        const MaskSlot& slot = request.settings.Slot(id);
        if (slot.enabled && slot.mode == MaskMode::Ocr && !has_ocr_factory) {
            throw InputError(std::string(MaskSlotName(id)) +
                             " mask uses OCR mode but no OCR engine is configured");
        }
    }
}

} // namespace

const char* RunPhaseToString(RunPhase phase) {
    switch (phase) {
    case RunPhase::ResolvingCrop:
        return "resolving_crop";
    case RunPhase::ResolvingMasks:
        return "resolving_masks";
    case RunPhase::Compositing:
        return "compositing";
    case RunPhase::Encoding:
        return "encoding";
    }
    return "unknown";
}

MontagePipeline::MontagePipeline(OcrEngineFactory ocr_factory)
    : ocr_factory_(std::move(ocr_factory)), scratch_("scratch"), montage_("montage") {}

std::optional<MontageResult> MontagePipeline::Run(const MontageRequest& request) {
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        spdlog::warn("Run ignored: a montage is already being processed");
        return std::nullopt;
    }
    ProcessingGuard processing_guard(processing_);

    ValidateRequest(request, static_cast<bool>(ocr_factory_));

    spdlog::info("Run started: {} image(s), format={}, cols={}, offset={}, crop_auto={}",
                 request.images.size(), ToOutputFormatString(request.settings.format),
                 request.settings.col_count, request.settings.offset, request.settings.crop_auto);

    ScopedOcrEngine ocr(ocr_factory_);
    RunScope run_scope(scratch_, montage_, ocr);
    try {
        return Execute(request, ocr);
    } catch (const Error& e) {
        spdlog::error("Run failed ({}): {}", ErrorCodeToString(e.code()), e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::critical("Run aborted by unexpected failure: {}", e.what());
        ocr.Release();
        Reset();
        throw InternalError(std::string("Unexpected failure, pipeline was reset: ") + e.what());
    } catch (...) {
        spdlog::critical("Run aborted by unexpected non-standard exception");
        ocr.Release();
        Reset();
        throw InternalError("Unexpected failure, pipeline was reset: unknown exception");
    }
}

MontageResult MontagePipeline::Execute(const MontageRequest& request, ScopedOcrEngine& ocr) {
    const Settings& settings = request.settings;

    MontageResult result;
    result.effective_settings = settings;
    Settings& effective       = result.effective_settings;

    // === 1. Crop rectangle ===
    NotifyProgress(request.progress, RunPhase::ResolvingCrop, 0.0f);
    Bitmap reference = DecodeBitmap(request.images.front());

    Rect crop = settings.crop;
    if (settings.crop_auto) {
        std::optional<Rect> detected = DetectCropRect(reference.pixels(), request.auto_crop);
        if (detected) {
            crop           = *detected;
            effective.crop = crop;
        } else {
            spdlog::warn("Auto-crop found no plausible rectangle, using manual crop ({},{} {}x{})",
                         crop.x, crop.y, crop.width, crop.height);
            effective.crop_auto = false;
            result.fallbacks.push_back(DetectionFallback::CropAutoDisabled);
            ValidateSettings(effective);
        }
    }
    NotifyProgress(request.progress, RunPhase::ResolvingCrop, 1.0f);

    // === 2. Mask rectangles ===
    NotifyProgress(request.progress, RunPhase::ResolvingMasks, 0.0f);
    MaskResolution masks = ResolveMasks(settings, crop, reference.pixels(), ocr, request.ocr_region);
    reference.Close();
    ocr.Release();

    effective.enemy_mask = masks.enemy_slot;
    effective.self_mask  = masks.self_slot;
    result.fallbacks.insert(result.fallbacks.end(), masks.fallbacks.begin(),
                            masks.fallbacks.end());
    NotifyProgress(request.progress, RunPhase::ResolvingMasks, 1.0f);

    const ResolvedGeometry geometry{crop, masks.enemy_mask, masks.self_mask};

    // === 3. Tiles ===
    NotifyProgress(request.progress, RunPhase::Compositing, 0.0f);
    MontageAssembler assembler(request.images, geometry, settings.col_count, settings.offset,
                               settings.background, scratch_, montage_);
    while (assembler.Step()) {
        NotifyProgress(request.progress, RunPhase::Compositing,
                       static_cast<float>(assembler.completed()) /
                           static_cast<float>(assembler.total()));
        if (request.checkpoint) { request.checkpoint(assembler.completed()); }
    }
    scratch_.Shrink();

    // === 4. Encode ===
    NotifyProgress(request.progress, RunPhase::Encoding, 0.0f);
    result.blob = encoder_.Encode(montage_.pixels(), settings.format, settings.quality,
                                  request.encode_timeout);
    montage_.Shrink();
    NotifyProgress(request.progress, RunPhase::Encoding, 1.0f);

    result.filename   = SuggestedFilename(settings.format);
    result.mime_type  = OutputFormatMimeType(settings.format);
    result.width      = assembler.layout().width;
    result.height     = assembler.layout().height;
    result.tile_count = assembler.total();
    result.geometry   = geometry;

    spdlog::info("Run finished: {}x{} {} ({} bytes, {} fallback(s))", result.width, result.height,
                 result.filename, result.blob.size(), result.fallbacks.size());
    return result;
}

void MontagePipeline::Reset() noexcept {
    scratch_.Shrink();
    montage_.Shrink();
    ++reset_count_;
    spdlog::warn("Pipeline reset to idle (reset #{})", reset_count_);
}

} // namespace ShotMontage
