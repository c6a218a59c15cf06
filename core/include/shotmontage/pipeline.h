/// \file pipeline.h
/// \brief Single-flight montage run: resolve geometry, composite, encode.

#pragma once

#include "auto_crop.h"
#include "bitmap.h"
#include "encoding.h"
#include "ocr.h"
#include "region_resolver.h"
#include "settings.h"
#include "surface.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ShotMontage {

/// Run phase reported through ProgressCallback.
enum class RunPhase : uint8_t {
    ResolvingCrop,  ///< Auto-crop detection on the first image.
    ResolvingMasks, ///< Ratio / OCR mask resolution.
    Compositing,    ///< Per-image loop.
    Encoding,       ///< Montage serialization.
};

/// Lowercase snake_case phase name.
const char* RunPhaseToString(RunPhase phase);

/// Progress callback.
/// \param phase Current phase
/// \param percent Progress within the phase [0.0, 1.0]
using ProgressCallback = std::function<void(RunPhase phase, float percent)>;

/// Checkpoint invoked after each tile is fully composited, before the next one
/// starts. \param completed Number of tiles finished so far
using TileCheckpoint = std::function<void(size_t completed)>;

/// Everything a run consumes.
struct MontageRequest {
    std::vector<ImageSource> images; ///< Non-empty, in grid order.
    Settings settings;

    AutoCropConfig auto_crop;
    OcrRegionConfig ocr_region;
    std::chrono::milliseconds encode_timeout{30000};

    ProgressCallback progress;  ///< Optional.
    TileCheckpoint checkpoint;  ///< Optional.
};

/// Output of a successful run.
struct MontageResult {
    std::vector<uint8_t> blob; ///< Encoded montage.
    std::string filename;      ///< Suggested name with timestamp and extension.
    std::string mime_type;

    int width         = 0;
    int height        = 0;
    size_t tile_count = 0;

    ResolvedGeometry geometry;   ///< Geometry the tiles were composited with.
    Settings effective_settings; ///< Input settings with detection fallbacks applied.
    std::vector<DetectionFallback> fallbacks;
};

/// Drives montage runs. Only one run may be in flight: Run() on a busy pipeline
/// returns nullopt without doing anything.
///
/// Scratch and montage surfaces belong to the pipeline and are shrunk on every
/// exit path; the OCR engine is created on first need and terminated once per
/// run. Typed Error exceptions propagate after cleanup. Any other exception is
/// treated as fatal: the pipeline is reset to idle and InternalError is thrown.
/// An encode abandoned by a timeout is joined before the next run encodes and
/// when the pipeline is destroyed.
class MontagePipeline {
public:
    explicit MontagePipeline(OcrEngineFactory ocr_factory = nullptr);

    MontagePipeline(const MontagePipeline&)            = delete;
    MontagePipeline& operator=(const MontagePipeline&) = delete;

    std::optional<MontageResult> Run(const MontageRequest& request);

    bool processing() const { return processing_.load(); }

    /// Number of completed resets after fatal failures.
    int reset_count() const { return reset_count_; }

    const Surface& scratch_surface() const { return scratch_; }
    const Surface& montage_surface() const { return montage_; }

    /// True while an encode abandoned by a timeout has not been joined.
    bool encoder_busy() const { return encoder_.busy(); }

private:
    MontageResult Execute(const MontageRequest& request, ScopedOcrEngine& ocr);
    void Reset() noexcept;

    OcrEngineFactory ocr_factory_;
    Surface scratch_;
    Surface montage_;
    BackgroundEncoder encoder_;
    std::atomic<bool> processing_{false};
    int reset_count_ = 0;
};

} // namespace ShotMontage
