/// \file ocr.h
/// \brief Text-recognition adapter interface, Tesseract backend, and scoped ownership.

#pragma once

#include "geometry.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ShotMontage {

/// One recognised word. Coordinates are relative to the image passed to
/// IOcrEngine::Recognize() until translated by the caller.
struct DetectedWord {
    std::string text;
    WordBox bbox;
};

/// A text-recognition engine. Implementations may hold large models, so the
/// pipeline creates at most one per run and always calls Terminate().
class IOcrEngine {
public:
    virtual ~IOcrEngine() = default;

    /// Recognises words in an 8-bit BGR image.
    virtual std::vector<DetectedWord> Recognize(const cv::Mat& image) = 0;

    /// Releases engine resources. Recognize() must not be called afterwards.
    virtual void Terminate() = 0;
};

using OcrEngineFactory = std::function<std::unique_ptr<IOcrEngine>()>;

/// Settings for the Tesseract backend.
struct TesseractConfig {
    std::string data_path;         ///< tessdata directory; empty = TESSDATA_PREFIX / default.
    std::string language = "eng";
    int page_seg_mode    = 11;     ///< tesseract::PSM_SPARSE_TEXT.
    int min_confidence   = 0;      ///< Words below this confidence are dropped.
};

/// Creates a Tesseract-backed engine. Throws OcrError if Tesseract cannot be
/// initialised with the given data path and language.
std::unique_ptr<IOcrEngine> CreateTesseractEngine(const TesseractConfig& config = {});

/// Factory producing Tesseract engines with \p config.
OcrEngineFactory TesseractEngineFactory(const TesseractConfig& config = {});

/// Lazily acquired engine for the duration of one run. The first Get() creates
/// the engine through the factory; Release() (also run by the destructor)
/// terminates it exactly once.
class ScopedOcrEngine {
public:
    explicit ScopedOcrEngine(OcrEngineFactory factory);
    ~ScopedOcrEngine();

    ScopedOcrEngine(const ScopedOcrEngine&)            = delete;
    ScopedOcrEngine& operator=(const ScopedOcrEngine&) = delete;

    /// Returns the live engine, creating it on first use. Throws OcrError when no
    /// factory was supplied or the factory returned nothing.
    IOcrEngine& Get();

    /// True once Get() created an engine that has not been released.
    bool live() const { return engine_ != nullptr; }

    bool has_factory() const { return static_cast<bool>(factory_); }

    void Release() noexcept;

private:
    OcrEngineFactory factory_;
    std::unique_ptr<IOcrEngine> engine_;
};

} // namespace ShotMontage
