#include "shotmontage/ocr.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace ShotMontage {

ScopedOcrEngine::ScopedOcrEngine(OcrEngineFactory factory) : factory_(std::move(factory)) {}

ScopedOcrEngine::~ScopedOcrEngine() { Release(); }

IOcrEngine& ScopedOcrEngine::Get() {
    if (engine_) { return *engine_; }
    if (!factory_) { throw OcrError("OCR mode requested but no OCR engine is configured"); }

    spdlog::info("OCR: starting engine");
    engine_ = factory_();
    if (!engine_) { throw OcrError("OCR engine factory returned no engine"); }
    return *engine_;
}

void ScopedOcrEngine::Release() noexcept {
    if (!engine_) { return; }
    std::unique_ptr<IOcrEngine> engine = std::move(engine_);
    try {
        engine->Terminate();
        spdlog::info("OCR: engine terminated");
    } catch (const std::exception& e) {
        spdlog::error("OCR: engine termination failed: {}", e.what());
    }
}

} // namespace ShotMontage
