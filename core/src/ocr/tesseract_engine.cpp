#include "shotmontage/ocr.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <opencv2/imgproc.hpp>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace ShotMontage {

namespace {

class TesseractEngine final : public IOcrEngine {
public:
    explicit TesseractEngine(const TesseractConfig& config)
        : api_(std::make_unique<tesseract::TessBaseAPI>()), config_(config) {
        const char* data_path = nullptr;
        if (!config_.data_path.empty()) {
            data_path = config_.data_path.c_str();
        } else if (const char* env = std::getenv("TESSDATA_PREFIX")) {
            data_path = env;
        }

        if (api_->Init(data_path, config_.language.c_str()) != 0) {
            api_.reset();
            throw OcrError("Failed to initialize Tesseract (language=" + config_.language +
                           ", tessdata=" + (data_path ? data_path : "(default)") + ")");
        }
        api_->SetPageSegMode(static_cast<tesseract::PageSegMode>(config_.page_seg_mode));
        spdlog::debug("Tesseract: initialized (language={}, psm={})", config_.language,
                      config_.page_seg_mode);
    }

    ~TesseractEngine() override { Terminate(); }

    std::vector<DetectedWord> Recognize(const cv::Mat& image) override {
        if (!api_) { throw OcrError("Tesseract: Recognize() after Terminate()"); }
        if (image.empty()) { return {}; }

        cv::Mat rgb;
        if (image.channels() == 1) {
            cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
        } else if (image.channels() == 4) {
            cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
        } else {
            cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
        }

        api_->SetImage(rgb.data, rgb.cols, rgb.rows, 3, static_cast<int>(rgb.step));
        if (api_->Recognize(nullptr) != 0) { throw OcrError("Tesseract: recognition failed"); }

        std::vector<DetectedWord> words;
        std::unique_ptr<tesseract::ResultIterator> it(api_->GetIterator());
        const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
        if (it) {
            do {
                std::unique_ptr<char[]> text(it->GetUTF8Text(level));
                if (!text || text[0] == '\0') { continue; }
                if (it->Confidence(level) < static_cast<float>(config_.min_confidence)) {
                    continue;
                }
                DetectedWord word;
                word.text = text.get();
                it->BoundingBox(level, &word.bbox.x0, &word.bbox.y0, &word.bbox.x1,
                                &word.bbox.y1);
                words.push_back(std::move(word));
            } while (it->Next(level));
        }
        api_->Clear();
        spdlog::debug("Tesseract: {} word(s) in {}x{} region", words.size(), image.cols,
                      image.rows);
        return words;
    }

    void Terminate() override {
        if (!api_) { return; }
        api_->End();
        api_.reset();
    }

private:
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    TesseractConfig config_;
};

} // namespace

std::unique_ptr<IOcrEngine> CreateTesseractEngine(const TesseractConfig& config) {
    return std::make_unique<TesseractEngine>(config);
}

OcrEngineFactory TesseractEngineFactory(const TesseractConfig& config) {
    return [config]() { return CreateTesseractEngine(config); };
}

} // namespace ShotMontage
