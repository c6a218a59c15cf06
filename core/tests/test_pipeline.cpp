#include <gtest/gtest.h>
#include "shotmontage/encoding.h"
#include "shotmontage/error.h"
#include "shotmontage/pipeline.h"
#include "fake_ocr_engine.h"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace ShotMontage;
using ShotMontage::test_support::FakeOcrFactory;
using ShotMontage::test_support::FakeOcrStats;

namespace {

const Rect kContent{60, 40, 280, 200};

// 400x300 black frame around a grey content area at kContent.
ImageSource FramedShot() {
    cv::Mat img(300, 400, CV_8UC3, cv::Scalar::all(0));
    img(kContent.ToCv()).setTo(cv::Scalar::all(200));
    return ImageSource::FromBuffer(EncodePng(img), "framed.png");
}

ImageSource FlatShot() {
    cv::Mat img(300, 400, CV_8UC3, cv::Scalar::all(90));
    return ImageSource::FromBuffer(EncodePng(img), "flat.png");
}

MontageRequest BaseRequest(size_t count) {
    MontageRequest req;
    for (size_t i = 0; i < count; ++i) { req.images.push_back(FramedShot()); }
    req.settings           = Settings::Defaults();
    req.settings.crop      = kContent;
    req.settings.format    = OutputFormat::Png;
    req.settings.col_count = 2;
    req.settings.offset    = 4;
    return req;
}

void EnableEnemyOcr(MontageRequest& req) {
    req.settings.enemy_mask.enabled = true;
    req.settings.enemy_mask.mode    = MaskMode::Ocr;
}

void ExpectIdle(const MontagePipeline& pipeline) {
    EXPECT_FALSE(pipeline.processing());
    EXPECT_EQ(pipeline.scratch_surface().Footprint(), 0u);
    EXPECT_EQ(pipeline.montage_surface().Footprint(), 0u);
}

} // namespace

TEST(Pipeline, ProducesMontageAndReleasesSurfaces) {
    MontageRequest req = BaseRequest(3);

    std::vector<size_t> checkpoints;
    std::vector<RunPhase> phases;
    req.checkpoint = [&](size_t completed) { checkpoints.push_back(completed); };
    req.progress   = [&](RunPhase phase, float) { phases.push_back(phase); };

    MontagePipeline pipeline;
    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->width, 280 * 2 + 4 * 3);
    EXPECT_EQ(result->height, 200 * 2 + 4 * 3);
    EXPECT_EQ(result->tile_count, 3u);
    EXPECT_EQ(result->mime_type, "image/png");
    EXPECT_EQ(result->filename.substr(result->filename.size() - 4), ".png");
    EXPECT_EQ(result->geometry.crop, kContent);
    EXPECT_TRUE(result->fallbacks.empty());
    EXPECT_EQ(result->effective_settings, req.settings);

    cv::Mat montage = cv::imdecode(result->blob, cv::IMREAD_COLOR);
    ASSERT_EQ(montage.cols, result->width);
    ASSERT_EQ(montage.rows, result->height);
    EXPECT_EQ(montage.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(montage.at<cv::Vec3b>(4, 4), cv::Vec3b(200, 200, 200));
    EXPECT_EQ(montage.at<cv::Vec3b>(210, 290), cv::Vec3b(0, 0, 0)); // empty grid cell

    EXPECT_EQ(checkpoints, (std::vector<size_t>{1, 2, 3}));
    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(phases.front(), RunPhase::ResolvingCrop);
    EXPECT_EQ(phases.back(), RunPhase::Encoding);
    ExpectIdle(pipeline);
}

TEST(Pipeline, AutoCropReplacesManualCrop) {
    MontageRequest req     = BaseRequest(1);
    req.settings.crop      = Rect{0, 0, 10, 10};
    req.settings.crop_auto = true;

    MontagePipeline pipeline;
    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->geometry.crop, kContent);
    EXPECT_EQ(result->effective_settings.crop, kContent);
    EXPECT_TRUE(result->effective_settings.crop_auto);
    EXPECT_EQ(result->width, 280 * 2 + 4 * 3);
}

TEST(Pipeline, AutoCropMissDisablesAutoCrop) {
    MontageRequest req     = BaseRequest(0);
    req.images             = {FlatShot(), FlatShot()};
    req.settings.crop      = Rect{0, 0, 50, 50};
    req.settings.crop_auto = true;

    MontagePipeline pipeline;
    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->fallbacks.size(), 1u);
    EXPECT_EQ(result->fallbacks[0], DetectionFallback::CropAutoDisabled);
    EXPECT_FALSE(result->effective_settings.crop_auto);
    EXPECT_EQ(result->geometry.crop, (Rect{0, 0, 50, 50}));
    ExpectIdle(pipeline);
}

TEST(Pipeline, AutoCropMissWithInvalidManualCropFails) {
    MontageRequest req     = BaseRequest(0);
    req.images             = {FlatShot()};
    req.settings.crop      = Rect{0, 0, 0, 0};
    req.settings.crop_auto = true;

    MontagePipeline pipeline;
    EXPECT_THROW(pipeline.Run(req), InputError);
    ExpectIdle(pipeline);
}

TEST(Pipeline, OcrMaskIsPaintedAndEngineTerminatedOnce) {
    MontageRequest req = BaseRequest(2);
    EnableEnemyOcr(req);

    FakeOcrStats stats;
    MontagePipeline pipeline(FakeOcrFactory({DetectedWord{"Lv.12", WordBox{50, 10, 90, 30}}},
                                            stats));
    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());

    // Search region is the right half of the crop's top quarter: (200,40) 140x50.
    const Rect expected{246, 46, 94, 28};
    ASSERT_TRUE(result->geometry.enemy_mask.has_value());
    EXPECT_EQ(result->geometry.enemy_mask->rect, expected);
    EXPECT_EQ(result->effective_settings.enemy_mask.rect, expected);
    EXPECT_EQ(result->effective_settings.enemy_mask.mode, MaskMode::Ocr);

    cv::Mat montage   = cv::imdecode(result->blob, cv::IMREAD_COLOR);
    const Color& fill = req.settings.enemy_mask.color;
    // Tile 1 origin is (4 + 280 + 4, 4); mask origin in tile coords is (186, 6).
    EXPECT_EQ(montage.at<cv::Vec3b>(4 + 6, 288 + 186), cv::Vec3b(fill.b, fill.g, fill.r));

    EXPECT_EQ(stats.created, 1);
    EXPECT_EQ(stats.recognized, 1);
    EXPECT_EQ(stats.terminated, 1);
    ExpectIdle(pipeline);
}

TEST(Pipeline, OcrMissFallsBackToManualRect) {
    MontageRequest req = BaseRequest(1);
    EnableEnemyOcr(req);
    req.settings.enemy_mask.rect = Rect{100, 100, 20, 20};

    FakeOcrStats stats;
    MontagePipeline pipeline(FakeOcrFactory({}, stats));
    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->fallbacks.size(), 1u);
    EXPECT_EQ(result->fallbacks[0], DetectionFallback::EnemyMaskManual);
    EXPECT_EQ(result->effective_settings.enemy_mask.mode, MaskMode::Manual);
    ASSERT_TRUE(result->geometry.enemy_mask.has_value());
    EXPECT_EQ(result->geometry.enemy_mask->rect, (Rect{100, 100, 20, 20}));
    EXPECT_EQ(stats.terminated, 1);
}

TEST(Pipeline, OcrModeWithoutEngineIsRejectedUpFront) {
    MontageRequest req = BaseRequest(1);
    EnableEnemyOcr(req);
    bool progressed = false;
    req.progress    = [&](RunPhase, float) { progressed = true; };

    MontagePipeline pipeline;
    EXPECT_THROW(pipeline.Run(req), InputError);
    EXPECT_FALSE(progressed);
    ExpectIdle(pipeline);
}

TEST(Pipeline, InvalidInputIsRejectedUpFront) {
    MontagePipeline pipeline;

    MontageRequest empty = BaseRequest(0);
    EXPECT_THROW(pipeline.Run(empty), InputError);

    MontageRequest bad     = BaseRequest(1);
    bad.settings.col_count = 0;
    EXPECT_THROW(pipeline.Run(bad), InputError);
    ExpectIdle(pipeline);
}

TEST(Pipeline, SecondRunWhileBusyIsNoOp) {
    MontageRequest req = BaseRequest(2);
    MontagePipeline pipeline;

    int nested_calls = 0;
    bool nested_ran  = false;
    req.checkpoint   = [&](size_t) {
        ++nested_calls;
        nested_ran = nested_ran || pipeline.Run(req).has_value();
        EXPECT_TRUE(pipeline.processing());
    };

    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(nested_calls, 2);
    EXPECT_FALSE(nested_ran);
    ExpectIdle(pipeline);
}

TEST(Pipeline, DecodeFailureReleasesEverything) {
    MontageRequest req = BaseRequest(1);
    req.images.push_back(ImageSource::FromBuffer({'j', 'u', 'n', 'k'}, "junk"));
    EnableEnemyOcr(req);

    FakeOcrStats stats;
    MontagePipeline pipeline(FakeOcrFactory({}, stats));
    EXPECT_THROW(pipeline.Run(req), DecodeError);
    EXPECT_EQ(stats.terminated, 1);
    EXPECT_EQ(pipeline.reset_count(), 0);
    ExpectIdle(pipeline);
}

TEST(Pipeline, UnexpectedFailureResetsPipeline) {
    MontageRequest req = BaseRequest(3);
    EnableEnemyOcr(req);
    req.checkpoint = [](size_t completed) {
        if (completed == 2) { throw std::runtime_error("host went away"); }
    };

    FakeOcrStats stats;
    MontagePipeline pipeline(FakeOcrFactory({}, stats));
    EXPECT_THROW(pipeline.Run(req), InternalError);
    EXPECT_EQ(pipeline.reset_count(), 1);
    EXPECT_EQ(stats.terminated, 1);
    ExpectIdle(pipeline);

    req.checkpoint = nullptr;
    EXPECT_TRUE(pipeline.Run(req).has_value());
    EXPECT_EQ(stats.terminated, 2);
}

TEST(Pipeline, NonStandardExceptionResetsPipeline) {
    MontageRequest req = BaseRequest(3);
    req.checkpoint     = [](size_t completed) {
        if (completed == 1) { throw 42; }
    };

    MontagePipeline pipeline;
    EXPECT_THROW(pipeline.Run(req), InternalError);
    EXPECT_EQ(pipeline.reset_count(), 1);
    ExpectIdle(pipeline);

    req.checkpoint = nullptr;
    EXPECT_TRUE(pipeline.Run(req).has_value());
}

TEST(Pipeline, EncodeTimeoutFailsRunAndNextRunSucceeds) {
    MontageRequest req = BaseRequest(1);
    req.images.front() = [] {
        cv::Mat img(1500, 2000, CV_8UC3);
        cv::randu(img, cv::Scalar::all(0), cv::Scalar::all(256));
        return ImageSource::FromBuffer(EncodePng(img), "noise.png");
    }();
    req.settings.crop  = Rect{0, 0, 2000, 1500};
    req.encode_timeout = std::chrono::milliseconds(0);

    MontagePipeline pipeline;
    EXPECT_THROW(pipeline.Run(req), EncodeError);
    EXPECT_EQ(pipeline.reset_count(), 0);
    EXPECT_TRUE(pipeline.encoder_busy());
    ExpectIdle(pipeline);

    req.encode_timeout = std::chrono::milliseconds(30000);
    std::optional<MontageResult> result = pipeline.Run(req);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->blob.empty());
    EXPECT_FALSE(pipeline.encoder_busy());
}

TEST(Pipeline, PhaseNames) {
    EXPECT_STREQ(RunPhaseToString(RunPhase::ResolvingCrop), "resolving_crop");
    EXPECT_STREQ(RunPhaseToString(RunPhase::Encoding), "encoding");
}
