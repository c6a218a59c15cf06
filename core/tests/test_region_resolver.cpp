#include <gtest/gtest.h>
#include "shotmontage/error.h"
#include "shotmontage/region_resolver.h"
#include "fake_ocr_engine.h"

#include <algorithm>

using namespace ShotMontage;
using ShotMontage::test_support::FakeOcrFactory;
using ShotMontage::test_support::FakeOcrStats;

namespace {

DetectedWord Word(const char* text, int x0, int y0, int x1, int y1) {
    return DetectedWord{text, WordBox{x0, y0, x1, y1}};
}

} // namespace

// --- ResolveRatioRect -------------------------------------------------------

TEST(RegionResolver, RatioRectMapsIntoCrop) {
    Rect r = ResolveRatioRect(Rect{10, 20, 100, 50}, RatioRect{0.0f, 0.0f, 0.5f, 0.5f});
    EXPECT_EQ(r, (Rect{10, 20, 50, 25}));
}

TEST(RegionResolver, DefaultEnemyRatioMatchesDefaultManualRect) {
    Rect r = ResolveRatioRect(Rect{31, 117, 1538, 665},
                              RatioRect{0.8303f, 0.1383f, 0.9980f, 0.1955f});
    EXPECT_EQ(r, (Rect{1308, 209, 258, 38}));
}

TEST(RegionResolver, RatioRectStaysInsideCrop) {
    const Rect crop{7, 3, 333, 127};
    const float values[] = {-0.5f, 0.0f, 0.13f, 0.5f, 0.77f, 1.0f, 1.5f};
    for (float a : values) {
        for (float b : values) {
            Rect r = ResolveRatioRect(crop, RatioRect{a, b, b, a});
            EXPECT_GE(r.width, 0);
            EXPECT_GE(r.height, 0);
            EXPECT_GE(r.x, crop.x);
            EXPECT_GE(r.y, crop.y);
            EXPECT_LE(r.Right(), crop.Right());
            EXPECT_LE(r.Bottom(), crop.Bottom());
        }
    }
}

// --- OCR search region and anchor selection ---------------------------------

TEST(RegionResolver, OcrSearchRegionPerSlot) {
    const Rect crop{10, 20, 200, 100};
    EXPECT_EQ(OcrSearchRegion(MaskSlotId::Self, crop, 300, 300), (Rect{10, 20, 100, 25}));
    EXPECT_EQ(OcrSearchRegion(MaskSlotId::Enemy, crop, 300, 300), (Rect{110, 20, 100, 25}));
}

TEST(RegionResolver, OcrSearchRegionClippedToImage) {
    const Rect crop{0, 0, 400, 300};
    EXPECT_EQ(OcrSearchRegion(MaskSlotId::Enemy, crop, 250, 300), (Rect{200, 0, 50, 75}));
}

TEST(RegionResolver, SelectsTopmostThenLeftmostAnchor) {
    const Rect crop{0, 0, 400, 300};
    std::vector<DetectedWord> words = {
        Word("HP", 0, 5, 20, 15),        Word("Lv.9", 100, 20, 130, 35),
        Word("Lv.7", 60, 20, 90, 35),    Word("Lv.8", 10, 40, 40, 55),
        Word("Level12", 0, 0, 60, 10),
    };
    std::optional<Rect> r = SelectOcrMaskRect(MaskSlotId::Enemy, words, crop);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{56, 16, 344, 23}));
}

TEST(RegionResolver, SelfMaskExtendsLeftAndIsClamped) {
    const Rect crop{10, 10, 300, 200};
    std::vector<DetectedWord> words = {Word("Lv.3", 12, 11, 40, 20)};
    std::optional<Rect> r = SelectOcrMaskRect(MaskSlotId::Self, words, crop);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{10, 10, 34, 14}));
}

TEST(RegionResolver, NoAnchorYieldsNothing) {
    std::vector<DetectedWord> words = {Word("Victory", 0, 0, 50, 10), Word("12", 60, 0, 70, 10)};
    EXPECT_FALSE(SelectOcrMaskRect(MaskSlotId::Enemy, words, Rect{0, 0, 100, 100}).has_value());
}

TEST(RegionResolver, ResolveOcrRectTranslatesRegionCoordinates) {
    cv::Mat reference(300, 400, CV_8UC3, cv::Scalar::all(0));
    FakeOcrStats stats;
    OcrEngineFactory factory = FakeOcrFactory({Word("Lv.12", 50, 10, 90, 30)}, stats);
    std::unique_ptr<IOcrEngine> engine = factory();

    std::optional<Rect> r =
        ResolveOcrRect(MaskSlotId::Enemy, reference, Rect{0, 0, 400, 300}, *engine);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{246, 6, 154, 28}));
    EXPECT_EQ(stats.recognized, 1);
}

// --- ResolveMasks ------------------------------------------------------------

TEST(RegionResolver, ManualAndRatioSlotsNeverStartOcr) {
    Settings s           = Settings::Defaults();
    s.enemy_mask.enabled = true;
    s.enemy_mask.rect    = Rect{1, 2, 3, 4};
    s.self_mask.enabled  = true;
    s.self_mask.mode     = MaskMode::Ratio;
    s.self_mask.ratio    = RatioRect{0.0f, 0.0f, 0.5f, 0.5f};

    FakeOcrStats stats;
    ScopedOcrEngine ocr(FakeOcrFactory({}, stats));
    cv::Mat reference(100, 200, CV_8UC3, cv::Scalar::all(0));

    MaskResolution res = ResolveMasks(s, Rect{10, 20, 100, 50}, reference, ocr);
    ASSERT_TRUE(res.enemy_mask.has_value());
    ASSERT_TRUE(res.self_mask.has_value());
    EXPECT_EQ(res.enemy_mask->rect, (Rect{1, 2, 3, 4}));
    EXPECT_EQ(res.enemy_mask->color, s.enemy_mask.color);
    EXPECT_EQ(res.self_mask->rect, (Rect{10, 20, 50, 25}));
    EXPECT_TRUE(res.fallbacks.empty());
    EXPECT_FALSE(ocr.live());
    EXPECT_EQ(stats.created, 0);
}

TEST(RegionResolver, DisabledSlotsProduceNoFill) {
    FakeOcrStats stats;
    ScopedOcrEngine ocr(FakeOcrFactory({}, stats));
    cv::Mat reference(100, 200, CV_8UC3, cv::Scalar::all(0));

    MaskResolution res = ResolveMasks(Settings::Defaults(), Rect{0, 0, 200, 100}, reference, ocr);
    EXPECT_FALSE(res.enemy_mask.has_value());
    EXPECT_FALSE(res.self_mask.has_value());
    EXPECT_EQ(res.enemy_slot, Settings::Defaults().enemy_mask);
}

TEST(RegionResolver, OcrSlotsShareOneEngine) {
    Settings s           = Settings::Defaults();
    s.enemy_mask.enabled = true;
    s.enemy_mask.mode    = MaskMode::Ocr;
    s.self_mask.enabled  = true;
    s.self_mask.mode     = MaskMode::Ocr;

    FakeOcrStats stats;
    ScopedOcrEngine ocr(FakeOcrFactory({Word("Lv.5", 20, 12, 50, 28)}, stats));
    cv::Mat reference(300, 400, CV_8UC3, cv::Scalar::all(0));

    MaskResolution res = ResolveMasks(s, Rect{0, 0, 400, 300}, reference, ocr);
    EXPECT_EQ(stats.created, 1);
    EXPECT_EQ(stats.recognized, 2);
    ASSERT_TRUE(res.self_mask.has_value());
    EXPECT_EQ(res.self_mask->rect, (Rect{0, 8, 54, 24}));
    ASSERT_TRUE(res.enemy_mask.has_value());
    EXPECT_EQ(res.enemy_mask->rect, (Rect{216, 8, 184, 24}));
    EXPECT_EQ(res.enemy_slot.rect, res.enemy_mask->rect);
    EXPECT_EQ(res.enemy_slot.mode, MaskMode::Ocr);

    ocr.Release();
    EXPECT_EQ(stats.terminated, 1);
}

TEST(RegionResolver, OcrMissFallsBackToManual) {
    Settings s           = Settings::Defaults();
    s.enemy_mask.enabled = true;
    s.enemy_mask.mode    = MaskMode::Ocr;
    s.enemy_mask.rect    = Rect{5, 6, 7, 8};

    FakeOcrStats stats;
    ScopedOcrEngine ocr(FakeOcrFactory({Word("nothing", 0, 0, 10, 10)}, stats));
    cv::Mat reference(300, 400, CV_8UC3, cv::Scalar::all(0));

    MaskResolution res = ResolveMasks(s, Rect{0, 0, 400, 300}, reference, ocr);
    ASSERT_TRUE(res.enemy_mask.has_value());
    EXPECT_EQ(res.enemy_mask->rect, (Rect{5, 6, 7, 8}));
    EXPECT_EQ(res.enemy_slot.mode, MaskMode::Manual);
    ASSERT_EQ(res.fallbacks.size(), 1u);
    EXPECT_EQ(res.fallbacks[0], DetectionFallback::EnemyMaskManual);
}

// --- ScopedOcrEngine ----------------------------------------------------------

TEST(ScopedOcrEngine, LazyCreateAndSingleTermination) {
    FakeOcrStats stats;
    {
        ScopedOcrEngine ocr(FakeOcrFactory({}, stats));
        EXPECT_FALSE(ocr.live());
        ocr.Get();
        ocr.Get();
        EXPECT_TRUE(ocr.live());
        EXPECT_EQ(stats.created, 1);

        ocr.Release();
        ocr.Release();
        EXPECT_FALSE(ocr.live());
    }
    EXPECT_EQ(stats.terminated, 1);
}

TEST(ScopedOcrEngine, DestructorTerminates) {
    FakeOcrStats stats;
    {
        ScopedOcrEngine ocr(FakeOcrFactory({}, stats));
        ocr.Get();
    }
    EXPECT_EQ(stats.terminated, 1);
}

TEST(ScopedOcrEngine, MissingFactoryThrows) {
    ScopedOcrEngine none(nullptr);
    EXPECT_FALSE(none.has_factory());
    EXPECT_THROW(none.Get(), OcrError);

    ScopedOcrEngine empty([]() { return std::unique_ptr<IOcrEngine>(); });
    EXPECT_THROW(empty.Get(), OcrError);
}
