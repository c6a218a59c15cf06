#include <gtest/gtest.h>
#include "shotmontage/bitmap.h"
#include "shotmontage/error.h"

#include <opencv2/imgcodecs.hpp>

#include <string>
#include <vector>

using namespace ShotMontage;

namespace {

std::vector<uint8_t> PngBytes(const cv::Mat& img) {
    std::vector<uint8_t> buf;
    cv::imencode(".png", img, buf);
    return buf;
}

} // namespace

TEST(Bitmap, DecodesFromBuffer) {
    cv::Mat img(12, 20, CV_8UC3, cv::Scalar(5, 6, 7));
    Bitmap bmp = DecodeBitmap(ImageSource::FromBuffer(PngBytes(img), "shot.png"));
    EXPECT_FALSE(bmp.closed());
    EXPECT_EQ(bmp.width(), 20);
    EXPECT_EQ(bmp.height(), 12);
    EXPECT_EQ(bmp.pixels().at<cv::Vec3b>(0, 0), cv::Vec3b(5, 6, 7));
}

TEST(Bitmap, NormalizesGrayAndAlpha) {
    cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(42));
    Bitmap a = DecodeBitmap(ImageSource::FromBuffer(PngBytes(gray)));
    EXPECT_EQ(a.pixels().type(), CV_8UC3);

    cv::Mat bgra(4, 4, CV_8UC4, cv::Scalar(1, 2, 3, 128));
    Bitmap b = DecodeBitmap(ImageSource::FromBuffer(PngBytes(bgra)));
    EXPECT_EQ(b.pixels().type(), CV_8UC3);
    EXPECT_EQ(b.pixels().at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));
}

TEST(Bitmap, CloseReleasesPixels) {
    cv::Mat img(4, 4, CV_8UC3, cv::Scalar::all(0));
    Bitmap bmp = DecodeBitmap(ImageSource::FromBuffer(PngBytes(img)));
    bmp.Close();
    EXPECT_TRUE(bmp.closed());
    EXPECT_THROW(bmp.pixels(), InputError);
    bmp.Close();
    EXPECT_TRUE(bmp.closed());
}

TEST(Bitmap, MoveLeavesSourceClosed) {
    Bitmap a(cv::Mat(3, 3, CV_8UC3, cv::Scalar::all(9)));
    Bitmap b(std::move(a));
    EXPECT_TRUE(a.closed());
    EXPECT_FALSE(b.closed());
}

TEST(Bitmap, GarbageBytesFailToDecode) {
    std::vector<uint8_t> junk = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    EXPECT_THROW(DecodeBitmap(ImageSource::FromBuffer(junk, "junk")), DecodeError);
    EXPECT_THROW(DecodeBitmap(ImageSource::FromBuffer({}, "empty")), InputError);
}

TEST(Bitmap, MissingFileIsIOError) {
    EXPECT_THROW(DecodeBitmap(ImageSource::FromPath("/nonexistent/shotmontage/none.png")),
                 IOError);
}

TEST(Bitmap, SourceLabel) {
    EXPECT_EQ(ImageSource::FromPath("/tmp/a/b.png").Label(), "b.png");
    EXPECT_EQ(ImageSource::FromBuffer({1}).Label(), "(buffer)");
}
