#include "shotmontage/encoding.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <future>
#include <utility>

namespace ShotMontage {

namespace {

constexpr int kPngCompression = 6;

static std::vector<uint8_t> Encode(const cv::Mat& image, const char* ext,
                                   const std::vector<int>& params) {
    std::vector<uint8_t> buf;
    bool ok = false;
    try {
        ok = cv::imencode(ext, image, buf, params);
    } catch (const cv::Exception& e) {
        throw EncodeError(std::string("cv::imencode(") + ext + ") threw: " + e.what());
    }
    if (!ok || buf.empty()) { throw EncodeError(std::string("cv::imencode(") + ext + ") failed"); }
    return buf;
}

static int ClampQuality(int quality) { return std::clamp(quality, 1, 100); }

} // namespace

std::vector<uint8_t> EncodePng(const cv::Mat& image) {
    if (image.empty()) { throw InputError("EncodePng: image is empty"); }
    std::vector<uint8_t> buf = Encode(image, ".png", {cv::IMWRITE_PNG_COMPRESSION, kPngCompression});
    spdlog::debug("EncodePng: {}x{} -> {} bytes", image.cols, image.rows, buf.size());
    return buf;
}

std::vector<uint8_t> EncodeJpeg(const cv::Mat& image, int quality) {
    if (image.empty()) { throw InputError("EncodeJpeg: image is empty"); }
    quality                  = ClampQuality(quality);
    std::vector<uint8_t> buf = Encode(image, ".jpg", {cv::IMWRITE_JPEG_QUALITY, quality});
    spdlog::debug("EncodeJpeg: {}x{} (q={}) -> {} bytes", image.cols, image.rows, quality,
                  buf.size());
    return buf;
}

std::vector<uint8_t> EncodeWebp(const cv::Mat& image, int quality) {
    if (image.empty()) { throw InputError("EncodeWebp: image is empty"); }
    quality                  = ClampQuality(quality);
    std::vector<uint8_t> buf = Encode(image, ".webp", {cv::IMWRITE_WEBP_QUALITY, quality});
    spdlog::debug("EncodeWebp: {}x{} (q={}) -> {} bytes", image.cols, image.rows, quality,
                  buf.size());
    return buf;
}

std::vector<uint8_t> EncodeImage(const cv::Mat& image, OutputFormat format, int quality) {
    switch (format) {
    case OutputFormat::Webp:
        return EncodeWebp(image, quality);
    case OutputFormat::Png:
        return EncodePng(image);
    case OutputFormat::Jpeg:
        return EncodeJpeg(image, quality);
    }
    throw InputError("EncodeImage: unknown output format");
}

BackgroundEncoder::~BackgroundEncoder() { Join(); }

void BackgroundEncoder::Join() {
    if (worker_.joinable()) { worker_.join(); }
}

std::vector<uint8_t> BackgroundEncoder::Encode(const cv::Mat& image, OutputFormat format,
                                               int quality, std::chrono::milliseconds timeout) {
    if (image.empty()) { throw InputError("BackgroundEncoder: image is empty"); }
    if (busy()) {
        spdlog::warn("Waiting for a previous encode that timed out");
        Join();
    }

    // The worker holds its own reference to the pixels.
    std::packaged_task<std::vector<uint8_t>()> task(
        [pixels = image, format, quality]() { return EncodeImage(pixels, format, quality); });
    std::future<std::vector<uint8_t>> blob = task.get_future();
    worker_                                = std::thread(std::move(task));

    if (blob.wait_for(timeout) != std::future_status::ready) {
        throw EncodeError("Encoding " + ToOutputFormatString(format) + " timed out after " +
                          std::to_string(timeout.count()) + " ms");
    }
    Join();
    return blob.get();
}

std::string SuggestedFilename(OutputFormat format, std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return std::string("montage_") + stamp + "." + OutputFormatExtension(format);
}

void WriteBlob(const std::vector<uint8_t>& data, const std::string& path) {
    if (path.empty()) { throw IOError("WriteBlob: output path is empty"); }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) { throw IOError("Failed to open output file: " + path); }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) { throw IOError("Failed to write output file: " + path); }
}

} // namespace ShotMontage
