#include "shotmontage/bitmap.h"
#include "shotmontage/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace ShotMontage {

namespace {

static std::vector<uint8_t> ReadFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { throw IOError("Failed to open image: " + path); }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) { throw IOError("Failed to read image: " + path); }
    return bytes;
}

static cv::Mat TryDecode(const std::vector<uint8_t>& bytes, int flags) {
    try {
        return cv::imdecode(bytes, flags);
    } catch (const cv::Exception& e) {
        spdlog::debug("DecodeBitmap: cv::imdecode(flags={}) threw: {}", flags, e.what());
        return cv::Mat();
    }
}

} // namespace

ImageSource ImageSource::FromPath(const std::string& path) {
    ImageSource src;
    src.path = path;
    src.name = std::filesystem::path(path).filename().string();
    return src;
}

ImageSource ImageSource::FromBuffer(std::vector<uint8_t> bytes, const std::string& name) {
    ImageSource src;
    src.buffer = std::move(bytes);
    src.name   = name;
    return src;
}

std::string ImageSource::Label() const {
    if (!name.empty()) { return name; }
    if (!path.empty()) { return path; }
    return "(buffer)";
}

Bitmap::Bitmap(cv::Mat pixels) : pixels_(std::move(pixels)) {}

Bitmap::Bitmap(Bitmap&& other) noexcept : pixels_(std::move(other.pixels_)) {
    other.pixels_.release();
}

Bitmap& Bitmap::operator=(Bitmap&& other) noexcept {
    if (this == &other) { return *this; }
    pixels_ = std::move(other.pixels_);
    other.pixels_.release();
    return *this;
}

const cv::Mat& Bitmap::pixels() const {
    if (pixels_.empty()) { throw InputError("Bitmap: pixels accessed after Close()"); }
    return pixels_;
}

void Bitmap::Close() noexcept { pixels_.release(); }

Bitmap DecodeBitmap(const ImageSource& source) {
    std::vector<uint8_t> file_bytes;
    const std::vector<uint8_t>* bytes = &source.buffer;
    if (source.buffer.empty()) {
        if (source.path.empty()) { throw InputError("ImageSource has neither path nor buffer"); }
        file_bytes = ReadFileBytes(source.path);
        bytes      = &file_bytes;
    }
    if (bytes->empty()) { throw DecodeError("Image is empty: " + source.Label()); }

    cv::Mat decoded = TryDecode(*bytes, cv::IMREAD_COLOR);
    if (decoded.empty()) {
        spdlog::warn("DecodeBitmap: primary decode failed for {}, trying fallback",
                     source.Label());
        cv::Mat raw = TryDecode(*bytes, cv::IMREAD_UNCHANGED);
        try {
            decoded = detail::EnsureBgr(raw);
        } catch (const InputError& e) {
            throw DecodeError("Failed to decode image " + source.Label() + ": " + e.what());
        }
    }
    if (decoded.empty()) { throw DecodeError("Failed to decode image: " + source.Label()); }

    spdlog::debug("DecodeBitmap: {} -> {}x{}", source.Label(), decoded.cols, decoded.rows);
    return Bitmap(std::move(decoded));
}

} // namespace ShotMontage
