#include "shotmontage/common.h"
#include "shotmontage/error.h"

#include <algorithm>
#include <cctype>

namespace ShotMontage {

namespace {

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:
        return "ok";
    case ErrorCode::InvalidInput:
        return "invalid_input";
    case ErrorCode::IOError:
        return "io_error";
    case ErrorCode::FormatError:
        return "format_error";
    case ErrorCode::DecodeFailed:
        return "decode_failed";
    case ErrorCode::SurfaceUnavailable:
        return "surface_unavailable";
    case ErrorCode::EncodeFailed:
        return "encode_failed";
    case ErrorCode::OcrFailed:
        return "ocr_failed";
    case ErrorCode::InternalError:
        return "internal_error";
    }
    return "unknown";
}

std::string ToMaskModeString(MaskMode mode) {
    switch (mode) {
    case MaskMode::Manual:
        return "manual";
    case MaskMode::Ratio:
        return "ratio";
    case MaskMode::Ocr:
        return "ocr";
    }
    return "manual";
}

MaskMode FromMaskModeString(const std::string& str) {
    const std::string s = ToLower(str);
    if (s == "manual") { return MaskMode::Manual; }
    if (s == "ratio") { return MaskMode::Ratio; }
    if (s == "ocr") { return MaskMode::Ocr; }
    throw FormatError("Invalid mask mode: " + str);
}

const char* MaskSlotName(MaskSlotId slot) {
    return slot == MaskSlotId::Enemy ? "enemy" : "self";
}

std::string ToOutputFormatString(OutputFormat format) {
    switch (format) {
    case OutputFormat::Webp:
        return "webp";
    case OutputFormat::Png:
        return "png";
    case OutputFormat::Jpeg:
        return "jpeg";
    }
    return "webp";
}

OutputFormat FromOutputFormatString(const std::string& str) {
    const std::string s = ToLower(str);
    if (s == "webp") { return OutputFormat::Webp; }
    if (s == "png") { return OutputFormat::Png; }
    if (s == "jpeg" || s == "jpg") { return OutputFormat::Jpeg; }
    throw FormatError("Invalid output format: " + str);
}

const char* OutputFormatExtension(OutputFormat format) {
    switch (format) {
    case OutputFormat::Webp:
        return "webp";
    case OutputFormat::Png:
        return "png";
    case OutputFormat::Jpeg:
        return "jpg";
    }
    return "webp";
}

const char* OutputFormatMimeType(OutputFormat format) {
    switch (format) {
    case OutputFormat::Webp:
        return "image/webp";
    case OutputFormat::Png:
        return "image/png";
    case OutputFormat::Jpeg:
        return "image/jpeg";
    }
    return "application/octet-stream";
}

} // namespace ShotMontage
