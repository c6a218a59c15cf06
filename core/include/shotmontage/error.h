#pragma once

/// \file error.h
/// \brief Typed error hierarchy for ShotMontage.
///
/// All public functions throw subclasses of ShotMontage::Error instead of
/// plain std::runtime_error, so callers can catch specific categories.
/// Detection misses (no crop found, no OCR anchor) are not errors; they are
/// reported through std::optional results and DetectionFallback entries.

#include "export.h"

#include <stdexcept>
#include <string>

namespace ShotMontage {

/// Error categories returned by Error::code().
enum class ErrorCode : int {
    Ok = 0,
    InvalidInput,       ///< Caller supplied invalid settings or arguments.
    IOError,            ///< File or stream I/O failure.
    FormatError,        ///< Data format / parsing error.
    DecodeFailed,       ///< An input image could not be decoded.
    SurfaceUnavailable, ///< A raster surface could not be allocated.
    EncodeFailed,       ///< Output encoding failed or timed out.
    OcrFailed,          ///< The OCR engine could not start or recognise.
    InternalError,      ///< Unexpected failure; the pipeline was reset.
};

/// Returns a short lowercase name for an error code.
SHOTMONTAGE_API const char* ErrorCodeToString(ErrorCode code);

/// Base exception for all ShotMontage errors.
class SHOTMONTAGE_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Invalid input arguments or settings.
class SHOTMONTAGE_API InputError : public Error {
public:
    explicit InputError(const std::string& msg)
        : Error(ErrorCode::InvalidInput, msg) {}
};

/// File / stream I/O failure.
class SHOTMONTAGE_API IOError : public Error {
public:
    explicit IOError(const std::string& msg)
        : Error(ErrorCode::IOError, msg) {}
};

/// Data format / parsing failure.
class SHOTMONTAGE_API FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorCode::FormatError, msg) {}
};

/// Image bytes could not be turned into a bitmap, even via the fallback path.
class SHOTMONTAGE_API DecodeError : public Error {
public:
    explicit DecodeError(const std::string& msg)
        : Error(ErrorCode::DecodeFailed, msg) {}
};

/// Drawing context for a scratch or montage surface could not be acquired.
class SHOTMONTAGE_API SurfaceError : public Error {
public:
    explicit SurfaceError(const std::string& msg)
        : Error(ErrorCode::SurfaceUnavailable, msg) {}
};

/// Montage encoding failed or exceeded its timeout.
class SHOTMONTAGE_API EncodeError : public Error {
public:
    explicit EncodeError(const std::string& msg)
        : Error(ErrorCode::EncodeFailed, msg) {}
};

/// OCR engine initialisation or recognition failure.
class SHOTMONTAGE_API OcrError : public Error {
public:
    explicit OcrError(const std::string& msg)
        : Error(ErrorCode::OcrFailed, msg) {}
};

/// Unexpected failure inside a run. Raised after all run resources were released.
class SHOTMONTAGE_API InternalError : public Error {
public:
    explicit InternalError(const std::string& msg)
        : Error(ErrorCode::InternalError, msg) {}
};

} // namespace ShotMontage
