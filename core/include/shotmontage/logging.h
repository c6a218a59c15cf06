/// \file logging.h
/// \brief Logging initialization and utilities.

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace ShotMontage {

/// Name of the logger installed by InitLogging().
inline constexpr const char* kLoggerName = "shotmontage";

/// Installs the default "shotmontage" logger: a colour stdout sink plus, when
/// \p log_file is non-empty, a file sink that always records debug detail.
/// Call once at the start of main() before any logging. Throws IOError when the
/// log file cannot be opened.
/// \param level Console log level (default: info)
/// \param log_file Optional path of a log file (appended to)
void InitLogging(spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& log_file = {});

/// Parses a log level string to spdlog level enum.
/// \param str Log level string ("trace", "debug", "info", "warn", "error", "off")
/// \return Parsed log level, or spdlog::level::info if unrecognized
spdlog::level::level_enum ParseLogLevel(const std::string& str);

} // namespace ShotMontage
