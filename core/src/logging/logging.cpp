#include "shotmontage/logging.h"
#include "shotmontage/error.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

namespace ShotMontage {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

} // namespace

void InitLogging(spdlog::level::level_enum level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(level);
    sinks.push_back(console);

    if (!log_file.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
            file->set_level(std::min(level, spdlog::level::debug));
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            throw IOError("Failed to open log file " + log_file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    // The logger passes everything its most verbose sink wants; sinks filter.
    logger->set_level(sinks.size() > 1 ? std::min(level, spdlog::level::debug) : level);
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum ParseLogLevel(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "trace") { return spdlog::level::trace; }
    if (s == "debug") { return spdlog::level::debug; }
    if (s == "info") { return spdlog::level::info; }
    if (s == "warn" || s == "warning") { return spdlog::level::warn; }
    if (s == "error" || s == "err") { return spdlog::level::err; }
    if (s == "critical" || s == "fatal") { return spdlog::level::critical; }
    if (s == "off") { return spdlog::level::off; }
    return spdlog::level::info;
}

} // namespace ShotMontage
