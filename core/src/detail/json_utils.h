/// \file detail/json_utils.h
/// \brief Lenient field readers used when merging persisted records over defaults.

#pragma once

#include "shotmontage/color.h"
#include "shotmontage/common.h"
#include "shotmontage/error.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <string>

namespace ShotMontage::detail {

/// Integer field, or \p fallback when missing, not an integer or outside int range.
inline int IntOr(const nlohmann::json& j, const std::string& key, int fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) { return fallback; }
    if (it->is_number_unsigned()) {
        if (it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            spdlog::debug("Settings: ignoring {}: out of range", key);
            return fallback;
        }
        return static_cast<int>(it->get<uint64_t>());
    }
    const int64_t value = it->get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        spdlog::debug("Settings: ignoring {}: out of range", key);
        return fallback;
    }
    return static_cast<int>(value);
}

/// Numeric field as float, or \p fallback when missing or not a number.
inline float FloatOr(const nlohmann::json& j, const std::string& key, float fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) { return fallback; }
    return it->get<float>();
}

/// Boolean field, or \p fallback when missing or not a boolean.
inline bool BoolOr(const nlohmann::json& j, const std::string& key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) { return fallback; }
    return it->get<bool>();
}

/// "#rrggbb" field, or \p fallback when missing or malformed.
inline Color ColorOr(const nlohmann::json& j, const std::string& key, const Color& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) { return fallback; }
    try {
        return Color::FromHex(it->get<std::string>());
    } catch (const InputError& e) {
        spdlog::debug("Settings: ignoring {}: {}", key, e.what());
        return fallback;
    }
}

/// Mask mode field, or \p fallback when missing or unknown.
inline MaskMode MaskModeOr(const nlohmann::json& j, const std::string& key, MaskMode fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) { return fallback; }
    try {
        return FromMaskModeString(it->get<std::string>());
    } catch (const FormatError& e) {
        spdlog::debug("Settings: ignoring {}: {}", key, e.what());
        return fallback;
    }
}

/// Output format field, or \p fallback when missing or unknown.
inline OutputFormat OutputFormatOr(const nlohmann::json& j, const std::string& key,
                                   OutputFormat fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) { return fallback; }
    try {
        return FromOutputFormatString(it->get<std::string>());
    } catch (const FormatError& e) {
        spdlog::debug("Settings: ignoring {}: {}", key, e.what());
        return fallback;
    }
}

} // namespace ShotMontage::detail
