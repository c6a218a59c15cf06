/// \file settings.h
/// \brief Per-run settings snapshot, validation, and the versioned persisted record.

#pragma once

#include "color.h"
#include "common.h"
#include "geometry.h"

#include <string>

namespace ShotMontage {

/// Configuration of one redaction mask slot.
struct MaskSlot {
    bool enabled  = false;
    MaskMode mode = MaskMode::Manual;
    Rect rect;       ///< Manual rectangle, source-image pixels.
    RatioRect ratio; ///< Fractions of the crop rectangle (ratio mode).
    Color color;     ///< Fill colour.

    bool operator==(const MaskSlot&) const = default;
};

/// Immutable-per-run snapshot of everything a montage run needs.
struct Settings {
    /// Current persisted schema version written by SettingsToJsonString().
    static constexpr int kSchemaVersion = 2;

    int col_count = 4; ///< Number of grid columns (>= 1).
    int offset    = 8; ///< Gutter in pixels on both axes (>= 0).
    Color background;  ///< Montage background colour.

    OutputFormat format = OutputFormat::Webp;
    int quality         = 80; ///< [1,100]; ignored for PNG.

    Rect crop{31, 117, 1538, 665};
    bool crop_auto = false; ///< Detect the crop rectangle from the first image.

    MaskSlot enemy_mask; ///< Right-hand slot.
    MaskSlot self_mask;  ///< Left-hand slot.

    /// Hardcoded defaults that persisted records are merged over.
    static Settings Defaults();

    MaskSlot& Slot(MaskSlotId id) { return id == MaskSlotId::Enemy ? enemy_mask : self_mask; }
    const MaskSlot& Slot(MaskSlotId id) const {
        return id == MaskSlotId::Enemy ? enemy_mask : self_mask;
    }

    bool operator==(const Settings&) const = default;
};

/// Validates user-editable fields before a run starts. Throws InputError with a
/// message naming the offending field.
///
/// Crop fields are only checked when crop_auto is off; mask rectangles only when
/// the slot is enabled in manual mode; ratio rectangles only in ratio mode.
void ValidateSettings(const Settings& settings);

/// Serializes settings to a JSON string at the current schema version.
std::string SettingsToJsonString(const Settings& settings);

/// Parses a persisted record of any known schema version, migrates it to the
/// current version, and merges it over Settings::Defaults(). Missing or
/// wrongly-typed fields keep their default. Throws FormatError when the text is
/// not a JSON object or carries a version newer than this build understands.
Settings SettingsFromJsonString(const std::string& json_str);

/// Key-value store backed by one JSON file. The settings record lives under
/// kSettingsKey; other keys in the file are preserved on save.
class SettingsStore {
public:
    static constexpr const char* kSettingsKey = "imageProcessorSettings";

    explicit SettingsStore(std::string path);

    /// Loads the record merged over defaults. A missing file, a missing key, or
    /// an unreadable file yield Settings::Defaults() (the latter with a warning).
    Settings Load() const;

    /// Writes the record under kSettingsKey. Throws IOError on failure.
    void Save(const Settings& settings) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace ShotMontage
