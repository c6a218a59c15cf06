#include "shotmontage/settings.h"
#include "shotmontage/error.h"
#include "detail/json_utils.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <string>

namespace ShotMontage {

using nlohmann::json;

namespace {

constexpr const char* kEnemyPrefix = "mask";
constexpr const char* kSelfPrefix  = "selfMask";
constexpr const char* kVersionKey  = "schemaVersion";

// Records written before versioning carry no version field.
constexpr int kUnversioned = 1;

static std::string Key(const char* prefix, const char* field) {
    return std::string(prefix) + field;
}

static void SlotToJson(const MaskSlot& slot, const char* prefix, json& j) {
    j[Key(prefix, "Enabled")] = slot.enabled;
    j[Key(prefix, "Mode")]    = ToMaskModeString(slot.mode);
    j[Key(prefix, "X")]       = slot.rect.x;
    j[Key(prefix, "Y")]       = slot.rect.y;
    j[Key(prefix, "Width")]   = slot.rect.width;
    j[Key(prefix, "Height")]  = slot.rect.height;
    j[Key(prefix, "RatioX0")] = slot.ratio.rx0;
    j[Key(prefix, "RatioY0")] = slot.ratio.ry0;
    j[Key(prefix, "RatioX1")] = slot.ratio.rx1;
    j[Key(prefix, "RatioY1")] = slot.ratio.ry1;
    j[Key(prefix, "Color")]   = slot.color.ToHex();
}

static MaskSlot SlotFromJson(const json& j, const char* prefix, const MaskSlot& defaults) {
    MaskSlot slot;
    slot.enabled     = detail::BoolOr(j, Key(prefix, "Enabled"), defaults.enabled);
    slot.mode        = detail::MaskModeOr(j, Key(prefix, "Mode"), defaults.mode);
    slot.rect.x      = detail::IntOr(j, Key(prefix, "X"), defaults.rect.x);
    slot.rect.y      = detail::IntOr(j, Key(prefix, "Y"), defaults.rect.y);
    slot.rect.width  = detail::IntOr(j, Key(prefix, "Width"), defaults.rect.width);
    slot.rect.height = detail::IntOr(j, Key(prefix, "Height"), defaults.rect.height);
    slot.ratio.rx0   = detail::FloatOr(j, Key(prefix, "RatioX0"), defaults.ratio.rx0);
    slot.ratio.ry0   = detail::FloatOr(j, Key(prefix, "RatioY0"), defaults.ratio.ry0);
    slot.ratio.rx1   = detail::FloatOr(j, Key(prefix, "RatioX1"), defaults.ratio.rx1);
    slot.ratio.ry1   = detail::FloatOr(j, Key(prefix, "RatioY1"), defaults.ratio.ry1);
    slot.color       = detail::ColorOr(j, Key(prefix, "Color"), defaults.color);
    return slot;
}

// v1 is the original flat record: offsetX/offsetY, webpMethod, boolean *Auto flags.
static void MigrateV1ToV2(json& j) {
    if (j.contains("offsetX") && !j.contains("offset")) { j["offset"] = j["offsetX"]; }
    j.erase("offsetX");
    j.erase("offsetY");
    j.erase("webpMethod");

    for (const char* prefix : {kEnemyPrefix, kSelfPrefix}) {
        const std::string auto_key = Key(prefix, "Auto");
        const std::string mode_key = Key(prefix, "Mode");
        auto it                    = j.find(auto_key);
        if (it == j.end()) { continue; }
        if (it->is_boolean() && !j.contains(mode_key)) {
            j[mode_key] = it->get<bool>() ? "ocr" : "manual";
        }
        j.erase(auto_key);
    }
    j[kVersionKey] = 2;
}

using Migration = void (*)(json&);

// kMigrations[v - 1] upgrades a record from version v to v + 1.
constexpr std::array<Migration, Settings::kSchemaVersion - 1> kMigrations = {&MigrateV1ToV2};

static void MigrateToCurrent(json& j) {
    int version = kUnversioned;
    auto it     = j.find(kVersionKey);
    if (it != j.end()) {
        if (!it->is_number_integer()) { throw FormatError("schemaVersion must be an integer"); }
        version = it->get<int>();
    }
    if (version < kUnversioned) {
        throw FormatError("Invalid settings schemaVersion: " + std::to_string(version));
    }
    if (version > Settings::kSchemaVersion) {
        throw FormatError("Settings schemaVersion " + std::to_string(version) +
                          " is newer than supported version " +
                          std::to_string(Settings::kSchemaVersion));
    }
    while (version < Settings::kSchemaVersion) {
        spdlog::debug("Settings: migrating record v{} -> v{}", version, version + 1);
        kMigrations[static_cast<size_t>(version - 1)](j);
        ++version;
    }
}

static void ValidateManualRect(const Rect& rect, const std::string& what) {
    if (rect.width <= 0 || rect.height <= 0) {
        throw InputError(what + " Width and Height must be positive values.");
    }
    if (rect.x < 0 || rect.y < 0) {
        throw InputError(what + " X and Y coordinates cannot be negative.");
    }
}

static void ValidateSlot(const MaskSlot& slot, MaskSlotId id) {
    if (!slot.enabled) { return; }
    const std::string what = std::string("Mask (") + MaskSlotName(id) + ")";
    switch (slot.mode) {
    case MaskMode::Manual:
        ValidateManualRect(slot.rect, what);
        return;
    case MaskMode::Ratio:
        if (!slot.ratio.IsValid()) {
            throw InputError(what + " ratios must lie in [0,1] with start <= end.");
        }
        return;
    case MaskMode::Ocr:
        return;
    }
}

} // namespace

Settings Settings::Defaults() {
    Settings s;
    s.col_count  = 4;
    s.offset     = 8;
    s.background = Color{0, 0, 0};
    s.format     = OutputFormat::Webp;
    s.quality    = 80;
    s.crop       = Rect{31, 117, 1538, 665};
    s.crop_auto  = false;

    s.enemy_mask.enabled = false;
    s.enemy_mask.mode    = MaskMode::Manual;
    s.enemy_mask.rect    = Rect{1308, 209, 258, 38};
    s.enemy_mask.ratio   = RatioRect{0.8303f, 0.1383f, 0.9980f, 0.1955f};
    s.enemy_mask.color   = Color{0xff, 0xe1, 0xd8};

    s.self_mask.enabled = false;
    s.self_mask.mode    = MaskMode::Manual;
    s.self_mask.rect    = Rect{0, 0, 100, 100};
    s.self_mask.ratio   = RatioRect{0.0020f, 0.1383f, 0.1697f, 0.1955f};
    s.self_mask.color   = Color{0xff, 0xff, 0xff};
    return s;
}

void ValidateSettings(const Settings& settings) {
    if (settings.col_count <= 0) { throw InputError("Columns must be a positive number."); }
    if (settings.offset < 0) { throw InputError("Offset (px) cannot be negative."); }
    if (settings.quality < 1 || settings.quality > 100) {
        throw InputError("Quality must be between 1 and 100.");
    }
    if (!settings.crop_auto) { ValidateManualRect(settings.crop, "Cropping"); }
    ValidateSlot(settings.enemy_mask, MaskSlotId::Enemy);
    ValidateSlot(settings.self_mask, MaskSlotId::Self);
}

std::string SettingsToJsonString(const Settings& settings) {
    json j;
    j[kVersionKey]  = Settings::kSchemaVersion;
    j["colCount"]   = settings.col_count;
    j["offset"]     = settings.offset;
    j["bgColor"]    = settings.background.ToHex();
    j["format"]     = ToOutputFormatString(settings.format);
    j["quality"]    = settings.quality;
    j["cropX"]      = settings.crop.x;
    j["cropY"]      = settings.crop.y;
    j["cropWidth"]  = settings.crop.width;
    j["cropHeight"] = settings.crop.height;
    j["cropAuto"]   = settings.crop_auto;
    SlotToJson(settings.enemy_mask, kEnemyPrefix, j);
    SlotToJson(settings.self_mask, kSelfPrefix, j);
    return j.dump(2);
}

Settings SettingsFromJsonString(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("Settings record is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) { throw FormatError("Settings record must be a JSON object"); }

    MigrateToCurrent(j);

    const Settings defaults = Settings::Defaults();
    Settings s;
    s.col_count   = detail::IntOr(j, "colCount", defaults.col_count);
    s.offset      = detail::IntOr(j, "offset", defaults.offset);
    s.background  = detail::ColorOr(j, "bgColor", defaults.background);
    s.format      = detail::OutputFormatOr(j, "format", defaults.format);
    s.quality     = detail::IntOr(j, "quality", defaults.quality);
    s.crop.x      = detail::IntOr(j, "cropX", defaults.crop.x);
    s.crop.y      = detail::IntOr(j, "cropY", defaults.crop.y);
    s.crop.width  = detail::IntOr(j, "cropWidth", defaults.crop.width);
    s.crop.height = detail::IntOr(j, "cropHeight", defaults.crop.height);
    s.crop_auto   = detail::BoolOr(j, "cropAuto", defaults.crop_auto);
    s.enemy_mask  = SlotFromJson(j, kEnemyPrefix, defaults.enemy_mask);
    s.self_mask   = SlotFromJson(j, kSelfPrefix, defaults.self_mask);
    return s;
}

} // namespace ShotMontage
