#include "shotmontage/shotmontage.h"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace ShotMontage;

namespace {

struct MaskOverrides {
    std::optional<bool> enabled;
    std::optional<MaskMode> mode;
    std::optional<Rect> rect;
    std::optional<RatioRect> ratio;
    std::optional<Color> color;
};

struct Options {
    std::vector<std::string> image_paths;
    std::string out_path;
    std::string settings_path = "shot_montage_settings.json";
    bool save_settings        = false;

    std::optional<int> cols;
    std::optional<int> offset;
    std::optional<Color> background;
    std::optional<OutputFormat> format;
    std::optional<int> quality;
    std::optional<Rect> crop;
    std::optional<bool> crop_auto;

    MaskOverrides enemy_mask;
    MaskOverrides self_mask;

    std::string tessdata_path;
    std::string ocr_language = "eng";

    std::string log_level = "info";
    std::string log_file;
};

void PrintUsage(const char* exe) {
    std::printf(
        "Usage: %s --image a.png [--image b.png ...] [options]\n"
        "       %s [options] a.png b.png ...\n"
        "Options:\n"
        "  --image PATH          Input screenshot (can be repeated, grid order)\n"
        "  --out PATH            Output file (default: montage_<timestamp>.<ext>)\n"
        "  --settings PATH       Settings store (default: shot_montage_settings.json)\n"
        "  --save-settings       Persist the effective settings after a successful run\n"
        "  --cols N              Grid columns (default 4)\n"
        "  --offset N            Gutter in pixels (default 8)\n"
        "  --bg #RRGGBB          Background colour (default #000000)\n"
        "  --format webp|png|jpeg  Output format (default webp)\n"
        "  --quality N           WebP/JPEG quality 1-100 (default 80)\n"
        "  --crop X,Y,W,H        Manual crop rectangle\n"
        "  --crop-auto 0|1       Detect the crop rectangle from the first image\n"
        "  --mask-enabled 0|1    Enable the enemy mask\n"
        "  --mask-mode manual|ratio|ocr   Enemy mask mode\n"
        "  --mask-rect X,Y,W,H   Enemy mask rectangle (manual mode)\n"
        "  --mask-ratio X0,Y0,X1,Y1       Enemy mask ratios of the crop (ratio mode)\n"
        "  --mask-color #RRGGBB  Enemy mask colour\n"
        "  --self-mask-*         Same options for the self mask\n"
        "  --tessdata PATH       Tesseract data directory (default: TESSDATA_PREFIX)\n"
        "  --ocr-lang LANG       Tesseract language (default eng)\n"
        "  --log-level LEVEL     Log level: trace/debug/info/warn/error/off (default: info)\n"
        "  --log-file PATH       Also append debug-level logs to PATH\n",
        exe, exe);
}

bool ParseInt(const char* s, int& out) {
    if (!s) { return false; }
    try {
        size_t idx = 0;
        int value  = std::stoi(s, &idx, 10);
        if (idx != std::string(s).size()) { return false; }
        out = value;
        return true;
    } catch (const std::exception&) { return false; }
}

bool ParseFloat(const std::string& s, float& out) {
    try {
        size_t idx  = 0;
        float value = std::stof(s, &idx);
        if (idx != s.size()) { return false; }
        out = value;
        return true;
    } catch (const std::exception&) { return false; }
}

bool ParseBool(const char* s, bool& out) {
    if (!s) { return false; }
    std::string v(s);
    if (v == "1" || v == "true" || v == "TRUE" || v == "True") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE" || v == "False") {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> SplitCommas(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) { parts.push_back(part); }
    return parts;
}

bool ParseRect(const char* s, Rect& out) {
    if (!s) { return false; }
    const std::vector<std::string> parts = SplitCommas(s);
    if (parts.size() != 4) { return false; }
    std::array<int, 4> v{};
    for (size_t i = 0; i < 4; ++i) {
        if (!ParseInt(parts[i].c_str(), v[i])) { return false; }
    }
    out = Rect{v[0], v[1], v[2], v[3]};
    return true;
}

bool ParseRatioRect(const char* s, RatioRect& out) {
    if (!s) { return false; }
    const std::vector<std::string> parts = SplitCommas(s);
    if (parts.size() != 4) { return false; }
    std::array<float, 4> v{};
    for (size_t i = 0; i < 4; ++i) {
        if (!ParseFloat(parts[i], v[i])) { return false; }
    }
    out = RatioRect{v[0], v[1], v[2], v[3]};
    return true;
}

bool ParseColor(const char* s, Color& out) {
    if (!s) { return false; }
    try {
        out = Color::FromHex(s);
        return true;
    } catch (const Error&) { return false; }
}

bool ParseMaskMode(const char* s, MaskMode& out) {
    if (!s) { return false; }
    try {
        out = FromMaskModeString(s);
        return true;
    } catch (const Error&) { return false; }
}

bool ParseFormat(const char* s, OutputFormat& out) {
    if (!s) { return false; }
    try {
        out = FromOutputFormatString(s);
        return true;
    } catch (const Error&) { return false; }
}

/// Consumes a "--<prefix>-<field> VALUE" pair. Returns false on a bad value;
/// \p matched reports whether the flag belonged to this slot at all.
bool ParseMaskArg(const std::string& arg, const std::string& prefix, const char* value,
                  MaskOverrides& mask, bool& matched) {
    matched = true;
    if (arg == prefix + "-enabled") {
        bool v = false;
        if (!ParseBool(value, v)) { return false; }
        mask.enabled = v;
        return true;
    }
    if (arg == prefix + "-mode") {
        MaskMode v = MaskMode::Manual;
        if (!ParseMaskMode(value, v)) { return false; }
        mask.mode = v;
        return true;
    }
    if (arg == prefix + "-rect") {
        Rect v;
        if (!ParseRect(value, v)) { return false; }
        mask.rect = v;
        return true;
    }
    if (arg == prefix + "-ratio") {
        RatioRect v;
        if (!ParseRatioRect(value, v)) { return false; }
        mask.ratio = v;
        return true;
    }
    if (arg == prefix + "-color") {
        Color v;
        if (!ParseColor(value, v)) { return false; }
        mask.color = v;
        return true;
    }
    matched = false;
    return true;
}

bool ParseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        }
        if (arg == "--save-settings") {
            opt.save_settings = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            opt.image_paths.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            std::fprintf(stderr, "Missing value for %s\n", arg.c_str());
            return false;
        }
        const char* value = argv[++i];

        if (arg == "--image") {
            opt.image_paths.push_back(value);
            continue;
        }
        if (arg == "--out") {
            opt.out_path = value;
            continue;
        }
        if (arg == "--settings") {
            opt.settings_path = value;
            continue;
        }
        if (arg == "--cols") {
            int v = 0;
            if (!ParseInt(value, v) || v < 1) {
                std::fprintf(stderr, "Invalid --cols value\n");
                return false;
            }
            opt.cols = v;
            continue;
        }
        if (arg == "--offset") {
            int v = 0;
            if (!ParseInt(value, v) || v < 0) {
                std::fprintf(stderr, "Invalid --offset value\n");
                return false;
            }
            opt.offset = v;
            continue;
        }
        if (arg == "--bg") {
            Color v;
            if (!ParseColor(value, v)) {
                std::fprintf(stderr, "Invalid --bg value\n");
                return false;
            }
            opt.background = v;
            continue;
        }
        if (arg == "--format") {
            OutputFormat v = OutputFormat::Webp;
            if (!ParseFormat(value, v)) {
                std::fprintf(stderr, "Invalid --format value\n");
                return false;
            }
            opt.format = v;
            continue;
        }
        if (arg == "--quality") {
            int v = 0;
            if (!ParseInt(value, v) || v < 1 || v > 100) {
                std::fprintf(stderr, "Invalid --quality value\n");
                return false;
            }
            opt.quality = v;
            continue;
        }
        if (arg == "--crop") {
            Rect v;
            if (!ParseRect(value, v)) {
                std::fprintf(stderr, "Invalid --crop value (expected X,Y,W,H)\n");
                return false;
            }
            opt.crop = v;
            continue;
        }
        if (arg == "--crop-auto") {
            bool v = false;
            if (!ParseBool(value, v)) {
                std::fprintf(stderr, "Invalid --crop-auto value\n");
                return false;
            }
            opt.crop_auto = v;
            continue;
        }
        if (arg == "--tessdata") {
            opt.tessdata_path = value;
            continue;
        }
        if (arg == "--ocr-lang") {
            opt.ocr_language = value;
            continue;
        }
        if (arg == "--log-level") {
            opt.log_level = value;
            continue;
        }
        if (arg == "--log-file") {
            opt.log_file = value;
            continue;
        }

        bool matched = false;
        for (auto [prefix, mask] : {std::pair{"--self-mask", &opt.self_mask},
                                    std::pair{"--mask", &opt.enemy_mask}}) {
            if (!ParseMaskArg(arg, prefix, value, *mask, matched)) {
                std::fprintf(stderr, "Invalid %s value\n", arg.c_str());
                return false;
            }
            if (matched) { break; }
        }
        if (matched) { continue; }

        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
        PrintUsage(argv[0]);
        return false;
    }
    return true;
}

void ApplyMaskOverrides(const MaskOverrides& overrides, MaskSlot& slot) {
    if (overrides.enabled) { slot.enabled = *overrides.enabled; }
    if (overrides.mode) { slot.mode = *overrides.mode; }
    if (overrides.rect) { slot.rect = *overrides.rect; }
    if (overrides.ratio) { slot.ratio = *overrides.ratio; }
    if (overrides.color) { slot.color = *overrides.color; }
}

Settings ApplyOverrides(const Options& opt, Settings settings) {
    if (opt.cols) { settings.col_count = *opt.cols; }
    if (opt.offset) { settings.offset = *opt.offset; }
    if (opt.background) { settings.background = *opt.background; }
    if (opt.format) { settings.format = *opt.format; }
    if (opt.quality) { settings.quality = *opt.quality; }
    if (opt.crop) { settings.crop = *opt.crop; }
    if (opt.crop_auto) { settings.crop_auto = *opt.crop_auto; }
    ApplyMaskOverrides(opt.enemy_mask, settings.enemy_mask);
    ApplyMaskOverrides(opt.self_mask, settings.self_mask);
    return settings;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    if (!ParseArgs(argc, argv, opt)) { return 1; }

    try {
        InitLogging(ParseLogLevel(opt.log_level), opt.log_file);
    } catch (const Error& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    if (opt.image_paths.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        SettingsStore store(opt.settings_path);

        MontageRequest req;
        req.settings = ApplyOverrides(opt, store.Load());
        req.images.reserve(opt.image_paths.size());
        for (const std::string& path : opt.image_paths) {
            req.images.push_back(ImageSource::FromPath(path));
        }
        req.progress = [](RunPhase phase, float percent) {
            spdlog::debug("Progress: {} {:.0f}%", RunPhaseToString(phase), percent * 100.0f);
        };

        TesseractConfig ocr_cfg;
        ocr_cfg.data_path = opt.tessdata_path;
        ocr_cfg.language  = opt.ocr_language;

        MontagePipeline pipeline(TesseractEngineFactory(ocr_cfg));
        std::optional<MontageResult> result = pipeline.Run(req);
        if (!result) {
            spdlog::error("Failed: pipeline is busy");
            return 1;
        }

        for (DetectionFallback fallback : result->fallbacks) {
            spdlog::warn("Fallback: {}", DetectionFallbackToString(fallback));
        }

        const std::string out_path = opt.out_path.empty() ? result->filename : opt.out_path;
        WriteBlob(result->blob, out_path);
        spdlog::info("Saved {} ({}x{}, {} tile(s), {} bytes) to {}", result->mime_type,
                     result->width, result->height, result->tile_count, result->blob.size(),
                     out_path);

        if (opt.save_settings) {
            store.Save(result->effective_settings);
            spdlog::info("Saved settings to {}", store.path());
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed: {}", e.what());
        return 1;
    }

    return 0;
}
