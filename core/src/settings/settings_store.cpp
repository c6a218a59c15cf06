#include "shotmontage/settings.h"
#include "shotmontage/error.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace ShotMontage {

using nlohmann::json;

namespace {

static bool ReadDocument(const std::string& path, json& doc) {
    std::ifstream in(path);
    if (!in) { return false; }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        doc = json::parse(ss.str());
    } catch (const json::parse_error& e) {
        spdlog::warn("SettingsStore: {} is not valid JSON: {}", path, e.what());
        return false;
    }
    if (!doc.is_object()) {
        spdlog::warn("SettingsStore: {} does not hold a JSON object", path);
        return false;
    }
    return true;
}

} // namespace

SettingsStore::SettingsStore(std::string path) : path_(std::move(path)) {}

Settings SettingsStore::Load() const {
    if (!std::filesystem::exists(path_)) {
        spdlog::debug("SettingsStore: {} not found, using defaults", path_);
        return Settings::Defaults();
    }

    json doc;
    if (!ReadDocument(path_, doc)) { return Settings::Defaults(); }

    auto it = doc.find(kSettingsKey);
    if (it == doc.end()) {
        spdlog::debug("SettingsStore: no '{}' record, using defaults", kSettingsKey);
        return Settings::Defaults();
    }

    // Accept both an embedded object and a serialized string record.
    const std::string record = it->is_string() ? it->get<std::string>() : it->dump();
    try {
        Settings settings = SettingsFromJsonString(record);
        spdlog::info("SettingsStore: loaded settings from {}", path_);
        return settings;
    } catch (const FormatError& e) {
        spdlog::warn("SettingsStore: discarding stored settings: {}", e.what());
        return Settings::Defaults();
    }
}

void SettingsStore::Save(const Settings& settings) const {
    json doc = json::object();
    if (std::filesystem::exists(path_) && !ReadDocument(path_, doc)) { doc = json::object(); }

    doc[kSettingsKey] = json::parse(SettingsToJsonString(settings));

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) { throw IOError("Failed to open settings file for writing: " + tmp_path); }
        out << doc.dump(2) << '\n';
        if (!out) { throw IOError("Failed to write settings file: " + tmp_path); }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw IOError("Failed to replace settings file " + path_ + ": " + reason);
    }
    spdlog::debug("SettingsStore: saved settings to {}", path_);
}

} // namespace ShotMontage
