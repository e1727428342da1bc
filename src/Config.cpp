/*
 * Config.cpp - Configuration load/save using nlohmann::json
 */

#include "Config.h"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static void ReadBool(const json& config, const char* key, bool& value) {
    json::const_iterator it = config.find(key);
    if (it == config.end()) return;
    if (!it->is_boolean()) {
        DebugLog("Config: '%s' is not a boolean, keeping default", key);
        return;
    }
    value = it->get<bool>();
}

/* Numeric value inside [minValue, maxValue]; anything else keeps the current value */
static void ReadRangedFloat(const json& config, const char* key,
                            float minValue, float maxValue, float& value) {
    json::const_iterator it = config.find(key);
    if (it == config.end()) return;
    if (!it->is_number()) {
        DebugLog("Config: '%s' is not a number, keeping default", key);
        return;
    }
    float loaded = it->get<float>();
    if (!(loaded >= minValue && loaded <= maxValue)) {
        DebugLog("Config: '%s' = %.2f out of range [%.1f, %.1f], keeping default",
                 key, loaded, minValue, maxValue);
        return;
    }
    value = loaded;
}

bool LoadConfiguration(const std::string& path, UserSettings& settings) {
    DebugLog("Loading configuration...");
    settings = UserSettings();

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        DebugLog("No configuration file found at %s, using defaults", path.c_str());
        return false;
    }

    json config;
    try {
        file >> config;
    } catch (const json::exception& e) {
        DebugLog("Failed to parse configuration file %s (%s), using defaults", path.c_str(), e.what());
        return false;
    }

    if (!config.is_object()) {
        DebugLog("Configuration file %s does not hold an object, using defaults", path.c_str());
        return false;
    }

    ReadBool(config, "soundEnabled", settings.soundEnabled);
    ReadBool(config, "autoStartOnGround", settings.autoStartOnGround);

    json::const_iterator volume = config.find("soundVolume");
    if (volume != config.end()) {
        if (volume->is_number()) {
            double loaded = volume->get<double>();
            settings.soundVolume = static_cast<int>(Clamp(static_cast<float>(loaded), 0.0f, 100.0f) + 0.5f);
        } else {
            DebugLog("Config: 'soundVolume' is not a number, keeping default");
        }
    }

    ReadRangedFloat(config, "truckSpeed", MIN_TRUCK_SPEED, MAX_TRUCK_SPEED, settings.truckSpeed);
    ReadRangedFloat(config, "waterJetHeight", MIN_WATER_JET_HEIGHT, MAX_WATER_JET_HEIGHT,
                    settings.waterJetHeight);

    DebugLog("Configuration loaded from %s (sound %s, volume %d, auto start %s, speed %.1f m/s, jet %.1f m)",
             path.c_str(), settings.soundEnabled ? "on" : "off", settings.soundVolume,
             settings.autoStartOnGround ? "on" : "off", settings.truckSpeed, settings.waterJetHeight);
    return true;
}

bool SaveConfiguration(const std::string& path, const UserSettings& settings) {
    json config;
    config["soundEnabled"] = settings.soundEnabled;
    config["soundVolume"] = settings.soundVolume;
    config["autoStartOnGround"] = settings.autoStartOnGround;
    config["truckSpeed"] = settings.truckSpeed;
    config["waterJetHeight"] = settings.waterJetHeight;

    std::ofstream file(path.c_str());
    if (!file.is_open()) {
        DebugLog("WARNING: Failed to save configuration to %s", path.c_str());
        return false;
    }

    file << config.dump(4) << "\n";
    if (!file) {
        DebugLog("WARNING: Failed to write configuration to %s", path.c_str());
        return false;
    }

    DebugLog("Configuration saved to %s", path.c_str());
    return true;
}
