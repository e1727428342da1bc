/*
 * Config.h - Persisted user settings
 *
 * Settings live in a small JSON file next to the plugin. Missing or bad
 * values fall back to their defaults one by one.
 */

#ifndef WATERARCH_CONFIG_H
#define WATERARCH_CONFIG_H

#include "Common.h"

static const char* const CONFIG_FILE_NAME = "waterarch_config.json";

static const int   DEFAULT_SOUND_VOLUME = 100;
static const float MIN_TRUCK_SPEED = 1.0f;         /* Lowest accepted cruise speed (m/s) */
static const float MAX_TRUCK_SPEED = 40.0f;        /* Highest accepted cruise speed (m/s) */
static const float MIN_WATER_JET_HEIGHT = 5.0f;    /* Lowest accepted arch height (meters) */
static const float MAX_WATER_JET_HEIGHT = 60.0f;   /* Highest accepted arch height (meters) */

/* User settings (with defaults) */
struct UserSettings {
    bool soundEnabled;
    int soundVolume;         /* 0-100 percentage */
    bool autoStartOnGround;  /* Start automatically after landing */
    float truckSpeed;        /* Truck cruise speed in m/s */
    float waterJetHeight;    /* Water arch height in meters */

    UserSettings()
        : soundEnabled(true), soundVolume(DEFAULT_SOUND_VOLUME), autoStartOnGround(false),
          truckSpeed(TRUCK_APPROACH_SPEED), waterJetHeight(WATER_JET_HEIGHT) {}
};

/*
 * LoadConfiguration - Reset settings to defaults, then apply the file at path
 *
 * Returns true when the file was opened and parsed. Keys with the wrong
 * type or an out-of-range value keep their default.
 */
bool LoadConfiguration(const std::string& path, UserSettings& settings);

/* Write every setting as pretty-printed JSON; false when the file cannot be written */
bool SaveConfiguration(const std::string& path, const UserSettings& settings);

#endif /* WATERARCH_CONFIG_H */
