/*
 * CeremonySystem.h - Water salute ceremony state machine
 *
 * One CeremonySystem owns the ceremony state, both fire trucks, the road
 * network and the windshield effect. The host drives it with Update(dt)
 * once per frame and forwards start/stop/toggle/horn requests to it.
 */

#ifndef WATERARCH_CEREMONYSYSTEM_H
#define WATERARCH_CEREMONYSYSTEM_H

#include "Common.h"
#include "HostServices.h"
#include "Config.h"
#include "RoadNetwork.h"
#include "PathPlanning.h"
#include "FireTruck.h"
#include "RaindropEffect.h"

/* Sound gains before the user volume is applied */
static const float SOUND_WATER_SPRAY_GAIN = 0.8f;
static const float SOUND_TRUCK_ENGINE_GAIN = 0.6f;
static const float SOUND_TRUCK_HORN_GAIN = 0.9f;
static const float SOUND_SPRAY_HEIGHT_OFFSET = 5.0f; /* Spray sound sits above the trucks (meters) */

static const int TRUCK_COUNT = 2;
static const int LEFT_TRUCK = 0;
static const int RIGHT_TRUCK = 1;

/* How the water arch is shown */
enum WaterEffectMode {
    WATER_EFFECT_PARTICLES,  /* Simulated droplets (also feeds the windshield effect) */
    WATER_EFFECT_STREAM      /* One animated stream object per truck */
};

class CeremonySystem {
public:
    explicit CeremonySystem(const HostServices& services);

    void SetSettings(const UserSettings& settings);
    const UserSettings& GetSettings() const { return m_settings; }

    /* apt.dat files scanned for the road network, in priority order */
    void SetAptDatSearchPaths(const std::vector<std::string>& paths);

    /* Particle tuning and random seed, for reproducible runs */
    void SetParticlePhysics(const ParticlePhysics& physics);
    void SeedRandom(unsigned int seed);

    /* Returns false (state unchanged) when the request is rejected */
    bool Start();
    void Stop();
    void Toggle();
    void PlayHorn();

    void Update(float dt);

    /* Release every instance and sound right away and restore the rain value */
    void Shutdown();

    CeremonyState GetState() const { return m_state; }
    WaterEffectMode GetWaterEffectMode() const { return m_waterEffectMode; }
    FireTruck* GetTruckByIndex(int index);
    const FireTruck* GetTruckByIndex(int index) const;
    const RoadNetwork& GetRoadNetwork() const { return m_roadNetwork; }
    float GetRaindropIntensity() const { return m_raindrop.currentIntensity; }
    bool IsAutoStartArmed() const { return m_autoStartArmed; }

private:
    void SetState(CeremonyState state);
    void PlaceTrucks(double acX, double acZ, float acHeading, float wingspan);
    void PlanTruckRoutes(double acLat, double acLon);
    void CreateTruckVisuals();
    void EnterSpraying();
    void FinishCeremony();

    void UpdateApproach(float dt);
    void UpdateWaterEffect(float dt, bool active);
    void UpdateDeparture(float dt);
    void UpdateAutoStart();

    float SoundGain(float baseGain) const;
    void StartLoopSound(SoundCue cue, float baseGain);
    void StopSound(SoundCue cue);
    void StopAllSounds();
    void UpdateSoundPositions();

    void LogDebugStatus() const;

    HostServices m_services;
    UserSettings m_settings;
    std::vector<std::string> m_aptDatPaths;

    CeremonyState m_state;
    WaterEffectMode m_waterEffectMode;
    FireTruck m_trucks[TRUCK_COUNT];
    RoadNetwork m_roadNetwork;
    RaindropEffect m_raindrop;
    ParticlePhysics m_physics;
    SprayRandom m_rng;

    double m_elapsedTime;    /* Simulated seconds since construction */
    float m_debugLogTimer;   /* Timer for periodic debug logging */
    bool m_autoStartArmed;   /* Set while airborne, consumed on touchdown */
};

#endif /* WATERARCH_CEREMONYSYSTEM_H */
