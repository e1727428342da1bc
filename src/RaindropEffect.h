/*
 * RaindropEffect.h - Water drops on the windshield
 *
 * When the aircraft passes through the water arch, spray particles near
 * the aircraft raise the host's rain-on-aircraft value so drops appear on
 * the windshield. The value the host had before is restored once the
 * effect has faded out.
 */

#ifndef WATERARCH_RAINDROPEFFECT_H
#define WATERARCH_RAINDROPEFFECT_H

#include "Common.h"
#include "HostServices.h"
#include "FireTruck.h"

/* Raindrop effect state */
struct RaindropEffect {
    float currentIntensity;  /* Current raindrop intensity (0.0 - 1.0) */
    float targetIntensity;   /* Intensity the current one is fading toward */
    float updateTimer;       /* Timer for detection updates */
    bool active;             /* Aircraft currently inside the spray */
    float originalRainValue; /* Host rain value before we modified it */
    bool savedOriginalRain;  /* Whether originalRainValue holds a saved value */
};

void InitializeRaindropEffect(RaindropEffect& effect, RainEffectTarget* rain);
void CleanupRaindropEffect(RaindropEffect& effect, RainEffectTarget* rain);

int CountNearbyParticles(const FireTruck* trucks, size_t truckCount,
                         double acX, double acY, double acZ);

/*
 * Advance the effect by dt. While spraying, the nearby particle count is
 * sampled every RAINDROP_UPDATE_INTERVAL seconds and the intensity chases
 * the derived target; otherwise it fades to zero and the saved host value
 * is restored.
 */
void UpdateRaindropEffect(RaindropEffect& effect, float dt, bool spraying,
                          const FireTruck* trucks, size_t truckCount,
                          double acX, double acY, double acZ,
                          RainEffectTarget* rain);

#endif /* WATERARCH_RAINDROPEFFECT_H */
