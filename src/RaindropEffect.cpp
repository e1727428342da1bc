/*
 * RaindropEffect.cpp - Raindrop effect on windshield
 */

#include "RaindropEffect.h"

static bool RainAvailable(RainEffectTarget* rain) {
    return rain && rain->IsAvailable();
}

static void ApplyRainValue(RainEffectTarget* rain, float value) {
    if (RainAvailable(rain)) {
        rain->SetValue(value);
    }
}

static void RestoreOriginalRain(RaindropEffect& effect, RainEffectTarget* rain) {
    if (!effect.savedOriginalRain) return;
    ApplyRainValue(rain, effect.originalRainValue);
    effect.savedOriginalRain = false;
}

/* Initialize the raindrop effect system */
void InitializeRaindropEffect(RaindropEffect& effect, RainEffectTarget* rain) {
    effect.currentIntensity = 0.0f;
    effect.targetIntensity = 0.0f;
    effect.updateTimer = 0.0f;
    effect.active = false;
    effect.originalRainValue = 0.0f;
    effect.savedOriginalRain = false;

    if (RainAvailable(rain)) {
        DebugLog("Raindrop effect system initialized");
    } else {
        DebugLog("WARNING: No rain dataref found - raindrop effect will not be visible");
    }
}

/* Clean up the raindrop effect system */
void CleanupRaindropEffect(RaindropEffect& effect, RainEffectTarget* rain) {
    RestoreOriginalRain(effect, rain);

    effect.currentIntensity = 0.0f;
    effect.targetIntensity = 0.0f;
    effect.active = false;

    DebugLog("Raindrop effect system cleaned up");
}

/* Count active water particles near the aircraft */
int CountNearbyParticles(const FireTruck* trucks, size_t truckCount,
                         double acX, double acY, double acZ) {
    int nearbyCount = 0;

    for (size_t t = 0; t < truckCount; ++t) {
        const std::vector<WaterParticle>& particles = trucks[t].particles;
        for (size_t i = 0; i < particles.size(); ++i) {
            const WaterParticle& particle = particles[i];
            if (!particle.active) continue;

            if (Distance2D(particle.x, particle.z, acX, acZ) > RAINDROP_DETECTION_RADIUS) continue;
            if (fabs(particle.y - acY) > RAINDROP_DETECTION_HEIGHT) continue;

            nearbyCount++;
        }
    }

    return nearbyCount;
}

void UpdateRaindropEffect(RaindropEffect& effect, float dt, bool spraying,
                          const FireTruck* trucks, size_t truckCount,
                          double acX, double acY, double acZ,
                          RainEffectTarget* rain) {
    if (!spraying) {
        /* Fade out the effect when not spraying */
        effect.targetIntensity = 0.0f;
        if (effect.currentIntensity > 0.0f) {
            effect.currentIntensity -= dt / RAINDROP_FADE_OUT_TIME;
            if (effect.currentIntensity < 0.0f) {
                effect.currentIntensity = 0.0f;
            }
            ApplyRainValue(rain, fminf(effect.originalRainValue + effect.currentIntensity, 1.0f));
        }

        /* Restore original value when effect is done */
        if (effect.currentIntensity == 0.0f && effect.savedOriginalRain) {
            RestoreOriginalRain(effect, rain);
            effect.active = false;
            DebugLog("Raindrop effect faded out completely");
        }
        return;
    }

    /* Save original rain value before first modification */
    if (!effect.savedOriginalRain) {
        effect.originalRainValue = RainAvailable(rain) ? rain->GetValue() : 0.0f;
        effect.savedOriginalRain = true;
        DebugLog("Saved original rain value: %.3f", effect.originalRainValue);
    }

    /* Detection runs less often than the fade */
    effect.updateTimer += dt;
    if (effect.updateTimer >= RAINDROP_UPDATE_INTERVAL) {
        effect.updateTimer = 0.0f;

        int nearbyParticles = CountNearbyParticles(trucks, truckCount, acX, acY, acZ);

        float particleRatio = static_cast<float>(nearbyParticles) /
                              static_cast<float>(NUM_PARTICLES_PER_JET * 2);
        effect.targetIntensity = fminf(particleRatio * RAINDROP_INTENSITY_MULTIPLIER, RAINDROP_EFFECT_MAX);

        if (nearbyParticles > 0 && !effect.active) {
            DebugLog("Aircraft entering water spray - %d particles nearby", nearbyParticles);
            effect.active = true;
        } else if (nearbyParticles == 0 && effect.active && effect.currentIntensity < 0.01f) {
            DebugLog("Aircraft left water spray area");
            effect.active = false;
        }
    }

    /* Fast in, slow out */
    if (effect.currentIntensity < effect.targetIntensity) {
        effect.currentIntensity += dt / RAINDROP_FADE_IN_TIME;
        if (effect.currentIntensity > effect.targetIntensity) {
            effect.currentIntensity = effect.targetIntensity;
        }
    } else if (effect.currentIntensity > effect.targetIntensity) {
        effect.currentIntensity -= dt / RAINDROP_FADE_OUT_TIME;
        if (effect.currentIntensity < effect.targetIntensity) {
            effect.currentIntensity = effect.targetIntensity;
        }
    }

    /* Added on top of any existing weather rain */
    float effectValue = fminf(effect.originalRainValue + effect.currentIntensity, 1.0f);
    ApplyRainValue(rain, effectValue);
}
