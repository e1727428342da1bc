/*
 * FireTruck.h - Fire truck structure, movement and water spray
 *
 * This module handles fire truck data structures, steering control,
 * approach/departure movement and the particle-based water jet.
 */

#ifndef WATERARCH_FIRETRUCK_H
#define WATERARCH_FIRETRUCK_H

#include "Common.h"
#include "HostServices.h"
#include "PathPlanning.h"

/* Random source for spray spread and turbulence */
typedef std::mt19937 SprayRandom;

/* Water particle */
struct WaterParticle {
    float x, y, z;           /* Current position */
    float vx, vy, vz;        /* Velocity */
    float lifetime;          /* Remaining lifetime */
    float maxLifetime;       /* Original lifetime */
    bool active;
    VisualHandle instance;   /* Instance for rendering this particle */
};

/* Particle simulation tuning */
struct ParticlePhysics {
    float gravity;           /* m/s^2 */
    float drag;              /* Quadratic drag coefficient */
    float turbulence;        /* Random velocity kick per tick */
    float spreadAngle;       /* Random pitch/yaw spread at emission (radians) */
    float emitTurbulence;    /* Scale of the random velocity added at emission */
    float lifetime;          /* Seconds */
    float emitInterval;      /* Seconds between emissions */
    int maxActive;           /* Active particle cap per truck */
};

ParticlePhysics DefaultParticlePhysics();

/* Fire truck */
struct FireTruck {
    VisualHandle instance;
    VisualHandle streamInstance; /* Water stream instance (stream effect mode) */
    double x, y, z;          /* Current position (OpenGL coords) */
    float heading;           /* Current heading in degrees */
    float targetX, targetZ;  /* Target position */
    float targetHeading;     /* Target heading */
    bool positioned;         /* Has reached target position */
    bool isTurningAtTarget;  /* Arrived, now turning to targetHeading */
    std::vector<WaterParticle> particles;
    double lastEmitTime;     /* Time of last particle emission */
    int particlesEmitted;    /* Particles emitted since initialization */
    float nozzleOffsetX;     /* Nozzle position offset from truck center */
    float nozzleOffsetY;     /* Nozzle height */
    float nozzleOffsetZ;     /* Nozzle forward offset */
    float frontSteeringAngle;     /* Front axles steering angle in degrees (-45 to 45) */
    float rearSteeringAngle;      /* Rear axle steering angle in degrees (-45 to 45) */
    float wheelRotationAngle;     /* Wheel rotation angle in degrees (0-360) */
    float cannonPitch;       /* Water cannon pitch angle in degrees (0 to 90) */
    float cannonYaw;         /* Water cannon yaw angle in degrees (-180 to 180) */
    float speed;             /* Current speed in m/s */
    float targetSpeed;       /* Target speed in m/s (for smooth acceleration/deceleration) */
    float cruiseSpeed;       /* Approach speed in m/s */
    float jetHeight;         /* Water arch height in meters */
    bool isTurningBeforeLeave; /* True while the truck turns before leaving */
    float leaveHeading;      /* Heading to use when leaving */
    PlannedRoute route;      /* Planned path from road network */
    bool useRoadNetwork;     /* Whether to follow the route or approach directly */
};

/* Lifecycle */
void InitializeTruck(FireTruck& truck);
void CleanupTruck(FireTruck& truck, VisualFactory* visuals);

/* Externally writable controls (clamped) */
void SetFrontSteeringAngle(FireTruck& truck, float angle);
void SetRearSteeringAngle(FireTruck& truck, float angle);
void SetCannonPitch(FireTruck& truck, float pitch);
void SetCannonYaw(FireTruck& truck, float yaw);

/* Movement */
void UpdateWheelRotationAngle(FireTruck& truck, float distanceMoved);
float IntegrateTruckMotion(FireTruck& truck, float dt, TerrainProbe* terrain, float maxDistance);
bool RotateTruckInPlace(FireTruck& truck, float desiredHeading, float dt, TerrainProbe* terrain);
void UpdateTruckDirect(FireTruck& truck, float dt, TerrainProbe* terrain);
void UpdateTruckFollowingPath(FireTruck& truck, float dt, TerrainProbe* terrain);
void UpdateTruckPosition(FireTruck& truck, float dt, TerrainProbe* terrain);
void BeginTruckDeparture(FireTruck& truck, bool isLeftTruck);
bool UpdateTruckLeaving(FireTruck& truck, float dt, TerrainProbe* terrain, double acX, double acZ);
void SyncTruckVisual(const FireTruck& truck, VisualFactory* visuals);

/* Water particle functions */
void GetNozzlePosition(const FireTruck& truck, float& x, float& y, float& z);
void EmitParticle(FireTruck& truck, const ParticlePhysics& physics, SprayRandom& rng,
                  VisualFactory* visuals);
void UpdateParticle(WaterParticle& particle, float dt, const ParticlePhysics& physics,
                    SprayRandom& rng, TerrainProbe* terrain, VisualFactory* visuals);
void UpdateTruckParticles(FireTruck& truck, float dt, double currentTime, bool emitting,
                          const ParticlePhysics& physics, SprayRandom& rng,
                          TerrainProbe* terrain, VisualFactory* visuals);
int CountActiveParticles(const FireTruck& truck);

/* Water stream functions */
void UpdateTruckWaterStream(FireTruck& truck, bool active, VisualFactory* visuals);

#endif /* WATERARCH_FIRETRUCK_H */
