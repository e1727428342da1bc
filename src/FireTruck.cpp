/*
 * FireTruck.cpp - Fire truck management and movement
 */

#include "FireTruck.h"

/* Terrain height at a planar point, 0 without a probe */
static float SampleTerrain(TerrainProbe* terrain, float x, float z) {
    if (!terrain) {
        return 0.0f;
    }
    return terrain->GetTerrainHeight(x, z);
}

static float RandomSpread(SprayRandom& rng) {
    std::uniform_real_distribution<float> randomDist(-0.5f, 0.5f);
    return randomDist(rng);
}

ParticlePhysics DefaultParticlePhysics() {
    ParticlePhysics physics;
    physics.gravity = PARTICLE_GRAVITY;
    physics.drag = PARTICLE_DRAG;
    physics.turbulence = PARTICLE_TURBULENCE;
    physics.spreadAngle = PARTICLE_SPREAD_ANGLE;
    physics.emitTurbulence = 1.0f;
    physics.lifetime = PARTICLE_LIFETIME;
    physics.emitInterval = PARTICLE_EMIT_RATE;
    physics.maxActive = NUM_PARTICLES_PER_JET;
    return physics;
}

/* Initialize a fire truck */
void InitializeTruck(FireTruck& truck) {
    truck.instance = nullptr;
    truck.streamInstance = nullptr;
    truck.x = truck.y = truck.z = 0.0;
    truck.heading = 0.0f;
    truck.targetX = truck.targetZ = 0.0f;
    truck.targetHeading = 0.0f;
    truck.positioned = false;
    truck.isTurningAtTarget = false;
    truck.particles.clear();
    truck.particles.reserve(NUM_PARTICLES_PER_JET);
    truck.lastEmitTime = 0.0;
    truck.particlesEmitted = 0;
    truck.nozzleOffsetX = NOZZLE_OFFSET_X;
    truck.nozzleOffsetY = NOZZLE_OFFSET_Y;
    truck.nozzleOffsetZ = NOZZLE_OFFSET_Z;
    /* Initialize wheel and steering control properties */
    truck.frontSteeringAngle = 0.0f;
    truck.rearSteeringAngle = 0.0f;
    truck.wheelRotationAngle = 0.0f;
    truck.cannonPitch = DEFAULT_CANNON_PITCH;
    truck.cannonYaw = 0.0f;
    truck.speed = 0.0f;
    truck.targetSpeed = 0.0f;
    truck.cruiseSpeed = TRUCK_APPROACH_SPEED;
    truck.jetHeight = WATER_JET_HEIGHT;
    truck.isTurningBeforeLeave = false;
    truck.leaveHeading = 0.0f;
    /* Initialize route planning */
    truck.route = PlannedRoute();
    truck.useRoadNetwork = false;
}

/* Clean up a fire truck, releasing every visual it owns */
void CleanupTruck(FireTruck& truck, VisualFactory* visuals) {
    if (truck.instance && visuals) {
        visuals->DestroyVisual(truck.instance);
    }
    truck.instance = nullptr;

    if (truck.streamInstance && visuals) {
        visuals->DestroyVisual(truck.streamInstance);
    }
    truck.streamInstance = nullptr;

    /* Clean up all particle instances */
    for (size_t i = 0; i < truck.particles.size(); ++i) {
        WaterParticle& particle = truck.particles[i];
        if (particle.instance && visuals) {
            visuals->DestroyVisual(particle.instance);
        }
        particle.instance = nullptr;
    }
    truck.particles.clear();
}

void SetFrontSteeringAngle(FireTruck& truck, float angle) {
    truck.frontSteeringAngle = ClampSteeringAngle(angle);
}

void SetRearSteeringAngle(FireTruck& truck, float angle) {
    truck.rearSteeringAngle = ClampSteeringAngle(angle);
}

void SetCannonPitch(FireTruck& truck, float pitch) {
    truck.cannonPitch = Clamp(pitch, MIN_CANNON_PITCH, MAX_CANNON_PITCH);
}

void SetCannonYaw(FireTruck& truck, float yaw) {
    truck.cannonYaw = NormalizeAngle180(yaw);
}

/* Update wheel rotation angle based on distance moved */
void UpdateWheelRotationAngle(FireTruck& truck, float distanceMoved) {
    /* Calculate rotation in degrees based on circumference */
    float wheelCircumference = 2.0f * PI * WHEEL_RADIUS;
    float rotationDegrees = (distanceMoved / wheelCircumference) * 360.0f;
    truck.wheelRotationAngle = NormalizeAngle360(truck.wheelRotationAngle + rotationDegrees);
}

/*
 * IntegrateTruckMotion - Advance heading and position by one tick
 *
 * Heading changes by the Ackermann turning rate of the current speed and
 * steering. The truck then moves along its new heading by speed * dt, but
 * never farther than maxDistance. Returns the distance moved.
 */
float IntegrateTruckMotion(FireTruck& truck, float dt, TerrainProbe* terrain, float maxDistance) {
    float turningRate = CalculateTurningRate(truck.speed, truck.frontSteeringAngle, truck.rearSteeringAngle);
    truck.heading = NormalizeAngle360(truck.heading + turningRate * dt);

    /*
     * X-Plane coordinate system:
     * - heading 0 = North = (0, -1) in (X, Z)
     * - heading 90 = East = (1, 0) in (X, Z)
     * - forward = (sin(heading), -cos(heading))
     */
    float headingRad = truck.heading * DEG_TO_RAD;
    float moveDistance = truck.speed * dt;
    if (moveDistance > maxDistance) moveDistance = maxDistance;
    if (moveDistance < 0.0f) moveDistance = 0.0f;

    truck.x += sinf(headingRad) * moveDistance;
    truck.z += -cosf(headingRad) * moveDistance;
    truck.y = SampleTerrain(terrain, static_cast<float>(truck.x), static_cast<float>(truck.z));

    UpdateWheelRotationAngle(truck, moveDistance);
    return moveDistance;
}

/*
 * RotateTruckInPlace - Turn toward desiredHeading at turn-in-place speed
 *
 * Steering is held at full lock, so the truck drives the tightest arc it
 * can. Returns true once the heading error is within HEADING_TOLERANCE_DEG,
 * at which point the steering is centered and nothing moves.
 */
bool RotateTruckInPlace(FireTruck& truck, float desiredHeading, float dt, TerrainProbe* terrain) {
    float headingDiff = NormalizeAngle180(desiredHeading - truck.heading);

    if (fabsf(headingDiff) <= HEADING_TOLERANCE_DEG) {
        truck.frontSteeringAngle = 0.0f;
        truck.rearSteeringAngle = 0.0f;
        return true;
    }

    truck.frontSteeringAngle = (headingDiff > 0.0f) ? MAX_STEERING_ANGLE : -MAX_STEERING_ANGLE;
    truck.rearSteeringAngle = CalculateRearSteeringAngle(truck.frontSteeringAngle);

    truck.targetSpeed = TRUCK_TURN_IN_PLACE_SPEED;
    truck.speed = UpdateSpeedSmooth(truck.speed, truck.targetSpeed, dt);

    IntegrateTruckMotion(truck, dt, terrain, std::numeric_limits<float>::max());
    return false;
}

/* Straight-line approach to (targetX, targetZ), then rotate to targetHeading */
void UpdateTruckDirect(FireTruck& truck, float dt, TerrainProbe* terrain) {
    float distance = Distance2D(truck.x, truck.z, truck.targetX, truck.targetZ);

    if (!truck.isTurningAtTarget && distance > TRUCK_ARRIVAL_RADIUS) {
        float desiredHeading = BearingDegrees(truck.targetX - truck.x, truck.targetZ - truck.z);
        float headingDiff = NormalizeAngle180(desiredHeading - truck.heading);

        /* Heading error is used directly as the steering command */
        truck.frontSteeringAngle = ClampSteeringAngle(headingDiff);
        truck.rearSteeringAngle = CalculateRearSteeringAngle(truck.frontSteeringAngle);

        if (distance < TRUCK_SLOWDOWN_DISTANCE) {
            float slowdownFactor = distance / TRUCK_SLOWDOWN_DISTANCE;
            truck.targetSpeed = fmaxf(TRUCK_TURN_IN_PLACE_SPEED, truck.cruiseSpeed * slowdownFactor);
        } else {
            truck.targetSpeed = truck.cruiseSpeed;
        }
        truck.speed = UpdateSpeedSmooth(truck.speed, truck.targetSpeed, dt);

        IntegrateTruckMotion(truck, dt, terrain, distance);
        return;
    }

    /* Reached position, now turn to face target heading; the arc may leave the arrival radius */
    truck.isTurningAtTarget = true;
    if (RotateTruckInPlace(truck, truck.targetHeading, dt, terrain)) {
        truck.isTurningAtTarget = false;
        truck.positioned = true;
        truck.speed = 0.0f;
        truck.targetSpeed = 0.0f;
        truck.frontSteeringAngle = 0.0f;
        truck.rearSteeringAngle = 0.0f;
        DebugLog("Truck positioned at (%.2f, %.2f) heading %.1f",
                 truck.x, truck.z, truck.heading);
    }
}

static void CompleteRoute(FireTruck& truck) {
    truck.route.isCompleted = true;
    truck.positioned = true;
    truck.speed = 0.0f;
    truck.targetSpeed = 0.0f;
    truck.frontSteeringAngle = 0.0f;
    truck.rearSteeringAngle = 0.0f;
    DebugLog("UpdateTruckFollowingPath: Route completed at (%.2f, %.2f)", truck.x, truck.z);
}

/* Update truck following planned path */
void UpdateTruckFollowingPath(FireTruck& truck, float dt, TerrainProbe* terrain) {
    PlannedRoute& route = truck.route;
    if (!route.isValid || route.isCompleted) {
        return;
    }

    if (route.currentWaypointIndex >= route.waypoints.size()) {
        CompleteRoute(truck);
        return;
    }

    float distance = Distance2D(truck.x, truck.z,
                                route.waypoints[route.currentWaypointIndex].x,
                                route.waypoints[route.currentWaypointIndex].z);

    /* Check if waypoint reached */
    if (distance < PATH_REACH_THRESHOLD) {
        route.currentWaypointIndex++;

        if (route.currentWaypointIndex >= route.waypoints.size()) {
            CompleteRoute(truck);
            return;
        }

        DebugLogVerbose("UpdateTruckFollowingPath: Reached waypoint %zu/%zu",
                        route.currentWaypointIndex, route.waypoints.size());

        distance = Distance2D(truck.x, truck.z,
                              route.waypoints[route.currentWaypointIndex].x,
                              route.waypoints[route.currentWaypointIndex].z);
    }

    const PathWaypoint& target = route.waypoints[route.currentWaypointIndex];
    float desiredHeading = BearingDegrees(target.x - truck.x, target.z - truck.z);

    /* Look ahead for upcoming turns */
    float accumulatedDist = distance;
    float futureHeading = desiredHeading;

    for (size_t i = route.currentWaypointIndex + 1;
         i < route.waypoints.size() && accumulatedDist < TURN_ANTICIPATION; ++i) {
        const PathWaypoint& wp = route.waypoints[i];
        const PathWaypoint& prevWp = route.waypoints[i - 1];

        accumulatedDist += Distance2D(prevWp.x, prevWp.z, wp.x, wp.z);

        if (accumulatedDist >= TURN_ANTICIPATION) {
            futureHeading = BearingDegrees(wp.x - prevWp.x, wp.z - prevWp.z);
            break;
        }
    }

    float headingDiff = NormalizeAngle180(desiredHeading - truck.heading);
    float futureHeadingDiff = NormalizeAngle180(futureHeading - truck.heading);

    /* Anticipate turns: blend current heading error with the upcoming one */
    if (fabsf(futureHeadingDiff) > fabsf(headingDiff) && distance < TURN_ANTICIPATION) {
        headingDiff = headingDiff * 0.7f + futureHeadingDiff * 0.3f;
    }

    truck.frontSteeringAngle = ClampSteeringAngle(headingDiff);
    truck.rearSteeringAngle = CalculateRearSteeringAngle(truck.frontSteeringAngle);

    /* Slower for tighter turns */
    float steeringTangent = fmaxf(fabsf(tanf(truck.frontSteeringAngle * DEG_TO_RAD)), MIN_STEERING_TANGENT);
    float turnRadius = WHEELBASE / steeringTangent;
    float maxSpeedForTurn = sqrtf(turnRadius * 2.0f);
    maxSpeedForTurn = fminf(maxSpeedForTurn, truck.cruiseSpeed);
    maxSpeedForTurn = fmaxf(maxSpeedForTurn, TRUCK_TURN_IN_PLACE_SPEED);

    /* Slower approaching waypoints */
    float waypointSpeed = target.speed > 0.0f ? target.speed : truck.cruiseSpeed;
    if (distance < TRUCK_SLOWDOWN_DISTANCE) {
        float slowdownFactor = distance / TRUCK_SLOWDOWN_DISTANCE;
        waypointSpeed = fmaxf(TRUCK_TURN_IN_PLACE_SPEED, waypointSpeed * slowdownFactor);
    }

    truck.targetSpeed = fminf(maxSpeedForTurn, waypointSpeed);
    truck.speed = UpdateSpeedSmooth(truck.speed, truck.targetSpeed, dt);

    IntegrateTruckMotion(truck, dt, terrain, std::numeric_limits<float>::max());
}

/* Per-tick approach update: hold, follow route, or drive directly */
void UpdateTruckPosition(FireTruck& truck, float dt, TerrainProbe* terrain) {
    if (truck.positioned) {
        truck.speed = 0.0f;
        truck.targetSpeed = 0.0f;
        truck.frontSteeringAngle = 0.0f;
        truck.rearSteeringAngle = 0.0f;
        return;
    }

    if (truck.useRoadNetwork && truck.route.isValid && !truck.route.isCompleted) {
        UpdateTruckFollowingPath(truck, dt, terrain);
    } else {
        UpdateTruckDirect(truck, dt, terrain);
    }
}

/* Start the turn-then-drive-away sequence; the two trucks turn in opposite directions */
void BeginTruckDeparture(FireTruck& truck, bool isLeftTruck) {
    float turn = isLeftTruck ? -TRUCK_LEAVE_TURN_ANGLE : TRUCK_LEAVE_TURN_ANGLE;
    truck.leaveHeading = NormalizeAngle360(truck.heading + turn);
    truck.isTurningBeforeLeave = true;
    truck.isTurningAtTarget = false;
    truck.positioned = false;
    DebugLog("Truck departing: heading %.1f -> %.1f", truck.heading, truck.leaveHeading);
}

/*
 * UpdateTruckLeaving - Departure update
 *
 * Returns true once the truck is farther than TRUCK_LEAVING_DISTANCE from the
 * aircraft.
 */
bool UpdateTruckLeaving(FireTruck& truck, float dt, TerrainProbe* terrain, double acX, double acZ) {
    if (Distance2D(truck.x, truck.z, acX, acZ) > TRUCK_LEAVING_DISTANCE) {
        return true;
    }

    if (truck.isTurningBeforeLeave) {
        if (RotateTruckInPlace(truck, truck.leaveHeading, dt, terrain)) {
            truck.isTurningBeforeLeave = false;
            DebugLogVerbose("Truck finished departure turn, heading %.1f", truck.heading);
        }
        return false;
    }

    truck.frontSteeringAngle = 0.0f;
    truck.rearSteeringAngle = 0.0f;
    truck.targetSpeed = truck.cruiseSpeed * TRUCK_LEAVING_SPEED_MULT;
    truck.speed = UpdateSpeedSmooth(truck.speed, truck.targetSpeed, dt);
    IntegrateTruckMotion(truck, dt, terrain, std::numeric_limits<float>::max());

    return Distance2D(truck.x, truck.z, acX, acZ) > TRUCK_LEAVING_DISTANCE;
}

/* Update instance position */
void SyncTruckVisual(const FireTruck& truck, VisualFactory* visuals) {
    if (!truck.instance || !visuals) {
        return;
    }
    visuals->SetVisualPosition(truck.instance,
                               static_cast<float>(truck.x),
                               static_cast<float>(truck.y),
                               static_cast<float>(truck.z),
                               0.0f, truck.heading, 0.0f, nullptr);
}

/* Nozzle world position from the heading-rotated offsets */
void GetNozzlePosition(const FireTruck& truck, float& x, float& y, float& z) {
    float headingRad = truck.heading * DEG_TO_RAD;
    float cosH = cosf(headingRad);
    float sinH = sinf(headingRad);

    x = static_cast<float>(truck.x) + sinH * truck.nozzleOffsetZ + cosH * truck.nozzleOffsetX;
    y = static_cast<float>(truck.y) + truck.nozzleOffsetY;
    z = static_cast<float>(truck.z) - cosH * truck.nozzleOffsetZ + sinH * truck.nozzleOffsetX;
}

/* Emit a water particle from truck's nozzle */
void EmitParticle(FireTruck& truck, const ParticlePhysics& physics, SprayRandom& rng,
                  VisualFactory* visuals) {
    WaterParticle particle;

    GetNozzlePosition(truck, particle.x, particle.y, particle.z);

    /* Cannon yaw is relative to truck heading */
    float pitchRad = truck.cannonPitch * DEG_TO_RAD;
    float yawRad = (truck.cannonYaw + truck.heading) * DEG_TO_RAD;

    /* Launch speed to reach the arch height */
    float initialSpeed = truck.jetHeight * WATER_JET_SPEED_FACTOR;

    float randPitch = pitchRad + RandomSpread(rng) * physics.spreadAngle;
    float randYaw = yawRad + RandomSpread(rng) * physics.spreadAngle;

    float cosPitch = cosf(randPitch);
    float sinPitch = sinf(randPitch);
    float cosYaw = cosf(randYaw);
    float sinYaw = sinf(randYaw);

    particle.vx = initialSpeed * cosPitch * sinYaw;
    particle.vy = initialSpeed * sinPitch;
    particle.vz = -initialSpeed * cosPitch * cosYaw;

    /* Spray turbulence */
    particle.vx += RandomSpread(rng) * 0.5f * physics.emitTurbulence;
    particle.vy += RandomSpread(rng) * 0.3f * physics.emitTurbulence;
    particle.vz += RandomSpread(rng) * 0.5f * physics.emitTurbulence;

    particle.lifetime = physics.lifetime;
    particle.maxLifetime = physics.lifetime;
    particle.active = true;
    particle.instance = nullptr;

    if (visuals && visuals->HasModel(VISUAL_WATER_DROP)) {
        particle.instance = visuals->CreateVisual(VISUAL_WATER_DROP);
        if (particle.instance) {
            visuals->SetVisualPosition(particle.instance, particle.x, particle.y, particle.z,
                                       0.0f, 0.0f, 0.0f, nullptr);
        }
    }

    truck.particles.push_back(particle);
    truck.particlesEmitted++;
}

/* Integrate one particle: gravity, quadratic drag, turbulence, ground bounce */
void UpdateParticle(WaterParticle& particle, float dt, const ParticlePhysics& physics,
                    SprayRandom& rng, TerrainProbe* terrain, VisualFactory* visuals) {
    if (!particle.active) return;

    particle.vy -= physics.gravity * dt;

    /* Air resistance, opposing velocity */
    float speed = sqrtf(particle.vx * particle.vx +
                        particle.vy * particle.vy +
                        particle.vz * particle.vz);
    if (speed > 0.01f) {
        float dragForce = physics.drag * speed * speed;
        float dragAccel = dragForce / speed;
        particle.vx -= particle.vx / speed * dragAccel * dt;
        particle.vy -= particle.vy / speed * dragAccel * dt;
        particle.vz -= particle.vz / speed * dragAccel * dt;
    }

    particle.vx += RandomSpread(rng) * physics.turbulence;
    particle.vy += RandomSpread(rng) * physics.turbulence;
    particle.vz += RandomSpread(rng) * physics.turbulence;

    particle.x += particle.vx * dt;
    particle.y += particle.vy * dt;
    particle.z += particle.vz * dt;

    float groundY = SampleTerrain(terrain, particle.x, particle.z);
    if (particle.y < groundY) {
        particle.y = groundY;
        particle.vy = 0.0f;
        particle.vx *= 0.5f;  /* Splash friction */
        particle.vz *= 0.5f;
    }

    if (particle.instance && visuals) {
        visuals->SetVisualPosition(particle.instance, particle.x, particle.y, particle.z,
                                   0.0f, 0.0f, 0.0f, nullptr);
    }

    particle.lifetime -= dt;
    if (particle.lifetime <= 0.0f) {
        particle.active = false;
        if (particle.instance && visuals) {
            visuals->DestroyVisual(particle.instance);
        }
        particle.instance = nullptr;
    }
}

int CountActiveParticles(const FireTruck& truck) {
    int activeCount = 0;
    for (size_t i = 0; i < truck.particles.size(); ++i) {
        if (truck.particles[i].active) activeCount++;
    }
    return activeCount;
}

/*
 * UpdateTruckParticles - Emit (when emitting) and integrate a truck's particles
 *
 * Emission happens at most once per call, every physics.emitInterval seconds
 * of currentTime, and only below the active particle cap. Dead entries are
 * pruned once the list grows past twice the cap.
 */
void UpdateTruckParticles(FireTruck& truck, float dt, double currentTime, bool emitting,
                          const ParticlePhysics& physics, SprayRandom& rng,
                          TerrainProbe* terrain, VisualFactory* visuals) {
    if (emitting && currentTime - truck.lastEmitTime >= physics.emitInterval) {
        if (CountActiveParticles(truck) < physics.maxActive) {
            EmitParticle(truck, physics, rng, visuals);
            truck.lastEmitTime = currentTime;
        }
    }

    for (size_t i = 0; i < truck.particles.size(); ++i) {
        UpdateParticle(truck.particles[i], dt, physics, rng, terrain, visuals);
    }

    /* Remove dead particles periodically */
    if (truck.particles.size() > static_cast<size_t>(physics.maxActive) * 2) {
        truck.particles.erase(
            std::remove_if(truck.particles.begin(), truck.particles.end(),
                [](const WaterParticle& p) { return !p.active; }),
            truck.particles.end());
    }
}

/*
 * UpdateTruckWaterStream - Single-instance water stream
 *
 * The stream instance is created the first time it is activated and then
 * follows the nozzle with the cannon pitch and yaw. Its two animation values
 * (active, intensity) are 1 while spraying and 0 otherwise.
 */
void UpdateTruckWaterStream(FireTruck& truck, bool active, VisualFactory* visuals) {
    if (!visuals) return;

    if (!truck.streamInstance) {
        if (!active || !visuals->HasModel(VISUAL_WATER_STREAM)) return;
        truck.streamInstance = visuals->CreateVisual(VISUAL_WATER_STREAM);
        if (!truck.streamInstance) {
            DebugLog("Failed to create water stream instance");
            return;
        }
    }

    float nozzleX, nozzleY, nozzleZ;
    GetNozzlePosition(truck, nozzleX, nozzleY, nozzleZ);

    float streamData[2];
    streamData[0] = active ? 1.0f : 0.0f;
    streamData[1] = active ? 1.0f : 0.0f;

    visuals->SetVisualPosition(truck.streamInstance, nozzleX, nozzleY, nozzleZ,
                               truck.cannonPitch,
                               NormalizeAngle360(truck.heading + truck.cannonYaw),
                               0.0f, streamData);
}
