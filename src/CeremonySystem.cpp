/*
 * CeremonySystem.cpp - Ceremony sequencing, sound cues and auto start
 */

#include "CeremonySystem.h"

CeremonySystem::CeremonySystem(const HostServices& services)
    : m_services(services),
      m_state(STATE_IDLE),
      m_waterEffectMode(WATER_EFFECT_PARTICLES),
      m_physics(DefaultParticlePhysics()),
      m_rng(std::random_device()()),
      m_elapsedTime(0.0),
      m_debugLogTimer(0.0f),
      m_autoStartArmed(false) {
    for (int i = 0; i < TRUCK_COUNT; ++i) {
        InitializeTruck(m_trucks[i]);
    }
    InitializeRaindropEffect(m_raindrop, m_services.rain);

    if (!m_services.visuals) {
        DebugLog("No visual factory attached - trucks and water will not be drawn");
    }
    if (!m_services.sound) {
        DebugLog("No sound player attached - sound cues disabled");
    }
}

void CeremonySystem::SetSettings(const UserSettings& settings) {
    m_settings = settings;
}

void CeremonySystem::SetAptDatSearchPaths(const std::vector<std::string>& paths) {
    m_aptDatPaths = paths;
}

void CeremonySystem::SetParticlePhysics(const ParticlePhysics& physics) {
    m_physics = physics;
}

void CeremonySystem::SeedRandom(unsigned int seed) {
    m_rng.seed(seed);
}

FireTruck* CeremonySystem::GetTruckByIndex(int index) {
    if (index < 0 || index >= TRUCK_COUNT) return nullptr;
    return &m_trucks[index];
}

const FireTruck* CeremonySystem::GetTruckByIndex(int index) const {
    if (index < 0 || index >= TRUCK_COUNT) return nullptr;
    return &m_trucks[index];
}

void CeremonySystem::SetState(CeremonyState state) {
    m_state = state;
    DebugLog("State changed to: %s", GetStateName(m_state));
}

/*
 * Start - Begin a ceremony for the current aircraft
 *
 * Rejected while a ceremony runs, while airborne, or above
 * MAX_GROUND_SPEED_KNOTS. Everything the ceremony needs (truck placement,
 * road network, routes, instances) is set up here and never re-planned.
 */
bool CeremonySystem::Start() {
    DebugLog("========================================");
    DebugLog("Start called, current state: %s", GetStateName(m_state));

    if (m_state != STATE_IDLE) {
        DebugLog("Cannot start - ceremony already in progress");
        return false;
    }

    AircraftTelemetry* aircraft = m_services.aircraft;
    if (!aircraft) {
        DebugLog("Cannot start - no aircraft telemetry available");
        return false;
    }

    if (!aircraft->IsOnGround()) {
        DebugLog("Cannot start - aircraft not on ground");
        return false;
    }

    float groundSpeedKnots = aircraft->GetGroundSpeed() / KNOTS_TO_MS;
    if (groundSpeedKnots > MAX_GROUND_SPEED_KNOTS) {
        DebugLog("Cannot start - ground speed too high: %.1f knots", groundSpeedKnots);
        return false;
    }

    double acX, acY, acZ;
    aircraft->GetPosition(acX, acY, acZ);
    float acHeading = NormalizeAngle360(aircraft->GetHeading());

    float wingspan = DEFAULT_WINGSPAN_METERS;
    float rawWingspan = 0.0f;
    if (aircraft->GetWingspanRaw(rawWingspan)) {
        wingspan = InterpretWingspan(rawWingspan);
    } else {
        DebugLog("Wingspan not available, using default %.0fm", DEFAULT_WINGSPAN_METERS);
    }

    DebugLog("Aircraft position: (%.2f, %.2f, %.2f), heading %.1f, wingspan %.1f m, ground speed %.1f knots",
             acX, acY, acZ, acHeading, wingspan, groundSpeedKnots);

    PlaceTrucks(acX, acZ, acHeading, wingspan);

    double acLat = 0.0, acLon = 0.0;
    aircraft->GetLatLon(acLat, acLon);
    PlanTruckRoutes(acLat, acLon);

    m_waterEffectMode = (m_services.visuals && m_services.visuals->HasModel(VISUAL_WATER_STREAM))
                        ? WATER_EFFECT_STREAM : WATER_EFFECT_PARTICLES;
    DebugLog("Water effect mode: %s",
             m_waterEffectMode == WATER_EFFECT_STREAM ? "stream" : "particles");

    CreateTruckVisuals();

    StartLoopSound(SOUND_TRUCK_ENGINE, SOUND_TRUCK_ENGINE_GAIN);

    m_debugLogTimer = 0.0f;
    SetState(STATE_TRUCKS_APPROACHING);
    DebugLog("Water salute started - trucks approaching");
    return true;
}

/*
 * PlaceTrucks - Spawn both trucks behind the aircraft and give them their
 * flanking targets in front of it
 */
void CeremonySystem::PlaceTrucks(double acX, double acZ, float acHeading, float wingspan) {
    float truckSpacing = (wingspan / 2.0f) + (TRUCK_EXTRA_SPACING / 2.0f);
    DebugLog("Truck spacing from center: %.1f meters", truckSpacing);

    /*
     * X-Plane coordinate system, heading h:
     * - forward = (sin(h), -cos(h)) in (X, Z)
     * - right   = (cos(h),  sin(h)) in (X, Z)
     */
    float headingRad = acHeading * DEG_TO_RAD;
    double forwardX = sinf(headingRad);
    double forwardZ = -cosf(headingRad);
    double rightX = cosf(headingRad);
    double rightZ = sinf(headingRad);

    double spawnX = acX - forwardX * TRUCK_SPAWN_DISTANCE;
    double spawnZ = acZ - forwardZ * TRUCK_SPAWN_DISTANCE;
    double targetX = acX + forwardX * TRUCK_STOP_DISTANCE;
    double targetZ = acZ + forwardZ * TRUCK_STOP_DISTANCE;

    for (int i = 0; i < TRUCK_COUNT; ++i) {
        FireTruck& truck = m_trucks[i];
        double side = (i == LEFT_TRUCK) ? -1.0 : 1.0;

        CleanupTruck(truck, m_services.visuals);
        InitializeTruck(truck);
        truck.cruiseSpeed = m_settings.truckSpeed;
        truck.jetHeight = m_settings.waterJetHeight;

        truck.x = spawnX + side * rightX * truckSpacing;
        truck.z = spawnZ + side * rightZ * truckSpacing;
        truck.y = m_services.terrain
                  ? m_services.terrain->GetTerrainHeight(static_cast<float>(truck.x), static_cast<float>(truck.z))
                  : 0.0f;
        truck.heading = acHeading;
        truck.targetX = static_cast<float>(targetX + side * rightX * truckSpacing);
        truck.targetZ = static_cast<float>(targetZ + side * rightZ * truckSpacing);
        /* Both trucks face the aircraft's path */
        truck.targetHeading = NormalizeAngle360(i == LEFT_TRUCK ? acHeading + 90.0f : acHeading - 90.0f);

        DebugLog("%s truck: start (%.2f, %.2f, %.2f), target (%.2f, %.2f), heading %.1f -> %.1f",
                 i == LEFT_TRUCK ? "Left" : "Right",
                 truck.x, truck.y, truck.z, truck.targetX, truck.targetZ,
                 truck.heading, truck.targetHeading);
    }
}

/*
 * PlanTruckRoutes - Load the road network and plan a route per truck
 *
 * Without a network the trucks stay in direct approach mode.
 */
void CeremonySystem::PlanTruckRoutes(double acLat, double acLon) {
    bool loaded = false;
    if (m_services.transform && !m_aptDatPaths.empty()) {
        loaded = LoadAptDat(m_aptDatPaths, acLat, acLon, *m_services.transform, m_roadNetwork);
    } else {
        ResetRoadNetwork(m_roadNetwork);
    }

    if (!loaded) {
        DebugLog("Road network not available, using direct approach");
        return;
    }

    DebugLog("Road network loaded for airport %s", m_roadNetwork.airportId.c_str());

    for (int i = 0; i < TRUCK_COUNT; ++i) {
        FireTruck& truck = m_trucks[i];

        size_t spawnNode = FindNearestNode(m_roadNetwork, truck.x, truck.z, true);
        if (spawnNode != SIZE_MAX) {
            const RoadNode& node = m_roadNetwork.nodes[spawnNode];
            truck.x = node.x;
            truck.z = node.z;
            truck.y = m_services.terrain
                      ? m_services.terrain->GetTerrainHeight(static_cast<float>(node.x), static_cast<float>(node.z))
                      : 0.0f;
            DebugLog("Truck %d snapped to node %s (%.2f, %.2f)", i, node.name.c_str(), node.x, node.z);
        }

        truck.route = PlanRouteToTarget(m_roadNetwork, truck.x, truck.z,
                                        truck.targetX, truck.targetZ,
                                        truck.targetHeading, truck.cruiseSpeed);
        truck.useRoadNetwork = truck.route.isValid;

        if (truck.route.isValid && truck.route.waypoints.size() > 1) {
            truck.heading = truck.route.waypoints.front().targetHeading;
        }
    }
}

void CeremonySystem::CreateTruckVisuals() {
    VisualFactory* visuals = m_services.visuals;
    if (!visuals || !visuals->HasModel(VISUAL_FIRE_TRUCK)) {
        DebugLog("WARNING: No truck model loaded - trucks will NOT be visible!");
        return;
    }

    for (int i = 0; i < TRUCK_COUNT; ++i) {
        m_trucks[i].instance = visuals->CreateVisual(VISUAL_FIRE_TRUCK);
        DebugLog("Truck %d instance: %s", i, m_trucks[i].instance ? "CREATED" : "FAILED");
        SyncTruckVisual(m_trucks[i], visuals);
    }
}

/*
 * Stop - Send the trucks away
 *
 * A no-op when idle or already leaving. From any other state both trucks
 * turn 45 degrees away and drive off; nothing is torn down until they are
 * out of range.
 */
void CeremonySystem::Stop() {
    DebugLog("Stop called, current state: %s", GetStateName(m_state));

    if (m_state == STATE_IDLE) {
        DebugLog("Already stopped");
        return;
    }
    if (m_state == STATE_TRUCKS_LEAVING) {
        DebugLog("Trucks already leaving");
        return;
    }

    StopSound(SOUND_WATER_SPRAY);

    BeginTruckDeparture(m_trucks[LEFT_TRUCK], true);
    BeginTruckDeparture(m_trucks[RIGHT_TRUCK], false);

    SetState(STATE_TRUCKS_LEAVING);
    DebugLog("Water salute ending");
}

void CeremonySystem::Toggle() {
    if (m_state == STATE_IDLE) {
        Start();
    } else {
        Stop();
    }
}

/* One-shot horn at the left truck, or at the aircraft when no trucks are out */
void CeremonySystem::PlayHorn() {
    if (!m_settings.soundEnabled || !m_services.sound) return;

    if (m_state != STATE_IDLE) {
        const FireTruck& truck = m_trucks[LEFT_TRUCK];
        m_services.sound->SetPosition(SOUND_TRUCK_HORN, truck.x, truck.y, truck.z);
    } else if (m_services.aircraft) {
        double acX, acY, acZ;
        m_services.aircraft->GetPosition(acX, acY, acZ);
        m_services.sound->SetPosition(SOUND_TRUCK_HORN, acX, acY, acZ);
    }

    m_services.sound->Play(SOUND_TRUCK_HORN, false, SoundGain(SOUND_TRUCK_HORN_GAIN));
    DebugLog("Truck horn played");
}

/*
 * Update - Advance the whole system by one frame
 */
void CeremonySystem::Update(float dt) {
    if (!(dt > 0.0f)) dt = 0.0f;
    if (dt > MAX_FRAME_DT) dt = MAX_FRAME_DT;
    m_elapsedTime += dt;

    UpdateAutoStart();

    if (m_state != STATE_IDLE) {
        m_debugLogTimer += dt;
        if (m_debugLogTimer >= DEBUG_LOG_INTERVAL) {
            m_debugLogTimer = 0.0f;
            LogDebugStatus();
        }
    }

    switch (m_state) {
        case STATE_TRUCKS_APPROACHING:
        case STATE_TRUCKS_POSITIONING:
            UpdateApproach(dt);
            break;
        case STATE_WATER_SPRAYING:
            UpdateWaterEffect(dt, true);
            break;
        case STATE_TRUCKS_LEAVING:
            UpdateWaterEffect(dt, false);
            UpdateDeparture(dt);
            break;
        case STATE_IDLE:
        default:
            break;
    }

    /* Runs in every state so a fade that outlives the ceremony still restores the host value */
    double acX = 0.0, acY = 0.0, acZ = 0.0;
    if (m_services.aircraft) {
        m_services.aircraft->GetPosition(acX, acY, acZ);
    }
    bool raindropActive = (m_state == STATE_WATER_SPRAYING && m_waterEffectMode == WATER_EFFECT_PARTICLES);
    UpdateRaindropEffect(m_raindrop, dt, raindropActive, m_trucks, TRUCK_COUNT,
                         acX, acY, acZ, m_services.rain);

    if (m_state != STATE_IDLE) {
        UpdateSoundPositions();
    }
}

void CeremonySystem::UpdateApproach(float dt) {
    for (int i = 0; i < TRUCK_COUNT; ++i) {
        UpdateTruckPosition(m_trucks[i], dt, m_services.terrain);
        SyncTruckVisual(m_trucks[i], m_services.visuals);
    }

    if (m_state == STATE_TRUCKS_APPROACHING) {
        for (int i = 0; i < TRUCK_COUNT; ++i) {
            const FireTruck& truck = m_trucks[i];
            if (Distance2D(truck.x, truck.z, truck.targetX, truck.targetZ) < TRUCK_POSITIONING_THRESHOLD) {
                SetState(STATE_TRUCKS_POSITIONING);
                break;
            }
        }
    }

    if (m_trucks[LEFT_TRUCK].positioned && m_trucks[RIGHT_TRUCK].positioned) {
        EnterSpraying();
    }
}

void CeremonySystem::EnterSpraying() {
    SetState(STATE_WATER_SPRAYING);

    if (m_waterEffectMode == WATER_EFFECT_STREAM) {
        for (int i = 0; i < TRUCK_COUNT; ++i) {
            UpdateTruckWaterStream(m_trucks[i], true, m_services.visuals);
        }
    }

    StartLoopSound(SOUND_WATER_SPRAY, SOUND_WATER_SPRAY_GAIN);
}

/*
 * UpdateWaterEffect - Drive the water arch of both trucks
 *
 * With active false no new water leaves the nozzles but particles already
 * in the air keep flying until their lifetime ends.
 */
void CeremonySystem::UpdateWaterEffect(float dt, bool active) {
    for (int i = 0; i < TRUCK_COUNT; ++i) {
        FireTruck& truck = m_trucks[i];
        if (m_waterEffectMode == WATER_EFFECT_STREAM) {
            UpdateTruckWaterStream(truck, active, m_services.visuals);
        } else {
            UpdateTruckParticles(truck, dt, m_elapsedTime, active, m_physics, m_rng,
                                 m_services.terrain, m_services.visuals);
        }
    }
}

void CeremonySystem::UpdateDeparture(float dt) {
    double acX = 0.0, acY = 0.0, acZ = 0.0;
    if (m_services.aircraft) {
        m_services.aircraft->GetPosition(acX, acY, acZ);
    }

    bool leftDone = UpdateTruckLeaving(m_trucks[LEFT_TRUCK], dt, m_services.terrain, acX, acZ);
    bool rightDone = UpdateTruckLeaving(m_trucks[RIGHT_TRUCK], dt, m_services.terrain, acX, acZ);

    for (int i = 0; i < TRUCK_COUNT; ++i) {
        SyncTruckVisual(m_trucks[i], m_services.visuals);
    }

    if (leftDone && rightDone) {
        FinishCeremony();
    }
}

void CeremonySystem::FinishCeremony() {
    for (int i = 0; i < TRUCK_COUNT; ++i) {
        CleanupTruck(m_trucks[i], m_services.visuals);
    }
    StopAllSounds();
    SetState(STATE_IDLE);
    DebugLog("Water salute complete");
}

/*
 * UpdateAutoStart - Arm while airborne, fire once after touchdown
 */
void CeremonySystem::UpdateAutoStart() {
    if (!m_settings.autoStartOnGround || !m_services.aircraft) {
        m_autoStartArmed = false;
        return;
    }

    AircraftTelemetry* aircraft = m_services.aircraft;
    if (!aircraft->IsOnGround()) {
        if (!m_autoStartArmed) {
            DebugLogVerbose("Auto start armed");
        }
        m_autoStartArmed = true;
        return;
    }

    if (!m_autoStartArmed) return;

    float groundSpeedKnots = aircraft->GetGroundSpeed() / KNOTS_TO_MS;
    if (groundSpeedKnots > MAX_GROUND_SPEED_KNOTS) return;

    m_autoStartArmed = false;
    DebugLog("Auto start: aircraft on ground at %.1f knots", groundSpeedKnots);
    Start();
}

void CeremonySystem::Shutdown() {
    for (int i = 0; i < TRUCK_COUNT; ++i) {
        CleanupTruck(m_trucks[i], m_services.visuals);
    }
    StopAllSounds();
    CleanupRaindropEffect(m_raindrop, m_services.rain);
    m_state = STATE_IDLE;
    m_autoStartArmed = false;
    DebugLog("Ceremony system shut down");
}

float CeremonySystem::SoundGain(float baseGain) const {
    return baseGain * static_cast<float>(m_settings.soundVolume) / 100.0f;
}

void CeremonySystem::StartLoopSound(SoundCue cue, float baseGain) {
    if (!m_settings.soundEnabled || !m_services.sound) return;
    if (m_services.sound->IsPlaying(cue)) return;
    m_services.sound->Play(cue, true, SoundGain(baseGain));
    DebugLogVerbose("Loop sound %d started", static_cast<int>(cue));
}

void CeremonySystem::StopSound(SoundCue cue) {
    if (m_services.sound && m_services.sound->IsPlaying(cue)) {
        m_services.sound->Stop(cue);
    }
}

void CeremonySystem::StopAllSounds() {
    StopSound(SOUND_WATER_SPRAY);
    StopSound(SOUND_TRUCK_ENGINE);
    StopSound(SOUND_TRUCK_HORN);
}

/* 3D sound positions follow the trucks */
void CeremonySystem::UpdateSoundPositions() {
    if (!m_services.sound) return;

    const FireTruck& left = m_trucks[LEFT_TRUCK];
    const FireTruck& right = m_trucks[RIGHT_TRUCK];

    m_services.sound->SetPosition(SOUND_WATER_SPRAY,
                                  (left.x + right.x) / 2.0,
                                  (left.y + right.y) / 2.0 + SOUND_SPRAY_HEIGHT_OFFSET,
                                  (left.z + right.z) / 2.0);
    m_services.sound->SetPosition(SOUND_TRUCK_ENGINE, left.x, left.y, left.z);
}

/* Log periodic debug status */
void CeremonySystem::LogDebugStatus() const {
    DebugLog("=== DEBUG STATUS ===");
    DebugLog("  State: %s (%d)", GetStateName(m_state), static_cast<int>(m_state));
    DebugLog("  Water effect: %s, Road network: %s",
             m_waterEffectMode == WATER_EFFECT_STREAM ? "stream" : "particles",
             m_roadNetwork.isLoaded ? m_roadNetwork.airportId.c_str() : "none");
    for (int i = 0; i < TRUCK_COUNT; ++i) {
        const FireTruck& truck = m_trucks[i];
        const char* name = (i == LEFT_TRUCK) ? "Left" : "Right";
        DebugLog("  %s Truck: Position (%.2f, %.2f, %.2f), Heading %.1f, Positioned %s, Instance %s",
                 name, truck.x, truck.y, truck.z, truck.heading,
                 truck.positioned ? "YES" : "NO", truck.instance ? "YES" : "NO");
        DebugLog("  %s Truck: Speed=%.2f m/s, WheelAngle=%.1f deg, FrontSteer=%.1f deg, RearSteer=%.1f deg",
                 name, truck.speed, truck.wheelRotationAngle,
                 truck.frontSteeringAngle, truck.rearSteeringAngle);
        DebugLog("  %s Cannon: Pitch=%.1f deg, Yaw=%.1f deg", name, truck.cannonPitch, truck.cannonYaw);
        DebugLog("  %s Particles: %d active / %d emitted", name,
                 CountActiveParticles(truck), truck.particlesEmitted);
        if (truck.useRoadNetwork) {
            DebugLog("  %s Route: waypoint %zu/%zu%s", name,
                     truck.route.currentWaypointIndex, truck.route.waypoints.size(),
                     truck.route.isCompleted ? " (completed)" : "");
        }
    }
    DebugLog("  Raindrop intensity: %.3f", m_raindrop.currentIntensity);
    DebugLog("===================");
}
