/*
 * XplmHost.cpp - Host services backed by the X-Plane SDK
 */

#include "XplmHost.h"

#include "XPLMGraphics.h"

#include <SDL2/SDL.h>

/* Instance datarefs animated by waterjet.obj */
static const char* g_noDataRefs[] = { nullptr };
static const char* g_waterJetDataRefs[] = {
    "waterarch/waterjet/active",
    "waterarch/waterjet/intensity",
    nullptr
};

XplmTerrainProbe::XplmTerrainProbe() {
    m_probe = XPLMCreateProbe(xplm_ProbeY);
}

XplmTerrainProbe::~XplmTerrainProbe() {
    if (m_probe) {
        XPLMDestroyProbe(m_probe);
        m_probe = nullptr;
    }
}

/*
 * GetTerrainHeight - Get terrain height at a position
 */
float XplmTerrainProbe::GetTerrainHeight(float x, float z) {
    if (!m_probe) {
        return 0.0f;
    }

    XPLMProbeInfo_t probeInfo;
    probeInfo.structSize = sizeof(XPLMProbeInfo_t);

    XPLMProbeResult result = XPLMProbeTerrainXYZ(m_probe, x, 10000.0f, z, &probeInfo);

    if (result == xplm_ProbeHitTerrain) {
        return probeInfo.locationY;
    }

    return 0.0f;
}

void XplmCoordinateTransform::WorldToLocal(double lat, double lon, double alt,
                                           double& x, double& y, double& z) {
    XPLMWorldToLocal(lat, lon, alt, &x, &y, &z);
}

void XplmCoordinateTransform::LocalToWorld(double x, double y, double z,
                                           double& lat, double& lon, double& alt) {
    XPLMLocalToWorld(x, y, z, &lat, &lon, &alt);
}

XplmAircraftTelemetry::XplmAircraftTelemetry() {
    m_drOnGround = XPLMFindDataRef("sim/flightmodel/failures/onground_any");
    m_drGroundSpeed = XPLMFindDataRef("sim/flightmodel/position/groundspeed");
    m_drLocalX = XPLMFindDataRef("sim/flightmodel/position/local_x");
    m_drLocalY = XPLMFindDataRef("sim/flightmodel/position/local_y");
    m_drLocalZ = XPLMFindDataRef("sim/flightmodel/position/local_z");
    m_drHeading = XPLMFindDataRef("sim/flightmodel/position/psi");
    m_drLatitude = XPLMFindDataRef("sim/flightmodel/position/latitude");
    m_drLongitude = XPLMFindDataRef("sim/flightmodel/position/longitude");

    /*
     * Wingspan sources, in priority order:
     * - sim/aircraft/view/acf_semi_len_m: semispan in meters
     * - sim/aircraft/overflow/acf_span: wingspan in feet
     * - sim/aircraft/parts/acf_wing_span, sim/aircraft/view/acf_wing_span: may be meters
     * The unit is sorted out from the value at ceremony start.
     */
    m_drWingspan = XPLMFindDataRef("sim/aircraft/view/acf_semi_len_m");
    if (!m_drWingspan) {
        m_drWingspan = XPLMFindDataRef("sim/aircraft/overflow/acf_span");
    }
    if (!m_drWingspan) {
        m_drWingspan = XPLMFindDataRef("sim/aircraft/parts/acf_wing_span");
    }
    if (!m_drWingspan) {
        m_drWingspan = XPLMFindDataRef("sim/aircraft/view/acf_wing_span");
    }

    if (m_drWingspan) {
        DebugLog("Wingspan dataref found (will verify value at water salute start)");
    } else {
        DebugLog("WARNING: No wingspan dataref found, will use default %.0fm", DEFAULT_WINGSPAN_METERS);
    }
}

bool XplmAircraftTelemetry::IsOnGround() {
    return m_drOnGround && XPLMGetDatai(m_drOnGround) != 0;
}

float XplmAircraftTelemetry::GetGroundSpeed() {
    return m_drGroundSpeed ? XPLMGetDataf(m_drGroundSpeed) : 0.0f;
}

void XplmAircraftTelemetry::GetPosition(double& x, double& y, double& z) {
    x = m_drLocalX ? XPLMGetDatad(m_drLocalX) : 0.0;
    y = m_drLocalY ? XPLMGetDatad(m_drLocalY) : 0.0;
    z = m_drLocalZ ? XPLMGetDatad(m_drLocalZ) : 0.0;
}

float XplmAircraftTelemetry::GetHeading() {
    return m_drHeading ? XPLMGetDataf(m_drHeading) : 0.0f;
}

void XplmAircraftTelemetry::GetLatLon(double& lat, double& lon) {
    lat = m_drLatitude ? XPLMGetDatad(m_drLatitude) : 0.0;
    lon = m_drLongitude ? XPLMGetDatad(m_drLongitude) : 0.0;
}

bool XplmAircraftTelemetry::GetWingspanRaw(float& rawValue) {
    if (!m_drWingspan) {
        return false;
    }
    rawValue = XPLMGetDataf(m_drWingspan);
    DebugLog("Raw wingspan dataref value: %.2f", rawValue);
    return true;
}

XplmVisualFactory::XplmVisualFactory()
    : m_truckObject(nullptr), m_waterDropObject(nullptr), m_waterJetObject(nullptr) {}

XplmVisualFactory::~XplmVisualFactory() {
    UnloadModels();
}

/* Load one OBJ file; nullptr (logged) when missing or invalid */
static XPLMObjectRef LoadModel(const std::string& resourcePath, const char* fileName) {
    std::string modelPath = resourcePath + "/" + fileName;
    DebugLog("Loading model from: %s", modelPath.c_str());

    FILE* testFile = fopen(modelPath.c_str(), "r");
    if (testFile) {
        fclose(testFile);
    } else {
        int savedErrno = errno;
        DebugLog("WARNING: Cannot open model file %s", fileName);
        DebugLog("  Error: %s (errno=%d)", strerror(savedErrno), savedErrno);
        return nullptr;
    }

    XPLMObjectRef object = XPLMLoadObject(modelPath.c_str());
    if (!object) {
        DebugLog("ERROR: XPLMLoadObject returned NULL for %s", fileName);
        DebugLog("  Check the OBJ format and its texture files");
        return nullptr;
    }

    DebugLog("Model %s loaded successfully (handle: %p)", fileName, (void*)object);
    return object;
}

void XplmVisualFactory::LoadModels(const std::string& resourcePath) {
    UnloadModels();

    m_truckObject = LoadModel(resourcePath, "firetruck.obj");
    if (!m_truckObject) {
        DebugLog("  Trucks will NOT be visible");
    }

    m_waterDropObject = LoadModel(resourcePath, "waterdrop.obj");
    if (!m_waterDropObject) {
        DebugLog("  Water particles will not be visible");
    }

    m_waterJetObject = LoadModel(resourcePath, "waterjet.obj");
    if (!m_waterJetObject) {
        DebugLog("  Water stream model missing, using particle spray");
    }
}

void XplmVisualFactory::UnloadModels() {
    if (m_truckObject) {
        XPLMUnloadObject(m_truckObject);
        m_truckObject = nullptr;
    }
    if (m_waterDropObject) {
        XPLMUnloadObject(m_waterDropObject);
        m_waterDropObject = nullptr;
    }
    if (m_waterJetObject) {
        XPLMUnloadObject(m_waterJetObject);
        m_waterJetObject = nullptr;
    }
}

XPLMObjectRef XplmVisualFactory::ObjectFor(VisualModel model) const {
    switch (model) {
        case VISUAL_FIRE_TRUCK: return m_truckObject;
        case VISUAL_WATER_DROP: return m_waterDropObject;
        case VISUAL_WATER_STREAM: return m_waterJetObject;
        default: return nullptr;
    }
}

bool XplmVisualFactory::HasModel(VisualModel model) {
    return ObjectFor(model) != nullptr;
}

VisualHandle XplmVisualFactory::CreateVisual(VisualModel model) {
    XPLMObjectRef object = ObjectFor(model);
    if (!object) {
        return nullptr;
    }
    const char** dataRefs = (model == VISUAL_WATER_STREAM) ? g_waterJetDataRefs : g_noDataRefs;
    return XPLMCreateInstance(object, dataRefs);
}

void XplmVisualFactory::SetVisualPosition(VisualHandle handle, float x, float y, float z,
                                          float pitch, float heading, float roll,
                                          const float* data) {
    if (!handle) return;

    XPLMDrawInfo_t drawInfo;
    drawInfo.structSize = sizeof(XPLMDrawInfo_t);
    drawInfo.x = x;
    drawInfo.y = y;
    drawInfo.z = z;
    drawInfo.pitch = pitch;
    drawInfo.heading = heading;
    drawInfo.roll = roll;
    XPLMInstanceSetPosition(static_cast<XPLMInstanceRef>(handle), &drawInfo, data);
}

void XplmVisualFactory::DestroyVisual(VisualHandle handle) {
    if (handle) {
        XPLMDestroyInstance(static_cast<XPLMInstanceRef>(handle));
    }
}

/*
 * LoadWav - Decode a WAV file to signed 16-bit PCM
 *
 * The channel count and sample rate are kept; only the sample format is
 * converted when the file is not already 16-bit.
 */
static bool LoadWav(const std::string& path, PcmSample& sample) {
    SDL_AudioSpec wavSpec;
    Uint8* wavBuffer = nullptr;
    Uint32 wavLength = 0;

    if (SDL_LoadWAV(path.c_str(), &wavSpec, &wavBuffer, &wavLength) == nullptr) {
        DebugLog("WARNING: Failed to load %s: %s", path.c_str(), SDL_GetError());
        return false;
    }

    SDL_AudioCVT cvt;
    int result = SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                                   AUDIO_S16SYS, wavSpec.channels, wavSpec.freq);
    if (result < 0) {
        DebugLog("WARNING: Cannot convert %s: %s", path.c_str(), SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    if (result == 0) {
        sample.samples.resize(wavLength / sizeof(int16_t));
        memcpy(sample.samples.data(), wavBuffer, sample.samples.size() * sizeof(int16_t));
    } else {
        std::vector<Uint8> converted(static_cast<size_t>(wavLength) * cvt.len_mult);
        memcpy(converted.data(), wavBuffer, wavLength);
        cvt.len = static_cast<int>(wavLength);
        cvt.buf = converted.data();

        if (SDL_ConvertAudio(&cvt) < 0) {
            DebugLog("WARNING: Cannot convert %s: %s", path.c_str(), SDL_GetError());
            SDL_FreeWAV(wavBuffer);
            return false;
        }

        sample.samples.resize(cvt.len_cvt / sizeof(int16_t));
        memcpy(sample.samples.data(), converted.data(), sample.samples.size() * sizeof(int16_t));
    }

    SDL_FreeWAV(wavBuffer);

    sample.frequency = wavSpec.freq;
    sample.channels = wavSpec.channels;
    DebugLog("Loaded %s: %zu samples, %d Hz, %d channel(s)",
             path.c_str(), sample.samples.size(), sample.frequency, sample.channels);
    return !sample.samples.empty();
}

XplmSoundPlayer::XplmSoundPlayer() {}

XplmSoundPlayer::~XplmSoundPlayer() {
    UnloadSounds();
}

XplmSoundPlayer::CueSlot* XplmSoundPlayer::SlotFor(SoundCue cue) {
    switch (cue) {
        case SOUND_WATER_SPRAY: return &m_slots[0];
        case SOUND_TRUCK_ENGINE: return &m_slots[1];
        case SOUND_TRUCK_HORN: return &m_slots[2];
        default: return nullptr;
    }
}

void XplmSoundPlayer::LoadSounds(const std::string& resourcePath) {
    UnloadSounds();

    DebugLog("Loading sound samples...");
    if (!LoadWav(resourcePath + "/water_spray.wav", SlotFor(SOUND_WATER_SPRAY)->sample)) {
        DebugLog("  Water spray will be silent");
    }
    if (!LoadWav(resourcePath + "/truck_engine.wav", SlotFor(SOUND_TRUCK_ENGINE)->sample)) {
        DebugLog("  Truck engine will be silent");
    }
    if (!LoadWav(resourcePath + "/truck_horn.wav", SlotFor(SOUND_TRUCK_HORN)->sample)) {
        DebugLog("  Truck horn will be silent");
    }
}

/* Stops every cue before the sample buffers go away */
void XplmSoundPlayer::UnloadSounds() {
    for (int i = 0; i < 3; ++i) {
        if (m_slots[i].channel) {
            XPLMStopAudio(m_slots[i].channel);
            m_slots[i].channel = nullptr;
        }
        m_slots[i].sample = PcmSample();
    }
}

/* X-Plane calls this when a sample finishes or is stopped */
void XplmSoundPlayer::PlaybackComplete(void* inRefcon, FMOD_RESULT status) {
    (void)status;
    CueSlot* slot = static_cast<CueSlot*>(inRefcon);
    if (slot) {
        slot->channel = nullptr;
    }
}

bool XplmSoundPlayer::IsPlaying(SoundCue cue) {
    CueSlot* slot = SlotFor(cue);
    return slot && slot->channel != nullptr;
}

void XplmSoundPlayer::Play(SoundCue cue, bool loop, float gain) {
    CueSlot* slot = SlotFor(cue);
    if (!slot || slot->sample.samples.empty()) return;

    if (slot->channel) {
        XPLMStopAudio(slot->channel);
        slot->channel = nullptr;
    }

    slot->channel = XPLMPlayPCMOnBus(slot->sample.samples.data(),
                                     static_cast<uint32_t>(slot->sample.samples.size() * sizeof(int16_t)),
                                     FMOD_SOUND_FORMAT_PCM16,
                                     slot->sample.frequency, slot->sample.channels,
                                     loop ? 1 : 0, xplm_AudioExteriorEnvironment,
                                     PlaybackComplete, slot);
    if (!slot->channel) {
        DebugLog("WARNING: XPLMPlayPCMOnBus failed for sound %d", static_cast<int>(cue));
        return;
    }

    XPLMSetAudioVolume(slot->channel, gain);
    FMOD_VECTOR velocity;
    velocity.x = velocity.y = velocity.z = 0.0f;
    XPLMSetAudioPosition(slot->channel, &slot->position, &velocity);
}

void XplmSoundPlayer::Stop(SoundCue cue) {
    CueSlot* slot = SlotFor(cue);
    if (slot && slot->channel) {
        XPLMStopAudio(slot->channel);
        slot->channel = nullptr;
    }
}

/* Remembered for the next Play and applied to a cue that is already playing */
void XplmSoundPlayer::SetPosition(SoundCue cue, double x, double y, double z) {
    CueSlot* slot = SlotFor(cue);
    if (!slot) return;

    slot->position.x = static_cast<float>(x);
    slot->position.y = static_cast<float>(y);
    slot->position.z = static_cast<float>(z);

    if (slot->channel) {
        FMOD_VECTOR velocity;
        velocity.x = velocity.y = velocity.z = 0.0f;
        XPLMSetAudioPosition(slot->channel, &slot->position, &velocity);
    }
}

XplmRainEffect::XplmRainEffect() {
    /* This dataref controls how much rain/water is visible on the aircraft */
    m_drRain = XPLMFindDataRef("sim/private/controls/rain/precipitation_on_aircraft_ratio");
    if (!m_drRain) {
        m_drRain = XPLMFindDataRef("sim/weather/rain_percent");
    }
    if (!m_drRain) {
        m_drRain = XPLMFindDataRef("sim/graphics/effects/rain_scale");
    }
}

bool XplmRainEffect::IsAvailable() {
    return m_drRain != nullptr;
}

float XplmRainEffect::GetValue() {
    return m_drRain ? XPLMGetDataf(m_drRain) : 0.0f;
}

void XplmRainEffect::SetValue(float value) {
    if (m_drRain) {
        XPLMSetDataf(m_drRain, value);
    }
}
