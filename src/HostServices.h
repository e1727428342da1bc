/*
 * HostServices.h - Interfaces to the host simulator
 *
 * The ceremony core never talks to X-Plane directly. Everything it needs
 * from the simulator (terrain, coordinate transform, aircraft state,
 * model instances, sound and the rain dataref) goes through these small
 * abstract classes. The plugin implements them with the XPLM API and the
 * tests implement them with plain fakes.
 */

#ifndef WATERARCH_HOSTSERVICES_H
#define WATERARCH_HOSTSERVICES_H

/* Terrain height lookup at a local planar position */
class TerrainProbe {
public:
    virtual ~TerrainProbe() {}

    /* Ground elevation (local Y) at (x, z); 0 when the probe misses */
    virtual float GetTerrainHeight(float x, float z) = 0;
};

/* Conversion between geographic and local OpenGL coordinates */
class CoordinateTransform {
public:
    virtual ~CoordinateTransform() {}

    virtual void WorldToLocal(double lat, double lon, double alt,
                              double& x, double& y, double& z) = 0;
    virtual void LocalToWorld(double x, double y, double z,
                              double& lat, double& lon, double& alt) = 0;
};

/* Read-only view of the user aircraft */
class AircraftTelemetry {
public:
    virtual ~AircraftTelemetry() {}

    virtual bool IsOnGround() = 0;
    virtual float GetGroundSpeed() = 0;        /* m/s */
    virtual void GetPosition(double& x, double& y, double& z) = 0;
    virtual float GetHeading() = 0;            /* degrees true */
    virtual void GetLatLon(double& lat, double& lon) = 0;

    /* Raw wingspan-related measurement; false when no source is available */
    virtual bool GetWingspanRaw(float& rawValue) = 0;
};

/* Opaque handle to a model instance owned by the host */
typedef void* VisualHandle;

enum VisualModel {
    VISUAL_FIRE_TRUCK,
    VISUAL_WATER_DROP,
    VISUAL_WATER_STREAM
};

/* Creates and places model instances */
class VisualFactory {
public:
    virtual ~VisualFactory() {}

    virtual bool HasModel(VisualModel model) = 0;

    /* Returns nullptr when the model is not loaded or creation fails */
    virtual VisualHandle CreateVisual(VisualModel model) = 0;

    /* data holds the model's animation values, nullptr when it has none */
    virtual void SetVisualPosition(VisualHandle handle, float x, float y, float z,
                                   float pitch, float heading, float roll,
                                   const float* data) = 0;
    virtual void DestroyVisual(VisualHandle handle) = 0;
};

enum SoundCue {
    SOUND_WATER_SPRAY,
    SOUND_TRUCK_ENGINE,
    SOUND_TRUCK_HORN
};

/* Positional sound playback */
class SoundPlayer {
public:
    virtual ~SoundPlayer() {}

    virtual bool IsPlaying(SoundCue cue) = 0;
    virtual void Play(SoundCue cue, bool loop, float gain) = 0;
    virtual void Stop(SoundCue cue) = 0;
    virtual void SetPosition(SoundCue cue, double x, double y, double z) = 0;
};

/* Host value driving rain drops on the windshield */
class RainEffectTarget {
public:
    virtual ~RainEffectTarget() {}

    virtual bool IsAvailable() = 0;
    virtual float GetValue() = 0;
    virtual void SetValue(float value) = 0;
};

/*
 * Services handed to the ceremony system. terrain, transform and aircraft
 * are required; visuals, sound and rain may be nullptr, in which case the
 * matching feature is skipped.
 */
struct HostServices {
    TerrainProbe* terrain;
    CoordinateTransform* transform;
    AircraftTelemetry* aircraft;
    VisualFactory* visuals;
    SoundPlayer* sound;
    RainEffectTarget* rain;

    HostServices()
        : terrain(nullptr), transform(nullptr), aircraft(nullptr),
          visuals(nullptr), sound(nullptr), rain(nullptr) {}
};

#endif /* WATERARCH_HOSTSERVICES_H */
