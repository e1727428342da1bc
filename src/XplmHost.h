/*
 * XplmHost.h - X-Plane implementations of the host service interfaces
 */

#ifndef WATERARCH_XPLMHOST_H
#define WATERARCH_XPLMHOST_H

#include "XPLMDefs.h"
#include "XPLMDataAccess.h"
#include "XPLMScenery.h"
#include "XPLMInstance.h"
#include "XPLMSound.h"

#include "Common.h"
#include "HostServices.h"

/* Terrain probe using XPLMProbeTerrainXYZ */
class XplmTerrainProbe : public TerrainProbe {
public:
    XplmTerrainProbe();
    virtual ~XplmTerrainProbe();

    virtual float GetTerrainHeight(float x, float z);

private:
    XPLMProbeRef m_probe;
};

class XplmCoordinateTransform : public CoordinateTransform {
public:
    virtual void WorldToLocal(double lat, double lon, double alt,
                              double& x, double& y, double& z);
    virtual void LocalToWorld(double x, double y, double z,
                              double& lat, double& lon, double& alt);
};

/* User aircraft state from sim/flightmodel datarefs */
class XplmAircraftTelemetry : public AircraftTelemetry {
public:
    XplmAircraftTelemetry();

    virtual bool IsOnGround();
    virtual float GetGroundSpeed();
    virtual void GetPosition(double& x, double& y, double& z);
    virtual float GetHeading();
    virtual void GetLatLon(double& lat, double& lon);
    virtual bool GetWingspanRaw(float& rawValue);

private:
    XPLMDataRef m_drOnGround;
    XPLMDataRef m_drGroundSpeed;
    XPLMDataRef m_drLocalX;
    XPLMDataRef m_drLocalY;
    XPLMDataRef m_drLocalZ;
    XPLMDataRef m_drHeading;
    XPLMDataRef m_drLatitude;
    XPLMDataRef m_drLongitude;
    XPLMDataRef m_drWingspan;
};

/* OBJ models and their instances */
class XplmVisualFactory : public VisualFactory {
public:
    XplmVisualFactory();
    virtual ~XplmVisualFactory();

    /* Load firetruck.obj, waterdrop.obj and waterjet.obj from resourcePath */
    void LoadModels(const std::string& resourcePath);
    void UnloadModels();

    virtual bool HasModel(VisualModel model);
    virtual VisualHandle CreateVisual(VisualModel model);
    virtual void SetVisualPosition(VisualHandle handle, float x, float y, float z,
                                   float pitch, float heading, float roll,
                                   const float* data);
    virtual void DestroyVisual(VisualHandle handle);

private:
    XPLMObjectRef ObjectFor(VisualModel model) const;

    XPLMObjectRef m_truckObject;
    XPLMObjectRef m_waterDropObject;  /* Water droplet model for particle instances */
    XPLMObjectRef m_waterJetObject;   /* Animated water stream model */
};

/* 16-bit PCM sample decoded from a WAV file */
struct PcmSample {
    std::vector<int16_t> samples;
    int frequency;
    int channels;

    PcmSample() : frequency(0), channels(0) {}
};

/*
 * Sound cues played through X-Plane's FMOD buses (XPLMPlayPCMOnBus).
 * Samples are water_spray.wav, truck_engine.wav and truck_horn.wav from the
 * resources directory; a cue whose file is missing stays silent.
 */
class XplmSoundPlayer : public SoundPlayer {
public:
    XplmSoundPlayer();
    virtual ~XplmSoundPlayer();

    void LoadSounds(const std::string& resourcePath);
    void UnloadSounds();

    virtual bool IsPlaying(SoundCue cue);
    virtual void Play(SoundCue cue, bool loop, float gain);
    virtual void Stop(SoundCue cue);
    virtual void SetPosition(SoundCue cue, double x, double y, double z);

private:
    /* One playing channel per cue; cleared by X-Plane when playback ends */
    struct CueSlot {
        PcmSample sample;
        FMOD_CHANNEL* channel;
        FMOD_VECTOR position;

        CueSlot() : channel(nullptr) { position.x = position.y = position.z = 0.0f; }
    };

    static void PlaybackComplete(void* inRefcon, FMOD_RESULT status);
    CueSlot* SlotFor(SoundCue cue);

    CueSlot m_slots[3];
};

/* Rain-on-aircraft dataref used for the windshield effect */
class XplmRainEffect : public RainEffectTarget {
public:
    XplmRainEffect();

    virtual bool IsAvailable();
    virtual float GetValue();
    virtual void SetValue(float value);

private:
    XPLMDataRef m_drRain;
};

#endif /* WATERARCH_XPLMHOST_H */
