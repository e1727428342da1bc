/*
 * FakeHost.h - In-memory host services for the unit tests
 */

#ifndef WATERARCH_TESTS_FAKEHOST_H
#define WATERARCH_TESTS_FAKEHOST_H

#include <map>
#include <set>

#include "HostServices.h"
#include "RoadNetwork.h"

/* Flat ground at a fixed elevation */
class FakeTerrain : public TerrainProbe {
public:
    FakeTerrain() : height(0.0f), probes(0) {}

    virtual float GetTerrainHeight(float x, float z) {
        (void)x;
        (void)z;
        probes++;
        return height;
    }

    float height;
    int probes;
};

/* Equirectangular projection around a fixed origin */
class FakeTransform : public CoordinateTransform {
public:
    FakeTransform() : originLat(0.0), originLon(0.0) {}

    virtual void WorldToLocal(double lat, double lon, double alt,
                              double& x, double& y, double& z) {
        LatLonToLocal(lat, lon, originLat, originLon, x, z);
        y = alt;
    }

    virtual void LocalToWorld(double x, double y, double z,
                              double& lat, double& lon, double& alt) {
        LocalToLatLon(x, z, originLat, originLon, lat, lon);
        alt = y;
    }

    double originLat;
    double originLon;
};

class FakeAircraft : public AircraftTelemetry {
public:
    FakeAircraft()
        : onGround(true), groundSpeed(0.0f), x(0.0), y(0.0), z(0.0), heading(0.0f),
          lat(0.0), lon(0.0), hasWingspan(true), wingspanRaw(15.0f) {}

    virtual bool IsOnGround() { return onGround; }
    virtual float GetGroundSpeed() { return groundSpeed; }
    virtual void GetPosition(double& outX, double& outY, double& outZ) {
        outX = x;
        outY = y;
        outZ = z;
    }
    virtual float GetHeading() { return heading; }
    virtual void GetLatLon(double& outLat, double& outLon) {
        outLat = lat;
        outLon = lon;
    }
    virtual bool GetWingspanRaw(float& rawValue) {
        if (!hasWingspan) return false;
        rawValue = wingspanRaw;
        return true;
    }

    bool onGround;
    float groundSpeed;       /* m/s */
    double x, y, z;
    float heading;
    double lat, lon;
    bool hasWingspan;
    float wingspanRaw;
};

/* Hands out integer handles and tracks which are alive */
class FakeVisuals : public VisualFactory {
public:
    FakeVisuals()
        : hasTruck(true), hasDrop(true), hasStream(false), nextHandle(1),
          created(0), destroyed(0), lastPitch(0.0f), lastHeading(0.0f) {
        lastData[0] = lastData[1] = -1.0f;
    }

    virtual bool HasModel(VisualModel model) {
        switch (model) {
            case VISUAL_FIRE_TRUCK: return hasTruck;
            case VISUAL_WATER_DROP: return hasDrop;
            case VISUAL_WATER_STREAM: return hasStream;
            default: return false;
        }
    }

    virtual VisualHandle CreateVisual(VisualModel model) {
        if (!HasModel(model)) return nullptr;
        VisualHandle handle = reinterpret_cast<VisualHandle>(nextHandle++);
        alive.insert(handle);
        models[handle] = model;
        created++;
        return handle;
    }

    virtual void SetVisualPosition(VisualHandle handle, float x, float y, float z,
                                   float pitch, float heading, float roll,
                                   const float* data) {
        (void)x;
        (void)y;
        (void)z;
        (void)roll;
        lastPitch = pitch;
        lastHeading = heading;
        if (data) {
            lastData[0] = data[0];
            lastData[1] = data[1];
        }
        positioned.insert(handle);
    }

    virtual void DestroyVisual(VisualHandle handle) {
        alive.erase(handle);
        destroyed++;
    }

    int AliveCount(VisualModel model) const {
        int count = 0;
        for (std::set<VisualHandle>::const_iterator it = alive.begin(); it != alive.end(); ++it) {
            std::map<VisualHandle, VisualModel>::const_iterator m = models.find(*it);
            if (m != models.end() && m->second == model) count++;
        }
        return count;
    }

    bool hasTruck;
    bool hasDrop;
    bool hasStream;
    uintptr_t nextHandle;
    int created;
    int destroyed;
    std::set<VisualHandle> alive;
    std::set<VisualHandle> positioned;
    std::map<VisualHandle, VisualModel> models;
    float lastPitch;
    float lastHeading;
    float lastData[2];
};

struct SoundPosition {
    double x, y, z;
};

struct SoundCall {
    SoundCue cue;
    bool loop;
    float gain;
};

class FakeSound : public SoundPlayer {
public:
    FakeSound() : stops(0) {}

    virtual bool IsPlaying(SoundCue cue) { return playing.count(cue) != 0; }
    virtual void Play(SoundCue cue, bool loop, float gain) {
        SoundCall call;
        call.cue = cue;
        call.loop = loop;
        call.gain = gain;
        plays.push_back(call);
        if (loop) playing.insert(cue);
    }
    virtual void Stop(SoundCue cue) {
        playing.erase(cue);
        stops++;
    }
    virtual void SetPosition(SoundCue cue, double x, double y, double z) {
        SoundPosition position;
        position.x = x;
        position.y = y;
        position.z = z;
        positions[cue] = position;
    }

    int PlayCount(SoundCue cue) const {
        int count = 0;
        for (size_t i = 0; i < plays.size(); ++i) {
            if (plays[i].cue == cue) count++;
        }
        return count;
    }

    std::vector<SoundCall> plays;
    std::set<SoundCue> playing;
    std::map<SoundCue, SoundPosition> positions;
    int stops;
};

class FakeRain : public RainEffectTarget {
public:
    FakeRain() : available(true), value(0.0f), writes(0) {}

    virtual bool IsAvailable() { return available; }
    virtual float GetValue() { return value; }
    virtual void SetValue(float newValue) {
        value = newValue;
        writes++;
    }

    bool available;
    float value;
    int writes;
};

/* Every fake wired into a HostServices bundle */
struct FakeHost {
    FakeTerrain terrain;
    FakeTransform transform;
    FakeAircraft aircraft;
    FakeVisuals visuals;
    FakeSound sound;
    FakeRain rain;

    HostServices Services() {
        HostServices services;
        services.terrain = &terrain;
        services.transform = &transform;
        services.aircraft = &aircraft;
        services.visuals = &visuals;
        services.sound = &sound;
        services.rain = &rain;
        return services;
    }
};

#endif /* WATERARCH_TESTS_FAKEHOST_H */
