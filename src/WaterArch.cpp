/*
 * Water Arch Plugin for X-Plane 12
 *
 * This plugin simulates a water salute ceremony where two fire trucks
 * drive up to the aircraft and spray water arches over it.
 *
 * Features:
 * - Menu and commands for Start/Stop/Toggle and the truck horn
 * - Aircraft ground and speed validation, optional auto start after landing
 * - Fire truck routing over the airport ground network (apt.dat)
 * - Particle or animated-stream water effects with windshield drops
 * - Per-truck steering, wheel and cannon datarefs for OBJ animation
 * - Positional truck engine, spray and horn sounds
 * - JSON user settings next to the plugin
 *
 * Copyright (c) 2024
 */

#include <memory>

#include "XPLMDefs.h"
#include "XPLMPlugin.h"
#include "XPLMDataAccess.h"
#include "XPLMProcessing.h"
#include "XPLMMenus.h"
#include "XPLMUtilities.h"

#include "Common.h"
#include "Config.h"
#include "CeremonySystem.h"
#include "XplmHost.h"

/* Everything the plugin owns between XPluginStart and XPluginStop */
struct PluginContext {
    XplmTerrainProbe terrain;
    XplmCoordinateTransform transform;
    XplmAircraftTelemetry aircraft;
    XplmVisualFactory visuals;
    XplmSoundPlayer sound;
    XplmRainEffect rain;
    std::unique_ptr<CeremonySystem> ceremony;
};

static std::unique_ptr<PluginContext> g_plugin;

static char g_pluginPath[512];
static std::string g_resourcePath;  /* Path to resources directory */
static std::string g_configPath;
static CeremonyState g_menuState = STATE_IDLE;

static XPLMMenuID g_menuId = nullptr;
static int g_menuStartItem = -1;
static int g_menuStopItem = -1;
static int g_menuHornItem = -1;

static XPLMFlightLoopID g_flightLoopId = nullptr;

static XPLMCommandRef g_cmdStart = nullptr;
static XPLMCommandRef g_cmdStop = nullptr;
static XPLMCommandRef g_cmdToggle = nullptr;
static XPLMCommandRef g_cmdHorn = nullptr;

/* Custom datarefs for fire truck animation - float array[2], index 0 = left, 1 = right */
static XPLMDataRef g_drTruckFrontSteeringAngle = nullptr;  /* waterarch/truck/front_steering_angle */
static XPLMDataRef g_drTruckRearSteeringAngle = nullptr;   /* waterarch/truck/rear_steering_angle */
static XPLMDataRef g_drTruckWheelAngle = nullptr;          /* waterarch/truck/wheel_rotation_angle */
static XPLMDataRef g_drTruckCannonPitch = nullptr;         /* waterarch/truck/cannon_pitch */
static XPLMDataRef g_drTruckCannonYaw = nullptr;           /* waterarch/truck/cannon_yaw */
static XPLMDataRef g_drTruckSpeed = nullptr;               /* waterarch/truck/speed (read-only) */

static void XplmLogSink(const char* message) {
    XPLMDebugString(message);
}

/* Custom dataref callback functions; inRefcon is the CeremonySystem */

typedef float (*TruckFloatGetter)(const FireTruck& truck);
typedef void (*TruckFloatSetter)(FireTruck& truck, float value);

static int ReadTruckArray(void* inRefcon, float* outValues, int inOffset, int inMax,
                          TruckFloatGetter getter) {
    if (outValues == nullptr) {
        return TRUCK_COUNT; /* Return array size */
    }
    CeremonySystem* ceremony = static_cast<CeremonySystem*>(inRefcon);
    int count = 0;
    for (int i = inOffset; i < TRUCK_COUNT && count < inMax; i++, count++) {
        const FireTruck* truck = ceremony ? ceremony->GetTruckByIndex(i) : nullptr;
        outValues[count] = truck ? getter(*truck) : 0.0f;
    }
    return count;
}

/* Writes go to the addressed truck only */
static void WriteTruckArray(void* inRefcon, const float* inValues, int inOffset, int inCount,
                            TruckFloatSetter setter) {
    CeremonySystem* ceremony = static_cast<CeremonySystem*>(inRefcon);
    if (!ceremony || !inValues || inOffset < 0) return;
    for (int i = 0; i < inCount && (inOffset + i) < TRUCK_COUNT; i++) {
        FireTruck* truck = ceremony->GetTruckByIndex(inOffset + i);
        if (truck) {
            setter(*truck, inValues[i]);
        }
    }
}

static float FrontSteeringOf(const FireTruck& truck) { return truck.frontSteeringAngle; }
static float RearSteeringOf(const FireTruck& truck) { return truck.rearSteeringAngle; }
static float WheelAngleOf(const FireTruck& truck) { return truck.wheelRotationAngle; }
static float CannonPitchOf(const FireTruck& truck) { return truck.cannonPitch; }
static float CannonYawOf(const FireTruck& truck) { return truck.cannonYaw; }
static float SpeedOf(const FireTruck& truck) { return truck.speed; }

static int GetFrontSteeringAngleCB(void* inRefcon, float* outValues, int inOffset, int inMax) {
    return ReadTruckArray(inRefcon, outValues, inOffset, inMax, FrontSteeringOf);
}

static void SetFrontSteeringAngleCB(void* inRefcon, float* inValues, int inOffset, int inCount) {
    WriteTruckArray(inRefcon, inValues, inOffset, inCount, SetFrontSteeringAngle);
}

static int GetRearSteeringAngleCB(void* inRefcon, float* outValues, int inOffset, int inMax) {
    return ReadTruckArray(inRefcon, outValues, inOffset, inMax, RearSteeringOf);
}

static void SetRearSteeringAngleCB(void* inRefcon, float* inValues, int inOffset, int inCount) {
    WriteTruckArray(inRefcon, inValues, inOffset, inCount, SetRearSteeringAngle);
}

static int GetWheelRotationAngleCB(void* inRefcon, float* outValues, int inOffset, int inMax) {
    return ReadTruckArray(inRefcon, outValues, inOffset, inMax, WheelAngleOf);
}

static int GetCannonPitchCB(void* inRefcon, float* outValues, int inOffset, int inMax) {
    return ReadTruckArray(inRefcon, outValues, inOffset, inMax, CannonPitchOf);
}

static void SetCannonPitchCB(void* inRefcon, float* inValues, int inOffset, int inCount) {
    WriteTruckArray(inRefcon, inValues, inOffset, inCount, SetCannonPitch);
}

static int GetCannonYawCB(void* inRefcon, float* outValues, int inOffset, int inMax) {
    return ReadTruckArray(inRefcon, outValues, inOffset, inMax, CannonYawOf);
}

static void SetCannonYawCB(void* inRefcon, float* inValues, int inOffset, int inCount) {
    WriteTruckArray(inRefcon, inValues, inOffset, inCount, SetCannonYaw);
}

static int GetTruckSpeedCB(void* inRefcon, float* outValues, int inOffset, int inMax) {
    return ReadTruckArray(inRefcon, outValues, inOffset, inMax, SpeedOf);
}

static XPLMDataRef RegisterTruckArray(const char* name, XPLMGetDatavf_f getter,
                                      XPLMSetDatavf_f setter, void* refcon) {
    XPLMDataRef ref = XPLMRegisterDataAccessor(
        name,
        xplmType_FloatArray,
        setter ? 1 : 0,     /* writable */
        nullptr, nullptr,   /* int accessors */
        nullptr, nullptr,   /* float accessors */
        nullptr, nullptr,   /* double accessors */
        nullptr, nullptr,   /* int array accessors */
        getter, setter,     /* float array accessors */
        nullptr, nullptr,   /* data accessors */
        refcon, refcon      /* refcons */
    );
    DebugLog("  Registered: %s", name);
    return ref;
}

/*
 * RegisterCustomDataRefs - Register all custom datarefs for fire truck control
 *
 * - front_steering_angle (rw): front axles, -45 to 45 degrees, negative = left
 * - rear_steering_angle (rw): rear axle counter-steer, -45 to 45 degrees
 * - wheel_rotation_angle (ro): 0 to 360 degrees, follows distance driven
 * - cannon_pitch (rw): 0 to 90 degrees
 * - cannon_yaw (rw): -180 to 180 degrees relative to the truck
 * - speed (ro): meters per second
 */
static void RegisterCustomDataRefs(CeremonySystem* ceremony) {
    DebugLog("Registering custom datarefs...");

    g_drTruckFrontSteeringAngle = RegisterTruckArray("waterarch/truck/front_steering_angle",
        GetFrontSteeringAngleCB, SetFrontSteeringAngleCB, ceremony);
    g_drTruckRearSteeringAngle = RegisterTruckArray("waterarch/truck/rear_steering_angle",
        GetRearSteeringAngleCB, SetRearSteeringAngleCB, ceremony);
    g_drTruckWheelAngle = RegisterTruckArray("waterarch/truck/wheel_rotation_angle",
        GetWheelRotationAngleCB, nullptr, ceremony);
    g_drTruckCannonPitch = RegisterTruckArray("waterarch/truck/cannon_pitch",
        GetCannonPitchCB, SetCannonPitchCB, ceremony);
    g_drTruckCannonYaw = RegisterTruckArray("waterarch/truck/cannon_yaw",
        GetCannonYawCB, SetCannonYawCB, ceremony);
    g_drTruckSpeed = RegisterTruckArray("waterarch/truck/speed",
        GetTruckSpeedCB, nullptr, ceremony);

    DebugLog("Custom datarefs registered successfully");
}

static void UnregisterDataRef(XPLMDataRef& ref) {
    if (ref) {
        XPLMUnregisterDataAccessor(ref);
        ref = nullptr;
    }
}

static void UnregisterCustomDataRefs() {
    UnregisterDataRef(g_drTruckFrontSteeringAngle);
    UnregisterDataRef(g_drTruckRearSteeringAngle);
    UnregisterDataRef(g_drTruckWheelAngle);
    UnregisterDataRef(g_drTruckCannonPitch);
    UnregisterDataRef(g_drTruckCannonYaw);
    UnregisterDataRef(g_drTruckSpeed);
    DebugLog("Custom datarefs unregistered");
}

/*
 * UpdateMenuState - Update menu item enabled states
 */
static void UpdateMenuState(CeremonyState state) {
    g_menuState = state;
    if (!g_menuId) return;

    bool canStart = (state == STATE_IDLE);
    /* Allow stopping during any active state (approaching, positioning, or spraying) */
    bool canStop = (state != STATE_IDLE && state != STATE_TRUCKS_LEAVING);

    XPLMEnableMenuItem(g_menuId, g_menuStartItem, canStart ? 1 : 0);
    XPLMEnableMenuItem(g_menuId, g_menuStopItem, canStop ? 1 : 0);
}

static void RequestStart(CeremonySystem* ceremony) {
    if (!ceremony->Start() && ceremony->GetState() == STATE_IDLE) {
        XPLMSpeakString("Water salute requires aircraft on ground below 40 knots");
    }
    UpdateMenuState(ceremony->GetState());
}

static void RequestStop(CeremonySystem* ceremony) {
    ceremony->Stop();
    UpdateMenuState(ceremony->GetState());
}

static void RequestToggle(CeremonySystem* ceremony) {
    if (ceremony->GetState() == STATE_IDLE) {
        RequestStart(ceremony);
    } else {
        RequestStop(ceremony);
    }
}

/*
 * MenuHandler - Handle menu clicks
 */
static void MenuHandler(void* inMenuRef, void* inItemRef) {
    CeremonySystem* ceremony = static_cast<CeremonySystem*>(inMenuRef);
    const char* item = static_cast<const char*>(inItemRef);
    if (!ceremony || !item) return;

    if (strcmp(item, "start") == 0) {
        RequestStart(ceremony);
    } else if (strcmp(item, "stop") == 0) {
        RequestStop(ceremony);
    } else if (strcmp(item, "horn") == 0) {
        ceremony->PlayHorn();
    }
}

/* Command handlers act on the press; inRefcon is the CeremonySystem */
static int StartCommandHandler(XPLMCommandRef inCommand, XPLMCommandPhase inPhase, void* inRefcon) {
    (void)inCommand;
    if (inPhase == xplm_CommandBegin) {
        RequestStart(static_cast<CeremonySystem*>(inRefcon));
    }
    return 0;
}

static int StopCommandHandler(XPLMCommandRef inCommand, XPLMCommandPhase inPhase, void* inRefcon) {
    (void)inCommand;
    if (inPhase == xplm_CommandBegin) {
        RequestStop(static_cast<CeremonySystem*>(inRefcon));
    }
    return 0;
}

static int ToggleCommandHandler(XPLMCommandRef inCommand, XPLMCommandPhase inPhase, void* inRefcon) {
    (void)inCommand;
    if (inPhase == xplm_CommandBegin) {
        RequestToggle(static_cast<CeremonySystem*>(inRefcon));
    }
    return 0;
}

static int HornCommandHandler(XPLMCommandRef inCommand, XPLMCommandPhase inPhase, void* inRefcon) {
    (void)inCommand;
    if (inPhase == xplm_CommandBegin) {
        static_cast<CeremonySystem*>(inRefcon)->PlayHorn();
    }
    return 0;
}

static void RegisterCommands(CeremonySystem* ceremony) {
    g_cmdStart = XPLMCreateCommand("waterarch/start", "Start water salute");
    g_cmdStop = XPLMCreateCommand("waterarch/stop", "Stop water salute");
    g_cmdToggle = XPLMCreateCommand("waterarch/toggle", "Toggle water salute");
    g_cmdHorn = XPLMCreateCommand("waterarch/horn", "Sound fire truck horn");

    XPLMRegisterCommandHandler(g_cmdStart, StartCommandHandler, 1, ceremony);
    XPLMRegisterCommandHandler(g_cmdStop, StopCommandHandler, 1, ceremony);
    XPLMRegisterCommandHandler(g_cmdToggle, ToggleCommandHandler, 1, ceremony);
    XPLMRegisterCommandHandler(g_cmdHorn, HornCommandHandler, 1, ceremony);
    DebugLog("Commands registered");
}

static void UnregisterCommands(CeremonySystem* ceremony) {
    if (g_cmdStart) XPLMUnregisterCommandHandler(g_cmdStart, StartCommandHandler, 1, ceremony);
    if (g_cmdStop) XPLMUnregisterCommandHandler(g_cmdStop, StopCommandHandler, 1, ceremony);
    if (g_cmdToggle) XPLMUnregisterCommandHandler(g_cmdToggle, ToggleCommandHandler, 1, ceremony);
    if (g_cmdHorn) XPLMUnregisterCommandHandler(g_cmdHorn, HornCommandHandler, 1, ceremony);
    g_cmdStart = g_cmdStop = g_cmdToggle = g_cmdHorn = nullptr;
}

/*
 * FlightLoopCallback - Main update loop
 */
static float FlightLoopCallback(float inElapsedSinceLastCall, float inElapsedTimeSinceLastFlightLoop,
                                int inCounter, void* inRefcon) {
    (void)inElapsedTimeSinceLastFlightLoop;
    (void)inCounter;

    CeremonySystem* ceremony = static_cast<CeremonySystem*>(inRefcon);
    if (!ceremony) {
        return -1.0f;
    }

    ceremony->Update(inElapsedSinceLastCall);

    if (ceremony->GetState() != g_menuState) {
        UpdateMenuState(ceremony->GetState());
    }

    return -1.0f; /* Run every frame */
}

/* Does dir/resources/firetruck.obj exist? */
static bool HasResources(const std::string& dir) {
    std::string testPath = dir + "/resources/firetruck.obj";
    DebugLog("Trying resource path: %s", testPath.c_str());
    FILE* testFile = fopen(testPath.c_str(), "r");
    if (!testFile) return false;
    fclose(testFile);
    return true;
}

/* Strip the last path component; false when there is none */
static bool ParentDirectory(std::string& path) {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash == std::string::npos) return false;
    path.erase(lastSlash);
    return true;
}

/*
 * FindResourcePath - Find the resources directory
 *
 * X-Plane plugins can be installed in different directory structures:
 * 1. Flat: WaterArch/WaterArch.xpl with resources at WaterArch/resources/
 * 2. Platform-specific: WaterArch/lin_x64/WaterArch.xpl (or win_x64/, mac_x64/)
 *    with resources at WaterArch/resources/
 * The plugin directory and up to two of its parents are tried.
 */
static bool FindResourcePath() {
    std::string dir = g_pluginPath;
    for (int level = 0; level < 3; ++level) {
        if (HasResources(dir)) {
            g_resourcePath = dir + "/resources";
            DebugLog("Found resources at: %s", g_resourcePath.c_str());
            return true;
        }
        if (!ParentDirectory(dir)) break;
    }

    DebugLog("ERROR: Could not find resources directory!");
    DebugLog("  Make sure 'resources/firetruck.obj' exists relative to plugin location");

    /* Fallback to default (will likely fail, but provides debug info) */
    g_resourcePath = std::string(g_pluginPath) + "/resources";
    return false;
}

/*
 * XPluginStart - Called when the plugin is loaded
 */
PLUGIN_API int XPluginStart(char* outName, char* outSig, char* outDesc) {
    strcpy(outName, "Water Arch");
    strcpy(outSig, "com.xplane.waterarch");
    strcpy(outDesc, "Water salute ceremony with fire trucks");

    SetLogSink(XplmLogSink);

    /* Get plugin path using XPLMGetPluginInfo */
    XPLMGetPluginInfo(XPLMGetMyID(), nullptr, g_pluginPath, nullptr, nullptr);
    /* Extract directory path from full file path */
    char* lastSlash = strrchr(g_pluginPath, '/');
    if (!lastSlash) lastSlash = strrchr(g_pluginPath, '\\');
    if (lastSlash) *lastSlash = '\0';

    DebugLog("Plugin starting...");
    DebugLog("Plugin directory: %s", g_pluginPath);

    FindResourcePath();

    g_plugin.reset(new PluginContext());
    g_plugin->visuals.LoadModels(g_resourcePath);
    g_plugin->sound.LoadSounds(g_resourcePath);

    HostServices services;
    services.terrain = &g_plugin->terrain;
    services.transform = &g_plugin->transform;
    services.aircraft = &g_plugin->aircraft;
    services.visuals = &g_plugin->visuals;
    services.sound = &g_plugin->sound;
    services.rain = &g_plugin->rain;
    g_plugin->ceremony.reset(new CeremonySystem(services));
    CeremonySystem* ceremony = g_plugin->ceremony.get();

    /* User settings */
    g_configPath = std::string(g_pluginPath) + "/" + CONFIG_FILE_NAME;
    UserSettings settings;
    if (!LoadConfiguration(g_configPath, settings)) {
        DebugLog("Using default settings");
    }
    ceremony->SetSettings(settings);

    /* apt.dat search paths */
    char systemPath[512];
    XPLMGetSystemPath(systemPath);
    ceremony->SetAptDatSearchPaths(GetDefaultAptDatPaths(systemPath));

    /* Create menu */
    int menuContainerItem = XPLMAppendMenuItem(XPLMFindPluginsMenu(), "Water Arch", nullptr, 0);
    g_menuId = XPLMCreateMenu("Water Arch", XPLMFindPluginsMenu(), menuContainerItem, MenuHandler, ceremony);

    g_menuStartItem = XPLMAppendMenuItem(g_menuId, "Start Water Salute", (void*)"start", 0);
    g_menuStopItem = XPLMAppendMenuItem(g_menuId, "Stop Water Salute", (void*)"stop", 0);
    g_menuHornItem = XPLMAppendMenuItem(g_menuId, "Sound Horn", (void*)"horn", 0);

    UpdateMenuState(ceremony->GetState());

    RegisterCommands(ceremony);

    /* Create flight loop */
    XPLMCreateFlightLoop_t flightLoopParams;
    flightLoopParams.structSize = sizeof(XPLMCreateFlightLoop_t);
    flightLoopParams.phase = xplm_FlightLoop_Phase_AfterFlightModel;
    flightLoopParams.callbackFunc = FlightLoopCallback;
    flightLoopParams.refcon = ceremony;

    g_flightLoopId = XPLMCreateFlightLoop(&flightLoopParams);
    XPLMScheduleFlightLoop(g_flightLoopId, -1.0f, 1);

    RegisterCustomDataRefs(ceremony);

    DebugLog("Plugin started successfully");

    return 1;
}

/*
 * XPluginStop - Called when the plugin is unloaded
 */
PLUGIN_API void XPluginStop(void) {
    DebugLog("Plugin stopping...");

    UnregisterCustomDataRefs();

    if (g_flightLoopId) {
        XPLMDestroyFlightLoop(g_flightLoopId);
        g_flightLoopId = nullptr;
    }

    if (g_plugin) {
        CeremonySystem* ceremony = g_plugin->ceremony.get();
        UnregisterCommands(ceremony);

        if (!SaveConfiguration(g_configPath, ceremony->GetSettings())) {
            DebugLog("Settings were not saved");
        }

        ceremony->Shutdown();
        g_plugin->ceremony.reset();
        g_plugin->visuals.UnloadModels();
        g_plugin->sound.UnloadSounds();
        g_plugin.reset();
    }

    if (g_menuId) {
        XPLMDestroyMenu(g_menuId);
        g_menuId = nullptr;
    }

    DebugLog("Plugin stopped");
    SetLogSink(nullptr);
}

/*
 * XPluginEnable - Called when the plugin is enabled
 */
PLUGIN_API int XPluginEnable(void) {
    DebugLog("Plugin enabled");
    return 1;
}

/*
 * XPluginDisable - Called when the plugin is disabled
 */
PLUGIN_API void XPluginDisable(void) {
    DebugLog("Plugin disabled");
    if (g_plugin && g_plugin->ceremony) {
        RequestStop(g_plugin->ceremony.get());
    }
}

/*
 * XPluginReceiveMessage - Handle messages from X-Plane
 */
PLUGIN_API void XPluginReceiveMessage(XPLMPluginID inFrom, int inMsg, void* inParam) {
    (void)inFrom;
    (void)inParam;

    if (inMsg == XPLM_MSG_PLANE_LOADED || inMsg == XPLM_MSG_AIRPORT_LOADED) {
        /* Send the trucks away when plane or airport changes */
        if (g_plugin && g_plugin->ceremony && g_plugin->ceremony->GetState() != STATE_IDLE) {
            RequestStop(g_plugin->ceremony.get());
        }
    }
}
