/*
 * Common.h - Common includes, constants and utilities for WaterArch
 *
 * This file contains shared includes, constants, logging and the
 * geometry/kinematics helpers used across all modules. Nothing here
 * depends on the X-Plane SDK so the ceremony core can be built and
 * tested without a simulator.
 */

#ifndef WATERARCH_COMMON_H
#define WATERARCH_COMMON_H

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <cstdarg>
#include <cerrno>
#include <cstdint>
#include <random>
#include <vector>
#include <string>
#include <algorithm>
#include <limits>

/* Unit conversion */
static const float KNOTS_TO_MS = 0.514444f;        /* Knots to m/s conversion */
static const float FEET_TO_METERS = 0.3048f;       /* Feet to meters conversion */
static const float PI = 3.14159265f;               /* Pi constant */
static const float DEG_TO_RAD = PI / 180.0f;       /* Degrees to radians conversion */
static const float RAD_TO_DEG = 180.0f / PI;       /* Radians to degrees conversion */

/* Ceremony constants */
static const float MAX_GROUND_SPEED_KNOTS = 40.0f; /* Maximum ground speed for water salute */
static const float MAX_FRAME_DT = 0.1f;            /* Largest time step accepted per update (seconds) */
static const float TRUCK_APPROACH_SPEED = 15.0f;   /* Default fire truck cruise speed in m/s */
static const float TRUCK_TURN_IN_PLACE_SPEED = 2.0f; /* Speed for turning in place (m/s) */
static const float TRUCK_LEAVING_SPEED_MULT = 2.0f / 3.0f;  /* Speed multiplier when leaving (2/3 of cruise speed) */
static const float TRUCK_ACCELERATION = 3.0f;      /* Truck acceleration in m/s^2 */
static const float TRUCK_DECELERATION = 4.0f;      /* Truck deceleration in m/s^2 */
static const float TRUCK_SLOWDOWN_DISTANCE = 30.0f; /* Distance at which truck starts slowing down (meters) */
static const float TRUCK_ARRIVAL_RADIUS = 2.0f;    /* Distance at which direct approach switches to in-place rotation */
static const float HEADING_TOLERANCE_DEG = 2.0f;   /* Tolerance for heading alignment (degrees) */
static const float TRUCK_LEAVING_DISTANCE = 600.0f;  /* Distance from aircraft to complete leaving (meters) */
static const float TRUCK_LEAVE_TURN_ANGLE = 45.0f; /* Heading change before driving away (degrees) */
static const float TRUCK_STOP_DISTANCE = 200.0f;   /* Distance in front of aircraft to stop (meters) */
static const float TRUCK_SPAWN_DISTANCE = 500.0f;  /* Distance behind aircraft to spawn trucks (meters) */
static const float TRUCK_EXTRA_SPACING = 40.0f;    /* Extra spacing beyond wingspan (meters) */
static const float TRUCK_POSITIONING_THRESHOLD = 50.0f; /* Distance threshold to enter positioning phase (meters) */

/* Water spray constants */
static const float WATER_JET_HEIGHT = 25.0f;       /* Default height of water arch (meters) */
static const float WATER_JET_SPEED_FACTOR = 2.5f;  /* Launch speed per meter of arch height */
static const float PARTICLE_LIFETIME = 4.0f;       /* Particle lifetime in seconds */
static const int   NUM_PARTICLES_PER_JET = 200;    /* Active particle cap per water jet */
static const float PARTICLE_EMIT_RATE = 0.015f;    /* Time between particle emissions (seconds) */
static const float PARTICLE_GRAVITY = 9.81f;       /* Gravity acceleration (m/s^2) */
static const float PARTICLE_DRAG = 0.15f;          /* Air drag coefficient for particles */
static const float PARTICLE_TURBULENCE = 0.02f;    /* Per-tick turbulence amount */
static const float PARTICLE_SPREAD_ANGLE = 0.05f;  /* Emission cone spread (radians, ~3 degrees) */
static const float NOZZLE_OFFSET_X = 0.0f;         /* Nozzle lateral offset from truck center */
static const float NOZZLE_OFFSET_Y = 3.5f;         /* Nozzle height above truck origin */
static const float NOZZLE_OFFSET_Z = 2.0f;         /* Nozzle forward offset */

/* Raindrop effect on windshield constants */
static const float RAINDROP_DETECTION_RADIUS = 50.0f;  /* Radius to detect water particles near aircraft (meters) */
static const float RAINDROP_DETECTION_HEIGHT = 20.0f;  /* Height range to detect water particles (meters) */
static const float RAINDROP_EFFECT_MAX = 0.8f;         /* Maximum rain effect intensity (0.0 - 1.0) */
static const float RAINDROP_INTENSITY_MULTIPLIER = 2.0f; /* Boost applied to the nearby particle ratio */
static const float RAINDROP_FADE_IN_TIME = 0.5f;       /* Time to fade in rain effect (seconds) */
static const float RAINDROP_FADE_OUT_TIME = 2.0f;      /* Time to fade out rain effect (seconds) */
static const float RAINDROP_UPDATE_INTERVAL = 0.1f;    /* Interval to update raindrop detection (seconds) */

/* Wingspan validation constants */
static const float MIN_SEMISPAN_METERS = 2.5f;     /* Minimum semispan (half wingspan) in meters */
static const float MAX_SEMISPAN_METERS = 45.0f;    /* Maximum semispan in meters (A380 wingspan ~80m / 2) */
static const float MIN_WINGSPAN_METERS = 5.0f;     /* Minimum valid wingspan in meters */
static const float MAX_WINGSPAN_METERS = 90.0f;    /* Maximum valid wingspan in meters (A380 ~80m) */
static const float DEFAULT_WINGSPAN_METERS = 30.0f; /* Default wingspan if not available */

/* Debug configuration */
#ifndef WATERARCH_DEBUG_VERBOSE
static const bool DEBUG_VERBOSE = false;           /* Enable verbose debug logging */
#else
static const bool DEBUG_VERBOSE = true;            /* Verbose logging enabled via build flag */
#endif
static const float DEBUG_LOG_INTERVAL = 2.0f;      /* Interval for periodic debug logs (seconds) */
static const size_t DEBUG_BUFFER_SIZE = 1024;      /* Buffer size for debug message formatting */
static const size_t DEBUG_LOG_PREFIX_SIZE = 32;    /* Max size of log prefix "WaterArch [VERBOSE]: " */
static const size_t DEBUG_LOG_MSG_SIZE = DEBUG_BUFFER_SIZE + DEBUG_LOG_PREFIX_SIZE + 2;

/* Road network constants */
static const float ROAD_SEARCH_RADIUS = 5000.0f;   /* Maximum distance to search for airports (meters) */
static const float PATH_NODE_DISTANCE = 30.0f;     /* Spacing of interpolated fallback waypoints (meters) */
static const float TURN_ANTICIPATION = 15.0f;      /* Distance ahead to start turning for smooth path following */
static const float MIN_TURN_RADIUS = 8.0f;         /* Minimum turning radius for 8x8 truck (meters) */
static const float PATH_REACH_THRESHOLD = 5.0f;    /* Distance to consider a waypoint reached (meters) */
static const float MIN_WAYPOINT_SPACING = 0.01f;   /* Waypoints closer than this share a heading (meters) */
static const float BEZIER_SMOOTHING_FACTOR = 0.25f; /* Corner point offset as fraction of segment length */
static const float CORNER_APPROACH_SPEED_FACTOR = 0.7f; /* Cruise fraction on corner approach/exit points */
static const float CORNER_APEX_SPEED_FACTOR = 0.5f; /* Cruise fraction at the corner itself */
static const int MAX_PATH_NODES = 500;             /* Maximum number of nodes in a planned path */
static const double EARTH_RADIUS_METERS = 6371000.0; /* Earth radius for lat/lon to meters conversion */
static const float MIN_STEERING_TANGENT = 0.01f;   /* Minimum tangent value to prevent division by zero */

/* Wheel physics constants */
static const float WHEEL_RADIUS = 0.5f;                 /* Wheel radius in meters */
static const float MAX_STEERING_ANGLE = 45.0f;          /* Maximum steering angle in degrees */
static const float WHEELBASE = 6.0f;                    /* Distance between front and rear axles in meters */
static const float REAR_STEER_RATIO = 0.4f;             /* Rear axle steering ratio (counter-steering magnitude) */
static const float MIN_CANNON_PITCH = 0.0f;             /* Minimum cannon pitch angle */
static const float MAX_CANNON_PITCH = 90.0f;            /* Maximum cannon pitch angle */
static const float DEFAULT_CANNON_PITCH = 45.0f;        /* Default cannon pitch angle for water arc */

/* Ceremony state enumeration */
enum CeremonyState {
    STATE_IDLE,
    STATE_TRUCKS_APPROACHING,
    STATE_TRUCKS_POSITIONING,
    STATE_WATER_SPRAYING,
    STATE_TRUCKS_LEAVING
};

/* Log output function; receives one complete, newline-terminated message */
typedef void (*LogSinkFunc)(const char* message);

/* Logging */
void SetLogSink(LogSinkFunc sink);
void DebugLog(const char* format, ...);
void DebugLogVerbose(const char* format, ...);
const char* GetStateName(CeremonyState state);

/* Angle and distance helpers */
float NormalizeAngle360(float angle);
float NormalizeAngle180(float angle);
float Clamp(float value, float minValue, float maxValue);
float Distance2D(double x1, double z1, double x2, double z2);
float Distance3D(double x1, double y1, double z1, double x2, double y2, double z2);
float BearingDegrees(double dx, double dz);

/* Kinematics helpers */
float UpdateSpeedSmooth(float currentSpeed, float targetSpeed, float dt,
                        float acceleration = TRUCK_ACCELERATION,
                        float deceleration = TRUCK_DECELERATION);
float ClampSteeringAngle(float angle);
float CalculateRearSteeringAngle(float frontSteerAngle);
float CalculateTurningRate(float speed, float frontSteerAngleDeg, float rearSteerAngleDeg);

/* Aircraft geometry */
float InterpretWingspan(float rawValue);

#endif /* WATERARCH_COMMON_H */
