/*
 * Common.cpp - Common utility functions for WaterArch
 */

#include "Common.h"

/* Default sink writes to stderr; the plugin replaces it with XPLMDebugString */
static void StderrLogSink(const char* message) {
    fputs(message, stderr);
}

static LogSinkFunc g_logSink = StderrLogSink;

void SetLogSink(LogSinkFunc sink) {
    g_logSink = sink ? sink : StderrLogSink;
}

/* Format a prefixed message, make sure it ends with a newline and hand it to the sink */
static void WriteLogMessage(const char* prefix, const char* format, va_list args) {
    char buffer[DEBUG_LOG_MSG_SIZE];

    int prefixLen = snprintf(buffer, DEBUG_LOG_MSG_SIZE, "%s", prefix);
    if (prefixLen > 0 && static_cast<size_t>(prefixLen) < DEBUG_LOG_MSG_SIZE - 1) {
        vsnprintf(buffer + prefixLen, DEBUG_LOG_MSG_SIZE - prefixLen - 1, format, args);
    }

    /* Ensure newline at end */
    size_t len = strlen(buffer);
    if (len > 0 && len < DEBUG_LOG_MSG_SIZE - 1 && buffer[len - 1] != '\n') {
        buffer[len] = '\n';
        buffer[len + 1] = '\0';
    }

    g_logSink(buffer);
}

/* Debug log function */
void DebugLog(const char* format, ...) {
    va_list args;
    va_start(args, format);
    WriteLogMessage("WaterArch: ", format, args);
    va_end(args);
}

/* Verbose debug log - only outputs when DEBUG_VERBOSE is true */
void DebugLogVerbose(const char* format, ...) {
    if (!DEBUG_VERBOSE) return;

    va_list args;
    va_start(args, format);
    WriteLogMessage("WaterArch [VERBOSE]: ", format, args);
    va_end(args);
}

/* Get state name for debugging */
const char* GetStateName(CeremonyState state) {
    switch (state) {
        case STATE_IDLE: return "STATE_IDLE";
        case STATE_TRUCKS_APPROACHING: return "STATE_TRUCKS_APPROACHING";
        case STATE_TRUCKS_POSITIONING: return "STATE_TRUCKS_POSITIONING";
        case STATE_WATER_SPRAYING: return "STATE_WATER_SPRAYING";
        case STATE_TRUCKS_LEAVING: return "STATE_TRUCKS_LEAVING";
        default: return "UNKNOWN";
    }
}

/* Normalize angle to [0, 360) */
float NormalizeAngle360(float angle) {
    angle = fmodf(angle, 360.0f);
    if (angle < 0.0f) {
        angle += 360.0f;
    }
    /* -epsilon + 360 rounds up to exactly 360 in float */
    if (angle >= 360.0f) {
        angle = 0.0f;
    }
    return angle;
}

/* Normalize angle to (-180, 180] */
float NormalizeAngle180(float angle) {
    angle = NormalizeAngle360(angle);
    if (angle > 180.0f) {
        angle -= 360.0f;
    }
    return angle;
}

float Clamp(float value, float minValue, float maxValue) {
    if (value < minValue) return minValue;
    if (value > maxValue) return maxValue;
    return value;
}

float Distance2D(double x1, double z1, double x2, double z2) {
    double dx = x2 - x1;
    double dz = z2 - z1;
    return static_cast<float>(sqrt(dx * dx + dz * dz));
}

float Distance3D(double x1, double y1, double z1, double x2, double y2, double z2) {
    double dx = x2 - x1;
    double dy = y2 - y1;
    double dz = z2 - z1;
    return static_cast<float>(sqrt(dx * dx + dy * dy + dz * dz));
}

/*
 * BearingDegrees - Heading of the direction (dx, dz) in local coordinates
 * Heading 0 points along -Z (north), 90 along +X (east).
 */
float BearingDegrees(double dx, double dz) {
    return static_cast<float>(atan2(dx, -dz)) * RAD_TO_DEG;
}

/* Smooth speed transition using acceleration/deceleration */
float UpdateSpeedSmooth(float currentSpeed, float targetSpeed, float dt,
                        float acceleration, float deceleration) {
    if (currentSpeed < targetSpeed) {
        /* Accelerating */
        currentSpeed += acceleration * dt;
        if (currentSpeed > targetSpeed) {
            currentSpeed = targetSpeed;
        }
    } else if (currentSpeed > targetSpeed) {
        /* Decelerating */
        currentSpeed -= deceleration * dt;
        if (currentSpeed < targetSpeed) {
            currentSpeed = targetSpeed;
        }
    }
    return currentSpeed;
}

/* Clamp steering angle to valid range */
float ClampSteeringAngle(float angle) {
    return Clamp(angle, -MAX_STEERING_ANGLE, MAX_STEERING_ANGLE);
}

/* Rear axle counter-steers with reduced magnitude for a tighter turning radius */
float CalculateRearSteeringAngle(float frontSteerAngle) {
    return ClampSteeringAngle(-frontSteerAngle * REAR_STEER_RATIO);
}

/*
 * CalculateTurningRate - Vehicle turning rate using Ackermann steering geometry
 *
 * For the 8x8 truck the front and rear axles both steer. With counter-steering
 * the rear tangent has the opposite sign, so (tan(front) - tan(rear)) adds the
 * two contributions. The average of both is used as the effective steer.
 *
 * @param speed Vehicle speed in m/s
 * @param frontSteerAngleDeg Front wheel steering angle in degrees
 * @param rearSteerAngleDeg Rear wheel steering angle in degrees
 * @return Turning rate in degrees per second
 */
float CalculateTurningRate(float speed, float frontSteerAngleDeg, float rearSteerAngleDeg) {
    /* Dead zone for very low speeds or near-zero steering */
    if (fabsf(speed) < 0.01f || fabsf(frontSteerAngleDeg) < 0.1f) {
        return 0.0f;
    }

    float frontAngleRad = frontSteerAngleDeg * DEG_TO_RAD;
    float rearAngleRad = rearSteerAngleDeg * DEG_TO_RAD;

    float effectiveSteer = (tanf(frontAngleRad) - tanf(rearAngleRad)) / 2.0f;

    /* Angular velocity = v * tan(steer) / wheelbase */
    float angularVelocity = speed * effectiveSteer / WHEELBASE;

    return angularVelocity * RAD_TO_DEG;
}

/*
 * InterpretWingspan - Convert a raw wingspan dataref value to a full wingspan in meters
 *
 * The dataref found may report a semispan in meters (acf_semi_len_m), a full
 * span in feet (acf_span) or a full span in meters. The value is tested
 * against each interpretation in that order; anything implausible falls back
 * to DEFAULT_WINGSPAN_METERS.
 */
float InterpretWingspan(float rawValue) {
    if (rawValue >= MIN_SEMISPAN_METERS && rawValue <= MAX_SEMISPAN_METERS) {
        return rawValue * 2.0f;
    }

    float wingspanMeters = rawValue * FEET_TO_METERS;
    if (wingspanMeters >= MIN_WINGSPAN_METERS && wingspanMeters <= MAX_WINGSPAN_METERS) {
        return wingspanMeters;
    }

    if (rawValue >= MIN_WINGSPAN_METERS && rawValue <= MAX_WINGSPAN_METERS) {
        return rawValue;
    }

    DebugLog("Invalid wingspan value (%.2f), using default %.0fm", rawValue, DEFAULT_WINGSPAN_METERS);
    return DEFAULT_WINGSPAN_METERS;
}
