#include "humanoid_model.h"
#include <algorithm>
#include <cmath>

namespace {
const char *const CHANNEL_NAMES[NUM_CHANNELS] = {
    "HEAD",
    "SHOULDER_RIGHT",
    "SHOULDER_LEFT",
    "ELBOW_RIGHT",
    "ELBOW_LEFT",
    "HIP_RIGHT",
    "HIP_LEFT",
    "KNEE_RIGHT",
    "KNEE_LEFT",
    "ANKLE_RIGHT",
    "ANKLE_LEFT",
    "WRIST_RIGHT",
    "WRIST_LEFT"};

// Safe operating ranges of the stock frame (degrees)
const double DEFAULT_LIMITS[NUM_CHANNELS][2] = {
    {45.0, 135.0}, // HEAD
    {30.0, 150.0}, // SHOULDER_RIGHT
    {30.0, 150.0}, // SHOULDER_LEFT
    {60.0, 180.0}, // ELBOW_RIGHT
    {0.0, 120.0},  // ELBOW_LEFT
    {60.0, 120.0}, // HIP_RIGHT
    {60.0, 120.0}, // HIP_LEFT
    {60.0, 120.0}, // KNEE_RIGHT
    {60.0, 120.0}, // KNEE_LEFT
    {60.0, 120.0}, // ANKLE_RIGHT
    {60.0, 120.0}, // ANKLE_LEFT
    {30.0, 150.0}, // WRIST_RIGHT
    {30.0, 150.0}  // WRIST_LEFT
};

const double DEFAULT_NEUTRAL_ANGLE = 90.0;
} // namespace

std::string getErrorMessage(ErrorCode error) {
    switch (error) {
    case NO_ERROR:
        return "No errors";
    case UNKNOWN_CHANNEL_ERROR:
        return "Unknown servo channel";
    case INVALID_CALIBRATION_ERROR:
        return "Invalid calibration (requires min < neutral < max)";
    case CHANNEL_BUSY_ERROR:
        return "Channel busy with another movement";
    case NOT_INITIALIZED_ERROR:
        return "Robot not initialized";
    case INITIALIZATION_FAILED_ERROR:
        return "Robot initialization failed";
    case SENSOR_UNAVAILABLE_ERROR:
        return "Sensor unavailable";
    case HARDWARE_WRITE_FAILED_ERROR:
        return "Hardware write failed";
    case QUEUE_STEP_FAILED_ERROR:
        return "Queued movement step failed";
    case PARAMETER_ERROR:
        return "Parameter error";
    case MOVEMENT_CANCELLED_ERROR:
        return "Movement cancelled";
    case FILE_IO_ERROR:
        return "File read/write error";
    default:
        return "Unknown error";
    }
}

bool isHardwareFault(ErrorCode error) {
    switch (error) {
    case INITIALIZATION_FAILED_ERROR:
    case SENSOR_UNAVAILABLE_ERROR:
    case HARDWARE_WRITE_FAILED_ERROR:
    case FILE_IO_ERROR:
        return true;
    default:
        return false;
    }
}

std::string getChannelName(int channel) {
    if (!isValidChannel(channel))
        return "UNKNOWN";
    return CHANNEL_NAMES[channel];
}

std::string getLifecycleStateName(RobotLifecycleState state) {
    switch (state) {
    case LIFECYCLE_UNINITIALIZED:
        return "UNINITIALIZED";
    case LIFECYCLE_INITIALIZING:
        return "INITIALIZING";
    case LIFECYCLE_READY:
        return "READY";
    case LIFECYCLE_MOVING:
        return "MOVING";
    case LIFECYCLE_SHUTTING_DOWN:
        return "SHUTTING_DOWN";
    case LIFECYCLE_SHUTDOWN:
        return "SHUTDOWN";
    default:
        return "UNKNOWN";
    }
}

bool Calibration::isValid() const {
    if (!std::isfinite(min_angle) || !std::isfinite(max_angle) || !std::isfinite(neutral_angle))
        return false;
    return min_angle < neutral_angle && neutral_angle < max_angle;
}

double Calibration::clamp(double angle) const {
    return std::max(min_angle, std::min(max_angle, angle));
}

Calibration getDefaultCalibration(int channel) {
    if (!isValidChannel(channel))
        return Calibration();
    return Calibration(DEFAULT_LIMITS[channel][0], DEFAULT_LIMITS[channel][1], DEFAULT_NEUTRAL_ANGLE);
}
