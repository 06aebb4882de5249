#ifndef HUMANOID_MODEL_H
#define HUMANOID_MODEL_H

#include "humamotion_constants.h"
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

//
// Designation of the servo channels on the PCA9685, one per joint.
//
enum JointChannel {
    CHANNEL_HEAD = 0,            //< Head pan
    CHANNEL_SHOULDER_RIGHT = 1,  //< Right shoulder
    CHANNEL_SHOULDER_LEFT = 2,   //< Left shoulder
    CHANNEL_ELBOW_RIGHT = 3,     //< Right elbow
    CHANNEL_ELBOW_LEFT = 4,      //< Left elbow
    CHANNEL_HIP_RIGHT = 5,       //< Right hip
    CHANNEL_HIP_LEFT = 6,        //< Left hip
    CHANNEL_KNEE_RIGHT = 7,      //< Right knee
    CHANNEL_KNEE_LEFT = 8,       //< Left knee
    CHANNEL_ANKLE_RIGHT = 9,     //< Right ankle
    CHANNEL_ANKLE_LEFT = 10,     //< Left ankle
    CHANNEL_WRIST_RIGHT = 11,    //< Right wrist
    CHANNEL_WRIST_LEFT = 12,     //< Left wrist
    CHANNEL_COUNT = NUM_CHANNELS //< Misc enum defining number of channels
};

//
// Lifecycle of a robot instance.
//
enum RobotLifecycleState {
    LIFECYCLE_UNINITIALIZED, //< Constructed, hardware not opened
    LIFECYCLE_INITIALIZING,  //< Opening hardware and moving to neutral
    LIFECYCLE_READY,         //< Accepting commands, no move in flight
    LIFECYCLE_MOVING,        //< Accepting commands, at least one move in flight
    LIFECYCLE_SHUTTING_DOWN, //< Cancelling moves and releasing hardware
    LIFECYCLE_SHUTDOWN       //< Hardware released; may be initialized again
};

//
// Sensors reachable through the hardware adapter.
//
enum SensorId {
    SENSOR_PROXIMITY = 0, //< OT703-C86 distance and ambient light ("eyes")
    SENSOR_MOTION = 1,    //< MPU-6050 accelerometer and gyroscope
    SENSOR_COUNT
};

// Error control
enum ErrorCode {
    NO_ERROR = 0,
    UNKNOWN_CHANNEL_ERROR = 1,       // Channel outside 0-12
    INVALID_CALIBRATION_ERROR = 2,   // min < neutral < max violated
    CHANNEL_BUSY_ERROR = 3,          // Channel already mid-interpolation
    NOT_INITIALIZED_ERROR = 4,       // Robot not Ready/Moving
    INITIALIZATION_FAILED_ERROR = 5, // Hardware could not be brought up
    SENSOR_UNAVAILABLE_ERROR = 6,    // Sensor read failed or returned garbage
    HARDWARE_WRITE_FAILED_ERROR = 7, // PWM write rejected by the adapter
    QUEUE_STEP_FAILED_ERROR = 8,     // A queued step failed, rest discarded
    PARAMETER_ERROR = 9,             // Malformed argument (NaN angle, bad duration)
    MOVEMENT_CANCELLED_ERROR = 10,   // Move stopped by cancel/shutdown
    FILE_IO_ERROR = 11               // Calibration or config file could not be read/written
};

/** Human readable description of an error code. */
std::string getErrorMessage(ErrorCode error);

/**
 * True for failures caused by the hardware or the file system, false for
 * failures caused by the request itself. Callers may retry the former.
 */
bool isHardwareFault(ErrorCode error);

/** Anatomical name of a channel ("HEAD", "KNEE_LEFT", ...). */
std::string getChannelName(int channel);

/** True if channel is one of the 13 joint channels. */
inline bool isValidChannel(int channel) { return channel >= 0 && channel < NUM_CHANNELS; }

/** Lifecycle state name for logging. */
std::string getLifecycleStateName(RobotLifecycleState state);

/**
 * @brief Per-channel angular limits and neutral pose in degrees.
 */
struct Calibration {
    double min_angle;
    double max_angle;
    double neutral_angle;

    Calibration() : min_angle(0.0), max_angle(SERVO_ANGLE_RANGE), neutral_angle(SERVO_ANGLE_RANGE / 2.0) {}
    Calibration(double min_a, double max_a, double neutral_a)
        : min_angle(min_a), max_angle(max_a), neutral_angle(neutral_a) {}

    /** min < neutral < max, all finite. */
    bool isValid() const;

    /** Clamp an angle into [min, max]. */
    double clamp(double angle) const;

    bool operator==(const Calibration &other) const {
        return min_angle == other.min_angle && max_angle == other.max_angle &&
               neutral_angle == other.neutral_angle;
    }
    bool operator!=(const Calibration &other) const { return !(*this == other); }
};

/** Built-in calibration for a channel, used when no file is available. */
Calibration getDefaultCalibration(int channel);

/**
 * @brief Live state of one joint.
 */
struct JointState {
    double current_angle = SERVO_ANGLE_RANGE / 2.0; //< Last angle written to the servo
    double target_angle = SERVO_ANGLE_RANGE / 2.0;  //< Goal of the in-flight move (== current when settled)
    bool moving = false;                            //< True while a trajectory owns the channel
};

/** Ordered mapping channel -> angle in degrees. */
typedef std::map<int, double> ChannelAngleMap;

/** Handle identifying a queued movement step. */
typedef uint32_t MovementHandle;

/**
 * @brief One queued unit of motion.
 */
struct MovementStep {
    MovementHandle handle = 0;
    ChannelAngleMap targets; //< Empty targets make the step a pause
    double duration = 0.0;   //< Seconds
};

/**
 * @brief OT703-C86 distance / light measurement.
 */
struct ProximityData {
    double distance_cm = 0.0;
    int ambient_light = 0; //< 0-255
};

/**
 * @brief MPU-6050 motion measurement.
 */
struct MotionData {
    Eigen::Vector3d acceleration_g = Eigen::Vector3d::Zero();        //< Acceleration in g
    Eigen::Vector3d angular_velocity_dps = Eigen::Vector3d::Zero();  //< Angular velocity in deg/s
    double temperature_c = 0.0;
    double roll_deg = 0.0;  //< Tilt about X derived from gravity
    double pitch_deg = 0.0; //< Tilt about Y derived from gravity
};

/**
 * @brief Decoded sensor reading. Only the block matching @c sensor is meaningful.
 */
struct SensorReading {
    SensorId sensor = SENSOR_PROXIMITY;
    double captured_at = 0.0; //< Clock time of the hardware read (seconds)
    ProximityData proximity;
    MotionData motion;
};

/**
 * @brief Boundary to the PWM chip and the I2C sensors.
 *
 * Implementations are selected once when the robot is built (real chip or
 * in-memory simulation) and are called with the hardware mutex held.
 */
class IHardwareAdapter {
  public:
    virtual ~IHardwareAdapter() = default;

    /** Open the bus and configure the devices. */
    virtual bool initialize() = 0;

    /** Close the bus. Safe to call when not initialized. */
    virtual void release() = 0;

    /**
     * Write a PWM duty value to a channel.
     * @param channel Channel index (0-12)
     * @param duty OFF count (0-4095) of a pulse starting at count 0
     * @return true if the write was acknowledged
     */
    virtual bool writePulse(int channel, int duty) = 0;

    /**
     * Read the raw register bytes of a sensor.
     * @param sensor Sensor to read
     * @param raw Filled with the bytes described in sensor_cache.h
     * @return true on success
     */
    virtual bool readSensor(SensorId sensor, std::vector<uint8_t> &raw) = 0;

    /** Short implementation name for diagnostics. */
    virtual std::string getName() const = 0;

    /** True for the in-memory variant. */
    virtual bool isSimulated() const = 0;
};

/**
 * @brief Time source for the tick scheduler.
 */
class IClock {
  public:
    virtual ~IClock() = default;

    /** Monotonic time in seconds. */
    virtual double now() = 0;

    /** Block until now() >= time. Returns immediately if already past. */
    virtual void sleepUntil(double time) = 0;
};

#endif // HUMANOID_MODEL_H
