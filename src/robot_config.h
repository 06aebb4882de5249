#ifndef ROBOT_CONFIG_H
#define ROBOT_CONFIG_H

#include "humamotion_constants.h"
#include "humanoid_model.h"
#include <string>

/**
 * @brief Robot configuration parameters.
 */
struct RobotParameters {
    // Motion timing
    double tick_interval = DEFAULT_TICK_INTERVAL;                   //< Interpolation tick (seconds)
    double nominal_servo_velocity = DEFAULT_NOMINAL_SERVO_VELOCITY; //< deg/s at speed multiplier 1.0
    double default_servo_speed = SERVO_SPEED_DEFAULT;               //< Speed multiplier used when none is given
    double step_settle_time = DEFAULT_STEP_SETTLE_TIME;             //< Extra wait after each queued step (seconds)
    double gesture_step_duration = DEFAULT_GESTURE_STEP_DURATION;   //< Duration of one gesture step (seconds)

    // Sensors
    double sensor_ttl = DEFAULT_SENSOR_TTL; //< Cache lifetime of a sensor reading (seconds)

    /**
     * @brief Servo pulse mapping. 0 deg -> min_pulse_us, 180 deg -> max_pulse_us.
     */
    struct PwmConfig {
        double min_pulse_us = DEFAULT_MIN_PULSE_US;
        double max_pulse_us = DEFAULT_MAX_PULSE_US;
        double frequency_hz = DEFAULT_PWM_FREQUENCY;
    } pwm;

    /**
     * @brief I2C bus and device addresses.
     */
    struct I2CConfig {
        int bus = DEFAULT_I2C_BUS;
        int pca9685_address = PCA9685_DEFAULT_ADDRESS;
        int proximity_address = OT703_DEFAULT_ADDRESS;
        int motion_address = MPU6050_DEFAULT_ADDRESS;
    } i2c;

    std::string calibration_file = "servo_calibration.json"; //< Persisted calibration path
    bool use_simulation = false;                              //< Build the in-memory adapter instead of the PCA9685 one
};

/** Defaults matching the stock frame on a Raspberry Pi. */
RobotParameters createDefaultParameters();

/**
 * @brief Check ranges of all tunables.
 * @return NO_ERROR or PARAMETER_ERROR
 */
ErrorCode validateParameters(const RobotParameters &params);

/**
 * @brief Override fields of @p params from a JSON file.
 *
 * Keys mirror the struct: "tick_interval", "pwm": {"min_pulse_us", ...},
 * "i2c": {"bus", ...}, "calibration_file", "use_simulation". Unknown keys are
 * ignored. @p params is left unchanged unless the file parses and validates.
 *
 * @return NO_ERROR, FILE_IO_ERROR if unreadable, PARAMETER_ERROR if
 *         malformed or out of range
 */
ErrorCode loadParametersFromFile(const std::string &path, RobotParameters &params);

#endif // ROBOT_CONFIG_H
