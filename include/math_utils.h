#ifndef MATH_UTILS_H
#define MATH_UTILS_H

#include <Eigen/Dense>
#include <cstdint>

namespace math_utils {
/** Convert degrees to radians. */
double degreesToRadians(double degrees);
/** Convert radians to degrees. */
double radiansToDegrees(double radians);
/** Clamp an angle into [min_angle, max_angle]. */
double clampAngle(double angle, double min_angle, double max_angle);

/**
 * @brief Linear interpolation sample for tick @p i of @p n.
 *
 * Returns exactly @p target for i >= n so no rounding drift survives the
 * last tick.
 */
Eigen::VectorXd interpolateLinear(const Eigen::VectorXd &start, const Eigen::VectorXd &target, int i, int n);

/**
 * Number of ticks for a move of given duration: max(1, floor(duration / tick)).
 * Saturates at INT_MAX instead of overflowing.
 */
int computeTickCount(double duration, double tick_interval);

/**
 * Map an angle (0-180 deg) onto the servo pulse width range.
 * @return Pulse width in microseconds
 */
double angleToPulseMicros(double angle, double min_pulse_us, double max_pulse_us);

/**
 * Convert a pulse width to a PCA9685 OFF count for the given PWM frequency.
 * @return Duty in [0, 4095]
 */
int pulseMicrosToDuty(double pulse_us, double pwm_frequency);

/** Inverse of pulseMicrosToDuty. */
double dutyToPulseMicros(int duty, double pwm_frequency);

/** Inverse of angleToPulseMicros. */
double pulseMicrosToAngle(double pulse_us, double min_pulse_us, double max_pulse_us);

/** Decode a signed big-endian 16 bit register pair. */
int16_t decodeInt16BE(uint8_t high, uint8_t low);

/** Decode an unsigned big-endian 16 bit register pair. */
uint16_t decodeUInt16BE(uint8_t high, uint8_t low);

/**
 * Roll and pitch (degrees) of the body from a gravity vector in g.
 * @return (roll, pitch); zero vector for a degenerate input
 */
Eigen::Vector2d tiltFromAcceleration(const Eigen::Vector3d &acceleration);
} // namespace math_utils

#endif // MATH_UTILS_H
