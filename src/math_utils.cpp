#include "math_utils.h"
#include "humamotion_constants.h"
#include <algorithm>
#include <cmath>
#include <limits>

// Utility function implementations
namespace math_utils {
double degreesToRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double radiansToDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

double clampAngle(double angle, double min_angle, double max_angle) {
    return std::max(min_angle, std::min(max_angle, angle));
}

Eigen::VectorXd interpolateLinear(const Eigen::VectorXd &start, const Eigen::VectorXd &target, int i, int n) {
    if (n <= 0 || i >= n)
        return target;
    if (i <= 0)
        return start;
    double fraction = static_cast<double>(i) / static_cast<double>(n);
    return start + (target - start) * fraction;
}

int computeTickCount(double duration, double tick_interval) {
    if (!(duration > 0.0) || !(tick_interval > 0.0))
        return 1;
    // Small epsilon so 0.5 / 0.02 gives 25 and not 24.999...
    double ticks = std::floor(duration / tick_interval + 1e-9);
    if (ticks >= static_cast<double>(std::numeric_limits<int>::max()))
        return std::numeric_limits<int>::max();
    return std::max(1, static_cast<int>(ticks));
}

double angleToPulseMicros(double angle, double min_pulse_us, double max_pulse_us) {
    double normalized = clampAngle(angle, 0.0, SERVO_ANGLE_RANGE) / SERVO_ANGLE_RANGE;
    return min_pulse_us + normalized * (max_pulse_us - min_pulse_us);
}

int pulseMicrosToDuty(double pulse_us, double pwm_frequency) {
    double period_us = 1000000.0 / pwm_frequency;
    long duty = std::lround(pulse_us / period_us * PWM_RESOLUTION);
    return static_cast<int>(std::max(0L, std::min(static_cast<long>(PWM_DUTY_MAX), duty)));
}

double dutyToPulseMicros(int duty, double pwm_frequency) {
    double period_us = 1000000.0 / pwm_frequency;
    return static_cast<double>(duty) * period_us / PWM_RESOLUTION;
}

double pulseMicrosToAngle(double pulse_us, double min_pulse_us, double max_pulse_us) {
    double range = max_pulse_us - min_pulse_us;
    if (range <= 0.0)
        return 0.0;
    return (pulse_us - min_pulse_us) / range * SERVO_ANGLE_RANGE;
}

int16_t decodeInt16BE(uint8_t high, uint8_t low) {
    return static_cast<int16_t>(static_cast<uint16_t>((high << 8) | low));
}

uint16_t decodeUInt16BE(uint8_t high, uint8_t low) {
    return static_cast<uint16_t>((high << 8) | low);
}

Eigen::Vector2d tiltFromAcceleration(const Eigen::Vector3d &acceleration) {
    if (acceleration.norm() < 1e-9)
        return Eigen::Vector2d::Zero();
    double roll = std::atan2(acceleration.y(), acceleration.z());
    double pitch = std::atan2(-acceleration.x(),
                              std::sqrt(acceleration.y() * acceleration.y() + acceleration.z() * acceleration.z()));
    return Eigen::Vector2d(radiansToDegrees(roll), radiansToDegrees(pitch));
}
} // namespace math_utils
