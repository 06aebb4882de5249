#include "linear_trajectory.h"
#include "humamotion_constants.h"
#include "math_utils.h"
#include <algorithm>
#include <cmath>

LinearTrajectory::LinearTrajectory(const std::vector<int> &channels, const Eigen::VectorXd &start_angles,
                                   const Eigen::VectorXd &target_angles, double duration, double tick_interval)
    : channels_(channels), start_angles_(start_angles), target_angles_(target_angles),
      tick_interval_(tick_interval), tick_count_(math_utils::computeTickCount(duration, tick_interval)) {}

Eigen::VectorXd LinearTrajectory::sample(int i) const {
    i = std::max(0, std::min(tick_count_, i));
    return math_utils::interpolateLinear(start_angles_, target_angles_, i, tick_count_);
}

double LinearTrajectory::clampSpeed(double speed) {
    return std::max(SERVO_SPEED_MIN, std::min(SERVO_SPEED_MAX, speed));
}

double LinearTrajectory::durationForDistance(double distance, double nominal_velocity, double speed,
                                             double tick_interval) {
    if (!(speed > 0.0) || !(nominal_velocity > 0.0))
        return tick_interval;
    double velocity = nominal_velocity * clampSpeed(speed);
    return std::fabs(distance) / velocity;
}
