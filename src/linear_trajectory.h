#ifndef LINEAR_TRAJECTORY_H
#define LINEAR_TRAJECTORY_H

#include <Eigen/Dense>
#include <vector>

/**
 * @brief Lockstep constant-rate interpolation of several channels.
 *
 * A move of duration D with tick T is split into n = max(1, floor(D / T))
 * ticks shared by every channel. Tick i (1..n) happens at offset i*T from
 * the start and commands start + (target - start) * i / n, so all channels
 * reach their targets exactly on tick n.
 */
class LinearTrajectory {
  public:
    LinearTrajectory(const std::vector<int> &channels, const Eigen::VectorXd &start_angles,
                     const Eigen::VectorXd &target_angles, double duration, double tick_interval);

    const std::vector<int> &channels() const { return channels_; }
    bool empty() const { return channels_.empty(); }
    int tickCount() const { return tick_count_; }

    /** Angles of all channels at tick i (clamped to [0, tickCount()]), ordered like channels(). */
    Eigen::VectorXd sample(int i) const;

    /** Offset of tick i from the move start in seconds. */
    double tickOffset(int i) const { return i * tick_interval_; }

    /**
     * @brief Duration of a move covering @p distance degrees.
     *
     * The speed multiplier is clamped to [SERVO_SPEED_MIN, SERVO_SPEED_MAX];
     * a non-positive speed asks for the fastest move, a single tick.
     */
    static double durationForDistance(double distance, double nominal_velocity, double speed,
                                      double tick_interval);

    /** Clamp a speed multiplier into the supported range. */
    static double clampSpeed(double speed);

  private:
    std::vector<int> channels_;
    Eigen::VectorXd start_angles_;
    Eigen::VectorXd target_angles_;
    double tick_interval_;
    int tick_count_;
};

#endif // LINEAR_TRAJECTORY_H
