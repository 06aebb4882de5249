#ifndef MOTION_CONTROLLER_H
#define MOTION_CONTROLLER_H

#include "calibration_store.h"
#include "humanoid_model.h"
#include "robot_config.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct GestureSequence;

/**
 * @brief Joint state owner and tick scheduler for all servo motion.
 *
 * Every move blocks its caller until it settles. Moves on disjoint channels
 * may run concurrently from different threads; a move touching a channel
 * that is already mid-interpolation fails with CHANNEL_BUSY_ERROR.
 *
 * The hardware mutex is shared with the sensor cache and held per tick
 * only, never across the inter-tick sleep. Lock order: queue mutex before
 * hardware mutex.
 */
class MotionController {
  public:
    /**
     * @brief Cause of the last aborted queue drain.
     */
    struct QueueFailure {
        MovementHandle handle = 0; //< Step that failed (0 if none yet)
        ErrorCode cause = NO_ERROR;
    };

    MotionController(IHardwareAdapter &adapter, IClock &clock, CalibrationStore &calibration,
                     std::mutex &hardware_mutex, const RobotParameters &params);
    ~MotionController();

    // Command gating, driven by the robot lifecycle
    void enable();
    void disable();
    bool isEnabled() const { return enabled_.load(); }

    /**
     * @brief Move one servo at a constant rate.
     *
     * The target is clamped into the channel calibration. The move lasts
     * |delta| / (nominal_servo_velocity * speed) with speed clamped to
     * [SERVO_SPEED_MIN, SERVO_SPEED_MAX]; speed <= 0 moves in a single tick.
     */
    ErrorCode setServo(int channel, double angle, double speed);
    ErrorCode setServo(int channel, double angle);

    /**
     * @brief Move several servos in lockstep on one tick schedule.
     *
     * Every tick is clamped into the calibration in force at that tick.
     * @param duration Seconds; negative derives it from the largest distance
     *                 at the default speed
     */
    ErrorCode setServos(const ChannelAngleMap &targets, double duration = -1.0);

    /** Write every channel's neutral pose directly, without interpolation. */
    ErrorCode moveAllToNeutral();

    /**
     * @brief Append a step to the movement queue.
     *
     * Targets are validated and clamped now and clamped again when the step
     * runs, so a calibration change in between is honored. An empty target
     * map queues a pause of @p duration seconds.
     */
    ErrorCode queueMovement(const ChannelAngleMap &targets, double duration, MovementHandle *handle = nullptr);

    /**
     * @brief Run queued steps in FIFO order until the queue is empty.
     *
     * Steps queued while draining run in the same drain. A failing step
     * discards the rest of the queue and the call returns
     * QUEUE_STEP_FAILED_ERROR; getLastQueueFailure() tells which step and why.
     */
    ErrorCode executeQueue();

    void clearQueue();
    size_t getQueueLength() const;
    QueueFailure getLastQueueFailure() const;

    // Gestures
    ErrorCode standUp();
    ErrorCode walkForward(int steps);
    ErrorCode dance();
    ErrorCode runServoTest();

    // State queries
    ErrorCode getPosition(int channel, double &angle) const;
    ErrorCode getAllPositions(ChannelAngleMap &angles) const;
    ErrorCode getJointState(int channel, JointState &state) const;

    /** Stop every in-flight move at its next tick. Joints keep their last angle. */
    void cancelMovements();

    /** Block until no move or queue drain is in flight. */
    void waitForIdle();

    bool isMoving() const;

    /** PCA9685 duty for an angle under the configured pulse range. */
    int angleToDuty(double angle) const;

    const RobotParameters &getParameters() const { return params_; }

  private:
    class ChannelReservation;

    ErrorCode clampTargets(const ChannelAngleMap &targets, ChannelAngleMap &clamped) const;
    ErrorCode performMove(const ChannelAngleMap &targets, double duration, double speed, uint64_t generation);
    ErrorCode drainQueue(uint64_t generation);
    ErrorCode runGesture(const GestureSequence &gesture);
    bool waitUntil(double deadline, uint64_t generation);
    bool exceedsTickLimit(double duration) const;
    bool isCancelled(uint64_t generation) const;
    void recordQueueFailure(MovementHandle handle, ErrorCode cause);
    void releaseChannels(const std::vector<int> &channels);
    void beginActivity();
    void endActivity();

    IHardwareAdapter &adapter_;
    IClock &clock_;
    CalibrationStore &calibration_;
    RobotParameters params_;

    // Guarded by hardware_mutex_
    std::mutex &hardware_mutex_;
    JointState joints_[NUM_CHANNELS];

    std::atomic<bool> enabled_;
    std::atomic<uint64_t> cancel_generation_;

    mutable std::mutex activity_mutex_;
    std::condition_variable idle_cv_;
    int active_moves_;

    mutable std::mutex queue_mutex_;
    std::deque<MovementStep> queue_;
    MovementHandle next_handle_;
    bool draining_;
    QueueFailure last_queue_failure_;
};

#endif // MOTION_CONTROLLER_H
