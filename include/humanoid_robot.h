#ifndef HUMANOID_ROBOT_H
#define HUMANOID_ROBOT_H

#include "calibration_store.h"
#include "humanoid_model.h"
#include "motion_controller.h"
#include "robot_config.h"
#include "sensor_cache.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Snapshot of one servo for status reporting.
 */
struct ServoState {
    int channel = 0;
    std::string name;
    double position = 0.0;
    double target = 0.0;
    bool moving = false;
    double min_angle = 0.0;
    double max_angle = 0.0;
    double neutral_angle = 0.0;
};

/**
 * @brief Robot summary for status reporting.
 */
struct RobotInfo {
    RobotLifecycleState state = LIFECYCLE_UNINITIALIZED;
    std::string adapter_name;
    bool simulated = false;
    bool using_default_calibration = true;
    size_t queue_length = 0;
};

/**
 * @brief Build the hardware adapter variant selected by the parameters.
 *
 * Called once per process; the robot never switches variants afterwards.
 */
std::unique_ptr<IHardwareAdapter> createHardwareAdapter(const RobotParameters &params);

/**
 * @brief Public surface of the humanoid: lifecycle plus every motion,
 *        sensor and calibration operation.
 *
 * Lifecycle: UNINITIALIZED -> INITIALIZING -> READY <-> MOVING ->
 * SHUTTING_DOWN -> SHUTDOWN. SHUTDOWN may be initialized again.
 * Motion and sensor operations return NOT_INITIALIZED_ERROR outside
 * READY / MOVING.
 *
 * The adapter and clock are owned by the caller and must outlive the robot.
 */
class HumanoidRobot {
  public:
    HumanoidRobot(IHardwareAdapter &adapter, IClock &clock, const RobotParameters &params);
    ~HumanoidRobot();

    HumanoidRobot(const HumanoidRobot &) = delete;
    HumanoidRobot &operator=(const HumanoidRobot &) = delete;

    /**
     * @brief Open the hardware, load calibration and move to the neutral pose.
     * @return NO_ERROR (also when already READY) or INITIALIZATION_FAILED_ERROR,
     *         in which case the robot ends in SHUTDOWN
     */
    ErrorCode initialize();

    /**
     * @brief Cancel in-flight moves, wait for them to stop and release the
     *        hardware. Idempotent.
     */
    ErrorCode shutdown();

    /** Current state; READY is reported as MOVING while a move is in flight. */
    RobotLifecycleState getLifecycleState() const;

    // Motion
    ErrorCode setServo(int channel, double angle, double speed);
    ErrorCode setServo(int channel, double angle);
    ErrorCode setServos(const ChannelAngleMap &targets, double duration = -1.0);
    ErrorCode queueMovement(const ChannelAngleMap &targets, double duration, MovementHandle *handle = nullptr);
    ErrorCode executeQueue();
    ErrorCode clearQueue();
    MotionController::QueueFailure getLastQueueFailure() const;
    ErrorCode standUp();
    ErrorCode walkForward(int steps);
    ErrorCode dance();
    ErrorCode runServoTest();
    void cancelMovements();

    // State
    ErrorCode getPosition(int channel, double &angle) const;
    ErrorCode getAllPositions(ChannelAngleMap &angles) const;
    ErrorCode getServoState(int channel, ServoState &state) const;
    RobotInfo getRobotInfo() const;

    // Sensors
    ErrorCode readSensor(SensorId sensor, SensorReading &reading);
    ErrorCode getLastSensorReading(SensorId sensor, SensorReading &reading, double *age = nullptr) const;

    // Calibration
    ErrorCode getCalibration(int channel, Calibration &calibration) const;

    /**
     * Replace a channel calibration in memory. A joint left outside the new
     * limits is moved back inside them when the robot is running. A move
     * already in flight on the channel is clamped from its next tick on.
     */
    ErrorCode setCalibration(int channel, const Calibration &calibration);

    /** Move a servo to @p angle, adopt it as the neutral pose and save. */
    ErrorCode calibrateNeutral(int channel, double angle);

    ErrorCode saveCalibration();

  private:
    bool isOperational() const;
    void failInitialization(const std::string &reason);

    IHardwareAdapter &adapter_;

    std::mutex hardware_mutex_;
    CalibrationStore calibration_;
    SensorCache sensors_;
    MotionController motion_;

    std::mutex transition_mutex_;
    std::atomic<RobotLifecycleState> state_;
};

#endif // HUMANOID_ROBOT_H
