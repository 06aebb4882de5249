#include "humanoid_robot.h"
#include "log_utils.h"
#include "pca9685_hardware_adapter.h"
#include "simulated_hardware_adapter.h"
#include <cmath>

namespace {
const char *const TAG = "HumanoidRobot";
} // namespace

std::unique_ptr<IHardwareAdapter> createHardwareAdapter(const RobotParameters &params) {
    if (params.use_simulation) {
        log_utils::logInfo(TAG, "Using simulated hardware");
        return std::make_unique<SimulatedHardwareAdapter>();
    }
    return std::make_unique<Pca9685HardwareAdapter>(params.i2c, params.pwm.frequency_hz);
}

HumanoidRobot::HumanoidRobot(IHardwareAdapter &adapter, IClock &clock, const RobotParameters &params)
    : adapter_(adapter), calibration_(params.calibration_file),
      sensors_(adapter, clock, hardware_mutex_, params.sensor_ttl),
      motion_(adapter, clock, calibration_, hardware_mutex_, params), state_(LIFECYCLE_UNINITIALIZED) {}

HumanoidRobot::~HumanoidRobot() {
    shutdown();
}

ErrorCode HumanoidRobot::initialize() {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    if (state_.load() == LIFECYCLE_READY)
        return NO_ERROR;

    state_.store(LIFECYCLE_INITIALIZING);
    log_utils::logInfo(TAG, "Initializing with " + adapter_.getName() + " hardware");

    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(hardware_mutex_);
        opened = adapter_.initialize();
    }
    if (!opened) {
        failInitialization("hardware adapter did not initialize");
        return INITIALIZATION_FAILED_ERROR;
    }

    ErrorCode calibration_result = calibration_.load();
    if (calibration_result != NO_ERROR)
        log_utils::logWarning(TAG, "Calibration: " + getErrorMessage(calibration_result) + ", using defaults");
    sensors_.invalidateAll();

    motion_.enable();
    ErrorCode neutral_result = motion_.moveAllToNeutral();
    if (neutral_result != NO_ERROR) {
        motion_.disable();
        {
            std::lock_guard<std::mutex> lock(hardware_mutex_);
            adapter_.release();
        }
        failInitialization("neutral pose failed: " + getErrorMessage(neutral_result));
        return INITIALIZATION_FAILED_ERROR;
    }

    state_.store(LIFECYCLE_READY);
    log_utils::logInfo(TAG, "Robot ready");
    return NO_ERROR;
}

void HumanoidRobot::failInitialization(const std::string &reason) {
    state_.store(LIFECYCLE_SHUTDOWN);
    log_utils::logError(TAG, "Initialization failed: " + reason);
}

ErrorCode HumanoidRobot::shutdown() {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    RobotLifecycleState state = state_.load();
    if (state == LIFECYCLE_UNINITIALIZED || state == LIFECYCLE_SHUTDOWN)
        return NO_ERROR;

    state_.store(LIFECYCLE_SHUTTING_DOWN);
    log_utils::logInfo(TAG, "Shutting down");
    motion_.disable();
    motion_.waitForIdle();
    motion_.clearQueue();
    {
        std::lock_guard<std::mutex> lock(hardware_mutex_);
        adapter_.release();
    }
    state_.store(LIFECYCLE_SHUTDOWN);
    log_utils::logInfo(TAG, "Shutdown complete");
    return NO_ERROR;
}

RobotLifecycleState HumanoidRobot::getLifecycleState() const {
    RobotLifecycleState state = state_.load();
    if (state == LIFECYCLE_READY && motion_.isMoving())
        return LIFECYCLE_MOVING;
    return state;
}

bool HumanoidRobot::isOperational() const {
    return state_.load() == LIFECYCLE_READY;
}

ErrorCode HumanoidRobot::setServo(int channel, double angle, double speed) {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.setServo(channel, angle, speed);
}

ErrorCode HumanoidRobot::setServo(int channel, double angle) {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.setServo(channel, angle);
}

ErrorCode HumanoidRobot::setServos(const ChannelAngleMap &targets, double duration) {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.setServos(targets, duration);
}

ErrorCode HumanoidRobot::queueMovement(const ChannelAngleMap &targets, double duration, MovementHandle *handle) {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.queueMovement(targets, duration, handle);
}

ErrorCode HumanoidRobot::executeQueue() {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.executeQueue();
}

ErrorCode HumanoidRobot::clearQueue() {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    motion_.clearQueue();
    return NO_ERROR;
}

MotionController::QueueFailure HumanoidRobot::getLastQueueFailure() const {
    return motion_.getLastQueueFailure();
}

ErrorCode HumanoidRobot::standUp() {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.standUp();
}

ErrorCode HumanoidRobot::walkForward(int steps) {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.walkForward(steps);
}

ErrorCode HumanoidRobot::dance() {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.dance();
}

ErrorCode HumanoidRobot::runServoTest() {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.runServoTest();
}

void HumanoidRobot::cancelMovements() {
    motion_.cancelMovements();
}

ErrorCode HumanoidRobot::getPosition(int channel, double &angle) const {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.getPosition(channel, angle);
}

ErrorCode HumanoidRobot::getAllPositions(ChannelAngleMap &angles) const {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return motion_.getAllPositions(angles);
}

ErrorCode HumanoidRobot::getServoState(int channel, ServoState &state) const {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;

    JointState joint;
    ErrorCode result = motion_.getJointState(channel, joint);
    if (result != NO_ERROR)
        return result;
    Calibration calibration;
    result = calibration_.get(channel, calibration);
    if (result != NO_ERROR)
        return result;

    state.channel = channel;
    state.name = getChannelName(channel);
    state.position = joint.current_angle;
    state.target = joint.target_angle;
    state.moving = joint.moving;
    state.min_angle = calibration.min_angle;
    state.max_angle = calibration.max_angle;
    state.neutral_angle = calibration.neutral_angle;
    return NO_ERROR;
}

RobotInfo HumanoidRobot::getRobotInfo() const {
    RobotInfo info;
    info.state = getLifecycleState();
    info.adapter_name = adapter_.getName();
    info.simulated = adapter_.isSimulated();
    info.using_default_calibration = calibration_.isUsingDefaults();
    info.queue_length = motion_.getQueueLength();
    return info;
}

ErrorCode HumanoidRobot::readSensor(SensorId sensor, SensorReading &reading) {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return sensors_.read(sensor, reading);
}

ErrorCode HumanoidRobot::getLastSensorReading(SensorId sensor, SensorReading &reading, double *age) const {
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;
    return sensors_.getLastReading(sensor, reading, age);
}

ErrorCode HumanoidRobot::getCalibration(int channel, Calibration &calibration) const {
    return calibration_.get(channel, calibration);
}

ErrorCode HumanoidRobot::setCalibration(int channel, const Calibration &calibration) {
    ErrorCode result = calibration_.set(channel, calibration);
    if (result != NO_ERROR || !isOperational())
        return result;

    JointState joint;
    result = motion_.getJointState(channel, joint);
    if (result != NO_ERROR)
        return result;
    // An in-flight move clamps its next tick against the new limits
    if (joint.moving)
        return NO_ERROR;
    const double current = joint.current_angle;
    if (current < calibration.min_angle || current > calibration.max_angle) {
        log_utils::logInfo(TAG, "Moving " + getChannelName(channel) + " inside its new limits");
        return motion_.setServo(channel, calibration.clamp(current));
    }
    return NO_ERROR;
}

ErrorCode HumanoidRobot::calibrateNeutral(int channel, double angle) {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!std::isfinite(angle))
        return PARAMETER_ERROR;
    if (!isOperational())
        return NOT_INITIALIZED_ERROR;

    Calibration calibration;
    ErrorCode result = calibration_.get(channel, calibration);
    if (result != NO_ERROR)
        return result;
    calibration.neutral_angle = angle;
    if (!calibration.isValid())
        return INVALID_CALIBRATION_ERROR;

    result = motion_.setServo(channel, angle);
    if (result != NO_ERROR)
        return result;
    result = calibration_.setNeutral(channel, angle);
    if (result != NO_ERROR)
        return result;
    log_utils::logInfo(TAG, "Neutral of " + getChannelName(channel) + " set to " + std::to_string(angle));
    return calibration_.save();
}

ErrorCode HumanoidRobot::saveCalibration() {
    return calibration_.save();
}
