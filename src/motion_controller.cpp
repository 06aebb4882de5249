#include "motion_controller.h"
#include "gesture_factory.h"
#include "linear_trajectory.h"
#include "log_utils.h"
#include "math_utils.h"
#include <algorithm>
#include <cmath>

namespace {
const char *const TAG = "MotionController";
} // namespace

// Marks channels as moving for the lifetime of a trajectory
class MotionController::ChannelReservation {
  public:
    ChannelReservation(MotionController &controller, const std::vector<int> &channels)
        : controller_(controller), channels_(channels) {}
    ~ChannelReservation() { controller_.releaseChannels(channels_); }

    ChannelReservation(const ChannelReservation &) = delete;
    ChannelReservation &operator=(const ChannelReservation &) = delete;

  private:
    MotionController &controller_;
    std::vector<int> channels_;
};

MotionController::MotionController(IHardwareAdapter &adapter, IClock &clock, CalibrationStore &calibration,
                                   std::mutex &hardware_mutex, const RobotParameters &params)
    : adapter_(adapter), clock_(clock), calibration_(calibration), params_(params),
      hardware_mutex_(hardware_mutex), enabled_(false), cancel_generation_(0), active_moves_(0),
      next_handle_(1), draining_(false) {}

MotionController::~MotionController() {
    cancelMovements();
    waitForIdle();
}

void MotionController::enable() {
    enabled_.store(true);
}

void MotionController::disable() {
    enabled_.store(false);
    cancelMovements();
}

ErrorCode MotionController::setServo(int channel, double angle) {
    return setServo(channel, angle, params_.default_servo_speed);
}

ErrorCode MotionController::setServo(int channel, double angle, double speed) {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!std::isfinite(angle) || std::isnan(speed))
        return PARAMETER_ERROR;
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;

    const uint64_t generation = cancel_generation_.load();
    ChannelAngleMap clamped;
    ErrorCode result = clampTargets({{channel, angle}}, clamped);
    if (result != NO_ERROR)
        return result;
    return performMove(clamped, -1.0, speed, generation);
}

ErrorCode MotionController::setServos(const ChannelAngleMap &targets, double duration) {
    if (std::isnan(duration) || std::isinf(duration) || exceedsTickLimit(duration))
        return PARAMETER_ERROR;
    const uint64_t generation = cancel_generation_.load();
    ChannelAngleMap clamped;
    ErrorCode result = clampTargets(targets, clamped);
    if (result != NO_ERROR)
        return result;
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    if (clamped.empty())
        return NO_ERROR;
    return performMove(clamped, duration, params_.default_servo_speed, generation);
}

ErrorCode MotionController::moveAllToNeutral() {
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    const std::vector<Calibration> table = calibration_.getAll();

    std::lock_guard<std::mutex> lock(hardware_mutex_);
    for (int channel = 0; channel < NUM_CHANNELS; ++channel) {
        if (joints_[channel].moving)
            return CHANNEL_BUSY_ERROR;
    }
    for (int channel = 0; channel < NUM_CHANNELS; ++channel) {
        const double neutral = table[channel].neutral_angle;
        if (!adapter_.writePulse(channel, angleToDuty(neutral))) {
            log_utils::logError(TAG, "Neutral write failed on " + getChannelName(channel));
            return HARDWARE_WRITE_FAILED_ERROR;
        }
        joints_[channel].current_angle = neutral;
        joints_[channel].target_angle = neutral;
    }
    return NO_ERROR;
}

ErrorCode MotionController::queueMovement(const ChannelAngleMap &targets, double duration, MovementHandle *handle) {
    if (!std::isfinite(duration) || duration < 0.0 || exceedsTickLimit(duration))
        return PARAMETER_ERROR;
    ChannelAngleMap clamped;
    ErrorCode result = clampTargets(targets, clamped);
    if (result != NO_ERROR)
        return result;
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    MovementStep step;
    step.handle = next_handle_++;
    step.targets = clamped;
    step.duration = duration;
    queue_.push_back(step);
    if (handle)
        *handle = step.handle;
    return NO_ERROR;
}

ErrorCode MotionController::executeQueue() {
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    const uint64_t generation = cancel_generation_.load();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (draining_)
            return CHANNEL_BUSY_ERROR;
        draining_ = true;
    }
    beginActivity();
    ErrorCode result = drainQueue(generation);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        draining_ = false;
    }
    endActivity();
    return result;
}

ErrorCode MotionController::drainQueue(uint64_t generation) {
    while (true) {
        MovementStep step;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty())
                return NO_ERROR;
            step = queue_.front();
            queue_.pop_front();
        }

        const double step_start = clock_.now();
        ErrorCode result = NO_ERROR;
        if (!step.targets.empty()) {
            // Limits may have changed since the step was queued
            ChannelAngleMap clamped;
            result = clampTargets(step.targets, clamped);
            if (result == NO_ERROR)
                result = performMove(clamped, step.duration, params_.default_servo_speed, generation);
        }
        if (result == NO_ERROR && !waitUntil(step_start + step.duration + params_.step_settle_time, generation))
            result = MOVEMENT_CANCELLED_ERROR;

        if (result != NO_ERROR) {
            recordQueueFailure(step.handle, result);
            return QUEUE_STEP_FAILED_ERROR;
        }
    }
}

void MotionController::clearQueue() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

size_t MotionController::getQueueLength() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

MotionController::QueueFailure MotionController::getLastQueueFailure() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return last_queue_failure_;
}

ErrorCode MotionController::standUp() {
    return runGesture(createStandUpGesture(calibration_.getAll(), params_.gesture_step_duration));
}

ErrorCode MotionController::walkForward(int steps) {
    if (steps < 1 || steps > MAX_WALK_STEPS)
        return PARAMETER_ERROR;
    return runGesture(createWalkGesture(steps, params_.gesture_step_duration));
}

ErrorCode MotionController::dance() {
    return runGesture(createDanceGesture());
}

ErrorCode MotionController::runServoTest() {
    return runGesture(createServoTestGesture(calibration_.getAll(), params_.gesture_step_duration));
}

ErrorCode MotionController::runGesture(const GestureSequence &gesture) {
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    for (const MovementStep &step : gesture.steps) {
        ErrorCode result = queueMovement(step.targets, step.duration);
        if (result != NO_ERROR)
            return result;
    }
    log_utils::logInfo(TAG, "Gesture " + gesture.name + " (" + std::to_string(gesture.steps.size()) + " steps)");
    ErrorCode result = executeQueue();
    if (result != NO_ERROR)
        log_utils::logWarning(TAG, "Gesture " + gesture.name + " aborted: " + getErrorMessage(result));
    return result;
}

ErrorCode MotionController::getPosition(int channel, double &angle) const {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    std::lock_guard<std::mutex> lock(hardware_mutex_);
    angle = joints_[channel].current_angle;
    return NO_ERROR;
}

ErrorCode MotionController::getAllPositions(ChannelAngleMap &angles) const {
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    std::lock_guard<std::mutex> lock(hardware_mutex_);
    angles.clear();
    for (int channel = 0; channel < NUM_CHANNELS; ++channel)
        angles[channel] = joints_[channel].current_angle;
    return NO_ERROR;
}

ErrorCode MotionController::getJointState(int channel, JointState &state) const {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!enabled_.load())
        return NOT_INITIALIZED_ERROR;
    std::lock_guard<std::mutex> lock(hardware_mutex_);
    state = joints_[channel];
    return NO_ERROR;
}

void MotionController::cancelMovements() {
    cancel_generation_.fetch_add(1);
}

void MotionController::waitForIdle() {
    std::unique_lock<std::mutex> lock(activity_mutex_);
    idle_cv_.wait(lock, [this] { return active_moves_ == 0; });
}

bool MotionController::isMoving() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return active_moves_ > 0;
}

int MotionController::angleToDuty(double angle) const {
    double pulse = math_utils::angleToPulseMicros(angle, params_.pwm.min_pulse_us, params_.pwm.max_pulse_us);
    return math_utils::pulseMicrosToDuty(pulse, params_.pwm.frequency_hz);
}

ErrorCode MotionController::clampTargets(const ChannelAngleMap &targets, ChannelAngleMap &clamped) const {
    clamped.clear();
    for (const auto &target : targets) {
        if (!isValidChannel(target.first))
            return UNKNOWN_CHANNEL_ERROR;
        if (!std::isfinite(target.second))
            return PARAMETER_ERROR;
    }
    for (const auto &target : targets) {
        Calibration calibration;
        ErrorCode result = calibration_.get(target.first, calibration);
        if (result != NO_ERROR)
            return result;
        clamped[target.first] = calibration.clamp(target.second);
    }
    return NO_ERROR;
}

ErrorCode MotionController::performMove(const ChannelAngleMap &targets, double duration, double speed,
                                        uint64_t generation) {
    std::vector<int> channels;
    std::vector<double> starts;
    std::vector<double> goals;
    double start_time = 0.0;
    {
        std::lock_guard<std::mutex> lock(hardware_mutex_);
        if (isCancelled(generation))
            return MOVEMENT_CANCELLED_ERROR;
        for (const auto &target : targets) {
            if (joints_[target.first].moving) {
                log_utils::logDebug(TAG, getChannelName(target.first) + " busy");
                return CHANNEL_BUSY_ERROR;
            }
        }
        // Channels already at their target stay out of the tick loop
        for (const auto &target : targets) {
            const double current = joints_[target.first].current_angle;
            if (current == target.second)
                continue;
            channels.push_back(target.first);
            starts.push_back(current);
            goals.push_back(target.second);
        }
        if (channels.empty())
            return NO_ERROR;

        for (size_t k = 0; k < channels.size(); ++k) {
            joints_[channels[k]].moving = true;
            joints_[channels[k]].target_angle = goals[k];
        }
        beginActivity();
        start_time = clock_.now();
    }
    ChannelReservation reservation(*this, channels);

    const Eigen::VectorXd start_angles = Eigen::Map<const Eigen::VectorXd>(starts.data(), static_cast<Eigen::Index>(starts.size()));
    const Eigen::VectorXd target_angles = Eigen::Map<const Eigen::VectorXd>(goals.data(), static_cast<Eigen::Index>(goals.size()));
    if (duration < 0.0) {
        const double distance = (target_angles - start_angles).cwiseAbs().maxCoeff();
        duration = LinearTrajectory::durationForDistance(distance, params_.nominal_servo_velocity, speed,
                                                         params_.tick_interval);
    }
    LinearTrajectory trajectory(channels, start_angles, target_angles, duration, params_.tick_interval);

    for (int i = 1; i <= trajectory.tickCount(); ++i) {
        clock_.sleepUntil(start_time + trajectory.tickOffset(i));
        if (isCancelled(generation)) {
            log_utils::logDebug(TAG, "Move cancelled at tick " + std::to_string(i));
            return MOVEMENT_CANCELLED_ERROR;
        }
        const Eigen::VectorXd angles = trajectory.sample(i);
        // Keep every sample inside the limits in force now
        const std::vector<Calibration> table = calibration_.getAll();

        std::lock_guard<std::mutex> lock(hardware_mutex_);
        for (size_t k = 0; k < channels.size(); ++k) {
            const int channel = channels[k];
            const double angle = table[channel].clamp(angles(k));
            if (!adapter_.writePulse(channel, angleToDuty(angle))) {
                log_utils::logError(TAG, "Hardware write failed on " + getChannelName(channel));
                return HARDWARE_WRITE_FAILED_ERROR;
            }
            joints_[channel].current_angle = angle;
        }
    }
    return NO_ERROR;
}

bool MotionController::waitUntil(double deadline, uint64_t generation) {
    while (clock_.now() < deadline) {
        if (isCancelled(generation))
            return false;
        clock_.sleepUntil(std::min(deadline, clock_.now() + params_.tick_interval));
    }
    return !isCancelled(generation);
}

bool MotionController::exceedsTickLimit(double duration) const {
    return duration / params_.tick_interval > MAX_MOVE_TICKS;
}

bool MotionController::isCancelled(uint64_t generation) const {
    return generation != cancel_generation_.load() || !enabled_.load();
}

void MotionController::recordQueueFailure(MovementHandle handle, ErrorCode cause) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    size_t discarded = queue_.size();
    queue_.clear();
    last_queue_failure_.handle = handle;
    last_queue_failure_.cause = cause;
    log_utils::logError(TAG, "Queue step " + std::to_string(handle) + " failed: " + getErrorMessage(cause) + ", " +
                                 std::to_string(discarded) + " steps discarded");
}

void MotionController::releaseChannels(const std::vector<int> &channels) {
    {
        std::lock_guard<std::mutex> lock(hardware_mutex_);
        for (int channel : channels) {
            joints_[channel].moving = false;
            joints_[channel].target_angle = joints_[channel].current_angle;
        }
    }
    endActivity();
}

void MotionController::beginActivity() {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    ++active_moves_;
}

void MotionController::endActivity() {
    {
        std::lock_guard<std::mutex> lock(activity_mutex_);
        --active_moves_;
    }
    idle_cv_.notify_all();
}
