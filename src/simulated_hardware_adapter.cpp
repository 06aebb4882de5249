#include "simulated_hardware_adapter.h"

namespace {
// Robot standing still: 50.0 cm free ahead, mid light, gravity on +Z, 25 C
std::vector<uint8_t> defaultProximityBytes() {
    return {0x01, 0xF4, 0x80};
}

std::vector<uint8_t> defaultMotionBytes() {
    // temperature raw = (25 - 36.53) * 340 = -3920 = 0xF0B0
    return {0x00, 0x00, 0x00, 0x00, 0x40, 0x00, 0xF0, 0xB0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
}
} // namespace

SimulatedHardwareAdapter::SimulatedHardwareAdapter()
    : initialized_(false), release_count_(0), write_log_capacity_(SIM_WRITE_LOG_CAPACITY), write_count_(0),
      fail_initialize_(false),
      writes_until_failure_(-1), failing_channel_(-1) {
    for (int i = 0; i < NUM_CHANNELS; ++i)
        duties_[i] = 0;
    for (int i = 0; i < SENSOR_COUNT; ++i) {
        sensor_failure_[i] = false;
        sensor_reads_[i] = 0;
    }
    sensor_data_[SENSOR_PROXIMITY] = defaultProximityBytes();
    sensor_data_[SENSOR_MOTION] = defaultMotionBytes();
}

bool SimulatedHardwareAdapter::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_initialize_)
        return false;
    initialized_ = true;
    return true;
}

void SimulatedHardwareAdapter::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
    ++release_count_;
}

bool SimulatedHardwareAdapter::writePulse(int channel, int duty) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ || !isValidChannel(channel) || duty < 0 || duty > PWM_DUTY_MAX)
        return false;
    if (channel == failing_channel_)
        return false;
    if (writes_until_failure_ == 0)
        return false;
    if (writes_until_failure_ > 0)
        --writes_until_failure_;

    duties_[channel] = duty;
    if (write_log_capacity_ > 0) {
        if (write_log_.size() >= write_log_capacity_)
            write_log_.pop_front();
        write_log_.push_back({channel, duty});
    }
    ++write_count_;
    return true;
}

bool SimulatedHardwareAdapter::readSensor(SensorId sensor, std::vector<uint8_t> &raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ || sensor < 0 || sensor >= SENSOR_COUNT)
        return false;
    ++sensor_reads_[sensor];
    if (sensor_failure_[sensor])
        return false;
    raw = sensor_data_[sensor];
    return true;
}

bool SimulatedHardwareAdapter::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

int SimulatedHardwareAdapter::getReleaseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return release_count_;
}

int SimulatedHardwareAdapter::getDuty(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isValidChannel(channel) ? duties_[channel] : 0;
}

int SimulatedHardwareAdapter::getWriteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

std::vector<SimulatedHardwareAdapter::WriteRecord> SimulatedHardwareAdapter::getWriteLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<WriteRecord>(write_log_.begin(), write_log_.end());
}

void SimulatedHardwareAdapter::clearWriteLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    write_log_.clear();
    write_count_ = 0;
}

void SimulatedHardwareAdapter::setWriteLogCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_log_capacity_ = capacity;
    while (write_log_.size() > write_log_capacity_)
        write_log_.pop_front();
}

int SimulatedHardwareAdapter::getSensorReadCount(SensorId sensor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (sensor >= 0 && sensor < SENSOR_COUNT) ? sensor_reads_[sensor] : 0;
}

void SimulatedHardwareAdapter::setFailInitialize(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_initialize_ = fail;
}

void SimulatedHardwareAdapter::setFailAfterWrites(int writes) {
    std::lock_guard<std::mutex> lock(mutex_);
    writes_until_failure_ = writes;
}

void SimulatedHardwareAdapter::setFailingChannel(int channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_channel_ = channel;
}

void SimulatedHardwareAdapter::setSensorFailure(SensorId sensor, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sensor >= 0 && sensor < SENSOR_COUNT)
        sensor_failure_[sensor] = fail;
}

void SimulatedHardwareAdapter::clearFaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_initialize_ = false;
    writes_until_failure_ = -1;
    failing_channel_ = -1;
    for (int i = 0; i < SENSOR_COUNT; ++i)
        sensor_failure_[i] = false;
}

void SimulatedHardwareAdapter::setSensorData(SensorId sensor, const std::vector<uint8_t> &raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sensor >= 0 && sensor < SENSOR_COUNT)
        sensor_data_[sensor] = raw;
}
