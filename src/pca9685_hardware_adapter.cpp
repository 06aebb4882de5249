#include "pca9685_hardware_adapter.h"
#include "log_utils.h"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

namespace {
const char *const TAG = "PCA9685";

// Largest transfer is the 14 byte MPU-6050 burst plus the register byte
const size_t MAX_BLOCK_LENGTH = 16;

void sleepMillis(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string hexAddress(int address) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%02X", address);
    return buffer;
}
} // namespace

Pca9685HardwareAdapter::Pca9685HardwareAdapter(const RobotParameters::I2CConfig &i2c, double pwm_frequency)
    : i2c_(i2c), pwm_frequency_(pwm_frequency), fd_(-1), selected_address_(-1), proximity_ready_(false),
      motion_ready_(false) {}

Pca9685HardwareAdapter::~Pca9685HardwareAdapter() {
    closeBus();
}

bool Pca9685HardwareAdapter::initialize() {
    closeBus();
    const std::string device = "/dev/i2c-" + std::to_string(i2c_.bus);
    fd_ = ::open(device.c_str(), O_RDWR);
    if (fd_ < 0) {
        log_utils::logError(TAG, "Cannot open " + device + ": " + std::strerror(errno));
        return false;
    }

    if (!configurePwm()) {
        log_utils::logError(TAG, "No PWM controller at " + hexAddress(i2c_.pca9685_address));
        closeBus();
        return false;
    }

    proximity_ready_ = configureProximity();
    if (!proximity_ready_)
        log_utils::logWarning(TAG, "Proximity sensor not found at " + hexAddress(i2c_.proximity_address));
    motion_ready_ = configureMotion();
    if (!motion_ready_)
        log_utils::logWarning(TAG, "Motion sensor not found at " + hexAddress(i2c_.motion_address));

    log_utils::logInfo(TAG, "Initialized on " + device);
    return true;
}

void Pca9685HardwareAdapter::release() {
    if (fd_ < 0)
        return;
    // Stop all pulses, then put the oscillator to sleep
    const uint8_t all_off[4] = {0x00, 0x00, 0x00, LED_FULL_OFF};
    if (!writeBlock(i2c_.pca9685_address, PCA9685_ALL_LED_ON_L, all_off, sizeof(all_off)) ||
        !writeRegister(i2c_.pca9685_address, PCA9685_MODE1, MODE1_SLEEP))
        log_utils::logWarning(TAG, "Could not park PWM outputs before release");
    closeBus();
}

bool Pca9685HardwareAdapter::writePulse(int channel, int duty) {
    if (fd_ < 0 || !isValidChannel(channel) || duty < 0 || duty > PWM_DUTY_MAX)
        return false;
    // ON at count 0, OFF at duty; auto-increment walks the four registers
    const uint8_t data[4] = {0x00, 0x00, static_cast<uint8_t>(duty & 0xFF), static_cast<uint8_t>(duty >> 8)};
    return writeBlock(i2c_.pca9685_address, static_cast<uint8_t>(PCA9685_LED0_ON_L + 4 * channel), data,
                      sizeof(data));
}

bool Pca9685HardwareAdapter::readSensor(SensorId sensor, std::vector<uint8_t> &raw) {
    if (fd_ < 0)
        return false;
    if (sensor == SENSOR_PROXIMITY) {
        if (!proximity_ready_)
            return false;
        uint8_t distance[2];
        uint8_t light = 0;
        if (!readBlock(i2c_.proximity_address, OT703_REG_DISTANCE, distance, sizeof(distance)) ||
            !readBlock(i2c_.proximity_address, OT703_REG_LIGHT, &light, 1))
            return false;
        raw.assign({distance[0], distance[1], light});
        return true;
    }
    if (sensor == SENSOR_MOTION) {
        if (!motion_ready_)
            return false;
        uint8_t burst[MOTION_RAW_SIZE];
        if (!readBlock(i2c_.motion_address, MPU6050_ACCEL_XOUT_H, burst, sizeof(burst)))
            return false;
        raw.assign(burst, burst + sizeof(burst));
        return true;
    }
    return false;
}

bool Pca9685HardwareAdapter::selectDevice(int address) {
    if (selected_address_ == address)
        return true;
    if (::ioctl(fd_, I2C_SLAVE, address) < 0) {
        log_utils::logError(TAG, "Cannot select device " + hexAddress(address) + ": " + std::strerror(errno));
        selected_address_ = -1;
        return false;
    }
    selected_address_ = address;
    return true;
}

bool Pca9685HardwareAdapter::writeRegister(int address, uint8_t reg, uint8_t value) {
    return writeBlock(address, reg, &value, 1);
}

bool Pca9685HardwareAdapter::writeBlock(int address, uint8_t reg, const uint8_t *data, size_t length) {
    if (length + 1 > MAX_BLOCK_LENGTH || !selectDevice(address))
        return false;
    uint8_t buffer[MAX_BLOCK_LENGTH];
    buffer[0] = reg;
    std::memcpy(buffer + 1, data, length);
    ssize_t written = ::write(fd_, buffer, length + 1);
    return written == static_cast<ssize_t>(length + 1);
}

bool Pca9685HardwareAdapter::readBlock(int address, uint8_t reg, uint8_t *data, size_t length) {
    if (!selectDevice(address))
        return false;
    if (::write(fd_, &reg, 1) != 1)
        return false;
    ssize_t received = ::read(fd_, data, length);
    return received == static_cast<ssize_t>(length);
}

bool Pca9685HardwareAdapter::configurePwm() {
    const int address = i2c_.pca9685_address;
    // prescale = 25MHz / (4096 * freq) - 1, rounded
    const uint8_t prescale =
        static_cast<uint8_t>(PCA9685_OSCILLATOR_HZ / (PWM_RESOLUTION * pwm_frequency_) - 0.5);

    if (!writeRegister(address, PCA9685_MODE1, MODE1_RESTART))
        return false;
    sleepMillis(10);

    uint8_t old_mode = 0;
    if (!readBlock(address, PCA9685_MODE1, &old_mode, 1))
        return false;
    const uint8_t sleep_mode = static_cast<uint8_t>((old_mode & 0x7F) | MODE1_SLEEP);
    if (!writeRegister(address, PCA9685_MODE1, sleep_mode) ||
        !writeRegister(address, PCA9685_PRESCALE, prescale) ||
        !writeRegister(address, PCA9685_MODE1, old_mode))
        return false;
    sleepMillis(5);
    if (!writeRegister(address, PCA9685_MODE1, static_cast<uint8_t>(old_mode | MODE1_RESTART | MODE1_AI)))
        return false;

    log_utils::logDebug(TAG, "PWM frequency " + std::to_string(pwm_frequency_) + " Hz, prescale " +
                                 std::to_string(prescale));
    return true;
}

bool Pca9685HardwareAdapter::configureProximity() {
    const int address = i2c_.proximity_address;
    // Continuous distance and light measurement
    if (!writeRegister(address, OT703_REG_CONFIG, OT703_CONFIG_MEASURE | OT703_CONFIG_LIGHT))
        return false;
    sleepMillis(100);
    uint8_t config = 0;
    if (!readBlock(address, OT703_REG_CONFIG, &config, 1))
        return false;
    return (config & (OT703_CONFIG_MEASURE | OT703_CONFIG_LIGHT)) != 0;
}

bool Pca9685HardwareAdapter::configureMotion() {
    const int address = i2c_.motion_address;
    if (!writeRegister(address, MPU6050_PWR_MGMT_1, 0x00))
        return false;
    sleepMillis(100);
    // 1 kHz sample rate, +-250 deg/s, +-2 g, data ready interrupt
    return writeRegister(address, MPU6050_SMPLRT_DIV, 0x07) && writeRegister(address, MPU6050_CONFIG, 0x00) &&
           writeRegister(address, MPU6050_GYRO_CONFIG, 0x00) && writeRegister(address, MPU6050_ACCEL_CONFIG, 0x00) &&
           writeRegister(address, MPU6050_INT_ENABLE, 0x01);
}

void Pca9685HardwareAdapter::closeBus() {
    if (fd_ >= 0)
        ::close(fd_);
    fd_ = -1;
    selected_address_ = -1;
    proximity_ready_ = false;
    motion_ready_ = false;
}
