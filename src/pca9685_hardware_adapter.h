#ifndef PCA9685_HARDWARE_ADAPTER_H
#define PCA9685_HARDWARE_ADAPTER_H

#include "humanoid_model.h"
#include "robot_config.h"
#include <cstddef>

/**
 * @brief Hardware adapter for a PCA9685 servo board and the I2C sensors
 *        on a Linux i2c-dev bus (/dev/i2c-N).
 *
 * The PWM chip is mandatory. The OT703-C86 and MPU-6050 are optional: when
 * one does not answer during initialize() its readSensor() calls fail and
 * the rest of the robot keeps working.
 */
class Pca9685HardwareAdapter : public IHardwareAdapter {
  public:
    Pca9685HardwareAdapter(const RobotParameters::I2CConfig &i2c, double pwm_frequency);
    ~Pca9685HardwareAdapter() override;

    bool initialize() override;
    void release() override;
    bool writePulse(int channel, int duty) override;
    bool readSensor(SensorId sensor, std::vector<uint8_t> &raw) override;
    std::string getName() const override { return "pca9685"; }
    bool isSimulated() const override { return false; }

  private:
    bool selectDevice(int address);
    bool writeRegister(int address, uint8_t reg, uint8_t value);
    bool writeBlock(int address, uint8_t reg, const uint8_t *data, size_t length);
    bool readBlock(int address, uint8_t reg, uint8_t *data, size_t length);

    bool configurePwm();
    bool configureProximity();
    bool configureMotion();
    void closeBus();

    RobotParameters::I2CConfig i2c_;
    double pwm_frequency_;
    int fd_;
    int selected_address_;
    bool proximity_ready_;
    bool motion_ready_;
};

#endif // PCA9685_HARDWARE_ADAPTER_H
