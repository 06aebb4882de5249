#include "robot_config.h"
#include "log_utils.h"
#include <ArduinoJson.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace {
const char *const TAG = "RobotConfig";

// 7-bit I2C address space excluding the reserved blocks
bool isValidI2CAddress(int address) {
    return address >= 0x03 && address <= 0x77;
}

bool isPositive(double value) {
    return std::isfinite(value) && value > 0.0;
}

bool isNonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

template <typename T>
void readField(JsonObjectConst object, const char *key, T &field) {
    JsonVariantConst value = object[key];
    if (!value.isNull() && value.is<T>())
        field = value.as<T>();
}

void readField(JsonObjectConst object, const char *key, std::string &field) {
    JsonVariantConst value = object[key];
    if (value.is<const char *>())
        field = value.as<const char *>();
}
} // namespace

RobotParameters createDefaultParameters() {
    RobotParameters params;
    return params;
}

ErrorCode validateParameters(const RobotParameters &params) {
    if (!isPositive(params.tick_interval) || !isPositive(params.nominal_servo_velocity))
        return PARAMETER_ERROR;
    if (!std::isfinite(params.default_servo_speed) ||
        params.default_servo_speed < SERVO_SPEED_MIN || params.default_servo_speed > SERVO_SPEED_MAX)
        return PARAMETER_ERROR;
    if (!isNonNegative(params.step_settle_time) || !isPositive(params.gesture_step_duration))
        return PARAMETER_ERROR;
    if (!isNonNegative(params.sensor_ttl))
        return PARAMETER_ERROR;

    // Pulse must fit inside one PWM period
    if (!isPositive(params.pwm.frequency_hz) || !isPositive(params.pwm.min_pulse_us))
        return PARAMETER_ERROR;
    if (!std::isfinite(params.pwm.max_pulse_us) || params.pwm.max_pulse_us <= params.pwm.min_pulse_us)
        return PARAMETER_ERROR;
    if (params.pwm.max_pulse_us >= 1e6 / params.pwm.frequency_hz)
        return PARAMETER_ERROR;

    if (params.i2c.bus < 0)
        return PARAMETER_ERROR;
    if (!isValidI2CAddress(params.i2c.pca9685_address) ||
        !isValidI2CAddress(params.i2c.proximity_address) ||
        !isValidI2CAddress(params.i2c.motion_address))
        return PARAMETER_ERROR;

    if (params.calibration_file.empty())
        return PARAMETER_ERROR;
    return NO_ERROR;
}

ErrorCode loadParametersFromFile(const std::string &path, RobotParameters &params) {
    std::ifstream file(path);
    if (!file.is_open()) {
        log_utils::logWarning(TAG, "Cannot open config file " + path);
        return FILE_IO_ERROR;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    DynamicJsonDocument doc(4096);
    DeserializationError error = deserializeJson(doc, content);
    if (error) {
        log_utils::logError(TAG, "Config parse failed: " + std::string(error.c_str()));
        return PARAMETER_ERROR;
    }
    if (!doc.is<JsonObject>()) {
        log_utils::logError(TAG, "Config root must be an object");
        return PARAMETER_ERROR;
    }

    RobotParameters loaded = params;
    JsonObjectConst root = doc.as<JsonObjectConst>();
    readField(root, "tick_interval", loaded.tick_interval);
    readField(root, "nominal_servo_velocity", loaded.nominal_servo_velocity);
    readField(root, "default_servo_speed", loaded.default_servo_speed);
    readField(root, "step_settle_time", loaded.step_settle_time);
    readField(root, "gesture_step_duration", loaded.gesture_step_duration);
    readField(root, "sensor_ttl", loaded.sensor_ttl);
    readField(root, "calibration_file", loaded.calibration_file);
    readField(root, "use_simulation", loaded.use_simulation);

    JsonObjectConst pwm = root["pwm"].as<JsonObjectConst>();
    if (!pwm.isNull()) {
        readField(pwm, "min_pulse_us", loaded.pwm.min_pulse_us);
        readField(pwm, "max_pulse_us", loaded.pwm.max_pulse_us);
        readField(pwm, "frequency_hz", loaded.pwm.frequency_hz);
    }

    JsonObjectConst i2c = root["i2c"].as<JsonObjectConst>();
    if (!i2c.isNull()) {
        readField(i2c, "bus", loaded.i2c.bus);
        readField(i2c, "pca9685_address", loaded.i2c.pca9685_address);
        readField(i2c, "proximity_address", loaded.i2c.proximity_address);
        readField(i2c, "motion_address", loaded.i2c.motion_address);
    }

    if (validateParameters(loaded) != NO_ERROR) {
        log_utils::logError(TAG, "Config values out of range in " + path);
        return PARAMETER_ERROR;
    }

    params = loaded;
    log_utils::logInfo(TAG, "Loaded config from " + path);
    return NO_ERROR;
}
