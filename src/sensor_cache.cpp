#include "sensor_cache.h"
#include "log_utils.h"
#include "math_utils.h"

namespace {
const char *const TAG = "SensorCache";

bool isValidSensor(SensorId sensor) {
    return sensor >= 0 && sensor < SENSOR_COUNT;
}

std::string sensorName(SensorId sensor) {
    return sensor == SENSOR_PROXIMITY ? "proximity" : "motion";
}
} // namespace

SensorCache::SensorCache(IHardwareAdapter &adapter, IClock &clock, std::mutex &hardware_mutex, double ttl)
    : adapter_(adapter), clock_(clock), hardware_mutex_(hardware_mutex), ttl_(ttl) {}

ErrorCode SensorCache::read(SensorId sensor, SensorReading &reading) {
    if (!isValidSensor(sensor))
        return PARAMETER_ERROR;

    // Held across the bus transaction so concurrent callers share one read
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    CacheEntry &entry = entries_[sensor];
    double now = clock_.now();
    if (entry.valid && now - entry.reading.captured_at < ttl_) {
        reading = entry.reading;
        return NO_ERROR;
    }

    std::vector<uint8_t> raw;
    bool ok = false;
    {
        std::lock_guard<std::mutex> hardware_lock(hardware_mutex_);
        ok = adapter_.readSensor(sensor, raw);
    }
    if (!ok) {
        log_utils::logWarning(TAG, "Hardware read failed for " + sensorName(sensor) + " sensor");
        return SENSOR_UNAVAILABLE_ERROR;
    }

    SensorReading decoded;
    decoded.sensor = sensor;
    decoded.captured_at = now;
    bool valid = sensor == SENSOR_PROXIMITY ? decodeProximity(raw, decoded.proximity)
                                            : decodeMotion(raw, decoded.motion);
    if (!valid) {
        log_utils::logWarning(TAG, "Malformed " + sensorName(sensor) + " data (" +
                                       std::to_string(raw.size()) + " bytes)");
        return SENSOR_UNAVAILABLE_ERROR;
    }

    entry.reading = decoded;
    entry.valid = true;
    reading = decoded;
    return NO_ERROR;
}

ErrorCode SensorCache::getLastReading(SensorId sensor, SensorReading &reading, double *age) const {
    if (!isValidSensor(sensor))
        return PARAMETER_ERROR;
    std::lock_guard<std::mutex> lock(cache_mutex_);
    const CacheEntry &entry = entries_[sensor];
    if (!entry.valid)
        return SENSOR_UNAVAILABLE_ERROR;
    reading = entry.reading;
    if (age)
        *age = clock_.now() - entry.reading.captured_at;
    return NO_ERROR;
}

void SensorCache::invalidate(SensorId sensor) {
    if (!isValidSensor(sensor))
        return;
    std::lock_guard<std::mutex> lock(cache_mutex_);
    entries_[sensor].valid = false;
}

void SensorCache::invalidateAll() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (int i = 0; i < SENSOR_COUNT; ++i)
        entries_[i].valid = false;
}

double SensorCache::getTtl() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return ttl_;
}

void SensorCache::setTtl(double ttl) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    ttl_ = ttl;
}

bool SensorCache::decodeProximity(const std::vector<uint8_t> &raw, ProximityData &data) {
    if (raw.size() != PROXIMITY_RAW_SIZE)
        return false;
    data.distance_cm = math_utils::decodeUInt16BE(raw[0], raw[1]) / PROXIMITY_DISTANCE_SCALE;
    data.ambient_light = raw[2];
    return true;
}

bool SensorCache::decodeMotion(const std::vector<uint8_t> &raw, MotionData &data) {
    if (raw.size() != MOTION_RAW_SIZE)
        return false;
    // Burst order: ACCEL_X/Y/Z, TEMP, GYRO_X/Y/Z, two bytes each
    double words[7];
    for (int i = 0; i < 7; ++i)
        words[i] = math_utils::decodeInt16BE(raw[2 * i], raw[2 * i + 1]);

    data.acceleration_g = Eigen::Vector3d(words[0], words[1], words[2]) / MPU6050_ACCEL_SCALE;
    data.temperature_c = words[3] / MPU6050_TEMP_SCALE + MPU6050_TEMP_OFFSET;
    data.angular_velocity_dps = Eigen::Vector3d(words[4], words[5], words[6]) / MPU6050_GYRO_SCALE;

    Eigen::Vector2d tilt = math_utils::tiltFromAcceleration(data.acceleration_g);
    data.roll_deg = tilt.x();
    data.pitch_deg = tilt.y();
    return true;
}
