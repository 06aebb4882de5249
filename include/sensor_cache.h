#ifndef SENSOR_CACHE_H
#define SENSOR_CACHE_H

#include "humanoid_model.h"
#include <mutex>
#include <vector>

/**
 * @brief Time-to-live cache in front of the I2C sensors.
 *
 * Raw byte layouts returned by IHardwareAdapter::readSensor():
 *  - SENSOR_PROXIMITY: 3 bytes [distance_hi, distance_lo, light],
 *    distance in tenths of a centimeter.
 *  - SENSOR_MOTION: 14 bytes, the MPU-6050 burst starting at ACCEL_XOUT_H
 *    (accel xyz, temperature, gyro xyz), signed big-endian words.
 *
 * A reading is served from cache while now - captured_at < ttl. Failed or
 * malformed hardware reads never touch the cached value.
 */
class SensorCache {
  public:
    /**
     * @param adapter Hardware boundary shared with the motion controller
     * @param clock Time source for captured_at and freshness
     * @param hardware_mutex Mutex serializing every adapter call
     * @param ttl Freshness window in seconds
     */
    SensorCache(IHardwareAdapter &adapter, IClock &clock, std::mutex &hardware_mutex, double ttl);

    /**
     * @brief Fresh reading of a sensor, hitting the hardware only when stale.
     * @return NO_ERROR, PARAMETER_ERROR for an unknown sensor or
     *         SENSOR_UNAVAILABLE_ERROR when the hardware read fails
     */
    ErrorCode read(SensorId sensor, SensorReading &reading);

    /**
     * @brief Last good reading regardless of age.
     * @param age If not null, receives now - captured_at
     * @return SENSOR_UNAVAILABLE_ERROR if the sensor was never read
     */
    ErrorCode getLastReading(SensorId sensor, SensorReading &reading, double *age = nullptr) const;

    /** Force the next read() of a sensor to go to the hardware. */
    void invalidate(SensorId sensor);
    void invalidateAll();

    double getTtl() const;
    void setTtl(double ttl);

    static bool decodeProximity(const std::vector<uint8_t> &raw, ProximityData &data);
    static bool decodeMotion(const std::vector<uint8_t> &raw, MotionData &data);

  private:
    struct CacheEntry {
        SensorReading reading;
        bool valid = false;
    };

    IHardwareAdapter &adapter_;
    IClock &clock_;
    std::mutex &hardware_mutex_;
    double ttl_;

    mutable std::mutex cache_mutex_;
    CacheEntry entries_[SENSOR_COUNT];
};

#endif // SENSOR_CACHE_H
