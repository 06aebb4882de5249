#ifndef SIMULATED_HARDWARE_ADAPTER_H
#define SIMULATED_HARDWARE_ADAPTER_H

#include "humanoid_model.h"
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

// Writes kept in the simulated write log before the oldest are dropped
#define SIM_WRITE_LOG_CAPACITY 8192

/**
 * @brief In-memory hardware adapter.
 *
 * Stores the last duty of every channel, logs the most recent writes and
 * serves configurable raw sensor bytes. Faults can be injected for tests and
 * for exercising the error paths without a robot attached.
 */
class SimulatedHardwareAdapter : public IHardwareAdapter {
  public:
    struct WriteRecord {
        int channel;
        int duty;
    };

    SimulatedHardwareAdapter();

    bool initialize() override;
    void release() override;
    bool writePulse(int channel, int duty) override;
    bool readSensor(SensorId sensor, std::vector<uint8_t> &raw) override;
    std::string getName() const override { return "simulated"; }
    bool isSimulated() const override { return true; }

    // Inspection
    bool isInitialized() const;
    int getReleaseCount() const;
    int getDuty(int channel) const;
    int getWriteCount() const;
    /** Latest writes, oldest first. getWriteCount() still counts dropped ones. */
    std::vector<WriteRecord> getWriteLog() const;
    /** Forget logged writes and reset the write count. Duties are kept. */
    void clearWriteLog();
    /** Keep at most @p capacity records; 0 turns logging off. */
    void setWriteLogCapacity(size_t capacity);
    int getSensorReadCount(SensorId sensor) const;

    // Fault injection
    void setFailInitialize(bool fail);
    /** Allow @p writes more successful writes, then reject all. Negative disables. */
    void setFailAfterWrites(int writes);
    /** Reject every write to @p channel. -1 disables. */
    void setFailingChannel(int channel);
    void setSensorFailure(SensorId sensor, bool fail);
    void clearFaults();

    /** Raw bytes returned for a sensor (layout in sensor_cache.h). */
    void setSensorData(SensorId sensor, const std::vector<uint8_t> &raw);

  private:
    mutable std::mutex mutex_;
    bool initialized_;
    int release_count_;
    int duties_[NUM_CHANNELS];
    std::deque<WriteRecord> write_log_;
    size_t write_log_capacity_;
    int write_count_;

    bool fail_initialize_;
    int writes_until_failure_;
    int failing_channel_;
    bool sensor_failure_[SENSOR_COUNT];
    std::vector<uint8_t> sensor_data_[SENSOR_COUNT];
    int sensor_reads_[SENSOR_COUNT];
};

#endif // SIMULATED_HARDWARE_ADAPTER_H
