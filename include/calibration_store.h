#ifndef CALIBRATION_STORE_H
#define CALIBRATION_STORE_H

#include "humanoid_model.h"
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Persistent per-channel calibration (limits and neutral pose).
 *
 * File layout:
 * @code
 * {"version": 1,
 *  "channels": {"0": {"name": "HEAD", "min": 45, "max": 135, "neutral": 90}, ...}}
 * @endcode
 * The older {"positions": {"0": 90, ...}, "limits": {"0": [45, 135], ...}}
 * layout written by the interactive calibration tool is accepted on load.
 * Channels missing from a file keep their built-in defaults.
 *
 * All methods are thread safe; get() returns a copy.
 */
class CalibrationStore {
  public:
    explicit CalibrationStore(const std::string &path);

    /**
     * @brief Load the calibration file.
     *
     * A missing or invalid file is not fatal: every channel falls back to
     * its built-in default and isUsingDefaults() turns true.
     * @return NO_ERROR if the file was applied, FILE_IO_ERROR if it could
     *         not be read, INVALID_CALIBRATION_ERROR if its content was rejected
     */
    ErrorCode load();

    /**
     * @brief Write all channels to the file.
     *
     * Data goes to "<path>.tmp" first and is renamed over the file, so a
     * failed save leaves the previous file intact. A successful save clears
     * isUsingDefaults().
     * @return NO_ERROR or FILE_IO_ERROR
     */
    ErrorCode save();

    ErrorCode get(int channel, Calibration &calibration) const;

    /**
     * Replace a channel calibration in memory. Requires min < neutral < max.
     * Any accepted edit clears isUsingDefaults().
     */
    ErrorCode set(int channel, const Calibration &calibration);

    /** Replace only the neutral angle of a channel, keeping its limits. */
    ErrorCode setNeutral(int channel, double neutral_angle);

    /** Calibration of all channels in channel order. */
    std::vector<Calibration> getAll() const;

    void resetToDefaults();
    bool isUsingDefaults() const;
    std::string getPath() const;

  private:
    mutable std::mutex mutex_;
    std::string path_;
    std::vector<Calibration> table_;
    bool using_defaults_;
};

#endif // CALIBRATION_STORE_H
