#include "calibration_store.h"
#include "log_utils.h"
#include <ArduinoJson.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
const char *const TAG = "CalibrationStore";
const int CALIBRATION_FILE_VERSION = 1;
const size_t CALIBRATION_DOC_CAPACITY = 8192;

std::vector<Calibration> defaultTable() {
    std::vector<Calibration> table;
    for (int channel = 0; channel < NUM_CHANNELS; ++channel)
        table.push_back(getDefaultCalibration(channel));
    return table;
}

// Channel keys are decimal strings "0".."12"
bool parseChannelKey(const char *key, int &channel) {
    if (key == nullptr || *key == '\0')
        return false;
    char *end = nullptr;
    errno = 0;
    long value = std::strtol(key, &end, 10);
    if (errno != 0 || *end != '\0' || !isValidChannel(static_cast<int>(value)))
        return false;
    channel = static_cast<int>(value);
    return true;
}

bool readNumber(JsonVariantConst value, double &out) {
    if (!value.is<double>())
        return false;
    out = value.as<double>();
    return true;
}

bool parseCurrentLayout(JsonObjectConst channels, std::vector<Calibration> &table) {
    for (JsonPairConst entry : channels) {
        int channel = 0;
        if (!parseChannelKey(entry.key().c_str(), channel)) {
            log_utils::logWarning(TAG, std::string("Unknown channel key '") + entry.key().c_str() + "'");
            return false;
        }
        JsonObjectConst object = entry.value().as<JsonObjectConst>();
        if (object.isNull())
            return false;
        Calibration calibration;
        if (!readNumber(object["min"], calibration.min_angle) ||
            !readNumber(object["max"], calibration.max_angle) ||
            !readNumber(object["neutral"], calibration.neutral_angle))
            return false;
        if (!calibration.isValid()) {
            log_utils::logWarning(TAG, "Rejected calibration for " + getChannelName(channel));
            return false;
        }
        table[channel] = calibration;
    }
    return true;
}

bool parseLegacyLayout(JsonObjectConst root, std::vector<Calibration> &table) {
    JsonObjectConst limits = root["limits"].as<JsonObjectConst>();
    for (JsonPairConst entry : limits) {
        int channel = 0;
        if (!parseChannelKey(entry.key().c_str(), channel))
            return false;
        JsonArrayConst range = entry.value().as<JsonArrayConst>();
        if (range.isNull() || range.size() != 2)
            return false;
        if (!readNumber(range[0], table[channel].min_angle) || !readNumber(range[1], table[channel].max_angle))
            return false;
    }

    JsonObjectConst positions = root["positions"].as<JsonObjectConst>();
    for (JsonPairConst entry : positions) {
        int channel = 0;
        if (!parseChannelKey(entry.key().c_str(), channel))
            return false;
        if (!readNumber(entry.value(), table[channel].neutral_angle))
            return false;
    }

    for (int channel = 0; channel < NUM_CHANNELS; ++channel) {
        if (!table[channel].isValid()) {
            log_utils::logWarning(TAG, "Rejected legacy calibration for " + getChannelName(channel));
            return false;
        }
    }
    return true;
}
} // namespace

CalibrationStore::CalibrationStore(const std::string &path)
    : path_(path), table_(defaultTable()), using_defaults_(true) {}

ErrorCode CalibrationStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(path_);
    if (!file.is_open()) {
        log_utils::logWarning(TAG, "No calibration file at " + path_ + ", using defaults");
        table_ = defaultTable();
        using_defaults_ = true;
        return FILE_IO_ERROR;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    DynamicJsonDocument doc(CALIBRATION_DOC_CAPACITY);
    DeserializationError error = deserializeJson(doc, content);
    std::vector<Calibration> loaded = defaultTable();
    bool accepted = false;
    if (error) {
        log_utils::logWarning(TAG, "Calibration parse failed: " + std::string(error.c_str()));
    } else if (doc.is<JsonObject>()) {
        JsonObjectConst root = doc.as<JsonObjectConst>();
        JsonObjectConst channels = root["channels"].as<JsonObjectConst>();
        if (!channels.isNull())
            accepted = parseCurrentLayout(channels, loaded);
        else if (root.containsKey("positions") || root.containsKey("limits"))
            accepted = parseLegacyLayout(root, loaded);
    }

    if (!accepted) {
        log_utils::logWarning(TAG, "Invalid calibration file " + path_ + ", using defaults");
        table_ = defaultTable();
        using_defaults_ = true;
        return INVALID_CALIBRATION_ERROR;
    }

    table_ = loaded;
    using_defaults_ = false;
    log_utils::logInfo(TAG, "Loaded calibration from " + path_);
    return NO_ERROR;
}

ErrorCode CalibrationStore::save() {
    DynamicJsonDocument doc(CALIBRATION_DOC_CAPACITY);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doc["version"] = CALIBRATION_FILE_VERSION;
        JsonObject channels = doc.createNestedObject("channels");
        for (int channel = 0; channel < NUM_CHANNELS; ++channel) {
            JsonObject entry = channels.createNestedObject(std::to_string(channel));
            entry["name"] = getChannelName(channel);
            entry["min"] = table_[channel].min_angle;
            entry["max"] = table_[channel].max_angle;
            entry["neutral"] = table_[channel].neutral_angle;
        }
    }
    if (doc.overflowed()) {
        log_utils::logError(TAG, "Calibration document overflow");
        return FILE_IO_ERROR;
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            log_utils::logError(TAG, "Cannot write " + tmp_path);
            return FILE_IO_ERROR;
        }
        serializeJsonPretty(doc, file);
        file.flush();
        if (!file.good()) {
            log_utils::logError(TAG, "Write failed for " + tmp_path);
            file.close();
            std::remove(tmp_path.c_str());
            return FILE_IO_ERROR;
        }
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        log_utils::logError(TAG, "Cannot replace " + path_);
        std::remove(tmp_path.c_str());
        return FILE_IO_ERROR;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        using_defaults_ = false;
    }
    log_utils::logInfo(TAG, "Saved calibration to " + path_);
    return NO_ERROR;
}

ErrorCode CalibrationStore::get(int channel, Calibration &calibration) const {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    std::lock_guard<std::mutex> lock(mutex_);
    calibration = table_[channel];
    return NO_ERROR;
}

ErrorCode CalibrationStore::set(int channel, const Calibration &calibration) {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    if (!calibration.isValid())
        return INVALID_CALIBRATION_ERROR;
    std::lock_guard<std::mutex> lock(mutex_);
    table_[channel] = calibration;
    using_defaults_ = false;
    return NO_ERROR;
}

ErrorCode CalibrationStore::setNeutral(int channel, double neutral_angle) {
    if (!isValidChannel(channel))
        return UNKNOWN_CHANNEL_ERROR;
    std::lock_guard<std::mutex> lock(mutex_);
    Calibration updated = table_[channel];
    updated.neutral_angle = neutral_angle;
    if (!updated.isValid())
        return INVALID_CALIBRATION_ERROR;
    table_[channel] = updated;
    using_defaults_ = false;
    return NO_ERROR;
}

std::vector<Calibration> CalibrationStore::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

void CalibrationStore::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    table_ = defaultTable();
    using_defaults_ = true;
}

bool CalibrationStore::isUsingDefaults() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return using_defaults_;
}

std::string CalibrationStore::getPath() const {
    return path_;
}
