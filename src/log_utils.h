#ifndef LOG_UTILS_H
#define LOG_UTILS_H

#include <string>

/**
 * @file log_utils.h
 * @brief Tagged console logging shared by the HumaMotion components.
 *
 * Lines look like "ERROR: [MotionController] Hardware write failed on KNEE_LEFT".
 * Debug lines are compiled in only when DEBUG_LOGGING is defined.
 */
namespace log_utils {
void logInfo(const std::string &tag, const std::string &message);
void logWarning(const std::string &tag, const std::string &message);
void logError(const std::string &tag, const std::string &message);

inline void logDebug(const std::string &tag, const std::string &message) {
#ifdef DEBUG_LOGGING
    logInfo(tag, "DEBUG: " + message);
#else
    (void)tag;
    (void)message;
#endif
}
} // namespace log_utils

#endif // LOG_UTILS_H
