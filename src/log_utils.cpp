#include "log_utils.h"
#include <iostream>
#include <mutex>

namespace {
// Keeps lines from concurrent tick threads from interleaving
std::mutex log_mutex;
} // namespace

namespace log_utils {
void logInfo(const std::string &tag, const std::string &message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << "[" << tag << "] " << message << std::endl;
}

void logWarning(const std::string &tag, const std::string &message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << "WARNING: [" << tag << "] " << message << std::endl;
}

void logError(const std::string &tag, const std::string &message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << "ERROR: [" << tag << "] " << message << std::endl;
}
} // namespace log_utils
