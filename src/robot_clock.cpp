#include "robot_clock.h"
#include <thread>

SteadyClock::SteadyClock() : epoch_(std::chrono::steady_clock::now()) {}

double SteadyClock::now() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - epoch_;
    return elapsed.count();
}

void SteadyClock::sleepUntil(double time) {
    auto deadline = epoch_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                 std::chrono::duration<double>(time));
    std::this_thread::sleep_until(deadline);
}
