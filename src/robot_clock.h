#ifndef ROBOT_CLOCK_H
#define ROBOT_CLOCK_H

#include "humanoid_model.h"
#include <chrono>

/**
 * @brief Production clock backed by std::chrono::steady_clock.
 *
 * now() counts seconds since construction so tick times stay small and
 * precise in double form.
 */
class SteadyClock : public IClock {
  public:
    SteadyClock();

    double now() override;
    void sleepUntil(double time) override;

  private:
    std::chrono::steady_clock::time_point epoch_;
};

#endif // ROBOT_CLOCK_H
