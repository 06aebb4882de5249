#ifndef GESTURE_FACTORY_H
#define GESTURE_FACTORY_H

#include "humanoid_model.h"
#include <string>
#include <vector>

/**
 * @file gesture_factory.h
 * @brief Hand-authored gesture sequences
 *
 * Each factory returns the ordered steps of a gesture. Step targets are
 * absolute joint angles; the motion controller clamps them against the
 * calibration when they are queued. Durations are the time a step is given
 * to reach its pose before the next one starts.
 */

/**
 * @brief Named gesture ready to be queued.
 */
struct GestureSequence {
    std::string name;
    std::vector<MovementStep> steps;
};

// Gesture creation functions
GestureSequence createStandUpGesture(const std::vector<Calibration> &calibration, double step_duration);
GestureSequence createWalkStepGesture(double step_duration);
GestureSequence createWalkGesture(int steps, double step_duration);
GestureSequence createDanceGesture();
GestureSequence createServoTestGesture(const std::vector<Calibration> &calibration, double step_duration);

#endif // GESTURE_FACTORY_H
