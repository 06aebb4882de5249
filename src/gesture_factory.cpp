#include "gesture_factory.h"
#include "humamotion_constants.h"

namespace {

MovementStep makeStep(const ChannelAngleMap &targets, double duration) {
    MovementStep step;
    step.targets = targets;
    step.duration = duration;
    return step;
}

// Dance pose timings (seconds)
const double DANCE_POSE_HOLD = 1.0;
const double DANCE_ROCK_DURATION = 0.4;
const double DANCE_BOB_DURATION = 0.3;
const double DANCE_TWIST_DURATION = 0.5;
const int DANCE_ROCK_REPEATS = 3;
const int DANCE_BOB_REPEATS = 2;
const int DANCE_TWIST_REPEATS = 2;

} // namespace

GestureSequence createStandUpGesture(const std::vector<Calibration> &calibration, double step_duration) {
    GestureSequence gesture;
    gesture.name = "stand_up";

    // Center every joint first
    ChannelAngleMap neutral;
    for (int channel = 0; channel < NUM_CHANNELS && channel < static_cast<int>(calibration.size()); ++channel)
        neutral[channel] = calibration[channel].neutral_angle;
    gesture.steps.push_back(makeStep(neutral, DEFAULT_NEUTRAL_POSE_DURATION));

    // Bend knees, lean forward, straighten knees, center hips
    gesture.steps.push_back(makeStep({{CHANNEL_KNEE_RIGHT, 120.0}, {CHANNEL_KNEE_LEFT, 120.0}}, step_duration));
    gesture.steps.push_back(makeStep({{CHANNEL_HIP_RIGHT, 110.0}, {CHANNEL_HIP_LEFT, 110.0}}, step_duration));
    gesture.steps.push_back(makeStep({{CHANNEL_KNEE_RIGHT, 90.0}, {CHANNEL_KNEE_LEFT, 90.0}}, step_duration));
    gesture.steps.push_back(makeStep({{CHANNEL_HIP_RIGHT, 90.0}, {CHANNEL_HIP_LEFT, 90.0}}, step_duration));
    return gesture;
}

GestureSequence createWalkStepGesture(double step_duration) {
    GestureSequence gesture;
    gesture.name = "walk_step";
    std::vector<MovementStep> &s = gesture.steps;

    // Weight onto the right leg, swing the left
    s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 100.0}, {CHANNEL_HIP_LEFT, 100.0}}, step_duration));
    s.push_back(makeStep({{CHANNEL_KNEE_LEFT, 120.0}}, step_duration));
    s.push_back(makeStep({{CHANNEL_HIP_LEFT, 70.0}}, step_duration));
    s.push_back(makeStep({{CHANNEL_KNEE_LEFT, 90.0}}, step_duration));

    // Weight onto the left leg, swing the right
    s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 80.0}, {CHANNEL_HIP_LEFT, 80.0}}, step_duration));
    s.push_back(makeStep({{CHANNEL_KNEE_RIGHT, 120.0}}, step_duration));
    s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 110.0}}, step_duration));
    s.push_back(makeStep({{CHANNEL_KNEE_RIGHT, 90.0}}, step_duration));

    s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 90.0}, {CHANNEL_HIP_LEFT, 90.0}}, step_duration));
    return gesture;
}

GestureSequence createWalkGesture(int steps, double step_duration) {
    GestureSequence gesture;
    gesture.name = "walk_forward";
    const GestureSequence single = createWalkStepGesture(step_duration);
    for (int i = 0; i < steps; ++i)
        gesture.steps.insert(gesture.steps.end(), single.steps.begin(), single.steps.end());
    return gesture;
}

GestureSequence createDanceGesture() {
    GestureSequence gesture;
    gesture.name = "dance";
    std::vector<MovementStep> &s = gesture.steps;

    const ChannelAngleMap starting_pose = {{CHANNEL_HEAD, 90.0},
                                           {CHANNEL_SHOULDER_RIGHT, 60.0},
                                           {CHANNEL_SHOULDER_LEFT, 120.0},
                                           {CHANNEL_ELBOW_RIGHT, 120.0},
                                           {CHANNEL_ELBOW_LEFT, 60.0}};
    s.push_back(makeStep(starting_pose, DANCE_POSE_HOLD));

    // Side to side rocking
    for (int i = 0; i < DANCE_ROCK_REPEATS; ++i) {
        s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 70.0},
                              {CHANNEL_HIP_LEFT, 110.0},
                              {CHANNEL_SHOULDER_RIGHT, 80.0},
                              {CHANNEL_SHOULDER_LEFT, 100.0}},
                             DANCE_ROCK_DURATION));
        s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 110.0},
                              {CHANNEL_HIP_LEFT, 70.0},
                              {CHANNEL_SHOULDER_RIGHT, 40.0},
                              {CHANNEL_SHOULDER_LEFT, 140.0}},
                             DANCE_ROCK_DURATION));
    }

    // Head bob with arm pumps
    for (int i = 0; i < DANCE_BOB_REPEATS; ++i) {
        s.push_back(makeStep({{CHANNEL_HEAD, 70.0}, {CHANNEL_ELBOW_RIGHT, 150.0}, {CHANNEL_ELBOW_LEFT, 30.0}},
                             DANCE_BOB_DURATION));
        s.push_back(makeStep({{CHANNEL_HEAD, 110.0}, {CHANNEL_ELBOW_RIGHT, 90.0}, {CHANNEL_ELBOW_LEFT, 90.0}},
                             DANCE_BOB_DURATION));
    }

    // Twist
    for (int i = 0; i < DANCE_TWIST_REPEATS; ++i) {
        s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 60.0},
                              {CHANNEL_HIP_LEFT, 120.0},
                              {CHANNEL_SHOULDER_RIGHT, 40.0},
                              {CHANNEL_SHOULDER_LEFT, 140.0},
                              {CHANNEL_HEAD, 60.0}},
                             DANCE_TWIST_DURATION));
        s.push_back(makeStep({{CHANNEL_HIP_RIGHT, 120.0},
                              {CHANNEL_HIP_LEFT, 60.0},
                              {CHANNEL_SHOULDER_RIGHT, 140.0},
                              {CHANNEL_SHOULDER_LEFT, 40.0},
                              {CHANNEL_HEAD, 120.0}},
                             DANCE_TWIST_DURATION));
    }

    ChannelAngleMap final_pose = starting_pose;
    final_pose[CHANNEL_HIP_RIGHT] = 90.0;
    final_pose[CHANNEL_HIP_LEFT] = 90.0;
    s.push_back(makeStep(final_pose, DANCE_POSE_HOLD));
    return gesture;
}

GestureSequence createServoTestGesture(const std::vector<Calibration> &calibration, double step_duration) {
    GestureSequence gesture;
    gesture.name = "servo_test";
    for (int channel = 0; channel < NUM_CHANNELS && channel < static_cast<int>(calibration.size()); ++channel) {
        const Calibration &c = calibration[channel];
        gesture.steps.push_back(makeStep({{channel, c.min_angle}}, step_duration));
        gesture.steps.push_back(makeStep({{channel, c.max_angle}}, step_duration));
        gesture.steps.push_back(makeStep({{channel, c.neutral_angle}}, step_duration));
    }
    return gesture;
}
