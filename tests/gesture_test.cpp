#include "../include/motion_controller.h"
#include "../src/gesture_factory.h"
#include "test_stubs.h"
#include <algorithm>
#include <cassert>
#include <iostream>

static std::vector<Calibration> defaultTable() {
    std::vector<Calibration> table;
    for (int channel = 0; channel < NUM_CHANNELS; ++channel)
        table.push_back(getDefaultCalibration(channel));
    return table;
}

static bool wroteDuty(const std::vector<SimulatedHardwareAdapter::WriteRecord> &log, int channel, int duty) {
    return std::any_of(log.begin(), log.end(), [&](const SimulatedHardwareAdapter::WriteRecord &record) {
        return record.channel == channel && record.duty == duty;
    });
}

struct GestureRig {
    SimulatedHardwareAdapter adapter;
    ManualClock clock;
    std::mutex hardware_mutex;
    RobotParameters params;
    CalibrationStore calibration;
    MotionController controller;

    GestureRig()
        : params(createTestParameters(tempFilePath("gesture_missing.json"))), calibration(params.calibration_file),
          controller(adapter, clock, calibration, hardware_mutex, params) {
        bool opened = adapter.initialize();
        assert(opened);
        controller.enable();
        ErrorCode result = controller.moveAllToNeutral();
        assert(result == NO_ERROR);
        adapter.clearWriteLog();
    }

    double position(int channel) {
        double angle = -1.0;
        ErrorCode result = controller.getPosition(channel, angle);
        assert(result == NO_ERROR);
        return angle;
    }
};

int main() {
    std::cout << "Test 1: Gesture factories" << std::endl;
    const std::vector<Calibration> table = defaultTable();
    GestureSequence stand = createStandUpGesture(table, 0.5);
    assert(stand.name == "stand_up");
    assert(stand.steps.size() == 5);
    assert(stand.steps[0].targets.size() == static_cast<size_t>(NUM_CHANNELS));
    expectNear(stand.steps[0].duration, 1.0, 1e-12, "neutral step duration");
    expectNear(stand.steps[1].targets[CHANNEL_KNEE_LEFT], 120.0, 1e-12, "knee bend");

    GestureSequence step = createWalkStepGesture(0.5);
    assert(step.steps.size() == 9);
    expectNear(step.steps[2].targets[CHANNEL_HIP_LEFT], 70.0, 1e-12, "left swing");
    assert(createWalkGesture(3, 0.5).steps.size() == 27);
    assert(createWalkGesture(0, 0.5).steps.empty());

    GestureSequence dance = createDanceGesture();
    assert(dance.steps.size() == 16);
    expectNear(dance.steps[1].duration, 0.4, 1e-12, "rock duration");
    expectNear(dance.steps[7].duration, 0.3, 1e-12, "bob duration");
    expectNear(dance.steps[11].duration, 0.5, 1e-12, "twist duration");
    assert(dance.steps.back().targets.size() == 7);

    GestureSequence sweep = createServoTestGesture(table, 0.25);
    assert(sweep.steps.size() == 39);
    expectNear(sweep.steps[0].targets[CHANNEL_HEAD], 45.0, 1e-12, "head min");
    expectNear(sweep.steps[1].targets[CHANNEL_HEAD], 135.0, 1e-12, "head max");
    expectNear(sweep.steps[2].targets[CHANNEL_HEAD], 90.0, 1e-12, "head neutral");
    expectNear(sweep.steps[38].targets[CHANNEL_WRIST_LEFT], 90.0, 1e-12, "last step");

    std::cout << "Test 2: Stand up" << std::endl;
    {
        GestureRig rig;
        expectError(rig.controller.standUp(), NO_ERROR, "standUp");
        expectNear(rig.clock.now(), 3.0, 1e-6, "stand up time");
        assert(wroteDuty(rig.adapter.getWriteLog(), CHANNEL_KNEE_RIGHT, rig.controller.angleToDuty(120.0)));
        expectNear(rig.position(CHANNEL_KNEE_RIGHT), 90.0, 1e-9, "knees straight");
        expectNear(rig.position(CHANNEL_HIP_LEFT), 90.0, 1e-9, "hips centered");
        assert(rig.controller.getQueueLength() == 0);
        assert(!rig.controller.isMoving());
    }

    std::cout << "Test 3: Dance ends in its final pose" << std::endl;
    {
        GestureRig rig;
        expectError(rig.controller.dance(), NO_ERROR, "dance");
        expectNear(rig.clock.now(), 7.6, 1e-6, "dance time");
        expectNear(rig.position(CHANNEL_HEAD), 90.0, 1e-9, "head");
        expectNear(rig.position(CHANNEL_SHOULDER_RIGHT), 60.0, 1e-9, "right shoulder");
        expectNear(rig.position(CHANNEL_SHOULDER_LEFT), 120.0, 1e-9, "left shoulder");
        expectNear(rig.position(CHANNEL_ELBOW_RIGHT), 120.0, 1e-9, "right elbow");
        expectNear(rig.position(CHANNEL_ELBOW_LEFT), 60.0, 1e-9, "left elbow");
        expectNear(rig.position(CHANNEL_HIP_RIGHT), 90.0, 1e-9, "right hip");
        assert(wroteDuty(rig.adapter.getWriteLog(), CHANNEL_ELBOW_LEFT, rig.controller.angleToDuty(30.0)));
    }

    std::cout << "Test 4: Walk forward" << std::endl;
    {
        GestureRig rig;
        expectError(rig.controller.walkForward(2), NO_ERROR, "walkForward");
        expectNear(rig.clock.now(), 9.0, 1e-6, "walk time");
        std::vector<SimulatedHardwareAdapter::WriteRecord> log = rig.adapter.getWriteLog();
        assert(wroteDuty(log, CHANNEL_HIP_LEFT, rig.controller.angleToDuty(70.0)));
        assert(wroteDuty(log, CHANNEL_HIP_RIGHT, rig.controller.angleToDuty(110.0)));
        expectNear(rig.position(CHANNEL_HIP_RIGHT), 90.0, 1e-9, "hips centered");
        expectNear(rig.position(CHANNEL_KNEE_LEFT), 90.0, 1e-9, "knees straight");
    }

    std::cout << "Test 5: Servo test sweeps every channel" << std::endl;
    {
        GestureRig rig;
        expectError(rig.controller.runServoTest(), NO_ERROR, "runServoTest");
        std::vector<SimulatedHardwareAdapter::WriteRecord> log = rig.adapter.getWriteLog();
        assert(wroteDuty(log, CHANNEL_HEAD, 256));
        assert(wroteDuty(log, CHANNEL_HEAD, 358));
        for (int channel = 0; channel < NUM_CHANNELS; ++channel) {
            Calibration calibration = getDefaultCalibration(channel);
            assert(wroteDuty(log, channel, rig.controller.angleToDuty(calibration.min_angle)));
            assert(wroteDuty(log, channel, rig.controller.angleToDuty(calibration.max_angle)));
            expectNear(rig.position(channel), 90.0, 1e-9, "back at neutral");
        }
        expectNear(rig.clock.now(), 19.5, 1e-6, "servo test time");
    }

    std::cout << "Test 6: Pre-queued steps run before the gesture" << std::endl;
    {
        GestureRig rig;
        ChannelAngleMap head;
        head[CHANNEL_HEAD] = 100.0;
        expectError(rig.controller.queueMovement(head, 0.2), NO_ERROR, "queue");
        expectError(rig.controller.standUp(), NO_ERROR, "standUp after queued step");
        std::vector<SimulatedHardwareAdapter::WriteRecord> log = rig.adapter.getWriteLog();
        assert(!log.empty() && log.front().channel == CHANNEL_HEAD);
        assert(wroteDuty(log, CHANNEL_HEAD, rig.controller.angleToDuty(100.0)));
        expectNear(rig.position(CHANNEL_HEAD), 90.0, 1e-9, "neutral step returned the head");
        expectNear(rig.clock.now(), 3.2, 1e-6, "queued step plus stand up");
    }

    std::cout << "Test 7: Failing gesture discards its remaining steps" << std::endl;
    {
        GestureRig rig;
        rig.adapter.setFailingChannel(CHANNEL_HIP_RIGHT);
        expectError(rig.controller.standUp(), QUEUE_STEP_FAILED_ERROR, "standUp with broken hip");
        MotionController::QueueFailure failure = rig.controller.getLastQueueFailure();
        assert(failure.cause == HARDWARE_WRITE_FAILED_ERROR);
        assert(failure.handle == 3);
        assert(rig.controller.getQueueLength() == 0);
        expectNear(rig.position(CHANNEL_KNEE_LEFT), 120.0, 1e-9, "knees left bent");
    }

    std::cout << "gesture_test executed successfully" << std::endl;
    return 0;
}
