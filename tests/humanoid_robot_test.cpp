#include "../include/humanoid_robot.h"
#include "test_stubs.h"
#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <thread>

static bool waitForState(const HumanoidRobot &robot, RobotLifecycleState state) {
    for (int i = 0; i < 5000; ++i) {
        if (robot.getLifecycleState() == state)
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

static double positionOf(const HumanoidRobot &robot, int channel) {
    double angle = -1.0;
    ErrorCode result = robot.getPosition(channel, angle);
    assert(result == NO_ERROR);
    return angle;
}

static void testUninitialized(const RobotParameters &params) {
    std::cout << "Test 1: Commands before initialize" << std::endl;
    SimulatedHardwareAdapter adapter;
    ManualClock clock;
    HumanoidRobot robot(adapter, clock, params);
    assert(robot.getLifecycleState() == LIFECYCLE_UNINITIALIZED);

    double angle = 0.0;
    SensorReading reading;
    ChannelAngleMap targets;
    targets[CHANNEL_HEAD] = 100.0;
    expectError(robot.setServo(CHANNEL_HEAD, 100.0), NOT_INITIALIZED_ERROR, "setServo");
    expectError(robot.setServos(targets), NOT_INITIALIZED_ERROR, "setServos");
    expectError(robot.queueMovement(targets, 0.1), NOT_INITIALIZED_ERROR, "queueMovement");
    expectError(robot.executeQueue(), NOT_INITIALIZED_ERROR, "executeQueue");
    expectError(robot.clearQueue(), NOT_INITIALIZED_ERROR, "clearQueue");
    expectError(robot.dance(), NOT_INITIALIZED_ERROR, "dance");
    expectError(robot.readSensor(SENSOR_PROXIMITY, reading), NOT_INITIALIZED_ERROR, "readSensor");
    expectError(robot.getPosition(CHANNEL_HEAD, angle), NOT_INITIALIZED_ERROR, "getPosition");
    expectError(robot.getPosition(NUM_CHANNELS, angle), UNKNOWN_CHANNEL_ERROR, "getPosition unknown channel");
    expectError(robot.calibrateNeutral(CHANNEL_HEAD, 95.0), NOT_INITIALIZED_ERROR, "calibrateNeutral");

    Calibration calibration;
    expectError(robot.getCalibration(CHANNEL_HEAD, calibration), NO_ERROR, "calibration readable");
    assert(calibration == getDefaultCalibration(CHANNEL_HEAD));

    expectError(robot.shutdown(), NO_ERROR, "shutdown before initialize");
    assert(robot.getLifecycleState() == LIFECYCLE_UNINITIALIZED);
    assert(adapter.getReleaseCount() == 0);
    assert(adapter.getWriteCount() == 0);
}

static void testInitializationFailures(const RobotParameters &params) {
    std::cout << "Test 2: Adapter that fails to open" << std::endl;
    {
        SimulatedHardwareAdapter adapter;
        ManualClock clock;
        HumanoidRobot robot(adapter, clock, params);
        adapter.setFailInitialize(true);
        expectError(robot.initialize(), INITIALIZATION_FAILED_ERROR, "failing open");
        assert(robot.getLifecycleState() == LIFECYCLE_SHUTDOWN);
        expectError(robot.setServo(CHANNEL_HEAD, 100.0), NOT_INITIALIZED_ERROR, "setServo after failure");

        adapter.clearFaults();
        expectError(robot.initialize(), NO_ERROR, "retry");
        assert(robot.getLifecycleState() == LIFECYCLE_READY);
    }

    std::cout << "Test 3: Neutral pose write failure" << std::endl;
    {
        SimulatedHardwareAdapter adapter;
        ManualClock clock;
        HumanoidRobot robot(adapter, clock, params);
        adapter.setFailingChannel(CHANNEL_HIP_RIGHT);
        expectError(robot.initialize(), INITIALIZATION_FAILED_ERROR, "failing neutral");
        assert(robot.getLifecycleState() == LIFECYCLE_SHUTDOWN);
        assert(!adapter.isInitialized());
        assert(adapter.getReleaseCount() == 1);
        expectError(robot.setServo(CHANNEL_HEAD, 100.0), NOT_INITIALIZED_ERROR, "setServo after failure");
    }
}

static void testInitialize(const RobotParameters &params) {
    std::cout << "Test 4: Initialize moves every joint to neutral" << std::endl;
    SimulatedHardwareAdapter adapter;
    ManualClock clock;
    HumanoidRobot robot(adapter, clock, params);
    expectError(robot.initialize(), NO_ERROR, "initialize");
    assert(robot.getLifecycleState() == LIFECYCLE_READY);
    assert(adapter.getWriteCount() == NUM_CHANNELS);
    for (int channel = 0; channel < NUM_CHANNELS; ++channel)
        assert(adapter.getDuty(channel) == 307);

    RobotInfo info = robot.getRobotInfo();
    assert(info.state == LIFECYCLE_READY);
    assert(info.adapter_name == "simulated");
    assert(info.simulated);
    assert(info.using_default_calibration);
    assert(info.queue_length == 0);

    ChannelAngleMap angles;
    expectError(robot.getAllPositions(angles), NO_ERROR, "getAllPositions");
    assert(angles.size() == static_cast<size_t>(NUM_CHANNELS));

    expectError(robot.initialize(), NO_ERROR, "initialize again");
    assert(adapter.getWriteCount() == NUM_CHANNELS);

    std::cout << "Test 5: Sensors through the robot" << std::endl;
    SensorReading reading;
    expectError(robot.readSensor(SENSOR_PROXIMITY, reading), NO_ERROR, "readSensor");
    expectNear(reading.proximity.distance_cm, 50.0, 1e-9, "distance");
    clock.advance(0.05);
    double age = 0.0;
    expectError(robot.getLastSensorReading(SENSOR_PROXIMITY, reading, &age), NO_ERROR, "last reading");
    expectNear(age, 0.05, 1e-9, "age");
    expectError(robot.getLastSensorReading(SENSOR_MOTION, reading), SENSOR_UNAVAILABLE_ERROR, "motion never read");
    adapter.setSensorFailure(SENSOR_MOTION, true);
    expectError(robot.readSensor(SENSOR_MOTION, reading), SENSOR_UNAVAILABLE_ERROR, "failing motion sensor");
    assert(robot.getLifecycleState() == LIFECYCLE_READY);

    std::cout << "Test 6: Shutdown releases the hardware once" << std::endl;
    expectError(robot.shutdown(), NO_ERROR, "shutdown");
    assert(robot.getLifecycleState() == LIFECYCLE_SHUTDOWN);
    assert(adapter.getReleaseCount() == 1);
    assert(!adapter.isInitialized());
    expectError(robot.setServo(CHANNEL_HEAD, 100.0), NOT_INITIALIZED_ERROR, "setServo after shutdown");
    expectError(robot.shutdown(), NO_ERROR, "second shutdown");
    assert(adapter.getReleaseCount() == 1);

    expectError(robot.initialize(), NO_ERROR, "initialize after shutdown");
    assert(robot.getLifecycleState() == LIFECYCLE_READY);
    expectError(robot.setServo(CHANNEL_HEAD, 100.0), NO_ERROR, "setServo after restart");
}

static void testCalibration(const std::string &path) {
    std::cout << "Test 7: Calibration file applied at initialize" << std::endl;
    writeTextFile(path, "{\"version\":1,\"channels\":{\"0\":{\"min\":50,\"max\":140,\"neutral\":100}}}");
    RobotParameters params = createTestParameters(path);
    SimulatedHardwareAdapter adapter;
    ManualClock clock;
    HumanoidRobot robot(adapter, clock, params);
    expectError(robot.initialize(), NO_ERROR, "initialize");
    assert(!robot.getRobotInfo().using_default_calibration);
    assert(adapter.getDuty(CHANNEL_HEAD) == 319);

    ServoState state;
    expectError(robot.getServoState(CHANNEL_HEAD, state), NO_ERROR, "servo state");
    assert(state.channel == CHANNEL_HEAD);
    assert(state.name == "HEAD");
    expectNear(state.position, 100.0, 1e-9, "position");
    expectNear(state.min_angle, 50.0, 1e-9, "min");
    expectNear(state.max_angle, 140.0, 1e-9, "max");
    expectNear(state.neutral_angle, 100.0, 1e-9, "neutral");
    assert(!state.moving);
    expectError(robot.getServoState(NUM_CHANNELS, state), UNKNOWN_CHANNEL_ERROR, "unknown channel");

    std::cout << "Test 8: Neutral calibration is saved" << std::endl;
    expectError(robot.calibrateNeutral(CHANNEL_HEAD, 95.0), NO_ERROR, "calibrateNeutral");
    expectNear(positionOf(robot, CHANNEL_HEAD), 95.0, 1e-9, "head moved to new neutral");
    CalibrationStore reloaded(path);
    expectError(reloaded.load(), NO_ERROR, "reload saved calibration");
    Calibration head;
    expectError(reloaded.get(CHANNEL_HEAD, head), NO_ERROR, "saved head");
    assert(head == Calibration(50.0, 140.0, 95.0));

    expectError(robot.calibrateNeutral(CHANNEL_HEAD, 145.0), INVALID_CALIBRATION_ERROR, "neutral past max");
    expectError(robot.calibrateNeutral(NUM_CHANNELS, 90.0), UNKNOWN_CHANNEL_ERROR, "unknown channel");
    expectError(robot.calibrateNeutral(CHANNEL_HEAD, std::numeric_limits<double>::quiet_NaN()), PARAMETER_ERROR,
                "NaN neutral");
    expectNear(positionOf(robot, CHANNEL_HEAD), 95.0, 1e-9, "rejected calibration did not move");

    std::cout << "Test 9: Narrowed limits pull the joint back inside" << std::endl;
    expectError(robot.setServo(CHANNEL_KNEE_LEFT, 110.0, 0.0), NO_ERROR, "bend knee");
    expectError(robot.setCalibration(CHANNEL_KNEE_LEFT, Calibration(60.0, 100.0, 80.0)), NO_ERROR, "narrow knee");
    expectNear(positionOf(robot, CHANNEL_KNEE_LEFT), 100.0, 1e-9, "knee clamped");
    expectError(robot.setCalibration(CHANNEL_KNEE_LEFT, Calibration(100.0, 60.0, 80.0)), INVALID_CALIBRATION_ERROR,
                "inverted limits");
    expectError(robot.setServo(CHANNEL_KNEE_LEFT, 120.0, 0.0), NO_ERROR, "move past new max");
    expectNear(positionOf(robot, CHANNEL_KNEE_LEFT), 100.0, 1e-9, "new limit enforced");
    expectError(robot.saveCalibration(), NO_ERROR, "saveCalibration");
}

static void testBusyAndCancel(const RobotParameters &params) {
    std::cout << "Test 10: Moving state, busy channel and cancel" << std::endl;
    SimulatedHardwareAdapter adapter;
    GatedClock clock;
    HumanoidRobot robot(adapter, clock, params);
    expectError(robot.initialize(), NO_ERROR, "initialize");

    ErrorCode owner = NO_ERROR;
    std::thread mover([&] { owner = robot.setServo(CHANNEL_HEAD, 120.0, 1.0); });
    bool parked = clock.waitForSleepers(1);
    assert(parked);
    assert(robot.getLifecycleState() == LIFECYCLE_MOVING);
    expectError(robot.setServo(CHANNEL_HEAD, 60.0), CHANNEL_BUSY_ERROR, "same channel");
    ServoState state;
    expectError(robot.getServoState(CHANNEL_HEAD, state), NO_ERROR, "servo state while moving");
    assert(state.moving);
    expectNear(state.target, 120.0, 1e-9, "target while moving");

    robot.cancelMovements();
    clock.openGate();
    mover.join();
    expectError(owner, MOVEMENT_CANCELLED_ERROR, "cancelled owner");
    expectNear(positionOf(robot, CHANNEL_HEAD), 90.0, 1e-9, "no tick written");
    assert(robot.getLifecycleState() == LIFECYCLE_READY);
    expectError(robot.setServo(CHANNEL_HEAD, 100.0, 0.0), NO_ERROR, "channel free again");
}

static void testConcurrentDrain(const RobotParameters &params) {
    std::cout << "Test 11: Second drain and gestures while draining" << std::endl;
    SimulatedHardwareAdapter adapter;
    GatedClock clock;
    HumanoidRobot robot(adapter, clock, params);
    expectError(robot.initialize(), NO_ERROR, "initialize");

    ChannelAngleMap head;
    head[CHANNEL_HEAD] = 100.0;
    expectError(robot.queueMovement(head, 0.2), NO_ERROR, "queue");
    ErrorCode drain = NO_ERROR;
    std::thread drainer([&] { drain = robot.executeQueue(); });
    bool parked = clock.waitForSleepers(1);
    assert(parked);
    assert(robot.getLifecycleState() == LIFECYCLE_MOVING);
    expectError(robot.executeQueue(), CHANNEL_BUSY_ERROR, "second drain");

    // The gesture's steps join the running drain
    expectError(robot.standUp(), CHANNEL_BUSY_ERROR, "gesture during drain");
    assert(robot.getRobotInfo().queue_length == 5);

    clock.openGate();
    drainer.join();
    expectError(drain, NO_ERROR, "drain");
    assert(robot.getRobotInfo().queue_length == 0);
    expectNear(positionOf(robot, CHANNEL_HEAD), 90.0, 1e-9, "stand up neutral step ran");
    expectNear(positionOf(robot, CHANNEL_KNEE_LEFT), 90.0, 1e-9, "stand up finished");
    expectError(robot.clearQueue(), NO_ERROR, "clearQueue");
}

static void testShutdownDuringMove(const RobotParameters &params) {
    std::cout << "Test 12: Shutdown cancels an in-flight move" << std::endl;
    SimulatedHardwareAdapter adapter;
    GatedClock clock;
    HumanoidRobot robot(adapter, clock, params);
    expectError(robot.initialize(), NO_ERROR, "initialize");

    ErrorCode owner = NO_ERROR;
    ErrorCode stopped = NO_ERROR;
    std::thread mover([&] { owner = robot.setServo(CHANNEL_HEAD, 120.0, 1.0); });
    bool parked = clock.waitForSleepers(1);
    assert(parked);
    std::thread stopper([&] { stopped = robot.shutdown(); });
    bool stopping = waitForState(robot, LIFECYCLE_SHUTTING_DOWN);
    assert(stopping);
    clock.openGate();
    mover.join();
    stopper.join();

    expectError(owner, MOVEMENT_CANCELLED_ERROR, "move cancelled by shutdown");
    expectError(stopped, NO_ERROR, "shutdown");
    assert(robot.getLifecycleState() == LIFECYCLE_SHUTDOWN);
    assert(adapter.getReleaseCount() == 1);
}

static void testDisjointMoves(const RobotParameters &params) {
    std::cout << "Test 13: Disjoint channels move concurrently" << std::endl;
    SimulatedHardwareAdapter adapter;
    GatedClock clock;
    {
        HumanoidRobot robot(adapter, clock, params);
        expectError(robot.initialize(), NO_ERROR, "initialize");

        ErrorCode head = NO_ERROR;
        ErrorCode knee = NO_ERROR;
        std::thread first([&] { head = robot.setServo(CHANNEL_HEAD, 120.0, 1.0); });
        std::thread second([&] { knee = robot.setServo(CHANNEL_KNEE_LEFT, 60.0, 1.0); });
        // Both moves are parked mid-trajectory at the same time
        bool parked = clock.waitForSleepers(2);
        assert(parked);
        ServoState head_state;
        ServoState knee_state;
        expectError(robot.getServoState(CHANNEL_HEAD, head_state), NO_ERROR, "head state");
        expectError(robot.getServoState(CHANNEL_KNEE_LEFT, knee_state), NO_ERROR, "knee state");
        assert(head_state.moving && knee_state.moving);
        assert(robot.getLifecycleState() == LIFECYCLE_MOVING);
        // The head move picks up narrower limits on its next tick
        expectError(robot.setCalibration(CHANNEL_HEAD, Calibration(45.0, 100.0, 90.0)), NO_ERROR,
                    "narrow a moving joint");
        clock.openGate();
        first.join();
        second.join();
        expectError(head, NO_ERROR, "head move");
        expectError(knee, NO_ERROR, "knee move");
        expectNear(positionOf(robot, CHANNEL_HEAD), 100.0, 1e-9, "head stopped at the new max");
        expectNear(positionOf(robot, CHANNEL_KNEE_LEFT), 60.0, 1e-9, "knee");
        assert(adapter.getDuty(CHANNEL_HEAD) == 319);
    }
    // Destruction shuts the robot down
    assert(adapter.getReleaseCount() == 1);
}

static void testSavedDefaults(const std::string &path) {
    std::cout << "Test 14: Saving a calibration leaves the defaults" << std::endl;
    std::remove(path.c_str());
    RobotParameters params = createTestParameters(path);
    SimulatedHardwareAdapter adapter;
    ManualClock clock;
    HumanoidRobot robot(adapter, clock, params);
    expectError(robot.initialize(), NO_ERROR, "initialize");
    assert(robot.getRobotInfo().using_default_calibration);
    expectError(robot.calibrateNeutral(CHANNEL_HEAD, 95.0), NO_ERROR, "calibrateNeutral");
    assert(!robot.getRobotInfo().using_default_calibration);
    assert(fileExists(path));
    std::remove(path.c_str());
}

static void testSimulatedWriteLog(const RobotParameters &params) {
    std::cout << "Test 15: Simulated adapter keeps a bounded write log" << std::endl;
    std::unique_ptr<IHardwareAdapter> owned = createHardwareAdapter(params);
    SimulatedHardwareAdapter *adapter = dynamic_cast<SimulatedHardwareAdapter *>(owned.get());
    assert(adapter != nullptr);
    bool opened = adapter->initialize();
    assert(opened);
    const int total = SIM_WRITE_LOG_CAPACITY + 100;
    for (int i = 0; i < total; ++i) {
        bool written = adapter->writePulse(i % NUM_CHANNELS, 205 + i % 200);
        assert(written);
    }
    std::vector<SimulatedHardwareAdapter::WriteRecord> log = adapter->getWriteLog();
    assert(log.size() == static_cast<size_t>(SIM_WRITE_LOG_CAPACITY));
    assert(adapter->getWriteCount() == total);
    // Oldest records were dropped first
    assert(log.front().channel == 100 % NUM_CHANNELS && log.front().duty == 305);
    assert(log.back().channel == (total - 1) % NUM_CHANNELS);

    adapter->setWriteLogCapacity(3);
    assert(adapter->getWriteLog().size() == 3);
    adapter->setWriteLogCapacity(0);
    assert(adapter->getWriteLog().empty());
    bool written = adapter->writePulse(CHANNEL_HEAD, 307);
    assert(written);
    assert(adapter->getWriteLog().empty());
    assert(adapter->getDuty(CHANNEL_HEAD) == 307);
    adapter->release();
}

int main() {
    const std::string missing = tempFilePath("robot_missing.json");
    const std::string calibration_path = tempFilePath("robot_calibration.json");
    std::remove(missing.c_str());
    std::remove(calibration_path.c_str());
    const RobotParameters params = createTestParameters(missing);

    testUninitialized(params);
    testInitializationFailures(params);
    testInitialize(params);
    testCalibration(calibration_path);
    testBusyAndCancel(params);
    testConcurrentDrain(params);
    testShutdownDuringMove(params);
    testDisjointMoves(params);
    testSavedDefaults(tempFilePath("robot_saved.json"));
    testSimulatedWriteLog(params);

    std::remove(calibration_path.c_str());
    std::remove((calibration_path + ".tmp").c_str());
    std::cout << "humanoid_robot_test executed successfully" << std::endl;
    return 0;
}
