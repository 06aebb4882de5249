#include "HumaMotion.h"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void printUsage(const char *program) {
    std::cout << "Usage: " << program << " [--simulate] [--config <file>] <command> [args]\n"
              << "Commands:\n"
              << "  status                  Robot info and all servo states\n"
              << "  stand                   Stand-up gesture\n"
              << "  walk <steps>            Walk forward\n"
              << "  dance                   Dance routine\n"
              << "  test                    Sweep every servo min -> max -> neutral\n"
              << "  servo <ch> <deg> [spd]  Move one servo\n"
              << "  calibrate <ch> <deg>    Adopt an angle as neutral and save\n"
              << "  sensors                 Read proximity and motion sensors\n";
}

void printStatus(const HumanoidRobot &robot) {
    RobotInfo info = robot.getRobotInfo();
    std::cout << "State: " << getLifecycleStateName(info.state) << "\n"
              << "Adapter: " << info.adapter_name << (info.simulated ? " (simulated)" : "") << "\n"
              << "Calibration: " << (info.using_default_calibration ? "defaults" : "file") << "\n"
              << "Queued steps: " << info.queue_length << "\n\n";

    std::cout << std::fixed << std::setprecision(1);
    for (int channel = 0; channel < NUM_CHANNELS; ++channel) {
        ServoState state;
        if (robot.getServoState(channel, state) != NO_ERROR)
            continue;
        std::cout << std::setw(2) << channel << " " << std::left << std::setw(15) << state.name << std::right
                  << " pos " << std::setw(6) << state.position << "  range [" << state.min_angle << ", "
                  << state.max_angle << "]  neutral " << state.neutral_angle << "\n";
    }
}

ErrorCode printSensors(HumanoidRobot &robot) {
    SensorReading reading;
    ErrorCode result = robot.readSensor(SENSOR_PROXIMITY, reading);
    if (result == NO_ERROR)
        std::cout << "Distance: " << reading.proximity.distance_cm << " cm, light "
                  << reading.proximity.ambient_light << "\n";
    else
        std::cout << "Proximity: " << getErrorMessage(result) << "\n";

    result = robot.readSensor(SENSOR_MOTION, reading);
    if (result == NO_ERROR) {
        const MotionData &m = reading.motion;
        std::cout << "Accel (g): " << m.acceleration_g.transpose() << "\n"
                  << "Gyro (deg/s): " << m.angular_velocity_dps.transpose() << "\n"
                  << "Roll " << m.roll_deg << " Pitch " << m.pitch_deg << " Temp " << m.temperature_c << " C\n";
    } else {
        std::cout << "Motion: " << getErrorMessage(result) << "\n";
    }
    return result;
}

ErrorCode runCommand(HumanoidRobot &robot, const std::vector<std::string> &args) {
    const std::string &command = args[0];
    if (command == "status") {
        printStatus(robot);
        return NO_ERROR;
    }
    if (command == "stand")
        return robot.standUp();
    if (command == "walk" && args.size() >= 2)
        return robot.walkForward(std::atoi(args[1].c_str()));
    if (command == "dance")
        return robot.dance();
    if (command == "test")
        return robot.runServoTest();
    if (command == "servo" && args.size() >= 3) {
        int channel = std::atoi(args[1].c_str());
        double angle = std::atof(args[2].c_str());
        if (args.size() >= 4)
            return robot.setServo(channel, angle, std::atof(args[3].c_str()));
        return robot.setServo(channel, angle);
    }
    if (command == "calibrate" && args.size() >= 3)
        return robot.calibrateNeutral(std::atoi(args[1].c_str()), std::atof(args[2].c_str()));
    if (command == "sensors")
        return printSensors(robot);
    return PARAMETER_ERROR;
}

} // namespace

int main(int argc, char **argv) {
    RobotParameters params = createDefaultParameters();
    std::string config_path;
    bool force_simulation = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--simulate") {
            force_simulation = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty())
        args.push_back("status");

    if (!config_path.empty()) {
        ErrorCode result = loadParametersFromFile(config_path, params);
        if (result != NO_ERROR) {
            std::cerr << "Config error: " << getErrorMessage(result) << std::endl;
            return 1;
        }
    }
    if (force_simulation)
        params.use_simulation = true;

    std::unique_ptr<IHardwareAdapter> adapter = createHardwareAdapter(params);
    SteadyClock clock;
    HumanoidRobot robot(*adapter, clock, params);

    ErrorCode result = robot.initialize();
    if (result != NO_ERROR) {
        std::cerr << "Initialization failed: " << getErrorMessage(result) << std::endl;
        return 1;
    }

    result = runCommand(robot, args);
    if (result == PARAMETER_ERROR && args[0] != "walk" && args[0] != "servo")
        printUsage(argv[0]);
    if (result != NO_ERROR)
        std::cerr << args[0] << " failed: " << getErrorMessage(result) << std::endl;

    robot.shutdown();
    return result == NO_ERROR ? 0 : 1;
}
