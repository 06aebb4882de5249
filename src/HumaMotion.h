#ifndef HUMAMOTION_H
#define HUMAMOTION_H

#include "calibration_store.h"
#include "gesture_factory.h"
#include "humamotion_constants.h"
#include "humanoid_model.h"
#include "humanoid_robot.h"
#include "linear_trajectory.h"
#include "log_utils.h"
#include "math_utils.h"
#include "motion_controller.h"
#include "robot_clock.h"
#include "robot_config.h"
#include "sensor_cache.h"

#endif // HUMAMOTION_H
