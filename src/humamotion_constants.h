#ifndef HUMAMOTION_CONSTANTS_H
#define HUMAMOTION_CONSTANTS_H

/**
 * @file humamotion_constants.h
 * @brief Global constants for the HumaMotion humanoid servo system
 *
 * This file contains the commonly used constants of the motion core: joint
 * count, timing defaults, PWM conversion values and I2C addressing.
 */

// Number of servo channels driven on the PCA9685 (one per joint)
#define NUM_CHANNELS 13

// ========================================================================
// TIMING CONSTANTS
// ========================================================================

#define DEFAULT_TICK_INTERVAL 0.02         // Interpolation tick (seconds, 50 Hz)
#define DEFAULT_SENSOR_TTL 0.1             // Sensor cache lifetime (seconds)
#define DEFAULT_STEP_SETTLE_TIME 0.0       // Extra wait after each queued step (seconds)
#define DEFAULT_GESTURE_STEP_DURATION 0.5  // Duration of one authored gesture step (seconds)
#define DEFAULT_NEUTRAL_POSE_DURATION 1.0  // Duration used when returning to neutral (seconds)

// ========================================================================
// SERVO SPEED CONSTANTS
// ========================================================================

#define SERVO_SPEED_MIN 0.1                // Minimum servo speed multiplier
#define SERVO_SPEED_MAX 3.0                // Maximum servo speed multiplier
#define SERVO_SPEED_DEFAULT 1.0            // Default servo speed multiplier
#define DEFAULT_NOMINAL_SERVO_VELOCITY 120.0 // Angular velocity at speed 1.0 (degrees/s)

// Longest accepted move or queued pause, in ticks (about 5.5 h at 50 Hz)
#define MAX_MOVE_TICKS 1000000.0
// Largest walkForward request (each step queues 9 poses)
#define MAX_WALK_STEPS 1000

// ========================================================================
// PWM CONVERSION CONSTANTS
// ========================================================================

#define SERVO_ANGLE_RANGE 180.0      // Full mechanical range mapped onto the pulse range (degrees)
#define DEFAULT_MIN_PULSE_US 1000.0  // Pulse width at 0 degrees (microseconds)
#define DEFAULT_MAX_PULSE_US 2000.0  // Pulse width at 180 degrees (microseconds)
#define DEFAULT_PWM_FREQUENCY 50.0   // Servo refresh rate (Hz)
#define PWM_RESOLUTION 4096          // PCA9685 counter resolution (12 bit)
#define PWM_DUTY_MAX (PWM_RESOLUTION - 1)

// ========================================================================
// I2C ADDRESSING (Raspberry Pi defaults)
// ========================================================================

#define DEFAULT_I2C_BUS 1
#define PCA9685_DEFAULT_ADDRESS 0x40
#define OT703_DEFAULT_ADDRESS 0x3C
#define MPU6050_DEFAULT_ADDRESS 0x68

// PCA9685 registers
#define PCA9685_MODE1 0x00
#define PCA9685_MODE2 0x01
#define PCA9685_PRESCALE 0xFE
#define PCA9685_LED0_ON_L 0x06
#define PCA9685_ALL_LED_ON_L 0xFA
#define PCA9685_OSCILLATOR_HZ 25000000.0

// PCA9685 MODE1 bits
#define MODE1_RESTART 0x80
#define MODE1_AI 0x20
#define MODE1_SLEEP 0x10
#define MODE1_ALLCALL 0x01
#define LED_FULL_OFF 0x10 // Bit 4 of LEDn_OFF_H

// OT703-C86 registers
#define OT703_REG_DISTANCE 0x00
#define OT703_REG_LIGHT 0x01
#define OT703_REG_CONFIG 0x02
#define OT703_CONFIG_MEASURE 0x01
#define OT703_CONFIG_LIGHT 0x02

// MPU-6050 registers
#define MPU6050_PWR_MGMT_1 0x6B
#define MPU6050_SMPLRT_DIV 0x19
#define MPU6050_CONFIG 0x1A
#define MPU6050_GYRO_CONFIG 0x1B
#define MPU6050_ACCEL_CONFIG 0x1C
#define MPU6050_INT_ENABLE 0x38
#define MPU6050_ACCEL_XOUT_H 0x3B

// ========================================================================
// SENSOR DECODING CONSTANTS
// ========================================================================

#define PROXIMITY_RAW_SIZE 3                // [distance_hi, distance_lo, light]
#define PROXIMITY_DISTANCE_SCALE 10.0       // Raw units per centimeter
#define MOTION_RAW_SIZE 14                  // accel(6) + temperature(2) + gyro(6)
#define MPU6050_ACCEL_SCALE 16384.0         // LSB per g at +-2g
#define MPU6050_GYRO_SCALE 131.0            // LSB per deg/s at +-250 deg/s
#define MPU6050_TEMP_SCALE 340.0
#define MPU6050_TEMP_OFFSET 36.53

#endif // HUMAMOTION_CONSTANTS_H
