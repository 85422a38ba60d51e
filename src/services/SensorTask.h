// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file SensorTask.h
 * @brief Gyroscope and compass sampling FreeRTOS tasks
 *
 * Two tasks, one per bus: the gyro task owns the L3GD20 on SPI0, the
 * compass task owns the LSM303DLHC on I2C1. They never touch each other's
 * bus and run independently. Both publish into a shared SensorData
 * snapshot protected by a mutex.
 *
 * @note Part of DiscoSense Services Layer
 */

#ifndef DISCOSENSE_SERVICES_SENSOR_TASK_H
#define DISCOSENSE_SERVICES_SENSOR_TASK_H

#include "FreeRTOS.h"
#include "task.h"
#include "semphr.h"

#include "hal/SensorScales.h"
#include "services/SensorCounters.h"
#include "hal/SensorTypes.h"

#include <cstdint>

namespace discosense {
namespace services {

/**
 * @brief Shared sensor snapshot
 *
 * Protected by g_sensorDataMutex. Readers should use SensorTask_GetData().
 */
struct SensorData {
    // L3GD20
    hal::AngularRate gyro;          // dps
    int8_t gyro_temp_c;             // Raw OUT_TEMP, 1 LSB/degC
    uint32_t gyro_timestamp_ms;

    // LSM303DLHC
    hal::Acceleration accel;        // g
    hal::MagneticField mag;         // gauss
    float heading_deg;              // [0, 360), flat-board
    bool heading_valid;             // false when mag x == y == 0
    int16_t mag_temp_raw;           // 8 LSB/degC, uncalibrated offset
    uint32_t compass_timestamp_ms;

    bool gyro_ok;
    bool compass_ok;
};

/**
 * @brief Task and sensor configuration
 */
struct SensorTaskConfig {
    static constexpr uint32_t GYRO_TASK_PRIORITY    = 4;
    static constexpr uint32_t COMPASS_TASK_PRIORITY = 3;
    static constexpr uint32_t STACK_SIZE            = 1024;     // words
    static constexpr UBaseType_t CORE_AFFINITY      = (1 << 0); // Core 0, both tasks

    static constexpr hal::GyroFullScale GYRO_SCALE = hal::GyroFullScale::DPS_500;
    static constexpr hal::GyroDataRate  GYRO_RATE  = hal::GyroDataRate::ODR_190_BW_50;
    static constexpr hal::AccelScale    ACCEL_SCALE = hal::AccelScale::G_4;
    static constexpr hal::MagGain       MAG_GAIN    = hal::MagGain::GAUSS_1_9;
    static constexpr hal::MagDataRate   MAG_RATE    = hal::MagDataRate::HZ_75;
};

// Global shared data
extern SensorData g_sensorData;
extern SemaphoreHandle_t g_sensorDataMutex;

/**
 * @brief Create buses and drivers, run begin() and apply configuration
 *
 * Must be called before SensorTask_Create(). A sensor that fails to
 * initialize is reported and its task is not created; the other sensor
 * still runs.
 *
 * @return true if at least one sensor initialized
 */
bool SensorTask_Init();

/**
 * @brief Create the gyro and compass tasks
 * @return true if every task for an initialized sensor was created
 */
bool SensorTask_Create();

/**
 * @brief Get copy of current sensor data (thread-safe)
 * @param data Output: copy of current sensor data
 * @return true if data was copied
 */
bool SensorTask_GetData(SensorData& data);

/**
 * @brief Get current task statistics
 */
SensorTaskStats SensorTask_GetStats();

/**
 * @brief Print sensor status (call from the UI task)
 */
void SensorTask_PrintStatus();

} // namespace services
} // namespace discosense

#endif // DISCOSENSE_SERVICES_SENSOR_TASK_H
