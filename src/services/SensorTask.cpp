// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file SensorTask.cpp
 * @brief Gyroscope and compass sampling task implementation
 */

#include "SensorTask.h"

#include "discosense/config.h"
#include "debug/debug_stream.h"
#include "fusion/compass_heading.h"
#include "hal/Bus.h"
#include "hal/Compass_LSM303DLHC.h"
#include "hal/Gyro_L3GD20.h"
#include "hal/Timing.h"

#include "hardware/i2c.h"
#include "hardware/spi.h"

#include <cstdio>
#include <memory>
#include <utility>

using namespace discosense::hal;

namespace discosense {
namespace services {

// ============================================================================
// Global Data
// ============================================================================

SensorData g_sensorData = {};
SemaphoreHandle_t g_sensorDataMutex = nullptr;

// ============================================================================
// Private Data
// ============================================================================

static SensorTaskStats s_stats = {};

// Each driver is touched only by its own task after SensorTask_Create()
static std::unique_ptr<Gyro_L3GD20> s_gyro;
static std::unique_ptr<Compass_LSM303DLHC> s_compass;

static TaskHandle_t s_gyroTask = nullptr;
static TaskHandle_t s_compassTask = nullptr;

static constexpr TickType_t kMutexWait = pdMS_TO_TICKS(2);

// ============================================================================
// Sensor Initialization
// ============================================================================

static bool initGyro() {
    spi_inst_t* spi = (bus::kGyroSpiIndex == 0) ? spi0 : spi1;
    auto gyroBus = std::make_unique<SPIBus>(spi, pins::kGyroCs, pins::kSpi0Sck,
                                            pins::kSpi0Mosi, pins::kSpi0Miso,
                                            bus::kGyroSpiFreqHz, SPIBus::Mode::MODE_3);

    auto gyro = std::make_unique<Gyro_L3GD20>(std::move(gyroBus), Timing::delayMs);

    BusResult r = gyro->begin();
    if (r != BusResult::OK) {
        printf("[SensorTask] L3GD20 init failed: %s\n", busResultName(r));
        return false;
    }
    if (!gyro->identityMatched()) {
        printf("[SensorTask] L3GD20 WHO_AM_I 0x%02X unexpected, continuing\n",
               gyro->identity());
    }

    r = gyro->setFullScale(SensorTaskConfig::GYRO_SCALE);
    if (r == BusResult::OK) {
        r = gyro->setDataRate(SensorTaskConfig::GYRO_RATE);
    }
    if (r != BusResult::OK) {
        printf("[SensorTask] L3GD20 config failed: %s\n", busResultName(r));
        return false;
    }

    s_gyro = std::move(gyro);
    return true;
}

static bool initCompass() {
    i2c_inst_t* i2c = (bus::kCompassI2cIndex == 0) ? i2c0 : i2c1;
    auto compassBus = std::make_unique<I2CBus>(i2c, Compass_LSM303DLHC::ACCEL_ADDR,
                                               pins::kI2c1Sda, pins::kI2c1Scl,
                                               bus::kCompassI2cFreqHz);

    auto compass = std::make_unique<Compass_LSM303DLHC>(std::move(compassBus),
                                                        Timing::delayMs);

    BusResult r = compass->begin();
    if (r != BusResult::OK) {
        printf("[SensorTask] LSM303DLHC init failed: %s\n", busResultName(r));
        return false;
    }

    r = compass->setAccelScale(SensorTaskConfig::ACCEL_SCALE);
    if (r == BusResult::OK) {
        r = compass->setMagGain(SensorTaskConfig::MAG_GAIN);
    }
    if (r == BusResult::OK) {
        r = compass->setMagDataRate(SensorTaskConfig::MAG_RATE);
    }
    if (r != BusResult::OK) {
        printf("[SensorTask] LSM303DLHC config failed: %s\n", busResultName(r));
        return false;
    }

    s_compass = std::move(compass);
    return true;
}

bool SensorTask_Init() {
    g_sensorDataMutex = xSemaphoreCreateMutex();
    if (g_sensorDataMutex == nullptr) {
        printf("[SensorTask] Mutex allocation failed\n");
        return false;
    }

    const bool gyroOk = initGyro();
    const bool compassOk = initCompass();

    g_sensorData.gyro_ok = gyroOk;
    g_sensorData.compass_ok = compassOk;

    printf("[SensorTask] Gyro %s, compass %s\n",
           gyroOk ? "OK" : "FAIL", compassOk ? "OK" : "FAIL");
    return gyroOk || compassOk;
}

// ============================================================================
// Task Bodies
// ============================================================================

static void gyroTask(void* /*params*/) {
    TickType_t lastWake = xTaskGetTickCount();
    const TickType_t period = pdMS_TO_TICKS(timing::kGyroSampleMs);

    while (true) {
        AngularRate rate;
        int8_t temp = 0;

        BusResult r = s_gyro->waitDataReady(sensors::kReadyPolls, sensors::kReadyPollMs);
        if (r == BusResult::OK) {
            r = s_gyro->readAngularRate(rate);
        }
        if (r == BusResult::OK) {
            r = s_gyro->readTemperature(temp);
        }

        if (r == BusResult::OK) {
            if (xSemaphoreTake(g_sensorDataMutex, kMutexWait) == pdTRUE) {
                g_sensorData.gyro = rate;
                g_sensorData.gyro_temp_c = temp;
                g_sensorData.gyro_timestamp_ms = Timing::millis32();
                xSemaphoreGive(g_sensorDataMutex);
            }
            s_stats.gyro_samples++;
        } else if (countFailure(s_stats.gyro, r)) {
            dbg_printf("[GyroTask] %s\n", busResultName(r));
        }

        if (xTaskDelayUntil(&lastWake, period) == pdFALSE) {
            s_stats.gyro.overruns++;
        }
    }
}

static void compassTask(void* /*params*/) {
    TickType_t lastWake = xTaskGetTickCount();
    const TickType_t period = pdMS_TO_TICKS(timing::kCompassSampleMs);
    uint32_t cycle = 0;

    while (true) {
        Acceleration accel;
        MagneticField mag;
        int16_t magTemp = 0;
        bool haveAccel = false;
        bool haveMag = false;
        bool haveTemp = false;

        BusResult r = s_compass->waitAccelDataReady(sensors::kReadyPolls, sensors::kReadyPollMs);
        if (r == BusResult::OK) {
            r = s_compass->readAcceleration(accel);
            haveAccel = (r == BusResult::OK);
        }

        if (r == BusResult::OK || r == BusResult::ERR_NOT_READY) {
            countFailure(s_stats.compass, r);
            r = s_compass->waitMagDataReady(sensors::kReadyPolls, sensors::kReadyPollMs);
            if (r == BusResult::OK) {
                r = s_compass->readMagneticField(mag);
                haveMag = (r == BusResult::OK);
            }
        }

        if (r == BusResult::OK && (cycle % timing::kMagTempDivider) == 0) {
            r = s_compass->readTemperature(magTemp);
            haveTemp = (r == BusResult::OK);
        }

        if (haveAccel || haveMag) {
            if (xSemaphoreTake(g_sensorDataMutex, kMutexWait) == pdTRUE) {
                if (haveAccel) {
                    g_sensorData.accel = accel;
                }
                if (haveMag) {
                    g_sensorData.mag = mag;
                    g_sensorData.heading_valid = ds::compass_heading_valid(mag);
                    g_sensorData.heading_deg = ds::compass_heading_deg(mag);
                }
                if (haveTemp) {
                    g_sensorData.mag_temp_raw = magTemp;
                }
                g_sensorData.compass_timestamp_ms = Timing::millis32();
                xSemaphoreGive(g_sensorDataMutex);
            }
            s_stats.accel_samples += haveAccel ? 1 : 0;
            s_stats.mag_samples += haveMag ? 1 : 0;
        }

        if (countFailure(s_stats.compass, r)) {
            dbg_printf("[CompassTask] %s\n", busResultName(r));
        }

        cycle++;
        if (xTaskDelayUntil(&lastWake, period) == pdFALSE) {
            s_stats.compass.overruns++;
        }
    }
}

// ============================================================================
// Public API
// ============================================================================

bool SensorTask_Create() {
    bool ok = true;

    if (s_gyro) {
        if (xTaskCreate(gyroTask, "Gyro", SensorTaskConfig::STACK_SIZE, nullptr,
                        SensorTaskConfig::GYRO_TASK_PRIORITY, &s_gyroTask) == pdPASS) {
            vTaskCoreAffinitySet(s_gyroTask, SensorTaskConfig::CORE_AFFINITY);
        } else {
            ok = false;
        }
    }
    if (s_compass) {
        if (xTaskCreate(compassTask, "Compass", SensorTaskConfig::STACK_SIZE, nullptr,
                        SensorTaskConfig::COMPASS_TASK_PRIORITY, &s_compassTask) == pdPASS) {
            vTaskCoreAffinitySet(s_compassTask, SensorTaskConfig::CORE_AFFINITY);
        } else {
            ok = false;
        }
    }

    if (!ok) {
        printf("[SensorTask] Task creation failed\n");
    }
    return ok;
}

bool SensorTask_GetData(SensorData& data) {
    if (g_sensorDataMutex == nullptr) {
        return false;
    }
    if (xSemaphoreTake(g_sensorDataMutex, kMutexWait) != pdTRUE) {
        return false;
    }
    data = g_sensorData;
    xSemaphoreGive(g_sensorDataMutex);
    return true;
}

SensorTaskStats SensorTask_GetStats() {
    return s_stats;
}

void SensorTask_PrintStatus() {
    SensorData d;
    if (!SensorTask_GetData(d)) {
        printf("[SensorTask] Data busy\n");
        return;
    }
    const SensorTaskStats s = SensorTask_GetStats();

    if (d.gyro_ok) {
        printf("Gyro  X:%8.2f Y:%8.2f Z:%8.2f dps | T:%d C | n=%lu err=%lu nr=%lu ovr=%lu\n",
               static_cast<double>(d.gyro.x), static_cast<double>(d.gyro.y),
               static_cast<double>(d.gyro.z), d.gyro_temp_c,
               static_cast<unsigned long>(s.gyro_samples),
               static_cast<unsigned long>(s.gyro.bus_errors),
               static_cast<unsigned long>(s.gyro.not_ready),
               static_cast<unsigned long>(s.gyro.overruns));
    }
    if (d.compass_ok) {
        printf("Accel X:%6d Y:%6d Z:%6d mg\n",
               static_cast<int>(d.accel.x * 1000.0f),
               static_cast<int>(d.accel.y * 1000.0f),
               static_cast<int>(d.accel.z * 1000.0f));
        printf("Mag   X:%6d Y:%6d Z:%6d mG | Heading: ",
               static_cast<int>(d.mag.x * 1000.0f),
               static_cast<int>(d.mag.y * 1000.0f),
               static_cast<int>(d.mag.z * 1000.0f));
        if (d.heading_valid) {
            printf("%5.1f deg", static_cast<double>(d.heading_deg));
        } else {
            printf("  --- ");
        }
        printf(" | T:%.1f C\n",
               static_cast<double>(Compass_LSM303DLHC::temperatureToCelsius(d.mag_temp_raw)));
        printf("      n=%lu/%lu err=%lu nr=%lu ovr=%lu\n",
               static_cast<unsigned long>(s.accel_samples),
               static_cast<unsigned long>(s.mag_samples),
               static_cast<unsigned long>(s.compass.bus_errors),
               static_cast<unsigned long>(s.compass.not_ready),
               static_cast<unsigned long>(s.compass.overruns));
    }
}

} // namespace services
} // namespace discosense
