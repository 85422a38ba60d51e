// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file SensorTypes.h
 * @brief Converted sensor samples shared by the drivers and fusion code
 *
 * Pure C++ - no Pico SDK dependencies.
 *
 * @note Part of DiscoSense HAL - Hardware Abstraction Layer
 */

#ifndef DISCOSENSE_HAL_SENSOR_TYPES_H
#define DISCOSENSE_HAL_SENSOR_TYPES_H

#include <cstdint>

namespace discosense {
namespace hal {

/**
 * @brief Angular rate in degrees per second
 */
struct AngularRate {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

/**
 * @brief Linear acceleration in g
 */
struct Acceleration {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

/**
 * @brief Magnetic flux density in gauss
 */
struct MagneticField {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

/**
 * @brief Millisecond delay hook handed to each driver
 *
 * Firmware passes Timing::delayMs (yields to FreeRTOS); host tests pass
 * a recorder.
 */
using DelayFn = void (*)(uint32_t ms);

} // namespace hal
} // namespace discosense

#endif // DISCOSENSE_HAL_SENSOR_TYPES_H
