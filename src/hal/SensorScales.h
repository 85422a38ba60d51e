// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file SensorScales.h
 * @brief Range, gain and data-rate selectors for L3GD20 and LSM303DLHC
 *
 * Each enumerator value is the exact bit pattern written to the device's
 * control register (already shifted into position). Conversion constants
 * hang off the enumerator through a constexpr lookup, so a driver that
 * stores the selector always holds the matching sensitivity.
 *
 * Values from the L3GD20 and LSM303DLHC datasheets.
 */

#ifndef DISCOSENSE_HAL_SENSOR_SCALES_H
#define DISCOSENSE_HAL_SENSOR_SCALES_H

#include <cstdint>

namespace discosense {
namespace hal {

// ============================================================================
// L3GD20 gyroscope
// ============================================================================

/**
 * @brief Gyroscope full-scale range (CTRL_REG4 bits 4-5)
 */
enum class GyroFullScale : uint8_t {
    DPS_250  = 0x00,
    DPS_500  = 0x10,
    DPS_2000 = 0x20
};

/**
 * @brief Gyroscope sensitivity in millidegrees per second per LSB
 */
constexpr float gyroSensitivityMdps(GyroFullScale scale) {
    switch (scale) {
        case GyroFullScale::DPS_250:  return 8.75f;
        case GyroFullScale::DPS_500:  return 17.5f;
        case GyroFullScale::DPS_2000: return 70.0f;
    }
    return 8.75f;
}

/**
 * @brief Gyroscope output data rate and bandwidth (CTRL_REG1 bits 4-7)
 *
 * Naming: ODR_<rate>_BW_<cutoff>, both in Hz.
 */
enum class GyroDataRate : uint8_t {
    ODR_95_BW_12_5  = 0x00,
    ODR_95_BW_25    = 0x10,
    ODR_190_BW_12_5 = 0x40,
    ODR_190_BW_25   = 0x50,
    ODR_190_BW_50   = 0x60,
    ODR_190_BW_70   = 0x70,
    ODR_380_BW_20   = 0x80,
    ODR_380_BW_25   = 0x90,
    ODR_380_BW_50   = 0xA0,
    ODR_380_BW_100  = 0xB0,
    ODR_760_BW_30   = 0xC0,
    ODR_760_BW_35   = 0xD0,
    ODR_760_BW_50   = 0xE0,
    ODR_760_BW_100  = 0xF0
};

// ============================================================================
// LSM303DLHC accelerometer
// ============================================================================

/**
 * @brief Accelerometer full-scale range (CTRL_REG4_A bits 4-5)
 */
enum class AccelScale : uint8_t {
    G_2  = 0x00,
    G_4  = 0x10,
    G_8  = 0x20,
    G_16 = 0x30
};

/**
 * @brief Accelerometer sensitivity in milli-g per LSB (12-bit output)
 */
constexpr float accelSensitivityMg(AccelScale scale) {
    switch (scale) {
        case AccelScale::G_2:  return 1.0f;
        case AccelScale::G_4:  return 2.0f;
        case AccelScale::G_8:  return 4.0f;
        case AccelScale::G_16: return 12.0f;
    }
    return 1.0f;
}

/**
 * @brief Accelerometer output data rate (CTRL_REG1_A bits 4-7)
 */
enum class AccelDataRate : uint8_t {
    POWER_DOWN  = 0x00,
    HZ_1        = 0x10,
    HZ_10       = 0x20,
    HZ_25       = 0x30,
    HZ_50       = 0x40,
    HZ_100      = 0x50,
    HZ_200      = 0x60,
    HZ_400      = 0x70,
    HZ_1620_LP  = 0x80,  // Low-power mode only
    HZ_1344     = 0x90   // 5376 Hz in low-power mode
};

// ============================================================================
// LSM303DLHC magnetometer
// ============================================================================

/**
 * @brief Magnetometer gain (CRB_REG_M bits 5-7)
 */
enum class MagGain : uint8_t {
    GAUSS_1_3 = 0x20,
    GAUSS_1_9 = 0x40,
    GAUSS_2_5 = 0x60,
    GAUSS_4_0 = 0x80,
    GAUSS_4_7 = 0xA0,
    GAUSS_5_6 = 0xC0,
    GAUSS_8_1 = 0xE0
};

/**
 * @brief X/Y axis sensitivity in LSB per gauss
 */
constexpr float magSensitivityXY(MagGain gain) {
    switch (gain) {
        case MagGain::GAUSS_1_3: return 1100.0f;
        case MagGain::GAUSS_1_9: return 855.0f;
        case MagGain::GAUSS_2_5: return 670.0f;
        case MagGain::GAUSS_4_0: return 450.0f;
        case MagGain::GAUSS_4_7: return 400.0f;
        case MagGain::GAUSS_5_6: return 330.0f;
        case MagGain::GAUSS_8_1: return 230.0f;
    }
    return 1100.0f;
}

/**
 * @brief Z axis sensitivity in LSB per gauss
 *
 * The Z coil is built differently from X/Y, hence the separate table.
 */
constexpr float magSensitivityZ(MagGain gain) {
    switch (gain) {
        case MagGain::GAUSS_1_3: return 980.0f;
        case MagGain::GAUSS_1_9: return 760.0f;
        case MagGain::GAUSS_2_5: return 600.0f;
        case MagGain::GAUSS_4_0: return 400.0f;
        case MagGain::GAUSS_4_7: return 355.0f;
        case MagGain::GAUSS_5_6: return 295.0f;
        case MagGain::GAUSS_8_1: return 205.0f;
    }
    return 980.0f;
}

/**
 * @brief Magnetometer output data rate (CRA_REG_M bits 2-4)
 */
enum class MagDataRate : uint8_t {
    HZ_0_75 = 0x00,
    HZ_1_5  = 0x04,
    HZ_3    = 0x08,
    HZ_7_5  = 0x0C,
    HZ_15   = 0x10,
    HZ_30   = 0x14,
    HZ_75   = 0x18,
    HZ_220  = 0x1C
};

} // namespace hal
} // namespace discosense

#endif // DISCOSENSE_HAL_SENSOR_SCALES_H
