// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file config.h
 * @brief DiscoSense build configuration and pin definitions
 *
 * Conventions:
 * - Constants use k prefix: kGyroSampleMs, kI2cFreqHz
 * - Global variables use g_ prefix: g_sensorData
 */

#ifndef DISCOSENSE_CONFIG_H
#define DISCOSENSE_CONFIG_H

#include <cstdint>

// ============================================================================
// Version Information
// ============================================================================

constexpr uint8_t     kVersionMajor  = 0;
constexpr uint8_t     kVersionMinor  = 1;
constexpr uint8_t     kVersionPatch  = 0;
constexpr const char* kVersionString = "0.1.0";

namespace discosense {

// ============================================================================
// Pin Definitions
// ============================================================================

namespace pins {

constexpr uint8_t kLedRed       = 7;        // Built-in red LED (heartbeat)

// SPI0 - L3GD20 gyroscope
constexpr uint8_t kSpi0Miso     = 20;
constexpr uint8_t kSpi0Sck      = 22;
constexpr uint8_t kSpi0Mosi     = 23;
constexpr uint8_t kGyroCs       = 24;       // GPIO-driven chip select

// I2C1 - LSM303DLHC (shared with the audio codec on the reference wiring)
constexpr uint8_t kI2c1Sda      = 2;
constexpr uint8_t kI2c1Scl      = 3;

} // namespace pins

// ============================================================================
// Bus Configuration
// ============================================================================

namespace bus {

constexpr uint8_t  kGyroSpiIndex    = 0;        // spi0
constexpr uint32_t kGyroSpiFreqHz   = 8000000;  // L3GD20 max 10 MHz
constexpr uint8_t  kCompassI2cIndex = 1;        // i2c1
constexpr uint32_t kCompassI2cFreqHz = 100000;  // Slowest device on the bus sets the clock

} // namespace bus

// ============================================================================
// Sensor Defaults
// ============================================================================

namespace sensors {

// Data-ready polling: up to kReadyPolls status reads, kReadyPollMs apart
constexpr uint32_t kReadyPolls      = 20;
constexpr uint32_t kReadyPollMs     = 1;

} // namespace sensors

// ============================================================================
// Timing Configuration
// ============================================================================

namespace timing {

constexpr uint32_t kGyroSampleMs        = 10;   // 100 Hz (gyro ODR 190 Hz)
constexpr uint32_t kCompassSampleMs     = 20;   // 50 Hz (accel 100 Hz, mag 75 Hz)
constexpr uint32_t kMagTempDivider      = 50;   // Mag temperature once per second
constexpr uint32_t kStatusPrintMs       = 1000;
constexpr uint32_t kDebugFlushMs        = 50;

} // namespace timing

} // namespace discosense

#endif // DISCOSENSE_CONFIG_H
