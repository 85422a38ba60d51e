// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
// Range, gain and data-rate tables
//
// Enumerator values are register bit patterns; sensitivities come from
// the L3GD20 and LSM303DLHC datasheets.

#include <gtest/gtest.h>
#include "hal/SensorScales.h"

using namespace discosense::hal;

// ============================================================================
// Gyroscope
// ============================================================================

TEST(GyroScales, RegisterCodes) {
    EXPECT_EQ(static_cast<uint8_t>(GyroFullScale::DPS_250), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(GyroFullScale::DPS_500), 0x10);
    EXPECT_EQ(static_cast<uint8_t>(GyroFullScale::DPS_2000), 0x20);
}

TEST(GyroScales, Sensitivity) {
    EXPECT_FLOAT_EQ(gyroSensitivityMdps(GyroFullScale::DPS_250), 8.75f);
    EXPECT_FLOAT_EQ(gyroSensitivityMdps(GyroFullScale::DPS_500), 17.5f);
    EXPECT_FLOAT_EQ(gyroSensitivityMdps(GyroFullScale::DPS_2000), 70.0f);
}

TEST(GyroScales, DataRateCodesFitUpperNibble) {
    const GyroDataRate rates[] = {
        GyroDataRate::ODR_95_BW_12_5, GyroDataRate::ODR_95_BW_25,
        GyroDataRate::ODR_190_BW_12_5, GyroDataRate::ODR_190_BW_25,
        GyroDataRate::ODR_190_BW_50, GyroDataRate::ODR_190_BW_70,
        GyroDataRate::ODR_380_BW_20, GyroDataRate::ODR_380_BW_25,
        GyroDataRate::ODR_380_BW_50, GyroDataRate::ODR_380_BW_100,
        GyroDataRate::ODR_760_BW_30, GyroDataRate::ODR_760_BW_35,
        GyroDataRate::ODR_760_BW_50, GyroDataRate::ODR_760_BW_100,
    };
    for (GyroDataRate r : rates) {
        EXPECT_EQ(static_cast<uint8_t>(r) & 0x0F, 0);
    }
    EXPECT_EQ(static_cast<uint8_t>(GyroDataRate::ODR_190_BW_50), 0x60);
    EXPECT_EQ(static_cast<uint8_t>(GyroDataRate::ODR_760_BW_100), 0xF0);
}

// ============================================================================
// Accelerometer
// ============================================================================

TEST(AccelScales, RegisterCodesAndSensitivity) {
    EXPECT_EQ(static_cast<uint8_t>(AccelScale::G_2), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(AccelScale::G_4), 0x10);
    EXPECT_EQ(static_cast<uint8_t>(AccelScale::G_8), 0x20);
    EXPECT_EQ(static_cast<uint8_t>(AccelScale::G_16), 0x30);

    EXPECT_FLOAT_EQ(accelSensitivityMg(AccelScale::G_2), 1.0f);
    EXPECT_FLOAT_EQ(accelSensitivityMg(AccelScale::G_4), 2.0f);
    EXPECT_FLOAT_EQ(accelSensitivityMg(AccelScale::G_8), 4.0f);
    // Not 8: the datasheet value for +/-16 g is 12 mg/LSB
    EXPECT_FLOAT_EQ(accelSensitivityMg(AccelScale::G_16), 12.0f);
}

TEST(AccelScales, DataRateCodes) {
    EXPECT_EQ(static_cast<uint8_t>(AccelDataRate::POWER_DOWN), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(AccelDataRate::HZ_100), 0x50);
    EXPECT_EQ(static_cast<uint8_t>(AccelDataRate::HZ_1344), 0x90);
}

// ============================================================================
// Magnetometer
// ============================================================================

TEST(MagScales, GainTable) {
    struct Row {
        MagGain gain;
        uint8_t code;
        float xy;
        float z;
    };
    const Row rows[] = {
        {MagGain::GAUSS_1_3, 0x20, 1100.0f, 980.0f},
        {MagGain::GAUSS_1_9, 0x40, 855.0f, 760.0f},
        {MagGain::GAUSS_2_5, 0x60, 670.0f, 600.0f},
        {MagGain::GAUSS_4_0, 0x80, 450.0f, 400.0f},
        {MagGain::GAUSS_4_7, 0xA0, 400.0f, 355.0f},
        {MagGain::GAUSS_5_6, 0xC0, 330.0f, 295.0f},
        {MagGain::GAUSS_8_1, 0xE0, 230.0f, 205.0f},
    };
    for (const Row& row : rows) {
        EXPECT_EQ(static_cast<uint8_t>(row.gain), row.code);
        EXPECT_FLOAT_EQ(magSensitivityXY(row.gain), row.xy);
        EXPECT_FLOAT_EQ(magSensitivityZ(row.gain), row.z);
        // Z coil is always less sensitive than X/Y
        EXPECT_LT(magSensitivityZ(row.gain), magSensitivityXY(row.gain));
    }
}

TEST(MagScales, DataRateCodesStayInRateField) {
    const MagDataRate rates[] = {
        MagDataRate::HZ_0_75, MagDataRate::HZ_1_5, MagDataRate::HZ_3,
        MagDataRate::HZ_7_5, MagDataRate::HZ_15, MagDataRate::HZ_30,
        MagDataRate::HZ_75, MagDataRate::HZ_220,
    };
    for (MagDataRate r : rates) {
        EXPECT_EQ(static_cast<uint8_t>(r) & ~0x1C, 0);
    }
    EXPECT_EQ(static_cast<uint8_t>(MagDataRate::HZ_15), 0x10);
    EXPECT_EQ(static_cast<uint8_t>(MagDataRate::HZ_220), 0x1C);
}
