// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
// Sampling task counters
//
// Each task counts into its own block, so the gyro and compass tasks never
// write the same word.

#include <gtest/gtest.h>
#include "services/SensorCounters.h"

using discosense::hal::BusResult;
using discosense::services::SensorTaskStats;
using discosense::services::TaskCounters;
using discosense::services::countFailure;

// ============================================================================
// Classification
// ============================================================================

TEST(SensorCounters, OkCountsNothing) {
    TaskCounters c = {};
    EXPECT_FALSE(countFailure(c, BusResult::OK));
    EXPECT_EQ(c.bus_errors, 0u);
    EXPECT_EQ(c.not_ready, 0u);
}

TEST(SensorCounters, NotReadyIsNotABusError) {
    TaskCounters c = {};
    EXPECT_FALSE(countFailure(c, BusResult::ERR_NOT_READY));
    EXPECT_EQ(c.not_ready, 1u);
    EXPECT_EQ(c.bus_errors, 0u);
}

TEST(SensorCounters, TransferFailuresAreBusErrors) {
    TaskCounters c = {};
    EXPECT_TRUE(countFailure(c, BusResult::ERR_TIMEOUT));
    EXPECT_TRUE(countFailure(c, BusResult::ERR_NACK));
    EXPECT_TRUE(countFailure(c, BusResult::ERR_BUS_ERROR));
    EXPECT_EQ(c.bus_errors, 3u);
    EXPECT_EQ(c.not_ready, 0u);
    EXPECT_EQ(c.overruns, 0u);
}

// ============================================================================
// Ownership
// ============================================================================

TEST(SensorCounters, GyroAndCompassCountSeparately) {
    SensorTaskStats s = {};
    countFailure(s.gyro, BusResult::ERR_NACK);
    s.gyro.overruns++;
    countFailure(s.compass, BusResult::ERR_NOT_READY);
    s.compass.overruns++;
    s.compass.overruns++;

    EXPECT_EQ(s.gyro.bus_errors, 1u);
    EXPECT_EQ(s.gyro.not_ready, 0u);
    EXPECT_EQ(s.gyro.overruns, 1u);
    EXPECT_EQ(s.compass.bus_errors, 0u);
    EXPECT_EQ(s.compass.not_ready, 1u);
    EXPECT_EQ(s.compass.overruns, 2u);
}

TEST(SensorCounters, BlocksDoNotShareStorage) {
    SensorTaskStats s = {};
    EXPECT_NE(&s.gyro.overruns, &s.compass.overruns);
    EXPECT_NE(&s.gyro.bus_errors, &s.compass.bus_errors);
    EXPECT_NE(&s.gyro.not_ready, &s.compass.not_ready);
}
