// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
// SPI command byte framing, transfer results and result-code names
//
// The SPI address byte carries the direction in bit 7 and the
// auto-increment request in bit 6; the register address stays in bits 0-5.

#include <gtest/gtest.h>
#include "hal/Bus.h"
#include "hal/Gyro_L3GD20.h"

using discosense::hal::BusResult;
using discosense::hal::Gyro_L3GD20;
using discosense::hal::SPIBus;
using discosense::hal::busResultName;
using discosense::hal::kSdkErrorGeneric;
using discosense::hal::kSdkErrorTimeout;
using discosense::hal::transferResult;

// ============================================================================
// Command bytes
// ============================================================================

TEST(SpiFraming, SingleReadSetsReadBitOnly) {
    EXPECT_EQ(SPIBus::readCommand(Gyro_L3GD20::REG_WHO_AM_I, 1), 0x8F);
    EXPECT_EQ(SPIBus::readCommand(Gyro_L3GD20::REG_STATUS_REG, 1), 0xA7);
}

TEST(SpiFraming, BurstReadAddsAutoIncrement) {
    EXPECT_EQ(SPIBus::readCommand(Gyro_L3GD20::REG_OUT_X_L, 6), 0xE8);
    EXPECT_EQ(SPIBus::readCommand(0x00, 2), 0xC0);
}

TEST(SpiFraming, WriteClearsReadBit) {
    EXPECT_EQ(SPIBus::writeCommand(Gyro_L3GD20::REG_CTRL_REG1), 0x20);
    EXPECT_EQ(SPIBus::writeCommand(0xA3), 0x23);
}

TEST(SpiFraming, CommandsUsableAtCompileTime) {
    static_assert(SPIBus::readCommand(0x0F, 1) == 0x8F, "single read");
    static_assert(SPIBus::readCommand(0x28, 6) == 0xE8, "burst read");
    static_assert(SPIBus::writeCommand(0x23) == 0x23, "write");
    SUCCEED();
}

// ============================================================================
// Transfer results
// ============================================================================

TEST(TransferResult, FullCountIsOk) {
    EXPECT_EQ(transferResult(6, 6), BusResult::OK);
    EXPECT_EQ(transferResult(1, 1), BusResult::OK);
}

TEST(TransferResult, ShortCountIsBusError) {
    EXPECT_EQ(transferResult(5, 6), BusResult::ERR_BUS_ERROR);
    EXPECT_EQ(transferResult(0, 1), BusResult::ERR_BUS_ERROR);
}

TEST(TransferResult, LongCountIsBusError) {
    EXPECT_EQ(transferResult(3, 2), BusResult::ERR_BUS_ERROR);
}

TEST(TransferResult, SdkTimeoutIsTimeout) {
    EXPECT_EQ(kSdkErrorTimeout, -2);
    EXPECT_EQ(transferResult(kSdkErrorTimeout, 6), BusResult::ERR_TIMEOUT);
}

TEST(TransferResult, SdkGenericErrorIsNack) {
    // Address or data byte not acknowledged
    EXPECT_EQ(kSdkErrorGeneric, -1);
    EXPECT_EQ(transferResult(kSdkErrorGeneric, 1), BusResult::ERR_NACK);
}

TEST(TransferResult, OtherNegativeIsBusError) {
    EXPECT_EQ(transferResult(-3, 1), BusResult::ERR_BUS_ERROR);
    EXPECT_EQ(transferResult(-100, 6), BusResult::ERR_BUS_ERROR);
}

// ============================================================================
// Result names
// ============================================================================

TEST(BusResultName, EveryCodeNamed) {
    EXPECT_STREQ(busResultName(BusResult::OK), "OK");
    EXPECT_STREQ(busResultName(BusResult::ERR_TIMEOUT), "TIMEOUT");
    EXPECT_STREQ(busResultName(BusResult::ERR_NACK), "NACK");
    EXPECT_STREQ(busResultName(BusResult::ERR_BUS_ERROR), "BUS_ERROR");
    EXPECT_STREQ(busResultName(BusResult::ERR_INVALID_PARAM), "INVALID_PARAM");
    EXPECT_STREQ(busResultName(BusResult::ERR_NOT_INITIALIZED), "NOT_INITIALIZED");
    EXPECT_STREQ(busResultName(BusResult::ERR_NOT_READY), "NOT_READY");
}

TEST(BusResultName, OutOfRangeIsUnknown) {
    EXPECT_STREQ(busResultName(static_cast<BusResult>(200)), "UNKNOWN");
}
