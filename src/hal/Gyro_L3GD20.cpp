// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Gyro_L3GD20.cpp
 * @brief L3GD20 gyroscope driver implementation
 */

#include "Gyro_L3GD20.h"
#include "debug.h"

#include <utility>

namespace discosense {
namespace hal {

// ============================================================================
// Bit Definitions
// ============================================================================

namespace {
    // CTRL_REG1
    constexpr uint8_t kCtrl1PowerOn      = (1U << 3);   // PD: 1 = normal mode
    constexpr uint8_t kCtrl1AxesEnable   = 0x07;        // Zen | Yen | Xen
    constexpr uint8_t kCtrl1RateMask     = 0xF0;        // DR1:0 | BW1:0

    // CTRL_REG4
    constexpr uint8_t kCtrl4ScaleMask    = 0x30;        // FS1:0

    // STATUS_REG
    constexpr uint8_t kStatusZyxda       = (1U << 3);

    // Timing
    constexpr uint32_t kBootDelayMs      = 10;
    constexpr uint32_t kStartupDelayMs   = 250;         // Datasheet charge-pump startup >= 200 ms

    constexpr size_t kAxisBytes          = 6;

    int16_t le16(const uint8_t* p) {
        return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                    (static_cast<uint16_t>(p[1]) << 8));
    }
} // namespace

// ============================================================================
// Constructor / Initialization
// ============================================================================

Gyro_L3GD20::Gyro_L3GD20(std::unique_ptr<SensorBus> bus, DelayFn delay)
    : m_bus(std::move(bus))
    , m_delay(delay)
    , m_scale(GyroFullScale::DPS_250)
    , m_rate(GyroDataRate::ODR_95_BW_12_5)
    , m_powered(false)
    , m_identity_ok(false)
    , m_who_am_i(0)
{
}

BusResult Gyro_L3GD20::begin() {
    if (!m_bus || !m_bus->begin()) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    m_delay(kBootDelayMs);

    BusResult r = m_bus->readRegister(REG_WHO_AM_I, m_who_am_i);
    if (r != BusResult::OK) {
        DBG_ERROR("[L3GD20] WHO_AM_I read failed on %s: %s\n",
                  m_bus->getName(), busResultName(r));
        return r;
    }

    m_identity_ok = (m_who_am_i == DEVICE_ID) || (m_who_am_i == DEVICE_ID_ALT);
    if (!m_identity_ok) {
        // Advisory only, the part may still work
        DBG_ERROR("[L3GD20] WHO_AM_I 0x%02X (expected 0x%02X or 0x%02X), continuing\n",
                  m_who_am_i, DEVICE_ID, DEVICE_ID_ALT);
    }

    // Power on, XYZ enabled, 95 Hz / 12.5 Hz cutoff
    const struct {
        uint8_t reg;
        uint8_t value;
    } init_seq[] = {
        {REG_CTRL_REG1, static_cast<uint8_t>(kCtrl1PowerOn | kCtrl1AxesEnable)},
        {REG_CTRL_REG2, 0x00},      // Normal HPF mode, HPF unused
        {REG_CTRL_REG3, 0x00},      // No interrupts
        {REG_CTRL_REG4, 0x00},      // Continuous update, 250 dps
        {REG_CTRL_REG5, 0x00},      // No FIFO, no HPF
    };

    for (const auto& step : init_seq) {
        r = m_bus->writeRegister(step.reg, step.value);
        if (r != BusResult::OK) {
            DBG_ERROR("[L3GD20] Init write 0x%02X failed: %s\n",
                      step.reg, busResultName(r));
            return r;
        }
    }

    m_scale = GyroFullScale::DPS_250;
    m_rate = GyroDataRate::ODR_95_BW_12_5;
    m_powered = true;

    m_delay(kStartupDelayMs);

    DBG_PRINT("[L3GD20] Initialized on %s (id 0x%02X)\n", m_bus->getName(), m_who_am_i);
    return BusResult::OK;
}

// ============================================================================
// Configuration
// ============================================================================

BusResult Gyro_L3GD20::modifyRegister(uint8_t reg, uint8_t keep_mask, uint8_t bits) {
    uint8_t value = 0;
    BusResult r = m_bus->readRegister(reg, value);
    if (r != BusResult::OK) {
        return r;
    }
    value = static_cast<uint8_t>((value & keep_mask) | bits);
    return m_bus->writeRegister(reg, value);
}

BusResult Gyro_L3GD20::setFullScale(GyroFullScale scale) {
    BusResult r = modifyRegister(REG_CTRL_REG4,
                                 static_cast<uint8_t>(~kCtrl4ScaleMask),
                                 static_cast<uint8_t>(scale));
    if (r != BusResult::OK) {
        DBG_ERROR("[L3GD20] setFullScale failed: %s\n", busResultName(r));
        return r;
    }
    m_scale = scale;
    return BusResult::OK;
}

BusResult Gyro_L3GD20::setDataRate(GyroDataRate rate) {
    BusResult r = modifyRegister(REG_CTRL_REG1,
                                 static_cast<uint8_t>(~kCtrl1RateMask),
                                 static_cast<uint8_t>(rate));
    if (r != BusResult::OK) {
        DBG_ERROR("[L3GD20] setDataRate failed: %s\n", busResultName(r));
        return r;
    }
    m_rate = rate;
    return BusResult::OK;
}

BusResult Gyro_L3GD20::powerDown() {
    BusResult r = modifyRegister(REG_CTRL_REG1,
                                 static_cast<uint8_t>(~kCtrl1PowerOn), 0x00);
    if (r != BusResult::OK) {
        return r;
    }
    m_powered = false;
    return BusResult::OK;
}

// ============================================================================
// Data Reading
// ============================================================================

BusResult Gyro_L3GD20::dataReady(bool& ready) {
    uint8_t status = 0;
    BusResult r = m_bus->readRegister(REG_STATUS_REG, status);
    if (r != BusResult::OK) {
        return r;
    }
    ready = (status & kStatusZyxda) != 0;
    return BusResult::OK;
}

BusResult Gyro_L3GD20::waitDataReady(uint32_t max_polls, uint32_t poll_interval_ms) {
    for (uint32_t i = 0; i < max_polls; i++) {
        bool ready = false;
        BusResult r = dataReady(ready);
        if (r != BusResult::OK) {
            return r;
        }
        if (ready) {
            return BusResult::OK;
        }
        if (i + 1 < max_polls) {
            m_delay(poll_interval_ms);
        }
    }
    return BusResult::ERR_NOT_READY;
}

BusResult Gyro_L3GD20::readAngularRate(AngularRate& rate) {
    uint8_t buf[kAxisBytes];
    BusResult r = m_bus->readRegisters(REG_OUT_X_L, buf, kAxisBytes);
    if (r != BusResult::OK) {
        return r;
    }

    // Table is mdps/LSB
    const float dps_per_lsb = gyroSensitivityMdps(m_scale) / 1000.0f;

    rate.x = static_cast<float>(le16(&buf[0])) * dps_per_lsb;
    rate.y = static_cast<float>(le16(&buf[2])) * dps_per_lsb;
    rate.z = static_cast<float>(le16(&buf[4])) * dps_per_lsb;
    return BusResult::OK;
}

BusResult Gyro_L3GD20::readTemperature(int8_t& temp) {
    uint8_t raw = 0;
    BusResult r = m_bus->readRegister(REG_OUT_TEMP, raw);
    if (r != BusResult::OK) {
        return r;
    }
    temp = static_cast<int8_t>(raw);
    return BusResult::OK;
}

} // namespace hal
} // namespace discosense
