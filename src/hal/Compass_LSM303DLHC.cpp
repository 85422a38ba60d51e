// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Compass_LSM303DLHC.cpp
 * @brief LSM303DLHC e-compass driver implementation
 */

#include "Compass_LSM303DLHC.h"
#include "debug.h"

#include <utility>

namespace discosense {
namespace hal {

// ============================================================================
// Bit Definitions
// ============================================================================

namespace {
    // CTRL_REG1_A: ODR 100 Hz (0x50) | normal power | Zen | Yen | Xen
    constexpr uint8_t kCtrl1ADefault    = 0x57;
    constexpr uint8_t kCtrl1ARateMask   = 0xF0;

    // CTRL_REG4_A: continuous update, +/-2 g, high resolution (HR)
    constexpr uint8_t kCtrl4ADefault    = 0x08;
    constexpr uint8_t kCtrl4AScaleMask  = 0x30;

    // CRA_REG_M: TEMP_EN | 15 Hz
    constexpr uint8_t kCraTempEnable    = (1U << 7);
    constexpr uint8_t kCraRateMask      = 0x1C;

    // MR_REG_M: continuous conversion
    constexpr uint8_t kMrContinuous     = 0x00;

    // Status bits
    constexpr uint8_t kStatusAZyxda     = (1U << 3);
    constexpr uint8_t kSrMDrdy          = (1U << 0);

    constexpr uint32_t kSettleDelayMs   = 10;
    constexpr size_t kAxisBytes         = 6;

    int16_t le16(const uint8_t* p) {
        return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                    (static_cast<uint16_t>(p[1]) << 8));
    }

    int16_t be16(const uint8_t* p) {
        return static_cast<int16_t>((static_cast<uint16_t>(p[0]) << 8) |
                                    static_cast<uint16_t>(p[1]));
    }
} // namespace

// ============================================================================
// Constructor / Initialization
// ============================================================================

Compass_LSM303DLHC::Compass_LSM303DLHC(std::unique_ptr<AddressableBus> bus, DelayFn delay)
    : m_bus(std::move(bus))
    , m_delay(delay)
    , m_accel_scale(AccelScale::G_2)
    , m_accel_rate(AccelDataRate::HZ_100)
    , m_mag_gain(MagGain::GAUSS_1_3)
    , m_mag_rate(MagDataRate::HZ_15)
{
}

BusResult Compass_LSM303DLHC::begin() {
    if (!m_bus || !m_bus->begin()) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    const struct {
        uint8_t reg;
        uint8_t value;
    } accel_seq[] = {
        {REG_CTRL_REG1_A, kCtrl1ADefault},
        {REG_CTRL_REG2_A, 0x00},    // No high-pass filter
        {REG_CTRL_REG3_A, 0x00},    // No interrupts
        {REG_CTRL_REG4_A, kCtrl4ADefault},
        {REG_CTRL_REG5_A, 0x00},    // No FIFO
    };

    for (const auto& step : accel_seq) {
        BusResult r = writeAccel(step.reg, step.value);
        if (r != BusResult::OK) {
            DBG_ERROR("[LSM303] Accel init write 0x%02X failed: %s\n",
                      step.reg, busResultName(r));
            return r;
        }
    }
    m_accel_scale = AccelScale::G_2;
    m_accel_rate = AccelDataRate::HZ_100;

    m_delay(kSettleDelayMs);

    const struct {
        uint8_t reg;
        uint8_t value;
    } mag_seq[] = {
        {REG_CRA_REG_M, static_cast<uint8_t>(kCraTempEnable |
                                             static_cast<uint8_t>(MagDataRate::HZ_15))},
        {REG_CRB_REG_M, static_cast<uint8_t>(MagGain::GAUSS_1_3)},
        {REG_MR_REG_M,  kMrContinuous},
    };

    for (const auto& step : mag_seq) {
        BusResult r = writeMag(step.reg, step.value);
        if (r != BusResult::OK) {
            DBG_ERROR("[LSM303] Mag init write 0x%02X failed: %s\n",
                      step.reg, busResultName(r));
            return r;
        }
    }
    m_mag_gain = MagGain::GAUSS_1_3;
    m_mag_rate = MagDataRate::HZ_15;

    m_delay(kSettleDelayMs);

    DBG_PRINT("[LSM303] Initialized (accel 0x%02X, mag 0x%02X)\n", ACCEL_ADDR, MAG_ADDR);
    return BusResult::OK;
}

// ============================================================================
// Configuration
// ============================================================================

BusResult Compass_LSM303DLHC::setAccelScale(AccelScale scale) {
    uint8_t ctrl4 = 0;
    BusResult r = readAccel(REG_CTRL_REG4_A, ctrl4);
    if (r != BusResult::OK) {
        return r;
    }
    ctrl4 = static_cast<uint8_t>((ctrl4 & ~kCtrl4AScaleMask) | static_cast<uint8_t>(scale));
    r = writeAccel(REG_CTRL_REG4_A, ctrl4);
    if (r != BusResult::OK) {
        return r;
    }
    m_accel_scale = scale;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::setAccelDataRate(AccelDataRate rate) {
    uint8_t ctrl1 = 0;
    BusResult r = readAccel(REG_CTRL_REG1_A, ctrl1);
    if (r != BusResult::OK) {
        return r;
    }
    ctrl1 = static_cast<uint8_t>((ctrl1 & ~kCtrl1ARateMask) | static_cast<uint8_t>(rate));
    r = writeAccel(REG_CTRL_REG1_A, ctrl1);
    if (r != BusResult::OK) {
        return r;
    }
    m_accel_rate = rate;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::setMagGain(MagGain gain) {
    // CRB_REG_M bits 0-4 must be zero, so no read-back needed
    BusResult r = writeMag(REG_CRB_REG_M, static_cast<uint8_t>(gain));
    if (r != BusResult::OK) {
        return r;
    }
    m_mag_gain = gain;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::setMagDataRate(MagDataRate rate) {
    uint8_t cra = 0;
    BusResult r = readMag(REG_CRA_REG_M, cra);
    if (r != BusResult::OK) {
        return r;
    }
    cra = static_cast<uint8_t>((cra & ~kCraRateMask) | static_cast<uint8_t>(rate));
    r = writeMag(REG_CRA_REG_M, cra);
    if (r != BusResult::OK) {
        return r;
    }
    m_mag_rate = rate;
    return BusResult::OK;
}

// ============================================================================
// Status
// ============================================================================

BusResult Compass_LSM303DLHC::accelDataReady(bool& ready) {
    uint8_t status = 0;
    BusResult r = readAccel(REG_STATUS_REG_A, status);
    if (r != BusResult::OK) {
        return r;
    }
    ready = (status & kStatusAZyxda) != 0;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::magDataReady(bool& ready) {
    uint8_t status = 0;
    BusResult r = readMag(REG_SR_REG_M, status);
    if (r != BusResult::OK) {
        return r;
    }
    ready = (status & kSrMDrdy) != 0;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::waitReady(bool accel, uint32_t max_polls,
                                        uint32_t poll_interval_ms) {
    for (uint32_t i = 0; i < max_polls; i++) {
        bool ready = false;
        BusResult r = accel ? accelDataReady(ready) : magDataReady(ready);
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

BusResult Compass_LSM303DLHC::waitAccelDataReady(uint32_t max_polls, uint32_t poll_interval_ms) {
    return waitReady(true, max_polls, poll_interval_ms);
}

BusResult Compass_LSM303DLHC::waitMagDataReady(uint32_t max_polls, uint32_t poll_interval_ms) {
    return waitReady(false, max_polls, poll_interval_ms);
}

// ============================================================================
// Data Reading
// ============================================================================

BusResult Compass_LSM303DLHC::readAcceleration(Acceleration& accel) {
    uint8_t buf[kAxisBytes];
    BusResult r = readBurst(ACCEL_ADDR,
                            static_cast<uint8_t>(REG_OUT_X_L_A | ACCEL_AUTO_INC),
                            buf, kAxisBytes);
    if (r != BusResult::OK) {
        return r;
    }

    // 12-bit left-justified: arithmetic shift drops the 4 unused LSBs
    const int16_t raw_x = static_cast<int16_t>(le16(&buf[0]) >> 4);
    const int16_t raw_y = static_cast<int16_t>(le16(&buf[2]) >> 4);
    const int16_t raw_z = static_cast<int16_t>(le16(&buf[4]) >> 4);

    const float g_per_lsb = accelSensitivityMg(m_accel_scale) / 1000.0f;

    accel.x = static_cast<float>(raw_x) * g_per_lsb;
    accel.y = static_cast<float>(raw_y) * g_per_lsb;
    accel.z = static_cast<float>(raw_z) * g_per_lsb;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::readMagneticField(MagneticField& mag) {
    uint8_t buf[kAxisBytes];
    BusResult r = readBurst(MAG_ADDR, REG_OUT_X_H_M, buf, kAxisBytes);
    if (r != BusResult::OK) {
        return r;
    }

    // Register order on the die is X, Z, Y
    const int16_t raw_x = be16(&buf[0]);
    const int16_t raw_z = be16(&buf[2]);
    const int16_t raw_y = be16(&buf[4]);

    const float sens_xy = magSensitivityXY(m_mag_gain);
    const float sens_z = magSensitivityZ(m_mag_gain);

    mag.x = static_cast<float>(raw_x) / sens_xy;
    mag.y = static_cast<float>(raw_y) / sens_xy;
    mag.z = static_cast<float>(raw_z) / sens_z;
    return BusResult::OK;
}

BusResult Compass_LSM303DLHC::readTemperature(int16_t& raw) {
    uint8_t high = 0;
    uint8_t low = 0;

    BusResult r = readMag(REG_TEMP_OUT_H_M, high);
    if (r != BusResult::OK) {
        return r;
    }
    r = readMag(REG_TEMP_OUT_L_M, low);
    if (r != BusResult::OK) {
        return r;
    }

    const uint8_t bytes[2] = {high, low};
    raw = static_cast<int16_t>(be16(bytes) >> 4);
    return BusResult::OK;
}

// ============================================================================
// Internal Helpers
// ============================================================================

BusResult Compass_LSM303DLHC::readAccel(uint8_t reg, uint8_t& value) {
    m_bus->setAddress(ACCEL_ADDR);
    return m_bus->readRegister(reg, value);
}

BusResult Compass_LSM303DLHC::writeAccel(uint8_t reg, uint8_t value) {
    m_bus->setAddress(ACCEL_ADDR);
    return m_bus->writeRegister(reg, value);
}

BusResult Compass_LSM303DLHC::readMag(uint8_t reg, uint8_t& value) {
    m_bus->setAddress(MAG_ADDR);
    return m_bus->readRegister(reg, value);
}

BusResult Compass_LSM303DLHC::writeMag(uint8_t reg, uint8_t value) {
    m_bus->setAddress(MAG_ADDR);
    return m_bus->writeRegister(reg, value);
}

BusResult Compass_LSM303DLHC::readBurst(uint8_t address, uint8_t reg,
                                        uint8_t* buffer, size_t length) {
    m_bus->setAddress(address);
    return m_bus->readRegisters(reg, buffer, length);
}

} // namespace hal
} // namespace discosense
