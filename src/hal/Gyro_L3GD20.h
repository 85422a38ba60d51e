// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Gyro_L3GD20.h
 * @brief L3GD20 3-axis gyroscope driver
 *
 * Direct register driver over the DiscoSense SensorBus (SPI, mode 3,
 * up to 10 MHz). 16-bit little-endian output per axis, +/-250/500/2000 dps.
 *
 * @see https://www.st.com/resource/en/datasheet/l3gd20.pdf
 */

#ifndef DISCOSENSE_HAL_GYRO_L3GD20_H
#define DISCOSENSE_HAL_GYRO_L3GD20_H

#include "Bus.h"
#include "SensorScales.h"
#include "SensorTypes.h"

#include <cstdint>
#include <memory>

namespace discosense {
namespace hal {

/**
 * @brief L3GD20 gyroscope driver
 *
 * Owns its bus. All methods are blocking and strictly ordered; call from
 * a single task only.
 *
 * @code
 * auto bus = std::make_unique<SPIBus>(spi0, CS_PIN, SCK_PIN, MOSI_PIN, MISO_PIN);
 * Gyro_L3GD20 gyro(std::move(bus), Timing::delayMs);
 *
 * if (gyro.begin() == BusResult::OK) {
 *     gyro.setFullScale(GyroFullScale::DPS_500);
 *
 *     AngularRate rate;
 *     if (gyro.waitDataReady(10, 1) == BusResult::OK &&
 *         gyro.readAngularRate(rate) == BusResult::OK) {
 *         // rate.x/y/z in dps
 *     }
 * }
 * @endcode
 */
class Gyro_L3GD20 {
public:
    static constexpr uint8_t DEVICE_ID     = 0xD4;
    static constexpr uint8_t DEVICE_ID_ALT = 0xD7;  // Reported by some silicon revisions

    static constexpr uint8_t REG_WHO_AM_I   = 0x0F;
    static constexpr uint8_t REG_CTRL_REG1  = 0x20;
    static constexpr uint8_t REG_CTRL_REG2  = 0x21;
    static constexpr uint8_t REG_CTRL_REG3  = 0x22;
    static constexpr uint8_t REG_CTRL_REG4  = 0x23;
    static constexpr uint8_t REG_CTRL_REG5  = 0x24;
    static constexpr uint8_t REG_REFERENCE  = 0x25;
    static constexpr uint8_t REG_OUT_TEMP   = 0x26;
    static constexpr uint8_t REG_STATUS_REG = 0x27;
    static constexpr uint8_t REG_OUT_X_L    = 0x28;

    /**
     * @brief Construct driver, taking ownership of the bus
     * @param bus SPI bus wired to the L3GD20 (not yet begun)
     * @param delay Millisecond delay hook
     */
    Gyro_L3GD20(std::unique_ptr<SensorBus> bus, DelayFn delay);

    Gyro_L3GD20(const Gyro_L3GD20&) = delete;
    Gyro_L3GD20& operator=(const Gyro_L3GD20&) = delete;

    /**
     * @brief Bring up the bus and power on the sensor
     *
     * Reads WHO_AM_I (mismatch is logged, not fatal), enables all three
     * axes at 95 Hz / 250 dps and waits for the charge pump to settle.
     *
     * @return BusResult::OK, or the first bus error
     */
    BusResult begin();

    /**
     * @brief Set full-scale range
     *
     * Read-modify-write of CTRL_REG4 bits 4-5. The stored range only
     * changes once the write has succeeded.
     */
    BusResult setFullScale(GyroFullScale scale);

    /**
     * @brief Set output data rate and bandwidth
     *
     * Read-modify-write of CTRL_REG1 bits 4-7; power and axis-enable
     * bits are preserved.
     */
    BusResult setDataRate(GyroDataRate rate);

    /**
     * @brief Put the sensor into power-down mode (clears CTRL_REG1 PD)
     */
    BusResult powerDown();

    /**
     * @brief Check the ZYXDA (all axes new data) status bit
     * @param ready Output: true when a fresh sample is available
     */
    BusResult dataReady(bool& ready);

    /**
     * @brief Poll dataReady() until set or the poll budget runs out
     * @param max_polls Number of status reads before giving up
     * @param poll_interval_ms Delay between status reads
     * @return OK when ready, ERR_NOT_READY on timeout, or a bus error
     */
    BusResult waitDataReady(uint32_t max_polls, uint32_t poll_interval_ms);

    /**
     * @brief Burst-read all three axes
     * @param rate Output: angular rate in dps
     */
    BusResult readAngularRate(AngularRate& rate);

    /**
     * @brief Read die temperature
     * @param temp Output: raw OUT_TEMP, 1 LSB/degC, no offset applied
     */
    BusResult readTemperature(int8_t& temp);

    GyroFullScale getFullScale() const { return m_scale; }
    GyroDataRate getDataRate() const { return m_rate; }
    bool isPoweredOn() const { return m_powered; }

    /**
     * @brief Whether WHO_AM_I matched a documented value at begin()
     */
    bool identityMatched() const { return m_identity_ok; }
    uint8_t identity() const { return m_who_am_i; }

private:
    BusResult modifyRegister(uint8_t reg, uint8_t keep_mask, uint8_t bits);

    std::unique_ptr<SensorBus> m_bus;
    DelayFn m_delay;
    GyroFullScale m_scale;
    GyroDataRate m_rate;
    bool m_powered;
    bool m_identity_ok;
    uint8_t m_who_am_i;
};

} // namespace hal
} // namespace discosense

#endif // DISCOSENSE_HAL_GYRO_L3GD20_H
