// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Compass_LSM303DLHC.h
 * @brief LSM303DLHC e-compass driver (accelerometer + magnetometer)
 *
 * The two sub-devices sit at different 7-bit addresses on one I2C bus
 * and have unrelated register maps and byte orders:
 *   - accelerometer: 12-bit left-justified, little-endian, X/Y/Z
 *   - magnetometer:  16-bit big-endian, physical order X/Z/Y
 *
 * @see https://www.st.com/resource/en/datasheet/lsm303dlhc.pdf
 */

#ifndef DISCOSENSE_HAL_COMPASS_LSM303DLHC_H
#define DISCOSENSE_HAL_COMPASS_LSM303DLHC_H

#include "Bus.h"
#include "SensorScales.h"
#include "SensorTypes.h"

#include <cstdint>
#include <memory>

namespace discosense {
namespace hal {

/**
 * @brief LSM303DLHC driver
 *
 * Owns the shared I2C bus and retargets it to the accelerometer or
 * magnetometer address per transaction. Transactions are serialized by
 * call order; a second driver on the same bus (e.g. an audio codec)
 * needs external locking.
 *
 * @code
 * auto bus = std::make_unique<I2CBus>(i2c1, Compass_LSM303DLHC::ACCEL_ADDR,
 *                                     SDA_PIN, SCL_PIN, 100000);
 * Compass_LSM303DLHC compass(std::move(bus), Timing::delayMs);
 *
 * if (compass.begin() == BusResult::OK) {
 *     MagneticField field;
 *     if (compass.readMagneticField(field) == BusResult::OK) {
 *         float heading = ds::compass_heading_deg(field);
 *     }
 * }
 * @endcode
 */
class Compass_LSM303DLHC {
public:
    static constexpr uint8_t ACCEL_ADDR = 0x19;   // 0x32 >> 1
    static constexpr uint8_t MAG_ADDR   = 0x1E;   // 0x3C >> 1

    // Accelerometer registers
    static constexpr uint8_t REG_CTRL_REG1_A  = 0x20;
    static constexpr uint8_t REG_CTRL_REG2_A  = 0x21;
    static constexpr uint8_t REG_CTRL_REG3_A  = 0x22;
    static constexpr uint8_t REG_CTRL_REG4_A  = 0x23;
    static constexpr uint8_t REG_CTRL_REG5_A  = 0x24;
    static constexpr uint8_t REG_STATUS_REG_A = 0x27;
    static constexpr uint8_t REG_OUT_X_L_A    = 0x28;
    static constexpr uint8_t ACCEL_AUTO_INC   = 0x80;   // Sub-address MSB enables auto-increment

    // Magnetometer registers
    static constexpr uint8_t REG_CRA_REG_M    = 0x00;
    static constexpr uint8_t REG_CRB_REG_M    = 0x01;
    static constexpr uint8_t REG_MR_REG_M     = 0x02;
    static constexpr uint8_t REG_OUT_X_H_M    = 0x03;   // Then X_L, Z_H, Z_L, Y_H, Y_L
    static constexpr uint8_t REG_SR_REG_M     = 0x09;
    static constexpr uint8_t REG_TEMP_OUT_H_M = 0x31;
    static constexpr uint8_t REG_TEMP_OUT_L_M = 0x32;

    /**
     * @brief Construct driver, taking ownership of the shared bus
     * @param bus I2C bus wired to both sub-devices (not yet begun)
     * @param delay Millisecond delay hook
     */
    Compass_LSM303DLHC(std::unique_ptr<AddressableBus> bus, DelayFn delay);

    Compass_LSM303DLHC(const Compass_LSM303DLHC&) = delete;
    Compass_LSM303DLHC& operator=(const Compass_LSM303DLHC&) = delete;

    /**
     * @brief Configure both sub-devices
     *
     * Accelerometer: normal mode, 100 Hz, XYZ, no HPF, no FIFO,
     * high resolution, +/-2 g. Magnetometer: temperature sensor on,
     * 15 Hz, +/-1.3 gauss, continuous conversion. Each sub-device gets
     * a 10 ms settle delay.
     *
     * @return BusResult::OK, or the first bus error
     */
    BusResult begin();

    // ------------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------------

    /**
     * @brief Set accelerometer range (CTRL_REG4_A bits 4-5, read-modify-write)
     */
    BusResult setAccelScale(AccelScale scale);

    /**
     * @brief Set accelerometer data rate (CTRL_REG1_A bits 4-7, read-modify-write)
     */
    BusResult setAccelDataRate(AccelDataRate rate);

    /**
     * @brief Set magnetometer gain (overwrites CRB_REG_M)
     */
    BusResult setMagGain(MagGain gain);

    /**
     * @brief Set magnetometer data rate (CRA_REG_M bits 2-4, read-modify-write)
     */
    BusResult setMagDataRate(MagDataRate rate);

    // ------------------------------------------------------------------
    // Status
    // ------------------------------------------------------------------

    BusResult accelDataReady(bool& ready);
    BusResult magDataReady(bool& ready);

    /**
     * @brief Poll accelDataReady() / magDataReady() until set
     * @return OK when ready, ERR_NOT_READY on timeout, or a bus error
     */
    BusResult waitAccelDataReady(uint32_t max_polls, uint32_t poll_interval_ms);
    BusResult waitMagDataReady(uint32_t max_polls, uint32_t poll_interval_ms);

    // ------------------------------------------------------------------
    // Data
    // ------------------------------------------------------------------

    /**
     * @brief Burst-read accelerometer X/Y/Z
     * @param accel Output: acceleration in g
     */
    BusResult readAcceleration(Acceleration& accel);

    /**
     * @brief Burst-read magnetometer and remap X/Z/Y to X/Y/Z
     * @param mag Output: magnetic field in gauss
     */
    BusResult readMagneticField(MagneticField& mag);

    /**
     * @brief Read the magnetometer die temperature
     * @param raw Output: signed 12-bit value, 8 LSB/degC, uncalibrated offset
     */
    BusResult readTemperature(int16_t& raw);

    /**
     * @brief Convert readTemperature() output to degrees (relative)
     */
    static float temperatureToCelsius(int16_t raw) {
        return static_cast<float>(raw) / 8.0f;
    }

    AccelScale getAccelScale() const { return m_accel_scale; }
    AccelDataRate getAccelDataRate() const { return m_accel_rate; }
    MagGain getMagGain() const { return m_mag_gain; }
    MagDataRate getMagDataRate() const { return m_mag_rate; }

private:
    BusResult readAccel(uint8_t reg, uint8_t& value);
    BusResult writeAccel(uint8_t reg, uint8_t value);
    BusResult readMag(uint8_t reg, uint8_t& value);
    BusResult writeMag(uint8_t reg, uint8_t value);
    BusResult readBurst(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length);
    BusResult waitReady(bool accel, uint32_t max_polls, uint32_t poll_interval_ms);

    std::unique_ptr<AddressableBus> m_bus;
    DelayFn m_delay;
    AccelScale m_accel_scale;
    AccelDataRate m_accel_rate;
    MagGain m_mag_gain;
    MagDataRate m_mag_rate;
};

} // namespace hal
} // namespace discosense

#endif // DISCOSENSE_HAL_COMPASS_LSM303DLHC_H
