// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Bus.h
 * @brief Abstract bus interfaces for sensor register access
 *
 * Provides a unified register interface over I2C and SPI, so the sensor
 * drivers never see the wire protocol. Implementations (Bus.cpp) wrap the
 * Pico SDK; the abstract classes are pure C++ and compile on the host.
 *
 * @note Part of DiscoSense HAL - Hardware Abstraction Layer
 */

#ifndef DISCOSENSE_HAL_BUS_H
#define DISCOSENSE_HAL_BUS_H

#include <cstdint>
#include <cstddef>

namespace discosense {
namespace hal {

/**
 * @brief Result codes for bus and sensor operations
 *
 * Everything except OK and ERR_NOT_READY means the transaction did not
 * complete and any output buffer must be discarded.
 */
enum class BusResult : uint8_t {
    OK = 0,
    ERR_TIMEOUT,
    ERR_NACK,
    ERR_BUS_ERROR,          // Short transfer or framing failure
    ERR_INVALID_PARAM,
    ERR_NOT_INITIALIZED,
    ERR_NOT_READY           // Data-ready bit never observed set
};

/**
 * @brief Human-readable name for a result code (log output)
 */
inline const char* busResultName(BusResult result) {
    switch (result) {
        case BusResult::OK:                  return "OK";
        case BusResult::ERR_TIMEOUT:         return "TIMEOUT";
        case BusResult::ERR_NACK:            return "NACK";
        case BusResult::ERR_BUS_ERROR:       return "BUS_ERROR";
        case BusResult::ERR_INVALID_PARAM:   return "INVALID_PARAM";
        case BusResult::ERR_NOT_INITIALIZED: return "NOT_INITIALIZED";
        case BusResult::ERR_NOT_READY:       return "NOT_READY";
        default:                             return "UNKNOWN";
    }
}

// Pico SDK error returns (pico/error.h); Bus.cpp checks them against the SDK
constexpr int kSdkErrorGeneric = -1;
constexpr int kSdkErrorTimeout = -2;

/**
 * @brief Map a transfer return value to a BusResult
 *
 * @param result   Byte count or negative SDK error from the transfer call
 * @param expected Bytes requested
 *
 * A count other than the one requested is a partial transfer, not success.
 */
constexpr BusResult transferResult(int result, size_t expected) {
    if (result == kSdkErrorTimeout) {
        return BusResult::ERR_TIMEOUT;
    }
    if (result == kSdkErrorGeneric) {
        return BusResult::ERR_NACK;
    }
    if (result < 0 || static_cast<size_t>(result) != expected) {
        return BusResult::ERR_BUS_ERROR;
    }
    return BusResult::OK;
}

/**
 * @brief Abstract base class for sensor bus communication
 *
 * A bus object owns its peripheral and chip-select line. Drivers take it
 * by std::unique_ptr, so one bus object backs exactly one driver.
 *
 * @code
 * class Gyro_L3GD20 {
 * public:
 *     explicit Gyro_L3GD20(std::unique_ptr<SensorBus> bus, DelayFn delay);
 *
 *     BusResult readAngularRate(AngularRate& out) {
 *         uint8_t buf[6];
 *         BusResult r = m_bus->readRegisters(REG_OUT_X_L, buf, 6);
 *         if (r != BusResult::OK) {
 *             return r;
 *         }
 *         // Parse buffer...
 *     }
 * };
 * @endcode
 */
class SensorBus {
public:
    virtual ~SensorBus() = default;

    /**
     * @brief Initialize the bus
     * @return true if initialization successful
     */
    virtual bool begin() = 0;

    /**
     * @brief Read a single register
     * @param reg Register address
     * @param value Output value (untouched on error)
     * @return BusResult::OK on success
     */
    virtual BusResult readRegister(uint8_t reg, uint8_t& value) = 0;

    /**
     * @brief Read multiple consecutive registers in one transaction
     * @param reg Starting register address
     * @param buffer Output buffer
     * @param length Number of bytes to read
     * @return BusResult::OK on success
     */
    virtual BusResult readRegisters(uint8_t reg, uint8_t* buffer, size_t length) = 0;

    /**
     * @brief Write a single register
     * @param reg Register address
     * @param value Value to write
     * @return BusResult::OK on success
     */
    virtual BusResult writeRegister(uint8_t reg, uint8_t value) = 0;

    /**
     * @brief Get descriptive name for this bus instance
     * @return Bus identifier string (e.g., "I2C1:0x19", "SPI0:CS17")
     */
    virtual const char* getName() const = 0;

protected:
    SensorBus() = default;

private:
    // Non-copyable
    SensorBus(const SensorBus&) = delete;
    SensorBus& operator=(const SensorBus&) = delete;
};


/**
 * @brief Bus that can retarget its transactions to another device address
 *
 * Used when several sub-devices share one physical bus (LSM303DLHC
 * accelerometer and magnetometer). The address applies to every
 * transaction until changed.
 */
class AddressableBus : public SensorBus {
public:
    /**
     * @brief Change target address
     * @param address New 7-bit I2C address
     */
    virtual void setAddress(uint8_t address) = 0;

    /**
     * @brief Get current target address
     */
    virtual uint8_t getAddress() const = 0;
};


/**
 * @brief I2C bus implementation
 *
 * Wraps Pico SDK I2C functions. Register reads use a repeated start
 * between the address write and the data read. Every transfer carries
 * a timeout so a stuck device cannot hang the calling task.
 */
class I2CBus : public AddressableBus {
public:
    static constexpr uint32_t kTimeoutUs = 10000;

    /**
     * @brief Construct I2C bus instance
     * @param i2c_inst Pico SDK I2C instance (i2c0 or i2c1)
     * @param address 7-bit I2C device address
     * @param sda_pin SDA GPIO pin number
     * @param scl_pin SCL GPIO pin number
     * @param freq_hz Bus frequency (default 100kHz)
     */
    I2CBus(void* i2c_inst, uint8_t address, uint8_t sda_pin, uint8_t scl_pin,
           uint32_t freq_hz = 100000);

    ~I2CBus() override;

    bool begin() override;
    BusResult readRegister(uint8_t reg, uint8_t& value) override;
    BusResult readRegisters(uint8_t reg, uint8_t* buffer, size_t length) override;
    BusResult writeRegister(uint8_t reg, uint8_t value) override;
    const char* getName() const override;

    void setAddress(uint8_t address) override;
    uint8_t getAddress() const override { return m_address; }

private:
    void updateName();

    void* m_i2c;
    uint8_t m_address;
    uint8_t m_sda_pin;
    uint8_t m_scl_pin;
    uint32_t m_freq_hz;
    bool m_initialized;
    char m_name[16];
};


/**
 * @brief SPI bus implementation
 *
 * Wraps Pico SDK SPI functions with a GPIO-controlled chip select, held
 * low across the address phase and all data phases of a transaction.
 *
 * Command byte framing (ST convention):
 *   bit 7: 1 = read, 0 = write
 *   bit 6: 1 = auto-increment address on multi-byte transfers
 *   bits 0-5: register address
 */
class SPIBus : public SensorBus {
public:
    /**
     * @brief SPI mode (clock polarity and phase)
     */
    enum class Mode : uint8_t {
        MODE_0 = 0,  // CPOL=0, CPHA=0
        MODE_1 = 1,  // CPOL=0, CPHA=1
        MODE_2 = 2,  // CPOL=1, CPHA=0
        MODE_3 = 3   // CPOL=1, CPHA=1 (idle high, capture on second edge)
    };

    static constexpr uint8_t kReadFlag          = 0x80;
    static constexpr uint8_t kAutoIncrementFlag = 0x40;

    /**
     * @brief Build the command byte for a read transaction
     * @param reg Register address
     * @param length Number of data bytes that follow
     */
    static constexpr uint8_t readCommand(uint8_t reg, size_t length) {
        return (length > 1)
            ? static_cast<uint8_t>(reg | kReadFlag | kAutoIncrementFlag)
            : static_cast<uint8_t>(reg | kReadFlag);
    }

    /**
     * @brief Build the command byte for a single-register write
     */
    static constexpr uint8_t writeCommand(uint8_t reg) {
        return static_cast<uint8_t>(reg & static_cast<uint8_t>(~kReadFlag));
    }

    /**
     * @brief Construct SPI bus instance
     * @param spi_inst Pico SDK SPI instance (spi0 or spi1)
     * @param cs_pin Chip select GPIO pin
     * @param sck_pin Clock GPIO pin
     * @param mosi_pin MOSI GPIO pin
     * @param miso_pin MISO GPIO pin
     * @param freq_hz Bus frequency (default 8MHz, device limit is 10MHz)
     * @param mode SPI mode (default MODE_3)
     */
    SPIBus(void* spi_inst, uint8_t cs_pin, uint8_t sck_pin, uint8_t mosi_pin,
           uint8_t miso_pin, uint32_t freq_hz = 8000000, Mode mode = Mode::MODE_3);

    ~SPIBus() override;

    bool begin() override;
    BusResult readRegister(uint8_t reg, uint8_t& value) override;
    BusResult readRegisters(uint8_t reg, uint8_t* buffer, size_t length) override;
    BusResult writeRegister(uint8_t reg, uint8_t value) override;
    const char* getName() const override;

private:
    void selectDevice();
    void deselectDevice();

    void* m_spi;
    uint8_t m_cs_pin;
    uint8_t m_sck_pin;
    uint8_t m_mosi_pin;
    uint8_t m_miso_pin;
    uint32_t m_freq_hz;
    Mode m_mode;
    bool m_initialized;
    char m_name[16];
};

} // namespace hal
} // namespace discosense

#endif // DISCOSENSE_HAL_BUS_H
