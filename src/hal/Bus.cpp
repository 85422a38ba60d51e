// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Bus.cpp
 * @brief I2C and SPI register access over the Pico SDK
 *
 * @note Part of DiscoSense HAL - Hardware Abstraction Layer
 */

#include "Bus.h"

#include "hardware/i2c.h"
#include "hardware/spi.h"
#include "hardware/gpio.h"
#include "pico/stdlib.h"

#include <cstdio>

namespace discosense {
namespace hal {

static_assert(kSdkErrorGeneric == PICO_ERROR_GENERIC, "SDK error code changed");
static_assert(kSdkErrorTimeout == PICO_ERROR_TIMEOUT, "SDK error code changed");

// ============================================================================
// I2CBus class implementation
// ============================================================================

I2CBus::I2CBus(void* i2c_inst, uint8_t address, uint8_t sda_pin, uint8_t scl_pin,
               uint32_t freq_hz)
    : m_i2c(i2c_inst)
    , m_address(address)
    , m_sda_pin(sda_pin)
    , m_scl_pin(scl_pin)
    , m_freq_hz(freq_hz)
    , m_initialized(false)
{
    updateName();
}

I2CBus::~I2CBus() {
    if (m_initialized) {
        i2c_deinit(static_cast<i2c_inst_t*>(m_i2c));
    }
}

bool I2CBus::begin() {
    if (m_initialized) {
        return true;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    i2c_init(i2c, m_freq_hz);

    gpio_set_function(m_sda_pin, GPIO_FUNC_I2C);
    gpio_set_function(m_scl_pin, GPIO_FUNC_I2C);

    // Enable pull-ups (required for I2C)
    gpio_pull_up(m_sda_pin);
    gpio_pull_up(m_scl_pin);

    m_initialized = true;
    return true;
}

BusResult I2CBus::readRegister(uint8_t reg, uint8_t& value) {
    return readRegisters(reg, &value, 1);
}

BusResult I2CBus::readRegisters(uint8_t reg, uint8_t* buffer, size_t length) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    if (buffer == nullptr || length == 0) {
        return BusResult::ERR_INVALID_PARAM;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    // Address phase, nostop=true for the repeated start
    int result = i2c_write_timeout_us(i2c, m_address, &reg, 1, true, kTimeoutUs);
    BusResult status = transferResult(result, 1);
    if (status != BusResult::OK) {
        return status;
    }

    result = i2c_read_timeout_us(i2c, m_address, buffer, length, false, kTimeoutUs);
    return transferResult(result, length);
}

BusResult I2CBus::writeRegister(uint8_t reg, uint8_t value) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    const uint8_t frame[2] = {reg, value};
    int result = i2c_write_timeout_us(i2c, m_address, frame, sizeof(frame), false, kTimeoutUs);
    return transferResult(result, sizeof(frame));
}

const char* I2CBus::getName() const {
    return m_name;
}

void I2CBus::setAddress(uint8_t address) {
    if (address == m_address) {
        return;
    }
    m_address = address;
    updateName();
}

void I2CBus::updateName() {
    snprintf(m_name, sizeof(m_name), "I2C%d:0x%02X",
             (m_i2c == i2c0) ? 0 : 1, m_address);
}

// ============================================================================
// SPIBus class implementation
// ============================================================================

SPIBus::SPIBus(void* spi_inst, uint8_t cs_pin, uint8_t sck_pin, uint8_t mosi_pin,
               uint8_t miso_pin, uint32_t freq_hz, Mode mode)
    : m_spi(spi_inst)
    , m_cs_pin(cs_pin)
    , m_sck_pin(sck_pin)
    , m_mosi_pin(mosi_pin)
    , m_miso_pin(miso_pin)
    , m_freq_hz(freq_hz)
    , m_mode(mode)
    , m_initialized(false)
{
    snprintf(m_name, sizeof(m_name), "SPI%d:CS%d",
             (spi_inst == spi0) ? 0 : 1, cs_pin);
}

SPIBus::~SPIBus() {
    if (m_initialized) {
        deselectDevice();
        spi_deinit(static_cast<spi_inst_t*>(m_spi));
    }
}

bool SPIBus::begin() {
    if (m_initialized) {
        return true;
    }

    spi_inst_t* spi = static_cast<spi_inst_t*>(m_spi);

    spi_init(spi, m_freq_hz);

    // Configure SPI mode (CPOL and CPHA)
    spi_cpol_t cpol = (static_cast<uint8_t>(m_mode) & 0x02) ? SPI_CPOL_1 : SPI_CPOL_0;
    spi_cpha_t cpha = (static_cast<uint8_t>(m_mode) & 0x01) ? SPI_CPHA_1 : SPI_CPHA_0;
    spi_set_format(spi, 8, cpol, cpha, SPI_MSB_FIRST);

    gpio_set_function(m_sck_pin, GPIO_FUNC_SPI);
    gpio_set_function(m_mosi_pin, GPIO_FUNC_SPI);
    gpio_set_function(m_miso_pin, GPIO_FUNC_SPI);

    // CS is GPIO-controlled so it stays low across burst transfers
    gpio_init(m_cs_pin);
    gpio_set_dir(m_cs_pin, GPIO_OUT);
    gpio_put(m_cs_pin, 1);

    m_initialized = true;
    return true;
}

void SPIBus::selectDevice() {
    gpio_put(m_cs_pin, 0);
}

void SPIBus::deselectDevice() {
    gpio_put(m_cs_pin, 1);
}

BusResult SPIBus::readRegister(uint8_t reg, uint8_t& value) {
    return readRegisters(reg, &value, 1);
}

BusResult SPIBus::readRegisters(uint8_t reg, uint8_t* buffer, size_t length) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    if (buffer == nullptr || length == 0) {
        return BusResult::ERR_INVALID_PARAM;
    }

    spi_inst_t* spi = static_cast<spi_inst_t*>(m_spi);

    selectDevice();

    const uint8_t cmd = readCommand(reg, length);
    int written = spi_write_blocking(spi, &cmd, 1);

    // Dummy 0x00 clocked out while the register data shifts in
    int read = 0;
    if (written == 1) {
        read = spi_read_blocking(spi, 0x00, buffer, length);
    }

    deselectDevice();

    if (written != 1) {
        return BusResult::ERR_BUS_ERROR;
    }
    return transferResult(read, length);
}

BusResult SPIBus::writeRegister(uint8_t reg, uint8_t value) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    spi_inst_t* spi = static_cast<spi_inst_t*>(m_spi);

    const uint8_t frame[2] = {writeCommand(reg), value};

    selectDevice();
    int written = spi_write_blocking(spi, frame, sizeof(frame));
    deselectDevice();

    return transferResult(written, sizeof(frame));
}

const char* SPIBus::getName() const {
    return m_name;
}

} // namespace hal
} // namespace discosense
