// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Timing.h
 * @brief Time and delay utilities
 *
 * Wraps the Pico SDK hardware timer and FreeRTOS delays. Timing::delayMs
 * is the DelayFn handed to the sensor drivers in firmware builds.
 *
 * @note Part of DiscoSense HAL - Hardware Abstraction Layer
 */

#ifndef DISCOSENSE_HAL_TIMING_H
#define DISCOSENSE_HAL_TIMING_H

#include <cstdint>

namespace discosense {
namespace hal {

class Timing {
public:
    /**
     * @brief Milliseconds since boot (wraps every ~49 days)
     */
    static uint32_t millis32();

    /**
     * @brief Delay in milliseconds (RTOS-aware)
     *
     * Yields to the FreeRTOS scheduler when it is running, so other tasks
     * proceed during sensor settle times and data-ready polling. Before
     * the scheduler starts this falls back to a busy wait.
     *
     * @param ms Milliseconds to delay
     */
    static void delayMs(uint32_t ms);

private:
    Timing() = delete;  // Static-only class
};

} // namespace hal
} // namespace discosense

#endif // DISCOSENSE_HAL_TIMING_H
