// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file Timing.cpp
 * @brief Time and delay utilities implementation
 *
 * @note Part of DiscoSense HAL - Hardware Abstraction Layer
 */

#include "Timing.h"

#include "pico/stdlib.h"
#include "hardware/timer.h"
#include "FreeRTOS.h"
#include "task.h"

namespace discosense {
namespace hal {

uint32_t Timing::millis32() {
    return static_cast<uint32_t>(time_us_64() / 1000ULL);
}

void Timing::delayMs(uint32_t ms) {
    if (xTaskGetSchedulerState() == taskSCHEDULER_RUNNING) {
        // Round up so a 1 ms poll never becomes a zero-tick yield
        TickType_t ticks = pdMS_TO_TICKS(ms);
        vTaskDelay(ticks > 0 ? ticks : 1);
    } else {
        busy_wait_us_32(ms * 1000);
    }
}

} // namespace hal
} // namespace discosense
