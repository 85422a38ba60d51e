// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file SensorCounters.h
 * @brief Per-task sampling counters
 *
 * Each sampling task owns one TaskCounters block and is its only writer.
 * Other tasks read them for status output and may see a slightly stale
 * count, never a lost update.
 *
 * @note Part of DiscoSense Services Layer
 */

#ifndef DISCOSENSE_SERVICES_SENSOR_COUNTERS_H
#define DISCOSENSE_SERVICES_SENSOR_COUNTERS_H

#include "hal/Bus.h"

#include <cstdint>

namespace discosense {
namespace services {

struct TaskCounters {
    uint32_t bus_errors;
    uint32_t not_ready;
    uint32_t overruns;          // Sample period missed
};

/**
 * @brief Count a failed step of one sampling cycle
 * @return true if r is a bus error (worth a log line)
 */
inline bool countFailure(TaskCounters& counters, hal::BusResult r) {
    if (r == hal::BusResult::OK) {
        return false;
    }
    if (r == hal::BusResult::ERR_NOT_READY) {
        counters.not_ready++;
        return false;
    }
    counters.bus_errors++;
    return true;
}

/**
 * @brief Per-task counters plus sample totals
 */
struct SensorTaskStats {
    uint32_t gyro_samples;
    uint32_t accel_samples;
    uint32_t mag_samples;
    TaskCounters gyro;          // Written by the gyro task only
    TaskCounters compass;       // Written by the compass task only
};

} // namespace services
} // namespace discosense

#endif // DISCOSENSE_SERVICES_SENSOR_COUNTERS_H
