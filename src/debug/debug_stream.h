// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file debug_stream.h
 * @brief Deferred debug output via FreeRTOS Stream Buffer
 *
 * Non-blocking debug output for the sensor tasks. Messages go into a
 * FreeRTOS stream buffer and are flushed to stdout (USB CDC) by the
 * low-priority UI task.
 *
 * Usage:
 *   - Call debug_stream_init() before scheduler starts
 *   - Use dbg_printf() instead of printf() in sensor task code
 *   - Call debug_stream_flush() periodically from the UI task
 *
 * printf() from a sensor task can block on the USB CDC mutex and stall the
 * sampling loop; dbg_printf() never blocks.
 */

#ifndef DISCOSENSE_DEBUG_STREAM_H
#define DISCOSENSE_DEBUG_STREAM_H

#include <stdarg.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Initialize debug stream buffer
 *
 * Must be called before vTaskStartScheduler().
 * Creates the internal FreeRTOS stream buffer.
 */
void debug_stream_init(void);

/**
 * @brief Non-blocking printf alternative
 *
 * Formats message and writes to stream buffer without blocking.
 * Safe to call from any task at any priority.
 *
 * @param fmt Format string (printf-style)
 * @param ... Format arguments
 * @return Number of bytes written, or 0 if buffer full
 *
 * @note If buffer is full, message is silently dropped (no blocking)
 * @note Maximum single message size is 256 bytes
 */
int dbg_printf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/**
 * @brief Flush buffered output to USB CDC
 *
 * Reads from stream buffer and writes to stdout via printf().
 * Call only from the UI task.
 *
 * @note May block on USB CDC
 */
void debug_stream_flush(void);

#ifdef __cplusplus
}
#endif

#endif // DISCOSENSE_DEBUG_STREAM_H
