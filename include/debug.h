// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file debug.h
 * @brief Compile-time guarded debug output macros
 *
 * DBG_PRINT and DBG_ERROR are enabled only when CONFIG_DEBUG is defined
 * (the firmware target defines it for Debug builds). Otherwise they
 * compile to no-ops and their arguments are not evaluated.
 *
 * Output format: one line per call, prefixed with the module tag.
 *
 *   DBG_PRINT("[L3GD20] Initialized on %s\n", bus->getName());
 *   DBG_ERROR("[LSM303] Mag read failed: %s\n", busResultName(r));
 *
 * These go straight to stdout and may block on USB CDC. Code running in
 * sensor tasks after the scheduler starts should use dbg_printf() from
 * debug/debug_stream.h instead.
 */

#ifndef DISCOSENSE_DEBUG_H
#define DISCOSENSE_DEBUG_H

#include <cstdio>

#ifdef CONFIG_DEBUG

#define DBG_PRINT(fmt, ...) printf(fmt, ##__VA_ARGS__)
#define DBG_ERROR(fmt, ...) printf("ERROR: " fmt, ##__VA_ARGS__)

#else

#define DBG_PRINT(fmt, ...) do {} while(0)
#define DBG_ERROR(fmt, ...) do {} while(0)

#endif // CONFIG_DEBUG

#endif // DISCOSENSE_DEBUG_H
