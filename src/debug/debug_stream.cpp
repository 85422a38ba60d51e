// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file debug_stream.cpp
 * @brief Deferred debug output implementation
 */

#include "debug_stream.h"

#include "FreeRTOS.h"
#include "stream_buffer.h"
#include "semphr.h"
#include "task.h"

#include <cstdio>

// ============================================================================
// Configuration
// ============================================================================

static constexpr size_t kStreamBufferSize = 4096;
static constexpr size_t kMaxMessageSize   = 256;
static constexpr size_t kFlushChunkSize   = 128;

// ============================================================================
// Private Data
// ============================================================================

static StreamBufferHandle_t s_stream = nullptr;

// Stream buffers allow one writer at a time; both sensor tasks write.
static SemaphoreHandle_t s_writeMutex = nullptr;

// Updated by every writer and reset by the flushing task; touch only
// inside a critical section.
static uint32_t s_dropped = 0;

static void countDropped() {
    taskENTER_CRITICAL();
    s_dropped++;
    taskEXIT_CRITICAL();
}

// ============================================================================
// Public API
// ============================================================================

void debug_stream_init(void) {
    if (s_stream != nullptr) {
        return;
    }
    s_stream = xStreamBufferCreate(kStreamBufferSize, 1);
    s_writeMutex = xSemaphoreCreateMutex();
}

int dbg_printf(const char* fmt, ...) {
    if (s_stream == nullptr || s_writeMutex == nullptr) {
        return 0;
    }

    char msg[kMaxMessageSize];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    if (len <= 0) {
        return 0;
    }
    size_t n = (static_cast<size_t>(len) < sizeof(msg)) ? static_cast<size_t>(len)
                                                         : sizeof(msg) - 1;

    // Never wait: a contended or full buffer drops the message
    if (xSemaphoreTake(s_writeMutex, 0) != pdTRUE) {
        countDropped();
        return 0;
    }
    size_t written = 0;
    if (xStreamBufferSpacesAvailable(s_stream) >= n) {
        written = xStreamBufferSend(s_stream, msg, n, 0);
    }
    xSemaphoreGive(s_writeMutex);

    if (written == 0) {
        countDropped();
    }
    return static_cast<int>(written);
}

void debug_stream_flush(void) {
    if (s_stream == nullptr) {
        return;
    }

    char chunk[kFlushChunkSize + 1];
    size_t n;
    while ((n = xStreamBufferReceive(s_stream, chunk, kFlushChunkSize, 0)) > 0) {
        chunk[n] = '\0';
        fputs(chunk, stdout);
    }

    taskENTER_CRITICAL();
    const uint32_t dropped = s_dropped;
    s_dropped = 0;
    taskEXIT_CRITICAL();

    if (dropped > 0) {
        printf("[debug] %lu message(s) dropped\n", static_cast<unsigned long>(dropped));
    }
    fflush(stdout);
}
