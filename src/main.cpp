// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
/**
 * @file main.cpp
 * @brief DiscoSense main entry point
 *
 * Brings up USB stdio and the debug stream, initializes the L3GD20 and
 * LSM303DLHC, then starts the FreeRTOS scheduler with one sampling task
 * per bus plus a low-priority UI task that flushes debug output, prints
 * sensor status and blinks the heartbeat LED.
 */

#include "discosense/config.h"
#include "debug.h"
#include "debug/debug_stream.h"
#include "services/SensorTask.h"

#include "pico/stdlib.h"
#include "hardware/gpio.h"

#include "FreeRTOS.h"
#include "task.h"

#include <stdio.h>

using namespace discosense;

// ============================================================================
// Constants
// ============================================================================

static constexpr uint32_t kUiTaskPriority   = 1;
static constexpr uint32_t kUiTaskStackWords = 1024;

// USB CDC enumeration wait before the banner
static constexpr uint32_t kUsbSettleMs      = 2000;

// ============================================================================
// UI Task
// ============================================================================

static void uiTask(void* /*params*/) {
    TickType_t lastWake = xTaskGetTickCount();
    const TickType_t period = pdMS_TO_TICKS(timing::kDebugFlushMs);
    uint32_t sinceStatusMs = 0;

    while (true) {
        debug_stream_flush();

        sinceStatusMs += timing::kDebugFlushMs;
        if (sinceStatusMs >= timing::kStatusPrintMs) {
            sinceStatusMs = 0;
            gpio_xor_mask(1u << pins::kLedRed);
            services::SensorTask_PrintStatus();
        }

        vTaskDelayUntil(&lastWake, period);
    }
}

// ============================================================================
// Main
// ============================================================================

int main() {
    stdio_init_all();

    gpio_init(pins::kLedRed);
    gpio_set_dir(pins::kLedRed, GPIO_OUT);
    gpio_put(pins::kLedRed, 1);

    sleep_ms(kUsbSettleMs);
    printf("\nDiscoSense v%s\n", kVersionString);

    debug_stream_init();

    if (!services::SensorTask_Init()) {
        printf("[main] No sensors available, status output only\n");
    }
    if (!services::SensorTask_Create()) {
        DBG_ERROR("[main] Sensor task creation failed\n");
    }

    if (xTaskCreate(uiTask, "UI", kUiTaskStackWords, nullptr, kUiTaskPriority,
                    nullptr) != pdPASS) {
        printf("[main] UI task creation failed\n");
    }

    gpio_put(pins::kLedRed, 0);
    vTaskStartScheduler();

    // Scheduler only returns if it could not allocate the idle task
    while (true) {
        tight_loop_contents();
    }
    return 0;
}

// ============================================================================
// FreeRTOS Hooks
// ============================================================================

extern "C" {

void vApplicationMallocFailedHook() {
    // Rapid LED blink to indicate malloc failure
    gpio_put(pins::kLedRed, 1);
    while (true) {
        gpio_xor_mask(1u << pins::kLedRed);
        busy_wait_ms(50);
    }
}

void vApplicationStackOverflowHook(TaskHandle_t task, char* name) {
    (void)task;
    printf("STACK OVERFLOW: %s\n", name);
    // Solid LED to indicate stack overflow
    gpio_put(pins::kLedRed, 1);
    while (true) {
        tight_loop_contents();
    }
}

// Idle task memory (Core 0)
static StaticTask_t g_idle_task_tcb;
static StackType_t g_idle_task_stack[configMINIMAL_STACK_SIZE];

void vApplicationGetIdleTaskMemory(StaticTask_t** tcb,
                                   StackType_t** stack,
                                   configSTACK_DEPTH_TYPE* stack_size) {
    *tcb = &g_idle_task_tcb;
    *stack = g_idle_task_stack;
    *stack_size = configMINIMAL_STACK_SIZE;
}

#if (configNUMBER_OF_CORES > 1)
// Passive idle task memory (Core 1)
static StaticTask_t g_passive_idle_tcb;
static StackType_t g_passive_idle_stack[configMINIMAL_STACK_SIZE];

void vApplicationGetPassiveIdleTaskMemory(StaticTask_t** tcb,
                                          StackType_t** stack,
                                          configSTACK_DEPTH_TYPE* stack_size,
                                          BaseType_t core) {
    (void)core;
    *tcb = &g_passive_idle_tcb;
    *stack = g_passive_idle_stack;
    *stack_size = configMINIMAL_STACK_SIZE;
}
#endif

// Timer task memory
static StaticTask_t g_timer_task_tcb;
static StackType_t g_timer_task_stack[configTIMER_TASK_STACK_DEPTH];

void vApplicationGetTimerTaskMemory(StaticTask_t** tcb,
                                    StackType_t** stack,
                                    configSTACK_DEPTH_TYPE* stack_size) {
    *tcb = &g_timer_task_tcb;
    *stack = g_timer_task_stack;
    *stack_size = configTIMER_TASK_STACK_DEPTH;
}

}  // extern "C"
