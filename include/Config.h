/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file for the host daemon. Defines identity strings,
 * default file locations and main-loop timing.
 * =================================================================================
 */
#pragma once

// --- Identity ---
#define DEVICE_NAME "rvsafetyd"
#define DEVICE_VERSION "1.0.0"

// =================================================================================
// SECTION: FILES
// =================================================================================

#define DEFAULT_CONFIG_PATH "/etc/rvsafety/rvsafety.json"

// =================================================================================
// SECTION: MAIN LOOP
// =================================================================================

#define MAIN_LOOP_INTERVAL_MS 50
#define SESSION_SWEEP_INTERVAL_MS 60000 // Expired PIN session cleanup
