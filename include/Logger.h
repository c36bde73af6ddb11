/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Thread-safe logging system. Callers on any thread push into an output queue
 * that the main loop drains to stderr.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

// =================================================================================
// SECTION: LOGGING CONSTANTS & MACROS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="
#define LOG_SEP_MINOR "--------------------------------------------------------------------------"

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);
void logKeyValue(const char *key, const char *value);
void processLogQueue();
void flushLogQueue(); // Drains everything (startup errors, shutdown)

#endif
