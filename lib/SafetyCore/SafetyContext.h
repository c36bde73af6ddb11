/*
 * =================================================================================
 * File:      lib/SafetyCore/SafetyContext.h
 * Description: Abstraction layer for clocks, randomness and logging.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

class ISafetyContext {
public:
    virtual ~ISafetyContext() {}

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Clocks ---
    // Monotonic milliseconds. Used for liveness timing (watchdog) only.
    virtual unsigned long getMillis() = 0;

    // Wall clock, UTC seconds since epoch. Used for every persisted timestamp.
    virtual int64_t getEpochSeconds() = 0;

    // --- Randomness ---
    // Fills buffer with cryptographically secure random bytes.
    // Returns false if the entropy source failed; callers must not proceed.
    virtual bool fillRandom(uint8_t* buffer, size_t length) = 0;
};
