/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      include/HostSafetyContext.h
 *
 * Description:
 * Linux implementation of ISafetyContext. Monotonic time from steady_clock,
 * wall time from system_clock, randomness from OpenSSL RAND_bytes, logging
 * through the Logger queue.
 * =================================================================================
 */
#pragma once
#include <chrono>
#include "SafetyContext.h"

class HostSafetyContext : public ISafetyContext {
public:
    HostSafetyContext();

    void log(const char* message) override;
    unsigned long getMillis() override;
    int64_t getEpochSeconds() override;
    bool fillRandom(uint8_t* buffer, size_t length) override;

private:
    std::chrono::steady_clock::time_point _bootTime;
};
