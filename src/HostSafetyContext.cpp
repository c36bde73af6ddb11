/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      src/HostSafetyContext.cpp
 * =================================================================================
 */
#include <limits.h>
#include <openssl/rand.h>

#include "HostSafetyContext.h"
#include "Logger.h"

HostSafetyContext::HostSafetyContext() : _bootTime(std::chrono::steady_clock::now()) {}

void HostSafetyContext::log(const char* message) {
    logMessage(message);
}

unsigned long HostSafetyContext::getMillis() {
    return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - _bootTime).count();
}

int64_t HostSafetyContext::getEpochSeconds() {
    return (int64_t)std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

bool HostSafetyContext::fillRandom(uint8_t* buffer, size_t length) {
    if (length > (size_t)INT_MAX) return false;
    return RAND_bytes(buffer, (int)length) == 1;
}
