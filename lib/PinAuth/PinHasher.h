/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/PinHasher.h
 *
 * Description:
 * Salted PIN hashing (PBKDF2-HMAC-SHA256, OpenSSL), constant-time comparison
 * and random hex tokens for salts, session tokens and record ids.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include "SafetyContext.h"

#define PIN_HASH_BYTES 32

class PinHasher {
public:
    // Deterministic for (pin, salt, iterations). Returns false if the digest failed.
    static bool hashPin(const std::string& pin, const std::string& salt, uint32_t iterations,
                        std::string& outHex);

    static bool verifyPin(const std::string& pin, const std::string& salt, uint32_t iterations,
                          const std::string& expectedHex, bool& matches);

    static bool constantTimeEquals(const std::string& a, const std::string& b);

    // Returns false if the context could not supply entropy.
    static bool randomHex(ISafetyContext& ctx, size_t byteCount, std::string& outHex);

    static std::string toHex(const uint8_t* data, size_t length);
};
