/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/PinHasher.cpp
 * =================================================================================
 */
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "PinHasher.h"

std::string PinHasher::toHex(const uint8_t* data, size_t length) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; i++) {
        out.push_back(HEX[data[i] >> 4]);
        out.push_back(HEX[data[i] & 0x0F]);
    }
    return out;
}

bool PinHasher::hashPin(const std::string& pin, const std::string& salt, uint32_t iterations,
                        std::string& outHex) {
    unsigned char digest[PIN_HASH_BYTES];
    int rounds = iterations > 0 ? (int)iterations : 1;

    int rc = PKCS5_PBKDF2_HMAC(pin.data(), (int)pin.size(),
                               reinterpret_cast<const unsigned char*>(salt.data()), (int)salt.size(),
                               rounds, EVP_sha256(), (int)sizeof(digest), digest);
    if (rc != 1) return false;

    outHex = toHex(digest, sizeof(digest));
    OPENSSL_cleanse(digest, sizeof(digest));
    return true;
}

bool PinHasher::verifyPin(const std::string& pin, const std::string& salt, uint32_t iterations,
                          const std::string& expectedHex, bool& matches) {
    std::string computed;
    if (!hashPin(pin, salt, iterations, computed)) return false;
    matches = constantTimeEquals(computed, expectedHex);
    return true;
}

bool PinHasher::constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool PinHasher::randomHex(ISafetyContext& ctx, size_t byteCount, std::string& outHex) {
    std::vector<uint8_t> buf(byteCount);
    if (byteCount > 0 && !ctx.fillRandom(&buf[0], byteCount)) return false;
    outHex = toHex(buf.empty() ? nullptr : &buf[0], byteCount);
    return true;
}
