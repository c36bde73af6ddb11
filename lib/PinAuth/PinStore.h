/*
 * =================================================================================
 * File:      lib/PinAuth/PinStore.h
 * Description: Persistence interface for PIN records, attempts and sessions.
 *
 * Every method returns false if the backing store could not be reached.
 * Out-parameters are only valid on true.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "PinTypes.h"

class IPinStore {
public:
    virtual ~IPinStore() {}

    // --- PIN Records ---
    // Upsert keyed by (userId, pinType).
    virtual bool savePin(const PinRecord& record) = 0;
    virtual bool findPin(const std::string& userId, PinType type, PinRecord& out, bool& found) = 0;
    virtual bool listUserPins(const std::string& userId, std::vector<PinRecord>& out) = 0;
    virtual bool countActivePins(uint32_t& count) = 0;

    // --- Attempts (append-only) ---
    virtual bool appendAttempt(const PinAttempt& attempt) = 0;

    // Timestamps of lockout-relevant failures at or after 'since', ascending.
    virtual bool listFailureTimes(const std::string& userId, PinType type, int64_t since,
                                  std::vector<int64_t>& out) = 0;

    // Attempts at or after 'since'. Empty userId counts every user.
    virtual bool countAttempts(const std::string& userId, int64_t since, uint32_t& count) = 0;

    // Admin unlock marker: failures before it are ignored by the lockout window.
    virtual bool setLockoutReset(const std::string& userId, PinType type, int64_t at) = 0;
    virtual bool getLockoutReset(const std::string& userId, PinType type, int64_t& at) = 0;

    // --- Sessions ---
    virtual bool insertSession(const PinSession& session) = 0;
    virtual bool updateSession(const PinSession& session) = 0;
    virtual bool findSession(const std::string& sessionId, PinSession& out, bool& found) = 0;

    // Active sessions in creation order. Empty userId lists every user.
    virtual bool listActiveSessions(const std::string& userId, std::vector<PinSession>& out) = 0;
};
