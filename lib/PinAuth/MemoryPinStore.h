/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/MemoryPinStore.h
 *
 * Description:
 * In-memory IPinStore. Thread safe, insertion ordered. Attempts and finished
 * sessions older than PIN_ATTEMPT_HISTORY_SECONDS are pruned on append.
 * Subclasses persist by overriding commit(), which runs under the store lock
 * after every mutation. A failed commit rolls the mutation back, so memory
 * never holds state the backing store rejected.
 * =================================================================================
 */
#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "PinStore.h"

class MemoryPinStore : public IPinStore {
public:
    MemoryPinStore();
    virtual ~MemoryPinStore() {}

    bool savePin(const PinRecord& record) override;
    bool findPin(const std::string& userId, PinType type, PinRecord& out, bool& found) override;
    bool listUserPins(const std::string& userId, std::vector<PinRecord>& out) override;
    bool countActivePins(uint32_t& count) override;

    bool appendAttempt(const PinAttempt& attempt) override;
    bool listFailureTimes(const std::string& userId, PinType type, int64_t since,
                          std::vector<int64_t>& out) override;
    bool countAttempts(const std::string& userId, int64_t since, uint32_t& count) override;
    bool setLockoutReset(const std::string& userId, PinType type, int64_t at) override;
    bool getLockoutReset(const std::string& userId, PinType type, int64_t& at) override;

    bool insertSession(const PinSession& session) override;
    bool updateSession(const PinSession& session) override;
    bool findSession(const std::string& sessionId, PinSession& out, bool& found) override;
    bool listActiveSessions(const std::string& userId, std::vector<PinSession>& out) override;

protected:
    std::mutex _mutex;
    std::vector<PinRecord> _pins;
    std::vector<PinAttempt> _attempts;
    std::vector<PinSession> _sessions;
    std::map<std::string, int64_t> _lockoutResets;

    // Called with _mutex held after each mutation.
    virtual bool commit() { return true; }

    static std::string resetKey(const std::string& userId, PinType type);
    static bool countsTowardLockout(const PinAttempt& attempt);
};
