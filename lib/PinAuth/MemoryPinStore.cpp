/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/MemoryPinStore.cpp
 * =================================================================================
 */
#include <algorithm>

#include "MemoryPinStore.h"

MemoryPinStore::MemoryPinStore() {}

std::string MemoryPinStore::resetKey(const std::string& userId, PinType type) {
    return userId + ":" + pinTypeToString(type);
}

bool MemoryPinStore::countsTowardLockout(const PinAttempt& attempt) {
    if (attempt.success) return false;
    return attempt.failure == ATTEMPT_INVALID_PIN ||
           attempt.failure == ATTEMPT_PIN_NOT_FOUND ||
           attempt.failure == ATTEMPT_PIN_EXHAUSTED;
}

// =================================================================================
// SECTION: PIN RECORDS
// =================================================================================

bool MemoryPinStore::savePin(const PinRecord& record) {
    std::lock_guard<std::mutex> lock(_mutex);
    for (size_t i = 0; i < _pins.size(); i++) {
        if (_pins[i].userId == record.userId && _pins[i].pinType == record.pinType) {
            PinRecord previous = _pins[i];
            _pins[i] = record;
            if (commit()) return true;
            _pins[i] = previous;
            return false;
        }
    }
    _pins.push_back(record);
    if (commit()) return true;
    _pins.pop_back();
    return false;
}

bool MemoryPinStore::findPin(const std::string& userId, PinType type, PinRecord& out, bool& found) {
    std::lock_guard<std::mutex> lock(_mutex);
    found = false;
    for (size_t i = 0; i < _pins.size(); i++) {
        if (_pins[i].userId == userId && _pins[i].pinType == type) {
            out = _pins[i];
            found = true;
            break;
        }
    }
    return true;
}

bool MemoryPinStore::listUserPins(const std::string& userId, std::vector<PinRecord>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out.clear();
    for (size_t i = 0; i < _pins.size(); i++) {
        if (_pins[i].userId == userId) out.push_back(_pins[i]);
    }
    return true;
}

bool MemoryPinStore::countActivePins(uint32_t& count) {
    std::lock_guard<std::mutex> lock(_mutex);
    count = 0;
    for (size_t i = 0; i < _pins.size(); i++) {
        if (_pins[i].isActive) count++;
    }
    return true;
}

// =================================================================================
// SECTION: ATTEMPTS
// =================================================================================

bool MemoryPinStore::appendAttempt(const PinAttempt& attempt) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<PinAttempt> previous = _attempts;

    int64_t horizon = attempt.attemptedAt - PIN_ATTEMPT_HISTORY_SECONDS;
    _attempts.erase(std::remove_if(_attempts.begin(), _attempts.end(),
                                   [horizon](const PinAttempt& a) { return a.attemptedAt < horizon; }),
                    _attempts.end());

    _attempts.push_back(attempt);
    if (commit()) return true;
    _attempts.swap(previous);
    return false;
}

bool MemoryPinStore::listFailureTimes(const std::string& userId, PinType type, int64_t since,
                                      std::vector<int64_t>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out.clear();
    for (size_t i = 0; i < _attempts.size(); i++) {
        const PinAttempt& a = _attempts[i];
        if (a.userId != userId || a.pinType != type) continue;
        if (a.attemptedAt < since || !countsTowardLockout(a)) continue;
        out.push_back(a.attemptedAt);
    }
    std::sort(out.begin(), out.end());
    return true;
}

bool MemoryPinStore::countAttempts(const std::string& userId, int64_t since, uint32_t& count) {
    std::lock_guard<std::mutex> lock(_mutex);
    count = 0;
    for (size_t i = 0; i < _attempts.size(); i++) {
        if (_attempts[i].attemptedAt < since) continue;
        if (!userId.empty() && _attempts[i].userId != userId) continue;
        count++;
    }
    return true;
}

bool MemoryPinStore::setLockoutReset(const std::string& userId, PinType type, int64_t at) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, int64_t> previous = _lockoutResets;
    _lockoutResets[resetKey(userId, type)] = at;
    if (commit()) return true;
    _lockoutResets.swap(previous);
    return false;
}

bool MemoryPinStore::getLockoutReset(const std::string& userId, PinType type, int64_t& at) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, int64_t>::const_iterator it = _lockoutResets.find(resetKey(userId, type));
    at = (it == _lockoutResets.end()) ? 0 : it->second;
    return true;
}

// =================================================================================
// SECTION: SESSIONS
// =================================================================================

bool MemoryPinStore::insertSession(const PinSession& session) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<PinSession> previous = _sessions;

    int64_t horizon = session.createdAt - PIN_ATTEMPT_HISTORY_SECONDS;
    _sessions.erase(std::remove_if(_sessions.begin(), _sessions.end(),
                                   [horizon](const PinSession& s) {
                                       return !s.isActive && s.expiresAt < horizon;
                                   }),
                    _sessions.end());

    _sessions.push_back(session);
    if (commit()) return true;
    _sessions.swap(previous);
    return false;
}

bool MemoryPinStore::updateSession(const PinSession& session) {
    std::lock_guard<std::mutex> lock(_mutex);
    for (size_t i = 0; i < _sessions.size(); i++) {
        if (_sessions[i].sessionId == session.sessionId) {
            PinSession previous = _sessions[i];
            _sessions[i] = session;
            if (commit()) return true;
            _sessions[i] = previous;
            return false;
        }
    }
    return false;
}

bool MemoryPinStore::findSession(const std::string& sessionId, PinSession& out, bool& found) {
    std::lock_guard<std::mutex> lock(_mutex);
    found = false;
    for (size_t i = 0; i < _sessions.size(); i++) {
        if (_sessions[i].sessionId == sessionId) {
            out = _sessions[i];
            found = true;
            break;
        }
    }
    return true;
}

bool MemoryPinStore::listActiveSessions(const std::string& userId, std::vector<PinSession>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out.clear();
    for (size_t i = 0; i < _sessions.size(); i++) {
        if (!_sessions[i].isActive) continue;
        if (!userId.empty() && _sessions[i].userId != userId) continue;
        out.push_back(_sessions[i]);
    }
    return true;
}
