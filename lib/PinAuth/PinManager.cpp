/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/PinManager.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * PIN validation and session lifecycle.
 * - Lockout is decided from failures inside a sliding window before the PIN
 *   is ever compared.
 * - Sessions carry a per-type TTL and operation budget. Creating a session
 *   beyond the per-user limit evicts the oldest one.
 * - Store failures deny and are reported as AUTH_INFRA_ERROR / AUTHZ_INFRA_ERROR.
 * =================================================================================
 */
#include <stdio.h>
#include <algorithm>

#include "PinManager.h"
#include "PinHasher.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

PinManager::PinManager(ISafetyContext& ctx, IPinStore& store, const PinConfig& config)
    : _ctx(ctx),
      _store(store),
      _config(config)
{
}

void PinManager::logKeyValue(const char* key, const char* value) {
    char tempBuf[192];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

// =================================================================================
// SECTION: PIN ADMINISTRATION
// =================================================================================

bool PinManager::validatePinFormat(const std::string& pin, std::string& errorMsg) const {
    if (pin.size() < _config.minPinLength || pin.size() > _config.maxPinLength) {
        errorMsg = "PIN must be between " + std::to_string(_config.minPinLength) + " and " +
                   std::to_string(_config.maxPinLength) + " characters";
        return false;
    }

    for (size_t i = 0; i < pin.size(); i++) {
        char c = pin[i];
        if (_config.requireNumericOnly && (c < '0' || c > '9')) {
            errorMsg = "PIN must contain only digits";
            return false;
        }
        if (c <= ' ' || c > '~') {
            errorMsg = "PIN contains unsupported characters";
            return false;
        }
    }
    return true;
}

AuthOutcome PinManager::setPin(const std::string& userId, PinType type, const std::string& pin,
                               const std::string& description, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(_mutex);
    return setPinLocked(userId, type, pin, description, errorMsg);
}

AuthOutcome PinManager::setPinLocked(const std::string& userId, PinType type, const std::string& pin,
                                     const std::string& description, std::string& errorMsg) {
    if (userId.empty() || type >= PIN_TYPE_COUNT) {
        errorMsg = "user_id and a valid pin_type are required";
        return AUTH_VALIDATION_ERROR;
    }
    if (!validatePinFormat(pin, errorMsg)) return AUTH_VALIDATION_ERROR;

    int64_t now = _ctx.getEpochSeconds();

    PinRecord existing;
    bool found = false;
    if (!_store.findPin(userId, type, existing, found)) {
        errorMsg = "PIN store unavailable";
        return AUTH_INFRA_ERROR;
    }

    PinRecord record;
    if (found) {
        record = existing;
    } else {
        if (!PinHasher::randomHex(_ctx, PIN_ID_BYTES, record.id)) {
            errorMsg = "Entropy source unavailable";
            return AUTH_INFRA_ERROR;
        }
        record.userId = userId;
        record.pinType = type;
        record.maxUses = 0;
        record.useCount = 0;
        record.lockoutAfterFailures = _config.maxFailedAttempts;
        record.lockoutDurationMinutes = _config.lockoutDurationMinutes;
        record.createdAt = now;
        record.lastUsedAt = 0;
    }

    if (!PinHasher::randomHex(_ctx, PIN_SALT_BYTES, record.salt)) {
        errorMsg = "Entropy source unavailable";
        return AUTH_INFRA_ERROR;
    }
    if (!PinHasher::hashPin(pin, record.salt, _config.hashIterations, record.pinHash)) {
        errorMsg = "PIN hashing failed";
        return AUTH_INFRA_ERROR;
    }

    if (!description.empty() || !found) record.description = description;
    record.isActive = true;
    record.updatedAt = now;

    if (!_store.savePin(record)) {
        errorMsg = "PIN store unavailable";
        return AUTH_INFRA_ERROR;
    }

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "%s %s PIN for user %s", found ? "Updated" : "Created",
             pinTypeToString(type), userId.c_str());
    logKeyValue("PinAuth", logBuf);
    return AUTH_OK;
}

bool PinManager::generatePins(size_t count, std::vector<std::string>& out) {
    size_t length = _config.minPinLength > 4 ? _config.minPinLength : 4;
    out.clear();

    while (out.size() < count) {
        std::string pin;
        while (pin.size() < length) {
            uint8_t b = 0;
            if (!_ctx.fillRandom(&b, 1)) return false;
            // Reject 250..255 so every digit is equally likely
            if (b >= 250) continue;
            char digit = (char)('0' + (b % 10));
            if (pin.empty() && digit == '0') continue;
            pin.push_back(digit);
        }
        if (std::find(out.begin(), out.end(), pin) == out.end()) out.push_back(pin);
    }
    return true;
}

AuthOutcome PinManager::initializeDefaultPins(const std::string& userId, std::map<PinType, std::string>& generated) {
    std::lock_guard<std::mutex> lock(_mutex);
    generated.clear();

    std::vector<PinRecord> existing;
    if (!_store.listUserPins(userId, existing)) return AUTH_INFRA_ERROR;
    if (!existing.empty()) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "PINs already exist for user %s", userId.c_str());
        logKeyValue("PinAuth", logBuf);
        return AUTH_OK;
    }

    std::vector<std::string> pins;
    if (!generatePins(PIN_TYPE_COUNT, pins)) return AUTH_INFRA_ERROR;

    AuthOutcome rc = applyGeneratedPins(userId, pins, true, generated);
    if (rc != AUTH_OK) return rc;

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Initialized default PINs for user %s", userId.c_str());
    logKeyValue("PinAuth", logBuf);
    return AUTH_OK;
}

AuthOutcome PinManager::rotateUserPins(const std::string& userId, std::map<PinType, std::string>& generated) {
    std::lock_guard<std::mutex> lock(_mutex);
    generated.clear();

    if (userId.empty()) return AUTH_VALIDATION_ERROR;

    std::vector<std::string> pins;
    if (!generatePins(PIN_TYPE_COUNT, pins)) return AUTH_INFRA_ERROR;

    AuthOutcome rc = applyGeneratedPins(userId, pins, false, generated);
    if (rc != AUTH_OK) return rc;

    // Sessions opened with the old PINs must not outlive them
    uint32_t revoked = 0;
    if (!revokeAllLocked(userId, _ctx.getEpochSeconds(), revoked)) return AUTH_INFRA_ERROR;

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Rotated PINs for user %s, revoked %u sessions", userId.c_str(), revoked);
    logKeyValue("PinAuth", logBuf);
    return AUTH_OK;
}

AuthOutcome PinManager::applyGeneratedPins(const std::string& userId, const std::vector<std::string>& pins,
                                           bool withDescription, std::map<PinType, std::string>& generated) {
    generated.clear();

    std::vector<PinRecord> previous;
    if (!_store.listUserPins(userId, previous)) return AUTH_INFRA_ERROR;

    for (uint8_t t = 0; t < PIN_TYPE_COUNT; t++) {
        PinType type = (PinType)t;
        std::string description;
        if (withDescription) description = std::string("Default ") + pinTypeToString(type) + " PIN";

        std::string errorMsg;
        AuthOutcome rc = setPinLocked(userId, type, pins[t], description, errorMsg);
        if (rc != AUTH_OK) {
            logKeyValue("PinAuth", errorMsg.c_str());
            rollbackPins(userId, previous, generated);
            return rc;
        }
        generated[type] = pins[t];
    }
    return AUTH_OK;
}

void PinManager::rollbackPins(const std::string& userId, const std::vector<PinRecord>& previous,
                              std::map<PinType, std::string>& generated) {
    std::map<PinType, std::string>::iterator it = generated.begin();
    while (it != generated.end()) {
        PinRecord restore;
        bool hadPrevious = false;
        for (size_t i = 0; i < previous.size(); i++) {
            if (previous[i].pinType == it->first) {
                restore = previous[i];
                hadPrevious = true;
                break;
            }
        }

        if (!hadPrevious) {
            // Newly created: retire it
            bool exists = false;
            if (!_store.findPin(userId, it->first, restore, exists)) {
                ++it;
                continue;
            }
            if (!exists) {
                generated.erase(it++);
                continue;
            }
            restore.isActive = false;
        }

        if (_store.savePin(restore)) generated.erase(it++);
        else ++it;
    }

    if (!generated.empty()) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "%u generated PINs for user %s could not be rolled back",
                 (unsigned)generated.size(), userId.c_str());
        logKeyValue("PinAuth", logBuf);
    }
}

bool PinManager::deactivatePin(const std::string& userId, PinType type) {
    std::lock_guard<std::mutex> lock(_mutex);

    PinRecord record;
    bool found = false;
    if (!_store.findPin(userId, type, record, found) || !found) return false;
    if (!record.isActive) return true;

    record.isActive = false;
    record.updatedAt = _ctx.getEpochSeconds();
    if (!_store.savePin(record)) return false;

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Deactivated %s PIN for user %s", pinTypeToString(type), userId.c_str());
    logKeyValue("PinAuth", logBuf);
    return true;
}

bool PinManager::unlockUser(const std::string& userId) {
    std::lock_guard<std::mutex> lock(_mutex);
    int64_t now = _ctx.getEpochSeconds();

    for (uint8_t t = 0; t < PIN_TYPE_COUNT; t++) {
        if (!_store.setLockoutReset(userId, (PinType)t, now)) return false;
    }

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Lockout cleared for user %s", userId.c_str());
    logKeyValue("PinAuth", logBuf);
    return true;
}

bool PinManager::listUserPins(const std::string& userId, std::vector<PinSummary>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out.clear();

    std::vector<PinRecord> records;
    if (!_store.listUserPins(userId, records)) return false;

    for (size_t i = 0; i < records.size(); i++) {
        PinSummary s;
        s.pinType = records[i].pinType;
        s.description = records[i].description;
        s.isActive = records[i].isActive;
        s.useCount = records[i].useCount;
        s.maxUses = records[i].maxUses;
        s.createdAt = records[i].createdAt;
        s.updatedAt = records[i].updatedAt;
        s.lastUsedAt = records[i].lastUsedAt;
        out.push_back(s);
    }
    return true;
}

// =================================================================================
// SECTION: LOCKOUT & ATTEMPTS
// =================================================================================

bool PinManager::computeLockout(const std::string& userId, PinType type, const PinRecord* record,
                                int64_t now, int64_t& lockoutUntil) {
    lockoutUntil = 0;

    uint32_t threshold = _config.maxFailedAttempts;
    uint32_t windowMinutes = _config.lockoutDurationMinutes;
    if (record != nullptr) {
        if (record->lockoutAfterFailures > 0) threshold = record->lockoutAfterFailures;
        if (record->lockoutDurationMinutes > 0) windowMinutes = record->lockoutDurationMinutes;
    }
    if (threshold == 0) return true;

    int64_t window = (int64_t)windowMinutes * 60;
    int64_t since = now - window;

    int64_t resetAt = 0;
    if (!_store.getLockoutReset(userId, type, resetAt)) return false;
    if (resetAt >= since) since = resetAt + 1;

    std::vector<int64_t> failures;
    if (!_store.listFailureTimes(userId, type, since, failures)) return false;

    if (failures.size() >= threshold) {
        // Unlocks once the oldest failure that still completes the threshold ages out
        lockoutUntil = failures[failures.size() - threshold] + window;
    }
    return true;
}

bool PinManager::recordAttempt(const std::string& userId, PinType type, AttemptFailure failure,
                               const std::string& ipAddress, const std::string& userAgent,
                               const std::string& sessionId, int64_t now) {
    PinAttempt attempt;
    if (!PinHasher::randomHex(_ctx, PIN_ID_BYTES, attempt.id)) return false;
    attempt.userId = userId;
    attempt.pinType = type;
    attempt.success = (failure == ATTEMPT_OK);
    attempt.failure = failure;
    attempt.ipAddress = ipAddress;
    attempt.userAgent = userAgent;
    attempt.sessionId = sessionId;
    attempt.attemptedAt = now;

    if (!_store.appendAttempt(attempt)) {
        logKeyValue("PinAuth", "Failed to record PIN attempt");
        return false;
    }
    return true;
}

PinValidationResult PinManager::infraFailure(const std::string& userId, PinType type,
                                             const std::string& ipAddress, const std::string& userAgent,
                                             int64_t now) {
    PinValidationResult result;
    result.outcome = AUTH_INFRA_ERROR;
    result.message = "PIN service unavailable";
    result.lockoutUntil = 0;
    result.retryAfterSeconds = 0;

    logKeyValue("PinAuth", "PIN store failure, denying validation");
    if (!recordAttempt(userId, type, ATTEMPT_STORE_UNAVAILABLE, ipAddress, userAgent, "", now)) {
        logKeyValue("PinAuth", "Store failure attempt could not be recorded");
    }
    return result;
}

// =================================================================================
// SECTION: VALIDATION
// =================================================================================

PinValidationResult PinManager::validatePin(const std::string& userId,
                                            const std::string& pin,
                                            PinType type,
                                            const std::string& ipAddress,
                                            const std::string& userAgent) {
    std::lock_guard<std::mutex> lock(_mutex);

    PinValidationResult result;
    result.outcome = AUTH_FAILED;
    result.lockoutUntil = 0;
    result.retryAfterSeconds = 0;

    if (userId.empty() || pin.empty() || type >= PIN_TYPE_COUNT) {
        result.outcome = AUTH_VALIDATION_ERROR;
        result.message = "user_id, pin and a valid pin_type are required";
        return result;
    }

    int64_t now = _ctx.getEpochSeconds();
    char logBuf[160];

    // 1. Load record (for its lockout policy)
    PinRecord record;
    bool found = false;
    if (!_store.findPin(userId, type, record, found)) {
        return infraFailure(userId, type, ipAddress, userAgent, now);
    }

    // 2. Lockout check, before the PIN is compared
    int64_t lockoutUntil = 0;
    if (!computeLockout(userId, type, found ? &record : nullptr, now, lockoutUntil)) {
        return infraFailure(userId, type, ipAddress, userAgent, now);
    }

    if (lockoutUntil > now) {
        if (!recordAttempt(userId, type, ATTEMPT_LOCKED_OUT, ipAddress, userAgent, "", now)) {
            logKeyValue("PinAuth", "Lockout denial could not be recorded");
        }

        char remaining[48];
        TimeUtils::formatSeconds((unsigned long)(lockoutUntil - now), remaining, sizeof(remaining));

        result.outcome = AUTH_LOCKED_OUT;
        result.lockoutUntil = lockoutUntil;
        result.retryAfterSeconds = (uint32_t)(lockoutUntil - now);
        result.message = std::string("User is locked out due to failed attempts. Try again in ") + remaining;

        snprintf(logBuf, sizeof(logBuf), "User %s locked out (%s) for %s", userId.c_str(),
                 pinTypeToString(type), remaining);
        logKeyValue("PinAuth", logBuf);
        return result;
    }

    // 3. Record must exist, be active and have uses left
    AttemptFailure failure = ATTEMPT_OK;
    if (!found || !record.isActive) {
        failure = ATTEMPT_PIN_NOT_FOUND;
    } else if (record.maxUses > 0 && record.useCount >= record.maxUses) {
        failure = ATTEMPT_PIN_EXHAUSTED;
    } else {
        bool matches = false;
        if (!PinHasher::verifyPin(pin, record.salt, _config.hashIterations, record.pinHash, matches)) {
            return infraFailure(userId, type, ipAddress, userAgent, now);
        }
        if (!matches) failure = ATTEMPT_INVALID_PIN;
    }

    if (failure != ATTEMPT_OK) {
        snprintf(logBuf, sizeof(logBuf), "Rejected %s PIN for user %s (%s)", pinTypeToString(type),
                 userId.c_str(), attemptFailureToString(failure));
        logKeyValue("PinAuth", logBuf);

        if (!recordAttempt(userId, type, failure, ipAddress, userAgent, "", now)) {
            result.outcome = AUTH_INFRA_ERROR;
            result.message = "PIN service unavailable";
            return result;
        }
        result.outcome = AUTH_FAILED;
        result.message = "Invalid PIN";
        return result;
    }

    // 4. Success: session, usage counter, attempt row
    std::string token;
    if (!createSession(record, ipAddress, userAgent, now, token)) {
        return infraFailure(userId, type, ipAddress, userAgent, now);
    }

    record.useCount++;
    record.lastUsedAt = now;
    bool committed = _store.savePin(record) &&
                     recordAttempt(userId, type, ATTEMPT_OK, ipAddress, userAgent, token, now);

    if (!committed) {
        PinSession created;
        bool sessionFound = false;
        if (_store.findSession(token, created, sessionFound) && sessionFound) {
            if (!deactivateSession(created, now, "rolled back")) {
                logKeyValue("PinAuth", "Rollback of new session failed");
            }
        }
        result.outcome = AUTH_INFRA_ERROR;
        result.message = "PIN service unavailable";
        return result;
    }

    result.outcome = AUTH_OK;
    result.sessionId = token;
    result.message = "PIN validated";

    snprintf(logBuf, sizeof(logBuf), "Validated %s PIN for user %s", pinTypeToString(type), userId.c_str());
    logKeyValue("PinAuth", logBuf);
    return result;
}

// =================================================================================
// SECTION: SESSIONS
// =================================================================================

bool PinManager::deactivateSession(PinSession& session, int64_t now, const char* reason) {
    session.isActive = false;
    session.terminatedAt = now;
    if (!_store.updateSession(session)) return false;

    char logBuf[160];
    snprintf(logBuf, sizeof(logBuf), "Session %.8s... for %s ended (%s)", session.sessionId.c_str(),
             session.userId.c_str(), reason);
    logKeyValue("PinAuth", logBuf);
    return true;
}

static bool createdBefore(const PinSession& a, const PinSession& b) {
    return a.createdAt < b.createdAt;
}

bool PinManager::enforceSessionLimit(const std::string& userId, int64_t now) {
    if (_config.maxConcurrentSessions == 0) return true;

    std::vector<PinSession> active;
    if (!_store.listActiveSessions(userId, active)) return false;

    std::vector<PinSession> live;
    for (size_t i = 0; i < active.size(); i++) {
        if (now > active[i].expiresAt) {
            if (!deactivateSession(active[i], now, "expired")) return false;
        } else {
            live.push_back(active[i]);
        }
    }

    // Store order breaks createdAt ties
    std::stable_sort(live.begin(), live.end(), createdBefore);

    size_t index = 0;
    while (live.size() - index >= _config.maxConcurrentSessions) {
        if (!deactivateSession(live[index], now, "evicted, session limit reached")) return false;
        index++;
    }
    return true;
}

bool PinManager::createSession(const PinRecord& record, const std::string& ipAddress,
                               const std::string& userAgent, int64_t now, std::string& outToken) {
    if (!enforceSessionLimit(record.userId, now)) return false;

    const PinTypePolicy& policy = _config.policies[record.pinType];

    PinSession session;
    if (!PinHasher::randomHex(_ctx, PIN_ID_BYTES, session.id)) return false;
    if (!PinHasher::randomHex(_ctx, PIN_SESSION_TOKEN_BYTES, session.sessionId)) return false;
    session.pinRecordId = record.id;
    session.userId = record.userId;
    session.pinType = record.pinType;
    session.ipAddress = ipAddress;
    session.userAgent = userAgent;
    session.maxDurationMinutes = policy.sessionMinutes;
    session.maxOperations = policy.maxOperations;
    session.operationCount = 0;
    session.isActive = true;
    session.createdAt = now;
    session.expiresAt = now + (int64_t)policy.sessionMinutes * 60;
    session.lastUsedAt = now;
    session.terminatedAt = 0;

    if (!_store.insertSession(session)) return false;

    outToken = session.sessionId;
    return true;
}

AuthDecision PinManager::authorizeOperation(const std::string& sessionId,
                                            const std::string& operation,
                                            const std::string& userId) {
    std::lock_guard<std::mutex> lock(_mutex);
    char logBuf[160];

    if (sessionId.empty()) return AUTHZ_DENIED;

    int64_t now = _ctx.getEpochSeconds();

    PinSession session;
    bool found = false;
    if (!_store.findSession(sessionId, session, found)) {
        logKeyValue("PinAuth", "PIN store failure, denying authorization");
        return AUTHZ_INFRA_ERROR;
    }

    if (!found || !session.isActive) {
        snprintf(logBuf, sizeof(logBuf), "Denied '%s': unknown or inactive session", operation.c_str());
        logKeyValue("PinAuth", logBuf);
        return AUTHZ_DENIED;
    }

    if (now > session.expiresAt) {
        if (!deactivateSession(session, now, "expired")) return AUTHZ_INFRA_ERROR;
        return AUTHZ_DENIED;
    }

    if (!userId.empty() && session.userId != userId) {
        snprintf(logBuf, sizeof(logBuf), "Denied '%s': session owner mismatch", operation.c_str());
        logKeyValue("PinAuth", logBuf);
        return AUTHZ_DENIED;
    }

    if (session.maxOperations > 0 && session.operationCount >= session.maxOperations) {
        if (!deactivateSession(session, now, "operation budget exhausted")) return AUTHZ_INFRA_ERROR;
        return AUTHZ_DENIED;
    }

    if (_config.enforceOperationScope && !isOperationInScope(session.pinType, operation)) {
        snprintf(logBuf, sizeof(logBuf), "Denied '%s': outside %s PIN scope", operation.c_str(),
                 pinTypeToString(session.pinType));
        logKeyValue("PinAuth", logBuf);
        return AUTHZ_DENIED;
    }

    session.operationCount++;
    session.lastUsedAt = now;
    bool exhausted = session.maxOperations > 0 && session.operationCount >= session.maxOperations;
    if (exhausted) {
        session.isActive = false;
        session.terminatedAt = now;
    }

    if (!_store.updateSession(session)) {
        logKeyValue("PinAuth", "PIN store failure, denying authorization");
        return AUTHZ_INFRA_ERROR;
    }

    snprintf(logBuf, sizeof(logBuf), "Authorized '%s' for %s (%u/%u)%s", operation.c_str(),
             session.userId.c_str(), session.operationCount, session.maxOperations,
             exhausted ? ", session closed" : "");
    logKeyValue("PinAuth", logBuf);
    return AUTHZ_GRANTED;
}

bool PinManager::revokeSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(_mutex);

    PinSession session;
    bool found = false;
    if (!_store.findSession(sessionId, session, found)) return false;
    if (!found || !session.isActive) return false;

    return deactivateSession(session, _ctx.getEpochSeconds(), "revoked");
}

bool PinManager::revokeAllLocked(const std::string& userId, int64_t now, uint32_t& revoked) {
    revoked = 0;
    std::vector<PinSession> active;
    if (!_store.listActiveSessions(userId, active)) return false;

    for (size_t i = 0; i < active.size(); i++) {
        if (!deactivateSession(active[i], now, "revoked")) return false;
        revoked++;
    }
    return true;
}

bool PinManager::revokeAllUserSessions(const std::string& userId, uint32_t& revoked) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (userId.empty()) {
        revoked = 0;
        return false;
    }
    return revokeAllLocked(userId, _ctx.getEpochSeconds(), revoked);
}

bool PinManager::getSessionInfo(const std::string& sessionId, PinSession& out) {
    std::lock_guard<std::mutex> lock(_mutex);

    bool found = false;
    if (!_store.findSession(sessionId, out, found) || !found) return false;

    // Expiry is reported lazily; the row is updated on next use or sweep
    if (out.isActive && _ctx.getEpochSeconds() > out.expiresAt) out.isActive = false;
    return true;
}

bool PinManager::sweepExpiredLocked(int64_t now, uint32_t& cleaned) {
    cleaned = 0;
    std::vector<PinSession> active;
    if (!_store.listActiveSessions("", active)) return false;

    for (size_t i = 0; i < active.size(); i++) {
        if (now <= active[i].expiresAt) continue;
        if (!deactivateSession(active[i], now, "expired")) return false;
        cleaned++;
    }
    return true;
}

uint32_t PinManager::cleanupExpiredSessions() {
    std::lock_guard<std::mutex> lock(_mutex);
    uint32_t cleaned = 0;
    if (!sweepExpiredLocked(_ctx.getEpochSeconds(), cleaned)) {
        logKeyValue("PinAuth", "Expired session sweep failed");
    }
    return cleaned;
}

// =================================================================================
// SECTION: STATUS
// =================================================================================

bool PinManager::getUserStatus(const std::string& userId, PinUserStatus& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    int64_t now = _ctx.getEpochSeconds();

    out.userId = userId;
    out.isLockedOut = false;
    out.activeSessions = 0;
    out.recentAttempts = 0;
    bool anyUsable = false;

    for (uint8_t t = 0; t < PIN_TYPE_COUNT; t++) {
        PinType type = (PinType)t;
        PinRecord record;
        bool found = false;
        if (!_store.findPin(userId, type, record, found)) return false;

        int64_t until = 0;
        if (!computeLockout(userId, type, found ? &record : nullptr, now, until)) return false;

        out.configured[t] = found && record.isActive;
        out.lockoutUntil[t] = (until > now) ? until : 0;
        out.rotationDue[t] = _config.enablePinRotation && out.configured[t] &&
                             (now - record.updatedAt) >= (int64_t)_config.pinRotationDays * 86400;

        if (out.lockoutUntil[t] != 0) out.isLockedOut = true;
        if (out.configured[t] && out.lockoutUntil[t] == 0) anyUsable = true;
    }

    std::vector<PinSession> active;
    if (!_store.listActiveSessions(userId, active)) return false;
    for (size_t i = 0; i < active.size(); i++) {
        if (now <= active[i].expiresAt) out.activeSessions++;
    }

    if (!_store.countAttempts(userId, now - PIN_ATTEMPT_HISTORY_SECONDS, out.recentAttempts)) return false;

    out.canUsePins = anyUsable;
    return true;
}

PinSystemStatus PinManager::getSystemStatus() {
    std::lock_guard<std::mutex> lock(_mutex);
    int64_t now = _ctx.getEpochSeconds();

    PinSystemStatus status;
    status.configuredPins = 0;
    status.activeSessions = 0;
    status.attemptsLast24h = 0;
    status.healthy = false;

    uint32_t cleaned = 0;
    if (!sweepExpiredLocked(now, cleaned)) return status;
    if (!_store.countActivePins(status.configuredPins)) return status;

    std::vector<PinSession> active;
    if (!_store.listActiveSessions("", active)) return status;
    status.activeSessions = (uint32_t)active.size();

    if (!_store.countAttempts("", now - PIN_ATTEMPT_HISTORY_SECONDS, status.attemptsLast24h)) return status;

    status.healthy = true;
    return status;
}

void PinManager::printStartupDiagnostics() {
    char logBuf[128];
    const char* boolStr[] = { "NO", "YES" };

    _ctx.log("==========================================================================");
    _ctx.log("                        PIN AUTHORIZATION DIAGNOSTICS                     ");
    _ctx.log("==========================================================================");

    _ctx.log("[ PIN POLICY ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u - %u", "PIN Length", _config.minPinLength, _config.maxPinLength);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Numeric Only", boolStr[_config.requireNumericOnly]);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u failures / %u min", "Lockout",
             _config.maxFailedAttempts, _config.lockoutDurationMinutes);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Max Sessions Per User", _config.maxConcurrentSessions);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Operation Scope", boolStr[_config.enforceOperationScope]);
    _ctx.log(logBuf);

    _ctx.log("");
    _ctx.log("[ SESSION POLICY ]");
    for (uint8_t t = 0; t < PIN_TYPE_COUNT; t++) {
        const PinTypePolicy& p = _config.policies[t];
        if (p.maxOperations == 0) {
            snprintf(logBuf, sizeof(logBuf), " %-25s : %u min, unlimited ops", pinTypeToString((PinType)t),
                     p.sessionMinutes);
        } else {
            snprintf(logBuf, sizeof(logBuf), " %-25s : %u min, %u ops", pinTypeToString((PinType)t),
                     p.sessionMinutes, p.maxOperations);
        }
        _ctx.log(logBuf);
    }

    PinSystemStatus status = getSystemStatus();
    _ctx.log("");
    _ctx.log("[ STORE ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Store Reachable", boolStr[status.healthy]);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Configured PINs", status.configuredPins);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Active Sessions", status.activeSessions);
    _ctx.log(logBuf);
}
