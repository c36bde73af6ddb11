/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/PinManager.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * PIN validation, sliding-window lockout and short-lived, usage-limited
 * authorization sessions.
 *
 * DESIGN NOTES:
 * 1. Decoupled from storage via IPinStore. Any store failure denies.
 * 2. One mutex serializes every public call, so lockout counting vs attempt
 *    recording and session eviction vs insertion are atomic.
 * 3. Implements IOperationAuthorizer for the safety supervisor.
 * 4. Constructed by the composition root and passed by reference.
 * =================================================================================
 */
#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "PinTypes.h"
#include "PinStore.h"
#include "SafetyContext.h"
#include "SafetyCollaborators.h"

class PinManager : public IOperationAuthorizer {
public:
    PinManager(ISafetyContext& ctx, IPinStore& store, const PinConfig& config);

    // --- PIN Administration ---
    AuthOutcome setPin(const std::string& userId, PinType type, const std::string& pin,
                       const std::string& description, std::string& errorMsg);
    bool validatePinFormat(const std::string& pin, std::string& errorMsg) const;

    // Generates one PIN per type if the user has none. 'generated' stays empty
    // when PINs already exist. On a store failure the PINs already written are
    // rolled back; any that could not be rolled back stay live and are
    // returned in 'generated'.
    AuthOutcome initializeDefaultPins(const std::string& userId, std::map<PinType, std::string>& generated);
    AuthOutcome rotateUserPins(const std::string& userId, std::map<PinType, std::string>& generated);
    bool deactivatePin(const std::string& userId, PinType type);
    bool unlockUser(const std::string& userId);
    bool listUserPins(const std::string& userId, std::vector<PinSummary>& out);

    // --- Validation & Sessions ---
    PinValidationResult validatePin(const std::string& userId,
                                    const std::string& pin,
                                    PinType type,
                                    const std::string& ipAddress = "",
                                    const std::string& userAgent = "");

    AuthDecision authorizeOperation(const std::string& sessionId,
                                    const std::string& operation,
                                    const std::string& userId) override;

    bool revokeSession(const std::string& sessionId);
    bool revokeAllUserSessions(const std::string& userId, uint32_t& revoked);
    bool getSessionInfo(const std::string& sessionId, PinSession& out);
    uint32_t cleanupExpiredSessions();

    // --- Status ---
    bool getUserStatus(const std::string& userId, PinUserStatus& out);
    PinSystemStatus getSystemStatus();
    const PinConfig& getConfig() const { return _config; }

    void printStartupDiagnostics();

private:
    // --- Dependencies ---
    ISafetyContext& _ctx;
    IPinStore& _store;

    // --- Configuration ---
    PinConfig _config;

    std::mutex _mutex;

    // =========================================================================
    // SECTION: LOCKED HELPERS (caller holds _mutex)
    // =========================================================================

    AuthOutcome setPinLocked(const std::string& userId, PinType type, const std::string& pin,
                             const std::string& description, std::string& errorMsg);
    bool generatePins(size_t count, std::vector<std::string>& out);
    AuthOutcome applyGeneratedPins(const std::string& userId, const std::vector<std::string>& pins,
                                   bool withDescription, std::map<PinType, std::string>& generated);
    void rollbackPins(const std::string& userId, const std::vector<PinRecord>& previous,
                      std::map<PinType, std::string>& generated);

    bool computeLockout(const std::string& userId, PinType type, const PinRecord* record,
                        int64_t now, int64_t& lockoutUntil);
    bool recordAttempt(const std::string& userId, PinType type, AttemptFailure failure,
                       const std::string& ipAddress, const std::string& userAgent,
                       const std::string& sessionId, int64_t now);

    bool createSession(const PinRecord& record, const std::string& ipAddress,
                       const std::string& userAgent, int64_t now, std::string& outToken);
    bool enforceSessionLimit(const std::string& userId, int64_t now);
    bool deactivateSession(PinSession& session, int64_t now, const char* reason);
    bool revokeAllLocked(const std::string& userId, int64_t now, uint32_t& revoked);
    bool sweepExpiredLocked(int64_t now, uint32_t& cleaned);

    PinValidationResult infraFailure(const std::string& userId, PinType type,
                                     const std::string& ipAddress, const std::string& userAgent,
                                     int64_t now);

    void logKeyValue(const char* key, const char* value);
};
