/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/SafetyService.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Safety supervisor. Owns the fixed interlock set, the emergency-stop flag,
 * the operational-mode session, the telemetry snapshot and the audit log.
 *
 * DESIGN NOTES:
 * 1. Decoupled from clocks/logging via ISafetyContext.
 * 2. Decoupled from PIN storage via IOperationAuthorizer (tagged decisions).
 * 3. Not thread safe. Exactly one owner drives it (see SafetyRuntime). The
 *    exceptions are isWatchdogExpired() and tripWatchdog(), which touch only
 *    atomics, and queryFeatureHealth(), which touches only the feature manager.
 * 4. Safe state is terminal: the monitoring ticks stop until an operator
 *    clears it explicitly. Emergency reset clears the emergency flags only.
 * 5. A detected watchdog expiry is latched. Later kicks do not cancel it and
 *    the next tick on the owner enters safe state.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "SafetyTypes.h"
#include "SafetyContext.h"
#include "SafetyCollaborators.h"
#include "SafetyInterlock.h"
#include "AuditLog.h"

class SafetyService {
public:
    // Authorizer and security audit are optional; a missing authorizer denies
    // every PIN-gated operation.
    SafetyService(ISafetyContext& ctx,
                  IFeatureManager& features,
                  const SafetyConfig& config,
                  IOperationAuthorizer* authorizer = nullptr,
                  ISecurityAudit* securityAudit = nullptr);

    // --- Monitoring Ticks ---
    void startMonitoring();
    bool runHealthCheck();      // One health-loop iteration. False once monitoring halted.
    bool checkWatchdog();       // One watchdog-loop iteration. False once monitoring halted.
    void kickWatchdog();
    bool isWatchdogExpired() const;
    bool tripWatchdog();        // Latches an expiry. True only for the call that latched it.
    bool isWatchdogTripped() const { return _watchdogTripped.load(); }
    void handleWatchdogTimeout();

    // Split health iteration: the query may block and runs off the owner.
    bool queryFeatureHealth(HealthReport& out);
    bool applyHealthCheck(bool healthAvailable, const HealthReport& report);
    bool isMonitoringActive() const { return _monitoringActive.load(); }

    // --- Telemetry ---
    void updateSystemState(const SystemStateUpdate& update);
    const SystemState& getSystemState() const { return _systemState; }

    // --- Interlocks ---
    uint32_t checkSafetyInterlocks(std::vector<std::string>* violated = nullptr);
    uint32_t checkAllInterlocks();
    bool clearInterlockOverride(const std::string& interlockName);
    const SafetyInterlock* getInterlock(const std::string& name) const;

    // --- Emergency Stop ---
    bool triggerEmergencyStop(const char* reason, const char* triggeredBy);
    SafetyOutcome emergencyStopWithPin(const std::string& sessionId, const std::string& reason,
                                       const std::string& triggeredBy);
    SafetyOutcome resetEmergencyStop(const std::string& authorizationCode, const std::string& resetBy);
    SafetyOutcome resetEmergencyStopWithPin(const std::string& sessionId, const std::string& resetBy);
    SafetyOutcome clearSafeStateWithPin(const std::string& sessionId, const std::string& clearedBy);

    // --- Interlock Override ---
    SafetyOutcome overrideInterlockWithPin(const std::string& sessionId,
                                           const std::string& interlockName,
                                           const std::string& reason,
                                           uint32_t durationMinutes,
                                           const std::string& overriddenBy);

    // --- Operational Modes ---
    SafetyOutcome enterMaintenanceModeWithPin(const std::string& sessionId, const std::string& reason,
                                              uint32_t durationMinutes, const std::string& enteredBy);
    SafetyOutcome exitMaintenanceModeWithPin(const std::string& sessionId, const std::string& exitedBy);
    SafetyOutcome enterDiagnosticModeWithPin(const std::string& sessionId, const std::string& reason,
                                             uint32_t durationMinutes, const std::string& enteredBy);
    SafetyOutcome exitDiagnosticModeWithPin(const std::string& sessionId, const std::string& exitedBy);
    bool checkModeExpiration();

    // --- Rate Limiting ---
    bool validateSafetyOperation(RateLimitCategory category,
                                 const std::string& userId,
                                 const std::string& sourceIp,
                                 bool isAdmin,
                                 const std::string& entityId);

    // --- State Accessors (Read-Only) ---
    OperationalMode getOperationalMode() const { return _mode; }
    bool isEmergencyStopActive() const { return _emergencyStopActive; }
    bool isInSafeState() const { return _inSafeState; }
    size_t getActiveOverrideCount() const { return _activeOverrides.size(); }
    const std::vector<std::string>& getActiveSafetyActions() const { return _activeSafetyActions; }
    const SafetyConfig& getConfig() const { return _config; }

    SafetyStatus getSafetyStatus() const;
    void getAuditLog(size_t maxEntries, std::vector<AuditLogEntry>& out) const;

    void printStartupDiagnostics();

private:
    // --- Dependencies ---
    ISafetyContext& _ctx;
    IFeatureManager& _features;
    IOperationAuthorizer* _authorizer;
    ISecurityAudit* _securityAudit;

    // --- Configuration ---
    SafetyConfig _config;

    // --- Dynamic State ---
    std::vector<std::unique_ptr<SafetyInterlock> > _interlocks;
    std::map<std::string, int64_t> _activeOverrides;
    SystemState _systemState;
    AuditLog _auditLog;
    std::vector<std::string> _activeSafetyActions;

    bool _inSafeState;
    std::string _safeStateReason;

    bool _emergencyStopActive;
    std::string _emergencyStopReason;
    std::string _emergencyStopTriggeredBy;
    int64_t _emergencyStopTime;

    OperationalMode _mode;
    bool _hasModeSession;
    ModeSession _modeSession;

    // --- Watchdog State (read cross-thread) ---
    std::atomic<unsigned long> _lastWatchdogKick;
    std::atomic<unsigned long> _trippedElapsedMs;
    std::atomic<bool> _watchdogTripped;
    std::atomic<bool> _monitoringActive;

    // =========================================================================
    // SECTION: INTERNAL TRANSITIONS
    // =========================================================================

    void setupDefaultInterlocks();
    SafetyInterlock* findInterlock(const std::string& name);

    void executeEmergencyStopActions();
    void enterSafeState(const std::string& reason);
    void shutdownSafetyCriticalFeatures();
    void engageAllInterlocks(const std::string& reason, bool recordActions);
    size_t clearAllOverrides();

    SafetyOutcome performEmergencyReset(const std::string& authorizationCode,
                                        const std::string& resetBy,
                                        const std::string& sessionId);

    SafetyOutcome enterMode(OperationalMode mode, const char* operation,
                            const std::string& sessionId, const std::string& reason,
                            uint32_t durationMinutes, const std::string& enteredBy);
    SafetyOutcome exitMode(OperationalMode mode, const char* operation,
                           const std::string& sessionId, const std::string& exitedBy);

    // =========================================================================
    // SECTION: AUTHORIZATION & AUDIT HELPERS
    // =========================================================================

    AuthDecision authorize(const std::string& sessionId, const char* operation, const std::string& userId);
    SafetyOutcome rejectAuthorization(AuthDecision decision,
                                      const char* auditEvent,
                                      const char* attemptedOperation,
                                      const std::string& userId,
                                      const std::string& sessionId);

    void audit(const char* eventType, JsonDocument& details);
    void reportSecurityEvent(SecurityEventType type, SecuritySeverity severity,
                             const std::string& userId, JsonDocument& details,
                             bool emergencyContext);

    void logKeyValue(const char* key, const char* value);
    std::string isoNow();
};
