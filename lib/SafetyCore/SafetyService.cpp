/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/SafetyService.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Core safety logic.
 * - Re-evaluates interlocks against the telemetry snapshot every health tick.
 * - Escalates critical feature failures and multiple violations to an
 *   emergency stop, which forces position-critical features to SAFE_SHUTDOWN,
 *   engages every interlock and enters safe state.
 * - Gates overrides, modes and resets behind PIN session authorization.
 * - Records every transition and denial in the audit ring buffer.
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "SafetyService.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

SafetyService::SafetyService(ISafetyContext& ctx,
                             IFeatureManager& features,
                             const SafetyConfig& config,
                             IOperationAuthorizer* authorizer,
                             ISecurityAudit* securityAudit)
    : _ctx(ctx),
      _features(features),
      _authorizer(authorizer),
      _securityAudit(securityAudit),
      _config(config),
      _auditLog(config.auditLogCapacity),
      _inSafeState(false),
      _emergencyStopActive(false),
      _emergencyStopTime(0),
      _mode(MODE_NORMAL),
      _hasModeSession(false),
      _lastWatchdogKick(0),
      _trippedElapsedMs(0),
      _watchdogTripped(false),
      _monitoringActive(false)
{
    _systemState = makeSafeDefaultState();
    _modeSession.enteredAt = 0;
    _modeSession.expiresAt = 0;
    setupDefaultInterlocks();
}

void SafetyService::setupDefaultInterlocks() {
    std::vector<std::string> slide;
    slide.push_back("vehicle_not_moving");
    slide.push_back("parking_brake_engaged");
    slide.push_back("leveling_jacks_deployed");
    slide.push_back("transmission_in_park");
    _interlocks.push_back(std::unique_ptr<SafetyInterlock>(
        new SafetyInterlock(_ctx, INTERLOCK_SLIDE_ROOM, FEATURE_FIREFLY, slide)));

    std::vector<std::string> awning;
    awning.push_back("vehicle_not_moving");
    awning.push_back("parking_brake_engaged");
    _interlocks.push_back(std::unique_ptr<SafetyInterlock>(
        new SafetyInterlock(_ctx, INTERLOCK_AWNING, FEATURE_FIREFLY, awning)));

    std::vector<std::string> jacks;
    jacks.push_back("vehicle_not_moving");
    jacks.push_back("parking_brake_engaged");
    jacks.push_back("transmission_in_park");
    jacks.push_back("engine_not_running");
    _interlocks.push_back(std::unique_ptr<SafetyInterlock>(
        new SafetyInterlock(_ctx, INTERLOCK_LEVELING_JACK, FEATURE_SPARTAN_K2, jacks)));
}

SafetyInterlock* SafetyService::findInterlock(const std::string& name) {
    for (size_t i = 0; i < _interlocks.size(); i++) {
        if (_interlocks[i]->getName() == name) return _interlocks[i].get();
    }
    return nullptr;
}

const SafetyInterlock* SafetyService::getInterlock(const std::string& name) const {
    for (size_t i = 0; i < _interlocks.size(); i++) {
        if (_interlocks[i]->getName() == name) return _interlocks[i].get();
    }
    return nullptr;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Audit)
// =================================================================================

void SafetyService::logKeyValue(const char* key, const char* value) {
    char tempBuf[256];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

std::string SafetyService::isoNow() {
    char buf[32];
    TimeUtils::formatIsoTimestamp(_ctx.getEpochSeconds(), buf, sizeof(buf));
    return std::string(buf);
}

void SafetyService::audit(const char* eventType, JsonDocument& details) {
    std::string text;
    serializeJson(details, text);
    _auditLog.append(_ctx.getEpochSeconds(), eventType, text);

    char logBuf[256];
    snprintf(logBuf, sizeof(logBuf), "%s %s", eventType, text.c_str());
    logKeyValue("Audit", logBuf);
}

void SafetyService::reportSecurityEvent(SecurityEventType type, SecuritySeverity severity,
                                        const std::string& userId, JsonDocument& details,
                                        bool emergencyContext) {
    if (_securityAudit == nullptr) return;

    SecurityEvent event;
    event.type = type;
    event.severity = severity;
    event.userId = userId;
    event.emergencyContext = emergencyContext;
    serializeJson(details, event.details);

    if (!_securityAudit->logSecurityEvent(event)) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Security audit unavailable, dropped '%s'", securityEventToString(type));
        logKeyValue("Safety", logBuf);
    }
}

// =================================================================================
// SECTION: AUTHORIZATION
// =================================================================================

AuthDecision SafetyService::authorize(const std::string& sessionId, const char* operation, const std::string& userId) {
    if (_authorizer == nullptr) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "PIN manager not available for '%s'", operation);
        logKeyValue("Safety", logBuf);
        return AUTHZ_INFRA_ERROR;
    }
    return _authorizer->authorizeOperation(sessionId, operation, userId);
}

SafetyOutcome SafetyService::rejectAuthorization(AuthDecision decision,
                                                 const char* auditEvent,
                                                 const char* attemptedOperation,
                                                 const std::string& userId,
                                                 const std::string& sessionId) {
    const char* failureReason = (decision == AUTHZ_INFRA_ERROR) ? "authorization_unavailable"
                                                                : "pin_authorization_failed";

    char logBuf[160];
    snprintf(logBuf, sizeof(logBuf), "%s denied for user %s (%s)", attemptedOperation,
             userId.c_str(), authDecisionToString(decision));
    logKeyValue("Safety", logBuf);

    JsonDocument details;
    details["user_id"] = userId;
    details["pin_session_id"] = sessionId;
    details["failure_reason"] = failureReason;
    audit(auditEvent, details);

    JsonDocument sec;
    sec["attempted_operation"] = attemptedOperation;
    sec["failure_reason"] = failureReason;
    sec["pin_session_id"] = sessionId;
    reportSecurityEvent(SEC_UNAUTHORIZED_ACCESS, SEV_HIGH, userId, sec, _emergencyStopActive);

    return (decision == AUTHZ_INFRA_ERROR) ? SAFETY_INFRA_ERROR : SAFETY_AUTH_DENIED;
}

// =================================================================================
// SECTION: TELEMETRY
// =================================================================================

void SafetyService::updateSystemState(const SystemStateUpdate& update) {
    const SystemState& v = update.values;
    if (update.fields & FIELD_VEHICLE_SPEED) _systemState.vehicleSpeedMph = v.vehicleSpeedMph;
    if (update.fields & FIELD_PARKING_BRAKE) _systemState.parkingBrakeEngaged = v.parkingBrakeEngaged;
    if (update.fields & FIELD_LEVELING_JACKS) _systemState.levelingJacksDown = v.levelingJacksDown;
    if (update.fields & FIELD_ENGINE_RUNNING) _systemState.engineRunning = v.engineRunning;
    if (update.fields & FIELD_TRANSMISSION) _systemState.transmissionGear = v.transmissionGear;
    if (update.fields & FIELD_SLIDES_RETRACTED) _systemState.allSlidesRetracted = v.allSlidesRetracted;
    _systemState.version = SYSTEM_STATE_VERSION;
}

// =================================================================================
// SECTION: INTERLOCK EVALUATION
// =================================================================================

uint32_t SafetyService::checkSafetyInterlocks(std::vector<std::string>* violated) {
    uint32_t violations = 0;

    for (size_t i = 0; i < _interlocks.size(); i++) {
        SafetyInterlock& interlock = *_interlocks[i];
        InterlockCheck check = interlock.checkConditions(_systemState);

        if (check.overrideExpired) {
            _activeOverrides.erase(interlock.getName());
            JsonDocument details;
            details["interlock"] = interlock.getName();
            audit("interlock_override_expired", details);
        }

        if (!check.satisfied) {
            violations++;
            if (violated != nullptr) violated->push_back(interlock.getName());

            if (interlock.engage(check.reason.c_str())) {
                JsonDocument details;
                details["interlock"] = interlock.getName();
                details["feature"] = interlock.getFeatureName();
                details["reason"] = check.reason;
                audit("interlock_engaged", details);

                JsonDocument sec;
                sec["interlock_name"] = interlock.getName();
                sec["feature_name"] = interlock.getFeatureName();
                sec["violation_reason"] = check.reason;
                sec["safe_state_action"] = safeStateActionToString(interlock.getSafeStateAction());
                reportSecurityEvent(SEC_SAFETY_INTERLOCK_VIOLATED, SEV_HIGH, "", sec, _emergencyStopActive);
            }
        } else if (interlock.isEngaged() && !_inSafeState) {
            // Safe state keeps every interlock engaged until cleared
            interlock.disengage("Conditions satisfied");
            JsonDocument details;
            details["interlock"] = interlock.getName();
            details["feature"] = interlock.getFeatureName();
            details["reason"] = check.reason;
            audit("interlock_disengaged", details);
        }
    }

    return violations;
}

uint32_t SafetyService::checkAllInterlocks() {
    std::vector<std::string> violated;
    uint32_t violations = checkSafetyInterlocks(&violated);

    for (size_t i = 0; i < violated.size(); i++) {
        std::string action = "interlock_violated_" + violated[i];
        bool known = false;
        for (size_t j = 0; j < _activeSafetyActions.size(); j++) {
            if (_activeSafetyActions[j] == action) { known = true; break; }
        }
        if (!known) _activeSafetyActions.push_back(action);
    }

    if (violations >= _config.multipleViolationThreshold) {
        std::string reason = "Multiple interlock violations: " + std::to_string(violations) + " (";
        for (size_t i = 0; i < violated.size(); i++) {
            if (i > 0) reason += ", ";
            reason += violated[i];
        }
        reason += ")";
        triggerEmergencyStop(reason.c_str(), "safety_monitoring");
    }

    return violations;
}

bool SafetyService::clearInterlockOverride(const std::string& interlockName) {
    SafetyInterlock* interlock = findInterlock(interlockName);
    if (interlock == nullptr) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Cannot clear override, unknown interlock '%s'", interlockName.c_str());
        logKeyValue("Safety", logBuf);
        return false;
    }

    bool wasOverridden = interlock->clearOverride();
    bool wasTracked = _activeOverrides.erase(interlockName) > 0;
    if (!wasOverridden && !wasTracked) return false;

    JsonDocument details;
    details["interlock"] = interlockName;
    details["cleared_at"] = isoNow();
    audit("interlock_override_cleared", details);
    return true;
}

// =================================================================================
// SECTION: EMERGENCY STOP
// =================================================================================

bool SafetyService::triggerEmergencyStop(const char* reason, const char* triggeredBy) {
    if (_emergencyStopActive) {
        logKeyValue("Safety", "Emergency stop already active");
        return false;
    }

    _emergencyStopActive = true;
    _emergencyStopReason = reason;
    _emergencyStopTriggeredBy = triggeredBy;
    _emergencyStopTime = _ctx.getEpochSeconds();

    _ctx.log("==========================================================================");
    char logBuf[256];
    snprintf(logBuf, sizeof(logBuf), "EMERGENCY STOP TRIGGERED - Reason: %s, By: %s", reason, triggeredBy);
    logKeyValue("Safety", logBuf);
    _ctx.log("==========================================================================");

    JsonDocument details;
    details["reason"] = reason;
    details["triggered_by"] = triggeredBy;
    details["timestamp"] = isoNow();
    audit("emergency_stop_triggered", details);

    executeEmergencyStopActions();

    JsonDocument sec;
    sec["reason"] = reason;
    sec["method"] = "trigger_emergency_stop";
    sec["safety_actions_count"] = _activeSafetyActions.size();
    reportSecurityEvent(SEC_EMERGENCY_STOP_TRIGGERED, SEV_CRITICAL, triggeredBy, sec, true);

    return true;
}

void SafetyService::executeEmergencyStopActions() {
    _activeSafetyActions.clear();

    // 1. Position-critical features to SAFE_SHUTDOWN
    std::vector<FeatureInfo> features;
    _features.listFeatures(features);

    size_t positionCritical = 0;
    for (size_t i = 0; i < features.size(); i++) {
        const FeatureInfo& f = features[i];
        if (f.classification != CLASS_POSITION_CRITICAL) continue;
        positionCritical++;
        if (!f.enabled || f.state == FEATURE_SAFE_SHUTDOWN) continue;

        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Emergency stop: Setting %s to SAFE_SHUTDOWN", f.name.c_str());
        logKeyValue("Safety", logBuf);

        if (!_features.setFeatureState(f.name, FEATURE_SAFE_SHUTDOWN)) {
            JsonDocument details;
            details["feature"] = f.name;
            details["error"] = "feature manager rejected SAFE_SHUTDOWN";
            details["reason"] = _emergencyStopReason;
            audit("emergency_stop_error", details);
        }
    }

    if (positionCritical > 0) {
        _activeSafetyActions.push_back("position_critical_safe_shutdown");
        _activeSafetyActions.push_back("maintain_position");
    }

    // 2. Engage every interlock
    engageAllInterlocks("Emergency stop: " + _emergencyStopReason, true);

    // 3. System-wide safe state
    enterSafeState("Emergency stop: " + _emergencyStopReason);
}

void SafetyService::engageAllInterlocks(const std::string& reason, bool recordActions) {
    for (size_t i = 0; i < _interlocks.size(); i++) {
        SafetyInterlock& interlock = *_interlocks[i];
        if (!interlock.engage(reason.c_str())) continue;

        if (recordActions) {
            _activeSafetyActions.push_back("interlock_engaged_" + interlock.getName());
        }

        JsonDocument details;
        details["interlock"] = interlock.getName();
        details["feature"] = interlock.getFeatureName();
        details["reason"] = reason;
        audit("interlock_engaged", details);
    }
}

void SafetyService::enterSafeState(const std::string& reason) {
    if (_inSafeState) return;

    _inSafeState = true;
    _safeStateReason = reason;
    _monitoringActive = false;

    _ctx.log("=== ENTERING SAFE STATE ===");
    logKeyValue("Safety", reason.c_str());

    JsonDocument details;
    details["reason"] = reason;
    details["timestamp"] = isoNow();
    audit("safe_state_entered", details);

    // Forensic snapshot
    char logBuf[192];
    snprintf(logBuf, sizeof(logBuf),
             "Snapshot v%u: speed=%.1f brake=%d jacks=%d engine=%d gear=%s slides_in=%d",
             (unsigned)_systemState.version, (double)_systemState.vehicleSpeedMph,
             _systemState.parkingBrakeEngaged, _systemState.levelingJacksDown,
             _systemState.engineRunning, gearToString(_systemState.transmissionGear),
             _systemState.allSlidesRetracted);
    logKeyValue("Safety", logBuf);

    shutdownSafetyCriticalFeatures();
    engageAllInterlocks("Safe state: " + reason, false);

    _ctx.log("=== SAFE STATE ESTABLISHED ===");
}

void SafetyService::shutdownSafetyCriticalFeatures() {
    std::vector<FeatureInfo> features;
    _features.listFeatures(features);

    for (size_t i = 0; i < features.size(); i++) {
        const FeatureInfo& f = features[i];
        bool critical = (f.classification == CLASS_CRITICAL || f.classification == CLASS_POSITION_CRITICAL);
        if (!critical || !f.enabled || f.state == FEATURE_SAFE_SHUTDOWN) continue;

        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Safe state: Setting %s to SAFE_SHUTDOWN", f.name.c_str());
        logKeyValue("Safety", logBuf);

        if (!_features.setFeatureState(f.name, FEATURE_SAFE_SHUTDOWN)) {
            JsonDocument details;
            details["feature"] = f.name;
            details["error"] = "feature manager rejected SAFE_SHUTDOWN";
            details["reason"] = _safeStateReason;
            audit("safe_state_error", details);
        }
    }
}

SafetyOutcome SafetyService::emergencyStopWithPin(const std::string& sessionId, const std::string& reason,
                                                  const std::string& triggeredBy) {
    AuthDecision decision = authorize(sessionId, OP_EMERGENCY_STOP, triggeredBy);
    if (decision != AUTHZ_GRANTED) {
        return rejectAuthorization(decision, "emergency_stop_auth_failed", "emergency_stop_with_pin",
                                   triggeredBy, sessionId);
    }

    if (!triggerEmergencyStop(reason.c_str(), triggeredBy.c_str())) return SAFETY_NO_CHANGE;

    char logBuf[160];
    snprintf(logBuf, sizeof(logBuf), "PIN-authorized emergency stop by %s", triggeredBy.c_str());
    logKeyValue("Safety", logBuf);
    return SAFETY_OK;
}

SafetyOutcome SafetyService::resetEmergencyStop(const std::string& authorizationCode, const std::string& resetBy) {
    return performEmergencyReset(authorizationCode, resetBy, "");
}

SafetyOutcome SafetyService::resetEmergencyStopWithPin(const std::string& sessionId, const std::string& resetBy) {
    return performEmergencyReset("", resetBy, sessionId);
}

SafetyOutcome SafetyService::performEmergencyReset(const std::string& authorizationCode,
                                                   const std::string& resetBy,
                                                   const std::string& sessionId) {
    if (!_emergencyStopActive) {
        logKeyValue("Safety", "No emergency stop active to reset");
        return SAFETY_NO_CHANGE;
    }

    bool authorized = false;
    const char* authMethod = "unknown";
    AuthDecision decision = AUTHZ_DENIED;

    // 1. PIN session (preferred)
    if (!sessionId.empty()) {
        decision = authorize(sessionId, OP_EMERGENCY_RESET, resetBy);
        authMethod = "pin_session";
        authorized = (decision == AUTHZ_GRANTED);
    }

    // 2. Legacy static code
    if (!authorized && !authorizationCode.empty()) {
        if (_config.allowLegacyResetCode && authorizationCode == _config.legacyResetCode) {
            authorized = true;
            authMethod = "legacy_code";
            logKeyValue("Safety", "Emergency stop reset using legacy authorization code");
        } else {
            logKeyValue("Safety", "Invalid legacy authorization code for emergency stop reset");
        }
    }

    if (!authorized) {
        // A rejected legacy code is a denial even if the PIN path was unreachable
        AuthDecision reported = authorizationCode.empty() ? decision : AUTHZ_DENIED;
        return rejectAuthorization(reported, "emergency_stop_reset_failed", "reset_emergency_stop",
                                   resetBy, sessionId);
    }

    _emergencyStopActive = false;
    _emergencyStopReason.clear();
    _emergencyStopTriggeredBy.clear();
    _emergencyStopTime = 0;

    JsonDocument details;
    details["reset_by"] = resetBy;
    details["auth_method"] = authMethod;
    details["pin_session_id"] = sessionId;
    details["timestamp"] = isoNow();
    audit("emergency_stop_reset", details);

    JsonDocument sec;
    sec["auth_method"] = authMethod;
    sec["pin_session_used"] = !sessionId.empty();
    sec["reset_successful"] = true;
    reportSecurityEvent(SEC_EMERGENCY_STOP_RESET, SEV_HIGH, resetBy, sec, false);

    logKeyValue("Safety", "Emergency stop reset. Features and interlocks require explicit re-enable.");
    return SAFETY_OK;
}

SafetyOutcome SafetyService::clearSafeStateWithPin(const std::string& sessionId, const std::string& clearedBy) {
    if (!_inSafeState) return SAFETY_NO_CHANGE;

    if (_emergencyStopActive) {
        logKeyValue("Safety", "Safe state cannot be cleared while emergency stop is active");
        return SAFETY_INVALID_STATE;
    }

    AuthDecision decision = authorize(sessionId, OP_SAFE_STATE_CLEAR, clearedBy);
    if (decision != AUTHZ_GRANTED) {
        return rejectAuthorization(decision, "safe_state_clear_auth_failed", "clear_safe_state_with_pin",
                                   clearedBy, sessionId);
    }

    std::string previousReason = _safeStateReason;
    _inSafeState = false;
    _safeStateReason.clear();
    _activeSafetyActions.clear();

    JsonDocument details;
    details["cleared_by"] = clearedBy;
    details["previous_reason"] = previousReason;
    details["pin_session_id"] = sessionId;
    details["timestamp"] = isoNow();
    audit("safe_state_cleared", details);

    JsonDocument sec;
    sec["previous_reason"] = previousReason;
    sec["authorization_method"] = "pin_session";
    reportSecurityEvent(SEC_SAFE_STATE_CLEARED, SEV_HIGH, clearedBy, sec, false);

    // Interlocks stay engaged until the next health tick re-evaluates them
    startMonitoring();
    return SAFETY_OK;
}

// =================================================================================
// SECTION: INTERLOCK OVERRIDE
// =================================================================================

SafetyOutcome SafetyService::overrideInterlockWithPin(const std::string& sessionId,
                                                      const std::string& interlockName,
                                                      const std::string& reason,
                                                      uint32_t durationMinutes,
                                                      const std::string& overriddenBy) {
    SafetyInterlock* interlock = findInterlock(interlockName);
    if (interlock == nullptr) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Override rejected, unknown interlock '%s'", interlockName.c_str());
        logKeyValue("Safety", logBuf);
        return SAFETY_NOT_FOUND;
    }

    if (durationMinutes == 0 || durationMinutes > _config.maxOverrideMinutes) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Override rejected, duration %u min outside 1..%u",
                 durationMinutes, _config.maxOverrideMinutes);
        logKeyValue("Safety", logBuf);
        return SAFETY_INVALID_REQUEST;
    }

    if (_emergencyStopActive || _inSafeState) {
        logKeyValue("Safety", "Override rejected while emergency stop or safe state is active");
        return SAFETY_INVALID_STATE;
    }

    AuthDecision decision = authorize(sessionId, OP_INTERLOCK_OVERRIDE, overriddenBy);
    if (decision != AUTHZ_GRANTED) {
        return rejectAuthorization(decision, "interlock_override_auth_failed", "override_interlock_with_pin",
                                   overriddenBy, sessionId);
    }

    InterlockOverride info;
    info.sessionId = sessionId;
    info.reason = reason;
    info.overriddenBy = overriddenBy;
    info.expiresAt = _ctx.getEpochSeconds() + (int64_t)durationMinutes * 60;

    interlock->override(info);
    _activeOverrides[interlockName] = info.expiresAt;

    char expiresStr[32];
    TimeUtils::formatIsoTimestamp(info.expiresAt, expiresStr, sizeof(expiresStr));

    JsonDocument details;
    details["interlock"] = interlockName;
    details["feature"] = interlock->getFeatureName();
    details["overridden_by"] = overriddenBy;
    details["reason"] = reason;
    details["duration_minutes"] = durationMinutes;
    details["expires_at"] = expiresStr;
    details["pin_session_id"] = sessionId;
    audit("interlock_overridden", details);

    JsonDocument sec;
    sec["interlock_name"] = interlockName;
    sec["feature_name"] = interlock->getFeatureName();
    sec["reason"] = reason;
    sec["duration_minutes"] = durationMinutes;
    sec["expires_at"] = expiresStr;
    sec["authorization_method"] = "pin_session";
    reportSecurityEvent(SEC_INTERLOCK_OVERRIDDEN, SEV_CRITICAL, overriddenBy, sec, false);

    return SAFETY_OK;
}

size_t SafetyService::clearAllOverrides() {
    size_t cleared = 0;
    for (size_t i = 0; i < _interlocks.size(); i++) {
        if (_interlocks[i]->clearOverride()) cleared++;
    }
    _activeOverrides.clear();
    return cleared;
}

// =================================================================================
// SECTION: OPERATIONAL MODES
// =================================================================================

SafetyOutcome SafetyService::enterMaintenanceModeWithPin(const std::string& sessionId, const std::string& reason,
                                                         uint32_t durationMinutes, const std::string& enteredBy) {
    return enterMode(MODE_MAINTENANCE, OP_MAINTENANCE_ENTER, sessionId, reason, durationMinutes, enteredBy);
}

SafetyOutcome SafetyService::exitMaintenanceModeWithPin(const std::string& sessionId, const std::string& exitedBy) {
    return exitMode(MODE_MAINTENANCE, OP_MAINTENANCE_EXIT, sessionId, exitedBy);
}

SafetyOutcome SafetyService::enterDiagnosticModeWithPin(const std::string& sessionId, const std::string& reason,
                                                        uint32_t durationMinutes, const std::string& enteredBy) {
    return enterMode(MODE_DIAGNOSTIC, OP_DIAGNOSTIC_ENTER, sessionId, reason, durationMinutes, enteredBy);
}

SafetyOutcome SafetyService::exitDiagnosticModeWithPin(const std::string& sessionId, const std::string& exitedBy) {
    return exitMode(MODE_DIAGNOSTIC, OP_DIAGNOSTIC_EXIT, sessionId, exitedBy);
}

SafetyOutcome SafetyService::enterMode(OperationalMode mode, const char* operation,
                                       const std::string& sessionId, const std::string& reason,
                                       uint32_t durationMinutes, const std::string& enteredBy) {
    const char* label = modeToString(mode);
    char logBuf[192];

    // Modes are mutually exclusive
    if (_mode != MODE_NORMAL) {
        snprintf(logBuf, sizeof(logBuf), "Cannot enter %s mode, system already in %s mode", label, modeToString(_mode));
        logKeyValue("Safety", logBuf);
        return SAFETY_INVALID_STATE;
    }

    if (durationMinutes == 0 || durationMinutes > _config.maxModeMinutes) {
        snprintf(logBuf, sizeof(logBuf), "Cannot enter %s mode, duration %u min outside 1..%u",
                 label, durationMinutes, _config.maxModeMinutes);
        logKeyValue("Safety", logBuf);
        return SAFETY_INVALID_REQUEST;
    }

    AuthDecision decision = authorize(sessionId, operation, enteredBy);
    if (decision != AUTHZ_GRANTED) {
        std::string auditEvent = std::string(label) + "_mode_auth_failed";
        std::string attempted = std::string("enter_") + label + "_mode_with_pin";
        return rejectAuthorization(decision, auditEvent.c_str(), attempted.c_str(), enteredBy, sessionId);
    }

    int64_t now = _ctx.getEpochSeconds();
    OperationalMode previous = _mode;
    _mode = mode;
    _hasModeSession = true;
    _modeSession.pinSessionId = sessionId;
    _modeSession.enteredBy = enteredBy;
    _modeSession.reason = reason;
    _modeSession.enteredAt = now;
    _modeSession.expiresAt = now + (int64_t)durationMinutes * 60;

    char expiresStr[32];
    TimeUtils::formatIsoTimestamp(_modeSession.expiresAt, expiresStr, sizeof(expiresStr));

    JsonDocument details;
    details["previous_mode"] = modeToString(previous);
    details["entered_by"] = enteredBy;
    details["reason"] = reason;
    details["duration_minutes"] = durationMinutes;
    details["expires_at"] = expiresStr;
    details["pin_session_id"] = sessionId;
    std::string auditEvent = std::string(label) + "_mode_entered";
    audit(auditEvent.c_str(), details);

    JsonDocument sec;
    sec["reason"] = reason;
    sec["duration_minutes"] = durationMinutes;
    sec["expires_at"] = expiresStr;
    sec["authorization_method"] = "pin_session";
    sec["previous_mode"] = modeToString(previous);
    reportSecurityEvent(mode == MODE_MAINTENANCE ? SEC_MAINTENANCE_MODE_ACTIVATED : SEC_DIAGNOSTIC_MODE_ACTIVATED,
                        SEV_HIGH, enteredBy, sec, _emergencyStopActive);

    snprintf(logBuf, sizeof(logBuf), ">>> MODE CHANGE: %s by %s for %u min", label, enteredBy.c_str(), durationMinutes);
    logKeyValue("Safety", logBuf);
    return SAFETY_OK;
}

SafetyOutcome SafetyService::exitMode(OperationalMode mode, const char* operation,
                                      const std::string& sessionId, const std::string& exitedBy) {
    const char* label = modeToString(mode);

    if (_mode == MODE_NORMAL) return SAFETY_NO_CHANGE;

    if (_mode != mode) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Cannot exit %s mode, system is in %s mode", label, modeToString(_mode));
        logKeyValue("Safety", logBuf);
        return SAFETY_INVALID_STATE;
    }

    AuthDecision decision = authorize(sessionId, operation, exitedBy);
    if (decision != AUTHZ_GRANTED) {
        std::string auditEvent = std::string(label) + "_mode_exit_auth_failed";
        std::string attempted = std::string("exit_") + label + "_mode_with_pin";
        return rejectAuthorization(decision, auditEvent.c_str(), attempted.c_str(), exitedBy, sessionId);
    }

    int64_t elapsed = _ctx.getEpochSeconds() - _modeSession.enteredAt;
    size_t cleared = clearAllOverrides();

    _mode = MODE_NORMAL;
    _hasModeSession = false;
    _modeSession = ModeSession();
    _modeSession.enteredAt = 0;
    _modeSession.expiresAt = 0;

    JsonDocument details;
    details["exited_by"] = exitedBy;
    details["duration_minutes"] = elapsed > 0 ? elapsed / 60 : 0;
    details["overrides_cleared"] = cleared;
    details["pin_session_id"] = sessionId;
    std::string auditEvent = std::string(label) + "_mode_exited";
    audit(auditEvent.c_str(), details);

    JsonDocument sec;
    sec["duration_minutes"] = elapsed > 0 ? elapsed / 60 : 0;
    sec["overrides_cleared"] = cleared;
    sec["authorization_method"] = "pin_session";
    reportSecurityEvent(mode == MODE_MAINTENANCE ? SEC_MAINTENANCE_MODE_DEACTIVATED : SEC_DIAGNOSTIC_MODE_DEACTIVATED,
                        SEV_MEDIUM, exitedBy, sec, _emergencyStopActive);

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), ">>> MODE CHANGE: normal (exited %s by %s)", label, exitedBy.c_str());
    logKeyValue("Safety", logBuf);
    return SAFETY_OK;
}

bool SafetyService::checkModeExpiration() {
    if (_mode == MODE_NORMAL || !_hasModeSession) return false;

    int64_t now = _ctx.getEpochSeconds();
    if (now <= _modeSession.expiresAt) return false;

    OperationalMode expired = _mode;
    size_t cleared = clearAllOverrides();

    JsonDocument details;
    details["expired_mode"] = modeToString(expired);
    details["entered_by"] = _modeSession.enteredBy;
    details["overrides_cleared"] = cleared;
    details["timestamp"] = isoNow();
    audit("operational_mode_expired", details);

    _mode = MODE_NORMAL;
    _hasModeSession = false;
    _modeSession = ModeSession();
    _modeSession.enteredAt = 0;
    _modeSession.expiresAt = 0;

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), ">>> MODE CHANGE: normal (%s mode expired)", modeToString(expired));
    logKeyValue("Safety", logBuf);
    return true;
}

// =================================================================================
// SECTION: RATE LIMITING
// =================================================================================

bool SafetyService::validateSafetyOperation(RateLimitCategory category,
                                            const std::string& userId,
                                            const std::string& sourceIp,
                                            bool isAdmin,
                                            const std::string& entityId) {
    if (_securityAudit == nullptr) return true;

    bool allowed = true;
    if (!_securityAudit->checkRateLimit(userId, category, isAdmin, sourceIp, allowed)) {
        logKeyValue("Safety", "Rate limiter unavailable, allowing operation");
        return true;
    }

    if (!allowed) {
        char logBuf[160];
        snprintf(logBuf, sizeof(logBuf), "Rate limit exceeded for %s (%s)", userId.c_str(),
                 rateCategoryToString(category));
        logKeyValue("Safety", logBuf);

        JsonDocument details;
        details["user_id"] = userId;
        details["category"] = rateCategoryToString(category);
        details["entity_id"] = entityId;
        audit("rate_limit_exceeded", details);

        JsonDocument sec;
        sec["category"] = rateCategoryToString(category);
        sec["entity_id"] = entityId;
        sec["source_ip"] = sourceIp;
        reportSecurityEvent(SEC_RATE_LIMIT_EXCEEDED, category == RATE_EMERGENCY ? SEV_HIGH : SEV_MEDIUM,
                            userId, sec, _emergencyStopActive);
        return false;
    }

    JsonDocument sec;
    sec["category"] = rateCategoryToString(category);
    sec["entity_id"] = entityId;
    sec["source_ip"] = sourceIp;
    sec["is_admin"] = isAdmin;
    reportSecurityEvent(SEC_SAFETY_OPERATION_AUTHORIZED, SEV_LOW, userId, sec, _emergencyStopActive);
    return true;
}

// =================================================================================
// SECTION: MONITORING TICKS (Health & Watchdog)
// =================================================================================

void SafetyService::startMonitoring() {
    if (_inSafeState) {
        logKeyValue("Safety", "Monitoring not started, system is in safe state");
        return;
    }
    _lastWatchdogKick = _ctx.getMillis();
    _watchdogTripped = false;
    _monitoringActive = true;
    logKeyValue("Safety", "Health monitoring and watchdog armed");
}

void SafetyService::kickWatchdog() {
    _lastWatchdogKick = _ctx.getMillis();
}

bool SafetyService::isWatchdogExpired() const {
    if (!_monitoringActive.load()) return false;
    unsigned long elapsed = _ctx.getMillis() - _lastWatchdogKick.load();
    return elapsed > _config.watchdogTimeoutMs;
}

bool SafetyService::tripWatchdog() {
    if (_watchdogTripped.load() || !isWatchdogExpired()) return false;
    unsigned long elapsed = _ctx.getMillis() - _lastWatchdogKick.load();
    bool expected = false;
    if (!_watchdogTripped.compare_exchange_strong(expected, true)) return false;
    _trippedElapsedMs = elapsed;
    return true;
}

void SafetyService::handleWatchdogTimeout() {
    if (_inSafeState) return;

    unsigned long elapsed = _ctx.getMillis() - _lastWatchdogKick.load();
    if (_watchdogTripped.load()) elapsed = _trippedElapsedMs.load();
    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Safety watchdog timeout detected (%lu ms > %u ms)",
             elapsed, _config.watchdogTimeoutMs);
    logKeyValue("Safety", logBuf);

    JsonDocument details;
    details["elapsed_ms"] = elapsed;
    details["timeout_ms"] = _config.watchdogTimeoutMs;
    audit("watchdog_timeout", details);

    enterSafeState("Watchdog timeout");
}

bool SafetyService::checkWatchdog() {
    if (!_monitoringActive.load() || _inSafeState) return false;
    tripWatchdog();
    if (_watchdogTripped.load()) {
        handleWatchdogTimeout();
        return false;
    }
    return true;
}

bool SafetyService::queryFeatureHealth(HealthReport& out) {
    return _features.checkSystemHealth(out);
}

bool SafetyService::runHealthCheck() {
    if (!_monitoringActive.load() || _inSafeState) return false;

    HealthReport report;
    bool available = queryFeatureHealth(report);
    return applyHealthCheck(available, report);
}

bool SafetyService::applyHealthCheck(bool healthAvailable, const HealthReport& report) {
    if (!_monitoringActive.load() || _inSafeState) return false;

    // 0. A latched watchdog expiry wins over a late tick
    if (_watchdogTripped.load()) {
        handleWatchdogTimeout();
        return false;
    }

    // 1. Feature health
    if (!healthAvailable) {
        logKeyValue("Safety", "Feature health query failed");
        enterSafeState("Monitoring loop failure: feature health unavailable");
        return false;
    }

    if (!report.failedCritical.empty()) {
        std::string reason = "Critical feature failed: ";
        for (size_t i = 0; i < report.failedCritical.size(); i++) {
            if (i > 0) reason += ", ";
            reason += report.failedCritical[i];
        }
        triggerEmergencyStop(reason.c_str(), "health_monitoring");
        return !_inSafeState;
    }

    // 2. Interlocks, with escalation on multiple violations
    checkAllInterlocks();
    if (_inSafeState) return false;

    // 3. Liveness
    kickWatchdog();

    // 4. Mode expiry sweep
    checkModeExpiration();
    return true;
}

// =================================================================================
// SECTION: STATUS & DIAGNOSTICS
// =================================================================================

SafetyStatus SafetyService::getSafetyStatus() const {
    SafetyStatus s;
    s.inSafeState = _inSafeState;
    s.safeStateReason = _safeStateReason;
    s.emergencyStopActive = _emergencyStopActive;
    s.emergencyStopReason = _emergencyStopReason;
    s.emergencyStopTriggeredBy = _emergencyStopTriggeredBy;
    s.emergencyStopTime = _emergencyStopTime;
    s.mode = _mode;
    s.hasModeSession = _hasModeSession;
    s.modeSession = _modeSession;

    for (std::map<std::string, int64_t>::const_iterator it = _activeOverrides.begin();
         it != _activeOverrides.end(); ++it) {
        ActiveOverride o;
        o.interlockName = it->first;
        o.expiresAt = it->second;
        s.activeOverrides.push_back(o);
    }

    s.watchdogTimeoutMs = _config.watchdogTimeoutMs;
    s.msSinceLastKick = _ctx.getMillis() - _lastWatchdogKick.load();

    for (size_t i = 0; i < _interlocks.size(); i++) {
        s.interlocks.push_back(_interlocks[i]->getStatus());
    }

    s.systemState = _systemState;
    s.auditLogEntries = _auditLog.size();
    s.activeSafetyActions = _activeSafetyActions;
    return s;
}

void SafetyService::getAuditLog(size_t maxEntries, std::vector<AuditLogEntry>& out) const {
    _auditLog.getRecent(maxEntries, out);
}

void SafetyService::printStartupDiagnostics() {
    char logBuf[160];
    const char* boolStr[] = { "NO", "YES" };

    _ctx.log("==========================================================================");
    _ctx.log("                        SAFETY SUPERVISOR DIAGNOSTICS                     ");
    _ctx.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _ctx.log("[ SUPERVISOR STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Operational Mode", modeToString(_mode));
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Emergency Stop", boolStr[_emergencyStopActive]);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Safe State", boolStr[_inSafeState]);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "PIN Authorizer", _authorizer ? "CONNECTED" : "MISSING (deny all)");
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Security Audit", _securityAudit ? "CONNECTED" : "DISABLED");
    _ctx.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: INTERLOCKS
    // -------------------------------------------------------------------------
    _ctx.log("");
    _ctx.log("[ INTERLOCKS ]");

    for (size_t i = 0; i < _interlocks.size(); i++) {
        const SafetyInterlock& il = *_interlocks[i];
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s, %u conditions, %s", il.getName().c_str(),
                 il.getFeatureName().c_str(), (unsigned)il.getConditionNames().size(),
                 il.isEngaged() ? "ENGAGED" : "disengaged");
        _ctx.log(logBuf);
    }

    // -------------------------------------------------------------------------
    // SECTION: TIMING & LIMITS
    // -------------------------------------------------------------------------
    _ctx.log("");
    _ctx.log("[ TIMING & LIMITS ]");

    char timeStr[48];
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Health Interval", _config.healthCheckIntervalMs);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Watchdog Timeout", _config.watchdogTimeoutMs);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Violation Threshold", _config.multipleViolationThreshold);
    _ctx.log(logBuf);
    TimeUtils::formatSeconds((unsigned long)_config.maxModeMinutes * 60, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Max Mode Duration", timeStr);
    _ctx.log(logBuf);
    TimeUtils::formatSeconds((unsigned long)_config.maxOverrideMinutes * 60, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Max Override Duration", timeStr);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Legacy Reset Code", boolStr[_config.allowLegacyResetCode]);
    _ctx.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Audit Capacity", (unsigned)_auditLog.capacity());
    _ctx.log(logBuf);
}
