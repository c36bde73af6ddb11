/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/ConfigValidators/StatusJson.cpp
 * =================================================================================
 */
#include "StatusJson.h"
#include "TimeUtils.h"

void StatusJson::writeTimestamp(JsonObject out, const char* key, int64_t epochSeconds) {
    if (epochSeconds <= 0) {
        out[key] = nullptr;
        return;
    }
    char buf[32];
    TimeUtils::formatIsoTimestamp(epochSeconds, buf, sizeof(buf));
    out[key] = buf;
}

// =================================================================================
// SECTION: SAFETY
// =================================================================================

void StatusJson::writeSafetyStatus(const SafetyStatus& status, JsonObject out) {
    out["in_safe_state"] = status.inSafeState;
    if (status.inSafeState) out["safe_state_reason"] = status.safeStateReason;

    JsonObject estop = out["emergency_stop"].to<JsonObject>();
    estop["active"] = status.emergencyStopActive;
    if (status.emergencyStopActive) {
        estop["reason"] = status.emergencyStopReason;
        estop["triggered_by"] = status.emergencyStopTriggeredBy;
        writeTimestamp(estop, "triggered_at", status.emergencyStopTime);
    }

    JsonObject mode = out["operational_mode"].to<JsonObject>();
    mode["mode"] = modeToString(status.mode);
    if (status.hasModeSession) {
        mode["entered_by"] = status.modeSession.enteredBy;
        mode["reason"] = status.modeSession.reason;
        writeTimestamp(mode, "entered_at", status.modeSession.enteredAt);
        writeTimestamp(mode, "expires_at", status.modeSession.expiresAt);
    }

    JsonArray overrides = out["active_overrides"].to<JsonArray>();
    for (size_t i = 0; i < status.activeOverrides.size(); i++) {
        JsonObject o = overrides.add<JsonObject>();
        o["interlock"] = status.activeOverrides[i].interlockName;
        writeTimestamp(o, "expires_at", status.activeOverrides[i].expiresAt);
    }

    JsonObject wd = out["watchdog"].to<JsonObject>();
    wd["timeout_ms"] = status.watchdogTimeoutMs;
    wd["ms_since_last_kick"] = status.msSinceLastKick;

    JsonObject interlocks = out["interlocks"].to<JsonObject>();
    for (size_t i = 0; i < status.interlocks.size(); i++) {
        const InterlockStatus& il = status.interlocks[i];
        JsonObject o = interlocks[il.name].to<JsonObject>();
        o["feature"] = il.featureName;
        o["engaged"] = il.engaged;
        JsonArray conds = o["conditions"].to<JsonArray>();
        for (size_t c = 0; c < il.conditions.size(); c++) conds.add(il.conditions[c]);
        if (il.engaged) {
            writeTimestamp(o, "engaged_at", il.engagementTime);
            o["engagement_reason"] = il.engagementReason;
        }
        o["overridden"] = il.overridden;
        if (il.overridden) {
            JsonObject ov = o["override"].to<JsonObject>();
            ov["reason"] = il.overrideInfo.reason;
            ov["overridden_by"] = il.overrideInfo.overriddenBy;
            writeTimestamp(ov, "expires_at", il.overrideInfo.expiresAt);
        }
    }

    JsonObject sys = out["system_state"].to<JsonObject>();
    sys["version"] = status.systemState.version;
    sys["vehicle_speed_mph"] = status.systemState.vehicleSpeedMph;
    sys["parking_brake_engaged"] = status.systemState.parkingBrakeEngaged;
    sys["leveling_jacks_down"] = status.systemState.levelingJacksDown;
    sys["engine_running"] = status.systemState.engineRunning;
    sys["transmission_gear"] = gearToString(status.systemState.transmissionGear);
    sys["all_slides_retracted"] = status.systemState.allSlidesRetracted;

    out["audit_log_entries"] = (uint32_t)status.auditLogEntries;

    JsonArray actions = out["active_safety_actions"].to<JsonArray>();
    for (size_t i = 0; i < status.activeSafetyActions.size(); i++) actions.add(status.activeSafetyActions[i]);
}

// Details are stored as JSON text and embedded without re-parsing.
void StatusJson::writeAuditLog(const std::vector<AuditLogEntry>& entries, JsonArray out) {
    for (size_t i = 0; i < entries.size(); i++) {
        JsonObject o = out.add<JsonObject>();
        writeTimestamp(o, "timestamp", entries[i].timestamp);
        o["event_type"] = entries[i].eventType;
        if (entries[i].details.empty()) o["details"].to<JsonObject>();
        else o["details"] = serialized(entries[i].details);
    }
}

// =================================================================================
// SECTION: PIN
// =================================================================================

void StatusJson::writeUserStatus(const PinUserStatus& status, JsonObject out) {
    out["user_id"] = status.userId;

    JsonObject pins = out["pins"].to<JsonObject>();
    for (uint8_t t = 0; t < PIN_TYPE_COUNT; t++) {
        JsonObject p = pins[pinTypeToString((PinType)t)].to<JsonObject>();
        p["configured"] = status.configured[t];
        p["rotation_due"] = status.rotationDue[t];
        writeTimestamp(p, "locked_until", status.lockoutUntil[t]);
    }

    out["is_locked_out"] = status.isLockedOut;
    out["active_sessions"] = status.activeSessions;
    out["recent_attempts"] = status.recentAttempts;
    out["can_use_pins"] = status.canUsePins;
}

void StatusJson::writeSystemStatus(const PinSystemStatus& status, JsonObject out) {
    out["configured_pins"] = status.configuredPins;
    out["active_sessions"] = status.activeSessions;
    out["attempts_last_24h"] = status.attemptsLast24h;
    out["healthy"] = status.healthy;
}

void StatusJson::writeSession(const PinSession& session, int64_t now, JsonObject out) {
    out["id"] = session.id;
    out["user_id"] = session.userId;
    out["pin_type"] = pinTypeToString(session.pinType);
    out["is_active"] = session.isActive;
    out["operation_count"] = session.operationCount;
    if (session.maxOperations == 0) out["max_operations"] = nullptr;
    else out["max_operations"] = session.maxOperations;
    writeTimestamp(out, "created_at", session.createdAt);
    writeTimestamp(out, "expires_at", session.expiresAt);
    writeTimestamp(out, "last_used_at", session.lastUsedAt);

    int64_t remaining = session.isActive ? session.expiresAt - now : 0;
    out["seconds_remaining"] = remaining > 0 ? remaining : 0;
}

void StatusJson::writePinSummaries(const std::vector<PinSummary>& pins, JsonArray out) {
    for (size_t i = 0; i < pins.size(); i++) {
        JsonObject o = out.add<JsonObject>();
        o["pin_type"] = pinTypeToString(pins[i].pinType);
        o["description"] = pins[i].description;
        o["is_active"] = pins[i].isActive;
        o["use_count"] = pins[i].useCount;
        if (pins[i].maxUses == 0) o["max_uses"] = nullptr;
        else o["max_uses"] = pins[i].maxUses;
        writeTimestamp(o, "created_at", pins[i].createdAt);
        writeTimestamp(o, "updated_at", pins[i].updatedAt);
        writeTimestamp(o, "last_used_at", pins[i].lastUsedAt);
    }
}
