/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/ConfigValidators/StatusJson.h
 *
 * Description:
 * Serializes status snapshots to JSON for the external API layer.
 * Timestamps are written as ISO-8601 UTC strings. Session tokens and PIN
 * hashes are never written.
 * =================================================================================
 */
#pragma once
#include <vector>

#include <ArduinoJson.h>

#include "PinTypes.h"
#include "SafetyTypes.h"

class StatusJson {
public:
    static void writeSafetyStatus(const SafetyStatus& status, JsonObject out);
    static void writeAuditLog(const std::vector<AuditLogEntry>& entries, JsonArray out);

    static void writeUserStatus(const PinUserStatus& status, JsonObject out);
    static void writeSystemStatus(const PinSystemStatus& status, JsonObject out);
    static void writeSession(const PinSession& session, int64_t now, JsonObject out);
    static void writePinSummaries(const std::vector<PinSummary>& pins, JsonArray out);

private:
    static void writeTimestamp(JsonObject out, const char* key, int64_t epochSeconds);
};
