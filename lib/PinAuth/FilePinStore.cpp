/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/FilePinStore.cpp
 * =================================================================================
 */
#include <stdio.h>
#include <fstream>

#include <ArduinoJson.h>

#include "FilePinStore.h"

FilePinStore::FilePinStore(ISafetyContext& ctx, const std::string& path)
    : _ctx(ctx), _path(path)
{
}

void FilePinStore::logKeyValue(const char* key, const char* value) {
    char tempBuf[192];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

// =================================================================================
// SECTION: LOAD
// =================================================================================

bool FilePinStore::load() {
    std::ifstream in(_path.c_str());
    if (!in.is_open()) {
        logKeyValue("Store", "No PIN store snapshot found, starting empty.");
        return true;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, in);
    if (err) {
        char logBuf[160];
        snprintf(logBuf, sizeof(logBuf), "PIN store snapshot unreadable: %s", err.c_str());
        logKeyValue("Store", logBuf);
        return false;
    }

    uint32_t magic = doc["magic"] | 0u;
    if (magic != PIN_STORE_MAGIC || (doc["version"] | 0) != PIN_STORE_VERSION) {
        logKeyValue("Store", "PIN store snapshot has wrong magic/version.");
        return false;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _pins.clear();
    _sessions.clear();
    _attempts.clear();
    _lockoutResets.clear();

    // 1. PIN RECORDS
    for (JsonObject p : doc["pins"].as<JsonArray>()) {
        PinRecord r;
        PinType type;
        if (!pinTypeFromString(p["pinType"] | "", type)) continue;
        r.id = p["id"] | "";
        r.userId = p["userId"] | "";
        r.pinType = type;
        r.pinHash = p["pinHash"] | "";
        r.salt = p["salt"] | "";
        r.description = p["description"] | "";
        r.isActive = p["isActive"] | false;
        r.maxUses = p["maxUses"] | 0u;
        r.useCount = p["useCount"] | 0u;
        r.lockoutAfterFailures = p["lockoutAfterFailures"] | 0u;
        r.lockoutDurationMinutes = p["lockoutDurationMinutes"] | 0u;
        r.createdAt = p["createdAt"] | (int64_t)0;
        r.updatedAt = p["updatedAt"] | (int64_t)0;
        r.lastUsedAt = p["lastUsedAt"] | (int64_t)0;
        _pins.push_back(r);
    }

    // 2. SESSIONS
    for (JsonObject s : doc["sessions"].as<JsonArray>()) {
        PinSession ps;
        PinType type;
        if (!pinTypeFromString(s["pinType"] | "", type)) continue;
        ps.id = s["id"] | "";
        ps.sessionId = s["sessionId"] | "";
        ps.pinRecordId = s["pinRecordId"] | "";
        ps.userId = s["userId"] | "";
        ps.pinType = type;
        ps.ipAddress = s["ipAddress"] | "";
        ps.userAgent = s["userAgent"] | "";
        ps.maxDurationMinutes = s["maxDurationMinutes"] | 0u;
        ps.maxOperations = s["maxOperations"] | 0u;
        ps.operationCount = s["operationCount"] | 0u;
        ps.isActive = s["isActive"] | false;
        ps.createdAt = s["createdAt"] | (int64_t)0;
        ps.expiresAt = s["expiresAt"] | (int64_t)0;
        ps.lastUsedAt = s["lastUsedAt"] | (int64_t)0;
        ps.terminatedAt = s["terminatedAt"] | (int64_t)0;
        _sessions.push_back(ps);
    }

    // 3. ATTEMPTS
    for (JsonObject a : doc["attempts"].as<JsonArray>()) {
        PinAttempt at;
        PinType type;
        AttemptFailure failure;
        if (!pinTypeFromString(a["pinType"] | "", type)) continue;
        if (!attemptFailureFromString(a["failure"] | "", failure)) continue;
        at.id = a["id"] | "";
        at.userId = a["userId"] | "";
        at.pinType = type;
        at.success = a["success"] | false;
        at.failure = failure;
        at.ipAddress = a["ipAddress"] | "";
        at.userAgent = a["userAgent"] | "";
        at.sessionId = a["sessionId"] | "";
        at.attemptedAt = a["attemptedAt"] | (int64_t)0;
        _attempts.push_back(at);
    }

    // 4. LOCKOUT RESETS
    for (JsonObject l : doc["lockoutResets"].as<JsonArray>()) {
        std::string key = l["key"] | "";
        if (!key.empty()) _lockoutResets[key] = l["at"] | (int64_t)0;
    }

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Loaded %u PINs, %u sessions, %u attempts",
             (unsigned)_pins.size(), (unsigned)_sessions.size(), (unsigned)_attempts.size());
    logKeyValue("Store", logBuf);
    return true;
}

// =================================================================================
// SECTION: SAVE (runs under the store lock)
// =================================================================================

bool FilePinStore::commit() {
    JsonDocument doc;
    doc["magic"] = PIN_STORE_MAGIC;
    doc["version"] = PIN_STORE_VERSION;

    JsonArray pins = doc["pins"].to<JsonArray>();
    for (size_t i = 0; i < _pins.size(); i++) {
        const PinRecord& r = _pins[i];
        JsonObject p = pins.add<JsonObject>();
        p["id"] = r.id;
        p["userId"] = r.userId;
        p["pinType"] = pinTypeToString(r.pinType);
        p["pinHash"] = r.pinHash;
        p["salt"] = r.salt;
        p["description"] = r.description;
        p["isActive"] = r.isActive;
        p["maxUses"] = r.maxUses;
        p["useCount"] = r.useCount;
        p["lockoutAfterFailures"] = r.lockoutAfterFailures;
        p["lockoutDurationMinutes"] = r.lockoutDurationMinutes;
        p["createdAt"] = r.createdAt;
        p["updatedAt"] = r.updatedAt;
        p["lastUsedAt"] = r.lastUsedAt;
    }

    JsonArray sessions = doc["sessions"].to<JsonArray>();
    for (size_t i = 0; i < _sessions.size(); i++) {
        const PinSession& ps = _sessions[i];
        JsonObject s = sessions.add<JsonObject>();
        s["id"] = ps.id;
        s["sessionId"] = ps.sessionId;
        s["pinRecordId"] = ps.pinRecordId;
        s["userId"] = ps.userId;
        s["pinType"] = pinTypeToString(ps.pinType);
        s["ipAddress"] = ps.ipAddress;
        s["userAgent"] = ps.userAgent;
        s["maxDurationMinutes"] = ps.maxDurationMinutes;
        s["maxOperations"] = ps.maxOperations;
        s["operationCount"] = ps.operationCount;
        s["isActive"] = ps.isActive;
        s["createdAt"] = ps.createdAt;
        s["expiresAt"] = ps.expiresAt;
        s["lastUsedAt"] = ps.lastUsedAt;
        s["terminatedAt"] = ps.terminatedAt;
    }

    JsonArray attempts = doc["attempts"].to<JsonArray>();
    for (size_t i = 0; i < _attempts.size(); i++) {
        const PinAttempt& at = _attempts[i];
        JsonObject a = attempts.add<JsonObject>();
        a["id"] = at.id;
        a["userId"] = at.userId;
        a["pinType"] = pinTypeToString(at.pinType);
        a["success"] = at.success;
        a["failure"] = attemptFailureToString(at.failure);
        a["ipAddress"] = at.ipAddress;
        a["userAgent"] = at.userAgent;
        a["sessionId"] = at.sessionId;
        a["attemptedAt"] = at.attemptedAt;
    }

    JsonArray resets = doc["lockoutResets"].to<JsonArray>();
    for (std::map<std::string, int64_t>::const_iterator it = _lockoutResets.begin();
         it != _lockoutResets.end(); ++it) {
        JsonObject l = resets.add<JsonObject>();
        l["key"] = it->first;
        l["at"] = it->second;
    }

    // Write to a temp file, then swap it in
    std::string tmpPath = _path + ".tmp";
    bool written = false;
    {
        std::ofstream out(tmpPath.c_str(), std::ios::trunc);
        if (!out.is_open()) {
            logKeyValue("Store", "Cannot open PIN store for writing");
            return false;
        }
        serializeJson(doc, out);
        out.flush();
        written = out.good();
    }
    if (!written) {
        logKeyValue("Store", "PIN store write failed");
        remove(tmpPath.c_str());
        return false;
    }

    if (rename(tmpPath.c_str(), _path.c_str()) != 0) {
        logKeyValue("Store", "PIN store rename failed");
        remove(tmpPath.c_str());
        return false;
    }
    return true;
}
