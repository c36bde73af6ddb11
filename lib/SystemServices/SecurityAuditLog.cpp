/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SystemServices/SecurityAuditLog.cpp
 * =================================================================================
 */
#include <stdio.h>

#include <ArduinoJson.h>

#include "SecurityAuditLog.h"

RateLimitConfig makeDefaultRateLimitConfig() {
    RateLimitConfig c;
    c.requestsPerMinute = 60;
    c.safetyOperationsPerMinute = 5;
    c.emergencyOperationsPerHour = 3;
    c.pinAttemptsPerMinute = 3;
    c.adminMultiplier = 2.0f;
    c.eventCapacity = DEFAULT_SECURITY_EVENT_CAPACITY;
    return c;
}

SecurityAuditLog::SecurityAuditLog(ISafetyContext& ctx, const RateLimitConfig& config)
    : _ctx(ctx), _config(config), _totalEvents(0), _blockedRequests(0), _lastPrune(0)
{
    if (_config.eventCapacity == 0) _config.eventCapacity = 1;
    for (size_t i = 0; i < sizeof(_typeCounts) / sizeof(_typeCounts[0]); i++) _typeCounts[i] = 0;
}

void SecurityAuditLog::logKeyValue(const char* key, const char* value) {
    char tempBuf[256];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

// =================================================================================
// SECTION: EVENTS
// =================================================================================

void SecurityAuditLog::recordLocked(const SecurityEvent& event) {
    SecurityEventRecord rec;
    rec.timestamp = _ctx.getEpochSeconds();
    rec.event = event;

    if (_events.size() >= _config.eventCapacity) _events.pop_front();
    _events.push_back(rec);
    _totalEvents++;
    if (event.type < sizeof(_typeCounts) / sizeof(_typeCounts[0])) _typeCounts[event.type]++;

    char logBuf[224];
    snprintf(logBuf, sizeof(logBuf), "[%s] %s user=%s %s",
             severityToString(event.severity), securityEventToString(event.type),
             event.userId.empty() ? "-" : event.userId.c_str(),
             event.emergencyContext ? "(emergency)" : "");
    logKeyValue("Security", logBuf);
}

bool SecurityAuditLog::logSecurityEvent(const SecurityEvent& event) {
    std::lock_guard<std::mutex> lock(_mutex);
    recordLocked(event);
    return true;
}

void SecurityAuditLog::getRecentEvents(size_t maxEntries, std::vector<SecurityEventRecord>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out.clear();
    size_t n = _events.size() < maxEntries ? _events.size() : maxEntries;
    out.assign(_events.end() - n, _events.end());
}

uint32_t SecurityAuditLog::countEvents(SecurityEventType type) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (type >= sizeof(_typeCounts) / sizeof(_typeCounts[0])) return 0;
    return _typeCounts[type];
}

uint64_t SecurityAuditLog::getTotalEvents() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _totalEvents;
}

uint32_t SecurityAuditLog::getBlockedRequests() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _blockedRequests;
}

size_t SecurityAuditLog::getTrackedWindowCount() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _windows.size();
}

// =================================================================================
// SECTION: RATE LIMITING
// =================================================================================

uint32_t SecurityAuditLog::getLimit(RateLimitCategory category, bool isAdmin) const {
    uint32_t base;
    switch (category) {
    case RATE_SAFETY:    base = _config.safetyOperationsPerMinute; break;
    case RATE_EMERGENCY: base = _config.emergencyOperationsPerHour; break;
    case RATE_PIN_AUTH:  base = _config.pinAttemptsPerMinute; break;
    default:             base = _config.requestsPerMinute; break;
    }
    if (isAdmin) return (uint32_t)(base * _config.adminMultiplier);
    return base;
}

uint32_t SecurityAuditLog::getWindowSeconds(RateLimitCategory category) {
    return category == RATE_EMERGENCY ? 3600 : 60;
}

void SecurityAuditLog::pruneWindowsLocked(int64_t now) {
    if (now - _lastPrune < RATE_WINDOW_PRUNE_INTERVAL_S) return;
    _lastPrune = now;

    std::map<std::string, RateWindow>::iterator it = _windows.begin();
    while (it != _windows.end()) {
        RateWindow& w = it->second;
        int64_t cutoff = now - (int64_t)w.windowSeconds;
        while (!w.requests.empty() && w.requests.front() <= cutoff) w.requests.pop_front();

        if (w.requests.empty() && w.blockedUntil <= now) {
            it = _windows.erase(it);
        } else {
            ++it;
        }
    }
}

bool SecurityAuditLog::checkRateLimit(const std::string& identifier,
                                      RateLimitCategory category,
                                      bool isAdmin,
                                      const std::string& sourceIp,
                                      bool& allowed) {
    std::lock_guard<std::mutex> lock(_mutex);
    int64_t now = _ctx.getEpochSeconds();
    uint32_t limit = getLimit(category, isAdmin);
    uint32_t window = getWindowSeconds(category);

    pruneWindowsLocked(now);

    std::string key = identifier + "|" + rateCategoryToString(category);
    RateWindow& w = _windows[key];
    w.windowSeconds = window;

    // 1. Blocked from an earlier breach
    if (w.blockedUntil > now) {
        _blockedRequests++;
        JsonDocument details;
        details["identifier"] = identifier;
        details["category"] = rateCategoryToString(category);
        details["blocked_until"] = w.blockedUntil;

        SecurityEvent ev;
        ev.type = SEC_RATE_LIMIT_EXCEEDED;
        ev.severity = SEV_MEDIUM;
        ev.userId = identifier;
        ev.sourceIp = sourceIp;
        serializeJson(details, ev.details);
        ev.emergencyContext = false;
        recordLocked(ev);

        allowed = false;
        return true;
    }

    // 2. Slide the window
    int64_t cutoff = now - (int64_t)window;
    while (!w.requests.empty() && w.requests.front() <= cutoff) w.requests.pop_front();

    // 3. Breach: block for one window
    if (w.requests.size() >= limit) {
        w.blockedUntil = now + window;
        _blockedRequests++;

        JsonDocument details;
        details["identifier"] = identifier;
        details["category"] = rateCategoryToString(category);
        details["limit"] = limit;
        details["time_window_seconds"] = window;
        details["request_count"] = (uint32_t)w.requests.size();

        SecurityEvent ev;
        ev.type = SEC_RATE_LIMIT_EXCEEDED;
        ev.severity = SEV_HIGH;
        ev.userId = identifier;
        ev.sourceIp = sourceIp;
        serializeJson(details, ev.details);
        ev.emergencyContext = false;
        recordLocked(ev);

        allowed = false;
        return true;
    }

    w.requests.push_back(now);
    allowed = true;
    return true;
}
