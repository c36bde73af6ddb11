/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SystemServices/SecurityAuditLog.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Security event sink and sliding-window rate limiter.
 * - Events are kept in a bounded ring and echoed to the log.
 * - Each (identifier, category) pair gets its own window. Exceeding the limit
 *   blocks the pair for one full window and records SEC_RATE_LIMIT_EXCEEDED.
 * - Windows with no requests left and no active block are swept at most once
 *   per RATE_WINDOW_PRUNE_INTERVAL_S.
 * =================================================================================
 */
#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "SafetyCollaborators.h"
#include "SafetyContext.h"

#define DEFAULT_SECURITY_EVENT_CAPACITY 500
#define RATE_WINDOW_PRUNE_INTERVAL_S 60

struct RateLimitConfig {
  uint32_t requestsPerMinute;
  uint32_t safetyOperationsPerMinute;
  uint32_t emergencyOperationsPerHour;
  uint32_t pinAttemptsPerMinute;
  float adminMultiplier;
  uint32_t eventCapacity;
};

struct SecurityEventRecord {
  int64_t timestamp;
  SecurityEvent event;
};

RateLimitConfig makeDefaultRateLimitConfig();

class SecurityAuditLog : public ISecurityAudit {
public:
    SecurityAuditLog(ISafetyContext& ctx, const RateLimitConfig& config);

    // --- ISecurityAudit ---
    bool logSecurityEvent(const SecurityEvent& event) override;
    bool checkRateLimit(const std::string& identifier,
                        RateLimitCategory category,
                        bool isAdmin,
                        const std::string& sourceIp,
                        bool& allowed) override;

    // --- Queries ---
    void getRecentEvents(size_t maxEntries, std::vector<SecurityEventRecord>& out);
    uint32_t countEvents(SecurityEventType type);
    uint64_t getTotalEvents();
    uint32_t getBlockedRequests();
    size_t getTrackedWindowCount();

    uint32_t getLimit(RateLimitCategory category, bool isAdmin) const;
    static uint32_t getWindowSeconds(RateLimitCategory category);

private:
    struct RateWindow {
        std::deque<int64_t> requests;
        int64_t blockedUntil;
        uint32_t windowSeconds;
        RateWindow() : blockedUntil(0), windowSeconds(60) {}
    };

    ISafetyContext& _ctx;
    RateLimitConfig _config;
    std::mutex _mutex;

    std::deque<SecurityEventRecord> _events;
    uint64_t _totalEvents;
    uint32_t _typeCounts[SEC_SAFETY_OPERATION_AUTHORIZED + 1];

    std::map<std::string, RateWindow> _windows;
    uint32_t _blockedRequests;
    int64_t _lastPrune;

    void pruneWindowsLocked(int64_t now);
    void recordLocked(const SecurityEvent& event);
    void logKeyValue(const char* key, const char* value);
};
