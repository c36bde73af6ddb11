/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/AuditLog.h
 *
 * Description:
 * Bounded ring buffer of safety audit entries. The oldest entry is evicted
 * once capacity is reached.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "SafetyTypes.h"

class AuditLog {
public:
    explicit AuditLog(size_t capacity = DEFAULT_AUDIT_LOG_CAPACITY);

    void append(int64_t timestamp, const char* eventType, const std::string& details);

    // Copies up to maxEntries of the newest entries, oldest first.
    void getRecent(size_t maxEntries, std::vector<AuditLogEntry>& out) const;

    size_t size() const { return _full ? _entries.size() : _index; }
    size_t capacity() const { return _entries.size(); }
    uint64_t totalRecorded() const { return _totalRecorded; }

private:
    std::vector<AuditLogEntry> _entries;
    size_t _index;
    bool _full;
    uint64_t _totalRecorded;
};
