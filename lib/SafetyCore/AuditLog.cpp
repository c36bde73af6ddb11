/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/AuditLog.cpp
 * =================================================================================
 */
#include "AuditLog.h"

AuditLog::AuditLog(size_t capacity)
    : _entries(capacity > 0 ? capacity : 1),
      _index(0),
      _full(false),
      _totalRecorded(0)
{
}

void AuditLog::append(int64_t timestamp, const char* eventType, const std::string& details) {
    AuditLogEntry& slot = _entries[_index];
    slot.timestamp = timestamp;
    slot.eventType = eventType;
    slot.details = details;

    _index++;
    if (_index >= _entries.size()) {
        _index = 0;
        _full = true;
    }
    _totalRecorded++;
}

void AuditLog::getRecent(size_t maxEntries, std::vector<AuditLogEntry>& out) const {
    out.clear();
    size_t count = size();
    if (maxEntries < count) count = maxEntries;
    if (count == 0) return;

    // Start 'count' entries behind the write index, wrapping around
    size_t cap = _entries.size();
    size_t start = (_index + cap - count) % cap;
    out.reserve(count);
    for (size_t i = 0; i < count; i++) {
        out.push_back(_entries[(start + i) % cap]);
    }
}
