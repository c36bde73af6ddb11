/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/SafetyInterlock.cpp
 * =================================================================================
 */
#include <stdio.h>

#include "SafetyInterlock.h"
#include "InterlockConditions.h"
#include "TimeUtils.h"

SafetyInterlock::SafetyInterlock(ISafetyContext& ctx,
                                 const std::string& name,
                                 const std::string& featureName,
                                 const std::vector<std::string>& conditions,
                                 SafeStateAction action)
    : _ctx(ctx),
      _name(name),
      _featureName(featureName),
      _conditionNames(conditions),
      _action(action),
      _engaged(false),
      _engagementTime(0),
      _overridden(false)
{
    _override.expiresAt = 0;
    for (size_t i = 0; i < _conditionNames.size(); i++) {
        InterlockCondition c = InterlockConditions::fromName(_conditionNames[i]);
        if (c == COND_UNKNOWN) {
            char logBuf[128];
            snprintf(logBuf, sizeof(logBuf), "%s: unknown condition '%s' (fails closed)",
                     _name.c_str(), _conditionNames[i].c_str());
            logKeyValue("Interlk", logBuf);
        }
        _conditions.push_back(c);
    }
}

void SafetyInterlock::logKeyValue(const char* key, const char* value) {
    char tempBuf[192];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

// =================================================================================
// SECTION: EVALUATION
// =================================================================================

InterlockCheck SafetyInterlock::checkConditions(const SystemState& state) {
    InterlockCheck result;
    result.satisfied = true;
    result.overrideExpired = false;

    // 1. Override handling
    if (_overridden) {
        if (_ctx.getEpochSeconds() < _override.expiresAt) {
            result.reason = "Override active";
            return result;
        }
        clearOverride();
        result.overrideExpired = true;
    }

    // 2. AND all conditions in order, first failure wins
    for (size_t i = 0; i < _conditions.size(); i++) {
        if (!InterlockConditions::evaluate(_conditions[i], state)) {
            result.satisfied = false;
            result.reason = "Condition not met: " + _conditionNames[i];
            return result;
        }
    }

    result.reason = "All conditions met";
    return result;
}

// =================================================================================
// SECTION: ENGAGEMENT
// =================================================================================

bool SafetyInterlock::engage(const char* reason) {
    if (_engaged) return false;

    _engaged = true;
    _engagementTime = _ctx.getEpochSeconds();
    _engagementReason = reason;

    char logBuf[192];
    snprintf(logBuf, sizeof(logBuf), "ENGAGED %s (%s): %s", _name.c_str(), _featureName.c_str(), reason);
    logKeyValue("Interlk", logBuf);
    return true;
}

bool SafetyInterlock::disengage(const char* reason) {
    if (!_engaged) return false;

    int64_t heldFor = _ctx.getEpochSeconds() - _engagementTime;
    char durationStr[48];
    TimeUtils::formatSeconds(heldFor > 0 ? (unsigned long)heldFor : 0, durationStr, sizeof(durationStr));

    _engaged = false;
    _engagementTime = 0;
    _engagementReason.clear();

    char logBuf[192];
    snprintf(logBuf, sizeof(logBuf), "DISENGAGED %s after %s: %s", _name.c_str(), durationStr, reason);
    logKeyValue("Interlk", logBuf);
    return true;
}

// =================================================================================
// SECTION: OVERRIDE
// =================================================================================

void SafetyInterlock::override(const InterlockOverride& info) {
    _overridden = true;
    _override = info;

    char logBuf[192];
    snprintf(logBuf, sizeof(logBuf), "OVERRIDE %s by %s: %s", _name.c_str(),
             info.overriddenBy.c_str(), info.reason.c_str());
    logKeyValue("Interlk", logBuf);
}

bool SafetyInterlock::clearOverride() {
    if (!_overridden) return false;

    _overridden = false;
    _override = InterlockOverride();
    _override.expiresAt = 0;

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Override cleared on %s", _name.c_str());
    logKeyValue("Interlk", logBuf);
    return true;
}

InterlockStatus SafetyInterlock::getStatus() const {
    InterlockStatus s;
    s.name = _name;
    s.featureName = _featureName;
    s.conditions = _conditionNames;
    s.engaged = _engaged;
    s.engagementTime = _engagementTime;
    s.engagementReason = _engagementReason;
    s.overridden = _overridden;
    s.overrideInfo = _override;
    return s;
}
