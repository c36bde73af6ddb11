/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/SafetyInterlock.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * One named guard over one feature. Holds an ordered list of conditions, the
 * engaged flag with its metadata, and an optional time-boxed override.
 *
 * States: Disengaged, Engaged, Overridden(expiresAt).
 * - override() never disengages by itself. The owning service disengages on
 *   its next checkConditions() cycle.
 * - An expired override is cleared before evaluation and never honored.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "SafetyTypes.h"
#include "SafetyContext.h"

struct InterlockCheck {
    bool satisfied;
    bool overrideExpired; // true if this check cleared a stale override
    std::string reason;
};

class SafetyInterlock {
public:
    SafetyInterlock(ISafetyContext& ctx,
                    const std::string& name,
                    const std::string& featureName,
                    const std::vector<std::string>& conditions,
                    SafeStateAction action = ACTION_MAINTAIN_POSITION);

    InterlockCheck checkConditions(const SystemState& state);

    // Both return true only if the state actually changed.
    bool engage(const char* reason);
    bool disengage(const char* reason);

    void override(const InterlockOverride& info);
    bool clearOverride();

    // --- Accessors ---
    const std::string& getName() const { return _name; }
    const std::string& getFeatureName() const { return _featureName; }
    const std::vector<std::string>& getConditionNames() const { return _conditionNames; }
    SafeStateAction getSafeStateAction() const { return _action; }
    bool isEngaged() const { return _engaged; }
    int64_t getEngagementTime() const { return _engagementTime; }
    const std::string& getEngagementReason() const { return _engagementReason; }
    bool isOverridden() const { return _overridden; }
    const InterlockOverride& getOverride() const { return _override; }

    InterlockStatus getStatus() const;

private:
    ISafetyContext& _ctx;

    std::string _name;
    std::string _featureName;
    std::vector<std::string> _conditionNames;
    std::vector<InterlockCondition> _conditions; // resolved once at construction
    SafeStateAction _action;

    bool _engaged;
    int64_t _engagementTime;
    std::string _engagementReason;

    bool _overridden;
    InterlockOverride _override;

    void logKeyValue(const char* key, const char* value);
};
