/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/InterlockConditions.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Fixed condition vocabulary for safety interlocks. Each condition is an enum
 * value mapped to a predicate over SystemState through a static table.
 * Names that do not resolve map to COND_UNKNOWN, which always evaluates false.
 * =================================================================================
 */
#pragma once
#include <string>
#include "SafetyTypes.h"

typedef bool (*ConditionPredicate)(const SystemState& state);

struct ConditionDescriptor {
    InterlockCondition id;
    const char* name;
    ConditionPredicate predicate;
};

class InterlockConditions {
public:
    static InterlockCondition fromName(const std::string& name);
    static const char* toName(InterlockCondition condition);

    // Evaluates a single condition. COND_UNKNOWN fails closed.
    static bool evaluate(InterlockCondition condition, const SystemState& state);

    static const ConditionDescriptor* table(size_t& count);
};
