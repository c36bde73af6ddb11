/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SystemServices/FeatureRegistry.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Registry of controllable RV features with their safety classification and
 * runtime state. Serves as the feature manager for the safety supervisor.
 * Device drivers report state changes through setFeatureState().
 * =================================================================================
 */
#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "SafetyCollaborators.h"
#include "SafetyContext.h"

class FeatureRegistry : public IFeatureManager {
public:
    explicit FeatureRegistry(ISafetyContext& ctx);

    // Adds or replaces a feature. New features start in FEATURE_STOPPED.
    void registerFeature(const std::string& name, SafetyClassification classification, bool enabled);
    bool setEnabled(const std::string& name, bool enabled);
    size_t size();

    // --- IFeatureManager ---
    bool getFeature(const std::string& name, FeatureInfo& out) override;
    void listFeatures(std::vector<FeatureInfo>& out) override;
    bool checkSystemHealth(HealthReport& out) override;
    bool setFeatureState(const std::string& name, FeatureState state) override;

private:
    ISafetyContext& _ctx;
    std::mutex _mutex;
    std::vector<FeatureInfo> _features;

    FeatureInfo* find(const std::string& name);
    void logKeyValue(const char* key, const char* value);
};
