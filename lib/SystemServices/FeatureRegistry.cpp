/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SystemServices/FeatureRegistry.cpp
 * =================================================================================
 */
#include <stdio.h>

#include "FeatureRegistry.h"

FeatureRegistry::FeatureRegistry(ISafetyContext& ctx) : _ctx(ctx) {}

void FeatureRegistry::logKeyValue(const char* key, const char* value) {
    char tempBuf[192];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

FeatureInfo* FeatureRegistry::find(const std::string& name) {
    for (size_t i = 0; i < _features.size(); i++) {
        if (_features[i].name == name) return &_features[i];
    }
    return nullptr;
}

void FeatureRegistry::registerFeature(const std::string& name, SafetyClassification classification, bool enabled) {
    std::lock_guard<std::mutex> lock(_mutex);
    FeatureInfo* existing = find(name);
    if (existing) {
        existing->classification = classification;
        existing->enabled = enabled;
        return;
    }
    FeatureInfo info;
    info.name = name;
    info.enabled = enabled;
    info.state = FEATURE_STOPPED;
    info.classification = classification;
    _features.push_back(info);
}

bool FeatureRegistry::setEnabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lock(_mutex);
    FeatureInfo* f = find(name);
    if (!f) return false;
    f->enabled = enabled;
    return true;
}

size_t FeatureRegistry::size() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _features.size();
}

bool FeatureRegistry::getFeature(const std::string& name, FeatureInfo& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    FeatureInfo* f = find(name);
    if (!f) return false;
    out = *f;
    return true;
}

void FeatureRegistry::listFeatures(std::vector<FeatureInfo>& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out = _features;
}

// Only enabled features in FEATURE_FAILED count. Critical means CLASS_CRITICAL;
// every other classification is reported in failedOther.
bool FeatureRegistry::checkSystemHealth(HealthReport& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    out.failedCritical.clear();
    out.failedOther.clear();

    for (size_t i = 0; i < _features.size(); i++) {
        const FeatureInfo& f = _features[i];
        if (!f.enabled || f.state != FEATURE_FAILED) continue;
        if (f.classification == CLASS_CRITICAL) out.failedCritical.push_back(f.name);
        else out.failedOther.push_back(f.name);
    }
    out.healthy = out.failedCritical.empty() && out.failedOther.empty();
    return true;
}

bool FeatureRegistry::setFeatureState(const std::string& name, FeatureState state) {
    std::lock_guard<std::mutex> lock(_mutex);
    FeatureInfo* f = find(name);
    if (!f) return false;
    if (f->state == state) return true;

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "%s: %s -> %s", name.c_str(),
             featureStateToString(f->state), featureStateToString(state));
    logKeyValue("Feature", logBuf);
    f->state = state;
    return true;
}
