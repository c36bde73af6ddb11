/*
 * =================================================================================
 * File:      lib/SafetyCore/SafetyCollaborators.h
 * Description: Interfaces for the services the safety supervisor depends on.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "SafetyTypes.h"

// Per-feature health, classification and forced state changes.
class IFeatureManager {
public:
    virtual ~IFeatureManager() {}

    virtual bool getFeature(const std::string& name, FeatureInfo& out) = 0;
    virtual void listFeatures(std::vector<FeatureInfo>& out) = 0;

    // Returns false if health could not be determined.
    virtual bool checkSystemHealth(HealthReport& out) = 0;

    virtual bool setFeatureState(const std::string& name, FeatureState state) = 0;
};

// Security event sink and rate limiter. Calls are best effort.
class ISecurityAudit {
public:
    virtual ~ISecurityAudit() {}

    virtual bool logSecurityEvent(const SecurityEvent& event) = 0;

    // Returns false if the limiter is unavailable; 'allowed' is valid only on true.
    virtual bool checkRateLimit(const std::string& identifier,
                                RateLimitCategory category,
                                bool isAdmin,
                                const std::string& sourceIp,
                                bool& allowed) = 0;
};

// Authorizes one operation against a PIN session.
class IOperationAuthorizer {
public:
    virtual ~IOperationAuthorizer() {}

    virtual AuthDecision authorizeOperation(const std::string& sessionId,
                                            const std::string& operation,
                                            const std::string& userId) = 0;
};
