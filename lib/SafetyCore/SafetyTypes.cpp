/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/SafetyTypes.cpp
 * =================================================================================
 */
#include "SafetyTypes.h"

SystemState makeSafeDefaultState() {
  // Parked and stabilized coach
  SystemState s;
  s.version = SYSTEM_STATE_VERSION;
  s.vehicleSpeedMph = 0.0f;
  s.parkingBrakeEngaged = true;
  s.levelingJacksDown = true;
  s.engineRunning = false;
  s.transmissionGear = GEAR_PARK;
  s.allSlidesRetracted = true;
  return s;
}

SafetyConfig makeDefaultSafetyConfig() {
  SafetyConfig c;
  c.healthCheckIntervalMs = 5000;
  c.watchdogTimeoutMs = 15000;
  c.watchdogPollMs = 1000;
  c.auditLogCapacity = DEFAULT_AUDIT_LOG_CAPACITY;
  c.multipleViolationThreshold = 3;
  c.maxModeMinutes = 480;
  c.maxOverrideMinutes = 240;
  c.allowLegacyResetCode = true;
  c.legacyResetCode = DEFAULT_LEGACY_RESET_CODE;
  return c;
}

const char *modeToString(OperationalMode m) {
  switch (m) {
  case MODE_MAINTENANCE:
    return "maintenance";
  case MODE_DIAGNOSTIC:
    return "diagnostic";
  default:
    return "normal";
  }
}

const char *gearToString(TransmissionGear g) {
  switch (g) {
  case GEAR_PARK:
    return "PARK";
  case GEAR_REVERSE:
    return "REVERSE";
  case GEAR_NEUTRAL:
    return "NEUTRAL";
  case GEAR_DRIVE:
    return "DRIVE";
  case GEAR_LOW:
    return "LOW";
  default:
    return "UNKNOWN";
  }
}

bool gearFromString(const std::string &text, TransmissionGear &out) {
  if (text == "PARK" || text == "P") out = GEAR_PARK;
  else if (text == "REVERSE" || text == "R") out = GEAR_REVERSE;
  else if (text == "NEUTRAL" || text == "N") out = GEAR_NEUTRAL;
  else if (text == "DRIVE" || text == "D") out = GEAR_DRIVE;
  else if (text == "LOW" || text == "L") out = GEAR_LOW;
  else return false;
  return true;
}

const char *featureStateToString(FeatureState s) {
  switch (s) {
  case FEATURE_STOPPED:
    return "stopped";
  case FEATURE_INITIALIZING:
    return "initializing";
  case FEATURE_HEALTHY:
    return "healthy";
  case FEATURE_DEGRADED:
    return "degraded";
  case FEATURE_FAILED:
    return "failed";
  case FEATURE_SAFE_SHUTDOWN:
    return "safe_shutdown";
  case FEATURE_MAINTENANCE:
    return "maintenance";
  default:
    return "unknown";
  }
}

const char *classificationToString(SafetyClassification c) {
  switch (c) {
  case CLASS_CRITICAL:
    return "critical";
  case CLASS_POSITION_CRITICAL:
    return "position_critical";
  case CLASS_MAINTENANCE:
    return "maintenance";
  default:
    return "operational";
  }
}

bool classificationFromString(const std::string &text, SafetyClassification &out) {
  if (text == "critical") out = CLASS_CRITICAL;
  else if (text == "position_critical") out = CLASS_POSITION_CRITICAL;
  else if (text == "operational") out = CLASS_OPERATIONAL;
  else if (text == "maintenance") out = CLASS_MAINTENANCE;
  else return false;
  return true;
}

const char *safeStateActionToString(SafeStateAction a) {
  switch (a) {
  case ACTION_CONTINUE_OPERATION:
    return "continue_operation";
  case ACTION_DISABLE:
    return "disable";
  case ACTION_SAFE_DEFAULT:
    return "safe_default";
  default:
    return "maintain_position";
  }
}

const char *authDecisionToString(AuthDecision d) {
  switch (d) {
  case AUTHZ_GRANTED:
    return "GRANTED";
  case AUTHZ_INFRA_ERROR:
    return "INFRA_ERROR";
  default:
    return "DENIED";
  }
}

const char *safetyOutcomeToString(SafetyOutcome o) {
  switch (o) {
  case SAFETY_OK:
    return "OK";
  case SAFETY_NO_CHANGE:
    return "NO_CHANGE";
  case SAFETY_INVALID_REQUEST:
    return "INVALID_REQUEST";
  case SAFETY_INVALID_STATE:
    return "INVALID_STATE";
  case SAFETY_NOT_FOUND:
    return "NOT_FOUND";
  case SAFETY_AUTH_DENIED:
    return "AUTH_DENIED";
  default:
    return "INFRA_ERROR";
  }
}

const char *securityEventToString(SecurityEventType t) {
  switch (t) {
  case SEC_SAFETY_INTERLOCK_VIOLATED:
    return "safety_interlock_violated";
  case SEC_INTERLOCK_OVERRIDDEN:
    return "interlock_overridden";
  case SEC_EMERGENCY_STOP_TRIGGERED:
    return "emergency_stop_triggered";
  case SEC_EMERGENCY_STOP_RESET:
    return "emergency_stop_reset";
  case SEC_SAFE_STATE_CLEARED:
    return "safe_state_cleared";
  case SEC_MAINTENANCE_MODE_ACTIVATED:
    return "maintenance_mode_activated";
  case SEC_MAINTENANCE_MODE_DEACTIVATED:
    return "maintenance_mode_deactivated";
  case SEC_DIAGNOSTIC_MODE_ACTIVATED:
    return "diagnostic_mode_activated";
  case SEC_DIAGNOSTIC_MODE_DEACTIVATED:
    return "diagnostic_mode_deactivated";
  case SEC_UNAUTHORIZED_ACCESS:
    return "unauthorized_access";
  case SEC_RATE_LIMIT_EXCEEDED:
    return "rate_limit_exceeded";
  default:
    return "safety_operation_authorized";
  }
}

const char *severityToString(SecuritySeverity s) {
  switch (s) {
  case SEV_LOW:
    return "low";
  case SEV_MEDIUM:
    return "medium";
  case SEV_HIGH:
    return "high";
  default:
    return "critical";
  }
}

const char *rateCategoryToString(RateLimitCategory c) {
  switch (c) {
  case RATE_SAFETY:
    return "safety";
  case RATE_EMERGENCY:
    return "emergency";
  case RATE_PIN_AUTH:
    return "pin_auth";
  default:
    return "general";
  }
}
