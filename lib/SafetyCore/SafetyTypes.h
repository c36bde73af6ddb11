/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/SafetyTypes.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Shared enums, constants and plain structs for the safety supervisor.
 * The telemetry snapshot (SystemState) is a closed, versioned record so that
 * every interlock predicate reads a named field instead of a string key.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

// --- Enums ---
enum OperationalMode : uint8_t { MODE_NORMAL, MODE_MAINTENANCE, MODE_DIAGNOSTIC };

enum InterlockCondition : uint8_t {
  COND_VEHICLE_NOT_MOVING,
  COND_PARKING_BRAKE_ENGAGED,
  COND_LEVELING_JACKS_DEPLOYED,
  COND_ENGINE_NOT_RUNNING,
  COND_TRANSMISSION_IN_PARK,
  COND_SLIDE_ROOMS_RETRACTED,
  COND_UNKNOWN
};

enum TransmissionGear : uint8_t { GEAR_PARK, GEAR_REVERSE, GEAR_NEUTRAL, GEAR_DRIVE, GEAR_LOW, GEAR_UNKNOWN };

enum FeatureState : uint8_t {
  FEATURE_STOPPED,
  FEATURE_INITIALIZING,
  FEATURE_HEALTHY,
  FEATURE_DEGRADED,
  FEATURE_FAILED,
  FEATURE_SAFE_SHUTDOWN,
  FEATURE_MAINTENANCE
};

enum SafetyClassification : uint8_t { CLASS_CRITICAL, CLASS_POSITION_CRITICAL, CLASS_OPERATIONAL, CLASS_MAINTENANCE };

enum SafeStateAction : uint8_t { ACTION_MAINTAIN_POSITION, ACTION_CONTINUE_OPERATION, ACTION_DISABLE, ACTION_SAFE_DEFAULT };

// Tagged result of a PIN session authorization request.
enum AuthDecision : uint8_t { AUTHZ_GRANTED, AUTHZ_DENIED, AUTHZ_INFRA_ERROR };

// Tagged result of every PIN-gated safety operation.
enum SafetyOutcome : uint8_t {
  SAFETY_OK,
  SAFETY_NO_CHANGE,
  SAFETY_INVALID_REQUEST,
  SAFETY_INVALID_STATE,
  SAFETY_NOT_FOUND,
  SAFETY_AUTH_DENIED,
  SAFETY_INFRA_ERROR
};

enum SecurityEventType : uint8_t {
  SEC_SAFETY_INTERLOCK_VIOLATED,
  SEC_INTERLOCK_OVERRIDDEN,
  SEC_EMERGENCY_STOP_TRIGGERED,
  SEC_EMERGENCY_STOP_RESET,
  SEC_SAFE_STATE_CLEARED,
  SEC_MAINTENANCE_MODE_ACTIVATED,
  SEC_MAINTENANCE_MODE_DEACTIVATED,
  SEC_DIAGNOSTIC_MODE_ACTIVATED,
  SEC_DIAGNOSTIC_MODE_DEACTIVATED,
  SEC_UNAUTHORIZED_ACCESS,
  SEC_RATE_LIMIT_EXCEEDED,
  SEC_SAFETY_OPERATION_AUTHORIZED
};

enum SecuritySeverity : uint8_t { SEV_LOW, SEV_MEDIUM, SEV_HIGH, SEV_CRITICAL };

enum RateLimitCategory : uint8_t { RATE_GENERAL, RATE_SAFETY, RATE_EMERGENCY, RATE_PIN_AUTH, RATE_CATEGORY_COUNT };

// --- Constants ---

#define SYSTEM_STATE_VERSION 1
#define VEHICLE_STOPPED_THRESHOLD_MPH 0.5f

#define DEFAULT_AUDIT_LOG_CAPACITY 1000
#define DEFAULT_AUDIT_QUERY_LIMIT 100
#define DEFAULT_LEGACY_RESET_CODE "SAFETY_OVERRIDE_ADMIN"

// PIN-gated operation names
#define OP_EMERGENCY_STOP "emergency_stop"
#define OP_EMERGENCY_RESET "emergency_reset"
#define OP_INTERLOCK_OVERRIDE "interlock_override"
#define OP_MAINTENANCE_ENTER "maintenance_mode"
#define OP_MAINTENANCE_EXIT "maintenance_exit"
#define OP_DIAGNOSTIC_ENTER "diagnostic_mode"
#define OP_DIAGNOSTIC_EXIT "diagnostic_exit"
#define OP_SAFE_STATE_CLEAR "safe_state_clear"

// Default interlocks and the features they guard
#define INTERLOCK_SLIDE_ROOM "slide_room_safety"
#define INTERLOCK_AWNING "awning_safety"
#define INTERLOCK_LEVELING_JACK "leveling_jack_safety"
#define FEATURE_FIREFLY "firefly"
#define FEATURE_SPARTAN_K2 "spartan_k2"

// --- Telemetry ---
struct SystemState {
  uint16_t version;
  float vehicleSpeedMph;
  bool parkingBrakeEngaged;
  bool levelingJacksDown;
  bool engineRunning;
  TransmissionGear transmissionGear;
  bool allSlidesRetracted;
};

// Field mask for partial telemetry updates
enum SystemStateField : uint8_t {
  FIELD_VEHICLE_SPEED = 1 << 0,
  FIELD_PARKING_BRAKE = 1 << 1,
  FIELD_LEVELING_JACKS = 1 << 2,
  FIELD_ENGINE_RUNNING = 1 << 3,
  FIELD_TRANSMISSION = 1 << 4,
  FIELD_SLIDES_RETRACTED = 1 << 5,
  FIELD_ALL = 0x3F
};

struct SystemStateUpdate {
  uint8_t fields;
  SystemState values;
};

// --- Configuration ---
struct SafetyConfig {
  uint32_t healthCheckIntervalMs;
  uint32_t watchdogTimeoutMs;
  uint32_t watchdogPollMs;
  uint32_t auditLogCapacity;
  uint32_t multipleViolationThreshold;
  uint32_t maxModeMinutes;
  uint32_t maxOverrideMinutes;
  bool allowLegacyResetCode;
  std::string legacyResetCode;
};

// --- Collaborator Records ---
struct FeatureInfo {
  std::string name;
  bool enabled;
  FeatureState state;
  SafetyClassification classification;
};

struct HealthReport {
  bool healthy;
  std::vector<std::string> failedCritical;
  std::vector<std::string> failedOther;
};

struct SecurityEvent {
  SecurityEventType type;
  SecuritySeverity severity;
  std::string userId;
  std::string sourceIp;
  std::string details; // JSON object text
  bool emergencyContext;
};

// --- Safety State Records ---
struct ModeSession {
  std::string pinSessionId;
  std::string enteredBy;
  std::string reason;
  int64_t enteredAt;
  int64_t expiresAt;
};

struct InterlockOverride {
  std::string sessionId;
  std::string reason;
  std::string overriddenBy;
  int64_t expiresAt;
};

struct AuditLogEntry {
  int64_t timestamp;
  std::string eventType;
  std::string details; // JSON object text
};

struct InterlockStatus {
  std::string name;
  std::string featureName;
  std::vector<std::string> conditions;
  bool engaged;
  int64_t engagementTime;
  std::string engagementReason;
  bool overridden;
  InterlockOverride overrideInfo;
};

struct ActiveOverride {
  std::string interlockName;
  int64_t expiresAt;
};

struct SafetyStatus {
  bool inSafeState;
  std::string safeStateReason;
  bool emergencyStopActive;
  std::string emergencyStopReason;
  std::string emergencyStopTriggeredBy;
  int64_t emergencyStopTime;
  OperationalMode mode;
  bool hasModeSession;
  ModeSession modeSession;
  std::vector<ActiveOverride> activeOverrides;
  uint32_t watchdogTimeoutMs;
  unsigned long msSinceLastKick;
  std::vector<InterlockStatus> interlocks;
  SystemState systemState;
  size_t auditLogEntries;
  std::vector<std::string> activeSafetyActions;
};

SystemState makeSafeDefaultState();
SafetyConfig makeDefaultSafetyConfig();

extern const char *modeToString(OperationalMode m);
extern const char *gearToString(TransmissionGear g);
extern const char *featureStateToString(FeatureState s);
extern const char *classificationToString(SafetyClassification c);
extern const char *safeStateActionToString(SafeStateAction a);
extern const char *authDecisionToString(AuthDecision d);
extern const char *safetyOutcomeToString(SafetyOutcome o);
extern const char *securityEventToString(SecurityEventType t);
extern const char *severityToString(SecuritySeverity s);
extern const char *rateCategoryToString(RateLimitCategory c);

bool gearFromString(const std::string &text, TransmissionGear &out);
bool classificationFromString(const std::string &text, SafetyClassification &out);
