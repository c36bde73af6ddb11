/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/PinTypes.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * PIN records, attempts, sessions, policy configuration and result structs.
 * Counters use 0 for "unlimited". Timestamps are UTC epoch seconds.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

// --- Enums ---
enum PinType : uint8_t { PIN_EMERGENCY, PIN_OVERRIDE, PIN_MAINTENANCE, PIN_TYPE_COUNT };

enum AuthOutcome : uint8_t {
  AUTH_OK,
  AUTH_VALIDATION_ERROR,
  AUTH_FAILED,
  AUTH_LOCKED_OUT,
  AUTH_SESSION_ERROR,
  AUTH_DENIED,
  AUTH_INFRA_ERROR
};

enum AttemptFailure : uint8_t {
  ATTEMPT_OK,
  ATTEMPT_INVALID_PIN,
  ATTEMPT_PIN_NOT_FOUND,
  ATTEMPT_PIN_EXHAUSTED,
  ATTEMPT_LOCKED_OUT,
  ATTEMPT_STORE_UNAVAILABLE
};

// --- Constants ---
#define PIN_SALT_BYTES 16
#define PIN_SESSION_TOKEN_BYTES 32
#define PIN_ID_BYTES 16
#define PIN_ATTEMPT_HISTORY_SECONDS 86400

// --- Configuration Structs ---
struct PinTypePolicy {
  uint32_t sessionMinutes;
  uint32_t maxOperations; // 0 = unlimited
};

struct PinConfig {
  // Format
  uint32_t minPinLength;
  uint32_t maxPinLength;
  bool requireNumericOnly;

  // Lockout defaults (records may carry their own)
  uint32_t maxFailedAttempts;
  uint32_t lockoutDurationMinutes;

  // Sessions
  uint32_t maxConcurrentSessions;
  PinTypePolicy policies[PIN_TYPE_COUNT];
  bool enforceOperationScope;

  // Rotation
  bool enablePinRotation;
  uint32_t pinRotationDays;

  // Hashing
  uint32_t hashIterations;
};

// --- Records ---
struct PinRecord {
  std::string id;
  std::string userId;
  PinType pinType;
  std::string pinHash;
  std::string salt;
  std::string description;
  bool isActive;
  uint32_t maxUses; // 0 = unlimited
  uint32_t useCount;
  uint32_t lockoutAfterFailures;
  uint32_t lockoutDurationMinutes;
  int64_t createdAt;
  int64_t updatedAt;
  int64_t lastUsedAt;
};

struct PinAttempt {
  std::string id;
  std::string userId;
  PinType pinType;
  bool success;
  AttemptFailure failure;
  std::string ipAddress;
  std::string userAgent;
  std::string sessionId;
  int64_t attemptedAt;
};

struct PinSession {
  std::string id;
  std::string sessionId; // bearer token
  std::string pinRecordId;
  std::string userId;
  PinType pinType;
  std::string ipAddress;
  std::string userAgent;
  uint32_t maxDurationMinutes;
  uint32_t maxOperations; // 0 = unlimited
  uint32_t operationCount;
  bool isActive;
  int64_t createdAt;
  int64_t expiresAt;
  int64_t lastUsedAt;
  int64_t terminatedAt;
};

// --- Results ---
struct PinValidationResult {
  AuthOutcome outcome;
  std::string sessionId;
  std::string message;
  int64_t lockoutUntil;
  uint32_t retryAfterSeconds;
};

struct PinUserStatus {
  std::string userId;
  bool configured[PIN_TYPE_COUNT];
  bool rotationDue[PIN_TYPE_COUNT];
  int64_t lockoutUntil[PIN_TYPE_COUNT]; // 0 = not locked
  bool isLockedOut;
  uint32_t activeSessions;
  uint32_t recentAttempts;
  bool canUsePins;
};

struct PinSystemStatus {
  uint32_t configuredPins;
  uint32_t activeSessions;
  uint32_t attemptsLast24h;
  bool healthy;
};

// Record metadata without secrets
struct PinSummary {
  PinType pinType;
  std::string description;
  bool isActive;
  uint32_t useCount;
  uint32_t maxUses;
  int64_t createdAt;
  int64_t updatedAt;
  int64_t lastUsedAt;
};

PinConfig makeDefaultPinConfig();
bool isOperationInScope(PinType type, const std::string& operation);

extern const char *pinTypeToString(PinType t);
extern bool pinTypeFromString(const std::string& text, PinType& out);
extern const char *authOutcomeToString(AuthOutcome o);
extern const char *attemptFailureToString(AttemptFailure f);
extern bool attemptFailureFromString(const std::string& text, AttemptFailure& out);
