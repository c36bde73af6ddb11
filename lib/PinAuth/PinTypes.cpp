/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/PinTypes.cpp
 * =================================================================================
 */
#include "PinTypes.h"
#include "SafetyTypes.h"

PinConfig makeDefaultPinConfig() {
  PinConfig c;
  c.minPinLength = 4;
  c.maxPinLength = 8;
  c.requireNumericOnly = true;

  c.maxFailedAttempts = 3;
  c.lockoutDurationMinutes = 15;

  c.maxConcurrentSessions = 2;
  c.policies[PIN_EMERGENCY].sessionMinutes = 5;
  c.policies[PIN_EMERGENCY].maxOperations = 1;
  c.policies[PIN_OVERRIDE].sessionMinutes = 30;
  c.policies[PIN_OVERRIDE].maxOperations = 3;
  c.policies[PIN_MAINTENANCE].sessionMinutes = 120;
  c.policies[PIN_MAINTENANCE].maxOperations = 0;
  c.enforceOperationScope = true;

  c.enablePinRotation = true;
  c.pinRotationDays = 30;

  c.hashIterations = 10000;
  return c;
}

// Operations each PIN type may authorize
static const char *const EMERGENCY_SCOPE[] = { OP_EMERGENCY_STOP, OP_EMERGENCY_RESET };
static const char *const OVERRIDE_SCOPE[] = { OP_INTERLOCK_OVERRIDE, OP_EMERGENCY_RESET };
static const char *const MAINTENANCE_SCOPE[] = {
  OP_EMERGENCY_STOP,    OP_EMERGENCY_RESET, OP_INTERLOCK_OVERRIDE, OP_MAINTENANCE_ENTER,
  OP_MAINTENANCE_EXIT,  OP_DIAGNOSTIC_ENTER, OP_DIAGNOSTIC_EXIT,   OP_SAFE_STATE_CLEAR
};

template <size_t N>
static bool inList(const char *const (&list)[N], const std::string &operation) {
  for (size_t i = 0; i < N; i++) {
    if (operation == list[i]) return true;
  }
  return false;
}

bool isOperationInScope(PinType type, const std::string &operation) {
  switch (type) {
  case PIN_EMERGENCY:
    return inList(EMERGENCY_SCOPE, operation);
  case PIN_OVERRIDE:
    return inList(OVERRIDE_SCOPE, operation);
  case PIN_MAINTENANCE:
    return inList(MAINTENANCE_SCOPE, operation);
  default:
    return false;
  }
}

const char *pinTypeToString(PinType t) {
  switch (t) {
  case PIN_EMERGENCY:
    return "emergency";
  case PIN_OVERRIDE:
    return "override";
  case PIN_MAINTENANCE:
    return "maintenance";
  default:
    return "unknown";
  }
}

bool pinTypeFromString(const std::string &text, PinType &out) {
  if (text == "emergency") out = PIN_EMERGENCY;
  else if (text == "override") out = PIN_OVERRIDE;
  else if (text == "maintenance") out = PIN_MAINTENANCE;
  else return false;
  return true;
}

const char *authOutcomeToString(AuthOutcome o) {
  switch (o) {
  case AUTH_OK:
    return "OK";
  case AUTH_VALIDATION_ERROR:
    return "VALIDATION_ERROR";
  case AUTH_FAILED:
    return "AUTHENTICATION_FAILED";
  case AUTH_LOCKED_OUT:
    return "LOCKED_OUT";
  case AUTH_SESSION_ERROR:
    return "SESSION_ERROR";
  case AUTH_DENIED:
    return "AUTHORIZATION_DENIED";
  default:
    return "INFRASTRUCTURE_ERROR";
  }
}

const char *attemptFailureToString(AttemptFailure f) {
  switch (f) {
  case ATTEMPT_OK:
    return "";
  case ATTEMPT_INVALID_PIN:
    return "invalid_pin";
  case ATTEMPT_PIN_NOT_FOUND:
    return "pin_not_found";
  case ATTEMPT_PIN_EXHAUSTED:
    return "pin_exhausted";
  case ATTEMPT_LOCKED_OUT:
    return "locked_out";
  default:
    return "store_unavailable";
  }
}

bool attemptFailureFromString(const std::string &text, AttemptFailure &out) {
  if (text.empty()) out = ATTEMPT_OK;
  else if (text == "invalid_pin") out = ATTEMPT_INVALID_PIN;
  else if (text == "pin_not_found") out = ATTEMPT_PIN_NOT_FOUND;
  else if (text == "pin_exhausted") out = ATTEMPT_PIN_EXHAUSTED;
  else if (text == "locked_out") out = ATTEMPT_LOCKED_OUT;
  else if (text == "store_unavailable") out = ATTEMPT_STORE_UNAVAILABLE;
  else return false;
  return true;
}
