/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration loading, defaults and saving.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Logger.h"

#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>
#include <fstream>

// Helper for logging
void SettingsManager::log(const char *key, const char *val) { logKeyValue(key, val); }

// =================================================================================
// SECTION: FILESYSTEM
// =================================================================================

bool SettingsManager::ensureParentDirectory(const std::string &path) {
  size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return true;

  // Create each missing component
  std::string dir = path.substr(0, slash);
  for (size_t pos = 1; pos <= dir.size(); pos++) {
    if (pos != dir.size() && dir[pos] != '/') continue;
    std::string part = dir.substr(0, pos);
    if (mkdir(part.c_str(), 0750) != 0 && errno != EEXIST) {
      std::string msg = "Cannot create directory " + part;
      log("Settings", msg.c_str());
      return false;
    }
  }
  return true;
}

// =================================================================================
// SECTION: CONFIGURATION FILE
// =================================================================================

bool SettingsManager::loadConfig(const std::string &path, AppConfig &config, std::string &errorMsg) {
  config = makeDefaultAppConfig();

  std::ifstream in(path.c_str());
  if (!in.is_open()) {
    std::string msg = "No config at " + path + ", writing defaults.";
    log("Settings", msg.c_str());
    if (!writeDefaultConfig(path, config)) log("Settings", "Default config not written, continuing with defaults.");
    return true;
  }

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, in);
  if (err) {
    errorMsg = std::string("Config parse error: ") + err.c_str();
    return false;
  }

  if (!ConfigValidators::parseAppConfig(doc.as<JsonVariantConst>(), config, errorMsg)) return false;

  std::string msg = "Loaded " + path;
  log("Settings", msg.c_str());
  return true;
}

bool SettingsManager::writeDefaultConfig(const std::string &path, const AppConfig &config) {
  if (!ensureParentDirectory(path)) return false;

  JsonDocument doc;
  serializeConfig(config, doc.to<JsonObject>());

  std::ofstream out(path.c_str(), std::ios::trunc);
  if (!out.is_open()) {
    log("Settings", "Cannot open config file for writing.");
    return false;
  }
  serializeJsonPretty(doc, out);
  out << "\n";
  return out.good();
}

void SettingsManager::serializeConfig(const AppConfig &config, JsonObject out) {
  // 1. PIN
  JsonObject pin = out["pin"].to<JsonObject>();
  pin["minPinLength"] = config.pin.minPinLength;
  pin["maxPinLength"] = config.pin.maxPinLength;
  pin["requireNumericOnly"] = config.pin.requireNumericOnly;
  pin["maxFailedAttempts"] = config.pin.maxFailedAttempts;
  pin["lockoutDurationMinutes"] = config.pin.lockoutDurationMinutes;
  pin["maxConcurrentSessions"] = config.pin.maxConcurrentSessions;
  pin["enforceOperationScope"] = config.pin.enforceOperationScope;
  JsonObject policies = pin["policies"].to<JsonObject>();
  for (uint8_t t = 0; t < PIN_TYPE_COUNT; t++) {
    JsonObject p = policies[pinTypeToString((PinType)t)].to<JsonObject>();
    p["sessionMinutes"] = config.pin.policies[t].sessionMinutes;
    p["maxOperations"] = config.pin.policies[t].maxOperations;
  }
  pin["enablePinRotation"] = config.pin.enablePinRotation;
  pin["pinRotationDays"] = config.pin.pinRotationDays;
  pin["hashIterations"] = config.pin.hashIterations;

  // 2. Safety
  JsonObject safety = out["safety"].to<JsonObject>();
  safety["healthCheckIntervalMs"] = config.safety.healthCheckIntervalMs;
  safety["watchdogTimeoutMs"] = config.safety.watchdogTimeoutMs;
  safety["watchdogPollMs"] = config.safety.watchdogPollMs;
  safety["auditLogCapacity"] = config.safety.auditLogCapacity;
  safety["multipleViolationThreshold"] = config.safety.multipleViolationThreshold;
  safety["maxModeMinutes"] = config.safety.maxModeMinutes;
  safety["maxOverrideMinutes"] = config.safety.maxOverrideMinutes;
  safety["allowLegacyResetCode"] = config.safety.allowLegacyResetCode;
  safety["legacyResetCode"] = config.safety.legacyResetCode;

  // 3. Rate limits
  JsonObject rl = out["rateLimits"].to<JsonObject>();
  rl["requestsPerMinute"] = config.rateLimits.requestsPerMinute;
  rl["safetyOperationsPerMinute"] = config.rateLimits.safetyOperationsPerMinute;
  rl["emergencyOperationsPerHour"] = config.rateLimits.emergencyOperationsPerHour;
  rl["pinAttemptsPerMinute"] = config.rateLimits.pinAttemptsPerMinute;
  rl["adminMultiplier"] = config.rateLimits.adminMultiplier;
  rl["eventCapacity"] = config.rateLimits.eventCapacity;

  // 4. Features
  JsonArray features = out["features"].to<JsonArray>();
  for (size_t i = 0; i < config.features.size(); i++) {
    JsonObject f = features.add<JsonObject>();
    f["name"] = config.features[i].name;
    f["classification"] = classificationToString(config.features[i].classification);
    f["enabled"] = config.features[i].enabled;
  }

  // 5. Storage
  out["storage"]["pinStorePath"] = config.pinStorePath;
}

// =================================================================================
// SECTION: APPLICATION
// =================================================================================

void SettingsManager::applyFeatures(const AppConfig &config, FeatureRegistry &registry) {
  for (size_t i = 0; i < config.features.size(); i++) {
    const FeatureDefinition &def = config.features[i];
    registry.registerFeature(def.name, def.classification, def.enabled);
    if (def.enabled) registry.setFeatureState(def.name, FEATURE_HEALTHY);
  }

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "%u features registered", (unsigned)config.features.size());
  log("Settings", logBuf);
}
