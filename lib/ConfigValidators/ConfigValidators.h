/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/ConfigValidators/ConfigValidators.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON configuration parsing and validation. Missing keys keep the value
 * already in the output struct (callers pass defaults in); present but
 * invalid values fail with a message in errorMsg.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "PinTypes.h"
#include "SafetyTypes.h"
#include "SecurityAuditLog.h"

#define DEFAULT_PIN_STORE_PATH "/var/lib/rvsafety/pins.json"

struct FeatureDefinition {
  std::string name;
  SafetyClassification classification;
  bool enabled;
};

struct AppConfig {
  PinConfig pin;
  SafetyConfig safety;
  RateLimitConfig rateLimits;
  std::vector<FeatureDefinition> features;
  std::string pinStorePath;
};

AppConfig makeDefaultAppConfig();
void makeDefaultFeatures(std::vector<FeatureDefinition>& out);

class ConfigValidators {
public:
    // Parses the whole document: "pin", "safety", "rateLimits", "features", "storage".
    static bool parseAppConfig(JsonVariantConst json, AppConfig& outConfig, std::string& errorMsg);

    static bool parsePinConfig(JsonVariantConst json, PinConfig& outConfig, std::string& errorMsg);
    static bool parseSafetyConfig(JsonVariantConst json, SafetyConfig& outConfig, std::string& errorMsg);
    static bool parseRateLimitConfig(JsonVariantConst json, RateLimitConfig& outConfig, std::string& errorMsg);

    // Replaces outFeatures when an array is present. Names must be unique.
    static bool parseFeatures(JsonVariantConst json, std::vector<FeatureDefinition>& outFeatures, std::string& errorMsg);

    // Telemetry frame to a partial update. Only present keys are flagged.
    static bool parseSystemStateUpdate(JsonVariantConst json, SystemStateUpdate& outUpdate, std::string& errorMsg);

private:
    static bool readUint(JsonVariantConst obj, const char* key, uint32_t minVal, uint32_t maxVal,
                         uint32_t& out, std::string& errorMsg);
    static bool readBool(JsonVariantConst obj, const char* key, bool& out, std::string& errorMsg);
};
