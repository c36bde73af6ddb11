/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/ConfigValidators/ConfigValidators.cpp
 * =================================================================================
 */
#include "ConfigValidators.h"

AppConfig makeDefaultAppConfig() {
    AppConfig c;
    c.pin = makeDefaultPinConfig();
    c.safety = makeDefaultSafetyConfig();
    c.rateLimits = makeDefaultRateLimitConfig();
    makeDefaultFeatures(c.features);
    c.pinStorePath = DEFAULT_PIN_STORE_PATH;
    return c;
}

void makeDefaultFeatures(std::vector<FeatureDefinition>& out) {
    static const FeatureDefinition DEFAULTS[] = {
        { "can_interface", CLASS_CRITICAL, true },
        { "rvc", CLASS_CRITICAL, true },
        { "brake_safety_monitoring", CLASS_CRITICAL, true },
        { FEATURE_FIREFLY, CLASS_POSITION_CRITICAL, true },
        { FEATURE_SPARTAN_K2, CLASS_POSITION_CRITICAL, true },
    };
    out.assign(DEFAULTS, DEFAULTS + sizeof(DEFAULTS) / sizeof(DEFAULTS[0]));
}

// =================================================================================
// SECTION: FIELD HELPERS
// =================================================================================

bool ConfigValidators::readUint(JsonVariantConst obj, const char* key, uint32_t minVal, uint32_t maxVal,
                                uint32_t& out, std::string& errorMsg) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<uint32_t>()) {
        errorMsg = std::string(key) + " must be a non-negative integer.";
        return false;
    }
    uint32_t value = v.as<uint32_t>();
    if (value < minVal || value > maxVal) {
        errorMsg = std::string(key) + " out of range (" + std::to_string(minVal) + "-" +
                   std::to_string(maxVal) + ").";
        return false;
    }
    out = value;
    return true;
}

bool ConfigValidators::readBool(JsonVariantConst obj, const char* key, bool& out, std::string& errorMsg) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<bool>()) {
        errorMsg = std::string(key) + " must be true or false.";
        return false;
    }
    out = v.as<bool>();
    return true;
}

// =================================================================================
// SECTION: SECTIONS
// =================================================================================

bool ConfigValidators::parsePinConfig(JsonVariantConst json, PinConfig& outConfig, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "pin must be an object.";
        return false;
    }

    // 1. Format
    if (!readUint(json, "minPinLength", 4, 16, outConfig.minPinLength, errorMsg)) return false;
    if (!readUint(json, "maxPinLength", 4, 16, outConfig.maxPinLength, errorMsg)) return false;
    if (outConfig.minPinLength > outConfig.maxPinLength) {
        errorMsg = "minPinLength cannot be greater than maxPinLength.";
        return false;
    }
    if (!readBool(json, "requireNumericOnly", outConfig.requireNumericOnly, errorMsg)) return false;

    // 2. Lockout
    if (!readUint(json, "maxFailedAttempts", 1, 100, outConfig.maxFailedAttempts, errorMsg)) return false;
    if (!readUint(json, "lockoutDurationMinutes", 1, 1440, outConfig.lockoutDurationMinutes, errorMsg)) return false;

    // 3. Sessions
    if (!readUint(json, "maxConcurrentSessions", 1, 16, outConfig.maxConcurrentSessions, errorMsg)) return false;
    if (!readBool(json, "enforceOperationScope", outConfig.enforceOperationScope, errorMsg)) return false;

    JsonVariantConst policies = json["policies"];
    if (!policies.isNull()) {
        if (!policies.is<JsonObjectConst>()) {
            errorMsg = "policies must be an object keyed by PIN type.";
            return false;
        }
        for (JsonPairConst kv : policies.as<JsonObjectConst>()) {
            PinType type;
            if (!pinTypeFromString(kv.key().c_str(), type)) {
                errorMsg = std::string("Unknown PIN type in policies: ") + kv.key().c_str();
                return false;
            }
            PinTypePolicy& p = outConfig.policies[type];
            if (!readUint(kv.value(), "sessionMinutes", 1, 1440, p.sessionMinutes, errorMsg)) return false;
            if (!readUint(kv.value(), "maxOperations", 0, 1000, p.maxOperations, errorMsg)) return false;
        }
    }

    // 4. Rotation & hashing
    if (!readBool(json, "enablePinRotation", outConfig.enablePinRotation, errorMsg)) return false;
    if (!readUint(json, "pinRotationDays", 1, 3650, outConfig.pinRotationDays, errorMsg)) return false;
    if (!readUint(json, "hashIterations", 1000, 1000000, outConfig.hashIterations, errorMsg)) return false;

    return true;
}

bool ConfigValidators::parseSafetyConfig(JsonVariantConst json, SafetyConfig& outConfig, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "safety must be an object.";
        return false;
    }

    // 1. Loop timing
    if (!readUint(json, "healthCheckIntervalMs", 100, 600000, outConfig.healthCheckIntervalMs, errorMsg)) return false;
    if (!readUint(json, "watchdogTimeoutMs", 200, 3600000, outConfig.watchdogTimeoutMs, errorMsg)) return false;
    if (outConfig.watchdogTimeoutMs <= outConfig.healthCheckIntervalMs) {
        errorMsg = "watchdogTimeoutMs must be greater than healthCheckIntervalMs.";
        return false;
    }
    if (!readUint(json, "watchdogPollMs", 10, 600000, outConfig.watchdogPollMs, errorMsg)) return false;
    if (outConfig.watchdogPollMs >= outConfig.watchdogTimeoutMs) {
        errorMsg = "watchdogPollMs must be less than watchdogTimeoutMs.";
        return false;
    }

    // 2. Limits
    if (!readUint(json, "auditLogCapacity", 10, 100000, outConfig.auditLogCapacity, errorMsg)) return false;
    if (!readUint(json, "multipleViolationThreshold", 1, 32, outConfig.multipleViolationThreshold, errorMsg)) return false;
    if (!readUint(json, "maxModeMinutes", 1, 1440, outConfig.maxModeMinutes, errorMsg)) return false;
    if (!readUint(json, "maxOverrideMinutes", 1, 1440, outConfig.maxOverrideMinutes, errorMsg)) return false;

    // 3. Legacy reset code
    if (!readBool(json, "allowLegacyResetCode", outConfig.allowLegacyResetCode, errorMsg)) return false;
    JsonVariantConst code = json["legacyResetCode"];
    if (!code.isNull()) {
        if (!code.is<const char*>()) {
            errorMsg = "legacyResetCode must be a string.";
            return false;
        }
        outConfig.legacyResetCode = code.as<const char*>();
    }
    if (outConfig.allowLegacyResetCode && outConfig.legacyResetCode.size() < 8) {
        errorMsg = "legacyResetCode must be at least 8 characters.";
        return false;
    }

    return true;
}

bool ConfigValidators::parseRateLimitConfig(JsonVariantConst json, RateLimitConfig& outConfig, std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "rateLimits must be an object.";
        return false;
    }

    if (!readUint(json, "requestsPerMinute", 1, 10000, outConfig.requestsPerMinute, errorMsg)) return false;
    if (!readUint(json, "safetyOperationsPerMinute", 1, 1000, outConfig.safetyOperationsPerMinute, errorMsg)) return false;
    if (!readUint(json, "emergencyOperationsPerHour", 1, 1000, outConfig.emergencyOperationsPerHour, errorMsg)) return false;
    if (!readUint(json, "pinAttemptsPerMinute", 1, 1000, outConfig.pinAttemptsPerMinute, errorMsg)) return false;
    if (!readUint(json, "eventCapacity", 10, 100000, outConfig.eventCapacity, errorMsg)) return false;

    JsonVariantConst mult = json["adminMultiplier"];
    if (!mult.isNull()) {
        if (!mult.is<float>() || mult.as<float>() < 1.0f || mult.as<float>() > 10.0f) {
            errorMsg = "adminMultiplier must be a number between 1 and 10.";
            return false;
        }
        outConfig.adminMultiplier = mult.as<float>();
    }
    return true;
}

bool ConfigValidators::parseFeatures(JsonVariantConst json, std::vector<FeatureDefinition>& outFeatures,
                                     std::string& errorMsg) {
    if (json.isNull()) return true;
    if (!json.is<JsonArrayConst>()) {
        errorMsg = "features must be an array.";
        return false;
    }

    std::vector<FeatureDefinition> parsed;
    for (JsonVariantConst item : json.as<JsonArrayConst>()) {
        FeatureDefinition def;
        def.name = item["name"] | "";
        if (def.name.empty()) {
            errorMsg = "Feature name cannot be empty.";
            return false;
        }
        for (size_t i = 0; i < parsed.size(); i++) {
            if (parsed[i].name == def.name) {
                errorMsg = "Duplicate feature: " + def.name;
                return false;
            }
        }

        std::string cls = item["classification"] | "operational";
        if (!classificationFromString(cls, def.classification)) {
            errorMsg = "Invalid classification for " + def.name + ": " + cls;
            return false;
        }

        def.enabled = true;
        if (!readBool(item, "enabled", def.enabled, errorMsg)) return false;
        parsed.push_back(def);
    }

    outFeatures = parsed;
    return true;
}

bool ConfigValidators::parseAppConfig(JsonVariantConst json, AppConfig& outConfig, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Configuration root must be an object.";
        return false;
    }

    if (!parsePinConfig(json["pin"], outConfig.pin, errorMsg)) return false;
    if (!parseSafetyConfig(json["safety"], outConfig.safety, errorMsg)) return false;
    if (!parseRateLimitConfig(json["rateLimits"], outConfig.rateLimits, errorMsg)) return false;
    if (!parseFeatures(json["features"], outConfig.features, errorMsg)) return false;

    JsonVariantConst storage = json["storage"];
    if (!storage.isNull()) {
        std::string path = storage["pinStorePath"] | "";
        if (path.empty()) {
            errorMsg = "storage.pinStorePath cannot be empty.";
            return false;
        }
        outConfig.pinStorePath = path;
    }
    return true;
}

// =================================================================================
// SECTION: TELEMETRY
// =================================================================================

bool ConfigValidators::parseSystemStateUpdate(JsonVariantConst json, SystemStateUpdate& outUpdate,
                                              std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "System state must be an object.";
        return false;
    }

    outUpdate.fields = 0;
    outUpdate.values = makeSafeDefaultState();

    JsonVariantConst speed = json["vehicleSpeedMph"];
    if (!speed.isNull()) {
        if (!speed.is<float>() || speed.as<float>() < 0.0f) {
            errorMsg = "vehicleSpeedMph must be a non-negative number.";
            return false;
        }
        outUpdate.values.vehicleSpeedMph = speed.as<float>();
        outUpdate.fields |= FIELD_VEHICLE_SPEED;
    }

    struct BoolField {
        const char* key;
        uint8_t flag;
        bool* target;
    };
    BoolField bools[] = {
        { "parkingBrakeEngaged", FIELD_PARKING_BRAKE, &outUpdate.values.parkingBrakeEngaged },
        { "levelingJacksDown", FIELD_LEVELING_JACKS, &outUpdate.values.levelingJacksDown },
        { "engineRunning", FIELD_ENGINE_RUNNING, &outUpdate.values.engineRunning },
        { "allSlidesRetracted", FIELD_SLIDES_RETRACTED, &outUpdate.values.allSlidesRetracted },
    };
    for (size_t i = 0; i < sizeof(bools) / sizeof(bools[0]); i++) {
        if (json[bools[i].key].isNull()) continue;
        if (!readBool(json, bools[i].key, *bools[i].target, errorMsg)) return false;
        outUpdate.fields |= bools[i].flag;
    }

    JsonVariantConst gear = json["transmissionGear"];
    if (!gear.isNull()) {
        std::string gearStr = gear | "";
        if (!gearFromString(gearStr, outUpdate.values.transmissionGear)) {
            errorMsg = "Invalid transmissionGear: " + gearStr;
            return false;
        }
        outUpdate.fields |= FIELD_TRANSMISSION;
    }

    if (outUpdate.fields == 0) {
        errorMsg = "System state update contains no known fields.";
        return false;
    }
    return true;
}
