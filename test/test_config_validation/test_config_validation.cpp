/*
 * File: test/test_config_validation/test_config_validation.cpp
 * Description: Verifies that the configuration parser keeps defaults for
 * missing keys, applies present ones and rejects out-of-range or
 * inconsistent values with a readable message.
 */
#include <unity.h>
#include <ArduinoJson.h>
#include "ConfigValidators.h"

static JsonDocument doc;
static AppConfig config;
static std::string errorMsg;

void setUp(void) {
    doc.clear();
    config = makeDefaultAppConfig();
    errorMsg.clear();
}

void tearDown(void) {}

// --- Helper ---
static bool parseApp(const char *json) {
    DeserializationError err = deserializeJson(doc, json);
    TEST_ASSERT_FALSE_MESSAGE(err, "Test fixture JSON failed to parse");
    return ConfigValidators::parseAppConfig(doc.as<JsonVariantConst>(), config, errorMsg);
}

static bool parseState(const char *json, SystemStateUpdate &update) {
    DeserializationError err = deserializeJson(doc, json);
    TEST_ASSERT_FALSE_MESSAGE(err, "Test fixture JSON failed to parse");
    return ConfigValidators::parseSystemStateUpdate(doc.as<JsonVariantConst>(), update, errorMsg);
}

// ============================================================================
// DEFAULTS
// ============================================================================

void test_empty_document_keeps_defaults(void) {
    TEST_ASSERT_TRUE(parseApp("{}"));
    TEST_ASSERT_EQUAL(4, config.pin.minPinLength);
    TEST_ASSERT_EQUAL(3, config.pin.maxFailedAttempts);
    TEST_ASSERT_EQUAL(15, config.pin.lockoutDurationMinutes);
    TEST_ASSERT_EQUAL(2, config.pin.maxConcurrentSessions);
    TEST_ASSERT_EQUAL(5, config.pin.policies[PIN_EMERGENCY].sessionMinutes);
    TEST_ASSERT_EQUAL(1, config.pin.policies[PIN_EMERGENCY].maxOperations);
    TEST_ASSERT_EQUAL(0, config.pin.policies[PIN_MAINTENANCE].maxOperations);
    TEST_ASSERT_EQUAL(3, config.safety.multipleViolationThreshold);
    TEST_ASSERT_EQUAL(5, config.features.size());
    TEST_ASSERT_EQUAL_STRING(DEFAULT_PIN_STORE_PATH, config.pinStorePath.c_str());
}

void test_root_must_be_object(void) {
    TEST_ASSERT_FALSE(parseApp("[1, 2]"));
    TEST_ASSERT_EQUAL_STRING("Configuration root must be an object.", errorMsg.c_str());
}

// ============================================================================
// PIN SECTION
// ============================================================================

void test_pin_section_applies_values(void) {
    TEST_ASSERT_TRUE(parseApp(
        "{\"pin\": {\"minPinLength\": 6, \"maxPinLength\": 8, \"maxFailedAttempts\": 5,"
        " \"enforceOperationScope\": false,"
        " \"policies\": {\"override\": {\"sessionMinutes\": 45, \"maxOperations\": 2}}}}"));
    TEST_ASSERT_EQUAL(6, config.pin.minPinLength);
    TEST_ASSERT_EQUAL(8, config.pin.maxPinLength);
    TEST_ASSERT_EQUAL(5, config.pin.maxFailedAttempts);
    TEST_ASSERT_FALSE(config.pin.enforceOperationScope);
    TEST_ASSERT_EQUAL(45, config.pin.policies[PIN_OVERRIDE].sessionMinutes);
    TEST_ASSERT_EQUAL(2, config.pin.policies[PIN_OVERRIDE].maxOperations);
    // Untouched policy keeps its default
    TEST_ASSERT_EQUAL(120, config.pin.policies[PIN_MAINTENANCE].sessionMinutes);
}

void test_pin_length_range(void) {
    TEST_ASSERT_FALSE(parseApp("{\"pin\": {\"minPinLength\": 3}}"));
    TEST_ASSERT_EQUAL_STRING("minPinLength out of range (4-16).", errorMsg.c_str());
}

void test_pin_length_order(void) {
    TEST_ASSERT_FALSE(parseApp("{\"pin\": {\"minPinLength\": 10, \"maxPinLength\": 6}}"));
    TEST_ASSERT_EQUAL_STRING("minPinLength cannot be greater than maxPinLength.", errorMsg.c_str());
}

void test_negative_integer_rejected(void) {
    TEST_ASSERT_FALSE(parseApp("{\"pin\": {\"maxFailedAttempts\": -1}}"));
    TEST_ASSERT_EQUAL_STRING("maxFailedAttempts must be a non-negative integer.", errorMsg.c_str());
}

void test_wrong_boolean_type_rejected(void) {
    TEST_ASSERT_FALSE(parseApp("{\"pin\": {\"requireNumericOnly\": \"yes\"}}"));
    TEST_ASSERT_EQUAL_STRING("requireNumericOnly must be true or false.", errorMsg.c_str());
}

void test_unknown_policy_type(void) {
    TEST_ASSERT_FALSE(parseApp("{\"pin\": {\"policies\": {\"valet\": {\"sessionMinutes\": 5}}}}"));
    TEST_ASSERT_EQUAL_STRING("Unknown PIN type in policies: valet", errorMsg.c_str());
}

void test_hash_iterations_floor(void) {
    TEST_ASSERT_FALSE(parseApp("{\"pin\": {\"hashIterations\": 999}}"));
    TEST_ASSERT_EQUAL_STRING("hashIterations out of range (1000-1000000).", errorMsg.c_str());
}

// ============================================================================
// SAFETY SECTION
// ============================================================================

void test_watchdog_must_exceed_health_interval(void) {
    TEST_ASSERT_FALSE(parseApp("{\"safety\": {\"healthCheckIntervalMs\": 5000, \"watchdogTimeoutMs\": 5000}}"));
    TEST_ASSERT_EQUAL_STRING("watchdogTimeoutMs must be greater than healthCheckIntervalMs.", errorMsg.c_str());
}

void test_watchdog_poll_must_be_shorter(void) {
    TEST_ASSERT_FALSE(parseApp("{\"safety\": {\"watchdogTimeoutMs\": 15000, \"watchdogPollMs\": 15000}}"));
    TEST_ASSERT_EQUAL_STRING("watchdogPollMs must be less than watchdogTimeoutMs.", errorMsg.c_str());
}

void test_short_legacy_code_rejected_only_when_allowed(void) {
    TEST_ASSERT_FALSE(parseApp("{\"safety\": {\"legacyResetCode\": \"abc\"}}"));
    TEST_ASSERT_EQUAL_STRING("legacyResetCode must be at least 8 characters.", errorMsg.c_str());

    config = makeDefaultAppConfig();
    TEST_ASSERT_TRUE(parseApp("{\"safety\": {\"allowLegacyResetCode\": false, \"legacyResetCode\": \"abc\"}}"));
    TEST_ASSERT_FALSE(config.safety.allowLegacyResetCode);
}

void test_safety_section_applies_values(void) {
    TEST_ASSERT_TRUE(parseApp(
        "{\"safety\": {\"healthCheckIntervalMs\": 1000, \"watchdogTimeoutMs\": 4000,"
        " \"watchdogPollMs\": 250, \"multipleViolationThreshold\": 2, \"maxOverrideMinutes\": 60}}"));
    TEST_ASSERT_EQUAL(1000, config.safety.healthCheckIntervalMs);
    TEST_ASSERT_EQUAL(4000, config.safety.watchdogTimeoutMs);
    TEST_ASSERT_EQUAL(250, config.safety.watchdogPollMs);
    TEST_ASSERT_EQUAL(2, config.safety.multipleViolationThreshold);
    TEST_ASSERT_EQUAL(60, config.safety.maxOverrideMinutes);
}

// ============================================================================
// RATE LIMITS, FEATURES, STORAGE
// ============================================================================

void test_rate_limits(void) {
    TEST_ASSERT_TRUE(parseApp("{\"rateLimits\": {\"safetyOperationsPerMinute\": 8, \"adminMultiplier\": 1.5}}"));
    TEST_ASSERT_EQUAL(8, config.rateLimits.safetyOperationsPerMinute);
    TEST_ASSERT_EQUAL_FLOAT(1.5f, config.rateLimits.adminMultiplier);

    TEST_ASSERT_FALSE(parseApp("{\"rateLimits\": {\"adminMultiplier\": 0.5}}"));
    TEST_ASSERT_EQUAL_STRING("adminMultiplier must be a number between 1 and 10.", errorMsg.c_str());
}

void test_features_replace_defaults(void) {
    TEST_ASSERT_TRUE(parseApp(
        "{\"features\": [{\"name\": \"firefly\", \"classification\": \"position_critical\"},"
        " {\"name\": \"tank_monitor\", \"enabled\": false}]}"));
    TEST_ASSERT_EQUAL(2, config.features.size());
    TEST_ASSERT_EQUAL(CLASS_POSITION_CRITICAL, config.features[0].classification);
    TEST_ASSERT_TRUE(config.features[0].enabled);
    TEST_ASSERT_EQUAL(CLASS_OPERATIONAL, config.features[1].classification);
    TEST_ASSERT_FALSE(config.features[1].enabled);
}

void test_duplicate_feature_rejected(void) {
    TEST_ASSERT_FALSE(parseApp("{\"features\": [{\"name\": \"rvc\"}, {\"name\": \"rvc\"}]}"));
    TEST_ASSERT_EQUAL_STRING("Duplicate feature: rvc", errorMsg.c_str());
    // Failed parse leaves the previous list intact
    TEST_ASSERT_EQUAL(5, config.features.size());
}

void test_invalid_classification_rejected(void) {
    TEST_ASSERT_FALSE(parseApp("{\"features\": [{\"name\": \"rvc\", \"classification\": \"vital\"}]}"));
    TEST_ASSERT_EQUAL_STRING("Invalid classification for rvc: vital", errorMsg.c_str());
}

void test_storage_path(void) {
    TEST_ASSERT_TRUE(parseApp("{\"storage\": {\"pinStorePath\": \"/tmp/pins.json\"}}"));
    TEST_ASSERT_EQUAL_STRING("/tmp/pins.json", config.pinStorePath.c_str());

    TEST_ASSERT_FALSE(parseApp("{\"storage\": {\"pinStorePath\": \"\"}}"));
    TEST_ASSERT_EQUAL_STRING("storage.pinStorePath cannot be empty.", errorMsg.c_str());
}

// ============================================================================
// TELEMETRY FRAMES
// ============================================================================

void test_system_state_update_flags_present_fields(void) {
    SystemStateUpdate update;
    TEST_ASSERT_TRUE(parseState("{\"vehicleSpeedMph\": 3.5, \"engineRunning\": true, \"transmissionGear\": \"D\"}",
                                update));
    TEST_ASSERT_EQUAL(FIELD_VEHICLE_SPEED | FIELD_ENGINE_RUNNING | FIELD_TRANSMISSION, update.fields);
    TEST_ASSERT_EQUAL_FLOAT(3.5f, update.values.vehicleSpeedMph);
    TEST_ASSERT_TRUE(update.values.engineRunning);
    TEST_ASSERT_EQUAL(GEAR_DRIVE, update.values.transmissionGear);
}

void test_system_state_update_errors(void) {
    SystemStateUpdate update;
    TEST_ASSERT_FALSE(parseState("{\"vehicleSpeedMph\": -1}", update));
    TEST_ASSERT_EQUAL_STRING("vehicleSpeedMph must be a non-negative number.", errorMsg.c_str());

    TEST_ASSERT_FALSE(parseState("{\"transmissionGear\": \"OVERDRIVE\"}", update));
    TEST_ASSERT_EQUAL_STRING("Invalid transmissionGear: OVERDRIVE", errorMsg.c_str());

    TEST_ASSERT_FALSE(parseState("{\"cabinTemp\": 71}", update));
    TEST_ASSERT_EQUAL_STRING("System state update contains no known fields.", errorMsg.c_str());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_empty_document_keeps_defaults);
    RUN_TEST(test_root_must_be_object);

    RUN_TEST(test_pin_section_applies_values);
    RUN_TEST(test_pin_length_range);
    RUN_TEST(test_pin_length_order);
    RUN_TEST(test_negative_integer_rejected);
    RUN_TEST(test_wrong_boolean_type_rejected);
    RUN_TEST(test_unknown_policy_type);
    RUN_TEST(test_hash_iterations_floor);

    RUN_TEST(test_watchdog_must_exceed_health_interval);
    RUN_TEST(test_watchdog_poll_must_be_shorter);
    RUN_TEST(test_short_legacy_code_rejected_only_when_allowed);
    RUN_TEST(test_safety_section_applies_values);

    RUN_TEST(test_rate_limits);
    RUN_TEST(test_features_replace_defaults);
    RUN_TEST(test_duplicate_feature_rejected);
    RUN_TEST(test_invalid_classification_rejected);
    RUN_TEST(test_storage_path);

    RUN_TEST(test_system_state_update_flags_present_fields);
    RUN_TEST(test_system_state_update_errors);

    return UNITY_END();
}
