/*
 * File: test/test_emergency_stop/test_emergency_stop.cpp
 * Description: Emergency stop and safe state lifecycle. Trigger actions,
 * PIN gating, reset paths (PIN session and legacy code) and the explicit
 * safe state clear.
 */

#include <unity.h>
#include "SafetyService.h"
#include "../MockCollaborators.h"
#include "../MockSafetyContext.h"

static MockSafetyContext *ctx = nullptr;
static MockFeatureManager *features = nullptr;
static MockAuthorizer *authorizer = nullptr;
static MockSecurityAudit *secAudit = nullptr;
static SafetyService *service = nullptr;

void setUp(void) {
    ctx = new MockSafetyContext();
    features = new MockFeatureManager();
    authorizer = new MockAuthorizer();
    secAudit = new MockSecurityAudit();
    service = new SafetyService(*ctx, *features, makeDefaultSafetyConfig(), authorizer, secAudit);
    service->startMonitoring();
}

void tearDown(void) {
    delete service;
    delete secAudit;
    delete authorizer;
    delete features;
    delete ctx;
}

static bool hasAudit(const char *eventType) {
    std::vector<AuditLogEntry> entries;
    service->getAuditLog(DEFAULT_AUDIT_QUERY_LIMIT, entries);
    for (size_t i = 0; i < entries.size(); i++) {
        if (entries[i].eventType == eventType) return true;
    }
    return false;
}

static bool hasAction(const char *action) {
    const std::vector<std::string> &actions = service->getActiveSafetyActions();
    for (size_t i = 0; i < actions.size(); i++) {
        if (actions[i] == action) return true;
    }
    return false;
}

static void assertAllInterlocks(bool engaged) {
    TEST_ASSERT_EQUAL(engaged, service->getInterlock(INTERLOCK_SLIDE_ROOM)->isEngaged());
    TEST_ASSERT_EQUAL(engaged, service->getInterlock(INTERLOCK_AWNING)->isEngaged());
    TEST_ASSERT_EQUAL(engaged, service->getInterlock(INTERLOCK_LEVELING_JACK)->isEngaged());
}

// --- Trigger ---

void test_trigger_executes_stop_actions(void) {
    TEST_ASSERT_TRUE(service->triggerEmergencyStop("Operator request", "driver"));

    TEST_ASSERT_TRUE(service->isEmergencyStopActive());
    TEST_ASSERT_TRUE(service->isInSafeState());
    TEST_ASSERT_FALSE(service->isMonitoringActive());

    TEST_ASSERT_EQUAL(FEATURE_SAFE_SHUTDOWN, features->stateOf("firefly"));
    TEST_ASSERT_EQUAL(FEATURE_SAFE_SHUTDOWN, features->stateOf("spartan_k2"));
    TEST_ASSERT_EQUAL(FEATURE_SAFE_SHUTDOWN, features->stateOf("can_interface"));
    TEST_ASSERT_EQUAL(FEATURE_HEALTHY, features->stateOf("notifications"));

    assertAllInterlocks(true);
    TEST_ASSERT_EQUAL(5, service->getActiveSafetyActions().size());
    TEST_ASSERT_TRUE(hasAction("position_critical_safe_shutdown"));
    TEST_ASSERT_TRUE(hasAction("maintain_position"));
    TEST_ASSERT_TRUE(hasAction("interlock_engaged_awning_safety"));

    TEST_ASSERT_TRUE(hasAudit("emergency_stop_triggered"));
    TEST_ASSERT_TRUE(hasAudit("safe_state_entered"));
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_EMERGENCY_STOP_TRIGGERED));

    SafetyStatus status = service->getSafetyStatus();
    TEST_ASSERT_EQUAL_STRING("Operator request", status.emergencyStopReason.c_str());
    TEST_ASSERT_EQUAL_STRING("driver", status.emergencyStopTriggeredBy.c_str());
    TEST_ASSERT_EQUAL_STRING("Emergency stop: Operator request", status.safeStateReason.c_str());
}

void test_second_trigger_is_noop(void) {
    TEST_ASSERT_TRUE(service->triggerEmergencyStop("First", "driver"));
    size_t changes = features->stateChanges.size();
    TEST_ASSERT_FALSE(service->triggerEmergencyStop("Second", "driver"));
    TEST_ASSERT_EQUAL(changes, features->stateChanges.size());
    TEST_ASSERT_EQUAL_STRING("First", service->getSafetyStatus().emergencyStopReason.c_str());
}

void test_disabled_features_are_left_alone(void) {
    features->addFeature("aux_jacks", CLASS_POSITION_CRITICAL, false);
    service->triggerEmergencyStop("Operator request", "driver");
    TEST_ASSERT_EQUAL(FEATURE_HEALTHY, features->stateOf("aux_jacks"));
}

void test_trigger_survives_unavailable_security_audit(void) {
    secAudit->unavailable = true;
    TEST_ASSERT_TRUE(service->triggerEmergencyStop("Operator request", "driver"));
    TEST_ASSERT_TRUE(service->isInSafeState());
    TEST_ASSERT_TRUE(ctx->hasLogContaining("Security audit unavailable"));
}

// --- PIN-Gated Trigger ---

void test_emergency_stop_with_pin(void) {
    authorizer->grant("s-ok");
    TEST_ASSERT_EQUAL(SAFETY_OK, service->emergencyStopWithPin("s-ok", "Smoke", "alice"));
    TEST_ASSERT_TRUE(service->isEmergencyStopActive());
    TEST_ASSERT_EQUAL_STRING(OP_EMERGENCY_STOP, authorizer->operations[0].c_str());
    TEST_ASSERT_EQUAL_STRING("alice", authorizer->lastUserId.c_str());

    // Already active
    TEST_ASSERT_EQUAL(SAFETY_NO_CHANGE, service->emergencyStopWithPin("s-ok", "Smoke", "alice"));
}

void test_emergency_stop_with_denied_pin(void) {
    TEST_ASSERT_EQUAL(SAFETY_AUTH_DENIED, service->emergencyStopWithPin("s-bad", "Smoke", "mallory"));
    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    TEST_ASSERT_FALSE(service->isInSafeState());
    TEST_ASSERT_TRUE(hasAudit("emergency_stop_auth_failed"));
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_UNAUTHORIZED_ACCESS));
}

void test_emergency_stop_without_authorizer(void) {
    SafetyService bare(*ctx, *features, makeDefaultSafetyConfig());
    TEST_ASSERT_EQUAL(SAFETY_INFRA_ERROR, bare.emergencyStopWithPin("s-ok", "Smoke", "alice"));
    TEST_ASSERT_FALSE(bare.isEmergencyStopActive());
    TEST_ASSERT_TRUE(ctx->hasLogContaining("PIN manager not available"));
}

// --- Reset ---

void test_reset_without_active_stop(void) {
    TEST_ASSERT_EQUAL(SAFETY_NO_CHANGE, service->resetEmergencyStop(DEFAULT_LEGACY_RESET_CODE, "admin"));
}

void test_reset_with_legacy_code(void) {
    service->triggerEmergencyStop("Operator request", "driver");
    TEST_ASSERT_EQUAL(SAFETY_OK, service->resetEmergencyStop(DEFAULT_LEGACY_RESET_CODE, "admin"));

    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    // Reset leaves the safe state and interlocks for an explicit clear
    TEST_ASSERT_TRUE(service->isInSafeState());
    assertAllInterlocks(true);
    TEST_ASSERT_EQUAL(FEATURE_SAFE_SHUTDOWN, features->stateOf("firefly"));

    TEST_ASSERT_TRUE(hasAudit("emergency_stop_reset"));
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_EMERGENCY_STOP_RESET));
    TEST_ASSERT_TRUE(service->getSafetyStatus().emergencyStopReason.empty());
}

void test_reset_with_wrong_code(void) {
    service->triggerEmergencyStop("Operator request", "driver");
    TEST_ASSERT_EQUAL(SAFETY_AUTH_DENIED, service->resetEmergencyStop("WRONG_CODE", "admin"));
    TEST_ASSERT_TRUE(service->isEmergencyStopActive());
    TEST_ASSERT_TRUE(hasAudit("emergency_stop_reset_failed"));
}

void test_reset_with_legacy_code_disabled(void) {
    SafetyConfig cfg = makeDefaultSafetyConfig();
    cfg.allowLegacyResetCode = false;
    SafetyService strict(*ctx, *features, cfg, authorizer, secAudit);
    strict.triggerEmergencyStop("Operator request", "driver");

    TEST_ASSERT_EQUAL(SAFETY_AUTH_DENIED, strict.resetEmergencyStop(DEFAULT_LEGACY_RESET_CODE, "admin"));
    TEST_ASSERT_TRUE(strict.isEmergencyStopActive());
}

void test_reset_with_pin(void) {
    authorizer->grant("s-reset");
    service->triggerEmergencyStop("Operator request", "driver");
    TEST_ASSERT_EQUAL(SAFETY_OK, service->resetEmergencyStopWithPin("s-reset", "alice"));
    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    TEST_ASSERT_EQUAL_STRING(OP_EMERGENCY_RESET, authorizer->operations.back().c_str());
}

void test_reset_with_pin_infra_error(void) {
    authorizer->defaultDecision = AUTHZ_INFRA_ERROR;
    service->triggerEmergencyStop("Operator request", "driver");
    TEST_ASSERT_EQUAL(SAFETY_INFRA_ERROR, service->resetEmergencyStopWithPin("s-any", "alice"));
    TEST_ASSERT_TRUE(service->isEmergencyStopActive());
}

// --- Safe State Clear ---

void test_clear_safe_state_requires_reset_first(void) {
    authorizer->grant("s-clear");
    service->triggerEmergencyStop("Operator request", "driver");
    TEST_ASSERT_EQUAL(SAFETY_INVALID_STATE, service->clearSafeStateWithPin("s-clear", "alice"));
    TEST_ASSERT_TRUE(service->isInSafeState());
}

void test_clear_safe_state_when_not_in_safe_state(void) {
    authorizer->grant("s-clear");
    TEST_ASSERT_EQUAL(SAFETY_NO_CHANGE, service->clearSafeStateWithPin("s-clear", "alice"));
}

void test_clear_safe_state_denied(void) {
    service->triggerEmergencyStop("Operator request", "driver");
    service->resetEmergencyStop(DEFAULT_LEGACY_RESET_CODE, "admin");
    TEST_ASSERT_EQUAL(SAFETY_AUTH_DENIED, service->clearSafeStateWithPin("s-bad", "alice"));
    TEST_ASSERT_TRUE(service->isInSafeState());
    TEST_ASSERT_TRUE(hasAudit("safe_state_clear_auth_failed"));
}

void test_full_recovery_cycle(void) {
    authorizer->grant("s-clear");
    service->triggerEmergencyStop("Operator request", "driver");
    service->resetEmergencyStop(DEFAULT_LEGACY_RESET_CODE, "admin");

    TEST_ASSERT_EQUAL(SAFETY_OK, service->clearSafeStateWithPin("s-clear", "alice"));
    TEST_ASSERT_FALSE(service->isInSafeState());
    TEST_ASSERT_TRUE(service->isMonitoringActive());
    TEST_ASSERT_EQUAL(0, service->getActiveSafetyActions().size());
    TEST_ASSERT_TRUE(hasAudit("safe_state_cleared"));
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_SAFE_STATE_CLEARED));

    // Interlocks release on the next health tick
    assertAllInterlocks(true);
    TEST_ASSERT_TRUE(service->runHealthCheck());
    assertAllInterlocks(false);
    TEST_ASSERT_TRUE(hasAudit("interlock_disengaged"));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_trigger_executes_stop_actions);
    RUN_TEST(test_second_trigger_is_noop);
    RUN_TEST(test_disabled_features_are_left_alone);
    RUN_TEST(test_trigger_survives_unavailable_security_audit);

    RUN_TEST(test_emergency_stop_with_pin);
    RUN_TEST(test_emergency_stop_with_denied_pin);
    RUN_TEST(test_emergency_stop_without_authorizer);

    RUN_TEST(test_reset_without_active_stop);
    RUN_TEST(test_reset_with_legacy_code);
    RUN_TEST(test_reset_with_wrong_code);
    RUN_TEST(test_reset_with_legacy_code_disabled);
    RUN_TEST(test_reset_with_pin);
    RUN_TEST(test_reset_with_pin_infra_error);

    RUN_TEST(test_clear_safe_state_requires_reset_first);
    RUN_TEST(test_clear_safe_state_when_not_in_safe_state);
    RUN_TEST(test_clear_safe_state_denied);
    RUN_TEST(test_full_recovery_cycle);

    return UNITY_END();
}
