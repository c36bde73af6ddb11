/*
 * File: test/test_health_monitor/test_health_monitor.cpp
 * Description: Health and watchdog ticks. Interlock re-evaluation against
 * telemetry, escalation to emergency stop, watchdog expiry and the
 * halted-monitoring behavior after safe state.
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

static void setEngineRunning(bool running) {
    SystemStateUpdate update;
    update.fields = FIELD_ENGINE_RUNNING;
    update.values = makeSafeDefaultState();
    update.values.engineRunning = running;
    service->updateSystemState(update);
}

// --- Telemetry ---

void test_partial_update_touches_only_masked_fields(void) {
    SystemStateUpdate update;
    update.fields = FIELD_VEHICLE_SPEED | FIELD_TRANSMISSION;
    update.values = makeSafeDefaultState();
    update.values.vehicleSpeedMph = 12.5f;
    update.values.parkingBrakeEngaged = false;
    update.values.levelingJacksDown = false;
    update.values.engineRunning = true;
    update.values.transmissionGear = GEAR_DRIVE;
    update.values.allSlidesRetracted = false;
    service->updateSystemState(update);

    const SystemState &s = service->getSystemState();
    TEST_ASSERT_EQUAL_FLOAT(12.5f, s.vehicleSpeedMph);
    TEST_ASSERT_EQUAL(GEAR_DRIVE, s.transmissionGear);
    TEST_ASSERT_TRUE(s.parkingBrakeEngaged);
    TEST_ASSERT_TRUE(s.levelingJacksDown);
    TEST_ASSERT_FALSE(s.engineRunning);
    TEST_ASSERT_TRUE(s.allSlidesRetracted);
    TEST_ASSERT_EQUAL(SYSTEM_STATE_VERSION, s.version);
}

// --- Interlock Ticks ---

void test_single_violation_engages_then_releases(void) {
    setEngineRunning(true);
    TEST_ASSERT_TRUE(service->runHealthCheck());

    TEST_ASSERT_TRUE(service->getInterlock(INTERLOCK_LEVELING_JACK)->isEngaged());
    TEST_ASSERT_FALSE(service->getInterlock(INTERLOCK_SLIDE_ROOM)->isEngaged());
    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    TEST_ASSERT_EQUAL_STRING("Condition not met: engine_not_running",
                             service->getInterlock(INTERLOCK_LEVELING_JACK)->getEngagementReason().c_str());
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_SAFETY_INTERLOCK_VIOLATED));

    const std::vector<std::string> &actions = service->getActiveSafetyActions();
    TEST_ASSERT_EQUAL(1, actions.size());
    TEST_ASSERT_EQUAL_STRING("interlock_violated_leveling_jack_safety", actions[0].c_str());

    // Still violated: no duplicate action, no second engagement audit
    size_t events = secAudit->events.size();
    TEST_ASSERT_TRUE(service->runHealthCheck());
    TEST_ASSERT_EQUAL(1, service->getActiveSafetyActions().size());
    TEST_ASSERT_EQUAL(events, secAudit->events.size());

    setEngineRunning(false);
    TEST_ASSERT_TRUE(service->runHealthCheck());
    TEST_ASSERT_FALSE(service->getInterlock(INTERLOCK_LEVELING_JACK)->isEngaged());
    TEST_ASSERT_TRUE(hasAudit("interlock_disengaged"));
}

void test_multiple_violations_trigger_emergency_stop(void) {
    SystemStateUpdate update;
    update.fields = FIELD_VEHICLE_SPEED | FIELD_PARKING_BRAKE | FIELD_ENGINE_RUNNING;
    update.values = makeSafeDefaultState();
    update.values.vehicleSpeedMph = 5.0f;
    update.values.parkingBrakeEngaged = false;
    update.values.engineRunning = true;
    service->updateSystemState(update);

    TEST_ASSERT_FALSE(service->runHealthCheck());

    TEST_ASSERT_TRUE(service->isEmergencyStopActive());
    TEST_ASSERT_TRUE(service->isInSafeState());
    SafetyStatus status = service->getSafetyStatus();
    TEST_ASSERT_EQUAL_STRING("safety_monitoring", status.emergencyStopTriggeredBy.c_str());
    TEST_ASSERT_EQUAL_STRING(
        "Multiple interlock violations: 3 (slide_room_safety, awning_safety, leveling_jack_safety)",
        status.emergencyStopReason.c_str());
    TEST_ASSERT_EQUAL(FEATURE_SAFE_SHUTDOWN, features->stateOf("firefly"));
}

void test_violation_threshold_is_configurable(void) {
    SafetyConfig cfg = makeDefaultSafetyConfig();
    cfg.multipleViolationThreshold = 1;
    SafetyService strict(*ctx, *features, cfg, authorizer, secAudit);
    strict.startMonitoring();

    SystemStateUpdate update;
    update.fields = FIELD_ENGINE_RUNNING;
    update.values = makeSafeDefaultState();
    update.values.engineRunning = true;
    strict.updateSystemState(update);

    TEST_ASSERT_FALSE(strict.runHealthCheck());
    TEST_ASSERT_TRUE(strict.isEmergencyStopActive());
}

// --- Feature Health ---

void test_critical_feature_failure_triggers_emergency_stop(void) {
    features->failedCritical.push_back("can_interface");
    TEST_ASSERT_FALSE(service->runHealthCheck());

    TEST_ASSERT_TRUE(service->isEmergencyStopActive());
    SafetyStatus status = service->getSafetyStatus();
    TEST_ASSERT_EQUAL_STRING("Critical feature failed: can_interface", status.emergencyStopReason.c_str());
    TEST_ASSERT_EQUAL_STRING("health_monitoring", status.emergencyStopTriggeredBy.c_str());
}

void test_non_critical_failure_is_tolerated(void) {
    features->failedOther.push_back("notifications");
    TEST_ASSERT_TRUE(service->runHealthCheck());
    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    TEST_ASSERT_FALSE(service->isInSafeState());
}

void test_health_query_failure_enters_safe_state(void) {
    features->healthUnavailable = true;
    TEST_ASSERT_FALSE(service->runHealthCheck());

    TEST_ASSERT_TRUE(service->isInSafeState());
    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    TEST_ASSERT_EQUAL_STRING("Monitoring loop failure: feature health unavailable",
                             service->getSafetyStatus().safeStateReason.c_str());
    TEST_ASSERT_TRUE(service->getInterlock(INTERLOCK_AWNING)->isEngaged());
}

// --- Watchdog ---

void test_watchdog_expires_without_kicks(void) {
    TEST_ASSERT_TRUE(service->checkWatchdog());

    ctx->advanceTime(15000);
    TEST_ASSERT_FALSE(service->isWatchdogExpired());
    TEST_ASSERT_TRUE(service->checkWatchdog());

    ctx->advanceTime(1);
    TEST_ASSERT_TRUE(service->isWatchdogExpired());
    TEST_ASSERT_FALSE(service->checkWatchdog());

    TEST_ASSERT_TRUE(service->isInSafeState());
    TEST_ASSERT_FALSE(service->isEmergencyStopActive());
    TEST_ASSERT_EQUAL_STRING("Watchdog timeout", service->getSafetyStatus().safeStateReason.c_str());
    TEST_ASSERT_TRUE(hasAudit("watchdog_timeout"));
}

void test_health_tick_kicks_watchdog(void) {
    ctx->advanceTime(10000);
    TEST_ASSERT_TRUE(service->runHealthCheck());
    ctx->advanceTime(10000);
    TEST_ASSERT_TRUE(service->checkWatchdog());
    TEST_ASSERT_EQUAL(10000, service->getSafetyStatus().msSinceLastKick);
}

void test_latched_expiry_survives_late_tick(void) {
    ctx->advanceTime(15001);
    TEST_ASSERT_TRUE(service->tripWatchdog());
    TEST_ASSERT_FALSE(service->tripWatchdog());
    TEST_ASSERT_TRUE(service->isWatchdogTripped());

    // The stalled health iteration finally completes
    TEST_ASSERT_FALSE(service->runHealthCheck());
    TEST_ASSERT_TRUE(service->isInSafeState());
    TEST_ASSERT_EQUAL_STRING("Watchdog timeout", service->getSafetyStatus().safeStateReason.c_str());
    TEST_ASSERT_TRUE(ctx->hasLogContaining("15001 ms > 15000 ms"));
}

void test_rearm_clears_latched_expiry(void) {
    ctx->advanceTime(15001);
    service->tripWatchdog();
    TEST_ASSERT_FALSE(service->checkWatchdog());

    authorizer->grant("s-admin");
    TEST_ASSERT_EQUAL(SAFETY_OK, service->clearSafeStateWithPin("s-admin", "admin"));
    TEST_ASSERT_FALSE(service->isWatchdogTripped());
    TEST_ASSERT_TRUE(service->runHealthCheck());
}

// --- Halted Monitoring ---

void test_ticks_are_noops_before_start(void) {
    SafetyService idle(*ctx, *features, makeDefaultSafetyConfig(), authorizer, secAudit);
    int before = features->healthChecks;
    TEST_ASSERT_FALSE(idle.runHealthCheck());
    TEST_ASSERT_FALSE(idle.checkWatchdog());
    TEST_ASSERT_FALSE(idle.isWatchdogExpired());
    TEST_ASSERT_EQUAL(before, features->healthChecks);
}

void test_ticks_halt_after_safe_state(void) {
    service->triggerEmergencyStop("Operator request", "driver");
    int before = features->healthChecks;

    ctx->advanceTime(60000);
    TEST_ASSERT_FALSE(service->runHealthCheck());
    TEST_ASSERT_FALSE(service->checkWatchdog());
    TEST_ASSERT_FALSE(service->isWatchdogExpired());
    TEST_ASSERT_EQUAL(before, features->healthChecks);
    TEST_ASSERT_FALSE(hasAudit("watchdog_timeout"));

    service->startMonitoring();
    TEST_ASSERT_FALSE(service->isMonitoringActive());
    TEST_ASSERT_TRUE(ctx->hasLogContaining("Monitoring not started"));
}

// --- Rate Limit Gate ---

void test_rate_limited_operation(void) {
    TEST_ASSERT_TRUE(service->validateSafetyOperation(RATE_SAFETY, "alice", "10.0.0.5", false, "slide_room"));
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_SAFETY_OPERATION_AUTHORIZED));
    TEST_ASSERT_EQUAL(RATE_SAFETY, secAudit->lastCategory);

    secAudit->allowAll = false;
    TEST_ASSERT_FALSE(service->validateSafetyOperation(RATE_EMERGENCY, "alice", "10.0.0.5", false, "estop"));
    TEST_ASSERT_TRUE(hasAudit("rate_limit_exceeded"));
    TEST_ASSERT_TRUE(secAudit->hasEvent(SEC_RATE_LIMIT_EXCEEDED));
}

void test_rate_limiter_unavailable_allows(void) {
    secAudit->unavailable = true;
    TEST_ASSERT_TRUE(service->validateSafetyOperation(RATE_SAFETY, "alice", "", false, "slide_room"));
    TEST_ASSERT_TRUE(ctx->hasLogContaining("Rate limiter unavailable"));

    SafetyService bare(*ctx, *features, makeDefaultSafetyConfig());
    TEST_ASSERT_TRUE(bare.validateSafetyOperation(RATE_SAFETY, "alice", "", false, "slide_room"));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_partial_update_touches_only_masked_fields);

    RUN_TEST(test_single_violation_engages_then_releases);
    RUN_TEST(test_multiple_violations_trigger_emergency_stop);
    RUN_TEST(test_violation_threshold_is_configurable);

    RUN_TEST(test_critical_feature_failure_triggers_emergency_stop);
    RUN_TEST(test_non_critical_failure_is_tolerated);
    RUN_TEST(test_health_query_failure_enters_safe_state);

    RUN_TEST(test_watchdog_expires_without_kicks);
    RUN_TEST(test_health_tick_kicks_watchdog);
    RUN_TEST(test_latched_expiry_survives_late_tick);
    RUN_TEST(test_rearm_clears_latched_expiry);

    RUN_TEST(test_ticks_are_noops_before_start);
    RUN_TEST(test_ticks_halt_after_safe_state);

    RUN_TEST(test_rate_limited_operation);
    RUN_TEST(test_rate_limiter_unavailable_allows);

    return UNITY_END();
}
