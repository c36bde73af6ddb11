/*
 * File: test/test_file_pin_store/test_file_pin_store.cpp
 * Description: Persistence of the PIN store across restarts. Records,
 * sessions and failure history reload from the JSON snapshot; unreadable
 * snapshots and unwritable paths are reported.
 */

#include <unity.h>
#include <fstream>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#include "FilePinStore.h"
#include "PinManager.h"
#include "../MockSafetyContext.h"

static MockSafetyContext *ctx = nullptr;
static std::string path;

static PinConfig testConfig() {
    PinConfig c = makeDefaultPinConfig();
    c.hashIterations = 1000;
    return c;
}

static void writeFile(const char *content) {
    std::ofstream out(path.c_str(), std::ios::trunc);
    out << content;
}

void setUp(void) {
    ctx = new MockSafetyContext();
    char buf[96];
    snprintf(buf, sizeof(buf), "/tmp/rvsafety_pins_%d.json", (int)getpid());
    path = buf;
    remove(path.c_str());
}

void tearDown(void) {
    remove(path.c_str());
    rmdir(path.c_str());
    remove((path + ".tmp").c_str());
    delete ctx;
}

// --- Loading ---

void test_missing_file_starts_empty(void) {
    FilePinStore store(*ctx, path);
    TEST_ASSERT_TRUE(store.load());

    uint32_t count = 99;
    TEST_ASSERT_TRUE(store.countActivePins(count));
    TEST_ASSERT_EQUAL(0, count);
    TEST_ASSERT_TRUE(ctx->hasLogContaining("No PIN store snapshot found"));
}

void test_corrupt_file_is_rejected(void) {
    writeFile("{ not json");
    FilePinStore store(*ctx, path);
    TEST_ASSERT_FALSE(store.load());
    TEST_ASSERT_TRUE(ctx->hasLogContaining("unreadable"));
}

void test_wrong_magic_is_rejected(void) {
    writeFile("{\"magic\": 1, \"version\": 1, \"pins\": []}");
    FilePinStore store(*ctx, path);
    TEST_ASSERT_FALSE(store.load());

    writeFile("{\"magic\": 1381388361, \"version\": 9, \"pins\": []}");
    TEST_ASSERT_FALSE(store.load());
}

// --- Round Trips ---

void test_pins_and_sessions_survive_restart(void) {
    std::string sid;
    {
        FilePinStore store(*ctx, path);
        TEST_ASSERT_TRUE(store.load());
        PinManager manager(*ctx, store, testConfig());

        std::string err;
        TEST_ASSERT_EQUAL(AUTH_OK, manager.setPin("alice", PIN_MAINTENANCE, "3456", "Tech PIN", err));
        PinValidationResult r = manager.validatePin("alice", "3456", PIN_MAINTENANCE);
        TEST_ASSERT_EQUAL(AUTH_OK, r.outcome);
        sid = r.sessionId;
    }

    FilePinStore reloaded(*ctx, path);
    TEST_ASSERT_TRUE(reloaded.load());
    PinManager manager(*ctx, reloaded, testConfig());

    TEST_ASSERT_EQUAL(AUTHZ_GRANTED, manager.authorizeOperation(sid, OP_MAINTENANCE_ENTER, "alice"));
    TEST_ASSERT_EQUAL(AUTH_OK, manager.validatePin("alice", "3456", PIN_MAINTENANCE).outcome);
    TEST_ASSERT_EQUAL(AUTH_FAILED, manager.validatePin("alice", "9999", PIN_MAINTENANCE).outcome);

    std::vector<PinSummary> pins;
    TEST_ASSERT_TRUE(manager.listUserPins("alice", pins));
    TEST_ASSERT_EQUAL(1, pins.size());
    TEST_ASSERT_EQUAL_STRING("Tech PIN", pins[0].description.c_str());
}

void test_lockout_survives_restart(void) {
    {
        FilePinStore store(*ctx, path);
        store.load();
        PinManager manager(*ctx, store, testConfig());
        std::string err;
        manager.setPin("alice", PIN_EMERGENCY, "1234", "", err);
        for (int i = 0; i < 3; i++) manager.validatePin("alice", "9999", PIN_EMERGENCY);
    }

    FilePinStore reloaded(*ctx, path);
    TEST_ASSERT_TRUE(reloaded.load());
    PinManager manager(*ctx, reloaded, testConfig());

    PinValidationResult r = manager.validatePin("alice", "1234", PIN_EMERGENCY);
    TEST_ASSERT_EQUAL(AUTH_LOCKED_OUT, r.outcome);
}

void test_admin_unlock_survives_restart(void) {
    {
        FilePinStore store(*ctx, path);
        store.load();
        PinManager manager(*ctx, store, testConfig());
        std::string err;
        manager.setPin("alice", PIN_EMERGENCY, "1234", "", err);
        for (int i = 0; i < 3; i++) manager.validatePin("alice", "9999", PIN_EMERGENCY);
        ctx->advanceSeconds(1);
        TEST_ASSERT_TRUE(manager.unlockUser("alice"));
    }

    ctx->advanceSeconds(1);
    FilePinStore reloaded(*ctx, path);
    TEST_ASSERT_TRUE(reloaded.load());
    PinManager manager(*ctx, reloaded, testConfig());
    TEST_ASSERT_EQUAL(AUTH_OK, manager.validatePin("alice", "1234", PIN_EMERGENCY).outcome);
}

// --- Write Failures ---

void test_unwritable_path_denies(void) {
    FilePinStore store(*ctx, "/nonexistent-dir/rvsafety/pins.json");
    TEST_ASSERT_TRUE(store.load());
    PinManager manager(*ctx, store, testConfig());

    std::string err;
    TEST_ASSERT_EQUAL(AUTH_INFRA_ERROR, manager.setPin("alice", PIN_EMERGENCY, "1234", "", err));
    TEST_ASSERT_TRUE(ctx->hasLogContaining("Cannot open PIN store for writing"));

    // The rejected PIN never becomes live
    std::vector<PinSummary> pins;
    TEST_ASSERT_TRUE(manager.listUserPins("alice", pins));
    TEST_ASSERT_EQUAL(0, pins.size());
}

void test_failed_rename_removes_temp_file(void) {
    // A directory in place of the snapshot makes the final rename fail
    TEST_ASSERT_EQUAL(0, mkdir(path.c_str(), 0700));
    FilePinStore store(*ctx, path);
    PinManager manager(*ctx, store, testConfig());

    std::string err;
    TEST_ASSERT_EQUAL(AUTH_INFRA_ERROR, manager.setPin("alice", PIN_EMERGENCY, "1234", "", err));
    TEST_ASSERT_TRUE(ctx->hasLogContaining("PIN store rename failed"));

    struct stat st;
    TEST_ASSERT_TRUE(stat((path + ".tmp").c_str(), &st) != 0);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_missing_file_starts_empty);
    RUN_TEST(test_corrupt_file_is_rejected);
    RUN_TEST(test_wrong_magic_is_rejected);

    RUN_TEST(test_pins_and_sessions_survive_restart);
    RUN_TEST(test_lockout_survives_restart);
    RUN_TEST(test_admin_unlock_survives_restart);

    RUN_TEST(test_unwritable_path_denies);
    RUN_TEST(test_failed_rename_removes_temp_file);

    return UNITY_END();
}
