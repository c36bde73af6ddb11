/*
 * File: test/test_time_utils/test_time_utils.cpp
 * Description: Unit tests for the static TimeUtils class.
 * Verifies human-readable durations (d/h/min/s) and ISO-8601 UTC timestamps.
 */

#include <unity.h>
#include "TimeUtils.h"
#include <string.h>

void setUp(void) {}
void tearDown(void) {}

// --- Durations ---

void test_format_zero_seconds(void) {
    char buf[32];
    TimeUtils::formatSeconds(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0s", buf);
}

void test_format_seconds_only(void) {
    char buf[32];
    TimeUtils::formatSeconds(45, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("45s", buf);
}

void test_format_minutes_only(void) {
    char buf[32];
    // Lockout window
    TimeUtils::formatSeconds(900, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("15min", buf);
}

void test_format_hours_only(void) {
    char buf[32];
    TimeUtils::formatSeconds(7200, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2h", buf);
}

void test_format_days_only(void) {
    char buf[32];
    TimeUtils::formatSeconds(86400 * 3, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("3d", buf);
}

// --- Composites ---

void test_format_minutes_and_seconds(void) {
    char buf[32];
    TimeUtils::formatSeconds(125, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2min 5s", buf);
}

void test_format_skips_zero_units(void) {
    char buf[32];
    // 1d 0h 0min 7s
    TimeUtils::formatSeconds(86400 + 7, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1d 7s", buf);
}

void test_format_all_units(void) {
    char buf[48];
    TimeUtils::formatSeconds(2 * 86400 + 5 * 3600 + 10 * 60 + 7, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2d 5h 10min 7s", buf);
}

void test_format_no_trailing_space(void) {
    char buf[32];
    TimeUtils::formatSeconds(3600 + 60, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 1min", buf);
}

void test_format_truncates_safely(void) {
    char buf[6];
    TimeUtils::formatSeconds(2 * 86400 + 5 * 3600 + 10 * 60 + 7, buf, sizeof(buf));
    TEST_ASSERT_TRUE(strlen(buf) < sizeof(buf));
}

// --- ISO Timestamps ---

void test_iso_timestamp(void) {
    char buf[32];
    TimeUtils::formatIsoTimestamp(1750000000, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2025-06-15T15:06:40Z", buf);
}

void test_iso_timestamp_epoch_start(void) {
    char buf[32];
    TimeUtils::formatIsoTimestamp(86400, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1970-01-02T00:00:00Z", buf);
}

void test_iso_timestamp_unset_is_empty(void) {
    char buf[32] = "stale";
    TimeUtils::formatIsoTimestamp(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("", buf);
    TimeUtils::formatIsoTimestamp(-5, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("", buf);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_format_zero_seconds);
    RUN_TEST(test_format_seconds_only);
    RUN_TEST(test_format_minutes_only);
    RUN_TEST(test_format_hours_only);
    RUN_TEST(test_format_days_only);

    RUN_TEST(test_format_minutes_and_seconds);
    RUN_TEST(test_format_skips_zero_units);
    RUN_TEST(test_format_all_units);
    RUN_TEST(test_format_no_trailing_space);
    RUN_TEST(test_format_truncates_safely);

    RUN_TEST(test_iso_timestamp);
    RUN_TEST(test_iso_timestamp_epoch_start);
    RUN_TEST(test_iso_timestamp_unset_is_empty);

    return UNITY_END();
}
