/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/TimeUtils.h
 *
 * Description:
 * Static helpers for human-readable durations (lockout messages, diagnostics)
 * and ISO-8601 UTC timestamps (audit details, status JSON).
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <time.h>

class TimeUtils {
public:
    /**
     * Formats seconds into a compact duration string (e.g., "2d 5h 10min 7s").
     * Units with 0 values are omitted unless the total time is 0s.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        if (totalSeconds == 0) {
            snprintf(buffer, size, "0s");
            return;
        }

        const unsigned long SECS_MIN  = 60;
        const unsigned long SECS_HOUR = 3600;
        const unsigned long SECS_DAY  = 86400;

        unsigned long rem = totalSeconds;

        unsigned long d = rem / SECS_DAY;
        rem %= SECS_DAY;

        unsigned long h = rem / SECS_HOUR;
        rem %= SECS_HOUR;

        unsigned long m = rem / SECS_MIN;
        unsigned long s = rem % SECS_MIN;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                int n = snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
                if (n > 0) offset += (size_t)n;
            }
        };

        append(d, "d");
        append(h, "h");
        append(m, "min");

        if (s > 0 || offset == 0) {
            if (offset < size) {
                snprintf(buffer + offset, size - offset, "%lus", s);
            }
        } else if (offset < size && offset > 0 && buffer[offset - 1] == ' ') {
            buffer[offset - 1] = '\0';
        } else if (offset >= size) {
            buffer[size - 1] = '\0';
        }
    }

    /**
     * Formats epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
     * A zero timestamp renders as an empty string.
     */
    static void formatIsoTimestamp(int64_t epochSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        buffer[0] = '\0';
        if (epochSeconds <= 0) return;

        time_t t = (time_t)epochSeconds;
        struct tm utc;
        if (gmtime_r(&t, &utc) == nullptr) return;
        strftime(buffer, size, "%Y-%m-%dT%H:%M:%SZ", &utc);
    }
};
