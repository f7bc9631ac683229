#ifndef REPORT_FORMAT_H
#define REPORT_FORMAT_H

#include <Arduino.h>
#include <stdio.h>
#include <time.h>
#include "DeviceTypes.h"

// ISO-8601 UTC, e.g. "1970-01-01T00:00:01Z". Milliseconds are only
// printed when non-zero ("...:01.250Z"). Returns false if the instant
// cannot be broken down or the buffer is too small.
inline bool formatIsoTimestamp(TimestampMs ms, char* buf, size_t bufSize) {
    int64_t secs = ms / 1000;
    int64_t frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }
    time_t t = (time_t)secs;
    struct tm parts;
    if (gmtime_r(&t, &parts) == nullptr) return false;

    int n;
    if (frac == 0) {
        n = snprintf(buf, bufSize, "%04d-%02d-%02dT%02d:%02d:%02dZ",
                     parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
                     parts.tm_hour, parts.tm_min, parts.tm_sec);
    } else {
        n = snprintf(buf, bufSize, "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                     parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
                     parts.tm_hour, parts.tm_min, parts.tm_sec, (int)frac);
    }
    return n > 0 && (size_t)n < bufSize;
}

// Whole seconds, truncated toward zero: "0s", "42s", "1m 5s", "2h 0m 7s".
// Negative ages (clock skew) keep a leading '-'.
inline void formatAge(int64_t ms, char* buf, size_t bufSize) {
    const char* sign = "";
    int64_t secs = ms / 1000;
    if (secs < 0) {
        sign = "-";
        secs = -secs;
    }
    unsigned long h = (unsigned long)(secs / 3600);
    unsigned long m = (unsigned long)((secs % 3600) / 60);
    unsigned long s = (unsigned long)(secs % 60);
    if (h > 0) {
        snprintf(buf, bufSize, "%s%luh %lum %lus", sign, h, m, s);
    } else if (m > 0) {
        snprintf(buf, bufSize, "%s%lum %lus", sign, m, s);
    } else {
        snprintf(buf, bufSize, "%s%lus", sign, s);
    }
}

inline const char* trendSymbol(RssiTrend trend) {
    switch (trend) {
        case RssiTrend::LOUDER:  return "^";
        case RssiTrend::QUIETER: return "v";
        case RssiTrend::SAME:    return "=";
        case RssiTrend::NEW:     return "*";
    }
    return "?";
}

// One report row: label (name or id), age, rssi, trend.
inline void formatReportRow(const ComparedDevice& device, char* buf, size_t bufSize) {
    char age[24];
    formatAge(device.comparison.relativeAgeMs, age, sizeof(age));
    snprintf(buf, bufSize, "%-32s %8s %4d %6s",
             device.state.signature.value, age, (int)device.state.rssi,
             trendSymbol(device.comparison.trend));
}

#endif
