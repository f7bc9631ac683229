#include "doctest.h"
#include "ReportFormat.h"

// ============================================================
// formatIsoTimestamp
// ============================================================

TEST_CASE("formatIsoTimestamp: whole seconds omit the fraction") {
    char buf[32];
    REQUIRE(formatIsoTimestamp(0, buf, sizeof(buf)));
    CHECK(strcmp(buf, "1970-01-01T00:00:00Z") == 0);
    REQUIRE(formatIsoTimestamp(1000, buf, sizeof(buf)));
    CHECK(strcmp(buf, "1970-01-01T00:00:01Z") == 0);
}

TEST_CASE("formatIsoTimestamp: milliseconds when present") {
    char buf[32];
    REQUIRE(formatIsoTimestamp(1700000000123LL, buf, sizeof(buf)));
    CHECK(strcmp(buf, "2023-11-14T22:13:20.123Z") == 0);
}

TEST_CASE("formatIsoTimestamp: instants before the epoch") {
    char buf[32];
    REQUIRE(formatIsoTimestamp(-1, buf, sizeof(buf)));
    CHECK(strcmp(buf, "1969-12-31T23:59:59.999Z") == 0);
}

TEST_CASE("formatIsoTimestamp: buffer too small") {
    char buf[8];
    CHECK_FALSE(formatIsoTimestamp(1000, buf, sizeof(buf)));
}

// ============================================================
// formatAge
// ============================================================

TEST_CASE("formatAge: seconds minutes and hours") {
    char buf[24];
    formatAge(0, buf, sizeof(buf));
    CHECK(strcmp(buf, "0s") == 0);
    formatAge(999, buf, sizeof(buf));
    CHECK(strcmp(buf, "0s") == 0);
    formatAge(42000, buf, sizeof(buf));
    CHECK(strcmp(buf, "42s") == 0);
    formatAge(65000, buf, sizeof(buf));
    CHECK(strcmp(buf, "1m 5s") == 0);
    formatAge(3723000, buf, sizeof(buf));
    CHECK(strcmp(buf, "1h 2m 3s") == 0);
    formatAge(7207000, buf, sizeof(buf));
    CHECK(strcmp(buf, "2h 0m 7s") == 0);
}

TEST_CASE("formatAge: negative ages keep the sign") {
    char buf[24];
    formatAge(-5000, buf, sizeof(buf));
    CHECK(strcmp(buf, "-5s") == 0);
    formatAge(-500, buf, sizeof(buf));
    CHECK(strcmp(buf, "0s") == 0);
}

// ============================================================
// Rows
// ============================================================

TEST_CASE("trendSymbol: one symbol per trend") {
    CHECK(strcmp(trendSymbol(RssiTrend::LOUDER), "^") == 0);
    CHECK(strcmp(trendSymbol(RssiTrend::QUIETER), "v") == 0);
    CHECK(strcmp(trendSymbol(RssiTrend::SAME), "=") == 0);
    CHECK(strcmp(trendSymbol(RssiTrend::NEW), "*") == 0);
}

TEST_CASE("formatReportRow: label age rssi and trend columns") {
    ComparedDevice device;
    device.state.signature = namedSignature("Device 1");
    device.state.lastSeenMs = 0;
    device.state.rssi = -42;
    device.comparison.relativeAgeMs = 65000;
    device.comparison.trend = RssiTrend::LOUDER;

    char row[96];
    formatReportRow(device, row, sizeof(row));
    CHECK(strcmp(row, "Device 1                            1m 5s  -42      ^") == 0);
}
