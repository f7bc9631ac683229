#include "doctest.h"
#include "Snapshot.h"

// ============================================================
// Helpers
// ============================================================

static DeviceState state(TimestampMs at, const char* name, int16_t rssi) {
    DeviceState s;
    s.signature = namedSignature(name);
    s.lastSeenMs = at;
    s.rssi = rssi;
    return s;
}

static Snapshot snapshotOf(const DeviceState* states, size_t n) {
    return Snapshot(std::vector<DeviceState>(states, states + n));
}

// ============================================================
// Orderings
// ============================================================

TEST_CASE("Snapshot: orderByAgeOldestLast puts newest first") {
    const DeviceState initial[] = {
        state(1000, "1", -1), state(2000, "2", -1), state(3000, "3", -1),
    };
    const DeviceState expected[] = {
        state(3000, "3", -1), state(2000, "2", -1), state(1000, "1", -1),
    };
    CHECK(snapshotOf(initial, 3).orderByAgeOldestLast() == snapshotOf(expected, 3));
}

TEST_CASE("Snapshot: orderByAgeAndVolume sorts by age first") {
    const DeviceState initial[] = {
        state(1000, "1", -1), state(2000, "2", -1), state(3000, "3", -1),
    };
    Snapshot ordered = snapshotOf(initial, 3).orderByAgeAndVolume();
    REQUIRE(ordered.size() == 3);
    CHECK(ordered.states()[0].lastSeenMs == 3000);
    CHECK(ordered.states()[1].lastSeenMs == 2000);
    CHECK(ordered.states()[2].lastSeenMs == 1000);
}

TEST_CASE("Snapshot: orderByAgeAndVolume breaks ties loudest first") {
    const DeviceState initial[] = {
        state(3000, "c", -3), state(3000, "a", -1), state(3000, "b", -2),
    };
    Snapshot ordered = snapshotOf(initial, 3).orderByAgeAndVolume();
    REQUIRE(ordered.size() == 3);
    CHECK(ordered.states()[0].rssi == -1);
    CHECK(ordered.states()[1].rssi == -2);
    CHECK(ordered.states()[2].rssi == -3);
}

TEST_CASE("Snapshot: age outranks volume") {
    const DeviceState initial[] = {
        state(1000, "loud-old", -10), state(2000, "quiet-new", -90),
    };
    Snapshot ordered = snapshotOf(initial, 2).orderByAgeAndVolume();
    CHECK(ordered.states()[0].signature == namedSignature("quiet-new"));
}

TEST_CASE("Snapshot: full ties keep their input order") {
    const DeviceState initial[] = {
        state(1000, "first", -50), state(1000, "second", -50), state(1000, "third", -50),
    };
    Snapshot ordered = snapshotOf(initial, 3).orderByAgeAndVolume();
    CHECK(ordered == snapshotOf(initial, 3));
}

TEST_CASE("Snapshot: ordering leaves the source untouched") {
    const DeviceState initial[] = { state(1000, "1", -5), state(2000, "2", -1) };
    Snapshot source = snapshotOf(initial, 2);
    Snapshot ordered = source.orderByAgeAndVolume();
    CHECK(source == snapshotOf(initial, 2));
    CHECK(ordered != source);
}

// ============================================================
// comparedTo
// ============================================================

TEST_CASE("Snapshot: comparedTo computes relative age against now") {
    const DeviceState current[] = {
        state(1000, "1", -1), state(2000, "2", -1), state(3000, "3", -1),
    };
    std::vector<ComparedDevice> result =
        snapshotOf(current, 3).comparedTo(4000, Snapshot());
    REQUIRE(result.size() == 3);
    CHECK(result[0].comparison.relativeAgeMs == 3000);
    CHECK(result[1].comparison.relativeAgeMs == 2000);
    CHECK(result[2].comparison.relativeAgeMs == 1000);
    // preserves input order and carries the state
    CHECK(result[0].state == current[0]);
    CHECK(result[2].state == current[2]);
}

TEST_CASE("Snapshot: now before lastSeen gives a non-positive age") {
    const DeviceState current[] = { state(5000, "skewed", -40) };
    std::vector<ComparedDevice> result =
        snapshotOf(current, 1).comparedTo(3000, Snapshot());
    REQUIRE(result.size() == 1);
    CHECK(result[0].comparison.relativeAgeMs == -2000);

    result = snapshotOf(current, 1).comparedTo(5000, Snapshot());
    CHECK(result[0].comparison.relativeAgeMs == 0);
}

TEST_CASE("Snapshot: trend classification against previous snapshot") {
    const DeviceState previous[] = { state(1000, "A", -10) };
    Snapshot prev = snapshotOf(previous, 1);

    SUBCASE("louder and new") {
        const DeviceState current[] = { state(2000, "A", -5), state(2000, "B", -10) };
        std::vector<ComparedDevice> r = snapshotOf(current, 2).comparedTo(3000, prev);
        REQUIRE(r.size() == 2);
        CHECK(r[0].comparison.trend == RssiTrend::LOUDER);
        CHECK(r[1].comparison.trend == RssiTrend::NEW);
    }
    SUBCASE("quieter") {
        const DeviceState current[] = { state(2000, "A", -15), state(2000, "B", -10) };
        std::vector<ComparedDevice> r = snapshotOf(current, 2).comparedTo(3000, prev);
        CHECK(r[0].comparison.trend == RssiTrend::QUIETER);
        CHECK(r[1].comparison.trend == RssiTrend::NEW);
    }
    SUBCASE("same") {
        const DeviceState current[] = { state(2000, "A", -10), state(2000, "B", -10) };
        std::vector<ComparedDevice> r = snapshotOf(current, 2).comparedTo(3000, prev);
        CHECK(r[0].comparison.trend == RssiTrend::SAME);
        CHECK(r[1].comparison.trend == RssiTrend::NEW);
    }
}

TEST_CASE("Snapshot: trend matches by signature, not by kind or position") {
    DeviceState named = state(1000, "abc", -50);
    DeviceState anon = named;
    anon.signature = anonymousSignature("abc");
    anon.rssi = -20;

    const DeviceState previous[] = { anon };
    const DeviceState current[] = { named };
    std::vector<ComparedDevice> r =
        snapshotOf(current, 1).comparedTo(2000, snapshotOf(previous, 1));
    CHECK(r[0].comparison.trend == RssiTrend::NEW);
}

TEST_CASE("Snapshot: comparing against empty previous marks everything new") {
    const DeviceState current[] = { state(1000, "A", -1), state(1000, "B", -2) };
    std::vector<ComparedDevice> r = snapshotOf(current, 2).comparedTo(1000, Snapshot());
    for (size_t i = 0; i < r.size(); i++) {
        CHECK(r[i].comparison.trend == RssiTrend::NEW);
    }
}

TEST_CASE("Snapshot: empty current yields empty comparison") {
    const DeviceState previous[] = { state(1000, "A", -1) };
    std::vector<ComparedDevice> r = Snapshot().comparedTo(1000, snapshotOf(previous, 1));
    CHECK(r.empty());
}
