#ifndef DEVICE_TYPES_H
#define DEVICE_TYPES_H

#include <Arduino.h>
#include <stdint.h>
#include "SignatureTypes.h"

// UTC wall-clock instant, milliseconds since the Unix epoch.
typedef int64_t TimestampMs;

// One sighting handed over by a scanner each cycle. Signatures are
// already resolved; unresolvable observations never become events.
struct DiscoveryEvent {
    TimestampMs timestampMs;
    Signature   signature;
    int16_t     rssi;
};

inline DiscoveryEvent makeDiscoveryEvent(TimestampMs at, const Signature& signature,
                                         int16_t rssi) {
    DiscoveryEvent e;
    e.timestampMs = at;
    e.signature   = signature;
    e.rssi        = rssi;
    return e;
}

inline bool operator==(const DiscoveryEvent& a, const DiscoveryEvent& b) {
    return a.timestampMs == b.timestampMs && a.signature == b.signature &&
           a.rssi == b.rssi;
}

// Last-known state of one signature. lastSeenMs and rssi are overwritten
// on every sighting; nothing else changes after creation.
struct DeviceState {
    Signature   signature;
    TimestampMs lastSeenMs;
    int16_t     rssi;

    void update(const DiscoveryEvent& event) {
        lastSeenMs = event.timestampMs;
        rssi       = event.rssi;
    }
};

inline DeviceState deviceStateFromEvent(const DiscoveryEvent& event) {
    DeviceState s;
    s.signature  = event.signature;
    s.lastSeenMs = event.timestampMs;
    s.rssi       = event.rssi;
    return s;
}

inline bool operator==(const DeviceState& a, const DeviceState& b) {
    return a.signature == b.signature && a.lastSeenMs == b.lastSeenMs &&
           a.rssi == b.rssi;
}

inline bool operator!=(const DeviceState& a, const DeviceState& b) {
    return !(a == b);
}

// Signal change relative to the previous snapshot.
enum class RssiTrend : uint8_t {
    LOUDER,
    QUIETER,
    SAME,
    NEW,
};

// Derived per refresh, never stored. relativeAgeMs is negative when the
// reference time precedes lastSeenMs (clock skew).
struct Comparison {
    int64_t   relativeAgeMs;
    RssiTrend trend;
};

struct ComparedDevice {
    DeviceState state;
    Comparison  comparison;
};

#endif
