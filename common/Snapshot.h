#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include <Arduino.h>
#include <algorithm>
#include <map>
#include <vector>
#include "DeviceTypes.h"

// ============================================================
// Snapshot
// Immutable, ordered copy of device states taken at one instant.
// Orderings return new snapshots; the source is never touched.
// ============================================================

class Snapshot {
public:
    Snapshot() {}
    explicit Snapshot(const std::vector<DeviceState>& states) : _states(states) {}

    const std::vector<DeviceState>& states() const { return _states; }
    size_t size() const { return _states.size(); }
    bool empty() const { return _states.empty(); }

    // Newest first.
    Snapshot orderByAgeOldestLast() const {
        std::vector<DeviceState> ordered(_states);
        std::stable_sort(ordered.begin(), ordered.end(), newerThan);
        return Snapshot(ordered);
    }

    // Newest first; equal lastSeenMs puts the louder device first.
    Snapshot orderByAgeAndVolume() const {
        std::vector<DeviceState> ordered(_states);
        std::stable_sort(ordered.begin(), ordered.end(), newerThenLouder);
        return Snapshot(ordered);
    }

    // One result per entry, in this snapshot's order. The trend is looked
    // up by signature in the previous snapshot; a signature absent there
    // is NEW.
    std::vector<ComparedDevice> comparedTo(TimestampMs nowMs,
                                           const Snapshot& previous) const {
        std::map<Signature, int16_t, SignatureLess> previousRssi;
        for (size_t i = 0; i < previous._states.size(); i++) {
            previousRssi[previous._states[i].signature] = previous._states[i].rssi;
        }

        std::vector<ComparedDevice> result;
        result.reserve(_states.size());
        for (size_t i = 0; i < _states.size(); i++) {
            ComparedDevice cd;
            cd.state = _states[i];
            cd.comparison.relativeAgeMs = nowMs - _states[i].lastSeenMs;

            std::map<Signature, int16_t, SignatureLess>::const_iterator it =
                previousRssi.find(_states[i].signature);
            if (it == previousRssi.end()) {
                cd.comparison.trend = RssiTrend::NEW;
            } else if (_states[i].rssi > it->second) {
                cd.comparison.trend = RssiTrend::LOUDER;
            } else if (_states[i].rssi < it->second) {
                cd.comparison.trend = RssiTrend::QUIETER;
            } else {
                cd.comparison.trend = RssiTrend::SAME;
            }
            result.push_back(cd);
        }
        return result;
    }

    bool operator==(const Snapshot& other) const { return _states == other._states; }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }

private:
    std::vector<DeviceState> _states;

    static bool newerThan(const DeviceState& a, const DeviceState& b) {
        return a.lastSeenMs > b.lastSeenMs;
    }

    static bool newerThenLouder(const DeviceState& a, const DeviceState& b) {
        if (a.lastSeenMs != b.lastSeenMs) return a.lastSeenMs > b.lastSeenMs;
        return a.rssi > b.rssi;
    }
};

#endif
