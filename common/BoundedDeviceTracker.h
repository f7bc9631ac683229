#ifndef BOUNDED_DEVICE_TRACKER_H
#define BOUNDED_DEVICE_TRACKER_H

#include <Arduino.h>
#include "BlescanConfig.h"
#include "SignatureDeriver.h"

// One tracked advertiser on the mote.
struct MoteDevice {
    Signature signature;
    int32_t   rssi;
    uint32_t  lastSeenMs;   // caller's monotonic clock
};

// ============================================================
// BoundedDeviceTracker
// Fixed slot table for memory-constrained deployments. At capacity the
// least-recently-seen entry makes room for a new signature. Every
// mutation bumps a wrapping sequence number so readers can tell whether
// anything changed since their last read.
// ============================================================

class BoundedDeviceTracker {
public:
    void initialize(uint8_t capacity = MOTE_CAPACITY) {
        if (capacity == 0) capacity = 1;
        if (capacity > MOTE_CAPACITY) capacity = MOTE_CAPACITY;
        _capacity = capacity;
        _count = 0;
        _sequence = 0;
        for (uint8_t i = 0; i < MOTE_CAPACITY; i++) {
            _used[i] = false;
        }
    }

    // Derives the signature and records the sighting. Observations
    // without a name or manufacturer data are ignored.
    void update(const Observation& obs, int32_t rssi, uint32_t nowMs) {
        Signature signature;
        if (!deriveSignature(obs, signature)) return;
        updateSignature(signature, rssi, nowMs);
    }

    void updateSignature(const Signature& signature, int32_t rssi, uint32_t nowMs) {
        int8_t slot = findSlot(signature);
        if (slot >= 0) {
            _slots[slot].rssi = rssi;
            _slots[slot].lastSeenMs = nowMs;
        } else {
            if (_count >= _capacity) evictOldest(nowMs);
            slot = findFreeSlot();
            _slots[slot].signature  = signature;
            _slots[slot].rssi       = rssi;
            _slots[slot].lastSeenMs = nowMs;
            _used[slot] = true;
            _count++;
        }
        _sequence++;
    }

    // Drops every entry not seen for more than maxAgeMs. One sequence
    // bump for the whole pass, none if nothing was removed.
    void pruneOld(uint32_t maxAgeMs, uint32_t nowMs) {
        uint8_t before = _count;
        for (uint8_t i = 0; i < MOTE_CAPACITY; i++) {
            if (_used[i] && elapsedMs(_slots[i].lastSeenMs, nowMs) > maxAgeMs) {
                _used[i] = false;
                _count--;
            }
        }
        if (_count != before) _sequence++;
    }

    // Copies up to maxOut entries into out[], strongest signal first.
    // Returns the number copied.
    uint8_t snapshotSorted(MoteDevice* out, uint8_t maxOut) const {
        uint8_t n = 0;
        for (uint8_t i = 0; i < MOTE_CAPACITY; i++) {
            if (!_used[i]) continue;
            // Insertion into the sorted prefix; equal rssi keeps slot order.
            int16_t j = n;
            while (j > 0 && out[j - 1].rssi < _slots[i].rssi) {
                if (j < maxOut) out[j] = out[j - 1];
                j--;
            }
            if (j < maxOut) out[j] = _slots[i];
            if (n < maxOut) n++;
        }
        return n;
    }

    uint8_t deviceCount() const { return _count; }
    uint8_t capacity() const { return _capacity; }
    uint32_t sequence() const { return _sequence; }

private:
    MoteDevice _slots[MOTE_CAPACITY];
    bool       _used[MOTE_CAPACITY] = {};
    uint8_t    _capacity = MOTE_CAPACITY;
    uint8_t    _count = 0;
    uint32_t   _sequence = 0;

    // Wrap-aware elapsed time. A sighting stamped after nowMs (the scan
    // callback sampled millis() later than the caller) counts as age 0.
    static uint32_t elapsedMs(uint32_t lastSeenMs, uint32_t nowMs) {
        if ((int32_t)(nowMs - lastSeenMs) <= 0) return 0;
        return nowMs - lastSeenMs;
    }

    int8_t findSlot(const Signature& signature) const {
        for (uint8_t i = 0; i < MOTE_CAPACITY; i++) {
            if (_used[i] && _slots[i].signature == signature) return i;
        }
        return -1;
    }

    uint8_t findFreeSlot() const {
        for (uint8_t i = 0; i < MOTE_CAPACITY; i++) {
            if (!_used[i]) return i;
        }
        return 0;
    }

    // Linear scan for the largest elapsed time; ties go to the first slot.
    void evictOldest(uint32_t nowMs) {
        int8_t oldest = -1;
        uint32_t oldestAge = 0;
        for (uint8_t i = 0; i < MOTE_CAPACITY; i++) {
            if (!_used[i]) continue;
            uint32_t age = elapsedMs(_slots[i].lastSeenMs, nowMs);
            if (oldest < 0 || age > oldestAge) {
                oldest = i;
                oldestAge = age;
            }
        }
        if (oldest >= 0) {
            _used[oldest] = false;
            _count--;
        }
    }
};

#endif
