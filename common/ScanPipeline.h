#ifndef SCAN_PIPELINE_H
#define SCAN_PIPELINE_H

#include <Arduino.h>
#include <vector>
#include "DeviceStateStore.h"
#include "DeviceTypes.h"
#include "EventSink.h"
#include "SignatureDeriver.h"
#include "Snapshot.h"

// ============================================================
// ScanPipeline
// One scan cycle end to end:
//   observe()/addEvent() -> flush() -> sink + store -> refresh()
//
// The batch side (observe, addEvent, flush) belongs to the scan task and
// the refresh side to the render loop. They only meet inside the
// SharedStateStore.
// ============================================================

class ScanPipeline {
public:
    explicit ScanPipeline(EventSink* sink = nullptr) : _sink(sink) {}

    void setSink(EventSink* sink) { _sink = sink; }

    // Resolves the observation and queues an event. Returns false when the
    // observation has neither a name nor manufacturer data.
    bool observe(const Observation& obs, int16_t rssi, TimestampMs atMs) {
        Signature signature;
        if (!deriveSignature(obs, signature)) return false;
        _pending.push_back(makeDiscoveryEvent(atMs, signature, rssi));
        return true;
    }

    void addEvent(const DiscoveryEvent& event) { _pending.push_back(event); }

    size_t pendingCount() const { return _pending.size(); }

    // Hands the queued batch to the sink and then to the store. Both see
    // the same list. Returns the sink's result; the store is updated
    // regardless.
    bool flush() {
        bool saved = true;
        if (_sink) saved = _sink->save(_pending);
        _store.discover(_pending);
        _pending.clear();
        return saved;
    }

    // Orders the current snapshot newest/loudest first and compares it to
    // the one taken by the previous refresh.
    std::vector<ComparedDevice> refresh(TimestampMs nowMs) {
        Snapshot current = _store.snapshot();
        std::vector<ComparedDevice> result =
            current.orderByAgeAndVolume().comparedTo(nowMs, _previous);
        _previous = current;
        return result;
    }

    size_t deviceCount() const { return _store.deviceCount(); }
    const SharedStateStore& store() const { return _store; }

private:
    EventSink*                  _sink;
    std::vector<DiscoveryEvent> _pending;
    SharedStateStore            _store;
    Snapshot                    _previous;
};

#endif
