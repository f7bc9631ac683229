#ifndef DEVICE_STATE_STORE_H
#define DEVICE_STATE_STORE_H

#include <Arduino.h>
#include <map>
#include <mutex>
#include <vector>
#include "DeviceTypes.h"
#include "Snapshot.h"

// ============================================================
// DeviceStateStore
// Unbounded signature -> last-known state map. Entries are created on
// first sighting and overwritten in place afterwards (last write wins).
// Nothing is ever removed. Not thread-safe; see SharedStateStore.
// ============================================================

class DeviceStateStore {
public:
    void discover(const std::vector<DiscoveryEvent>& events) {
        for (size_t i = 0; i < events.size(); i++) {
            const DiscoveryEvent& event = events[i];
            StateMap::iterator it = _states.find(event.signature);
            if (it == _states.end()) {
                _states.insert(std::make_pair(event.signature,
                                              deviceStateFromEvent(event)));
            } else {
                it->second.update(event);
            }
        }
    }

    // Ordered by signature, independent of insertion order.
    Snapshot snapshot() const {
        std::vector<DeviceState> states;
        states.reserve(_states.size());
        for (StateMap::const_iterator it = _states.begin(); it != _states.end(); ++it) {
            states.push_back(it->second);
        }
        return Snapshot(states);
    }

    size_t deviceCount() const { return _states.size(); }

private:
    typedef std::map<Signature, DeviceState, SignatureLess> StateMap;
    StateMap _states;
};

// ============================================================
// SharedStateStore
// One lock around the whole store, held for each discover() or
// snapshot(). Lets a scan task and a render loop share the state.
// ============================================================

class SharedStateStore {
public:
    void discover(const std::vector<DiscoveryEvent>& events) {
        std::lock_guard<std::mutex> lock(_mutex);
        _store.discover(events);
    }

    Snapshot snapshot() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _store.snapshot();
    }

    size_t deviceCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _store.deviceCount();
    }

private:
    mutable std::mutex _mutex;
    DeviceStateStore   _store;
};

#endif
