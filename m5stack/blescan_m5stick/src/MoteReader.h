#ifndef MOTE_READER_H
#define MOTE_READER_H

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <vector>
#include "BlescanConfig.h"
#include "MoteReport.h"

/// GATT client side of the mote service. After each scan the scanner hands
/// over every result advertising the mote service; the reader connects
/// (reusing open connections), reads the devices characteristic and turns
/// the payload into DiscoveryEvents.
///
/// A payload whose sequence has not advanced since the last read from the
/// same mote carries no new sightings and is skipped.
class MoteReader {
public:
    static const uint8_t MAX_MOTES = 4;

    static bool isMote(const NimBLEAdvertisedDevice* device) {
        return device->isAdvertisingService(NimBLEUUID(BLESCAN_MOTE_SERVICE_UUID));
    }

    // Off while Serial carries JSON-lines records.
    void setLogging(bool enabled) { _logging = enabled; }

    // Returns the number of events appended.
    size_t read(const NimBLEAdvertisedDevice* device, TimestampMs scanTimeMs,
                std::vector<DiscoveryEvent>& events) {
        NimBLEClient* client = NimBLEDevice::getClientByPeerAddress(device->getAddress());
        if (client == nullptr) {
            client = NimBLEDevice::createClient();
            if (client == nullptr) {
                if (_logging) Serial.println("[MOTE] No client slot available");
                return 0;
            }
        }

        if (!client->isConnected()) {
            if (!client->connect(device)) {
                if (_logging) Serial.printf("[MOTE] Connect to %s failed, skipping\n",
                                            device->getAddress().toString().c_str());
                NimBLEDevice::deleteClient(client);
                return 0;
            }
            if (_logging) Serial.printf("[MOTE] Connected to %s\n",
                                        device->getAddress().toString().c_str());
        }

        NimBLERemoteService* service = client->getService(BLESCAN_MOTE_SERVICE_UUID);
        NimBLERemoteCharacteristic* chr = service
            ? service->getCharacteristic(BLESCAN_MOTE_DEVICES_CHAR_UUID)
            : nullptr;
        if (chr == nullptr || !chr->canRead()) {
            if (_logging) Serial.println("[MOTE] Devices characteristic not found, disconnecting");
            client->disconnect();
            return 0;
        }

        NimBLEAttValue value = chr->readValue();
        MoteReport report;
        if (!parseMoteReport((const char*)value.data(), value.length(), report)) {
            if (_logging) Serial.printf("[MOTE] Unparsable payload (%u bytes), skipping\n",
                                        (unsigned)value.length());
            return 0;
        }
        if (report.skipped > 0) {
            if (_logging) Serial.printf("[MOTE] Skipped %u malformed device entries\n",
                                        (unsigned)report.skipped);
        }

        int8_t slot = slotFor(device->getAddress());
        if (_seen[slot] && !sequenceAdvanced(report.seq, _lastSeq[slot])) return 0;
        _seen[slot] = true;
        _lastSeq[slot] = report.seq;

        return appendMoteEvents(report, scanTimeMs, events);
    }

private:
    NimBLEAddress _addresses[MAX_MOTES];
    uint32_t      _lastSeq[MAX_MOTES] = {};
    bool          _seen[MAX_MOTES] = {};
    uint8_t       _next = 0;
    bool          _logging = true;

    // Slot per mote address; the oldest slot is recycled when full.
    int8_t slotFor(const NimBLEAddress& address) {
        for (uint8_t i = 0; i < MAX_MOTES; i++) {
            if (_seen[i] && _addresses[i] == address) return i;
        }
        uint8_t slot = _next;
        _next = (_next + 1) % MAX_MOTES;
        _addresses[slot] = address;
        _seen[slot] = false;
        return slot;
    }
};

#endif
