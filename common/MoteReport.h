#ifndef MOTE_REPORT_H
#define MOTE_REPORT_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include <vector>
#include "BlescanConfig.h"
#include "BoundedDeviceTracker.h"
#include "DeviceTypes.h"
#include "EventSink.h"

// Compact device list exposed by the mote as a GATT characteristic:
//   {"seq":7,"count":14,"devices":[{"signature":{"Named":"x"},"rssi":-40},...]}
// devices holds at most MOTE_REPORT_CAP strongest entries, fewer when
// they would not fit the buffer; count is the tracker's full size and may
// exceed devices.length.

struct MoteReportResult {
    bool        ok;
    size_t      length;
    const char* error;
};

// Sized for MOTE_REPORT_CAP devices on 64-bit hosts as well as the ESP32.
// Parsing copies every string, hence the larger reader document.
typedef StaticJsonDocument<3072> MoteReportWriterDocument;
typedef StaticJsonDocument<4096> MoteReportReaderDocument;

inline MoteReportResult serializeMoteReport(const BoundedDeviceTracker& tracker,
                                            char* buf, size_t bufSize) {
    MoteReportResult r = { false, 0, nullptr };

    MoteDevice devices[MOTE_REPORT_CAP];
    uint8_t n = tracker.snapshotSorted(devices, MOTE_REPORT_CAP);

    MoteReportWriterDocument doc;
    doc["seq"] = tracker.sequence();
    doc["count"] = tracker.deviceCount();
    JsonArray list = doc.createNestedArray("devices");
    for (uint8_t i = 0; i < n; i++) {
        JsonObject entry = list.createNestedObject();
        writeSignatureJson(entry, "signature", devices[i].signature);
        entry["rssi"] = devices[i].rssi;
    }
    if (doc.overflowed()) {
        r.error = "document overflow";
        return r;
    }

    // Long names or ids can push a full list past the buffer. The weakest
    // entries go first; count still reports the tracker's full size.
    size_t needed = measureJson(doc);
    while (needed >= bufSize && list.size() > 0) {
        list.remove(list.size() - 1);
        needed = measureJson(doc);
    }
    if (needed >= bufSize) {
        r.error = "payload exceeds buffer";
        return r;
    }
    r.length = serializeJson(doc, buf, bufSize);
    r.ok = true;
    return r;
}

// Consumer side of the payload.
struct MoteReport {
    uint32_t   seq;
    uint32_t   count;
    uint8_t    deviceCount;
    uint8_t    skipped;         // malformed device entries
    MoteDevice devices[MOTE_REPORT_CAP];
};

inline bool readSignatureJson(JsonObjectConst obj, Signature& out) {
    if (obj.isNull() || obj.size() != 1) return false;
    JsonObjectConst::iterator it = obj.begin();
    SignatureKind kind;
    if (!signatureKindFromName(it->key().c_str(), kind)) return false;
    const char* value = it->value().as<const char*>();
    if (value == nullptr) return false;
    out = makeSignature(kind, value);
    return true;
}

// Parses a payload read from a mote. Returns false when the payload is not
// JSON or lacks a devices array. Malformed entries are skipped; devices
// beyond MOTE_REPORT_CAP are ignored. lastSeenMs is left at zero.
inline bool parseMoteReport(const char* json, size_t len, MoteReport& out) {
    memset(&out, 0, sizeof(out));

    MoteReportReaderDocument doc;
    DeserializationError err = deserializeJson(doc, json, len);
    if (err) return false;

    JsonArrayConst devices = doc["devices"].as<JsonArrayConst>();
    if (devices.isNull()) return false;

    out.seq = doc["seq"] | 0u;
    out.count = doc["count"] | 0u;
    for (JsonVariantConst v : devices) {
        if (out.deviceCount >= MOTE_REPORT_CAP) break;
        JsonObjectConst entry = v.as<JsonObjectConst>();
        Signature signature;
        if (entry.isNull() || !entry["rssi"].is<int32_t>() ||
            !readSignatureJson(entry["signature"].as<JsonObjectConst>(), signature)) {
            out.skipped++;
            continue;
        }
        MoteDevice& d = out.devices[out.deviceCount++];
        d.signature = signature;
        d.rssi = entry["rssi"].as<int32_t>();
        d.lastSeenMs = 0;
    }
    return true;
}

inline int16_t clampRssi(int32_t rssi) {
    if (rssi > INT16_MAX) return INT16_MAX;
    if (rssi < INT16_MIN) return INT16_MIN;
    return (int16_t)rssi;
}

// Appends one DiscoveryEvent per reported device, stamped with the time the
// payload was read. Returns the number appended.
inline size_t appendMoteEvents(const MoteReport& report, TimestampMs scanTimeMs,
                               std::vector<DiscoveryEvent>& events) {
    for (uint8_t i = 0; i < report.deviceCount; i++) {
        events.push_back(makeDiscoveryEvent(scanTimeMs, report.devices[i].signature,
                                            clampRssi(report.devices[i].rssi)));
    }
    return report.deviceCount;
}

#endif
