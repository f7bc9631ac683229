#ifndef EVENT_SINK_H
#define EVENT_SINK_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include <functional>
#include <vector>
#include "DeviceTypes.h"
#include "ReportFormat.h"

// Receives every event batch handed to the state store, unchanged.
// Returns false when the batch could not be recorded; the store is
// still updated by the caller.
class EventSink {
public:
    virtual ~EventSink() {}
    virtual bool save(const std::vector<DiscoveryEvent>& events) = 0;
    virtual void close() {}
};

class NoopEventSink : public EventSink {
public:
    bool save(const std::vector<DiscoveryEvent>&) override { return true; }
};

// Adds {"Named":"..."} / {"Anonymous":"..."} under key.
inline void writeSignatureJson(JsonObject parent, const char* key, const Signature& s) {
    JsonObject sig = parent.createNestedObject(key);
    sig[signatureKindName(s.kind)] = s.value;
}

/// One JSON object per event, newline terminated:
///   {"date_time":"1970-01-01T00:00:01Z","signature":{"Named":"x"},"rssi":-20}
///
/// The writer receives each complete line including the trailing '\n'
/// (Serial.write on the firmware, a string buffer in tests).
class JsonLinesEventSink : public EventSink {
public:
    typedef std::function<void(const char* data, size_t len)> LineWriter;

    // Worst case: every name byte escaped as \u00XX, plus the fixed fields.
    static const size_t LINE_BUFFER_SIZE = 6 * MAX_SIGNATURE_LEN + 80;

    explicit JsonLinesEventSink(LineWriter writer) : _writer(writer) {}

    bool save(const std::vector<DiscoveryEvent>& events) override {
        bool ok = true;
        for (size_t i = 0; i < events.size(); i++) {
            char line[LINE_BUFFER_SIZE];
            size_t len = 0;
            if (!encode(events[i], line, sizeof(line), len)) {
                ok = false;
                continue;
            }
            if (_writer) _writer(line, len);
        }
        return ok;
    }

    // Serializes one event into buf with a trailing newline. Fails if the
    // record would be truncated.
    static bool encode(const DiscoveryEvent& event, char* buf, size_t bufSize,
                       size_t& len) {
        char when[32];
        if (!formatIsoTimestamp(event.timestampMs, when, sizeof(when))) return false;

        StaticJsonDocument<256> doc;
        doc["date_time"] = when;
        writeSignatureJson(doc.as<JsonObject>(), "signature", event.signature);
        doc["rssi"] = event.rssi;
        if (doc.overflowed()) return false;

        // +1 byte for the newline
        len = serializeJson(doc, buf, bufSize - 1);
        if (len == 0 || len >= bufSize - 2) return false;
        buf[len++] = '\n';
        buf[len] = '\0';
        return true;
    }

private:
    LineWriter _writer;
};

#endif
