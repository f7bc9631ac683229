#ifndef BLE_SCANNER_H
#define BLE_SCANNER_H

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <NimBLEScan.h>
#include <NimBLEAdvertisedDevice.h>
#include <sys/time.h>
#include "BlescanConfig.h"
#include "AdvertisementReader.h"
#include "ScanPipeline.h"
#include "MoteReader.h"

// Wall clock in ms since the epoch. Counts from 1970 until something sets
// the RTC, which still gives consistent ages within one run.
inline TimestampMs wallClockMs() {
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return (TimestampMs)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

/// Runs blocking scan cycles on its own FreeRTOS task and feeds each
/// cycle's sightings to the pipeline as one batch.
class BleScannerManager {
public:
    static const uint32_t TASK_STACK_SIZE = 12288;

    void initialize(ScanPipeline* pipeline) {
        _pipeline = pipeline;
        if (!NimBLEDevice::isInitialized()) {
            NimBLEDevice::init("");
        }
        _scan = NimBLEDevice::getScan();
        _scan->setActiveScan(true);
        _scan->setInterval(100);
        _scan->setWindow(99);
        if (_logging) Serial.println("[SCAN] Bluetooth scanner initialized");
    }

    void start() {
        xTaskCreatePinnedToCore(scanTask, "blescan", TASK_STACK_SIZE, this, 1,
                                nullptr, 0);
    }

    // Diagnostics share Serial with the JSON-lines sink; call before
    // initialize() to keep the record stream clean.
    void setLogging(bool enabled) {
        _logging = enabled;
        _moteReader.setLogging(enabled);
    }

    // Reading motes needs GATT connections between scans; off by default.
    void setMotePolling(bool enabled) { _motePolling = enabled; }

    uint32_t cycleCount() const { return _cycles; }
    uint32_t lastBatchSize() const { return _lastBatch; }
    bool lastSaveOk() const { return _lastSaveOk; }

private:
    ScanPipeline*  _pipeline = nullptr;
    NimBLEScan*    _scan = nullptr;
    MoteReader     _moteReader;
    volatile bool  _motePolling = false;
    bool           _logging = true;
    volatile uint32_t _cycles = 0;
    volatile uint32_t _lastBatch = 0;
    volatile bool  _lastSaveOk = true;
    uint32_t       _lastMotePollMs = 0;

    static void scanTask(void* arg) {
        BleScannerManager* self = static_cast<BleScannerManager*>(arg);
        for (;;) {
            self->runCycle();
        }
    }

    void runCycle() {
        NimBLEScanResults results = _scan->getResults(SCANNER_SCAN_DURATION_MS, false);
        TimestampMs scanTime = wallClockMs();

        const NimBLEAdvertisedDevice* motes[MoteReader::MAX_MOTES];
        uint8_t moteCount = 0;

        Observation obs;
        for (int i = 0; i < results.getCount(); i++) {
            const NimBLEAdvertisedDevice* device = results.getDevice(i);
            readObservation(device, obs);
            // Unresolvable observations are dropped here without comment.
            _pipeline->observe(obs, (int16_t)device->getRSSI(), scanTime);

            if (_motePolling && moteCount < MoteReader::MAX_MOTES &&
                MoteReader::isMote(device)) {
                motes[moteCount++] = device;
            }
        }

        uint32_t now = millis();
        if (moteCount > 0 && now - _lastMotePollMs >= SCANNER_MOTE_POLL_MS) {
            _lastMotePollMs = now;
            std::vector<DiscoveryEvent> moteEvents;
            for (uint8_t i = 0; i < moteCount; i++) {
                _moteReader.read(motes[i], scanTime, moteEvents);
            }
            for (size_t i = 0; i < moteEvents.size(); i++) {
                _pipeline->addEvent(moteEvents[i]);
            }
        }

        _lastBatch = _pipeline->pendingCount();
        _lastSaveOk = _pipeline->flush();
        _scan->clearResults();
        _cycles++;
    }
};

#endif
