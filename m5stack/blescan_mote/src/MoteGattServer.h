#ifndef MOTE_GATT_SERVER_H
#define MOTE_GATT_SERVER_H

#include <Arduino.h>
#include <NimBLEDevice.h>
#include "BlescanConfig.h"

/// NimBLE GATT server exposing the mote's compact device list as a single
/// READ | NOTIFY characteristic.
///
/// Usage:
///   MoteGattServer gatt;
///   gatt.initialize();                   // after NimBLEDevice::init()
///   gatt.publish(payload, len);          // whenever the list changes
///
/// The characteristic always holds the last payload passed to publish(),
/// so a failed serialization upstream leaves the previous list readable.
class MoteGattServer : public NimBLEServerCallbacks {
public:
    void initialize() {
        NimBLEDevice::setMTU(MOTE_REPORT_BUFFER_SIZE);

        _server = NimBLEDevice::createServer();
        _server->setCallbacks(this);

        NimBLEService* service = _server->createService(BLESCAN_MOTE_SERVICE_UUID);

        _devicesChar = service->createCharacteristic(
            BLESCAN_MOTE_DEVICES_CHAR_UUID,
            NIMBLE_PROPERTY::READ | NIMBLE_PROPERTY::NOTIFY
        );
        static const char EMPTY_REPORT[] = "{\"seq\":0,\"count\":0,\"devices\":[]}";
        _devicesChar->setValue((const uint8_t*)EMPTY_REPORT, sizeof(EMPTY_REPORT) - 1);

        service->start();

        NimBLEAdvertising* advertising = NimBLEDevice::getAdvertising();
        advertising->setName(BLESCAN_MOTE_DEVICE_NAME);
        advertising->addServiceUUID(service->getUUID());
        advertising->enableScanResponse(true);
        advertising->start();

        Serial.printf("[BLE] GATT server started, advertising as '%s'\n",
                      BLESCAN_MOTE_DEVICE_NAME);
        Serial.printf("[BLE] Service %s, devices characteristic %s\n",
                      BLESCAN_MOTE_SERVICE_UUID, BLESCAN_MOTE_DEVICES_CHAR_UUID);
    }

    /// Replace the characteristic value and notify a subscribed client.
    void publish(const char* data, size_t len) {
        if (_devicesChar == nullptr) return;
        _devicesChar->setValue((const uint8_t*)data, len);
        if (_connected) _devicesChar->notify();
    }

    bool isClientConnected() const { return _connected; }

    // -- NimBLEServerCallbacks --

    void onConnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo) override {
        _connected = true;
        Serial.printf("[BLE] Client connected: %s\n",
                      connInfo.getAddress().toString().c_str());
    }

    void onDisconnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo, int reason) override {
        _connected = false;
        Serial.printf("[BLE] Client disconnected (reason %d), restarting advertising\n",
                      reason);
        NimBLEDevice::getAdvertising()->start();
    }

private:
    NimBLEServer* _server = nullptr;
    NimBLECharacteristic* _devicesChar = nullptr;
    volatile bool _connected = false;
};

#endif
