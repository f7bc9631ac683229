#ifndef ADVERTISEMENT_READER_H
#define ADVERTISEMENT_READER_H

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <NimBLEAdvertisedDevice.h>
#include "SignatureTypes.h"

// Copies the fields signature derivation needs out of a NimBLE scan
// result: the local name, and every manufacturer-specific AD structure
// split into company id and payload.
inline void readObservation(const NimBLEAdvertisedDevice* device, Observation& obs) {
    obs.clear();
    if (device->haveName()) {
        obs.setName(device->getName().c_str());
    }
    if (device->haveManufacturerData()) {
        uint8_t count = device->getManufacturerDataCount();
        for (uint8_t i = 0; i < count; i++) {
            std::string raw = device->getManufacturerData(i);
            // Entries past the table or shorter than a company id are dropped.
            obs.setManufacturerDataRaw((const uint8_t*)raw.data(), raw.length());
        }
    }
}

#endif
