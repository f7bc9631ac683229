#ifndef SIGNATURE_DERIVER_H
#define SIGNATURE_DERIVER_H

#include <Arduino.h>
#include "SignatureTypes.h"

// ============================================================
// FNV-1a 64-bit
// ============================================================

static const uint64_t FNV64_OFFSET_BASIS = 14695981039346656037ULL;
static const uint64_t FNV64_PRIME        = 1099511628211ULL;

inline uint64_t fnv1a64Update(uint64_t h, const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        h ^= (uint64_t)data[i];
        h *= FNV64_PRIME;
    }
    return h;
}

// Hash of the manufacturer table: for each company id in ascending
// numeric order, the id (little-endian) followed by its payload bytes.
// Insertion order of the table never reaches the hash.
inline uint64_t hashManufacturerData(const Observation& obs) {
    uint8_t order[MAX_MANUFACTURER_ENTRIES];
    uint8_t count = obs.manufacturerCount;
    if (count > MAX_MANUFACTURER_ENTRIES) count = MAX_MANUFACTURER_ENTRIES;
    for (uint8_t i = 0; i < count; i++) order[i] = i;

    // Insertion sort on company id; the table holds a handful of entries.
    for (uint8_t i = 1; i < count; i++) {
        uint8_t key = order[i];
        int8_t j = i - 1;
        while (j >= 0 &&
               obs.manufacturer[order[j]].companyId > obs.manufacturer[key].companyId) {
            order[j + 1] = order[j];
            j--;
        }
        order[j + 1] = key;
    }

    uint64_t h = FNV64_OFFSET_BASIS;
    for (uint8_t i = 0; i < count; i++) {
        const ManufacturerEntry& entry = obs.manufacturer[order[i]];
        uint8_t id[2] = { (uint8_t)(entry.companyId & 0xFF),
                          (uint8_t)(entry.companyId >> 8) };
        h = fnv1a64Update(h, id, sizeof(id));
        h = fnv1a64Update(h, entry.payload, entry.length);
    }
    return h;
}

// 16 lowercase hex digits, most significant first.
inline void formatAnonymousId(uint64_t h, char* buf, size_t bufSize) {
    snprintf(buf, bufSize, "%08lx%08lx",
             (unsigned long)(h >> 32), (unsigned long)(h & 0xFFFFFFFFUL));
}

// Resolves an observation to its signature. The local name wins over
// manufacturer data. Returns false when neither is present; such an
// observation cannot be correlated and the caller drops it.
inline bool deriveSignature(const Observation& obs, Signature& out) {
    if (obs.hasName) {
        out = namedSignature(obs.name);
        return true;
    }
    if (obs.manufacturerCount == 0) return false;

    char id[17];
    formatAnonymousId(hashManufacturerData(obs), id, sizeof(id));
    out = anonymousSignature(id);
    return true;
}

#endif
