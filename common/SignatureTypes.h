#ifndef SIGNATURE_TYPES_H
#define SIGNATURE_TYPES_H

#include <Arduino.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include "BlescanConfig.h"

// ============================================================
// Signature
// Stable identity of an advertiser. Closed two-variant tagged union:
// a NAMED signature carries the advertised local name, an ANONYMOUS
// one carries the hex id derived from manufacturer data.
// ============================================================

enum class SignatureKind : uint8_t {
    NAMED,
    ANONYMOUS,
};

struct Signature {
    SignatureKind kind;
    char          value[MAX_SIGNATURE_LEN + 1];
};

inline Signature makeSignature(SignatureKind kind, const char* value) {
    Signature s;
    memset(&s, 0, sizeof(s));
    s.kind = kind;
    strncpy(s.value, value, MAX_SIGNATURE_LEN);
    return s;
}

inline Signature namedSignature(const char* name) {
    return makeSignature(SignatureKind::NAMED, name);
}

inline Signature anonymousSignature(const char* id) {
    return makeSignature(SignatureKind::ANONYMOUS, id);
}

inline const char* signatureKindName(SignatureKind kind) {
    switch (kind) {
        case SignatureKind::NAMED:     return "Named";
        case SignatureKind::ANONYMOUS: return "Anonymous";
    }
    return "Anonymous";
}

// Parses the tag used in JSON payloads. Returns false for unknown tags.
inline bool signatureKindFromName(const char* name, SignatureKind& out) {
    if (strcmp(name, "Named") == 0) {
        out = SignatureKind::NAMED;
        return true;
    }
    if (strcmp(name, "Anonymous") == 0) {
        out = SignatureKind::ANONYMOUS;
        return true;
    }
    return false;
}

// "Named:<name>" / "Anonymous:<id>". Truncates to bufSize.
inline void normalisedSignature(const Signature& s, char* buf, size_t bufSize) {
    snprintf(buf, bufSize, "%s:%s", signatureKindName(s.kind), s.value);
}

// Total order over the normalised form. Every ANONYMOUS tag sorts before
// every NAMED tag ('A' < 'N'), so comparing the kind first and then the
// value bytes gives the same result as comparing the normalised strings.
inline int compareSignatures(const Signature& a, const Signature& b) {
    if (a.kind != b.kind) {
        return a.kind == SignatureKind::ANONYMOUS ? -1 : 1;
    }
    return strcmp(a.value, b.value);
}

inline bool operator==(const Signature& a, const Signature& b) {
    return a.kind == b.kind && strcmp(a.value, b.value) == 0;
}

inline bool operator!=(const Signature& a, const Signature& b) {
    return !(a == b);
}

struct SignatureLess {
    bool operator()(const Signature& a, const Signature& b) const {
        return compareSignatures(a, b) < 0;
    }
};

// ============================================================
// Observation
// One advertisement as seen by the radio: optional local name plus
// vendor payloads keyed by 16-bit company id. Fixed size, no heap.
// ============================================================

struct ManufacturerEntry {
    uint16_t companyId;
    uint8_t  length;
    uint8_t  payload[MAX_MANUFACTURER_PAYLOAD];
};

struct Observation {
    bool              hasName;
    char              name[MAX_SIGNATURE_LEN + 1];
    uint8_t           manufacturerCount;
    ManufacturerEntry manufacturer[MAX_MANUFACTURER_ENTRIES];

    void clear() {
        memset(this, 0, sizeof(*this));
    }

    void setName(const char* localName) {
        memset(name, 0, sizeof(name));
        strncpy(name, localName, MAX_SIGNATURE_LEN);
        hasName = true;
    }

    // Map semantics: an existing company id has its payload replaced.
    // Returns false when the entry table is full.
    bool setManufacturerData(uint16_t companyId, const uint8_t* data, size_t len) {
        ManufacturerEntry* entry = nullptr;
        for (uint8_t i = 0; i < manufacturerCount; i++) {
            if (manufacturer[i].companyId == companyId) {
                entry = &manufacturer[i];
                break;
            }
        }
        if (entry == nullptr) {
            if (manufacturerCount >= MAX_MANUFACTURER_ENTRIES) return false;
            entry = &manufacturer[manufacturerCount++];
            entry->companyId = companyId;
        }
        if (len > MAX_MANUFACTURER_PAYLOAD) len = MAX_MANUFACTURER_PAYLOAD;
        entry->length = (uint8_t)len;
        if (len > 0) memcpy(entry->payload, data, len);
        return true;
    }

    // Raw AD structure contents: company id little-endian in the first two
    // bytes, vendor payload after. Shorter blobs are ignored.
    bool setManufacturerDataRaw(const uint8_t* raw, size_t len) {
        if (len < 2) return false;
        uint16_t companyId = (uint16_t)(raw[0] | (raw[1] << 8));
        return setManufacturerData(companyId, raw + 2, len - 2);
    }
};

// ============================================================
// Sequence counters wrap; compare by signed distance, never by <.
// ============================================================

inline bool sequenceAdvanced(uint32_t current, uint32_t last) {
    return (int32_t)(current - last) > 0;
}

#endif
