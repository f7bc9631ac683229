#ifndef BLESCAN_CONFIG_H
#define BLESCAN_CONFIG_H

#include <stdint.h>
#include <stddef.h>

// Mote GATT UUIDs. The scanner's mote reader uses the same values.
#define BLESCAN_MOTE_SERVICE_UUID       "12345678-1234-5678-1234-56789abcdef0"
#define BLESCAN_MOTE_DEVICES_CHAR_UUID  "12345678-1234-5678-1234-56789abcdef2"
#define BLESCAN_MOTE_DEVICE_NAME        "blescan-mote"

// Identity buffers
static const uint8_t  MAX_SIGNATURE_LEN         = 48;   // bytes, excluding NUL
static const uint8_t  MAX_MANUFACTURER_ENTRIES  = 4;
static const uint8_t  MAX_MANUFACTURER_PAYLOAD  = 64;

// Bounded tracker (mote)
static const uint8_t  MOTE_CAPACITY             = 20;
static const uint8_t  MOTE_REPORT_CAP           = 10;
static const uint32_t MOTE_MAX_DEVICE_AGE_MS    = 30000;
static const size_t   MOTE_REPORT_BUFFER_SIZE   = 512;  // ATT attribute value limit

// Mote radio timing
static const uint32_t MOTE_SCAN_DURATION_MS     = 800;
static const uint32_t MOTE_SCAN_CYCLE_DELAY_MS  = 200;
static const uint16_t MOTE_SCAN_INTERVAL_MS     = 62;
static const uint16_t MOTE_SCAN_WINDOW_MS       = 31;

// Scanner (display unit)
static const uint32_t SCANNER_SCAN_DURATION_MS  = 1000;
static const uint32_t SCANNER_LIST_REFRESH_MS   = 2000;
static const uint32_t SCANNER_MOTE_POLL_MS      = 5000;

#endif
