#pragma once

// Characteristic the cuff pushes its measurement record on (Blood Pressure Measurement, 0x2A35)
#define BP_CHARACTERISTIC_UUID "00002a35-0000-1000-8000-00805f9b34fb"

// Fixed record layout: flags, sys, dia, map, year, month, day, hour, minute, status, pulse, user
#define BP_MIN_PAYLOAD_LENGTH 17

// How long a session waits for the single measurement notification
#ifndef BP_NOTIFICATION_TIMEOUT_MS
#define BP_NOTIFICATION_TIMEOUT_MS 15000
#endif

// Minimum time between two active polls of the same cuff
#ifndef BP_POLL_INTERVAL_MS
#define BP_POLL_INTERVAL_MS 300000
#endif
#define BP_POLL_INTERVAL_MIN_MS 5000
#define BP_POLL_INTERVAL_MAX_MS 86400000

// Advertised name prefix used to recognise the cuff when no address is pinned.
// An empty string accepts every advertiser.
#ifndef BP_CUFF_NAME_PREFIX
#define BP_CUFF_NAME_PREFIX "BPM"
#endif

#define BP_MANUFACTURER "Silvercrest"
#define BP_MODEL "Blood Pressure Measurement"

// Scan duty cycle (0.625 ms units) while hunting for the cuff
#define BP_SCAN_INTERVAL 160
#define BP_SCAN_WINDOW 80

// Gateway GATT service relaying readings to the phone
#define GATEWAY_NAME "silverbp-gateway"
#define SERVICE_UUID "7B5D0001-3C2E-4F6A-9D1B-2E8C4A6F1B30"
#define CHAR_RX_UUID "7B5D0002-3C2E-4F6A-9D1B-2E8C4A6F1B30"
#define CHAR_TX_UUID "7B5D0003-3C2E-4F6A-9D1B-2E8C4A6F1B30"
#define CHAR_INFO_UUID "7B5D0004-3C2E-4F6A-9D1B-2E8C4A6F1B30"
