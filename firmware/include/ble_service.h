/**
 * Pullcell - BLE Service Module
 * NimBLE GATT server speaking the Progressor protocol
 */

#ifndef BLE_SERVICE_H
#define BLE_SERVICE_H

#include "config.h"

#if ENABLE_BLE

#include <Arduino.h>
#include "protocol.h"

// BLE UUIDs (Tindeq Progressor service)
#define PROGRESSOR_SERVICE_UUID         "7e4e1701-1ea6-40c9-9dcc-13d34ffead57"
#define PROGRESSOR_DATA_UUID            "7e4e1702-1ea6-40c9-9dcc-13d34ffead57"
#define PROGRESSOR_CONTROL_UUID         "7e4e1703-1ea6-40c9-9dcc-13d34ffead57"

// BLE advertising parameters
#define BLE_ADV_INTERVAL_MS             100     // Fast discovery, device is mains/USB or briefly on battery
#define BLE_TX_POWER_DBM                0

// BLE MTU configuration
#define BLE_MTU_SIZE                    64      // Largest frame is 14 bytes

// Public API

/**
 * Initialize BLE service
 * Sets up NimBLE server, Progressor service and starts advertising
 * @return true if initialization successful
 */
bool bleInit();

/**
 * Update BLE service (call from main loop)
 * Forwards latched disconnects and queued control writes to the protocol engine
 * @param protocol Engine that owns the session
 */
void bleUpdate(ProtocolEngine& protocol);

/**
 * Check if BLE is connected
 * @return true if a peer is connected
 */
bool bleIsConnected();

/**
 * Transport for the protocol engine (data characteristic notifications)
 */
Transport& bleGetTransport();

/**
 * Device id reported by GetProgressorID (48-bit MAC)
 */
uint64_t bleGetDeviceId();

/**
 * Get device MAC address suffix for advertising name
 * @return Last 4 hex digits of MAC (e.g., "A3F2")
 */
String bleGetDeviceSuffix();

// Control writes dropped because the frame queue was full
uint32_t bleGetDroppedFrames();

#endif // ENABLE_BLE

#endif // BLE_SERVICE_H
