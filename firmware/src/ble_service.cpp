/**
 * Pullcell - BLE Service Implementation
 * NimBLE GATT server speaking the Progressor protocol
 */

#include "config.h"

#if ENABLE_BLE

#include "ble_service.h"
#include <NimBLEDevice.h>
#include <esp_mac.h>
#include "control_queue.h"
#include "pullcell.h"

// NimBLE objects
static NimBLEServer* pServer = nullptr;
static NimBLEService* pProgressorService = nullptr;
static NimBLEAdvertising* pAdvertising = nullptr;
static NimBLECharacteristic* pDataChar = nullptr;
static NimBLECharacteristic* pControlChar = nullptr;

// Connection state (written from the NimBLE host task)
static volatile bool isConnected = false;
static volatile uint16_t connHandle = 0;

// Control writes and disconnects waiting for the main loop
static ControlFrameQueue g_control;

// Result of the notify() in progress, set from onStatus()
static SendResult g_notify_result = SEND_OK;

#define BLE_DEBUG(x) DEBUG_PRINTF(g_debug_ble, "[BLE] %s\n", x)
#define BLE_DEBUG_F(fmt, ...) DEBUG_PRINTF(g_debug_ble, "[BLE] " fmt "\n", ##__VA_ARGS__)

// Control characteristic callbacks
class ControlCallbacks : public NimBLECharacteristicCallbacks {
    void onWrite(NimBLECharacteristic* pCharacteristic) {
        std::string value = pCharacteristic->getValue();

        if (value.length() > CONTROL_FRAME_MAX_SIZE) {
            BLE_DEBUG_F("Control write too long: %d bytes", (int)value.length());
        }
        if (!g_control.onWrite((const uint8_t*)value.data(), value.length())) {
            BLE_DEBUG("Control queue full - write dropped");
            return;
        }
        BLE_DEBUG_F("Control write: %d bytes, opcode 0x%02X",
                    (int)value.length(), value.length() > 0 ? (uint8_t)value[0] : 0);
    }
};

// Data characteristic callbacks
class DataCallbacks : public NimBLECharacteristicCallbacks {
    void onSubscribe(NimBLECharacteristic* pCharacteristic, ble_gap_conn_desc* desc, uint16_t subValue) {
        BLE_DEBUG_F("Data subscription: %u", (unsigned)subValue);
    }

    // Called from inside notify() once per subscribed client
    void onStatus(NimBLECharacteristic* pCharacteristic, Status s, int code) {
        switch (s) {
            case SUCCESS_NOTIFY:
                break;
            case ERROR_GATT:
                // Out of mbufs / controller queue full
                g_notify_result = SEND_BUSY;
                break;
            case ERROR_NO_CLIENT:
            case ERROR_NOTIFY_DISABLED:
                if (g_notify_result == SEND_OK) {
                    g_notify_result = SEND_NOT_CONNECTED;
                }
                break;
            default:
                BLE_DEBUG_F("Notify status %d (rc=%d)", (int)s, code);
                break;
        }
    }
};

// Server callbacks
class PullcellServerCallbacks : public NimBLEServerCallbacks {
    void onConnect(NimBLEServer* pServer, ble_gap_conn_desc* desc) {
        BLE_DEBUG("Client connected");
        connHandle = desc->conn_handle;
        isConnected = true;
    }

    void onDisconnect(NimBLEServer* pServer) {
        BLE_DEBUG("Client disconnected");
        isConnected = false;
        g_control.onDisconnect();

        // Restart advertising for next connection
        pAdvertising->start();
    }
};

// Transport adapter over the data characteristic
class BleTransport : public Transport {
public:
    SendResult sendNotification(const uint8_t* data, size_t length) {
        if (!isConnected || pDataChar == nullptr) {
            return SEND_NOT_CONNECTED;
        }
        g_notify_result = SEND_OK;
        pDataChar->setValue(data, length);
        pDataChar->notify();
        return g_notify_result;
    }

    void disconnect() {
        if (isConnected) {
            BLE_DEBUG("Disconnect requested");
            int rc = pServer->disconnect(connHandle);
            if (rc != 0) {
                Serial.printf("BLE: disconnect failed (rc=%d)\n", rc);
            }
        }
    }
};

static BleTransport g_transport;

// Get device MAC address for unique naming
String bleGetDeviceSuffix() {
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_BT);
    char suffix[5];
    snprintf(suffix, sizeof(suffix), "%02X%02X", mac[4], mac[5]);
    return String(suffix);
}

uint64_t bleGetDeviceId() {
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_BT);
    uint64_t id = 0;
    for (int i = 0; i < 6; i++) {
        id = (id << 8) | mac[i];
    }
    return id;
}

// Initialize BLE service
bool bleInit() {
    BLE_DEBUG("Initializing BLE service...");

    String deviceName = BLE_DEVICE_NAME_PREFIX + bleGetDeviceSuffix();
    BLE_DEBUG_F("Device name: %s", deviceName.c_str());

    NimBLEDevice::init(deviceName.c_str());
    NimBLEDevice::setPower(ESP_PWR_LVL_N0);
    NimBLEDevice::setMTU(BLE_MTU_SIZE);

    pServer = NimBLEDevice::createServer();
    if (pServer == nullptr) {
        Serial.println("BLE: ERROR - server creation failed");
        return false;
    }
    pServer->setCallbacks(new PullcellServerCallbacks());

    pProgressorService = pServer->createService(PROGRESSOR_SERVICE_UUID);

    pDataChar = pProgressorService->createCharacteristic(
        PROGRESSOR_DATA_UUID,
        NIMBLE_PROPERTY::READ | NIMBLE_PROPERTY::NOTIFY
    );
    pDataChar->setCallbacks(new DataCallbacks());

    pControlChar = pProgressorService->createCharacteristic(
        PROGRESSOR_CONTROL_UUID,
        NIMBLE_PROPERTY::WRITE | NIMBLE_PROPERTY::WRITE_NR
    );
    pControlChar->setCallbacks(new ControlCallbacks());

    pProgressorService->start();

    pAdvertising = NimBLEDevice::getAdvertising();
    pAdvertising->addServiceUUID(PROGRESSOR_SERVICE_UUID);
    pAdvertising->setScanResponse(true);
    pAdvertising->setMinInterval(BLE_ADV_INTERVAL_MS * 1000 / 625);  // 0.625ms units
    pAdvertising->setMaxInterval(BLE_ADV_INTERVAL_MS * 1000 / 625);

    if (!pAdvertising->start()) {
        Serial.println("BLE: ERROR - advertising failed to start");
        return false;
    }

    Serial.printf("BLE: advertising as %s\n", deviceName.c_str());
    return true;
}

bool bleIsConnected() {
    return isConnected;
}

Transport& bleGetTransport() {
    return g_transport;
}

uint32_t bleGetDroppedFrames() {
    return g_control.droppedFrames();
}

// Update BLE service (call from main loop)
void bleUpdate(ProtocolEngine& protocol) {
    g_control.dispatch(protocol);
}

#endif // ENABLE_BLE
