/**
 * Pullcell - Force Sensor Firmware
 * Main entry point
 */

#include <Arduino.h>
#include <Wire.h>
#include <Adafruit_NAU7802.h>
#include <nvs_flash.h>
#include "pullcell.h"
#include "config.h"

#include "median_filter.h"
#include "calibration_store.h"
#include "calibration.h"
#include "flash_partition.h"
#include "protocol.h"
#include "weight.h"
#include "sampler.h"
#include "storage.h"

// Serial commands (conditional)
#if ENABLE_SERIAL_COMMANDS
#include "serial_commands.h"
#endif

// BLE service (conditional)
#if ENABLE_BLE
#include "ble_service.h"
#else
// Without BLE nothing is ever connected
class NullTransport : public Transport {
public:
    SendResult sendNotification(const uint8_t* data, size_t length) { return SEND_NOT_CONNECTED; }
    void disconnect() {}
};
static NullTransport g_null_transport;
#endif

Adafruit_NAU7802 nau;
bool nauReady = false;

// Measurement chain
static SampleChannel g_channel;
static MedianFilter g_filter(MEDIAN_WINDOW_SIZE);
static PartitionFlash g_flash;
static CalibrationStore g_store(g_flash);
static CalibrationEngine g_calibration(g_filter, g_store);

// Created in setup() once the transport exists
static ProtocolEngine* g_protocol = nullptr;
static WeightPipeline* g_pipeline = nullptr;

static unsigned long g_last_battery_check = 0;

uint32_t getBatteryMillivolts() {
    uint32_t mv = analogReadMilliVolts(PIN_VBAT);
    mv *= 2;    // Voltage divider, multiply back
    return mv;
}

static void checkBattery() {
    uint32_t mv = getBatteryMillivolts();
    bool low = mv >= BATTERY_ABSENT_MV && mv < BATTERY_LOW_MV;
    if (low && !g_protocol->batteryLow()) {
        Serial.printf("Battery: LOW (%lu mV)\n", (unsigned long)mv);
    }
    g_protocol->setBattery(mv, low);
    DEBUG_PRINTF(g_debug_weight, "Battery: %lu mV\n", (unsigned long)mv);
}

void setup() {
    Serial.begin(115200);
    delay(1000);

    // Initialize LED
    pinMode(PIN_LED, OUTPUT);
    digitalWrite(PIN_LED, LOW);

    Serial.println("=================================");
#if defined(BOARD_ADAFRUIT_FEATHER)
    Serial.printf("Pullcell v%d.%d.%d | Adafruit ESP32 Feather V2\n",
                  PULLCELL_VERSION_MAJOR, PULLCELL_VERSION_MINOR, PULLCELL_VERSION_PATCH);
#elif defined(BOARD_SPARKFUN_QWIIC)
    Serial.printf("Pullcell v%d.%d.%d | SparkFun ESP32-C6 Qwiic Pocket\n",
                  PULLCELL_VERSION_MAJOR, PULLCELL_VERSION_MINOR, PULLCELL_VERSION_PATCH);
#endif
    Serial.println("=================================");

    // Initialize NVS (Preferences and BLE both need it)
    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        Serial.println("NVS: Erasing and reinitializing...");
        ret = nvs_flash_erase();
        if (ret == ESP_OK) {
            ret = nvs_flash_init();
        }
    }
    if (ret != ESP_OK) {
        Serial.printf("NVS: ERROR - init failed (%s), settings will not persist\n", esp_err_to_name(ret));
    }

    // Settings
    if (!storageInit()) {
        Serial.println("Storage: using default settings");
    }
    uint8_t debug_level = storageLoadDebugLevel();
    if (!logSetDebugLevel(debug_level)) {
        Serial.printf("Debug level %u invalid, using %d\n", (unsigned)debug_level, DEBUG_LEVEL_DEFAULT);
        logSetDebugLevel(DEBUG_LEVEL_DEFAULT);
    }

    // Calibration store and active mapping
    bool flash_ok = g_flash.begin(CAL_PARTITION_LABEL);
    if (g_calibration.begin()) {
        Serial.println("Calibration: loaded");
    } else {
        Serial.println("Calibration: NOT CALIBRATED");
    }

    // Protocol engine
    ProtocolConfig config = protocolGetDefaultConfig();
    config.app_version = PULLCELL_VERSION;
    config.float_order = storageLoadFloatByteOrder();
#if ENABLE_BLE
    config.device_id = bleGetDeviceId();
    g_protocol = new ProtocolEngine(g_calibration, bleGetTransport(), config);
#else
    g_protocol = new ProtocolEngine(g_calibration, g_null_transport, config);
#endif
    g_pipeline = new WeightPipeline(g_channel, g_filter, g_calibration, *g_protocol);

    if (!flash_ok) {
        g_protocol->recordError(calibrationStatusName(CAL_ERR_STORAGE_FAULT));
    }
    checkBattery();
    g_last_battery_check = millis();

#if ENABLE_BLE
    if (!bleInit()) {
        Serial.println("BLE: initialization failed");
    }
#endif

    nauReady = samplerInit(nau, g_channel);
    if (!nauReady) {
        Serial.println("Sampler: NOT RUNNING - no weight readings");
        g_protocol->recordError("NoSensor");
    }

#if ENABLE_SERIAL_COMMANDS
    serialCommandsInit(&g_calibration, g_protocol, &g_channel, g_pipeline);
    Serial.println("Serial commands ready (? for help)");
#endif

    Serial.println("Setup complete!");
}

void loop() {
    // Check for serial commands (conditional)
#if ENABLE_SERIAL_COMMANDS
    serialCommandsUpdate();
#endif

    // Received control writes and disconnects
#if ENABLE_BLE
    bleUpdate(*g_protocol);
    digitalWrite(PIN_LED, bleIsConnected() ? HIGH : LOW);
#endif

    // Filter, convert and stream whatever the sampler produced
    g_pipeline->poll();

    // Retry anything the transport pushed back on
    g_protocol->poll();

    if (millis() - g_last_battery_check >= BATTERY_CHECK_INTERVAL_MS) {
        g_last_battery_check = millis();
        checkBattery();
    }

    delay(1);
}
