/**
 * Pullcell - NVS Storage Module
 * Implementation
 */

#include "storage.h"
#include "config.h"
#include <Preferences.h>

// Static variables
static Preferences g_preferences;
static bool g_initialized = false;

// NVS keys
static const char* KEY_FLOAT_ORDER = "float_order";
static const char* KEY_DEBUG_LEVEL = "debug_level";

bool storageInit() {
    if (g_initialized) {
        return true; // Already initialized
    }

    // Open NVS namespace in read-write mode
    bool success = g_preferences.begin(NVS_NAMESPACE, false);
    if (success) {
        g_initialized = true;
        DEBUG_PRINTLN(g_debug_storage, "Storage: NVS initialized");
    } else {
        Serial.println("Storage: Failed to initialize NVS");
    }

    return success;
}

bool storageSaveFloatByteOrder(FloatByteOrder order) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }

    if (g_preferences.putUChar(KEY_FLOAT_ORDER, (uint8_t)order) == 0) {
        Serial.println("Storage: Failed to save float_order");
        return false;
    }
    DEBUG_PRINTF(g_debug_storage, "Storage: Saved float_order = %s\n", floatByteOrderName(order));
    return true;
}

FloatByteOrder storageLoadFloatByteOrder() {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized, using default float_order");
        return (FloatByteOrder)FLOAT_BYTE_ORDER_DEFAULT;
    }

    uint8_t value = g_preferences.getUChar(KEY_FLOAT_ORDER, FLOAT_BYTE_ORDER_DEFAULT);
    if (value > FLOAT_ORDER_AUTO) {
        Serial.printf("Storage: Invalid float_order %u, using default\n", (unsigned)value);
        value = FLOAT_BYTE_ORDER_DEFAULT;
    }

    FloatByteOrder order = (FloatByteOrder)value;
    DEBUG_PRINTF(g_debug_storage, "Storage: Loaded float_order = %s\n", floatByteOrderName(order));
    return order;
}

bool storageSaveDebugLevel(uint8_t level) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }

    if (g_preferences.putUChar(KEY_DEBUG_LEVEL, level) == 0) {
        Serial.println("Storage: Failed to save debug_level");
        return false;
    }
    DEBUG_PRINTF(g_debug_storage, "Storage: Saved debug_level = %u\n", (unsigned)level);
    return true;
}

uint8_t storageLoadDebugLevel() {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized, using default debug_level");
        return DEBUG_LEVEL_DEFAULT;
    }

    return g_preferences.getUChar(KEY_DEBUG_LEVEL, DEBUG_LEVEL_DEFAULT);
}
