/**
 * Pullcell - Log Output
 * Implementation
 */

#include "log.h"
#include "config.h"

#include <stdarg.h>
#include <stdio.h>

#ifdef ARDUINO
#include <Arduino.h>
#endif

// Runtime debug control variables (defaults from config.h)
bool g_debug_enabled = DEBUG_ENABLED;
bool g_debug_weight = DEBUG_WEIGHT;
bool g_debug_calibration = DEBUG_CALIBRATION;
bool g_debug_storage = DEBUG_STORAGE;
bool g_debug_protocol = DEBUG_PROTOCOL;
bool g_debug_ble = DEBUG_BLE;

static LogSink g_sink = nullptr;
static uint8_t g_debug_level = DEBUG_LEVEL_DEFAULT;

void logSetSink(LogSink sink) {
    g_sink = sink;
}

void logPrint(const char* text) {
    if (g_sink != nullptr) {
        g_sink(text);
        return;
    }
#ifdef ARDUINO
    Serial.print(text);
#else
    fputs(text, stdout);
    fflush(stdout);
#endif
}

void logPrintf(const char* format, ...) {
    char buffer[LOG_LINE_MAX];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    logPrint(buffer);
}

bool logSetDebugLevel(uint8_t level) {
    switch (level) {
        case 0:  // All OFF
            g_debug_enabled = false;
            g_debug_weight = false;
            g_debug_calibration = false;
            g_debug_storage = false;
            g_debug_protocol = false;
            g_debug_ble = false;
            break;

        case 1:  // Events only
            g_debug_enabled = true;
            g_debug_weight = false;
            g_debug_calibration = true;
            g_debug_storage = true;
            g_debug_protocol = false;
            g_debug_ble = false;
            break;

        case 2:  // + Protocol frames and BLE
            g_debug_enabled = true;
            g_debug_weight = false;
            g_debug_calibration = true;
            g_debug_storage = true;
            g_debug_protocol = true;
            g_debug_ble = true;
            break;

        case 3:  // + Weight readings
        case 9:  // All ON
            g_debug_enabled = true;
            g_debug_weight = true;
            g_debug_calibration = true;
            g_debug_storage = true;
            g_debug_protocol = true;
            g_debug_ble = true;
            break;

        default:
            return false;
    }
    g_debug_level = level;
    return true;
}

uint8_t logGetDebugLevel() {
    return g_debug_level;
}
