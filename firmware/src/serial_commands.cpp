// serial_commands.cpp
// Single-character serial console: debug level, status, byte order, calibration reset

#include "config.h"

#if ENABLE_SERIAL_COMMANDS

#include "serial_commands.h"
#include "storage.h"
#include "sampler.h"
#include "pullcell.h"
#include <math.h>

#if ENABLE_BLE
#include "ble_service.h"
#endif

// Command buffer for serial input
#define CMD_BUFFER_SIZE 32
static char cmdBuffer[CMD_BUFFER_SIZE];
static uint8_t cmdBufferPos = 0;

// Objects owned by main.cpp
static CalibrationEngine* g_calibration = nullptr;
static ProtocolEngine* g_protocol = nullptr;
static const SampleChannel* g_channel = nullptr;
static const WeightPipeline* g_pipeline = nullptr;

void serialCommandsInit(CalibrationEngine* calibration, ProtocolEngine* protocol,
                        const SampleChannel* channel, const WeightPipeline* pipeline) {
    g_calibration = calibration;
    g_protocol = protocol;
    g_channel = channel;
    g_pipeline = pipeline;
    cmdBufferPos = 0;
    cmdBuffer[0] = '\0';
}

static void handleHelp() {
    Serial.println("\n=== Pullcell Serial Commands ===");
    Serial.println("  0-3, 9  - Debug level (0=off, 1=events, 2=+protocol, 3=+weight, 9=all)");
    Serial.println("  S       - Show status");
    Serial.println("  E       - Cycle calibration float byte order (LITTLE -> BIG -> AUTO)");
    Serial.println("  R       - Reset calibration (erases stored mapping)");
    Serial.println("  ?       - This help");
}

// Handle debug level change (single character '0'-'3', '9')
static void handleDebugLevel(char level) {
    uint8_t value = (uint8_t)(level - '0');
    if (!logSetDebugLevel(value)) {
        Serial.println("ERROR: Invalid debug level (use 0-3 or 9)");
        return;
    }

    switch (value) {
        case 0: Serial.println("Debug Level 0: All debug output OFF"); break;
        case 1: Serial.println("Debug Level 1: Events (calibration, storage)"); break;
        case 2: Serial.println("Debug Level 2: + Protocol and BLE"); break;
        case 3: Serial.println("Debug Level 3: + Weight (every filtered sample)"); break;
        default: Serial.println("Debug Level 9: All debug ON"); break;
    }

    if (!storageSaveDebugLevel(value)) {
        Serial.println("WARNING: Debug level not persisted");
    }
}

static void handleGetStatus() {
    Serial.println("\n=== SYSTEM STATUS ===");
    Serial.printf("Firmware: %s\n", PULLCELL_VERSION);

    CalibrationMapping mapping;
    if (g_calibration->getMapping(mapping)) {
        Serial.printf("Calibration: VALID (zero_raw=%ld, gradient=%.9g kg/count)\n",
                      (long)mapping.zero_raw, mapping.gradient);
    } else {
        Serial.println("Calibration: NOT CALIBRATED");
    }
    Serial.printf("Calibration points: %u\n", (unsigned)g_calibration->session().count());
    Serial.printf("Tare offset: %.3f kg%s\n", g_calibration->tareOffset(),
                  g_calibration->isTaring() ? " (taring)" : "");

    float weight = g_pipeline->lastWeight();
    if (isnan(weight)) {
        Serial.printf("Last reading: raw=%ld, weight=---\n", (long)g_pipeline->lastFiltered());
    } else {
        Serial.printf("Last reading: raw=%ld, weight=%.3f kg\n",
                      (long)g_pipeline->lastFiltered(), weight);
    }
    Serial.printf("Samples: %lu read, %lu processed, %lu overruns, %lu DRDY timeouts\n",
                  (unsigned long)samplerGetSampleCount(),
                  (unsigned long)g_pipeline->samplesProcessed(),
                  (unsigned long)g_channel->overruns(),
                  (unsigned long)samplerGetTimeoutCount());

    Serial.printf("Streaming: %s\n", g_protocol->isStreaming() ? "YES" : "NO");
    Serial.printf("Float byte order: %s\n", floatByteOrderName(g_protocol->floatByteOrder()));
    Serial.printf("Notifications sent: %lu, responses dropped: %lu\n",
                  (unsigned long)g_protocol->notificationsSent(),
                  (unsigned long)g_protocol->droppedResponses());
    Serial.printf("Error info: %s\n", g_protocol->errorInfo()[0] ? g_protocol->errorInfo() : "(none)");
    Serial.printf("Battery low: %s\n", g_protocol->batteryLow() ? "YES" : "NO");
#if ENABLE_BLE
    Serial.printf("BLE connected: %s, frames dropped: %lu\n",
                  bleIsConnected() ? "YES" : "NO", (unsigned long)bleGetDroppedFrames());
#endif
    Serial.printf("Debug level: %u\n", (unsigned)logGetDebugLevel());
    Serial.println("=====================\n");
}

static void handleCycleByteOrder() {
    FloatByteOrder next;
    switch (g_protocol->floatByteOrder()) {
        case FLOAT_ORDER_LITTLE: next = FLOAT_ORDER_BIG; break;
        case FLOAT_ORDER_BIG: next = FLOAT_ORDER_AUTO; break;
        default: next = FLOAT_ORDER_LITTLE; break;
    }

    g_protocol->setFloatByteOrder(next);
    Serial.printf("Float byte order: %s\n", floatByteOrderName(next));
    if (!storageSaveFloatByteOrder(next)) {
        Serial.println("WARNING: Byte order not persisted");
    }
}

static void handleResetCalibration() {
    CalStatus status = g_calibration->reset();
    if (status != CAL_OK) {
        Serial.printf("ERROR: Calibration reset failed (%s)\n", calibrationStatusName(status));
        g_protocol->recordError(calibrationStatusName(status));
        return;
    }
    Serial.println("Calibration reset - device is uncalibrated");
}

static void processCommand(char* cmd) {
    // Trim leading whitespace
    while (*cmd == ' ' || *cmd == '\t') cmd++;

    // Check for empty command
    if (*cmd == '\0') return;

    if (strlen(cmd) != 1) {
        Serial.printf("ERROR: Unknown command '%s' (? for help)\n", cmd);
        return;
    }

    char c = cmd[0];
    if ((c >= '0' && c <= '3') || c == '9') {
        handleDebugLevel(c);
        return;
    }

    switch (c) {
        case 'S': case 's': handleGetStatus(); break;
        case 'E': case 'e': handleCycleByteOrder(); break;
        case 'R': case 'r': handleResetCalibration(); break;
        case '?': case 'H': case 'h': handleHelp(); break;
        default:
            Serial.printf("ERROR: Unknown command '%c' (? for help)\n", c);
            break;
    }
}

// Update serial command handler (call in loop())
void serialCommandsUpdate() {
    while (Serial.available() > 0) {
        char c = Serial.read();

        // Handle newline (command complete)
        if (c == '\n' || c == '\r') {
            if (cmdBufferPos > 0) {
                cmdBuffer[cmdBufferPos] = '\0';
                processCommand(cmdBuffer);
                cmdBufferPos = 0;
            }
        }
        // Add character to buffer
        else if (cmdBufferPos < CMD_BUFFER_SIZE - 1) {
            cmdBuffer[cmdBufferPos++] = c;
        }
        // Buffer overflow - reset
        else {
            Serial.println("ERROR: Command too long");
            cmdBufferPos = 0;
        }
    }
}

#endif // ENABLE_SERIAL_COMMANDS
