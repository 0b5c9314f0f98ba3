/**
 * Pullcell - Configuration Constants
 * Centralized configuration for sampling, calibration, storage and BLE
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>  // For uint8_t, uint32_t types

// ==================== Feature Flags ====================

#define ENABLE_BLE                      1   // Vendor-compatible BLE service
#define ENABLE_SERIAL_COMMANDS          1   // USB debug console (debug level, status, byte order)

// ==================== Debug Configuration ====================

// Debug levels (runtime control via serial commands '0'-'3', '9')
// Level 0: All debug output OFF (quiet mode)
// Level 1: Events (calibration, storage commits, connection changes)
// Level 2: + Protocol frames and BLE notifications
// Level 3: + Weight readings (every filtered sample, very chatty at 80 SPS)
// Level 9: All debug ON

// Default debug flags (can be overridden at runtime via serial commands)
#define DEBUG_ENABLED                   1   // 0 = quiet mode, 1 = verbose debug output
#define DEBUG_LEVEL_DEFAULT             1   // Level applied at boot if none stored in NVS
#define DEBUG_WEIGHT                    0   // 0 = disable per-sample weight messages
#define DEBUG_CALIBRATION               1   // 0 = disable calibration debug
#define DEBUG_STORAGE                   1   // 0 = disable flash/NVS debug
#define DEBUG_PROTOCOL                  0   // 0 = disable protocol frame debug
#define DEBUG_BLE                       0   // 0 = disable BLE debug, 1 = enable BLE debug

// Runtime debug control - these extern declarations allow runtime debug control
// Use these macros in your code instead of #if DEBUG_* for runtime control
// (flags live in log.cpp so host builds of the core link without main.cpp)
#include "log.h"

extern bool g_debug_enabled;
extern bool g_debug_weight;
extern bool g_debug_calibration;
extern bool g_debug_storage;
extern bool g_debug_protocol;
extern bool g_debug_ble;

// Helper macros for conditional debug output (runtime control)
#define DEBUG_PRINT(category, text) \
    do { \
        if (g_debug_enabled && category) { \
            logPrint(text); \
        } \
    } while(0)

#define DEBUG_PRINTLN(category, text) \
    do { \
        if (g_debug_enabled && category) { \
            logPrintf("%s\n", text); \
        } \
    } while(0)

#define DEBUG_PRINTF(category, ...) \
    do { \
        if (g_debug_enabled && category) { \
            logPrintf(__VA_ARGS__); \
        } \
    } while(0)

// ==================== Sampling ====================

// NAU7802 conversion rate. Everything that is "N seconds of samples" is derived from this.
#define SAMPLE_RATE_HZ                  80

// Median window (odd, 3..MEDIAN_WINDOW_MAX). First MEDIAN_WINDOW_SIZE-1 samples yield no output.
#define MEDIAN_WINDOW_SIZE              5
#define MEDIAN_WINDOW_MAX               9

// Sampler -> pipeline channel. Producer overwrites the oldest sample when full.
#define SAMPLE_CHANNEL_CAPACITY         2

// Upper bound of raw samples consumed by one WeightPipeline::poll() call
#define PIPELINE_MAX_SAMPLES_PER_POLL   8

// Sampler task (FreeRTOS)
#define SAMPLER_TASK_STACK_SIZE         3072
#define SAMPLER_TASK_PRIORITY           5       // Above loopTask (1) so sampling never waits on the loop
#define SAMPLER_DRDY_TIMEOUT_MS         100     // Poll the ADC anyway if DRDY edges stop arriving

// ==================== Calibration ====================

// Tare: skip 0.5s of readings then average the next 0.5s
#define TARE_WARMUP_SAMPLES             (SAMPLE_RATE_HZ / 2)
#define TARE_SAMPLES                    (SAMPLE_RATE_HZ / 2)

// Physical capacity of the load cell (kg). Used to sanity-check decoded reference weights.
#define SCALE_CAPACITY_KG               200.0f

// Smallest non-zero reference weight accepted when auto-detecting byte order (1 g)
#define CAL_REFERENCE_RESOLUTION_KG     0.001f

// Float byte order for AddCalibrationPoint payloads when nothing is stored in NVS
// 0 = little-endian, 1 = big-endian, 2 = auto-detect
#define FLOAT_BYTE_ORDER_DEFAULT        0

// ==================== Calibration Flash Region ====================

// Dedicated data partition (see partitions.csv). Two sectors, one record slot each.
#define CAL_PARTITION_LABEL             "calib"
#define CAL_FLASH_SECTOR_SIZE           4096
#define CAL_FLASH_SLOT_COUNT            2

// ==================== Protocol ====================

#define CONTROL_FRAME_MAX_SIZE          20      // Largest control write we copy out of the BLE stack
#define FRAME_QUEUE_CAPACITY            8       // Control writes buffered between BLE task and loop
#define RESPONSE_QUEUE_SIZE             4       // Command responses awaiting delivery
#define STREAM_REORDER_WINDOW_US        1000000 // A sample this far before the stream start becomes the new origin

// ==================== Battery Monitoring ====================

#define BATTERY_CHECK_INTERVAL_MS       10000   // Sample battery voltage every 10 seconds
#define BATTERY_LOW_MV                  3400    // Below this, warn the peer and drop the connection
#define BATTERY_ABSENT_MV               2500    // Below this no cell is attached (USB powered)

// ==================== NVS Storage ====================

#define NVS_NAMESPACE                   "pullcell"  // NVS namespace for device settings

#endif // CONFIG_H
