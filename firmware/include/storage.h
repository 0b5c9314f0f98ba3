/**
 * Pullcell - NVS Storage Module
 * Persistent device settings (calibration itself lives in the calib partition)
 */

#ifndef STORAGE_H
#define STORAGE_H

#include <Arduino.h>
#include "protocol.h"

// Initialize storage module (opens NVS namespace)
bool storageInit();

// Save AddCalibrationPoint float byte order to NVS
bool storageSaveFloatByteOrder(FloatByteOrder order);

// Load float byte order from NVS (default: FLOAT_BYTE_ORDER_DEFAULT)
FloatByteOrder storageLoadFloatByteOrder();

// Save debug level to NVS (0-3, 9)
bool storageSaveDebugLevel(uint8_t level);

// Load debug level from NVS (default: DEBUG_LEVEL_DEFAULT)
uint8_t storageLoadDebugLevel();

#endif // STORAGE_H
