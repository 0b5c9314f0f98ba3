/**
 * Pullcell - Load Cell Firmware
 * Common definitions: version, board pins, device identity
 */

#ifndef PULLCELL_H
#define PULLCELL_H

#include <Arduino.h>

// Version info
#define PULLCELL_VERSION_MAJOR  1
#define PULLCELL_VERSION_MINOR  0
#define PULLCELL_VERSION_PATCH  0
#define PULLCELL_VERSION        "1.0.0"

// Include board-specific pin definitions
#if defined(BOARD_ADAFRUIT_FEATHER)
    #include "config/pins_adafruit.h"
#elif defined(BOARD_SPARKFUN_QWIIC)
    #include "config/pins_sparkfun.h"
#else
    #error "No board defined! Use -DBOARD_ADAFRUIT_FEATHER or -DBOARD_SPARKFUN_QWIIC"
#endif

// I2C device addresses
#define I2C_ADDR_NAU7802    0x2A

// Advertised as BLE_DEVICE_NAME_PREFIX + last two MAC bytes in hex ("Progressor_1A2B").
// Peer apps filter on this prefix.
#define BLE_DEVICE_NAME_PREFIX  "Progressor_"

#endif // PULLCELL_H
