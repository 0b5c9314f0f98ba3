/**
 * Pin definitions for Adafruit ESP32 Feather V2
 *
 * I2C devices (STEMMA QT / Qwiic):
 *   - NAU7802 ADC (load cell): 0x2A
 *
 * NAU7802 DRDY is not on the STEMMA QT connector, wire it to A10
 */

#ifndef PINS_ADAFRUIT_H
#define PINS_ADAFRUIT_H

// I2C pins (STEMMA QT connector)
#define PIN_I2C_SDA         22
#define PIN_I2C_SCL         20

// NAU7802 data-ready (active high, one edge per conversion)
#define PIN_NAU_DRDY        27

// Battery monitoring
#define PIN_VBAT            A13  // Battery voltage divider (1/2)

// Onboard LED
#define PIN_LED             13

#endif // PINS_ADAFRUIT_H
