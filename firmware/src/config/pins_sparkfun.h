/**
 * Pin definitions for SparkFun ESP32-C6 Qwiic Pocket
 *
 * I2C devices (Qwiic connector):
 *   - NAU7802 ADC (load cell): 0x2A
 *
 * NAU7802 DRDY requires manual wiring
 */

#ifndef PINS_SPARKFUN_H
#define PINS_SPARKFUN_H

// I2C pins (Qwiic connector)
#define PIN_I2C_SDA         6
#define PIN_I2C_SCL         7

// NAU7802 data-ready (active high, one edge per conversion)
#define PIN_NAU_DRDY        5

// Battery monitoring (via external 1/2 divider)
#define PIN_VBAT            A0

// Onboard LED (standard blue LED, not WS2812)
#define PIN_LED             23

#endif // PINS_SPARKFUN_H
