// serial_commands.h
// Serial command interface for debug level, status and calibration reset
// Part of Pullcell force sensor firmware

#ifndef SERIAL_COMMANDS_H
#define SERIAL_COMMANDS_H

#include "config.h"

#if ENABLE_SERIAL_COMMANDS

#include <Arduino.h>
#include "calibration.h"
#include "protocol.h"
#include "weight.h"

// Initialize serial command handler
// Must be called once in setup() after Serial.begin(), with the objects
// the status/reset commands operate on
void serialCommandsInit(CalibrationEngine* calibration, ProtocolEngine* protocol,
                        const SampleChannel* channel, const WeightPipeline* pipeline);

// Update serial command handler (call in loop())
// Checks for incoming serial data and processes commands
void serialCommandsUpdate();

#endif // ENABLE_SERIAL_COMMANDS

#endif // SERIAL_COMMANDS_H
