/**
 * Pullcell - Load Cell Sampler
 * NAU7802 at a fixed conversion rate. The DRDY interrupt wakes a FreeRTOS
 * task that reads each conversion and pushes it into the sample channel.
 */

#ifndef SAMPLER_H
#define SAMPLER_H

#include <Arduino.h>
#include <Adafruit_NAU7802.h>
#include "weight.h"

// Configure the ADC, start the sampler task and attach the DRDY interrupt.
// Returns false if the NAU7802 does not respond or the task cannot start.
bool samplerInit(Adafruit_NAU7802& nau, SampleChannel& channel);

// Conversions read since boot
uint32_t samplerGetSampleCount();

// DRDY waits that timed out (ADC stalled or interrupt not wired)
uint32_t samplerGetTimeoutCount();

#endif // SAMPLER_H
