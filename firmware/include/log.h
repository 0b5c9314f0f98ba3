/**
 * Pullcell - Log Output
 * Formatted console output behind the DEBUG_* macros in config.h.
 * Device builds write to Serial, host builds to stdout. A sink can be
 * installed to capture output (tests, or mirroring to another channel).
 */

#ifndef LOG_H
#define LOG_H

#include <stdint.h>

#define LOG_LINE_MAX 192    // Longer messages are truncated

// Receives one formatted chunk at a time (may or may not end in '\n')
typedef void (*LogSink)(const char* text);

// Install a sink, or nullptr to restore the default console output
void logSetSink(LogSink sink);

void logPrint(const char* text);
void logPrintf(const char* format, ...) __attribute__((format(printf, 1, 2)));

// Apply a debug level preset to the g_debug_* flags
// Levels: 0 = off, 1 = events, 2 = + protocol/BLE, 3 = + weight, 9 = all
// Returns false (flags unchanged) for any other level
bool logSetDebugLevel(uint8_t level);

// Last level applied with logSetDebugLevel()
uint8_t logGetDebugLevel();

#endif // LOG_H
