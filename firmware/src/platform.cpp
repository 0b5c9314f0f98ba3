/**
 * Pullcell - Platform Primitives
 * Implementation
 */

#include "platform.h"

#ifdef ARDUINO
#include <Arduino.h>
#include "freertos/FreeRTOS.h"
#include "freertos/portmacro.h"
#else
#include <chrono>
#include <mutex>
#endif

#ifdef ARDUINO

static portMUX_TYPE g_platform_mux = portMUX_INITIALIZER_UNLOCKED;

uint32_t platformMicros() {
    return micros();
}

uint32_t platformMillis() {
    return millis();
}

CriticalGuard::CriticalGuard() {
    taskENTER_CRITICAL(&g_platform_mux);
}

CriticalGuard::~CriticalGuard() {
    taskEXIT_CRITICAL(&g_platform_mux);
}

#else

static std::mutex g_platform_mutex;

static std::chrono::steady_clock::time_point startTime() {
    static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    return start;
}

uint32_t platformMicros() {
    using namespace std::chrono;
    return static_cast<uint32_t>(duration_cast<microseconds>(steady_clock::now() - startTime()).count());
}

uint32_t platformMillis() {
    using namespace std::chrono;
    return static_cast<uint32_t>(duration_cast<milliseconds>(steady_clock::now() - startTime()).count());
}

CriticalGuard::CriticalGuard() {
    g_platform_mutex.lock();
}

CriticalGuard::~CriticalGuard() {
    g_platform_mutex.unlock();
}

#endif
