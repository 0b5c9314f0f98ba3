/**
 * Pullcell - Platform Primitives
 * Monotonic clock and critical sections, shared by device and host builds
 */

#ifndef PLATFORM_H
#define PLATFORM_H

#include <stdint.h>

// Microseconds since boot (wraps after ~71 minutes, compare with unsigned subtraction)
uint32_t platformMicros();

// Milliseconds since boot
uint32_t platformMillis();

// Scoped critical section. Keep the guarded region short: on the device this
// masks the scheduler on the current core.
class CriticalGuard {
public:
    CriticalGuard();
    ~CriticalGuard();

private:
    CriticalGuard(const CriticalGuard&);
    CriticalGuard& operator=(const CriticalGuard&);
};

#endif // PLATFORM_H
