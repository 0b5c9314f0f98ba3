/**
 * Pullcell - Ring Buffer
 * Fixed-capacity FIFO shared between one producer and one consumer
 * (sampler task -> loop, BLE host task -> loop). Every access takes a
 * CriticalGuard, so T should be a small trivially-copyable struct.
 */

#ifndef RING_BUFFER_H
#define RING_BUFFER_H

#include <stddef.h>
#include <stdint.h>
#include "platform.h"

template <typename T, size_t N>
class RingBuffer {
public:
    RingBuffer() : m_head(0), m_count(0), m_overruns(0) {}

    static size_t capacity() { return N; }

    // Append. Returns false (item dropped) when full.
    bool push(const T& item) {
        CriticalGuard guard;
        if (m_count == N) {
            return false;
        }
        m_items[(m_head + m_count) % N] = item;
        m_count++;
        return true;
    }

    // Append, evicting the oldest item when full. Never blocks or fails.
    void pushOverwrite(const T& item) {
        CriticalGuard guard;
        if (m_count == N) {
            m_head = (m_head + 1) % N;
            m_count--;
            m_overruns++;
        }
        m_items[(m_head + m_count) % N] = item;
        m_count++;
    }

    bool pop(T& item) {
        CriticalGuard guard;
        if (m_count == 0) {
            return false;
        }
        item = m_items[m_head];
        m_head = (m_head + 1) % N;
        m_count--;
        return true;
    }

    // Copy the oldest item without removing it
    bool peek(T& item) const {
        CriticalGuard guard;
        if (m_count == 0) {
            return false;
        }
        item = m_items[m_head];
        return true;
    }

    size_t size() const {
        CriticalGuard guard;
        return m_count;
    }

    bool empty() const { return size() == 0; }

    void clear() {
        CriticalGuard guard;
        m_head = 0;
        m_count = 0;
    }

    // Items evicted by pushOverwrite() since construction
    uint32_t overruns() const {
        CriticalGuard guard;
        return m_overruns;
    }

private:
    T m_items[N];
    size_t m_head;
    size_t m_count;
    uint32_t m_overruns;
};

#endif // RING_BUFFER_H
