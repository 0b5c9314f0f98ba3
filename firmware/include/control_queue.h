/**
 * Pullcell - Control Queue
 * Hands control writes from the BLE host task to the main loop.
 * Writes are tagged with the connection they arrived on, so a latched
 * disconnect only discards what the old peer sent.
 */

#ifndef CONTROL_QUEUE_H
#define CONTROL_QUEUE_H

#include <stddef.h>
#include <stdint.h>
#include "protocol.h"
#include "ring_buffer.h"
#include "config.h"

// Control write as received, before decoding
struct ControlFrame {
    uint8_t length;                     // Bytes kept in data
    bool oversize;                      // Write was longer than data, tail cut off
    uint32_t epoch;                     // Connection the write arrived on
    uint8_t data[CONTROL_FRAME_MAX_SIZE];
};

class ControlFrameQueue {
public:
    ControlFrameQueue();

    // BLE host task side
    // Returns false if the write was dropped (queue full)
    bool onWrite(const uint8_t* data, size_t length);
    void onDisconnect();

    // Main loop side: latched disconnect first, then queued writes of the
    // current connection, then a QueueFull error for the first dropped write
    void dispatch(ProtocolEngine& protocol);

    uint32_t droppedFrames() const;
    uint32_t staleFrames() const { return m_stale; }
    size_t pending() const { return m_frames.size(); }

private:
    uint32_t takeDisconnect(ProtocolEngine& protocol);
    void reportOverflow(ProtocolEngine& protocol, uint32_t epoch);

    RingBuffer<ControlFrame, FRAME_QUEUE_CAPACITY> m_frames;

    // Guarded by CriticalGuard
    uint32_t m_epoch;
    bool m_disconnect_pending;
    bool m_overflow_pending;
    uint8_t m_overflow_opcode;
    uint32_t m_overflow_epoch;
    uint32_t m_dropped;

    // Main loop only
    uint32_t m_stale;

    ControlFrameQueue(const ControlFrameQueue&);
    ControlFrameQueue& operator=(const ControlFrameQueue&);
};

#endif // CONTROL_QUEUE_H
