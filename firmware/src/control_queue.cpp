/**
 * Pullcell - Control Queue
 * Implementation
 */

#include "control_queue.h"
#include <string.h>
#include "platform.h"

ControlFrameQueue::ControlFrameQueue()
    : m_epoch(0),
      m_disconnect_pending(false),
      m_overflow_pending(false),
      m_overflow_opcode(0),
      m_overflow_epoch(0),
      m_dropped(0),
      m_stale(0) {
}

bool ControlFrameQueue::onWrite(const uint8_t* data, size_t length) {
    ControlFrame frame;
    memset(&frame, 0, sizeof(frame));
    frame.oversize = length > CONTROL_FRAME_MAX_SIZE;
    frame.length = (uint8_t)(frame.oversize ? CONTROL_FRAME_MAX_SIZE : length);
    if (frame.length > 0) {
        memcpy(frame.data, data, frame.length);
    }
    {
        CriticalGuard guard;
        frame.epoch = m_epoch;
    }

    if (m_frames.push(frame)) {
        return true;
    }

    CriticalGuard guard;
    m_dropped++;
    if (!m_overflow_pending) {
        m_overflow_pending = true;
        m_overflow_opcode = frame.length > 0 ? frame.data[0] : 0x00;
        m_overflow_epoch = frame.epoch;
    }
    return false;
}

void ControlFrameQueue::onDisconnect() {
    CriticalGuard guard;
    m_epoch++;
    m_disconnect_pending = true;
}

uint32_t ControlFrameQueue::droppedFrames() const {
    CriticalGuard guard;
    return m_dropped;
}

uint32_t ControlFrameQueue::takeDisconnect(ProtocolEngine& protocol) {
    bool disconnected;
    uint32_t epoch;
    {
        CriticalGuard guard;
        disconnected = m_disconnect_pending;
        m_disconnect_pending = false;
        epoch = m_epoch;
    }
    if (disconnected) {
        protocol.onDisconnect();
    }
    return epoch;
}

void ControlFrameQueue::dispatch(ProtocolEngine& protocol) {
    uint32_t epoch = takeDisconnect(protocol);

    ControlFrame frame;
    while (m_frames.pop(frame)) {
        if (frame.epoch != epoch) {
            // Link changed while draining
            epoch = takeDisconnect(protocol);
        }
        if (frame.epoch != epoch) {
            m_stale++;
            DEBUG_PRINTF(g_debug_ble, "[BLE] Discarded write from closed connection (opcode 0x%02X)\n",
                         frame.length > 0 ? frame.data[0] : 0);
            continue;
        }

        if (frame.oversize) {
            protocol.rejectFrame(frame.data[0], PROTO_ERR_MALFORMED_FRAME);
            continue;
        }

        ProtocolError err = protocol.onFrameReceived(frame.data, frame.length);
        if (err != PROTO_OK) {
            DEBUG_PRINTF(g_debug_ble, "[BLE] Frame rejected: %s\n", protocolErrorName(err));
        }
    }

    reportOverflow(protocol, epoch);
}

void ControlFrameQueue::reportOverflow(ProtocolEngine& protocol, uint32_t epoch) {
    bool overflow;
    uint8_t opcode;
    uint32_t overflow_epoch;
    uint32_t dropped;
    {
        CriticalGuard guard;
        overflow = m_overflow_pending;
        opcode = m_overflow_opcode;
        overflow_epoch = m_overflow_epoch;
        dropped = m_dropped;
        m_overflow_pending = false;
    }
    if (!overflow || overflow_epoch != epoch) {
        return;
    }

    logPrintf("BLE: control queue full - dropped write(s), first opcode 0x%02X (%lu total)\n",
              opcode, (unsigned long)dropped);
    protocol.rejectFrame(opcode, PROTO_ERR_QUEUE_FULL);
}
