/**
 * Pullcell - Protocol Engine
 * Progressor-compatible command decode, dispatch and notification encode.
 * Transport-agnostic: the BLE service feeds received control writes in and
 * supplies a Transport for outgoing notifications.
 */

#ifndef PROTOCOL_H
#define PROTOCOL_H

#include <stddef.h>
#include <stdint.h>
#include "calibration.h"
#include "platform.h"
#include "ring_buffer.h"
#include "config.h"

// Control opcodes (peer -> device)
enum ControlOpcode {
    OP_TARE                         = 0x64,
    OP_START_MEASUREMENT            = 0x65,
    OP_STOP_MEASUREMENT             = 0x66,
    OP_START_PEAK_RFD               = 0x67,
    OP_START_PEAK_RFD_SERIES        = 0x68,
    OP_ADD_CALIBRATION_POINT        = 0x69,
    OP_SAVE_CALIBRATION             = 0x6A,
    OP_GET_APP_VERSION              = 0x6B,
    OP_GET_ERROR_INFO               = 0x6C,
    OP_CLEAR_ERROR_INFO             = 0x6D,
    OP_SHUTDOWN                     = 0x6E,
    OP_SAMPLE_BATTERY               = 0x6F,
    OP_GET_PROGRESSOR_ID            = 0x70,
    OP_GET_CALIBRATION_CURVE        = 0x72,
};

// Notification response codes (device -> peer)
enum ResponseCode {
    RES_CMD_RESPONSE                = 0x00,
    RES_WEIGHT_MEASUREMENT          = 0x01,
    RES_LOW_POWER_WARNING           = 0x04,
    RES_ERROR                       = 0x0F,
};

// Error codes carried in RES_ERROR frames as [request opcode][error code]
enum ProtocolError {
    PROTO_OK                        = 0x00,
    PROTO_ERR_MALFORMED_FRAME       = 0x01,
    PROTO_ERR_UNKNOWN_OPCODE        = 0x02,
    PROTO_ERR_UNSUPPORTED           = 0x03,
    PROTO_ERR_UNCALIBRATED          = 0x04,
    PROTO_ERR_QUEUE_FULL            = 0x05,     // Control write dropped before it was decoded
    PROTO_ERR_CALIBRATION_BASE      = 0x10,     // + CalStatus
};

const char* protocolErrorName(ProtocolError error);

// AddCalibrationPoint float decoding
enum FloatByteOrder {
    FLOAT_ORDER_LITTLE              = 0,
    FLOAT_ORDER_BIG                 = 1,
    FLOAT_ORDER_AUTO                = 2,        // LE, fall back to BE if implausible
};

const char* floatByteOrderName(FloatByteOrder order);

enum SendResult {
    SEND_OK,
    SEND_NOT_CONNECTED,                         // Nobody to deliver to, drop
    SEND_BUSY,                                  // Peer/stack not ready, retry later
};

enum StreamState {
    STREAM_IDLE,
    STREAM_STREAMING,
};

#define PROTOCOL_MAX_VALUE_SIZE     12
#define PROTOCOL_CAL_POINT_SIZE     4           // AddCalibrationPoint float payload

// Outgoing frame: [code][length][value]
struct __attribute__((packed)) DataPoint {
    uint8_t code;
    uint8_t length;
    uint8_t value[PROTOCOL_MAX_VALUE_SIZE];
};

inline size_t dataPointSize(const DataPoint& point) {
    return 2 + point.length;
}

// Decoded control frame
struct ControlCommand {
    uint8_t opcode;
    float reference_kg;     // OP_ADD_CALIBRATION_POINT only
};

// Write-side of the wireless link
class Transport {
public:
    virtual ~Transport() {}
    virtual SendResult sendNotification(const uint8_t* data, size_t length) = 0;
    virtual void disconnect() = 0;
};

// Decode a control write. Fails with PROTO_ERR_MALFORMED_FRAME on empty input or
// a payload length that does not match the opcode, PROTO_ERR_UNKNOWN_OPCODE otherwise.
ProtocolError protocolDecode(const uint8_t* data, size_t length, FloatByteOrder order,
                             float capacity_kg, ControlCommand& command);

// Frame encoders
DataPoint protocolEncodeWeight(float weight_kg, uint32_t timestamp_us);
DataPoint protocolEncodeResponse(const uint8_t* value, size_t length);
DataPoint protocolEncodeError(uint8_t opcode, uint8_t error);
DataPoint protocolEncodeLowPowerWarning();

// Device id little-endian with most-significant zero bytes trimmed (min 1 byte)
// Returns number of bytes written to out (max 8)
size_t protocolEncodeDeviceId(uint64_t id, uint8_t* out);

struct ProtocolConfig {
    const char* app_version;        // ASCII, truncated to PROTOCOL_MAX_VALUE_SIZE
    uint64_t device_id;
    FloatByteOrder float_order;
    float capacity_kg;
};

ProtocolConfig protocolGetDefaultConfig();

class ProtocolEngine {
public:
    typedef uint32_t (*ClockFn)();

    ProtocolEngine(CalibrationEngine& calibration, Transport& transport,
                   const ProtocolConfig& config, ClockFn clock = platformMicros);

    // Control write from the peer. Returns the decode/dispatch error that was
    // reported to the peer, PROTO_OK if the command succeeded.
    ProtocolError onFrameReceived(const uint8_t* data, size_t length);

    // Answer a control write that never reached decoding (truncated or dropped
    // by the transport) with an error response for its opcode
    void rejectFrame(uint8_t opcode, ProtocolError error);

    // Link dropped: stop streaming and discard everything pending
    void onDisconnect();

    // Converted weight for the streaming path. Replaces any undelivered weight.
    void publishWeight(float weight_kg, uint32_t timestamp_us);

    // Retry delivery of pending responses, then the pending weight. Never blocks.
    void poll();

    StreamState state() const { return m_state; }
    bool isStreaming() const { return m_state == STREAM_STREAMING; }

    void setFloatByteOrder(FloatByteOrder order) { m_config.float_order = order; }
    FloatByteOrder floatByteOrder() const { return m_config.float_order; }

    void setBattery(uint32_t millivolts, bool low);
    bool batteryLow() const { return m_battery_low; }

    // Text reported by GetErrorInfo
    void recordError(const char* text);
    const char* errorInfo() const { return m_error_info; }

    // Inspection (status console, tests)
    size_t pendingResponses() const { return m_responses.size(); }
    bool pendingWeight(DataPoint& point) const;
    uint32_t droppedResponses() const { return m_dropped_responses; }
    uint32_t notificationsSent() const { return m_sent; }

private:
    ProtocolError dispatch(const ControlCommand& command);
    void queueResponse(const DataPoint& point);
    void queueError(uint8_t opcode, uint8_t error);
    void discardPending();
    SendResult send(const DataPoint& point);

    CalibrationEngine& m_calibration;
    Transport& m_transport;
    ProtocolConfig m_config;
    ClockFn m_clock;

    StreamState m_state;
    uint32_t m_stream_start_us;

    RingBuffer<DataPoint, RESPONSE_QUEUE_SIZE> m_responses;
    DataPoint m_weight;
    bool m_weight_pending;

    uint32_t m_battery_mv;
    bool m_battery_low;
    char m_error_info[PROTOCOL_MAX_VALUE_SIZE + 1];

    uint32_t m_dropped_responses;
    uint32_t m_sent;
};

#endif // PROTOCOL_H
