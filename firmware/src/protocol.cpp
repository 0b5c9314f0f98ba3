/**
 * Pullcell - Protocol Engine
 * Implementation
 */

#include "protocol.h"
#include <math.h>
#include <string.h>

// ==================== Names ====================

const char* protocolErrorName(ProtocolError error) {
    switch (error) {
        case PROTO_OK: return "OK";
        case PROTO_ERR_MALFORMED_FRAME: return "Malformed";
        case PROTO_ERR_UNKNOWN_OPCODE: return "UnknownOp";
        case PROTO_ERR_UNSUPPORTED: return "Unsupported";
        case PROTO_ERR_UNCALIBRATED: return "Uncalibrated";
        case PROTO_ERR_QUEUE_FULL: return "QueueFull";
        default:
            if (error > PROTO_ERR_CALIBRATION_BASE) {
                return calibrationStatusName((CalStatus)(error - PROTO_ERR_CALIBRATION_BASE));
            }
            return "Unknown";
    }
}

const char* floatByteOrderName(FloatByteOrder order) {
    switch (order) {
        case FLOAT_ORDER_LITTLE: return "little-endian";
        case FLOAT_ORDER_BIG: return "big-endian";
        case FLOAT_ORDER_AUTO: return "auto";
        default: return "unknown";
    }
}

// ==================== Byte helpers ====================

static void putLe32(uint8_t* out, uint32_t value) {
    out[0] = (uint8_t)(value);
    out[1] = (uint8_t)(value >> 8);
    out[2] = (uint8_t)(value >> 16);
    out[3] = (uint8_t)(value >> 24);
}

static void putLe64(uint8_t* out, uint64_t value) {
    putLe32(out, (uint32_t)value);
    putLe32(out + 4, (uint32_t)(value >> 32));
}

static float floatFromBits(uint32_t bits) {
    float value;
    memcpy(&value, &bits, sizeof(value));
    return value;
}

static float readFloat(const uint8_t* in, bool big_endian) {
    uint32_t bits;
    if (big_endian) {
        bits = ((uint32_t)in[0] << 24) | ((uint32_t)in[1] << 16) | ((uint32_t)in[2] << 8) | in[3];
    } else {
        bits = ((uint32_t)in[3] << 24) | ((uint32_t)in[2] << 16) | ((uint32_t)in[1] << 8) | in[0];
    }
    return floatFromBits(bits);
}

// A reference weight a person could actually hang on the cell: finite, within
// capacity, and either exactly zero or at least CAL_REFERENCE_RESOLUTION_KG.
// Byte-swapped floats land on denormals or huge exponents and fail this.
static bool plausibleReference(float value, float capacity_kg) {
    if (!isfinite(value)) {
        return false;
    }
    float magnitude = fabsf(value);
    if (magnitude > capacity_kg) {
        return false;
    }
    return magnitude == 0.0f || magnitude >= CAL_REFERENCE_RESOLUTION_KG;
}

// ==================== Decode ====================

static bool opcodeHasNoPayload(uint8_t opcode) {
    switch (opcode) {
        case OP_TARE:
        case OP_START_MEASUREMENT:
        case OP_STOP_MEASUREMENT:
        case OP_START_PEAK_RFD:
        case OP_START_PEAK_RFD_SERIES:
        case OP_SAVE_CALIBRATION:
        case OP_GET_APP_VERSION:
        case OP_GET_ERROR_INFO:
        case OP_CLEAR_ERROR_INFO:
        case OP_SHUTDOWN:
        case OP_SAMPLE_BATTERY:
        case OP_GET_PROGRESSOR_ID:
        case OP_GET_CALIBRATION_CURVE:
            return true;
        default:
            return false;
    }
}

static ProtocolError decodeReference(const uint8_t* payload, FloatByteOrder order,
                                     float capacity_kg, float& reference_kg) {
    switch (order) {
        case FLOAT_ORDER_LITTLE:
        case FLOAT_ORDER_BIG: {
            float value = readFloat(payload, order == FLOAT_ORDER_BIG);
            if (!isfinite(value)) {
                return PROTO_ERR_MALFORMED_FRAME;
            }
            reference_kg = value;
            return PROTO_OK;
        }

        case FLOAT_ORDER_AUTO: {
            float little = readFloat(payload, false);
            if (plausibleReference(little, capacity_kg)) {
                reference_kg = little;
                return PROTO_OK;
            }
            float big = readFloat(payload, true);
            if (plausibleReference(big, capacity_kg)) {
                reference_kg = big;
                return PROTO_OK;
            }
            return PROTO_ERR_MALFORMED_FRAME;
        }

        default:
            return PROTO_ERR_MALFORMED_FRAME;
    }
}

ProtocolError protocolDecode(const uint8_t* data, size_t length, FloatByteOrder order,
                             float capacity_kg, ControlCommand& command) {
    if (data == nullptr || length == 0) {
        return PROTO_ERR_MALFORMED_FRAME;
    }

    uint8_t opcode = data[0];
    const uint8_t* payload = data + 1;
    size_t payload_length = length - 1;

    if (opcodeHasNoPayload(opcode)) {
        if (payload_length != 0) {
            return PROTO_ERR_MALFORMED_FRAME;
        }
        command.opcode = opcode;
        command.reference_kg = 0.0f;
        return PROTO_OK;
    }

    if (opcode == OP_ADD_CALIBRATION_POINT) {
        // Plain float, or a float behind a one-byte length prefix
        if (payload_length == PROTOCOL_CAL_POINT_SIZE + 1 && payload[0] == PROTOCOL_CAL_POINT_SIZE) {
            payload++;
            payload_length--;
        }
        if (payload_length != PROTOCOL_CAL_POINT_SIZE) {
            return PROTO_ERR_MALFORMED_FRAME;
        }

        float reference_kg;
        ProtocolError error = decodeReference(payload, order, capacity_kg, reference_kg);
        if (error != PROTO_OK) {
            return error;
        }
        command.opcode = opcode;
        command.reference_kg = reference_kg;
        return PROTO_OK;
    }

    return PROTO_ERR_UNKNOWN_OPCODE;
}

// ==================== Encode ====================

DataPoint protocolEncodeResponse(const uint8_t* value, size_t length) {
    DataPoint point;
    memset(&point, 0, sizeof(point));
    if (length > PROTOCOL_MAX_VALUE_SIZE) {
        length = PROTOCOL_MAX_VALUE_SIZE;
    }
    point.code = RES_CMD_RESPONSE;
    point.length = (uint8_t)length;
    if (length > 0) {
        memcpy(point.value, value, length);
    }
    return point;
}

DataPoint protocolEncodeWeight(float weight_kg, uint32_t timestamp_us) {
    DataPoint point;
    memset(&point, 0, sizeof(point));
    uint32_t bits;
    memcpy(&bits, &weight_kg, sizeof(bits));
    point.code = RES_WEIGHT_MEASUREMENT;
    point.length = 8;
    putLe32(point.value, bits);
    putLe32(point.value + 4, timestamp_us);
    return point;
}

DataPoint protocolEncodeError(uint8_t opcode, uint8_t error) {
    DataPoint point;
    memset(&point, 0, sizeof(point));
    point.code = RES_ERROR;
    point.length = 2;
    point.value[0] = opcode;
    point.value[1] = error;
    return point;
}

DataPoint protocolEncodeLowPowerWarning() {
    DataPoint point;
    memset(&point, 0, sizeof(point));
    point.code = RES_LOW_POWER_WARNING;
    point.length = 0;
    return point;
}

size_t protocolEncodeDeviceId(uint64_t id, uint8_t* out) {
    putLe64(out, id);
    size_t length = 8;
    while (length > 1 && out[length - 1] == 0) {
        length--;
    }
    return length;
}

ProtocolConfig protocolGetDefaultConfig() {
    ProtocolConfig config;
    config.app_version = "";
    config.device_id = 0;
    config.float_order = (FloatByteOrder)FLOAT_BYTE_ORDER_DEFAULT;
    config.capacity_kg = SCALE_CAPACITY_KG;
    return config;
}

// ==================== Engine ====================

ProtocolEngine::ProtocolEngine(CalibrationEngine& calibration, Transport& transport,
                               const ProtocolConfig& config, ClockFn clock)
    : m_calibration(calibration),
      m_transport(transport),
      m_config(config),
      m_clock(clock),
      m_state(STREAM_IDLE),
      m_stream_start_us(0),
      m_weight_pending(false),
      m_battery_mv(0),
      m_battery_low(false),
      m_dropped_responses(0),
      m_sent(0) {
    memset(&m_weight, 0, sizeof(m_weight));
    m_error_info[0] = '\0';
}

ProtocolError ProtocolEngine::onFrameReceived(const uint8_t* data, size_t length) {
    if (m_battery_low) {
        logPrintf("Protocol: battery low (%lu mV) - warning peer and disconnecting\n",
                  (unsigned long)m_battery_mv);
        queueResponse(protocolEncodeLowPowerWarning());
        poll();
        m_transport.disconnect();
    }

    ControlCommand command;
    ProtocolError error = protocolDecode(data, length, m_config.float_order, m_config.capacity_kg, command);
    if (error != PROTO_OK) {
        uint8_t opcode = (data != nullptr && length > 0) ? data[0] : 0x00;
        DEBUG_PRINTF(g_debug_protocol, "Protocol: rejected frame 0x%02X (%u bytes): %s\n",
                     opcode, (unsigned)length, protocolErrorName(error));
        queueError(opcode, error);
        poll();
        return error;
    }

    DEBUG_PRINTF(g_debug_protocol, "Protocol: command 0x%02X\n", command.opcode);
    error = dispatch(command);
    poll();
    return error;
}

void ProtocolEngine::rejectFrame(uint8_t opcode, ProtocolError error) {
    DEBUG_PRINTF(g_debug_protocol, "Protocol: frame 0x%02X not decoded: %s\n",
                 opcode, protocolErrorName(error));
    queueError(opcode, error);
    poll();
}

ProtocolError ProtocolEngine::dispatch(const ControlCommand& command) {
    uint8_t value[PROTOCOL_MAX_VALUE_SIZE];

    switch (command.opcode) {
        case OP_TARE:
            if (!m_calibration.beginTare()) {
                queueError(command.opcode, PROTO_ERR_UNCALIBRATED);
                return PROTO_ERR_UNCALIBRATED;
            }
            return PROTO_OK;

        case OP_START_MEASUREMENT:
            if (m_state == STREAM_IDLE) {
                m_state = STREAM_STREAMING;
                m_stream_start_us = m_clock();
                m_weight_pending = false;
                DEBUG_PRINTLN(g_debug_protocol, "Protocol: streaming started");
            }
            return PROTO_OK;

        case OP_STOP_MEASUREMENT:
            if (m_state == STREAM_STREAMING) {
                DEBUG_PRINTLN(g_debug_protocol, "Protocol: streaming stopped");
            }
            m_state = STREAM_IDLE;
            m_weight_pending = false;
            return PROTO_OK;

        case OP_START_PEAK_RFD:
        case OP_START_PEAK_RFD_SERIES:
            queueError(command.opcode, PROTO_ERR_UNSUPPORTED);
            return PROTO_ERR_UNSUPPORTED;

        case OP_ADD_CALIBRATION_POINT:
        case OP_SAVE_CALIBRATION: {
            CalStatus status = (command.opcode == OP_ADD_CALIBRATION_POINT)
                ? m_calibration.addPoint(command.reference_kg)
                : m_calibration.save();
            if (status != CAL_OK) {
                ProtocolError error = (ProtocolError)(PROTO_ERR_CALIBRATION_BASE + status);
                queueError(command.opcode, error);
                return error;
            }
            return PROTO_OK;
        }

        case OP_GET_APP_VERSION: {
            const char* version = m_config.app_version != nullptr ? m_config.app_version : "";
            queueResponse(protocolEncodeResponse((const uint8_t*)version, strlen(version)));
            return PROTO_OK;
        }

        case OP_GET_ERROR_INFO:
            queueResponse(protocolEncodeResponse((const uint8_t*)m_error_info, strlen(m_error_info)));
            return PROTO_OK;

        case OP_CLEAR_ERROR_INFO:
            m_error_info[0] = '\0';
            return PROTO_OK;

        case OP_SHUTDOWN:
            // Nothing to power down; the peer drops the link itself
            DEBUG_PRINTLN(g_debug_protocol, "Protocol: shutdown requested (ignored)");
            return PROTO_OK;

        case OP_SAMPLE_BATTERY:
            putLe32(value, m_battery_mv);
            queueResponse(protocolEncodeResponse(value, 4));
            return PROTO_OK;

        case OP_GET_PROGRESSOR_ID: {
            size_t length = protocolEncodeDeviceId(m_config.device_id, value);
            queueResponse(protocolEncodeResponse(value, length));
            return PROTO_OK;
        }

        case OP_GET_CALIBRATION_CURVE: {
            CalibrationMapping mapping;
            if (!m_calibration.getMapping(mapping)) {
                queueError(command.opcode, PROTO_ERR_UNCALIBRATED);
                return PROTO_ERR_UNCALIBRATED;
            }
            uint64_t gradient_bits;
            memcpy(&gradient_bits, &mapping.gradient, sizeof(gradient_bits));
            putLe32(value, (uint32_t)mapping.zero_raw);
            putLe64(value + 4, gradient_bits);
            queueResponse(protocolEncodeResponse(value, 12));
            return PROTO_OK;
        }

        default:
            // protocolDecode only passes known opcodes
            queueError(command.opcode, PROTO_ERR_UNKNOWN_OPCODE);
            return PROTO_ERR_UNKNOWN_OPCODE;
    }
}

void ProtocolEngine::onDisconnect() {
    if (m_state == STREAM_STREAMING) {
        DEBUG_PRINTLN(g_debug_protocol, "Protocol: peer disconnected - streaming stopped");
    }
    m_state = STREAM_IDLE;
    discardPending();
}

void ProtocolEngine::publishWeight(float weight_kg, uint32_t timestamp_us) {
    if (m_state != STREAM_STREAMING) {
        return;
    }

    // The microsecond clock wraps, so "before the start" only means a sample
    // taken a little ahead of the start command being handled
    uint32_t elapsed = timestamp_us - m_stream_start_us;
    uint32_t lead = m_stream_start_us - timestamp_us;
    if (lead != 0 && lead <= STREAM_REORDER_WINDOW_US) {
        m_stream_start_us = timestamp_us;
        elapsed = 0;
    }

    m_weight = protocolEncodeWeight(weight_kg, elapsed);
    m_weight_pending = true;
    poll();
}

void ProtocolEngine::poll() {
    DataPoint point;
    while (m_responses.peek(point)) {
        SendResult result = send(point);
        if (result == SEND_BUSY) {
            return;
        }
        if (result == SEND_NOT_CONNECTED) {
            discardPending();
            return;
        }
        m_responses.pop(point);
    }

    if (m_weight_pending) {
        SendResult result = send(m_weight);
        if (result == SEND_BUSY) {
            return;
        }
        if (result == SEND_NOT_CONNECTED) {
            discardPending();
            return;
        }
        m_weight_pending = false;
    }
}

void ProtocolEngine::setBattery(uint32_t millivolts, bool low) {
    if (low && !m_battery_low) {
        logPrintf("Protocol: battery low (%lu mV)\n", (unsigned long)millivolts);
    }
    m_battery_mv = millivolts;
    m_battery_low = low;
}

void ProtocolEngine::recordError(const char* text) {
    strncpy(m_error_info, text, PROTOCOL_MAX_VALUE_SIZE);
    m_error_info[PROTOCOL_MAX_VALUE_SIZE] = '\0';
}

bool ProtocolEngine::pendingWeight(DataPoint& point) const {
    if (!m_weight_pending) {
        return false;
    }
    point = m_weight;
    return true;
}

void ProtocolEngine::queueResponse(const DataPoint& point) {
    if (!m_responses.push(point)) {
        m_dropped_responses++;
        logPrintf("Protocol: response queue full - dropped code 0x%02X\n", point.code);
    }
}

void ProtocolEngine::queueError(uint8_t opcode, uint8_t error) {
    recordError(protocolErrorName((ProtocolError)error));
    queueResponse(protocolEncodeError(opcode, error));
}

void ProtocolEngine::discardPending() {
    m_responses.clear();
    m_weight_pending = false;
}

SendResult ProtocolEngine::send(const DataPoint& point) {
    SendResult result = m_transport.sendNotification((const uint8_t*)&point, dataPointSize(point));
    if (result == SEND_OK) {
        m_sent++;
        DEBUG_PRINTF(g_debug_protocol, "Protocol: sent code 0x%02X (%u bytes)\n",
                     point.code, (unsigned)point.length);
    }
    return result;
}
