// test_protocol.cpp

#include <gtest/gtest.h>

#include <math.h>
#include <string.h>
#include <string>
#include <vector>

#include "fake_flash.h"
#include "fake_transport.h"
#include "protocol.h"

static uint32_t g_fake_now_us = 0;

static uint32_t fakeClock() {
    return g_fake_now_us;
}

static std::vector<uint8_t> frame(uint8_t opcode) {
    return std::vector<uint8_t>(1, opcode);
}

static std::vector<uint8_t> calPointFrame(float value, bool big_endian) {
    uint32_t bits;
    memcpy(&bits, &value, sizeof(bits));
    std::vector<uint8_t> data(1, OP_ADD_CALIBRATION_POINT);
    for (int i = 0; i < 4; i++) {
        int shift = big_endian ? (24 - 8 * i) : (8 * i);
        data.push_back((uint8_t)(bits >> shift));
    }
    return data;
}

// ==================== Decode ====================

TEST(ProtocolDecode, EmptyFrameIsMalformed) {
    ControlCommand command;
    EXPECT_EQ(PROTO_ERR_MALFORMED_FRAME,
              protocolDecode(nullptr, 0, FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
}

TEST(ProtocolDecode, ShortCalibrationPointIsMalformed) {
    const uint8_t data[] = {OP_ADD_CALIBRATION_POINT, 0x00, 0x00, 0xA0};
    ControlCommand command;
    command.reference_kg = 123.0f;
    EXPECT_EQ(PROTO_ERR_MALFORMED_FRAME,
              protocolDecode(data, sizeof(data), FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(123.0f, command.reference_kg);
}

TEST(ProtocolDecode, PayloadOnNoPayloadOpcodeIsMalformed) {
    const uint8_t data[] = {OP_START_MEASUREMENT, 0x01};
    ControlCommand command;
    EXPECT_EQ(PROTO_ERR_MALFORMED_FRAME,
              protocolDecode(data, sizeof(data), FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
}

TEST(ProtocolDecode, UnknownOpcode) {
    const uint8_t data[] = {0x42};
    ControlCommand command;
    EXPECT_EQ(PROTO_ERR_UNKNOWN_OPCODE,
              protocolDecode(data, sizeof(data), FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
}

TEST(ProtocolDecode, ByteOrders) {
    std::vector<uint8_t> little = calPointFrame(20.0f, false);
    std::vector<uint8_t> big = calPointFrame(20.0f, true);
    ControlCommand command;

    ASSERT_EQ(PROTO_OK, protocolDecode(little.data(), little.size(), FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(20.0f, command.reference_kg);
    ASSERT_EQ(PROTO_OK, protocolDecode(little.data(), little.size(), FLOAT_ORDER_AUTO, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(20.0f, command.reference_kg);

    ASSERT_EQ(PROTO_OK, protocolDecode(big.data(), big.size(), FLOAT_ORDER_BIG, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(20.0f, command.reference_kg);
    ASSERT_EQ(PROTO_OK, protocolDecode(big.data(), big.size(), FLOAT_ORDER_AUTO, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(20.0f, command.reference_kg);
}

TEST(ProtocolDecode, AutoAcceptsZeroAndFractionalWeights) {
    ControlCommand command;
    std::vector<uint8_t> zero = calPointFrame(0.0f, false);
    ASSERT_EQ(PROTO_OK, protocolDecode(zero.data(), zero.size(), FLOAT_ORDER_AUTO, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(0.0f, command.reference_kg);

    std::vector<uint8_t> small = calPointFrame(2.5f, true);
    ASSERT_EQ(PROTO_OK, protocolDecode(small.data(), small.size(), FLOAT_ORDER_AUTO, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(2.5f, command.reference_kg);
}

TEST(ProtocolDecode, AutoRejectsImplausibleInBothOrders) {
    std::vector<uint8_t> data = calPointFrame(5000.0f, false);  // Over capacity, BE is tiny
    ControlCommand command;
    EXPECT_EQ(PROTO_ERR_MALFORMED_FRAME,
              protocolDecode(data.data(), data.size(), FLOAT_ORDER_AUTO, SCALE_CAPACITY_KG, command));
}

TEST(ProtocolDecode, NonFiniteReferenceIsMalformed) {
    std::vector<uint8_t> data = calPointFrame(NAN, false);
    ControlCommand command;
    EXPECT_EQ(PROTO_ERR_MALFORMED_FRAME,
              protocolDecode(data.data(), data.size(), FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
}

TEST(ProtocolDecode, LengthPrefixedCalibrationPoint) {
    std::vector<uint8_t> data = calPointFrame(12.5f, false);
    data.insert(data.begin() + 1, (uint8_t)PROTOCOL_CAL_POINT_SIZE);
    ControlCommand command;
    ASSERT_EQ(PROTO_OK, protocolDecode(data.data(), data.size(), FLOAT_ORDER_LITTLE, SCALE_CAPACITY_KG, command));
    EXPECT_FLOAT_EQ(12.5f, command.reference_kg);
}

TEST(ProtocolEncode, DeviceIdTrimsHighZeroBytes) {
    uint8_t out[8];
    ASSERT_EQ(3u, protocolEncodeDeviceId(0x00000000000A0B0Cull, out));
    EXPECT_EQ(0x0C, out[0]);
    EXPECT_EQ(0x0B, out[1]);
    EXPECT_EQ(0x0A, out[2]);

    EXPECT_EQ(1u, protocolEncodeDeviceId(0, out));
    EXPECT_EQ(0x00, out[0]);
    EXPECT_EQ(8u, protocolEncodeDeviceId(0x8000000000000001ull, out));
}

TEST(ProtocolEncode, WeightFrameLayout) {
    DataPoint point = protocolEncodeWeight(1.5f, 0x01020304);
    EXPECT_EQ(RES_WEIGHT_MEASUREMENT, point.code);
    EXPECT_EQ(8, point.length);
    EXPECT_EQ(10u, dataPointSize(point));
    std::vector<uint8_t> bytes((const uint8_t*)&point, (const uint8_t*)&point + dataPointSize(point));
    EXPECT_FLOAT_EQ(1.5f, frameFloat(bytes, 2));
    EXPECT_EQ(0x01020304u, frameU32(bytes, 6));
}

// ==================== Engine ====================

class ProtocolEngineTest : public ::testing::Test {
protected:
    ProtocolEngineTest()
        : filter(3),
          store(flash),
          calibration(filter, store),
          engine(calibration, transport, makeConfig(), fakeClock) {
        g_fake_now_us = 0;
    }

    static ProtocolConfig makeConfig() {
        ProtocolConfig config = protocolGetDefaultConfig();
        config.app_version = "1.2.0";
        config.device_id = 0x0000A1B2C3D4E5F6ull;
        config.float_order = FLOAT_ORDER_LITTLE;
        return config;
    }

    ProtocolError receive(const std::vector<uint8_t>& data) {
        return engine.onFrameReceived(data.data(), data.size());
    }

    void settle(int32_t raw) {
        int32_t out;
        for (uint8_t i = 0; i < filter.size(); i++) {
            filter.push(raw, out);
        }
    }

    void calibrate() {
        settle(1000);
        ASSERT_EQ(PROTO_OK, receive(calPointFrame(0.0f, false)));
        settle(5000);
        ASSERT_EQ(PROTO_OK, receive(calPointFrame(50.0f, false)));
        ASSERT_EQ(PROTO_OK, receive(frame(OP_SAVE_CALIBRATION)));
    }

    std::vector<uint8_t> lastFrame() const {
        return transport.frames.empty() ? std::vector<uint8_t>() : transport.frames.back();
    }

    MedianFilter filter;
    FakeFlash flash;
    CalibrationStore store;
    CalibrationEngine calibration;
    FakeTransport transport;
    ProtocolEngine engine;
};

TEST_F(ProtocolEngineTest, UnknownOpcodeGetsErrorResponse) {
    EXPECT_EQ(PROTO_ERR_UNKNOWN_OPCODE, receive(frame(0x42)));
    ASSERT_EQ(1u, transport.frames.size());
    const uint8_t expected[] = {RES_ERROR, 2, 0x42, PROTO_ERR_UNKNOWN_OPCODE};
    EXPECT_EQ(std::vector<uint8_t>(expected, expected + 4), lastFrame());
    EXPECT_STREQ("UnknownOp", engine.errorInfo());
}

TEST_F(ProtocolEngineTest, MalformedCalibrationPointLeavesSessionAlone) {
    settle(1000);
    const uint8_t data[] = {OP_ADD_CALIBRATION_POINT, 0x00, 0x00, 0xA0};
    EXPECT_EQ(PROTO_ERR_MALFORMED_FRAME, engine.onFrameReceived(data, sizeof(data)));
    EXPECT_EQ(0, calibration.session().count());

    const uint8_t expected[] = {RES_ERROR, 2, OP_ADD_CALIBRATION_POINT, PROTO_ERR_MALFORMED_FRAME};
    EXPECT_EQ(std::vector<uint8_t>(expected, expected + 4), lastFrame());
}

TEST_F(ProtocolEngineTest, CalibrationPointBeforeFirstSample) {
    EXPECT_EQ(PROTO_ERR_CALIBRATION_BASE + CAL_ERR_NO_SAMPLE, receive(calPointFrame(0.0f, false)));
    const uint8_t expected[] = {RES_ERROR, 2, OP_ADD_CALIBRATION_POINT, 0x11};
    EXPECT_EQ(std::vector<uint8_t>(expected, expected + 4), lastFrame());
}

TEST_F(ProtocolEngineTest, SaveErrorsAreReported) {
    EXPECT_EQ(PROTO_ERR_CALIBRATION_BASE + CAL_ERR_INSUFFICIENT_POINTS, receive(frame(OP_SAVE_CALIBRATION)));
    EXPECT_EQ(0x12, lastFrame()[3]);

    settle(4000);
    receive(calPointFrame(0.0f, false));
    receive(calPointFrame(10.0f, false));
    EXPECT_EQ(PROTO_ERR_CALIBRATION_BASE + CAL_ERR_DEGENERATE, receive(frame(OP_SAVE_CALIBRATION)));
    const uint8_t expected[] = {RES_ERROR, 2, OP_SAVE_CALIBRATION, 0x13};
    EXPECT_EQ(std::vector<uint8_t>(expected, expected + 4), lastFrame());
    EXPECT_STREQ("Degenerate", engine.errorInfo());
    EXPECT_FALSE(calibration.isCalibrated());
}

TEST_F(ProtocolEngineTest, StorageFaultIsReportedAndRecorded) {
    flash.setFailWrites(true);
    settle(1000);
    receive(calPointFrame(0.0f, false));
    settle(5000);
    receive(calPointFrame(50.0f, false));
    EXPECT_EQ(PROTO_ERR_CALIBRATION_BASE + CAL_ERR_STORAGE_FAULT, receive(frame(OP_SAVE_CALIBRATION)));
    EXPECT_EQ(0x14, lastFrame()[3]);

    receive(frame(OP_GET_ERROR_INFO));
    std::vector<uint8_t> info = lastFrame();
    EXPECT_EQ(RES_CMD_RESPONSE, info[0]);
    EXPECT_EQ("StorageFault", std::string(info.begin() + 2, info.end()));

    receive(frame(OP_CLEAR_ERROR_INFO));
    receive(frame(OP_GET_ERROR_INFO));
    EXPECT_EQ(2u, lastFrame().size());
}

TEST_F(ProtocolEngineTest, SuccessfulSaveSendsNothing) {
    calibrate();
    EXPECT_TRUE(transport.frames.empty());
    EXPECT_TRUE(calibration.isCalibrated());
}

TEST_F(ProtocolEngineTest, StreamsWeightsWithRelativeTimestamps) {
    calibrate();
    g_fake_now_us = 10000;
    ASSERT_EQ(PROTO_OK, receive(frame(OP_START_MEASUREMENT)));
    EXPECT_TRUE(engine.isStreaming());

    engine.publishWeight(25.0f, 12500);
    ASSERT_EQ(1u, transport.frames.size());
    EXPECT_EQ(RES_WEIGHT_MEASUREMENT, lastFrame()[0]);
    EXPECT_FLOAT_EQ(25.0f, frameFloat(lastFrame(), 2));
    EXPECT_EQ(2500u, frameU32(lastFrame(), 6));

    // Sampled before the start command was handled: becomes the new origin
    engine.publishWeight(24.0f, 9000);
    EXPECT_EQ(0u, frameU32(lastFrame(), 6));
    engine.publishWeight(24.5f, 9100);
    EXPECT_EQ(100u, frameU32(lastFrame(), 6));
}

TEST_F(ProtocolEngineTest, TimestampsKeepCountingPastHalfTheClockRange) {
    ASSERT_EQ(PROTO_OK, receive(frame(OP_START_MEASUREMENT)));

    engine.publishWeight(1.0f, 2100000000u);
    EXPECT_EQ(2100000000u, frameU32(lastFrame(), 6));
    engine.publishWeight(1.0f, 2200000000u);
    EXPECT_EQ(2200000000u, frameU32(lastFrame(), 6));
    engine.publishWeight(1.0f, 2200012500u);
    EXPECT_EQ(2200012500u, frameU32(lastFrame(), 6));
}

TEST_F(ProtocolEngineTest, TimestampsSurviveClockWrap) {
    g_fake_now_us = 0xFFFFF000u;
    ASSERT_EQ(PROTO_OK, receive(frame(OP_START_MEASUREMENT)));

    engine.publishWeight(1.0f, 0x00000F00u);
    EXPECT_EQ(0x1F00u, frameU32(lastFrame(), 6));

    // Just before the start, across the wrap
    engine.publishWeight(1.0f, 0xFFFFE000u);
    EXPECT_EQ(0u, frameU32(lastFrame(), 6));
}

TEST_F(ProtocolEngineTest, StartIsIdempotentAndStopDropsPending) {
    ASSERT_EQ(PROTO_OK, receive(frame(OP_START_MEASUREMENT)));
    ASSERT_EQ(PROTO_OK, receive(frame(OP_START_MEASUREMENT)));
    EXPECT_TRUE(engine.isStreaming());
    EXPECT_TRUE(transport.frames.empty());

    transport.result = SEND_BUSY;
    engine.publishWeight(1.0f, 100);
    DataPoint pending;
    EXPECT_TRUE(engine.pendingWeight(pending));

    ASSERT_EQ(PROTO_OK, receive(frame(OP_STOP_MEASUREMENT)));
    EXPECT_FALSE(engine.isStreaming());
    EXPECT_FALSE(engine.pendingWeight(pending));

    engine.publishWeight(2.0f, 200);
    EXPECT_FALSE(engine.pendingWeight(pending));
}

TEST_F(ProtocolEngineTest, BackpressureKeepsOnlyLatestWeight) {
    receive(frame(OP_START_MEASUREMENT));
    transport.result = SEND_BUSY;

    for (int i = 0; i < 10; i++) {
        engine.publishWeight((float)i, 1000 + i);
    }
    EXPECT_TRUE(transport.frames.empty());

    DataPoint pending;
    ASSERT_TRUE(engine.pendingWeight(pending));
    std::vector<uint8_t> bytes((const uint8_t*)&pending, (const uint8_t*)&pending + dataPointSize(pending));
    EXPECT_FLOAT_EQ(9.0f, frameFloat(bytes, 2));

    transport.result = SEND_OK;
    engine.poll();
    ASSERT_EQ(1u, transport.frames.size());
    EXPECT_FLOAT_EQ(9.0f, frameFloat(lastFrame(), 2));
    EXPECT_FALSE(engine.pendingWeight(pending));
}

TEST_F(ProtocolEngineTest, ResponsesFlushBeforeWeight) {
    receive(frame(OP_START_MEASUREMENT));
    transport.result = SEND_BUSY;
    engine.publishWeight(3.0f, 50);
    receive(frame(OP_GET_APP_VERSION));
    EXPECT_EQ(1u, engine.pendingResponses());

    transport.result = SEND_OK;
    engine.poll();
    ASSERT_EQ(2u, transport.frames.size());
    EXPECT_EQ(RES_CMD_RESPONSE, transport.frames[0][0]);
    EXPECT_EQ("1.2.0", std::string(transport.frames[0].begin() + 2, transport.frames[0].end()));
    EXPECT_EQ(RES_WEIGHT_MEASUREMENT, transport.frames[1][0]);
}

TEST_F(ProtocolEngineTest, FullResponseQueueDropsNewest) {
    transport.result = SEND_BUSY;
    for (int i = 0; i < RESPONSE_QUEUE_SIZE + 2; i++) {
        receive(frame(OP_GET_APP_VERSION));
    }
    EXPECT_EQ((size_t)RESPONSE_QUEUE_SIZE, engine.pendingResponses());
    EXPECT_EQ(2u, engine.droppedResponses());
}

TEST_F(ProtocolEngineTest, NotConnectedDiscardsEverything) {
    receive(frame(OP_START_MEASUREMENT));
    transport.result = SEND_BUSY;
    engine.publishWeight(1.0f, 10);
    receive(frame(OP_SAMPLE_BATTERY));

    transport.result = SEND_NOT_CONNECTED;
    engine.poll();
    EXPECT_EQ(0u, engine.pendingResponses());
    DataPoint pending;
    EXPECT_FALSE(engine.pendingWeight(pending));
}

TEST_F(ProtocolEngineTest, DisconnectStopsStreaming) {
    receive(frame(OP_START_MEASUREMENT));
    transport.result = SEND_BUSY;
    engine.publishWeight(1.0f, 10);

    engine.onDisconnect();
    EXPECT_EQ(STREAM_IDLE, engine.state());
    DataPoint pending;
    EXPECT_FALSE(engine.pendingWeight(pending));
}

TEST_F(ProtocolEngineTest, PeakRfdIsUnsupported) {
    EXPECT_EQ(PROTO_ERR_UNSUPPORTED, receive(frame(OP_START_PEAK_RFD)));
    EXPECT_EQ(PROTO_ERR_UNSUPPORTED, receive(frame(OP_START_PEAK_RFD_SERIES)));
    const uint8_t expected[] = {RES_ERROR, 2, OP_START_PEAK_RFD_SERIES, PROTO_ERR_UNSUPPORTED};
    EXPECT_EQ(std::vector<uint8_t>(expected, expected + 4), lastFrame());
    EXPECT_FALSE(engine.isStreaming());
}

TEST_F(ProtocolEngineTest, ProgressorIdIsTrimmedLittleEndian) {
    receive(frame(OP_GET_PROGRESSOR_ID));
    const uint8_t expected[] = {RES_CMD_RESPONSE, 6, 0xF6, 0xE5, 0xD4, 0xC3, 0xB2, 0xA1};
    EXPECT_EQ(std::vector<uint8_t>(expected, expected + 8), lastFrame());
}

TEST_F(ProtocolEngineTest, SampleBatteryReportsMillivolts) {
    engine.setBattery(3987, false);
    receive(frame(OP_SAMPLE_BATTERY));
    std::vector<uint8_t> response = lastFrame();
    ASSERT_EQ(6u, response.size());
    EXPECT_EQ(4, response[1]);
    EXPECT_EQ(3987u, frameU32(response, 2));
}

TEST_F(ProtocolEngineTest, CalibrationCurveReflectsMapping) {
    receive(frame(OP_GET_CALIBRATION_CURVE));
    const uint8_t uncalibrated[] = {RES_ERROR, 2, OP_GET_CALIBRATION_CURVE, PROTO_ERR_UNCALIBRATED};
    EXPECT_EQ(std::vector<uint8_t>(uncalibrated, uncalibrated + 4), lastFrame());

    calibrate();
    receive(frame(OP_GET_CALIBRATION_CURVE));
    std::vector<uint8_t> curve = lastFrame();
    ASSERT_EQ(14u, curve.size());
    EXPECT_EQ(RES_CMD_RESPONSE, curve[0]);
    EXPECT_EQ(12, curve[1]);
    EXPECT_EQ(1000u, frameU32(curve, 2));

    uint64_t bits = (uint64_t)frameU32(curve, 6) | ((uint64_t)frameU32(curve, 10) << 32);
    double gradient;
    memcpy(&gradient, &bits, sizeof(gradient));
    EXPECT_DOUBLE_EQ(50.0 / 4000.0, gradient);
}

TEST_F(ProtocolEngineTest, TareRequiresCalibration) {
    EXPECT_EQ(PROTO_ERR_UNCALIBRATED, receive(frame(OP_TARE)));
    calibrate();
    EXPECT_EQ(PROTO_OK, receive(frame(OP_TARE)));
    EXPECT_TRUE(calibration.isTaring());
}

TEST_F(ProtocolEngineTest, LowBatteryWarnsAndDisconnects) {
    engine.setBattery(3300, true);
    EXPECT_EQ(PROTO_OK, receive(frame(OP_GET_APP_VERSION)));
    EXPECT_EQ(1, transport.disconnects);
    ASSERT_GE(transport.frames.size(), 1u);
    EXPECT_EQ(RES_LOW_POWER_WARNING, transport.frames[0][0]);
    EXPECT_EQ(0, transport.frames[0][1]);
}

TEST_F(ProtocolEngineTest, BigEndianPeerCalibrates) {
    engine.setFloatByteOrder(FLOAT_ORDER_BIG);
    settle(1000);
    ASSERT_EQ(PROTO_OK, receive(calPointFrame(0.0f, true)));
    settle(5000);
    ASSERT_EQ(PROTO_OK, receive(calPointFrame(50.0f, true)));
    ASSERT_EQ(PROTO_OK, receive(frame(OP_SAVE_CALIBRATION)));
    EXPECT_NEAR(25.0f, calibration.convert(3000), 1e-5);
}
