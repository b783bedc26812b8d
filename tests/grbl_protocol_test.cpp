/*
 * GRBL protocol codec tests
 */

#include <gtest/gtest.h>

#include <grbl_protocol.h>

// ============================================================================
// Jog
// ============================================================================

TEST(GrblProtocolJog, IncrementalSingleAxis) {
    EXPECT_EQ(GrblProtocol::buildJogCommand(10.0, std::nullopt, std::nullopt, 1000.0, true),
              "$J=G91 X10.000 F1000.000\n");
}

TEST(GrblProtocolJog, AbsoluteCarriesOnlyGivenAxes) {
    EXPECT_EQ(GrblProtocol::buildJogCommand(std::nullopt, -2.5, 0.125, 600.0, false),
              "$J=G90 Y-2.500 Z0.125 F600.000\n");
}

// ============================================================================
// Frame
// ============================================================================

TEST(GrblProtocolFrame, TracesRectangleAndEndsLaserOff) {
    FrameBounds b;
    b.xMin = 0.0;
    b.xMax = 50.0;
    b.yMin = 0.0;
    b.yMax = 20.0;

    std::vector<std::string> lines = GrblProtocol::buildFrameProgram(b, 3000.0, 10, Units::Millimeters,
                                                                     LaserMode::Dynamic);
    std::vector<std::string> expected = {
        "G21",
        "G90",
        "G0 X0.000 Y0.000",
        "M4 S10",
        "G1 X50.000 Y0.000 F3000.000",
        "G1 X50.000 Y20.000",
        "G1 X0.000 Y20.000",
        "G1 X0.000 Y0.000",
        "M5",
    };
    EXPECT_EQ(lines, expected);
}

TEST(GrblProtocolFrame, NormalisesInvertedBoundsAndInches) {
    FrameBounds b;
    b.xMin = 5.0;
    b.xMax = 1.0;
    b.yMin = 4.0;
    b.yMax = 2.0;

    std::vector<std::string> lines = GrblProtocol::buildFrameProgram(b, 100.0, 0, Units::Inches,
                                                                     LaserMode::Off);
    ASSERT_EQ(lines.size(), 9u);
    EXPECT_EQ(lines[0], "G20");
    EXPECT_EQ(lines[2], "G0 X1.000 Y2.000");
    EXPECT_EQ(lines[3], "M5");
    EXPECT_EQ(lines[5], "G1 X5.000 Y4.000");
}

TEST(GrblProtocolFrame, ConstantModeUsesM3) {
    FrameBounds b{0.0, 1.0, 0.0, 1.0};
    std::vector<std::string> lines = GrblProtocol::buildFrameProgram(b, 100.0, 250, Units::Millimeters,
                                                                     LaserMode::Constant);
    EXPECT_EQ(lines[3], "M3 S250");
}

// ============================================================================
// Overrides
// ============================================================================

TEST(GrblProtocolOverride, OneBytePerStep) {
    EXPECT_EQ(GrblProtocol::feedOverrideByte(OverrideAdjust::Reset), 0x90);
    EXPECT_EQ(GrblProtocol::feedOverrideByte(OverrideAdjust::CoarsePlus), 0x91);
    EXPECT_EQ(GrblProtocol::feedOverrideByte(OverrideAdjust::FineMinus), 0x94);
    EXPECT_EQ(GrblProtocol::spindleOverrideByte(OverrideAdjust::Reset), 0x99);
    EXPECT_EQ(GrblProtocol::spindleOverrideByte(OverrideAdjust::CoarseMinus), 0x9B);
    EXPECT_EQ(GrblProtocol::rapidOverrideByte(RapidPreset::Full), 0x95);
    EXPECT_EQ(GrblProtocol::rapidOverrideByte(RapidPreset::Quarter), 0x97);
    EXPECT_EQ(GrblProtocol::rapidPresetPercent(RapidPreset::Half), 50);
}

TEST(GrblProtocolOverride, RealtimeBytes) {
    EXPECT_TRUE(GrblProtocol::isRealtimeByte('?'));
    EXPECT_TRUE(GrblProtocol::isRealtimeByte(0x18));
    EXPECT_TRUE(GrblProtocol::isRealtimeByte(0x85));
    EXPECT_FALSE(GrblProtocol::isRealtimeByte('G'));
    EXPECT_FALSE(GrblProtocol::isRealtimeByte('\n'));
}

TEST(GrblProtocolQuery, SystemCommands) {
    EXPECT_STREQ(GrblProtocol::deviceQueryCommand(DeviceQuery::Settings), "$$");
    EXPECT_STREQ(GrblProtocol::deviceQueryCommand(DeviceQuery::ParserState), "$G");
    EXPECT_STREQ(GrblProtocol::deviceQueryCommand(DeviceQuery::BuildInfo), "$I");
}

// ============================================================================
// Responses
// ============================================================================

TEST(GrblProtocolResponse, OkErrorAlarm) {
    EXPECT_EQ(GrblProtocol::parseResponse("ok").type, GrblResponse::Type::Ok);
    EXPECT_EQ(GrblProtocol::parseResponse("ok\r").type, GrblResponse::Type::Ok);

    GrblResponse err = GrblProtocol::parseResponse("error:9");
    EXPECT_EQ(err.type, GrblResponse::Type::Error);
    EXPECT_EQ(err.code, 9u);

    GrblResponse alarm = GrblProtocol::parseResponse("ALARM:1");
    EXPECT_EQ(alarm.type, GrblResponse::Type::Alarm);
    EXPECT_EQ(alarm.code, 1u);
}

TEST(GrblProtocolResponse, MalformedCodesAreUnknown) {
    EXPECT_EQ(GrblProtocol::parseResponse("error:").type, GrblResponse::Type::Unknown);
    EXPECT_EQ(GrblProtocol::parseResponse("ALARM:x").type, GrblResponse::Type::Unknown);
    EXPECT_EQ(GrblProtocol::parseResponse("okay").type, GrblResponse::Type::Unknown);
}

TEST(GrblProtocolResponse, StatusReport) {
    GrblResponse resp = GrblProtocol::parseResponse("<Idle|MPos:1.000,2.000,3.000|FS:0,0>");
    ASSERT_EQ(resp.type, GrblResponse::Type::Status);
    EXPECT_EQ(resp.status.state, MachineState::Idle);
    EXPECT_DOUBLE_EQ(resp.status.machinePos.y, 2.0);
}

TEST(GrblProtocolResponse, WelcomeMessageSetting) {
    GrblResponse welcome = GrblProtocol::parseResponse("Grbl 1.1h ['$' for help]");
    EXPECT_EQ(welcome.type, GrblResponse::Type::Welcome);
    EXPECT_EQ(welcome.text, "Grbl 1.1h ['$' for help]");

    GrblResponse msg = GrblProtocol::parseResponse("[MSG:'$H'|'$X' to unlock]");
    EXPECT_EQ(msg.type, GrblResponse::Type::Message);
    EXPECT_EQ(msg.text, "'$H'|'$X' to unlock");

    GrblResponse gc = GrblProtocol::parseResponse("[GC:G0 G54 G17 G21 G90 G94 M5 M9 T0 F0 S0]");
    EXPECT_EQ(gc.type, GrblResponse::Type::Message);

    GrblResponse setting = GrblProtocol::parseResponse("$30=1000");
    EXPECT_EQ(setting.type, GrblResponse::Type::Setting);
    EXPECT_EQ(setting.code, 30u);
    EXPECT_EQ(setting.text, "1000");
}

TEST(GrblProtocolResponse, Descriptions) {
    EXPECT_STREQ(GrblProtocol::errorDescription(9), "G-code locked out (alarm or jog)");
    EXPECT_STREQ(GrblProtocol::errorDescription(999), "Unknown error");
    EXPECT_STREQ(GrblProtocol::alarmDescription(1), "Hard limit triggered");
    EXPECT_STREQ(GrblProtocol::responseTypeName(GrblResponse::Type::Welcome), "welcome");
}
