/*
 * GRBL status report parser tests
 */

#include <gtest/gtest.h>

#include <grbl_status.h>

TEST(GrblStatus, FullReport) {
    MachineStatus st;
    ASSERT_TRUE(GrblStatus::parseStatusReport(
        "<Run|MPos:10.500,-3.250,0.000|FS:1200,300|Ov:120,50,90|Pn:XP|A:S|Bf:15,128|Ln:42>", st));

    EXPECT_EQ(st.state, MachineState::Run);
    EXPECT_DOUBLE_EQ(st.machinePos.x, 10.5);
    EXPECT_DOUBLE_EQ(st.machinePos.y, -3.25);
    ASSERT_TRUE(st.feedRate.has_value());
    EXPECT_DOUBLE_EQ(*st.feedRate, 1200.0);
    EXPECT_DOUBLE_EQ(*st.spindleSpeed, 300.0);

    ASSERT_TRUE(st.overrides.has_value());
    EXPECT_EQ(st.overrides->feed, 120);
    EXPECT_EQ(st.overrides->rapid, 50);
    EXPECT_EQ(st.overrides->spindle, 90);

    ASSERT_TRUE(st.inputPins.has_value());
    EXPECT_EQ(*st.inputPins, InputPin::LIMIT_X | InputPin::PROBE);
    ASSERT_TRUE(st.accessories.has_value());
    EXPECT_TRUE(st.accessories->spindleCw);
    EXPECT_FALSE(st.accessories->floodCoolant);
    EXPECT_EQ(st.buffer->plannerBlocksFree, 15);
    EXPECT_EQ(st.buffer->rxBytesFree, 128);
    EXPECT_EQ(*st.lineNumber, 42u);
}

TEST(GrblStatus, AbsentFieldsStayEmpty) {
    MachineStatus st;
    ASSERT_TRUE(GrblStatus::parseStatusReport("<Idle|MPos:0.000,0.000,0.000>", st));
    EXPECT_FALSE(st.feedRate.has_value());
    EXPECT_FALSE(st.overrides.has_value());
    EXPECT_FALSE(st.inputPins.has_value());
    EXPECT_FALSE(st.workPos.has_value());
}

TEST(GrblStatus, SubStateAndWorkOffset) {
    MachineStatus st;
    ASSERT_TRUE(GrblStatus::parseStatusReport("<Hold:1|MPos:12.000,8.000,1.000|WCO:2.000,3.000,1.000>", st));
    EXPECT_EQ(st.state, MachineState::Hold);
    ASSERT_TRUE(st.subState.has_value());
    EXPECT_EQ(*st.subState, 1);
    ASSERT_TRUE(st.workPos.has_value());
    EXPECT_DOUBLE_EQ(st.workPos->x, 10.0);
    EXPECT_DOUBLE_EQ(st.workPos->y, 5.0);
    EXPECT_DOUBLE_EQ(st.workPos->z, 0.0);
}

TEST(GrblStatus, UnknownStateAndFieldsTolerated) {
    MachineStatus st;
    ASSERT_TRUE(GrblStatus::parseStatusReport("<Tool|MPos:1.000,1.000,1.000|XYZ:7>", st));
    EXPECT_EQ(st.state, MachineState::Unknown);
    EXPECT_DOUBLE_EQ(st.machinePos.z, 1.0);
}

TEST(GrblStatus, RejectsNonReports) {
    MachineStatus st;
    EXPECT_FALSE(GrblStatus::parseStatusReport("Idle|MPos:0,0,0", st));
    EXPECT_FALSE(GrblStatus::parseStatusReport("<>", st));
    EXPECT_FALSE(GrblStatus::parseStatusReport("<Foo>", st));
    EXPECT_FALSE(GrblStatus::parseStatusReport("<Idle|FS:0,0|Ov:100,100,100>", st));
    EXPECT_FALSE(GrblStatus::parseStatusReport("<Idle|MPos:1.000,2.000>", st));
}

TEST(GrblStatus, WorkPositionOnlyReport) {
    MachineStatus st;
    ASSERT_TRUE(GrblStatus::parseStatusReport("<Idle|WPos:1.000,2.000,3.000|WCO:10.000,0.000,0.000>", st));
    EXPECT_DOUBLE_EQ(st.machinePos.x, 11.0);
    EXPECT_DOUBLE_EQ(st.machinePos.y, 2.0);
    EXPECT_DOUBLE_EQ(st.machinePos.z, 3.0);
    ASSERT_TRUE(st.workPos.has_value());
    EXPECT_DOUBLE_EQ(st.workPos->x, 1.0);

    // No WCO in this report: offset taken as zero
    ASSERT_TRUE(GrblStatus::parseStatusReport("<Run|WPos:4.000,5.000,0.000|FS:300,0>", st));
    EXPECT_EQ(st.state, MachineState::Run);
    EXPECT_DOUBLE_EQ(st.machinePos.x, 4.0);
    EXPECT_DOUBLE_EQ(st.machinePos.y, 5.0);
}

TEST(GrblStatus, StateNames) {
    EXPECT_STREQ(GrblStatus::machineStateName(MachineState::Alarm), "alarm");
    EXPECT_EQ(GrblStatus::parseMachineState("Door:0"), MachineState::Door);
    EXPECT_EQ(GrblStatus::parseMachineState("Sleep"), MachineState::Sleep);
}

TEST(GrblStatus, Position) {
    Position pos;
    EXPECT_TRUE(GrblStatus::parsePosition("1.5,2.5,-3.5", pos));
    EXPECT_DOUBLE_EQ(pos.z, -3.5);
    EXPECT_FALSE(GrblStatus::parsePosition("1.5,2.5", pos));
    EXPECT_FALSE(GrblStatus::parsePosition("a,b,c", pos));
}
