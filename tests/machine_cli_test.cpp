/*
 * Console command tests (routing, device traffic, output format)
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/command_router.h"
#include "cli/machine_cli.h"
#include "cli/port_cli.h"
#include "cli/system_cli.h"
#include "controller/grbl_controller.h"
#include "storage/config_reader.h"
#include "mock_serial_channel.h"

class MachineCliTest : public ::testing::Test {
protected:
    MachineCliTest()
        : _device(std::make_shared<MockGrblDevice>()),
          _controller(controllerSettings(), _device->factory()),
          _portCli(&_controller),
          _machineCli(&_controller, &_settings) {
        _device->setStatusReply("<Idle|MPos:0.000,0.000,0.000|FS:0,0|Ov:100,100,100>");

        _settings.port = "/dev/ttyMOCK0";
        _settings.baudRate = 115200;
        _settings.jogFeed = 1000.0;
        _settings.jogStep = 2.5;

        _systemCli.setVersion("0.0.1");
        _router.addHandler(&_systemCli);
        _router.addHandler(&_portCli);
        _router.addHandler(&_machineCli);
        _systemCli.registerHandlers(_router.getHandlers());
    }

    ~MachineCliTest() override {
        _controller.stopPolling();
        _controller.disconnect();
    }

    static ControllerSettings controllerSettings() {
        ControllerSettings s;
        s.command = RequestPolicy{200, 0};
        s.homing = RequestPolicy{200, 0};
        s.statusTimeoutMs = 100;
        s.startupTimeoutMs = 200;
        return s;
    }

    // Routes one line and returns what the handlers printed
    std::string run(const std::string& line, bool* handled = nullptr) {
        testing::internal::CaptureStdout();
        bool result = _router.routeCommand(line);
        std::string output = testing::internal::GetCapturedStdout();
        if (handled) *handled = result;
        return output;
    }

    static bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }

    std::shared_ptr<MockGrblDevice> _device;
    LaserFXSettings _settings;
    GrblController _controller;
    CommandRouter _router;
    SystemCli _systemCli;
    PortCli _portCli;
    MachineCli _machineCli;
};

TEST_F(MachineCliTest, UnknownCommandNotHandled) {
    bool handled = true;
    run("laser-on", &handled);
    EXPECT_FALSE(handled);
}

TEST_F(MachineCliTest, HelpListsHandlersAsJson) {
    bool handled = false;
    std::string out = run("help --json", &handled);
    EXPECT_TRUE(handled);
    EXPECT_EQ(out, "{\"commands\":[\"System\",\"Ports\",\"Machine\"]}\n");
}

TEST_F(MachineCliTest, VersionJson) {
    EXPECT_EQ(run("VERSION -j"), "{\"version\":\"v0.0.1\",\"protocol\":\"grbl-1.1\"}\n");
}

TEST_F(MachineCliTest, BaudRatesJson) {
    std::string out = run("bauds --json");
    EXPECT_EQ(out.compare(0, 14, "{\"baudRates\":["), 0);
    EXPECT_TRUE(contains(out, "115200"));
}

TEST_F(MachineCliTest, ConnectUsesConfiguredPort) {
    std::string out = run("connect");
    EXPECT_TRUE(contains(out, "Connecting to /dev/ttyMOCK0 @ 115200"));
    EXPECT_TRUE(contains(out, "Connected: Grbl 1.1h"));
    EXPECT_EQ(_device->openCount(), 1);
}

TEST_F(MachineCliTest, ConnectRejectsBadBaud) {
    std::string out = run("connect /dev/ttyMOCK0 fast");
    EXPECT_TRUE(contains(out, "Invalid baud rate: fast"));
    EXPECT_EQ(_device->openCount(), 0);
}

TEST_F(MachineCliTest, CommandWithoutConnectionReportsError) {
    EXPECT_EQ(run("home"), "Homing...\nError: [NOT_CONNECTED] not connected\n");
}

TEST_F(MachineCliTest, JsonErrorReport) {
    std::string out = run("unlock --json");
    EXPECT_EQ(out.compare(0, 30, "{\"command\":\"unlock\",\"ok\":false"), 0);
    EXPECT_TRUE(contains(out, "\"code\":\"NOT_CONNECTED\""));
}

TEST_F(MachineCliTest, JogWritesOneLine) {
    run("connect");
    EXPECT_EQ(run("jog x -5"), "OK\n");

    std::vector<std::string> lines = _device->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "$J=G91 X-5.000 F1000.000");
}

TEST_F(MachineCliTest, JogBareAxisUsesStepAndFeedKeyword) {
    run("connect");
    EXPECT_EQ(run("jog y feed 600"), "OK\n");
    EXPECT_EQ(run("jog z 1.5 abs"), "OK\n");

    std::vector<std::string> lines = _device->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "$J=G91 Y2.500 F600.000");
    EXPECT_EQ(lines[1], "$J=G90 Z1.500 F1000.000");
}

TEST_F(MachineCliTest, JogWithoutAxisRejected) {
    run("connect");
    std::string out = run("jog feed 500");
    EXPECT_EQ(out.compare(0, 21, "Error: [INVALID_STATE"), 0);
    EXPECT_TRUE(_device->lines().empty());
}

TEST_F(MachineCliTest, FrameSendsProgram) {
    run("connect");
    EXPECT_EQ(run("frame 0 50 0 20 feed 3000 power 10 mode dynamic"), "OK\n");

    std::vector<std::string> lines = _device->lines();
    EXPECT_EQ(lines, GrblProtocol::buildFrameProgram(FrameBounds{0, 50, 0, 20}, 3000.0, 10,
                                                     Units::Millimeters, LaserMode::Dynamic));
}

TEST_F(MachineCliTest, FrameUsageAndModeChecks) {
    run("connect");
    EXPECT_EQ(run("frame 0 50 0").compare(0, 12, "Usage: frame"), 0);
    EXPECT_EQ(run("frame 0 50 0 20 mode plasma"), "Unknown laser mode: plasma\n");
    EXPECT_TRUE(_device->lines().empty());
}

TEST_F(MachineCliTest, OverridesSendRealtimeBytes) {
    run("connect");
    EXPECT_EQ(run("ovr feed +10"), "OK\n");
    EXPECT_EQ(run("ovr rapid 25"), "OK\n");
    EXPECT_EQ(run("ovr spindle -1"), "OK\n");
    EXPECT_TRUE(contains(run("ovr rapid 30"), "Usage: ovr rapid"));

    std::string bytes = _device->realtime();
    EXPECT_NE(bytes.find((char)GrblProtocol::RT_FEED_OVR_COARSE_PLUS), std::string::npos);
    EXPECT_NE(bytes.find((char)GrblProtocol::RT_RAPID_OVR_QUARTER), std::string::npos);
    EXPECT_NE(bytes.find((char)GrblProtocol::RT_SPINDLE_OVR_FINE_MINUS), std::string::npos);
}

TEST_F(MachineCliTest, StatusJson) {
    run("connect");
    std::string out = run("status --json");
    EXPECT_TRUE(contains(out, "{\"connection\":{\"state\":\"connected\""));
    EXPECT_TRUE(contains(out, "\"state\":\"Idle\""));
    EXPECT_TRUE(contains(out, "\"fresh\":true"));
}

TEST_F(MachineCliTest, PollerStartStop) {
    EXPECT_EQ(run("poller start 50"), "Invalid poll interval\n");

    run("connect");
    EXPECT_EQ(run("poller start 50"), "Poller started\n");
    EXPECT_TRUE(_controller.isPolling());
    EXPECT_EQ(run("poller stop"), "Poller stopped\n");
    EXPECT_FALSE(_controller.isPolling());
}

TEST_F(MachineCliTest, DisconnectIsIdempotent) {
    run("connect");
    EXPECT_EQ(run("disconnect"), "OK\n");
    EXPECT_EQ(run("close"), "OK\n");
    EXPECT_EQ(_device->closeCount(), 1);
}

TEST_F(MachineCliTest, SettingsQueryPrintsLines) {
    _device->setReply("$$", "$0=10\r\n$30=1000\r\nok");
    run("connect");

    EXPECT_EQ(run("settings"), "$0=10\n$30=1000\nOK\n");
    EXPECT_EQ(run("$$ --json"),
              "{\"command\":\"settings\",\"ok\":true,\"lines\":[\"$0=10\",\"$30=1000\"]}\n");
}

TEST_F(MachineCliTest, CoolantNeedsTarget) {
    run("connect");
    EXPECT_EQ(run("coolant"), "Usage: coolant <flood|mist>\n");
    EXPECT_EQ(run("coolant mist"), "OK\n");
    EXPECT_TRUE(_device->waitForRealtime(GrblProtocol::RT_COOLANT_MIST_TOGGLE, 1, 1000));
}
