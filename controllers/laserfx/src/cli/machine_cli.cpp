/**
 * @file machine_cli.cpp
 * @brief Machine command handler implementation
 *
 * Every action prints "OK" or the controller error. With --json the
 * result is a single object: {"command":"home","ok":true} or
 * {"command":"home","ok":false,"error":{...}}.
 */

#include "machine_cli.h"
#include "command_parser.h"
#include "../controller/grbl_controller.h"
#include "../storage/config_reader.h"
#include "../debug_config.h"
#include <stdio.h>
#include <strings.h>

// ============================================================================
//  JSON HELPERS
// ============================================================================

static std::string jsonEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:
                if ((unsigned char)c < 0x20) continue;
                out += c;
        }
    }
    return out;
}

static void printErrorJson(const CommandError& error) {
    printf("{\"code\":\"%s\",\"message\":\"%s\"", errorCodeName(error.code),
           jsonEscape(error.message).c_str());
    if (error.details) {
        printf(",\"details\":\"%s\"", jsonEscape(*error.details).c_str());
    }
    printf("}");
}

static void printPositionJson(const char* key, const Position& pos) {
    printf(",\"%s\":[%.3f,%.3f,%.3f]", key, pos.x, pos.y, pos.z);
}

static std::string pinLetters(uint16_t pins) {
    static const struct { uint16_t bit; char letter; } PINS[] = {
        {InputPin::LIMIT_X, 'X'}, {InputPin::LIMIT_Y, 'Y'}, {InputPin::LIMIT_Z, 'Z'},
        {InputPin::PROBE, 'P'}, {InputPin::DOOR, 'D'}, {InputPin::HOLD, 'H'},
        {InputPin::SOFT_RESET, 'R'}, {InputPin::CYCLE_START, 'S'},
    };
    std::string out;
    for (const auto& pin : PINS) {
        if (pins & pin.bit) out += pin.letter;
    }
    return out;
}

// ============================================================================
//  DISPATCH
// ============================================================================

bool MachineCli::handleCommand(const std::string& cmd) {
    CommandParser p(cmd);

    // ---- CONNECT [port] [baud] ----
    if (p.is("connect") || p.is("open")) {
        return handleConnect(p);
    }

    // ---- DISCONNECT ----
    if (p.is("disconnect") || p.is("close")) {
        return report(p, "disconnect", _controller->disconnect());
    }

    // ---- STATUS [--json] ----
    if (p.is("status") || p.is("st")) {
        printStatus(p.jsonRequested());
        return true;
    }

    // ---- POLL ----
    if (p.is("poll")) {
        CommandResult result = _controller->pollOnce();
        if (!result.ok()) {
            return report(p, "poll", result);
        }
        printStatus(p.jsonRequested());
        return true;
    }

    // ---- POLLER start [ms] | stop ----
    if (p.is("poller")) {
        return handlePoller(p);
    }

    // ---- STATS [--json] ----
    if (p.is("stats")) {
        printStats(p.jsonRequested());
        return true;
    }

    // ---- JOG x <d> y <d> z <d> [feed <f>] [abs] ----
    if (p.is("jog")) {
        return handleJog(p);
    }

    if (p.is("cancel")) {
        return report(p, "cancel", _controller->jogCancel());
    }

    if (p.is("home")) {
        if (!p.jsonRequested()) printf("Homing...\n");
        return report(p, "home", _controller->home());
    }

    if (p.is("unlock")) {
        return report(p, "unlock", _controller->unlock());
    }

    if (p.is("reset")) {
        return report(p, "reset", _controller->softReset());
    }

    if (p.is("hold") || p.is("pause")) {
        return report(p, "hold", _controller->feedHold());
    }

    if (p.is("resume") || p.is("start")) {
        return report(p, "resume", _controller->cycleStart());
    }

    // ---- OVR feed|spindle|rapid <value> ----
    if (p.is("ovr") || p.is("override")) {
        return handleOverride(p);
    }

    if (p.is("door")) {
        return report(p, "door", _controller->safetyDoor());
    }

    // ---- COOLANT flood|mist, SSTOP ----
    if (p.is("coolant")) {
        if (p.matches("coolant", "flood")) return report(p, "coolant flood", _controller->toggleFlood());
        if (p.matches("coolant", "mist")) return report(p, "coolant mist", _controller->toggleMist());
        printf("Usage: coolant <flood|mist>\n");
        return true;
    }

    if (p.is("sstop")) {
        return report(p, "sstop", _controller->toggleSpindleStop());
    }

    // ---- FRAME xmin xmax ymin ymax [feed f] [power p] [mode m] ----
    if (p.is("frame")) {
        return handleFrame(p);
    }

    // ---- SETTINGS / GSTATE / BUILD [--json], CHECK ----
    if (p.is("settings") || p.is("$$")) {
        return handleQuery(p, "settings", DeviceQuery::Settings);
    }
    if (p.is("gstate") || p.is("$g")) {
        return handleQuery(p, "gstate", DeviceQuery::ParserState);
    }
    if (p.is("build") || p.is("$i")) {
        return handleQuery(p, "build", DeviceQuery::BuildInfo);
    }
    if (p.is("check") || p.is("$c")) {
        return report(p, "check", _controller->toggleCheckMode());
    }

    return false;
}

// ============================================================================
//  RESULT OUTPUT
// ============================================================================

bool MachineCli::report(const CommandParser& p, const char* command, const CommandResult& result) const {
    CLI_LOG("%s -> %s", command, result.ok() ? "ok" : errorCodeName(result.error->code));
    if (p.jsonRequested()) {
        printf("{\"command\":\"%s\",\"ok\":%s", command, result.ok() ? "true" : "false");
        if (result.error) {
            printf(",\"error\":");
            printErrorJson(*result.error);
        }
        printf("}\n");
    } else if (result.ok()) {
        printf("OK\n");
    } else {
        printf("Error: %s\n", formatError(*result.error).c_str());
    }
    return true;
}

// ============================================================================
//  HANDLERS
// ============================================================================

bool MachineCli::handleConnect(const CommandParser& p) {
    std::string port = p.subcommand().empty() ? _settings->port : p.subcommand();
    uint32_t baud = _settings->baudRate;

    if (port.empty()) {
        printf("Usage: connect <port> [baud] (no port configured)\n");
        return true;
    }
    if (p.argCount() > 0) {
        long value = 0;
        if (!CommandParser::toLong(p.arg(0), value) || value <= 0) {
            printf("Invalid baud rate: %s\n", p.arg(0).c_str());
            return true;
        }
        baud = (uint32_t)value;
    }

    if (!p.jsonRequested()) printf("Connecting to %s @ %u...\n", port.c_str(), (unsigned)baud);
    CommandResult result = _controller->connect(port, baud);
    if (result.ok() && !p.jsonRequested()) {
        ControllerSnapshot snap = _controller->snapshot();
        printf("Connected: %s\n", snap.welcome ? snap.welcome->c_str() : "(no banner)");
        return true;
    }
    return report(p, "connect", result);
}

bool MachineCli::handleJog(const CommandParser& p) {
    static const char* AXES[] = {"x", "y", "z"};
    std::optional<double> target[3];

    // "jog x" alone moves one configured step, "jog x -5" moves -5
    for (int i = 0; i < 3; i++) {
        if (!p.hasWord(AXES[i])) continue;
        std::optional<double> value = p.valueAfterDouble(AXES[i]);
        target[i] = value ? *value : _settings->jogStep;
    }

    std::optional<double> feed = p.valueAfterDouble("feed");
    bool incremental = !p.hasWord("abs");

    return report(p, "jog", _controller->jog(target[0], target[1], target[2],
                                             feed ? *feed : _settings->jogFeed, incremental));
}

static bool parseAdjust(const std::string& text, OverrideAdjust& out) {
    if (strcasecmp(text.c_str(), "reset") == 0 || text == "100") out = OverrideAdjust::Reset;
    else if (text == "+10") out = OverrideAdjust::CoarsePlus;
    else if (text == "-10") out = OverrideAdjust::CoarseMinus;
    else if (text == "+1" || text == "+") out = OverrideAdjust::FinePlus;
    else if (text == "-1" || text == "-") out = OverrideAdjust::FineMinus;
    else return false;
    return true;
}

bool MachineCli::handleOverride(const CommandParser& p) {
    if (p.matches(p.base().c_str(), "rapid")) {
        long percent = 0;
        RapidPreset preset;
        if (!CommandParser::toLong(p.arg(0), percent)) percent = -1;
        switch (percent) {
            case 100: preset = RapidPreset::Full; break;
            case 50:  preset = RapidPreset::Half; break;
            case 25:  preset = RapidPreset::Quarter; break;
            default:
                printf("Usage: ovr rapid <100|50|25>\n");
                return true;
        }
        return report(p, "ovr rapid", _controller->rapidOverride(preset));
    }

    bool feed = p.matches(p.base().c_str(), "feed");
    bool spindle = p.matches(p.base().c_str(), "spindle") || p.matches(p.base().c_str(), "laser");
    OverrideAdjust adjust;
    if ((!feed && !spindle) || !parseAdjust(p.arg(0), adjust)) {
        printf("Usage: ovr <feed|spindle> <reset|+10|-10|+1|-1>\n");
        printf("       ovr rapid <100|50|25>\n");
        return true;
    }

    if (feed) {
        return report(p, "ovr feed", _controller->feedOverride(adjust));
    }
    return report(p, "ovr spindle", _controller->spindleOverride(adjust));
}

bool MachineCli::handleFrame(const CommandParser& p) {
    const std::vector<std::string>& words = p.words();
    double edges[4];
    for (int i = 0; i < 4; i++) {
        if (i >= (int)words.size() || !CommandParser::toDouble(words[i], edges[i])) {
            printf("Usage: frame <xmin> <xmax> <ymin> <ymax> [feed f] [power p] [mode dynamic|constant|off]\n");
            return true;
        }
    }

    FrameBounds bounds;
    bounds.xMin = edges[0];
    bounds.xMax = edges[1];
    bounds.yMin = edges[2];
    bounds.yMax = edges[3];

    std::optional<double> feed = p.valueAfterDouble("feed");
    std::optional<long> power = p.valueAfterLong("power");
    LaserMode mode = _settings->frameMode;
    std::string modeText = p.valueAfter("mode");
    if (!modeText.empty() && !ConfigReader::parseLaserMode(modeText.c_str(), mode)) {
        printf("Unknown laser mode: %s\n", modeText.c_str());
        return true;
    }
    if (power && *power < 0) {
        printf("Invalid power: %ld\n", *power);
        return true;
    }

    CommandResult result = _controller->runFrame(bounds, feed ? *feed : _settings->frameFeed,
                                                 power ? (uint32_t)*power : _settings->framePower,
                                                 _settings->units, mode);
    return report(p, "frame", result);
}

bool MachineCli::handleQuery(const CommandParser& p, const char* command, DeviceQuery query) {
    std::vector<std::string> lines;
    CommandResult result = _controller->queryDevice(query, lines);
    if (!result.ok()) {
        return report(p, command, result);
    }

    if (p.jsonRequested()) {
        printf("{\"command\":\"%s\",\"ok\":true,\"lines\":[", command);
        for (size_t i = 0; i < lines.size(); i++) {
            printf("%s\"%s\"", i ? "," : "", jsonEscape(lines[i]).c_str());
        }
        printf("]}\n");
    } else {
        for (const std::string& line : lines) {
            printf("%s\n", line.c_str());
        }
        printf("OK\n");
    }
    return true;
}

bool MachineCli::handlePoller(const CommandParser& p) {
    if (p.matches("poller", "stop")) {
        _controller->stopPolling();
        printf("Poller stopped\n");
        return true;
    }
    if (p.matches("poller", "start")) {
        uint32_t interval = (uint32_t)p.argInt(0, 0);
        if (!_controller->startPolling(interval)) {
            printf("Invalid poll interval\n");
        } else {
            printf("Poller started\n");
        }
        return true;
    }
    printf("Poller: %s\n", _controller->isPolling() ? "running" : "stopped");
    return true;
}

// ============================================================================
//  STATUS
// ============================================================================

void MachineCli::printStatus(bool json) const {
    ControllerSnapshot snap = _controller->snapshot();
    const MachineStatus& st = snap.status;
    const Connection::Connected* link = std::get_if<Connection::Connected>(&snap.connection);
    const Connection::Error* linkError = std::get_if<Connection::Error>(&snap.connection);

    if (json) {
        printf("{\"connection\":{\"state\":\"%s\"", connectionStateName(snap.connection));
        if (link) {
            printf(",\"port\":\"%s\",\"baudRate\":%u", jsonEscape(link->port).c_str(), (unsigned)link->baudRate);
        }
        if (linkError) {
            printf(",\"message\":\"%s\"", jsonEscape(linkError->message).c_str());
        }
        printf("},\"status\":{\"state\":\"%s\"", GrblStatus::machineStateName(st.state));
        if (st.subState) printf(",\"subState\":%u", (unsigned)*st.subState);
        printPositionJson("mpos", st.machinePos);
        if (st.workPos) printPositionJson("wpos", *st.workPos);
        if (st.workOffset) printPositionJson("wco", *st.workOffset);
        if (st.feedRate) printf(",\"feed\":%.1f", *st.feedRate);
        if (st.spindleSpeed) printf(",\"spindle\":%.1f", *st.spindleSpeed);
        if (st.overrides) {
            printf(",\"overrides\":{\"feed\":%u,\"rapid\":%u,\"spindle\":%u}",
                   st.overrides->feed, st.overrides->rapid, st.overrides->spindle);
        }
        if (st.inputPins) printf(",\"pins\":\"%s\"", pinLetters(*st.inputPins).c_str());
        if (st.buffer) {
            printf(",\"buffer\":{\"planner\":%u,\"rx\":%u}",
                   st.buffer->plannerBlocksFree, st.buffer->rxBytesFree);
        }
        if (st.lineNumber) printf(",\"line\":%u", (unsigned)*st.lineNumber);
        printf("},\"fresh\":%s", snap.statusFresh ? "true" : "false");
        if (snap.welcome) printf(",\"welcome\":\"%s\"", jsonEscape(*snap.welcome).c_str());
        if (snap.lastError) {
            printf(",\"lastError\":");
            printErrorJson(*snap.lastError);
        }
        if (snap.pendingAlarm) {
            printf(",\"alarm\":{\"code\":%u,\"id\":%llu}", (unsigned)snap.pendingAlarm->code,
                   (unsigned long long)snap.pendingAlarm->id);
        }
        printf("}\n");
        return;
    }

    printf("\n=== Machine Status ===\n");
    printf("Connection: %s", connectionStateName(snap.connection));
    if (link) printf(" (%s @ %u)", link->port.c_str(), (unsigned)link->baudRate);
    if (linkError) printf(" (%s)", linkError->message.c_str());
    printf("\n");
    if (snap.welcome) printf("Firmware: %s\n", snap.welcome->c_str());

    printf("State: %s", GrblStatus::machineStateName(st.state));
    if (st.subState) printf(":%u", (unsigned)*st.subState);
    printf("%s\n", snap.statusFresh ? "" : " (stale)");
    printf("MPos: %.3f, %.3f, %.3f\n", st.machinePos.x, st.machinePos.y, st.machinePos.z);
    if (st.workPos) printf("WPos: %.3f, %.3f, %.3f\n", st.workPos->x, st.workPos->y, st.workPos->z);
    if (st.feedRate || st.spindleSpeed) {
        printf("Feed: %.1f  Spindle: %.1f\n", st.feedRate.value_or(0.0), st.spindleSpeed.value_or(0.0));
    }
    if (st.overrides) {
        printf("Overrides: feed %u%%, rapid %u%%, spindle %u%%\n",
               st.overrides->feed, st.overrides->rapid, st.overrides->spindle);
    }
    if (st.inputPins && *st.inputPins) printf("Pins: %s\n", pinLetters(*st.inputPins).c_str());

    if (snap.pendingAlarm) {
        printf("Alarm: %u - %s\n", (unsigned)snap.pendingAlarm->code,
               GrblProtocol::alarmDescription(snap.pendingAlarm->code));
    }
    if (snap.lastError) printf("Last error: %s\n", formatError(*snap.lastError).c_str());
    printf("\n");
}

void MachineCli::printStats(bool json) const {
    std::optional<SerialWorkerStats> stats = _controller->workerStats();
    if (!stats) {
        printf(json ? "{\"stats\":null}\n" : "Not connected\n");
        return;
    }
    const SerialWorkerStats& s = *stats;
    if (json) {
        printf("{\"stats\":{\"linesReceived\":%u,\"linesDropped\":%u,\"bytesWritten\":%u,"
               "\"commandsSent\":%u,\"retries\":%u,\"timeouts\":%u,\"statusReports\":%u}}\n",
               s.lines_received, s.lines_dropped, s.bytes_written,
               s.commands_sent, s.retries, s.timeouts, s.status_reports);
        return;
    }
    printf("\n=== Serial Stats ===\n");
    printf("Lines received: %u (dropped %u)\n", s.lines_received, s.lines_dropped);
    printf("Commands sent: %u (retries %u, timeouts %u)\n", s.commands_sent, s.retries, s.timeouts);
    printf("Bytes written: %u\n", s.bytes_written);
    printf("Status reports: %u\n\n", s.status_reports);
}

void MachineCli::printHelp() const {
    printf("=== Machine Commands ===\n");
    printf("  connect [port] [baud]    - Open the controller (defaults from config)\n");
    printf("  disconnect               - Close the controller\n");
    printf("  status [--json]          - Show last known machine status\n");
    printf("  poll [--json]            - Query status once and show it\n");
    printf("  poller <start [ms]|stop> - Background status polling\n");
    printf("  stats [--json]           - Serial link counters\n");
    printf("  jog [x d] [y d] [z d] [feed f] [abs]\n");
    printf("                           - Jog (distance defaults to configured step)\n");
    printf("  cancel                   - Cancel jog\n");
    printf("  home                     - Run homing cycle ($H)\n");
    printf("  unlock                   - Clear alarm lock ($X)\n");
    printf("  reset                    - Soft reset (Ctrl-X)\n");
    printf("  hold / resume            - Feed hold / cycle start\n");
    printf("  ovr <feed|spindle> <reset|+10|-10|+1|-1>\n");
    printf("  ovr rapid <100|50|25>    - Overrides\n");
    printf("  door                     - Safety door\n");
    printf("  coolant <flood|mist>     - Toggle coolant\n");
    printf("  sstop                    - Toggle spindle stop (while held)\n");
    printf("  settings / gstate / build [--json]\n");
    printf("                           - Device settings ($$), parser state ($G), build info ($I)\n");
    printf("  check                    - Toggle g-code check mode ($C)\n");
    printf("  frame <xmin> <xmax> <ymin> <ymax> [feed f] [power p] [mode m]\n");
    printf("                           - Trace job bounds\n");
}
