/*
 * GRBL Protocol - Implementation
 */

#include "grbl_protocol.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <utility>

namespace GrblProtocol {

// ============================================================================
// Helpers
// ============================================================================

static std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && (text[start] == ' ' || text[start] == '\t' ||
                           text[start] == '\r' || text[start] == '\n')) {
        start++;
    }
    while (end > start && (text[end - 1] == ' ' || text[end - 1] == '\t' ||
                           text[end - 1] == '\r' || text[end - 1] == '\n')) {
        end--;
    }
    return text.substr(start, end - start);
}

static bool startsWith(const std::string& text, const char* prefix) {
    return text.compare(0, strlen(prefix), prefix) == 0;
}

static bool parseCode(const std::string& text, uint32_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    unsigned long value = strtoul(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;
    out = (uint32_t)value;
    return true;
}

static std::string formatWord(char letter, double value) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%c%.3f", letter, value);
    return buf;
}

// ============================================================================
// Real-time
// ============================================================================

bool isRealtimeByte(uint8_t byte) {
    if (byte == RT_STATUS_QUERY || byte == RT_FEED_HOLD ||
        byte == RT_CYCLE_START || byte == RT_SOFT_RESET) {
        return true;
    }
    return byte >= 0x80;
}

// ============================================================================
// Encoding
// ============================================================================

std::string buildJogCommand(std::optional<double> x, std::optional<double> y,
                            std::optional<double> z, double feed, bool incremental) {
    std::string cmd = "$J=";
    cmd += incremental ? "G91" : "G90";

    if (x) cmd += " " + formatWord('X', *x);
    if (y) cmd += " " + formatWord('Y', *y);
    if (z) cmd += " " + formatWord('Z', *z);

    cmd += " " + formatWord('F', feed);
    cmd += LINE_TERMINATOR;
    return cmd;
}

std::vector<std::string> buildFrameProgram(const FrameBounds& bounds, double feed,
                                           uint32_t power, Units units, LaserMode mode) {
    double xMin = bounds.xMin;
    double xMax = bounds.xMax;
    double yMin = bounds.yMin;
    double yMax = bounds.yMax;
    if (xMin > xMax) std::swap(xMin, xMax);
    if (yMin > yMax) std::swap(yMin, yMax);

    std::vector<std::string> lines;
    lines.reserve(9);

    lines.push_back(units == Units::Inches ? "G20" : "G21");
    lines.push_back("G90");
    lines.push_back("G0 " + formatWord('X', xMin) + " " + formatWord('Y', yMin));

    char laser[24];
    switch (mode) {
        case LaserMode::Dynamic:
            snprintf(laser, sizeof(laser), "M4 S%u", (unsigned)power);
            break;
        case LaserMode::Constant:
            snprintf(laser, sizeof(laser), "M3 S%u", (unsigned)power);
            break;
        case LaserMode::Off:
            snprintf(laser, sizeof(laser), "M5");
            break;
    }
    lines.push_back(laser);

    lines.push_back("G1 " + formatWord('X', xMax) + " " + formatWord('Y', yMin) + " " + formatWord('F', feed));
    lines.push_back("G1 " + formatWord('X', xMax) + " " + formatWord('Y', yMax));
    lines.push_back("G1 " + formatWord('X', xMin) + " " + formatWord('Y', yMax));
    lines.push_back("G1 " + formatWord('X', xMin) + " " + formatWord('Y', yMin));
    lines.push_back("M5");

    return lines;
}

uint8_t feedOverrideByte(OverrideAdjust adjust) {
    switch (adjust) {
        case OverrideAdjust::Reset:       return RT_FEED_OVR_RESET;
        case OverrideAdjust::CoarsePlus:  return RT_FEED_OVR_COARSE_PLUS;
        case OverrideAdjust::CoarseMinus: return RT_FEED_OVR_COARSE_MINUS;
        case OverrideAdjust::FinePlus:    return RT_FEED_OVR_FINE_PLUS;
        case OverrideAdjust::FineMinus:   return RT_FEED_OVR_FINE_MINUS;
    }
    return RT_FEED_OVR_RESET;
}

uint8_t spindleOverrideByte(OverrideAdjust adjust) {
    switch (adjust) {
        case OverrideAdjust::Reset:       return RT_SPINDLE_OVR_RESET;
        case OverrideAdjust::CoarsePlus:  return RT_SPINDLE_OVR_COARSE_PLUS;
        case OverrideAdjust::CoarseMinus: return RT_SPINDLE_OVR_COARSE_MINUS;
        case OverrideAdjust::FinePlus:    return RT_SPINDLE_OVR_FINE_PLUS;
        case OverrideAdjust::FineMinus:   return RT_SPINDLE_OVR_FINE_MINUS;
    }
    return RT_SPINDLE_OVR_RESET;
}

uint8_t rapidOverrideByte(RapidPreset preset) {
    switch (preset) {
        case RapidPreset::Full:    return RT_RAPID_OVR_RESET;
        case RapidPreset::Half:    return RT_RAPID_OVR_HALF;
        case RapidPreset::Quarter: return RT_RAPID_OVR_QUARTER;
    }
    return RT_RAPID_OVR_RESET;
}

uint16_t rapidPresetPercent(RapidPreset preset) {
    switch (preset) {
        case RapidPreset::Full:    return 100;
        case RapidPreset::Half:    return 50;
        case RapidPreset::Quarter: return 25;
    }
    return 100;
}

const char* deviceQueryCommand(DeviceQuery query) {
    switch (query) {
        case DeviceQuery::Settings:    return CMD_VIEW_SETTINGS;
        case DeviceQuery::ParserState: return CMD_VIEW_PARSER_STATE;
        case DeviceQuery::BuildInfo:   return CMD_VIEW_BUILD_INFO;
    }
    return CMD_VIEW_SETTINGS;
}

// ============================================================================
// Decoding
// ============================================================================

GrblResponse parseResponse(const std::string& raw) {
    GrblResponse resp;
    std::string line = trim(raw);

    if (line == "ok") {
        resp.type = GrblResponse::Type::Ok;
        return resp;
    }

    if (startsWith(line, "error:")) {
        if (parseCode(line.substr(6), resp.code)) {
            resp.type = GrblResponse::Type::Error;
            return resp;
        }
    }

    if (startsWith(line, "ALARM:")) {
        if (parseCode(line.substr(6), resp.code)) {
            resp.type = GrblResponse::Type::Alarm;
            return resp;
        }
    }

    if (!line.empty() && line.front() == '<' && line.back() == '>') {
        if (GrblStatus::parseStatusReport(line, resp.status)) {
            resp.type = GrblResponse::Type::Status;
            return resp;
        }
    }

    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        std::string inner = line.substr(1, line.size() - 2);
        if (startsWith(inner, "MSG:")) {
            inner = inner.substr(4);
        }
        resp.type = GrblResponse::Type::Message;
        resp.text = inner;
        return resp;
    }

    // "Grbl 1.1h ['$' for help]", "GrblHAL 1.1f ...", FluidNC "Grbl 3.7 [FluidNC ...]"
    if (startsWith(line, "Grbl")) {
        resp.type = GrblResponse::Type::Welcome;
        resp.text = line;
        return resp;
    }

    if (line.size() > 1 && line.front() == '$') {
        size_t eq = line.find('=');
        if (eq != std::string::npos && parseCode(line.substr(1, eq - 1), resp.code)) {
            resp.type = GrblResponse::Type::Setting;
            resp.text = line.substr(eq + 1);
            return resp;
        }
    }

    resp.type = GrblResponse::Type::Unknown;
    resp.code = 0;
    resp.text = line;
    return resp;
}

const char* errorDescription(uint32_t code) {
    switch (code) {
        case 1:  return "Expected command letter";
        case 2:  return "Bad number format";
        case 3:  return "Invalid $ statement";
        case 4:  return "Negative value";
        case 5:  return "Homing not enabled";
        case 6:  return "Step pulse too short";
        case 7:  return "EEPROM read failed";
        case 8:  return "Not idle";
        case 9:  return "G-code locked out (alarm or jog)";
        case 10: return "Soft limits require homing";
        case 11: return "Line overflow";
        case 12: return "Step rate too high";
        case 13: return "Safety door open";
        case 14: return "Startup line too long";
        case 15: return "Jog target exceeds travel";
        case 16: return "Invalid jog command";
        case 17: return "Laser mode requires PWM output";
        case 20: return "Unsupported command";
        case 21: return "Modal group violation";
        case 22: return "Undefined feed rate";
        case 23: return "Value must be an integer";
        case 24: return "Conflicting axis commands";
        case 25: return "Repeated word";
        case 26: return "No axis words";
        case 27: return "Invalid line number";
        case 28: return "Missing value word";
        case 29: return "Work coordinate system not supported";
        case 30: return "G53 requires G0 or G1";
        case 31: return "Unused axis words";
        case 32: return "No axis words in plane";
        case 33: return "Invalid motion target";
        case 34: return "Arc radius error";
        case 35: return "No offsets in plane";
        case 36: return "Unused words";
        case 37: return "Tool length offset axis error";
        case 38: return "Tool number too large";
        default: return "Unknown error";
    }
}

const char* alarmDescription(uint32_t code) {
    switch (code) {
        case 1:  return "Hard limit triggered";
        case 2:  return "Soft limit exceeded";
        case 3:  return "Reset while in motion";
        case 4:  return "Probe fail (initial state)";
        case 5:  return "Probe fail (no contact)";
        case 6:  return "Homing fail (reset)";
        case 7:  return "Homing fail (door opened)";
        case 8:  return "Homing fail (pull-off)";
        case 9:  return "Homing fail (switch not found)";
        case 10: return "Homing fail (dual axis)";
        default: return "Unknown alarm";
    }
}

const char* responseTypeName(GrblResponse::Type type) {
    switch (type) {
        case GrblResponse::Type::Unknown: return "unknown";
        case GrblResponse::Type::Ok:      return "ok";
        case GrblResponse::Type::Error:   return "error";
        case GrblResponse::Type::Alarm:   return "alarm";
        case GrblResponse::Type::Status:  return "status";
        case GrblResponse::Type::Welcome: return "welcome";
        case GrblResponse::Type::Message: return "message";
        case GrblResponse::Type::Setting: return "setting";
    }
    return "unknown";
}

} // namespace GrblProtocol
