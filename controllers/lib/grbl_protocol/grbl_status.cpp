/*
 * GRBL Status - Implementation
 */

#include "grbl_status.h"

#include <stdlib.h>
#include <string.h>
#include <vector>

namespace GrblStatus {

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

static std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double value = strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return false;
    out = value;
    return true;
}

static bool parseUnsigned(const std::string& text, uint32_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    unsigned long value = strtoul(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;
    out = (uint32_t)value;
    return true;
}

// ----------------------------------------------------------------------------
// State
// ----------------------------------------------------------------------------

MachineState parseMachineState(const std::string& token, std::optional<uint8_t>* subState) {
    std::string base = token;
    size_t colon = token.find(':');
    if (colon != std::string::npos) {
        base = token.substr(0, colon);
        uint32_t code = 0;
        if (subState && parseUnsigned(token.substr(colon + 1), code)) {
            *subState = (uint8_t)code;
        }
    }

    if (base == "Idle")  return MachineState::Idle;
    if (base == "Run")   return MachineState::Run;
    if (base == "Hold")  return MachineState::Hold;
    if (base == "Jog")   return MachineState::Jog;
    if (base == "Alarm") return MachineState::Alarm;
    if (base == "Door")  return MachineState::Door;
    if (base == "Check") return MachineState::Check;
    if (base == "Home")  return MachineState::Home;
    if (base == "Sleep") return MachineState::Sleep;
    return MachineState::Unknown;
}

const char* machineStateName(MachineState state) {
    switch (state) {
        case MachineState::Idle:    return "idle";
        case MachineState::Run:     return "run";
        case MachineState::Hold:    return "hold";
        case MachineState::Jog:     return "jog";
        case MachineState::Alarm:   return "alarm";
        case MachineState::Door:    return "door";
        case MachineState::Check:   return "check";
        case MachineState::Home:    return "home";
        case MachineState::Sleep:   return "sleep";
        case MachineState::Unknown: return "unknown";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Fields
// ----------------------------------------------------------------------------

bool parsePosition(const std::string& text, Position& out) {
    std::vector<std::string> vals = split(text, ',');
    if (vals.size() < 3) return false;

    Position pos;
    if (!parseDouble(vals[0], pos.x)) return false;
    if (!parseDouble(vals[1], pos.y)) return false;
    if (!parseDouble(vals[2], pos.z)) return false;
    out = pos;
    return true;
}

uint16_t parseInputPins(const std::string& text) {
    uint16_t pins = 0;
    for (char c : text) {
        switch (c) {
            case 'X': pins |= InputPin::LIMIT_X; break;
            case 'Y': pins |= InputPin::LIMIT_Y; break;
            case 'Z': pins |= InputPin::LIMIT_Z; break;
            case 'P': pins |= InputPin::PROBE; break;
            case 'D': pins |= InputPin::DOOR; break;
            case 'H': pins |= InputPin::HOLD; break;
            case 'R': pins |= InputPin::SOFT_RESET; break;
            case 'S': pins |= InputPin::CYCLE_START; break;
            default: break;
        }
    }
    return pins;
}

static Accessories parseAccessories(const std::string& text) {
    Accessories acc;
    acc.spindleCw = text.find('S') != std::string::npos;
    acc.spindleCcw = text.find('C') != std::string::npos;
    acc.floodCoolant = text.find('F') != std::string::npos;
    acc.mistCoolant = text.find('M') != std::string::npos;
    return acc;
}

static void parseField(const std::string& key, const std::string& value, MachineStatus& status) {
    if (key == "MPos") {
        Position pos;
        if (parsePosition(value, pos)) {
            status.machinePos = pos;
        }
    } else if (key == "WPos") {
        Position pos;
        if (parsePosition(value, pos)) {
            status.workPos = pos;
        }
    } else if (key == "WCO") {
        Position pos;
        if (parsePosition(value, pos)) {
            status.workOffset = pos;
        }
    } else if (key == "FS") {
        std::vector<std::string> vals = split(value, ',');
        double number = 0.0;
        if (vals.size() > 0 && parseDouble(vals[0], number)) {
            status.feedRate = number;
        }
        if (vals.size() > 1 && parseDouble(vals[1], number)) {
            status.spindleSpeed = number;
        }
    } else if (key == "F") {
        double number = 0.0;
        if (parseDouble(value, number)) {
            status.feedRate = number;
        }
    } else if (key == "Ov") {
        std::vector<std::string> vals = split(value, ',');
        uint32_t f = 0, r = 0, s = 0;
        if (vals.size() >= 3 && parseUnsigned(vals[0], f) &&
            parseUnsigned(vals[1], r) && parseUnsigned(vals[2], s)) {
            OverrideValues ov;
            ov.feed = (uint16_t)f;
            ov.rapid = (uint16_t)r;
            ov.spindle = (uint16_t)s;
            status.overrides = ov;
        }
    } else if (key == "Pn") {
        status.inputPins = parseInputPins(value);
    } else if (key == "A") {
        status.accessories = parseAccessories(value);
    } else if (key == "Bf") {
        std::vector<std::string> vals = split(value, ',');
        uint32_t blocks = 0, bytes = 0;
        if (vals.size() >= 2 && parseUnsigned(vals[0], blocks) && parseUnsigned(vals[1], bytes)) {
            BufferState buf;
            buf.plannerBlocksFree = (uint16_t)blocks;
            buf.rxBytesFree = (uint16_t)bytes;
            status.buffer = buf;
        }
    } else if (key == "Ln") {
        uint32_t line = 0;
        if (parseUnsigned(value, line)) {
            status.lineNumber = line;
        }
    }
    // Unknown keys (e.g. firmware extensions) are ignored
}

// ----------------------------------------------------------------------------
// Report
// ----------------------------------------------------------------------------

bool parseStatusReport(const std::string& line, MachineStatus& out) {
    if (line.size() < 3 || line.front() != '<' || line.back() != '>') {
        return false;
    }

    std::string inner = line.substr(1, line.size() - 2);
    std::vector<std::string> parts = split(inner, '|');

    MachineStatus status;
    status.state = parseMachineState(parts[0], &status.subState);

    bool hasMachinePos = false;
    for (size_t i = 1; i < parts.size(); i++) {
        size_t colon = parts[i].find(':');
        if (colon == std::string::npos) continue;
        std::string key = parts[i].substr(0, colon);
        parseField(key, parts[i].substr(colon + 1), status);
        if (key == "MPos" && !hasMachinePos) {
            Position pos;
            hasMachinePos = parsePosition(parts[i].substr(colon + 1), pos);
        }
    }

    // A report always carries one of the two positions
    if (!hasMachinePos && !status.workPos) {
        return false;
    }

    // $10 can switch the firmware to WPos; MPos is then WPos + WCO.
    // WCO only rides along every few reports, a missing one counts as zero.
    if (!hasMachinePos) {
        status.machinePos = *status.workPos;
        if (status.workOffset) {
            status.machinePos.x += status.workOffset->x;
            status.machinePos.y += status.workOffset->y;
            status.machinePos.z += status.workOffset->z;
        }
    }

    // Derive work position from the offset when the firmware reports MPos only
    if (!status.workPos && status.workOffset) {
        Position wpos;
        wpos.x = status.machinePos.x - status.workOffset->x;
        wpos.y = status.machinePos.y - status.workOffset->y;
        wpos.z = status.machinePos.z - status.workOffset->z;
        status.workPos = wpos;
    }

    out = status;
    return true;
}

} // namespace GrblStatus
