/*
 * GRBL Status - Machine status model and status report parser
 *
 * Parses GRBL v1.1 real-time status reports:
 *   <State|MPos:x,y,z|WPos:x,y,z|WCO:x,y,z|FS:feed,speed|Ov:f,r,s|Pn:XYZ|A:SFM|Bf:b,r|Ln:n>
 *
 * Every field after the state is optional. A field the firmware did not
 * report stays empty (std::nullopt) so "not reported" is never confused
 * with "reported as zero".
 */

#ifndef GRBL_STATUS_H
#define GRBL_STATUS_H

#include <stdint.h>
#include <optional>
#include <string>

// ============================================================================
// Machine State
// ============================================================================

enum class MachineState : uint8_t {
    Idle = 0,
    Run,
    Hold,
    Jog,
    Alarm,
    Door,
    Check,
    Home,
    Sleep,
    Unknown
};

// ============================================================================
// Status Fields
// ============================================================================

struct Position {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    bool operator==(const Position& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/**
 * @brief Override percentages as reported by the device (Ov: field)
 */
struct OverrideValues {
    uint16_t feed = 100;
    uint16_t rapid = 100;
    uint16_t spindle = 100;

    bool operator==(const OverrideValues& other) const {
        return feed == other.feed && rapid == other.rapid && spindle == other.spindle;
    }
};

/**
 * @brief Accessory state (A: field)
 */
struct Accessories {
    bool spindleCw = false;
    bool spindleCcw = false;
    bool floodCoolant = false;
    bool mistCoolant = false;
};

/**
 * @brief Planner / serial RX buffer availability (Bf: field)
 */
struct BufferState {
    uint16_t plannerBlocksFree = 0;
    uint16_t rxBytesFree = 0;
};

// Input pin bitmask (Pn: field letters)
namespace InputPin {
    constexpr uint16_t LIMIT_X     = 0x0001;  // X
    constexpr uint16_t LIMIT_Y     = 0x0002;  // Y
    constexpr uint16_t LIMIT_Z     = 0x0004;  // Z
    constexpr uint16_t PROBE       = 0x0008;  // P
    constexpr uint16_t DOOR        = 0x0010;  // D
    constexpr uint16_t HOLD        = 0x0020;  // H
    constexpr uint16_t SOFT_RESET  = 0x0040;  // R
    constexpr uint16_t CYCLE_START = 0x0080;  // S
}

/**
 * @brief Complete machine status decoded from one status report
 */
struct MachineStatus {
    MachineState state = MachineState::Idle;
    std::optional<uint8_t> subState;          // Hold:0, Door:1, ...
    Position machinePos;
    std::optional<Position> workPos;
    std::optional<Position> workOffset;
    std::optional<double> feedRate;
    std::optional<double> spindleSpeed;
    std::optional<OverrideValues> overrides;
    std::optional<uint16_t> inputPins;         // InputPin bitmask
    std::optional<Accessories> accessories;
    std::optional<BufferState> buffer;
    std::optional<uint32_t> lineNumber;
};

// ============================================================================
// Parsing
// ============================================================================

namespace GrblStatus {

/**
 * @brief Parse a state token such as "Idle", "Hold:0" or "Door:1"
 * @param token State token (sub-state suffix allowed)
 * @param subState Receives the sub-state code when present (may be nullptr)
 * @return Parsed state, MachineState::Unknown for unrecognised names
 */
MachineState parseMachineState(const std::string& token, std::optional<uint8_t>* subState = nullptr);

/**
 * @brief Lower-case state name ("idle", "alarm", ...)
 */
const char* machineStateName(MachineState state);

/**
 * @brief Parse a comma separated "x,y,z" triple
 * @return true if at least three numeric values were found
 */
bool parsePosition(const std::string& text, Position& out);

/**
 * @brief Parse a Pn: value ("XYZPDHRS" letters) into an InputPin bitmask
 */
uint16_t parseInputPins(const std::string& text);

/**
 * @brief Parse a complete status report line
 * @param line Report including the angle brackets
 * @param out Receives the decoded status (reset to defaults first)
 * @return false if the line is not a bracketed report
 */
bool parseStatusReport(const std::string& line, MachineStatus& out);

} // namespace GrblStatus

#endif // GRBL_STATUS_H
