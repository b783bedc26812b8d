/*
 * GRBL Protocol - Wire codec for GRBL v1.1 controllers
 *
 * Provides:
 *   - Real-time control bytes and system command strings (GrblProtocol namespace)
 *   - Line-protocol command builders (jog, frame trace)
 *   - Override byte selection (one byte per discrete step)
 *   - Response line decoder (ok, error:N, ALARM:N, status report, banner, ...)
 *
 * Line protocol:
 *   Commands are '\n' terminated text lines, each acknowledged by exactly
 *   one "ok" or "error:N" line. The protocol has no request ids.
 *
 * Real-time protocol:
 *   Single bytes acted on immediately by the firmware, never acknowledged.
 *
 * Reference: https://github.com/gnea/grbl/wiki/Grbl-v1.1-Commands
 */

#ifndef GRBL_PROTOCOL_H
#define GRBL_PROTOCOL_H

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>
#include <vector>

#include "grbl_status.h"

// ============================================================================
// Protocol Constants
// ============================================================================

namespace GrblProtocol {

constexpr uint32_t DEFAULT_BAUD_RATE = 115200;
constexpr uint32_t SUPPORTED_BAUD_RATES[] = {9600, 19200, 38400, 57600, 115200, 230400};
constexpr size_t SUPPORTED_BAUD_RATE_COUNT = sizeof(SUPPORTED_BAUD_RATES) / sizeof(SUPPORTED_BAUD_RATES[0]);

constexpr char LINE_TERMINATOR = '\n';
constexpr size_t MAX_LINE_LENGTH = 256;

// Real-time commands (single byte, no newline)
constexpr uint8_t RT_STATUS_QUERY           = '?';
constexpr uint8_t RT_FEED_HOLD              = '!';
constexpr uint8_t RT_CYCLE_START            = '~';
constexpr uint8_t RT_SOFT_RESET             = 0x18;
constexpr uint8_t RT_SAFETY_DOOR            = 0x84;
constexpr uint8_t RT_JOG_CANCEL             = 0x85;

// Feed override
constexpr uint8_t RT_FEED_OVR_RESET         = 0x90;
constexpr uint8_t RT_FEED_OVR_COARSE_PLUS   = 0x91;
constexpr uint8_t RT_FEED_OVR_COARSE_MINUS  = 0x92;
constexpr uint8_t RT_FEED_OVR_FINE_PLUS     = 0x93;
constexpr uint8_t RT_FEED_OVR_FINE_MINUS    = 0x94;

// Rapid override (presets only)
constexpr uint8_t RT_RAPID_OVR_RESET        = 0x95;
constexpr uint8_t RT_RAPID_OVR_HALF         = 0x96;
constexpr uint8_t RT_RAPID_OVR_QUARTER      = 0x97;

// Spindle / laser power override
constexpr uint8_t RT_SPINDLE_OVR_RESET        = 0x99;
constexpr uint8_t RT_SPINDLE_OVR_COARSE_PLUS  = 0x9A;
constexpr uint8_t RT_SPINDLE_OVR_COARSE_MINUS = 0x9B;
constexpr uint8_t RT_SPINDLE_OVR_FINE_PLUS    = 0x9C;
constexpr uint8_t RT_SPINDLE_OVR_FINE_MINUS   = 0x9D;

// Accessory toggles
constexpr uint8_t RT_SPINDLE_STOP_TOGGLE    = 0x9E;
constexpr uint8_t RT_COOLANT_FLOOD_TOGGLE   = 0xA0;
constexpr uint8_t RT_COOLANT_MIST_TOGGLE    = 0xA1;

// System commands ($ prefix, sent as lines)
constexpr const char* CMD_HOME              = "$H";
constexpr const char* CMD_UNLOCK            = "$X";
constexpr const char* CMD_VIEW_SETTINGS     = "$$";
constexpr const char* CMD_VIEW_PARSER_STATE = "$G";
constexpr const char* CMD_VIEW_BUILD_INFO   = "$I";
constexpr const char* CMD_CHECK_MODE        = "$C";

/**
 * @brief Check if a byte is handled by the firmware as a real-time command
 */
bool isRealtimeByte(uint8_t byte);

} // namespace GrblProtocol

// ============================================================================
// Command Parameters
// ============================================================================

enum class OverrideAdjust : uint8_t {
    Reset = 0,      // back to 100%
    CoarsePlus,     // +10%
    CoarseMinus,    // -10%
    FinePlus,       // +1%
    FineMinus       // -1%
};

enum class RapidPreset : uint8_t {
    Full = 0,       // 100%
    Half,           // 50%
    Quarter         // 25%
};

/**
 * @brief Read-only system commands answered with report lines and "ok"
 */
enum class DeviceQuery : uint8_t {
    Settings = 0,   // $$ - "$N=value" lines
    ParserState,    // $G - [GC:...]
    BuildInfo       // $I - [VER:...] [OPT:...]
};

enum class Units : uint8_t {
    Millimeters = 0,
    Inches
};

/**
 * @brief Laser activation while tracing a frame
 */
enum class LaserMode : uint8_t {
    Dynamic = 0,    // M4 - power scales with speed, off when stopped
    Constant,       // M3 - constant power while moving
    Off             // M5 - guide only, laser never fires
};

struct FrameBounds {
    double xMin = 0.0;
    double xMax = 0.0;
    double yMin = 0.0;
    double yMax = 0.0;
};

// ============================================================================
// Responses
// ============================================================================

/**
 * @brief One decoded line from the device
 */
struct GrblResponse {
    enum class Type : uint8_t {
        Unknown = 0,    // matched no known shape
        Ok,
        Error,          // code = error number
        Alarm,          // code = alarm number
        Status,         // status = decoded report
        Welcome,        // text = banner line
        Message,        // text = [MSG:...] payload
        Setting         // code = setting number, text = value
    } type = Type::Unknown;

    uint32_t code = 0;
    std::string text;
    MachineStatus status;
};

namespace GrblProtocol {

// ---- Encoding ----

/**
 * @brief Build a jog command carrying only the moving axes
 * @param x X distance/target (nullopt = axis not moved)
 * @param y Y distance/target
 * @param z Z distance/target
 * @param feed Feed rate in units/min
 * @param incremental true for G91 (relative), false for G90 (absolute)
 * @return Terminated line, e.g. "$J=G91 X10.000 F1000.000\n"
 */
std::string buildJogCommand(std::optional<double> x, std::optional<double> y,
                            std::optional<double> z, double feed, bool incremental);

/**
 * @brief Build the line sequence tracing a rectangle's perimeter
 *
 * Inverted bounds (min > max) are normalised. Lines are unterminated.
 */
std::vector<std::string> buildFrameProgram(const FrameBounds& bounds, double feed,
                                           uint32_t power, Units units, LaserMode mode);

uint8_t feedOverrideByte(OverrideAdjust adjust);
uint8_t spindleOverrideByte(OverrideAdjust adjust);
uint8_t rapidOverrideByte(RapidPreset preset);

/**
 * @brief Percentage a rapid preset selects (100, 50, 25)
 */
uint16_t rapidPresetPercent(RapidPreset preset);

const char* deviceQueryCommand(DeviceQuery query);

// ---- Decoding ----

/**
 * @brief Decode one line (terminator already removed)
 * @return Decoded response; Type::Unknown for unrecognised lines
 */
GrblResponse parseResponse(const std::string& line);

/**
 * @brief Short description of a GRBL error:N code
 */
const char* errorDescription(uint32_t code);

/**
 * @brief Short description of a GRBL ALARM:N code
 */
const char* alarmDescription(uint32_t code);

const char* responseTypeName(GrblResponse::Type type);

} // namespace GrblProtocol

#endif // GRBL_PROTOCOL_H
