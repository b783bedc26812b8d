/*
 * Controller Types - Shared state and result types for the LaserFX core
 *
 * CommandResult / CommandError is the only error shape that crosses the
 * controller boundary. ConnectionState is a closed variant; consumers
 * switch over every alternative.
 */

#ifndef CONTROLLER_TYPES_H
#define CONTROLLER_TYPES_H

#include <stdint.h>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <grbl_status.h>

// ============================================================================
// Errors
// ============================================================================

enum class ErrorCode : uint8_t {
    NotConnected = 0,
    Timeout,
    GrblError,
    Alarm,
    SerialError,
    InvalidState,
    Unknown
};

/**
 * @brief Stable wire name ("NOT_CONNECTED", "TIMEOUT", ...)
 */
const char* errorCodeName(ErrorCode code);

struct CommandError {
    std::string message;
    ErrorCode code = ErrorCode::Unknown;
    std::optional<std::string> details;
};

/**
 * @brief Outcome of a controller operation (success or CommandError)
 */
struct CommandResult {
    std::optional<CommandError> error;

    bool ok() const { return !error.has_value(); }

    static CommandResult success() { return CommandResult(); }
    static CommandResult failure(ErrorCode code, const std::string& message,
                                 std::optional<std::string> details = std::nullopt) {
        CommandResult result;
        result.error = CommandError{message, code, std::move(details)};
        return result;
    }
};

/**
 * @brief Format an error as "[CODE] message (details)"
 */
std::string formatError(const CommandError& error);

// ============================================================================
// Connection State
// ============================================================================

namespace Connection {

struct Disconnected {};
struct Connecting {};

struct Connected {
    std::string port;
    uint32_t baudRate = 0;
};

struct Error {
    std::string message;
};

} // namespace Connection

using ConnectionState = std::variant<Connection::Disconnected,
                                     Connection::Connecting,
                                     Connection::Connected,
                                     Connection::Error>;

const char* connectionStateName(const ConnectionState& state);

inline bool isConnected(const ConnectionState& state) {
    return std::holds_alternative<Connection::Connected>(state);
}

// ============================================================================
// Snapshot
// ============================================================================

/**
 * @brief Alarm surfaced to the caller; id changes only for a new alarm instance
 */
struct PendingAlarm {
    uint32_t code = 0;
    uint64_t id = 0;
};

/**
 * @brief Consistent copy of the session state
 */
struct ControllerSnapshot {
    ConnectionState connection = Connection::Disconnected{};
    MachineStatus status;
    std::optional<std::string> welcome;
    std::optional<CommandError> lastError;
    std::optional<PendingAlarm> pendingAlarm;
    bool statusFresh = false;
};

// ============================================================================
// Settings
// ============================================================================

/**
 * @brief Timeout / retry policy for one request class
 */
struct RequestPolicy {
    uint32_t timeoutMs = 500;
    uint8_t retries = 2;         // resends after the first attempt
};

struct ControllerSettings {
    RequestPolicy command{500, 2};
    RequestPolicy homing{500, 2};
    uint32_t statusTimeoutMs = 300;
    uint32_t startupTimeoutMs = 1000;
    uint32_t pollIntervalMs = 250;
    bool resetOnConnect = false;
    uint32_t maxLaserPower = 1000;
};

// ============================================================================
// Session State
// ============================================================================

/**
 * @brief Mutable session data, only touched under SessionState's lock
 */
struct SessionData {
    ConnectionState connection = Connection::Disconnected{};
    MachineStatus status;
    std::optional<std::string> welcome;
    std::optional<CommandError> lastError;
    std::optional<PendingAlarm> pendingAlarm;
    bool statusFresh = false;
    uint64_t sessionId = 0;         // bumped on every connect attempt
    uint64_t lastAlarmId = 0;       // monotonic across sessions
};

/**
 * @brief Single owner of the session data
 *
 * The lock is held for one read or one update only, never across I/O.
 */
class SessionState {
public:
    SessionState() = default;

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    ControllerSnapshot snapshot() const;

    template <typename Fn>
    auto read(Fn fn) const -> decltype(fn(std::declval<const SessionData&>())) {
        std::lock_guard<std::mutex> lock(_mutex);
        return fn(static_cast<const SessionData&>(_data));
    }

    template <typename Fn>
    auto update(Fn fn) -> decltype(fn(std::declval<SessionData&>())) {
        std::lock_guard<std::mutex> lock(_mutex);
        return fn(_data);
    }

    ConnectionState connection() const;
    MachineStatus status() const;
    void recordError(const CommandError& error);

private:
    mutable std::mutex _mutex;
    SessionData _data;
};

#endif // CONTROLLER_TYPES_H
