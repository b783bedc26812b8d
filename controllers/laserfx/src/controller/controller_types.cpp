/*
 * Controller Types - Implementation
 */

#include "controller_types.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotConnected: return "NOT_CONNECTED";
        case ErrorCode::Timeout:      return "TIMEOUT";
        case ErrorCode::GrblError:    return "GRBL_ERROR";
        case ErrorCode::Alarm:        return "ALARM";
        case ErrorCode::SerialError:  return "SERIAL_ERROR";
        case ErrorCode::InvalidState: return "INVALID_STATE";
        case ErrorCode::Unknown:      return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string formatError(const CommandError& error) {
    std::string text = "[";
    text += errorCodeName(error.code);
    text += "] ";
    text += error.message;
    if (error.details) {
        text += " (" + *error.details + ")";
    }
    return text;
}

namespace {

struct StateNameVisitor {
    const char* operator()(const Connection::Disconnected&) const { return "disconnected"; }
    const char* operator()(const Connection::Connecting&) const { return "connecting"; }
    const char* operator()(const Connection::Connected&) const { return "connected"; }
    const char* operator()(const Connection::Error&) const { return "error"; }
};

} // namespace

const char* connectionStateName(const ConnectionState& state) {
    return std::visit(StateNameVisitor(), state);
}

// ============================================================================
// SessionState
// ============================================================================

ControllerSnapshot SessionState::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    ControllerSnapshot snap;
    snap.connection = _data.connection;
    snap.status = _data.status;
    snap.welcome = _data.welcome;
    snap.lastError = _data.lastError;
    snap.pendingAlarm = _data.pendingAlarm;
    snap.statusFresh = _data.statusFresh;
    return snap;
}

ConnectionState SessionState::connection() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _data.connection;
}

MachineStatus SessionState::status() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _data.status;
}

void SessionState::recordError(const CommandError& error) {
    std::lock_guard<std::mutex> lock(_mutex);
    _data.lastError = error;
}
